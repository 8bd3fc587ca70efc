#include "tool.h"
#include "arbor/database.h"
#include "arbor/status.h"
#include <fmt/ostream.h>
#include <memory>

namespace Arbor::Tool {

static constexpr auto USAGE = "usage: arbor <database> <get|set|delete|remove|find> <key> [<value>]";

auto log_level_from_env(const char *value) -> LogLevel
{
    if (value == nullptr) {
        return LogLevel::OFF;
    }
    const Slice level {value};
    if (level == "trace") {
        return LogLevel::TRACE;
    } else if (level == "info") {
        return LogLevel::INFO;
    } else if (level == "warn") {
        return LogLevel::WARN;
    } else if (level == "error") {
        return LogLevel::ERROR;
    }
    return LogLevel::OFF;
}

auto run(const std::vector<std::string> &args, const Options &options, std::ostream &out, std::ostream &err) -> int
{
    if (args.size() < 3 || args.size() > 4) {
        fmt::print(err, "{}\n", USAGE);
        return EXIT_ERROR;
    }
    const auto &path = args[0];
    const auto &verb = args[1];
    const auto &key = args[2];

    const auto is_set = verb == "set";
    const auto is_delete = verb == "delete" || verb == "remove";
    if (!is_set && !is_delete && verb != "get" && verb != "find") {
        fmt::print(err, "unsupported verb \"{}\"\n{}\n", verb, USAGE);
        return EXIT_ERROR;
    }
    if (is_set != (args.size() == 4)) {
        fmt::print(err, "{}\n", USAGE);
        return EXIT_ERROR;
    }

    Database *ptr {};
    if (auto s = Database::open(path, options, &ptr); !s.is_ok()) {
        fmt::print(err, "cannot open \"{}\": {}\n", path, s.to_string());
        return EXIT_ERROR;
    }
    std::unique_ptr<Database> db {ptr};

    auto s = Status::ok();
    if (is_set) {
        const auto &value = args[3];
        s = db->put(key, value);
        if (s.is_ok()) {
            s = db->commit();
        }
        if (s.is_ok()) {
            fmt::print(out, "set \"{}\" to \"{}\"\n", key, value);
        }
    } else if (is_delete) {
        s = db->erase(key);
        if (s.is_ok()) {
            s = db->commit();
        }
        if (s.is_ok()) {
            fmt::print(out, "removed \"{}\"\n", key);
        }
    } else if (verb == "get") {
        std::string value;
        s = db->get(key, value);
        if (s.is_ok()) {
            fmt::print(out, "{}\n", value);
        }
    } else {
        bool exists {};
        s = db->contains(key, exists);
        if (s.is_ok()) {
            if (!exists) {
                fmt::print(err, "key \"{}\" does not exist\n", key);
                return EXIT_ERROR;
            }
            fmt::print(out, "found \"{}\"\n", key);
        }
    }

    if (!s.is_ok()) {
        fmt::print(err, "error: {}\n", s.to_string());
        return EXIT_ERROR;
    }
    if (s = db->close(); !s.is_ok()) {
        fmt::print(err, "error: {}\n", s.to_string());
        return EXIT_ERROR;
    }
    return EXIT_OK;
}

} // namespace Arbor::Tool
