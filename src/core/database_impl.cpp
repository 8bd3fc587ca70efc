#include "database_impl.h"
#include "arbor/comparator.h"
#include "storage/posix_file.h"
#include "utils/logging.h"
#include <algorithm>
#include <fmt/format.h>
#include <vector>

namespace Arbor {

auto sanitize_options(const Options &options) -> Options
{
    auto sanitized = options;
    if (sanitized.comparator == nullptr) {
        sanitized.comparator = bytewise_comparator();
    }
    sanitized.max_log_size = std::clamp(sanitized.max_log_size, MINIMUM_LOG_MAX_SIZE, MAXIMUM_LOG_MAX_SIZE);
    sanitized.max_log_files = std::clamp(sanitized.max_log_files, MINIMUM_LOG_MAX_FILES, MAXIMUM_LOG_MAX_FILES);
    return sanitized;
}

DatabaseImpl::~DatabaseImpl()
{
    (void)close();
}

auto DatabaseImpl::destroy(const std::string &path) -> Status
{
    Arbor_Try(remove_file(path));

    // Rotated log files are named "<path>.log", "<path>.1.log", "<path>.2.log", etc.
    std::vector<std::string> logs {path + LOG_SUFFIX};
    for (Size i {1}; i <= MAXIMUM_LOG_MAX_FILES; ++i) {
        logs.emplace_back(fmt::format("{}.{}{}", path, i, LOG_SUFFIX));
    }
    for (const auto &log: logs) {
        if (file_exists(log).is_ok()) {
            Arbor_Try(remove_file(log));
        }
    }
    return Status::ok();
}

auto DatabaseImpl::open(const Slice &path, const Options &options) -> Status
{
    if (path.is_empty()) {
        return Status::invalid_argument("path is empty");
    }
    const auto sanitized = sanitize_options(options);
    m_path = path.to_string();

    m_system = std::make_unique<System>(m_path, sanitized);
    m_log = m_system->create_log("database");

    Arbor_Info("starting Arbor v{}.{}.{} at \"{}\"", ARBOR_VERSION_MAJOR,
               ARBOR_VERSION_MINOR, ARBOR_VERSION_PATCH, m_path);
    Arbor_Info("ordering keys with \"{}\"", sanitized.comparator->name());

    File *file {};
    if (auto s = PosixFile::open(m_path, sanitized.read_only, &file); !s.is_ok()) {
        Arbor_Error("cannot open \"{}\": {}", m_path, s.what().data());
        return s;
    }

    Storage::Parameters param;
    param.lock_timeout = sanitized.lock_timeout;
    param.sync = sanitized.sync_on_commit;
    param.read_only = sanitized.read_only;
    param.comparator_name = sanitized.comparator->name();
    if (auto s = Storage::open(std::unique_ptr<File> {file}, param, m_system->create_log("storage"), m_storage); !s.is_ok()) {
        Arbor_Error("cannot open storage: {}", s.what().data());
        return s;
    }

    Core::Parameters core_param;
    core_param.storage = m_storage.get();
    core_param.comparator = sanitized.comparator;
    core_param.lock_policy = sanitized.lock_policy;
    core_param.log = m_system->create_log("core");
    m_core = std::make_unique<Core>(core_param);

    Arbor_Info("successfully opened database");
    return Status::ok();
}

auto DatabaseImpl::close() -> Status
{
    if (is_closed()) {
        return Status::ok();
    }
    m_core->release();
    m_core.reset();
    m_storage->close();
    m_storage.reset();
    Arbor_Info("closed database");
    return Status::ok();
}

auto DatabaseImpl::check_open() const -> Status
{
    if (is_closed()) {
        return Status::logic_error("database is closed");
    }
    return Status::ok();
}

auto DatabaseImpl::report(const Status &s, const char *operation, const Slice &key) const -> Status
{
    if (s.is_ok()) {
        return s;
    }
    if (s.is_not_found()) {
        Arbor_Trace("{}: key \"{}\" does not exist", operation, escape_string(key));
        return Status::not_found(fmt::format("key \"{}\" does not exist", escape_string(key)));
    }
    Arbor_Error("{} failed ({}): {}", operation, get_status_name(s), s.what().data());
    return s;
}

auto DatabaseImpl::get(const Slice &key, std::string &value) -> Status
{
    Arbor_Try(check_open());
    return report(m_core->get(key, value), "get", key);
}

auto DatabaseImpl::contains(const Slice &key, bool &exists) -> Status
{
    Arbor_Try(check_open());
    return report(m_core->contains(key, exists), "contains", key);
}

auto DatabaseImpl::size(Size &out) -> Status
{
    Arbor_Try(check_open());
    return report(m_core->size(out), "size", {});
}

auto DatabaseImpl::put(const Slice &key, const Slice &value) -> Status
{
    Arbor_Try(check_open());
    return report(m_core->put(key, value), "put", key);
}

auto DatabaseImpl::erase(const Slice &key) -> Status
{
    Arbor_Try(check_open());
    return report(m_core->erase(key), "erase", key);
}

auto DatabaseImpl::commit() -> Status
{
    Arbor_Try(check_open());
    return report(m_core->commit(), "commit", {});
}

} // namespace Arbor
