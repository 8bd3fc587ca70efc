#include "tool.h"
#include <cstdlib>
#include <iostream>

auto main(int argc, const char *argv[]) -> int
{
    Arbor::Options options;
    options.log_level = Arbor::Tool::log_level_from_env(std::getenv("ARBOR_LOG_LEVEL"));
    options.log_target = Arbor::LogTarget::STDERR_COLOR;

    std::vector<std::string> args;
    for (int i {1}; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return Arbor::Tool::run(args, options, std::cout, std::cerr);
}
