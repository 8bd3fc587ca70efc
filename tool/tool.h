#ifndef ARBOR_TOOL_TOOL_H
#define ARBOR_TOOL_TOOL_H

#include <ostream>
#include <string>
#include <vector>
#include "arbor/options.h"

namespace Arbor::Tool {

static constexpr int EXIT_OK {0};
static constexpr int EXIT_ERROR {1};

/*
 * Run one command of the form "<file> <verb> <key> [<value>]". Returns the process exit code.
 *
 *     Verb            | Action
 *    -----------------|------------------------------------------------
 *     get             | print the value stored under key
 *     set             | store value under key and commit
 *     delete, remove  | remove key and commit
 *     find            | report whether key exists
 */
auto run(const std::vector<std::string> &args, const Options &options, std::ostream &out, std::ostream &err) -> int;

// Parse the ARBOR_LOG_LEVEL environment variable. Unset or unrecognized values turn logging off.
auto log_level_from_env(const char *value) -> LogLevel;

} // namespace Arbor::Tool

#endif // ARBOR_TOOL_TOOL_H
