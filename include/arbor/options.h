#ifndef ARBOR_OPTIONS_H
#define ARBOR_OPTIONS_H

#include "slice.h"

namespace Arbor {

class Comparator;

static constexpr Size MINIMUM_LOG_MAX_SIZE {0xA000};
static constexpr Size DEFAULT_MAX_LOG_SIZE {0x100000};
static constexpr Size MAXIMUM_LOG_MAX_SIZE {0xA00000};
static constexpr Size MINIMUM_LOG_MAX_FILES {1};
static constexpr Size DEFAULT_MAX_LOG_FILES {4};
static constexpr Size MAXIMUM_LOG_MAX_FILES {32};

enum class LogLevel {
    TRACE,
    INFO,
    WARN,
    ERROR,
    OFF,
};

enum class LogTarget {
    FILE,
    STDOUT,
    STDERR,
    STDOUT_COLOR,
    STDERR_COLOR,
};

/*
 * Determines how long a writer keeps the file lock. With RELEASE_ON_COMMIT, the lock taken by the first mutation
 * of a batch is dropped once commit() publishes the batch. With HOLD_UNTIL_CLOSE, it is dropped by close().
 */
enum class LockPolicy {
    RELEASE_ON_COMMIT,
    HOLD_UNTIL_CLOSE,
};

struct Options {
    // Defaults to bytewise_comparator() when null.
    const Comparator *comparator {};
    LockPolicy lock_policy {LockPolicy::RELEASE_ON_COMMIT};

    // Time to wait for the writer lock, in microseconds. 0 waits forever.
    Size lock_timeout {};

    bool sync_on_commit {true};
    bool read_only {};
    Size max_log_size {DEFAULT_MAX_LOG_SIZE};
    Size max_log_files {DEFAULT_MAX_LOG_FILES};
    LogLevel log_level {LogLevel::OFF};
    LogTarget log_target {};
};

} // namespace Arbor

#endif // ARBOR_OPTIONS_H
