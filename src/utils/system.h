#ifndef ARBOR_UTILS_SYSTEM_H
#define ARBOR_UTILS_SYSTEM_H

#include <memory>
#include <spdlog/spdlog.h>
#include "arbor/options.h"
#include "arbor/status.h"
#include "utils.h"

namespace Arbor {

constexpr auto LOG_SUFFIX = ".log";

using Log = spdlog::logger;
using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

#define Arbor_Trace m_log->trace
#define Arbor_Info m_log->info
#define Arbor_Warn m_log->warn
#define Arbor_Error m_log->error

/*
 * Owns the sink that every component's logger writes to. Log files live beside the database file, at
 * "<database path>.log".
 */
class System {
public:
    System(const std::string &path, const Options &options);
    [[nodiscard]] auto create_log(const std::string &name) const -> LogPtr;

private:
    LogSink m_sink;
};

} // namespace Arbor

#endif // ARBOR_UTILS_SYSTEM_H
