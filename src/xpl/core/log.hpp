#pragma once

// Logging for xpl-shell using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Very verbose, per-event logging (e.g., every X11 event, every fan-out)
//   - DEBUG: Detailed debugging info (e.g., window state changes, drag transitions)
//   - INFO:  Normal operational messages (e.g., startup, style changes)
//   - WARN:  Recoverable problems (rejected requests, missing native effects)
//   - ERROR: Error conditions
//
// In Release builds: TRACE and DEBUG are compiled out (zero cost)
// In Debug builds: All levels are active
//
// Usage:
//   LOG_DEBUG("Window {} ready", id);
//   LOG_INFO("UI style changed from {} to {}", to_string(old), to_string(style));

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

namespace xpl::log {

// Initialize logging - call once at startup
inline void init(std::string const& file_path = "/tmp/xpl-shell.log")
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{ console_sink };
    std::string file_error;
    if (!file_path.empty())
    {
        try
        {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
            sinks.push_back(file_sink);
        }
        catch (spdlog::spdlog_ex const& e)
        {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("xpl", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace); // Runtime level (compile-time is separate)
    logger->flush_on(spdlog::level::debug);

    spdlog::set_default_logger(logger);

    if (!file_error.empty())
        spdlog::warn("File logging disabled: {}", file_error);
}

// Apply the level named in the config ("trace", "debug", "info", "warn", "error")
inline void set_level(std::string const& name)
{
    if (name.empty())
        return;
    spdlog::set_level(spdlog::level::from_str(name));
}

// Shutdown logging - call at exit
inline void shutdown() { spdlog::shutdown(); }

} // namespace xpl::log

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
