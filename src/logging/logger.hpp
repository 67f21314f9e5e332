//===----------------------------------------------------------------------===//
//                         runnerd
//
// logging/logger.hpp
//
// Logging facade over spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace runnerd {

class Logger {
public:
    // Console sink always; rotating file sink when `log_file` is set
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "info");

    static void Shutdown();

    // Main logger, initialized with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(const std::string& level);
    static std::string GetLevel();

    static void Flush();

    // Accepts trace/debug/info/warn/warning/error/fatal/critical/off
    static bool IsValidLevel(const std::string& level);
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

} // namespace runnerd

// LOG_INFO("component", "message " + std::to_string(x))
#define RUNNERD_LOG_AT(lvl, method, component, message) \
    do { \
        auto& runnerd_logger_ = runnerd::Logger::Get(); \
        if (runnerd_logger_->should_log(lvl)) \
            runnerd_logger_->method("[{}] {}", component, message); \
    } while(0)

#define LOG_TRACE(component, message) RUNNERD_LOG_AT(spdlog::level::trace, trace, component, message)
#define LOG_DEBUG(component, message) RUNNERD_LOG_AT(spdlog::level::debug, debug, component, message)
#define LOG_INFO(component, message)  RUNNERD_LOG_AT(spdlog::level::info, info, component, message)
#define LOG_WARN(component, message)  RUNNERD_LOG_AT(spdlog::level::warn, warn, component, message)
#define LOG_ERROR(component, message) RUNNERD_LOG_AT(spdlog::level::err, error, component, message)
#define LOG_FATAL(component, message) RUNNERD_LOG_AT(spdlog::level::critical, critical, component, message)

// fmt-style: RLOG_INFO("component", "session {} started", id)
#define RLOG_DEBUG(component, fmt, ...) \
    runnerd::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define RLOG_INFO(component, fmt, ...) \
    runnerd::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define RLOG_WARN(component, fmt, ...) \
    runnerd::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
#define RLOG_ERROR(component, fmt, ...) \
    runnerd::Logger::Get()->error("[{}] " fmt, component, ##__VA_ARGS__)
