//===----------------------------------------------------------------------===//
//                         runnerd
//
// logging/logger.cpp
//
// Logger implementation
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <algorithm>
#include <vector>

namespace runnerd {

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::initialized_ = false;

namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return value;
}

} // anonymous namespace

void Logger::Initialize(const std::string& log_file, const std::string& log_level) {
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file,
            100 * 1024 * 1024,  // 100 MB per file
            3                    // rotated files kept
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("runnerd", sinks.begin(), sinks.end());
    logger_->set_level(ToSpdlogLevel(log_level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    initialized_ = true;
}

void Logger::Shutdown() {
    if (logger_) {
        logger_->flush();
    }
    spdlog::shutdown();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

void Logger::SetLevel(const std::string& level) {
    Get()->set_level(ToSpdlogLevel(level));
}

std::string Logger::GetLevel() {
    auto name = spdlog::level::to_string_view(Get()->level());
    return std::string(name.data(), name.size());
}

void Logger::Flush() {
    if (logger_) {
        logger_->flush();
    }
}

bool Logger::IsValidLevel(const std::string& level) {
    static const char* const kLevels[] = {
        "trace", "debug", "info", "warn", "warning", "error", "fatal", "critical", "off"
    };
    std::string lower = Lower(level);
    return std::find(std::begin(kLevels), std::end(kLevels), lower) != std::end(kLevels);
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    std::string lower = Lower(level);

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info")  return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "fatal" || lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;

    return spdlog::level::info;
}

} // namespace runnerd
