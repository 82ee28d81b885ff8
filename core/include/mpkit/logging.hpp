#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace mpkit {

/// key=value pair appended to a log line
struct LogField {
    std::string key;
    std::string value;
};

LogField stringField(std::string_view key, std::string_view value);
LogField intField(std::string_view key, std::int64_t value);
LogField boolField(std::string_view key, bool value);

/**
 * @brief Logging configuration.
 *
 * The MPKIT_LOG_LEVEL and MPKIT_LOG_PATTERN environment variables take
 * precedence over the values given here.
 */
struct LoggingOptions {
    /// spdlog level name (trace, debug, info, warn, err, critical, off)
    std::string level = "warn";

    /// spdlog pattern (empty = library default)
    std::string pattern;
};

/**
 * @brief Configure the "mpkit" logger.
 *
 * Calling this is optional; the logger is created with default options
 * on first use.
 */
void initializeLogging(const LoggingOptions& options = {});

/// The library logger (writes to stderr)
std::shared_ptr<spdlog::logger> logger();

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void logDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void logInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void logWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void logError(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace mpkit

#define MPKIT_LOG_DEBUG(message, ...) ::mpkit::logDebug((message), ##__VA_ARGS__)
#define MPKIT_LOG_INFO(message, ...) ::mpkit::logInfo((message), ##__VA_ARGS__)
#define MPKIT_LOG_WARN(message, ...) ::mpkit::logWarn((message), ##__VA_ARGS__)
#define MPKIT_LOG_ERROR(message, ...) ::mpkit::logError((message), ##__VA_ARGS__)
