#include "mpkit/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <sstream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mpkit {

namespace {

constexpr const char* LOGGER_NAME = "mpkit";
constexpr const char* DEFAULT_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";

std::string resolveLevel(const LoggingOptions& options) {
    if (const char* level = std::getenv("MPKIT_LOG_LEVEL")) {
        return level;
    }
    if (!options.level.empty()) {
        return options.level;
    }
    return "warn";
}

std::string resolvePattern(const LoggingOptions& options) {
    if (const char* pattern = std::getenv("MPKIT_LOG_PATTERN")) {
        return pattern;
    }
    if (!options.pattern.empty()) {
        return options.pattern;
    }
    return DEFAULT_PATTERN;
}

std::string serializeFields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

std::mutex g_logger_mutex;

void configure(spdlog::logger& target, const LoggingOptions& options) {
    target.set_pattern(resolvePattern(options));
    target.set_level(spdlog::level::from_str(resolveLevel(options)));
    target.flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> getOrCreate(const LoggingOptions& options, bool reconfigure) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        if (reconfigure) configure(*existing, options);
        return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    configure(*created, options);
    return created;
}

} // namespace

LogField stringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField intField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField boolField(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void initializeLogging(const LoggingOptions& options) {
    getOrCreate(options, true);
}

std::shared_ptr<spdlog::logger> logger() {
    return getOrCreate(LoggingOptions{}, false);
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
    auto target = logger();
    if (!target->should_log(level)) {
        return;
    }
    auto serialized = serializeFields(fields);
    if (serialized.empty()) {
        target->log(level, "{}", message);
    } else {
        target->log(level, "{} {}", message, serialized);
    }
}

} // namespace mpkit
