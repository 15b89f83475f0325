#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace chains::runtime::config {
class RuntimeConfig;
class LoggingConfig;
} // namespace chains::runtime::config

namespace chains::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
};

// CHAINS_LOG_LEVEL / CHAINS_LOG_PATTERN win over the config section.
// Throws std::runtime_error for a level spdlog does not know.
LogSettings ResolveLogSettings(const chains::runtime::config::LoggingConfig& logging);

// key=value pairs; values with spaces, quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const chains::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace chains::observability

#define CHAINS_LOG_DEBUG(message, ...) ::chains::observability::LogDebug((message), ##__VA_ARGS__)
#define CHAINS_LOG_INFO(message, ...) ::chains::observability::LogInfo((message), ##__VA_ARGS__)
#define CHAINS_LOG_WARN(message, ...) ::chains::observability::LogWarn((message), ##__VA_ARGS__)
#define CHAINS_LOG_ERROR(message, ...) ::chains::observability::LogError((message), ##__VA_ARGS__)
