#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

/*
  Structured logging over spdlog.

  Fields are rendered as key=value after the message. Before InitializeLogging
  runs (unit tests, fleetctl) spdlog's default logger is used as is.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// FLEET_LOG_LEVEL, FLEET_LOG_PATTERN and FLEET_LOG_INCLUDE_TRACE_CONTEXT
// override the matching config fields.
void InitializeLogging(const fleet::runtime::config::RuntimeConfig& config);
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

} // namespace fleet::observability

#define FLEET_LOG_DEBUG(message, ...) ::fleet::observability::LogDebug((message), ##__VA_ARGS__)
#define FLEET_LOG_INFO(message, ...) ::fleet::observability::LogInfo((message), ##__VA_ARGS__)
#define FLEET_LOG_WARN(message, ...) ::fleet::observability::LogWarn((message), ##__VA_ARGS__)
#define FLEET_LOG_ERROR(message, ...) ::fleet::observability::LogError((message), ##__VA_ARGS__)
