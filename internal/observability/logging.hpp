#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace scout::runtime::config {
class RuntimeConfig;
}

namespace scout::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);
// Rendered as "<n>ms".
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

/*
  "<message> k1=v1 k2=v2".

  Values that are empty or contain whitespace, '=' or '"' are quoted,
  with '"' and '\' escaped, so a manufacturer like "Philips Lighting"
  stays one field.
*/
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

// trace, debug, info, warn (or warning), error, critical, off.
// Throws util::InvalidArgument for anything else.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

/*
  Installs the "device-scout" logger: stderr, plus an append-mode file
  sink when logging.file is set. SCOUT_LOG_LEVEL, SCOUT_LOG_PATTERN and
  SCOUT_LOG_FILE override the config.
*/
void InitializeLogging(const scout::runtime::config::RuntimeConfig& config);
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

} // namespace scout::observability

#define SCOUT_LOG_DEBUG(message, ...) ::scout::observability::LogDebug((message), ##__VA_ARGS__)
#define SCOUT_LOG_INFO(message, ...) ::scout::observability::LogInfo((message), ##__VA_ARGS__)
#define SCOUT_LOG_WARN(message, ...) ::scout::observability::LogWarn((message), ##__VA_ARGS__)
#define SCOUT_LOG_ERROR(message, ...) ::scout::observability::LogError((message), ##__VA_ARGS__)
