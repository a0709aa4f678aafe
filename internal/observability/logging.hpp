#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace speechmaker::runtime::config {
class LoggingConfig;
}

namespace speechmaker::observability {

// One key/value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "speechmaker" default logger.

  Console output is always on. logging.file adds a size-rotated copy of the
  same stream; logging.error_log_file opens the classified-error journal,
  one JSON object per line, appended across restarts.

  SPEECHMAKER_LOG_LEVEL overrides logging.level. An unknown level name is
  rejected with std::invalid_argument.
*/
void InitializeLogging(const speechmaker::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// Error journal. Both are no-ops when no journal file is configured.
// `line` is one complete JSON object without the trailing newline.
void JournalError(std::string_view line);
void TruncateErrorJournal();

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

} // namespace speechmaker::observability

#define SPEECHMAKER_LOG_DEBUG(message, ...) ::speechmaker::observability::LogDebug((message), ##__VA_ARGS__)
#define SPEECHMAKER_LOG_INFO(message, ...) ::speechmaker::observability::LogInfo((message), ##__VA_ARGS__)
#define SPEECHMAKER_LOG_WARN(message, ...) ::speechmaker::observability::LogWarn((message), ##__VA_ARGS__)
#define SPEECHMAKER_LOG_ERROR(message, ...) ::speechmaker::observability::LogError((message), ##__VA_ARGS__)
