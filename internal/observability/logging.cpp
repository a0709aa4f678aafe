#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace speechmaker::observability {
namespace {

constexpr const char* kLoggerName       = "speechmaker";
constexpr const char* kDefaultPattern   = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr std::size_t kDefaultFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kDefaultFileCount = 3;

struct Journal {
  std::mutex    mu;
  std::string   path;
  std::ofstream out;
};

Journal& ErrorJournal() {
  static Journal journal;
  return journal;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  // from_str maps anything unrecognised to "off"
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("Invalid configuration: unknown log level '" + name + "'");
  }
  return level;
}

std::string EffectiveLevel(const speechmaker::runtime::config::LoggingConfig& config) {
  if (const char* env = std::getenv("SPEECHMAKER_LOG_LEVEL"); env != nullptr && *env != '\0') {
    return env;
  }
  return config.level().empty() ? std::string("info") : config.level();
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') {
      return true;
    }
  }
  return false;
}

void AppendEscaped(std::string& out, const std::string& value) {
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
}

// key=value key="value with spaces"
std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out += ' ';
    }
    out += field.key;
    out += '=';
    if (NeedsQuoting(field.value)) {
      out += '"';
      AppendEscaped(out, field.value);
      out += '"';
    } else {
      out += field.value;
    }
  }
  return out;
}

void OpenJournal(const std::string& path) {
  auto&                       journal = ErrorJournal();
  std::lock_guard<std::mutex> lock(journal.mu);
  if (journal.out.is_open()) {
    journal.out.close();
  }
  journal.path = path;
  if (path.empty()) {
    return;
  }

  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  journal.out.open(path, std::ios::app);
  if (!journal.out) {
    throw std::runtime_error("Failed to open error journal: " + path);
  }
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const speechmaker::runtime::config::LoggingConfig& config) {
  const auto level = ParseLevel(EffectiveLevel(config));

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!config.file().empty()) {
    const std::size_t max_bytes = config.max_file_bytes() > 0 ? config.max_file_bytes() : kDefaultFileBytes;
    const std::size_t max_files = config.max_files() > 0 ? config.max_files() : kDefaultFileCount;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.file(), max_bytes, max_files));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(config.pattern().empty() ? std::string(kDefaultPattern) : config.pattern());
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));

  OpenJournal(config.error_log_file());
}

void ShutdownLogging() {
  OpenJournal({});
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

void JournalError(std::string_view line) {
  auto&                       journal = ErrorJournal();
  std::lock_guard<std::mutex> lock(journal.mu);
  if (!journal.out.is_open()) {
    return;
  }
  journal.out << line << '\n';
  journal.out.flush();
  if (!journal.out) {
    // keep the stream usable for the next record
    journal.out.clear();
    spdlog::warn("error journal write failed path={}", journal.path);
  }
}

void TruncateErrorJournal() {
  auto&                       journal = ErrorJournal();
  std::lock_guard<std::mutex> lock(journal.mu);
  if (journal.path.empty()) {
    return;
  }
  journal.out.close();
  { std::ofstream truncate(journal.path, std::ios::trunc); }
  journal.out.open(journal.path, std::ios::app);
  if (!journal.out) {
    spdlog::warn("error journal truncate failed path={}", journal.path);
  }
}

} // namespace speechmaker::observability
