#include "error_classifier.hpp"

#include <filesystem>
#include <initializer_list>
#include <regex>
#include <string_view>
#include <system_error>

#include "internal/errors/classified_error.hpp"
#include "internal/errors/error_record_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errno_codes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace speechmaker::errors {

namespace {

using model::ErrorCategory;
using model::Severity;

bool HasCode(const RawError& e, std::initializer_list<std::string_view> codes) {
  for (auto code : codes) {
    if (e.code == code) {
      return true;
    }
  }
  return false;
}

bool Mentions(const RawError& e, std::string_view needle) {
  return e.message.find(needle) != std::string::npos;
}

std::string FileName(const RawError& e) {
  if (e.subject.empty()) {
    return "the file";
  }
  const auto name = std::filesystem::path(e.subject).filename().string();
  return name.empty() ? e.subject : name;
}

std::string FileSizeMb(const RawError& e) {
  static const std::regex size_pattern(R"((\d+(?:\.\d+)?)\s*MB)");
  std::smatch             match;
  if (std::regex_search(e.message, match, size_pattern)) {
    return match[1].str();
  }
  return "unknown";
}

struct Rule {
  bool (*matches)(const RawError&);
  ErrorCategory category;
  Severity      severity;
  bool          can_retry;
  const char*   action;
  std::string (*message)(const RawError&);
  std::vector<std::string> troubleshooting;
};

const std::vector<Rule>& Rules() {
  static const std::vector<Rule> rules = {
      {[](const RawError& e) { return e.domain == ErrorDomain::kCleanup; },
       ErrorCategory::kCleanup,
       Severity::kWarning,
       false,
       "none",
       [](const RawError& e) { return "Temporary audio files could not be removed: " + FileName(e); },
       {"The files can be deleted manually", "Check that no other program holds the files open"}},

      {[](const RawError& e) { return HasCode(e, {"ECANCELED"}) || Mentions(e, "cancelled"); },
       ErrorCategory::kCancelled,
       Severity::kInfo,
       false,
       "none",
       [](const RawError&) { return std::string("Conversion was cancelled by user."); },
       {"Start a new conversion when ready"}},

      {[](const RawError& e) { return e.domain == ErrorDomain::kFile && Mentions(e, "File is empty"); },
       ErrorCategory::kEmptyInput,
       Severity::kInfo,
       false,
       "add_text",
       [](const RawError& e) { return "File is empty: " + FileName(e); },
       {"Check if the file contains text content", "Open the file in a text editor to verify content",
        "Try selecting a different file"}},

      {[](const RawError& e) { return HasCode(e, {"EEMPTY"}) || Mentions(e, "Text cannot be empty"); },
       ErrorCategory::kEmptyInput,
       Severity::kInfo,
       false,
       "add_text",
       [](const RawError&) { return std::string("No text provided for conversion."); },
       {"Enter text or select a text file", "Make sure the selected file contains readable text",
        "Check the file encoding (UTF-8 recommended)"}},

      {[](const RawError& e) { return HasCode(e, {"EMFILE", "ENFILE"}); },
       ErrorCategory::kTooManyOpenFiles,
       Severity::kError,
       true,
       "restart_app",
       [](const RawError&) { return std::string("Too many files are currently open"); },
       {"Close some applications and try again", "Restart the application if the problem persists",
        "Free up system resources"}},

      {[](const RawError& e) { return Mentions(e, "Unsupported file type"); },
       ErrorCategory::kUnsupportedFile,
       Severity::kError,
       false,
       "convert_file",
       [](const RawError& e) { return "Unsupported file format: " + FileName(e); },
       {"Only .txt files are supported", "Convert your file to .txt format using a text editor",
        "Paste the text directly instead", "Save your document as plain text (.txt)"}},

      {[](const RawError& e) { return Mentions(e, "File too large"); },
       ErrorCategory::kFileTooLarge,
       Severity::kError,
       true,
       "split_file",
       [](const RawError& e) { return "File too large: " + FileSizeMb(e) + "MB (maximum 10MB)"; },
       {"Split the file into smaller parts (under 10MB each)", "Paste smaller portions of text directly",
        "Remove unnecessary content from the file"}},

      {[](const RawError& e) {
         return (e.domain == ErrorDomain::kOutput &&
                 HasCode(e, {"ENOENT", "EACCES", "EPERM", "ENOTDIR", "EROFS", "ENOSPC", "EEXIST"})) ||
                Mentions(e, "Output path");
       },
       ErrorCategory::kOutputLocation,
       Severity::kError,
       true,
       "select_folder",
       [](const RawError&) { return std::string("Cannot save to the selected output location."); },
       {"Check if the output folder exists and is writable", "Select a different output folder",
        "Make sure you have permission to write to the location", "Check if there is enough disk space"}},

      {[](const RawError& e) { return e.domain == ErrorDomain::kFile && HasCode(e, {"ENOENT"}); },
       ErrorCategory::kFileNotFound,
       Severity::kError,
       true,
       "browse_file",
       [](const RawError& e) { return "File not found: " + FileName(e); },
       {"Check if the file exists at the specified location", "Verify the file path is correct",
        "Make sure the file has not been moved or deleted", "Try browsing for the file again"}},

      {[](const RawError& e) { return e.domain == ErrorDomain::kFile && HasCode(e, {"EACCES", "EPERM"}); },
       ErrorCategory::kAccessDenied,
       Severity::kError,
       true,
       "check_permissions",
       [](const RawError& e) { return "Access denied: Cannot read " + FileName(e); },
       {"Check if the file is locked by another application", "Verify you have permission to read the file",
        "Check if the file is on a network drive with restricted access"}},

      {[](const RawError& e) { return HasCode(e, {"EISDIR"}); },
       ErrorCategory::kIsDirectory,
       Severity::kError,
       true,
       "browse_file",
       [](const RawError&) { return std::string("Invalid selection: You selected a folder instead of a file"); },
       {"Please select a .txt file, not a folder", "Navigate into the folder and select a text file"}},

      {[](const RawError& e) { return Mentions(e, "Voice") && Mentions(e, "not found"); },
       ErrorCategory::kVoiceUnavailable,
       Severity::kWarning,
       true,
       "select_voice",
       [](const RawError& e) {
         return e.subject.empty() ? std::string("The selected voice is no longer available.")
                                  : "The selected voice \"" + e.subject + "\" is no longer available.";
       },
       {"Select a different voice", "Refresh the voice list", "Reset the voice to the default"}},

      {[](const RawError& e) {
         return e.domain == ErrorDomain::kVoice &&
                (Mentions(e, "No TTS voices found") || HasCode(e, {"ENOENT", "EACCES", "ENOEXEC"}));
       },
       ErrorCategory::kVoiceUnavailable,
       Severity::kCritical,
       true,
       "install_voices",
       [](const RawError&) { return std::string("No text-to-speech voices are available on your system."); },
       {"Ensure the speech engine (edge-tts) is installed and on PATH", "Check the network connection used by the engine",
        "Restart the application after installing the engine"}},

      {[](const RawError& e) { return e.domain == ErrorDomain::kConverter && Mentions(e, "Converting engine output"); },
       ErrorCategory::kConverterMissing,
       Severity::kError,
       true,
       "install_converter",
       [](const RawError&) {
         return std::string("FFmpeg is required to convert the speech engine's audio but is not installed.");
       },
       {"Install FFmpeg with your package manager or from https://ffmpeg.org/download.html",
        "Make sure the ffmpeg binary is on PATH", "Restart the application after installation"}},

      {[](const RawError& e) {
         return e.domain == ErrorDomain::kConverter &&
                (HasCode(e, {"ENOENT", "ECONVERTER"}) || Mentions(e, "not installed") || Mentions(e, "not available"));
       },
       ErrorCategory::kConverterMissing,
       Severity::kWarning,
       true,
       "use_wav",
       [](const RawError&) { return std::string("FFmpeg is required for MP3 conversion but is not installed."); },
       {"Install FFmpeg with your package manager or from https://ffmpeg.org/download.html",
        "Make sure the ffmpeg binary is on PATH", "Restart the application after installation",
        "Alternative: use WAV format which does not require FFmpeg"}},

      {[](const RawError& e) { return Mentions(e, "MP3 conversion failed"); },
       ErrorCategory::kConversionFailed,
       Severity::kError,
       true,
       "use_wav",
       [](const RawError&) { return std::string("MP3 conversion failed. The audio file may be corrupted."); },
       {"Try converting to WAV format instead", "Check if FFmpeg is properly installed",
        "Check if there is enough disk space"}},

      {[](const RawError& e) { return Mentions(e, "Audio merging failed"); },
       ErrorCategory::kMergeFailed,
       Severity::kError,
       true,
       "retry_smaller",
       [](const RawError&) { return std::string("Failed to merge audio chunks. The conversion may be incomplete."); },
       {"Try converting smaller portions of text", "Check if there is enough disk space",
        "Use WAV format which is more reliable for large files"}},

      {[](const RawError& e) {
         const bool engine_call = e.domain == ErrorDomain::kVoice || e.domain == ErrorDomain::kConversion;
         return HasCode(e, {"ETIMEDOUT"}) || Mentions(e, "TTS conversion failed") ||
                (engine_call && HasCode(e, {"EXIT_NONZERO", "ESPAWN", "ENOENT", "ENOEXEC"}));
       },
       ErrorCategory::kEngineUnresponsive,
       Severity::kError,
       true,
       "retry",
       [](const RawError&) { return std::string("The text-to-speech engine is not responding."); },
       {"Try again in a moment", "Try with a shorter text sample", "Check the network connection used by the engine",
        "Try a different voice if available"}},

      {[](const RawError& e) { return e.domain == ErrorDomain::kConverter; },
       ErrorCategory::kConversionFailed,
       Severity::kError,
       true,
       "use_wav",
       [](const RawError&) { return std::string("Audio processing error occurred."); },
       {"Check if FFmpeg is properly installed", "Try using WAV format instead of MP3"}},

      {[](const RawError& e) { return e.domain == ErrorDomain::kVoice; },
       ErrorCategory::kVoiceUnavailable,
       Severity::kError,
       true,
       "retry",
       [](const RawError&) { return std::string("An unexpected error occurred with the text-to-speech system."); },
       {"Try reloading the voice list", "Restart the application"}},
  };
  return rules;
}

spdlog::level::level_enum LevelFor(Severity severity) {
  switch (severity) {
    case Severity::kInfo:
      return spdlog::level::info;
    case Severity::kWarning:
      return spdlog::level::warn;
    case Severity::kError:
    case Severity::kCritical:
      break;
  }
  return spdlog::level::err;
}

} // namespace

RawError RawError::FromException(const std::exception& e, ErrorDomain domain, std::string operation, std::string subject) {
  RawError raw;
  raw.message   = e.what();
  raw.domain    = domain;
  raw.operation = std::move(operation);
  raw.subject   = std::move(subject);

  if (const auto* op = dynamic_cast<const util::OperationError*>(&e)) {
    raw.code = op->code();
  } else if (const auto* classified = dynamic_cast<const ClassifiedError*>(&e)) {
    raw.code = classified->record().code;
    if (!classified->record().raw_message.empty()) {
      raw.message = classified->record().raw_message;
    }
  } else if (const auto* sys = dynamic_cast<const std::system_error*>(&e)) {
    if (sys->code().category() == std::generic_category() || sys->code().category() == std::system_category()) {
      raw.code = util::ErrnoName(sys->code().value());
    }
  } else if (dynamic_cast<const util::InvalidArgument*>(&e)) {
    raw.code = "EINVAL";
  }
  return raw;
}

ErrorClassifier::ErrorClassifier(std::size_t log_capacity) : log_(log_capacity) {
}

model::ErrorRecord ErrorClassifier::Describe(const RawError& raw) const {
  model::ErrorRecord record;
  record.id          = util::GenerateErrorId();
  record.timestamp   = util::Now();
  record.code        = raw.code;
  record.raw_message = raw.message;
  record.operation   = raw.operation;

  for (const auto& rule : Rules()) {
    if (!rule.matches(raw)) {
      continue;
    }
    record.category         = rule.category;
    record.severity         = rule.severity;
    record.can_retry        = rule.can_retry;
    record.suggested_action = rule.action;
    record.user_message     = rule.message(raw);
    record.troubleshooting  = rule.troubleshooting;
    return record;
  }

  record.category         = ErrorCategory::kUnknown;
  record.severity         = Severity::kError;
  record.can_retry        = true;
  record.suggested_action = "retry";
  record.user_message     = "An unexpected error occurred: " + raw.message;
  record.troubleshooting  = {"Try the operation again", "Restart the application",
                             "Check the application log for details"};
  return record;
}

model::ErrorRecord ErrorClassifier::Classify(const RawError& raw) {
  auto record = Describe(raw);

  observability::Log(LevelFor(record.severity), record.user_message,
                     {observability::StringField("error_id", record.id),
                      observability::StringField("category", model::ToString(record.category)),
                      observability::StringField("severity", model::ToString(record.severity)),
                      observability::StringField("code", record.code),
                      observability::StringField("operation", record.operation),
                      observability::BoolField("can_retry", record.can_retry),
                      observability::StringField("raw", record.raw_message)});

  try {
    observability::JournalError(ToJsonLine(record));
  } catch (const std::exception& e) {
    SPEECHMAKER_LOG_WARN("error journal entry dropped",
                         {observability::StringField("error_id", record.id), observability::StringField("error", e.what())});
  }

  log_.Append(record);
  return record;
}

model::ErrorRecord ErrorClassifier::Classify(const std::exception& e, ErrorDomain domain, std::string operation, std::string subject) {
  return Classify(RawError::FromException(e, domain, std::move(operation), std::move(subject)));
}

void ErrorClassifier::Clear() {
  log_.Clear();
  observability::TruncateErrorJournal();
}

} // namespace speechmaker::errors
