#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace speechmaker::model {

enum class ErrorCategory : std::uint8_t {
  kUnknown            = 0,
  kVoiceUnavailable   = 1,
  kEngineUnresponsive = 2,
  kFileNotFound       = 3,
  kAccessDenied       = 4,
  kIsDirectory        = 5,
  kUnsupportedFile    = 6,
  kFileTooLarge       = 7,
  kConverterMissing   = 8,
  kConversionFailed   = 9,
  kMergeFailed        = 10,
  kEmptyInput         = 11,
  kCancelled          = 12,
  kCleanup            = 13,
  kTooManyOpenFiles   = 14,
  kOutputLocation     = 15,
};

enum class Severity : std::uint8_t {
  kInfo     = 0,
  kWarning  = 1,
  kError    = 2,
  kCritical = 3,
};

/*
  Normalized failure descriptor. Immutable once created by the classifier.
*/
struct ErrorRecord {
  std::string              id;
  util::TimePoint          timestamp{};
  ErrorCategory            category = ErrorCategory::kUnknown;
  Severity                 severity = Severity::kError;
  std::string              user_message;
  std::vector<std::string> troubleshooting;
  bool                     can_retry = false;
  std::string              suggested_action;

  // raw signature and context
  std::string code;
  std::string raw_message;
  std::string operation;
};

constexpr std::string_view ToString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kVoiceUnavailable:
      return "voice_unavailable";
    case ErrorCategory::kEngineUnresponsive:
      return "engine_unresponsive";
    case ErrorCategory::kFileNotFound:
      return "file_not_found";
    case ErrorCategory::kAccessDenied:
      return "access_denied";
    case ErrorCategory::kIsDirectory:
      return "is_directory";
    case ErrorCategory::kUnsupportedFile:
      return "unsupported_file_type";
    case ErrorCategory::kFileTooLarge:
      return "file_too_large";
    case ErrorCategory::kConverterMissing:
      return "converter_missing";
    case ErrorCategory::kConversionFailed:
      return "conversion_failed";
    case ErrorCategory::kMergeFailed:
      return "merge_failed";
    case ErrorCategory::kEmptyInput:
      return "empty_input";
    case ErrorCategory::kCancelled:
      return "cancelled";
    case ErrorCategory::kCleanup:
      return "cleanup";
    case ErrorCategory::kTooManyOpenFiles:
      return "too_many_open_files";
    case ErrorCategory::kOutputLocation:
      return "output_location";
    case ErrorCategory::kUnknown:
      break;
  }
  return "unknown";
}

constexpr std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kInfo:
      return "info";
    case Severity::kWarning:
      return "warning";
    case Severity::kError:
      return "error";
    case Severity::kCritical:
      return "critical";
  }
  return "error";
}

} // namespace speechmaker::model
