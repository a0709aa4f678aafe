#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include "internal/errors/error_log.hpp"
#include "internal/model/error_record.hpp"

namespace speechmaker::errors {

// Where the failure happened; decides how an OS code is read.
enum class ErrorDomain {
  kSystem,
  kVoice,
  kFile,
  kConverter,
  kConversion,
  kOutput,
  kCleanup,
};

/*
  Raw failure signature handed to the classifier.

  code is OS style (ENOENT, EACCES, ETIMEDOUT, ECANCELED, EXIT_NONZERO, ...)
  or empty; subject is the file path or voice id the failure refers to.
*/
struct RawError {
  std::string code;
  std::string message;
  ErrorDomain domain = ErrorDomain::kSystem;
  std::string operation;
  std::string subject;

  static RawError FromException(const std::exception& e, ErrorDomain domain, std::string operation, std::string subject = {});
};

/*
  Maps raw failures to ErrorRecords using a fixed rule table.

  Classification is deterministic for a given signature. Every record is
  logged at a level derived from its severity and appended to the owned
  ErrorLog.
*/
class ErrorClassifier {
 public:
  explicit ErrorClassifier(std::size_t log_capacity = 1000);

  model::ErrorRecord Classify(const RawError& raw);
  model::ErrorRecord Classify(const std::exception& e, ErrorDomain domain, std::string operation, std::string subject = {});

  // Classification without logging; used for previews and tests.
  model::ErrorRecord Describe(const RawError& raw) const;

  std::vector<model::ErrorRecord> Recent(std::size_t limit = 50) const {
    return log_.Recent(limit);
  }

  ErrorStatistics Stats() const {
    return log_.Stats();
  }

  // Empties the in-memory log and the on-disk error journal.
  void Clear();

 private:
  ErrorLog log_;
};

} // namespace speechmaker::errors
