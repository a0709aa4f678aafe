#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/error_record.hpp"

namespace speechmaker::errors {

/*
  A failure that has already been through the ErrorClassifier.

  what() is the user-facing message; the full descriptor is in record().
*/
class ClassifiedError : public std::runtime_error {
 public:
  explicit ClassifiedError(model::ErrorRecord record)
      : std::runtime_error(record.user_message), record_(std::move(record)) {
  }

  const model::ErrorRecord& record() const {
    return record_;
  }

 private:
  model::ErrorRecord record_;
};

/*
  Terminal failure of a conversion session. Keeps the chunk files produced so
  far so the caller can clean them up.
*/
class SessionError : public ClassifiedError {
 public:
  SessionError(model::ErrorRecord record, std::vector<std::string> partial_outputs)
      : ClassifiedError(std::move(record)), partial_outputs_(std::move(partial_outputs)) {
  }

  const std::vector<std::string>& partial_outputs() const {
    return partial_outputs_;
  }

 private:
  std::vector<std::string> partial_outputs_;
};

} // namespace speechmaker::errors
