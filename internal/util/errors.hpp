#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace speechmaker::util {

/*
  Central error types.

  Raw failures are thrown with these types and classified later into
  ErrorRecords; the RPC layer translates classified errors to gRPC status codes.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A failed external operation carrying a raw, OS-style code
  (ENOENT, EACCES, ETIMEDOUT, ECANCELED, EXIT_NONZERO, ESPAWN, ...).
*/
class OperationError : public std::runtime_error {
 public:
  OperationError(std::string code, const std::string& msg) : std::runtime_error(msg), code_(std::move(code)) {
  }

  const std::string& code() const {
    return code_;
  }

 private:
  std::string code_;
};

} // namespace speechmaker::util
