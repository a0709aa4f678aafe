#pragma once

#include <string>
#include <vector>

#include "internal/util/deadline.hpp"

namespace speechmaker::util {

struct ProcessResult {
  int         exit_code = -1;
  std::string stdout_data;
  std::string stderr_data;
  bool        timed_out = false;
  bool        cancelled = false;

  bool Succeeded() const {
    return !timed_out && !cancelled && exit_code == 0;
  }
};

/*
  Runs an external command (argv[0] resolved through PATH) and collects its
  output.

  Always returns a definite outcome: the child is killed when the deadline
  passes or the token is cancelled. Failure to start the program throws
  OperationError with the errno name as code (ENOENT when it is not installed).
*/
class ProcessRunner {
 public:
  ProcessResult Run(const std::vector<std::string>& argv, const Deadline& deadline, const CancellationToken& cancel) const;

  ProcessResult Run(const std::vector<std::string>& argv, const Deadline& deadline) const {
    return Run(argv, deadline, CancellationToken{});
  }
};

} // namespace speechmaker::util
