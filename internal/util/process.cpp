#include "process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include "internal/util/errno_codes.hpp"
#include "internal/util/errors.hpp"

namespace speechmaker::util {

namespace {

constexpr int kPollIntervalMs = 20;

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Reads whatever is available; returns false once the pipe reached EOF.
bool Drain(int fd, std::string& sink) {
  char buffer[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      sink.append(buffer, static_cast<size_t>(n));
      if (static_cast<size_t>(n) < sizeof(buffer)) {
        return true;
      }
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv, const Deadline& deadline, const CancellationToken& cancel) const {
  if (argv.empty() || argv.front().empty()) {
    throw InvalidArgument("empty command line");
  }

  // argv must be materialized before fork()
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  int out_pipe[2]  = {-1, -1};
  int err_pipe[2]  = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
      CloseFd(fds[0]);
      CloseFd(fds[1]);
    }
    throw OperationError(ErrnoName(err), "failed to create pipes for " + argv.front() + ": " + std::strerror(err));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
      CloseFd(fds[0]);
      CloseFd(fds[1]);
    }
    throw OperationError("ESPAWN", "failed to fork for " + argv.front() + ": " + std::strerror(err));
  }

  if (pid == 0) {
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    ::execvp(args[0], args.data());
    const int err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    ::_exit(127);
  }

  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  CloseFd(exec_pipe[1]);

  // The exec pipe closes on a successful exec; otherwise it carries errno.
  int     child_errno = 0;
  ssize_t got         = -1;
  do {
    got = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  CloseFd(exec_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    ::waitpid(pid, nullptr, 0);
    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);
    throw OperationError(ErrnoName(child_errno), "failed to start " + argv.front() + ": " + std::strerror(child_errno));
  }

  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  ProcessResult result;
  int           status = 0;
  bool          reaped = false;

  for (;;) {
    if (cancel.IsCancelled()) {
      ::kill(pid, SIGKILL);
      result.cancelled = true;
      break;
    }
    if (deadline.Expired()) {
      ::kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    if (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
      pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
      const int ready = ::poll(fds, 2, kPollIntervalMs);
      if (ready < 0 && errno != EINTR) {
        ::kill(pid, SIGKILL);
        break;
      }
      if (ready > 0) {
        if (out_pipe[0] >= 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) && !Drain(out_pipe[0], result.stdout_data)) {
          CloseFd(out_pipe[0]);
        }
        if (err_pipe[0] >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) && !Drain(err_pipe[0], result.stderr_data)) {
          CloseFd(err_pipe[0]);
        }
      }
      continue;
    }

    const pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      reaped = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
  }

  if (!reaped) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  CloseFd(out_pipe[0]);
  CloseFd(err_pipe[0]);

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace speechmaker::util
