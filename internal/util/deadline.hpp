#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace speechmaker::util {

/*
  Monotonic expiry for a single external call.
*/
class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  static Deadline After(std::chrono::milliseconds timeout);
  static Deadline Never();

  bool                      Expired() const;
  std::chrono::milliseconds Remaining() const;
  bool                      IsBounded() const {
    return bounded_;
  }

 private:
  Deadline(Clock::time_point at, bool bounded) : at_(at), bounded_(bounded) {
  }

  Clock::time_point at_;
  bool              bounded_;
};

/*
  Cooperative cancellation signal shared between a session and its workers.

  Copies share state; Cancel() is sticky and wakes every WaitFor().
*/
class CancellationToken {
 public:
  CancellationToken();

  void Cancel();
  bool IsCancelled() const;

  // Sleeps up to `duration`; returns true if the token was cancelled.
  bool WaitFor(std::chrono::milliseconds duration) const;

 private:
  struct State {
    mutable std::mutex      mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
  };

  std::shared_ptr<State> state_;
};

} // namespace speechmaker::util
