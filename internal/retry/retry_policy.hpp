#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/model/error_record.hpp"
#include "internal/util/deadline.hpp"

namespace speechmaker::retry {

/*
  Backoff timing and per-key attempt counting.

  The policy does not classify: whether a failure is retried is decided by the
  record's can_retry flag. Counters are monotonic until Reset(key).
*/
class RetryPolicy {
 public:
  struct Options {
    std::uint32_t base_delay_ms = 1000;
    std::uint32_t cap_delay_ms  = 10000;
    std::uint32_t max_attempts  = 3;
  };

  RetryPolicy();
  explicit RetryPolicy(Options options);

  // min(base * 2^attempt, cap)
  std::chrono::milliseconds Delay(std::uint32_t attempt) const;

  bool ShouldRetry(const model::ErrorRecord& record) const {
    return record.can_retry;
  }

  // Records one more attempt for `key` and returns the new count.
  // Throws util::ResourceExhausted once max_attempts is already reached.
  std::uint32_t NextAttempt(const std::string& key);

  // Checks and records in one step; nullopt once max_attempts is reached.
  std::optional<std::uint32_t> TryNextAttempt(const std::string& key);

  bool          HasAttemptsLeft(const std::string& key) const;
  std::uint32_t Attempts(const std::string& key) const;
  std::uint32_t LastDelayMs(const std::string& key) const;

  void Reset(const std::string& key);
  void ResetAll();

  // Sleeps Delay(attempt); returns false if cancelled while waiting.
  bool WaitBeforeRetry(const std::string& key, std::uint32_t attempt, const util::CancellationToken& cancel);

  const Options& options() const {
    return options_;
  }

 private:
  struct RetryState {
    std::uint32_t attempts      = 0;
    std::uint32_t last_delay_ms = 0;
  };

  Options                                     options_;
  mutable std::mutex                          mutex_;
  std::unordered_map<std::string, RetryState> states_;
};

} // namespace speechmaker::retry
