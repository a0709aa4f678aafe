#include "retry_policy.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace speechmaker::retry {

RetryPolicy::RetryPolicy() : RetryPolicy(Options{}) {
}

RetryPolicy::RetryPolicy(Options options) : options_(options) {
  if (options_.max_attempts == 0) {
    throw util::InvalidArgument("retry max_attempts must be positive");
  }
  if (options_.cap_delay_ms < options_.base_delay_ms) {
    throw util::InvalidArgument("retry cap delay must not be below base delay");
  }
}

std::chrono::milliseconds RetryPolicy::Delay(std::uint32_t attempt) const {
  const std::uint64_t cap   = options_.cap_delay_ms;
  std::uint64_t       delay = options_.base_delay_ms;
  for (std::uint32_t i = 0; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, cap));
}

std::uint32_t RetryPolicy::NextAttempt(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto&           state = states_[key];
  if (state.attempts >= options_.max_attempts) {
    throw util::ResourceExhausted("retry attempts exhausted for " + key);
  }
  return ++state.attempts;
}

std::optional<std::uint32_t> RetryPolicy::TryNextAttempt(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto&           state = states_[key];
  if (state.attempts >= options_.max_attempts) {
    return std::nullopt;
  }
  return ++state.attempts;
}

bool RetryPolicy::HasAttemptsLeft(const std::string& key) const {
  return Attempts(key) < options_.max_attempts;
}

std::uint32_t RetryPolicy::Attempts(const std::string& key) const {
  std::lock_guard lock(mutex_);
  const auto      it = states_.find(key);
  return it == states_.end() ? 0 : it->second.attempts;
}

std::uint32_t RetryPolicy::LastDelayMs(const std::string& key) const {
  std::lock_guard lock(mutex_);
  const auto      it = states_.find(key);
  return it == states_.end() ? 0 : it->second.last_delay_ms;
}

void RetryPolicy::Reset(const std::string& key) {
  std::lock_guard lock(mutex_);
  states_.erase(key);
}

void RetryPolicy::ResetAll() {
  std::lock_guard lock(mutex_);
  states_.clear();
}

bool RetryPolicy::WaitBeforeRetry(const std::string& key, std::uint32_t attempt, const util::CancellationToken& cancel) {
  const auto delay = Delay(attempt);
  {
    std::lock_guard lock(mutex_);
    states_[key].last_delay_ms = static_cast<std::uint32_t>(delay.count());
  }
  return !cancel.WaitFor(delay);
}

} // namespace speechmaker::retry
