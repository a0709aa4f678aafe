#include "deadline.hpp"

#include <algorithm>

namespace speechmaker::util {

Deadline Deadline::After(std::chrono::milliseconds timeout) {
  return Deadline(Clock::now() + timeout, true);
}

Deadline Deadline::Never() {
  return Deadline(Clock::time_point::max(), false);
}

bool Deadline::Expired() const {
  return bounded_ && Clock::now() >= at_;
}

std::chrono::milliseconds Deadline::Remaining() const {
  if (!bounded_) {
    return std::chrono::milliseconds::max();
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  std::unique_lock lock(state_->mutex);
  return state_->cv.wait_for(lock, duration, [&] { return state_->cancelled; });
}

} // namespace speechmaker::util
