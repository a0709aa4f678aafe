#pragma once

#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <utility>

namespace speechmaker::resources {

/*
  Cached, deduplicated computation of one value.

  Concurrent Get() calls share a single execution of `fn`. The result is
  cached when `cacheable(result)` holds; exceptions are propagated to every
  waiter and never cached. Clear() drops the cache and detaches any execution
  still running so it cannot repopulate it.
*/
template <typename T>
class SingleFlight {
 public:
  template <typename Fn, typename Pred>
  T Get(Fn&& fn, Pred&& cacheable) {
    std::unique_lock lock(mutex_);
    if (cached_) {
      return *cached_;
    }
    if (inflight_) {
      auto shared = *inflight_;
      lock.unlock();
      return shared.get();
    }

    std::promise<T> promise;
    inflight_             = promise.get_future().share();
    const auto generation = generation_;
    lock.unlock();

    try {
      T value = fn();
      lock.lock();
      if (generation == generation_) {
        if (cacheable(value)) {
          cached_ = value;
        }
        inflight_.reset();
      }
      lock.unlock();
      promise.set_value(value);
      return value;
    } catch (...) {
      lock.lock();
      if (generation == generation_) {
        inflight_.reset();
      }
      lock.unlock();
      promise.set_exception(std::current_exception());
      throw;
    }
  }

  template <typename Fn>
  T Get(Fn&& fn) {
    return Get(std::forward<Fn>(fn), [](const T&) { return true; });
  }

  std::optional<T> Cached() const {
    std::lock_guard lock(mutex_);
    return cached_;
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    cached_.reset();
    inflight_.reset();
    ++generation_;
  }

 private:
  mutable std::mutex                   mutex_;
  std::optional<T>                     cached_;
  std::optional<std::shared_future<T>> inflight_;
  std::uint64_t                        generation_ = 0;
};

} // namespace speechmaker::resources
