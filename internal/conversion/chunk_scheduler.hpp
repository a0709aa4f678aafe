#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>

namespace speechmaker::conversion {

/*
  A chunk waiting for a worker. Retries are re-enqueued with the next attempt.
*/
struct ChunkTask {
  std::size_t   index   = 0;
  std::uint32_t attempt = 0;
};

/*
  Thread-safe blocking queue feeding the chunk workers of one session.
*/
class ChunkScheduler {
 public:
  void Enqueue(const ChunkTask& task);

  // blocking wait; empty once shut down and drained
  std::optional<ChunkTask> Dequeue();

  // Lets workers drain what is queued, then stop.
  void Shutdown();

  // Drops unscheduled tasks and stops. Returns how many were dropped.
  std::size_t Abort();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<ChunkTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace speechmaker::conversion
