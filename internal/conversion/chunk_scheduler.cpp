#include "chunk_scheduler.hpp"

namespace speechmaker::conversion {

void ChunkScheduler::Enqueue(const ChunkTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<ChunkTask> ChunkScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  ChunkTask task = queue_.front();
  queue_.pop();
  return task;
}

void ChunkScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t ChunkScheduler::Abort() {
  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    dropped = queue_.size();
    std::queue<ChunkTask>().swap(queue_);
    shutdown_ = true;
  }
  cv_.notify_all();
  return dropped;
}

} // namespace speechmaker::conversion
