#include "error_log.hpp"

#include <algorithm>
#include <chrono>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace speechmaker::errors {

ErrorLog::ErrorLog(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw util::InvalidArgument("error log capacity must be positive");
  }
}

void ErrorLog::Append(model::ErrorRecord record) {
  std::lock_guard lock(mutex_);
  entries_.push_back(std::move(record));
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

std::vector<model::ErrorRecord> ErrorLog::Recent(std::size_t limit) const {
  std::lock_guard                 lock(mutex_);
  std::vector<model::ErrorRecord> out;
  out.reserve(std::min(limit, entries_.size()));
  for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < limit; ++it) {
    out.push_back(*it);
  }
  return out;
}

ErrorStatistics ErrorLog::Stats() const {
  const auto day_ago = util::Now() - std::chrono::hours(24);

  std::lock_guard lock(mutex_);
  ErrorStatistics stats;
  stats.total = entries_.size();
  for (const auto& record : entries_) {
    ++stats.by_category[std::string(model::ToString(record.category))];
    if (record.timestamp > day_ago) {
      ++stats.recent_24h;
    }
    if (record.severity == model::Severity::kCritical) {
      ++stats.critical_count;
    }
  }
  return stats;
}

void ErrorLog::Clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

std::size_t ErrorLog::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace speechmaker::errors
