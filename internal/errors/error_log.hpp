#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/model/error_record.hpp"

namespace speechmaker::errors {

struct ErrorStatistics {
  std::uint64_t                        total = 0;
  std::map<std::string, std::uint64_t> by_category;
  std::uint64_t                        recent_24h     = 0;
  std::uint64_t                        critical_count = 0;
};

/*
  Bounded in-memory audit trail of classified errors.

  Oldest entries are evicted once capacity is reached. Owned by the
  ErrorClassifier; there is no process-global instance.
*/
class ErrorLog {
 public:
  explicit ErrorLog(std::size_t capacity);

  void Append(model::ErrorRecord record);

  // Newest first.
  std::vector<model::ErrorRecord> Recent(std::size_t limit) const;

  ErrorStatistics Stats() const;
  void            Clear();
  std::size_t     Size() const;

  std::size_t capacity() const {
    return capacity_;
  }

 private:
  std::size_t                    capacity_;
  mutable std::mutex             mutex_;
  std::deque<model::ErrorRecord> entries_;
};

} // namespace speechmaker::errors
