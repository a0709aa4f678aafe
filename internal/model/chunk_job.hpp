#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/output_format.hpp"

namespace speechmaker::model {

enum class ChunkStatus : std::uint8_t {
  kPending    = 0,
  kInProgress = 1,
  kSucceeded  = 2,
  kFailed     = 3,
};

// Failed may go back to Pending when a retry is scheduled.
constexpr bool CanTransition(ChunkStatus from, ChunkStatus to) {
  switch (from) {
    case ChunkStatus::kPending:
      return to == ChunkStatus::kInProgress || to == ChunkStatus::kFailed;
    case ChunkStatus::kInProgress:
      return to == ChunkStatus::kSucceeded || to == ChunkStatus::kFailed;
    case ChunkStatus::kFailed:
      return to == ChunkStatus::kPending;
    case ChunkStatus::kSucceeded:
      return false;
  }
  return false;
}

struct ChunkJob {
  std::size_t index = 0;
  std::string text;
  ChunkStatus status        = ChunkStatus::kPending;
  int         attempt_count = 0;
  std::string output_path;
};

enum class SessionStatus : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kSucceeded = 2,
  kFailed    = 3,
  kCancelled = 4,
};

constexpr bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kSucceeded || status == SessionStatus::kFailed || status == SessionStatus::kCancelled;
}

/*
  One end-to-end text to audio request.

  jobs[i].index == i; merge order is always by index.
*/
struct ConversionSession {
  std::string           id;
  std::vector<ChunkJob> jobs;
  std::string           voice_id;
  double                speed  = 1.0;
  OutputFormat          format = OutputFormat::kWav;
  std::string           output_path;
  SessionStatus         status = SessionStatus::kPending;
};

} // namespace speechmaker::model
