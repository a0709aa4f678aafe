#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace speechmaker::model {

enum class ResourceKind : std::uint8_t {
  kAudioConverter = 0,
  kVoiceCatalog   = 1,
};

enum class ResourceSource : std::uint8_t {
  kNone    = 0,
  kBundled = 1,
  kSystem  = 2,
  kEngine  = 3,
};

/*
  Snapshot of an external capability.

  Shared read-only once resolution has completed; refreshed only by clearing
  the resolver cache.
*/
struct ResourceStatus {
  ResourceKind              kind      = ResourceKind::kAudioConverter;
  bool                      available = false;
  ResourceSource            source    = ResourceSource::kNone;
  std::string               path;
  std::chrono::milliseconds detection_latency{0};
  util::TimePoint           cached_at{};
};

constexpr std::string_view ToString(ResourceKind kind) {
  return kind == ResourceKind::kAudioConverter ? "audio_converter" : "voice_catalog";
}

constexpr std::string_view ToString(ResourceSource source) {
  switch (source) {
    case ResourceSource::kBundled:
      return "bundled";
    case ResourceSource::kSystem:
      return "system";
    case ResourceSource::kEngine:
      return "engine";
    case ResourceSource::kNone:
      break;
  }
  return "none";
}

} // namespace speechmaker::model
