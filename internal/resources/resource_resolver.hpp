#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/engine/voice_engine.hpp"
#include "internal/errors/error_classifier.hpp"
#include "internal/model/error_record.hpp"
#include "internal/model/resource_status.hpp"
#include "internal/model/voice.hpp"
#include "internal/resources/converter_probe.hpp"
#include "internal/resources/single_flight.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/deadline.hpp"

namespace speechmaker::resources {

struct VoiceCatalog {
  model::ResourceStatus             status;
  std::vector<model::Voice>         voices;
  std::uint32_t                     attempts = 0;
  std::optional<model::ErrorRecord> last_error;
};

/*
  ResourceResolver

  Resolves the audio converter and the voice catalog once per cache lifetime.
  Concurrent callers for the same kind share one probe. Failed voice listings
  are cached like successes; cancelled ones are not. Clear() starts a new
  cache lifetime; a load still running from the previous lifetime finishes
  on its own attempt budget and is not cached.
*/
class ResourceResolver {
 public:
  struct Options {
    std::string               bundled_converter_path;
    std::chrono::milliseconds converter_timeout{3000};
    std::chrono::milliseconds voice_list_timeout{5000};
    std::uint32_t             voice_load_attempts = 3;
    std::uint32_t             retry_base_delay_ms = 1000;
    std::uint32_t             retry_cap_delay_ms  = 10000;
  };

  ResourceResolver(Options options, std::shared_ptr<ConverterProbe> probe, std::shared_ptr<engine::VoiceEngine> engine,
                   std::shared_ptr<errors::ErrorClassifier> classifier);

  model::ResourceStatus ResolveConverter();
  VoiceCatalog          ResolveVoices();

  model::ResourceStatus Resolve(model::ResourceKind kind);

  std::optional<model::ResourceStatus> Cached(model::ResourceKind kind) const;

  void Clear();
  void Clear(model::ResourceKind kind);

  // Clears voice retry bookkeeping, including that of a load in progress.
  void ResetRetries();

  // Interrupts running probes; later resolutions fail fast as cancelled.
  void Cancel();

  // Prefix of the per-load retry keys ("voice_catalog#<n>").
  static constexpr const char* kVoiceRetryKey = "voice_catalog";

 private:
  model::ResourceStatus ProbeConverter();
  VoiceCatalog          LoadVoices();

  Options                                  options_;
  std::shared_ptr<ConverterProbe>          probe_;
  std::shared_ptr<engine::VoiceEngine>     engine_;
  std::shared_ptr<errors::ErrorClassifier> classifier_;
  retry::RetryPolicy                       voice_retry_;
  util::CancellationToken                  cancel_;
  std::atomic<std::uint64_t>               voice_loads_{0};

  SingleFlight<model::ResourceStatus> converter_;
  SingleFlight<VoiceCatalog>          voices_;
};

} // namespace speechmaker::resources
