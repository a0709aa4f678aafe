#include "resource_resolver.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace speechmaker::resources {

namespace {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

std::chrono::milliseconds Since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

ResourceResolver::ResourceResolver(Options options, std::shared_ptr<ConverterProbe> probe,
                                   std::shared_ptr<engine::VoiceEngine> engine,
                                   std::shared_ptr<errors::ErrorClassifier> classifier)
    : options_(std::move(options)),
      probe_(std::move(probe)),
      engine_(std::move(engine)),
      classifier_(std::move(classifier)),
      voice_retry_(retry::RetryPolicy::Options{options_.retry_base_delay_ms, options_.retry_cap_delay_ms,
                                               options_.voice_load_attempts}) {
  if (!probe_ || !engine_ || !classifier_) {
    throw util::InvalidArgument("resource resolver requires probe, engine and classifier");
  }
}

model::ResourceStatus ResourceResolver::ResolveConverter() {
  return converter_.Get([this] { return ProbeConverter(); });
}

VoiceCatalog ResourceResolver::ResolveVoices() {
  return voices_.Get([this] { return LoadVoices(); },
                     [](const VoiceCatalog& catalog) {
                       return !catalog.last_error || catalog.last_error->category != model::ErrorCategory::kCancelled;
                     });
}

model::ResourceStatus ResourceResolver::Resolve(model::ResourceKind kind) {
  if (kind == model::ResourceKind::kAudioConverter) {
    return ResolveConverter();
  }
  return ResolveVoices().status;
}

std::optional<model::ResourceStatus> ResourceResolver::Cached(model::ResourceKind kind) const {
  if (kind == model::ResourceKind::kAudioConverter) {
    return converter_.Cached();
  }
  auto catalog = voices_.Cached();
  if (!catalog) {
    return std::nullopt;
  }
  return catalog->status;
}

void ResourceResolver::Clear() {
  converter_.Clear();
  voices_.Clear();
}

void ResourceResolver::Clear(model::ResourceKind kind) {
  if (kind == model::ResourceKind::kAudioConverter) {
    converter_.Clear();
  } else {
    voices_.Clear();
  }
}

void ResourceResolver::ResetRetries() {
  voice_retry_.ResetAll();
}

void ResourceResolver::Cancel() {
  cancel_.Cancel();
}

model::ResourceStatus ResourceResolver::ProbeConverter() {
  const auto start = std::chrono::steady_clock::now();

  model::ResourceStatus status;
  status.kind = model::ResourceKind::kAudioConverter;

  try {
    if (!options_.bundled_converter_path.empty() && probe_->CheckBundled(options_.bundled_converter_path)) {
      status.available = true;
      status.source    = model::ResourceSource::kBundled;
      status.path      = options_.bundled_converter_path;
    } else {
      const auto deadline = util::Deadline::After(options_.converter_timeout);
      auto       found    = probe_->FindSystem(deadline);
      if (found && !deadline.Expired()) {
        status.available = true;
        status.source    = model::ResourceSource::kSystem;
        status.path      = std::move(*found);
      } else if (found) {
        SPEECHMAKER_LOG_WARN("converter found after detection deadline; treating as absent",
                             {StringField("path", *found)});
      }
    }
  } catch (const std::exception& e) {
    classifier_->Classify(e, errors::ErrorDomain::kConverter, "detect_converter");
  }

  status.detection_latency = Since(start);
  status.cached_at         = util::Now();

  SPEECHMAKER_LOG_INFO("audio converter resolved",
                       {BoolField("available", status.available), StringField("source", model::ToString(status.source)),
                        StringField("path", status.path), IntField("latency_ms", status.detection_latency.count())});
  return status;
}

VoiceCatalog ResourceResolver::LoadVoices() {
  const auto start = std::chrono::steady_clock::now();

  VoiceCatalog catalog;
  catalog.status.kind = model::ResourceKind::kVoiceCatalog;

  // one counter per load; a load detached by Clear() keeps its own budget
  const std::string key = std::string(kVoiceRetryKey) + "#" + std::to_string(++voice_loads_);

  while (const auto attempt = voice_retry_.TryNextAttempt(key)) {
    catalog.attempts = *attempt;
    try {
      catalog.voices = engine_->ListVoices(util::Deadline::After(options_.voice_list_timeout), cancel_);
      catalog.last_error.reset();
      break;
    } catch (const std::exception& e) {
      catalog.last_error = classifier_->Classify(e, errors::ErrorDomain::kVoice, "list_voices");
    }

    const auto& record = *catalog.last_error;
    if (record.category == model::ErrorCategory::kCancelled || !voice_retry_.ShouldRetry(record) ||
        !voice_retry_.HasAttemptsLeft(key)) {
      break;
    }

    SPEECHMAKER_LOG_WARN("voice listing failed, retrying",
                         {IntField("attempt", catalog.attempts),
                          IntField("delay_ms", voice_retry_.Delay(catalog.attempts - 1).count())});
    if (!voice_retry_.WaitBeforeRetry(key, catalog.attempts - 1, cancel_)) {
      catalog.last_error = classifier_->Classify(errors::RawError{"ECANCELED", "Voice loading was cancelled",
                                                                  errors::ErrorDomain::kVoice, "list_voices", {}});
      break;
    }
  }

  voice_retry_.Reset(key);

  catalog.status.available         = !catalog.voices.empty();
  catalog.status.source            = catalog.status.available ? model::ResourceSource::kEngine : model::ResourceSource::kNone;
  catalog.status.detection_latency = Since(start);
  catalog.status.cached_at         = util::Now();

  SPEECHMAKER_LOG_INFO("voice catalog resolved", {IntField("voices", static_cast<std::int64_t>(catalog.voices.size())),
                                                  IntField("attempts", catalog.attempts),
                                                  IntField("latency_ms", catalog.status.detection_latency.count())});
  return catalog;
}

} // namespace speechmaker::resources
