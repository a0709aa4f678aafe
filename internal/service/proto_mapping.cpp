#include "proto_mapping.hpp"

#include "internal/util/time.hpp"

namespace speechmaker::service {

namespace v1 = speechmaker::v1;

v1::Voice ToProto(const model::Voice& voice) {
  v1::Voice out;
  out.set_id(voice.id);
  out.set_display_name(voice.display_name);
  out.set_locale(voice.locale);
  out.set_gender(voice.gender);
  out.set_is_default(voice.is_default);
  return out;
}

v1::ResourceStatus ToProto(const model::ResourceStatus& status) {
  v1::ResourceStatus out;
  out.set_kind(std::string(model::ToString(status.kind)));
  out.set_available(status.available);
  switch (status.source) {
    case model::ResourceSource::kBundled:
      out.set_source(v1::RESOURCE_SOURCE_BUNDLED);
      break;
    case model::ResourceSource::kSystem:
      out.set_source(v1::RESOURCE_SOURCE_SYSTEM);
      break;
    case model::ResourceSource::kEngine:
      out.set_source(v1::RESOURCE_SOURCE_ENGINE);
      break;
    case model::ResourceSource::kNone:
      out.set_source(v1::RESOURCE_SOURCE_NONE);
      break;
  }
  out.set_path(status.path);
  out.set_detection_latency_ms(static_cast<uint64_t>(status.detection_latency.count()));
  out.set_cached_at_ms(util::ToUnixMillis(status.cached_at));
  return out;
}

v1::ReadinessSnapshot ToProto(const readiness::ReadinessSnapshot& snapshot) {
  v1::ReadinessSnapshot out;
  out.set_ready(snapshot.ready);
  out.set_initializing(snapshot.initializing);
  out.set_voices_loaded(snapshot.voices_loaded);
  out.set_voice_count(static_cast<uint32_t>(snapshot.voices.size()));
  out.set_voice_load_attempts(snapshot.voice_load_attempts);
  if (snapshot.voice_load_error) {
    *out.mutable_voice_load_error() = ToProto(*snapshot.voice_load_error);
  }
  if (snapshot.converter) {
    *out.mutable_converter() = ToProto(*snapshot.converter);
  }
  out.set_mp3_available(snapshot.mp3_available);
  out.set_output_folder_set(snapshot.output_folder_set);
  out.set_output_folder(snapshot.output_folder);
  out.set_default_output_folder(snapshot.default_output_folder);
  out.set_sequence(snapshot.sequence);
  return out;
}

v1::ReadinessTopic ToProto(readiness::Topic topic) {
  switch (topic) {
    case readiness::Topic::kInitialization:
      return v1::READINESS_TOPIC_INITIALIZATION;
    case readiness::Topic::kVoice:
      return v1::READINESS_TOPIC_VOICE;
    case readiness::Topic::kConverter:
      return v1::READINESS_TOPIC_CONVERTER;
    case readiness::Topic::kOutputFolder:
      return v1::READINESS_TOPIC_OUTPUT_FOLDER;
    case readiness::Topic::kAction:
      return v1::READINESS_TOPIC_ACTION;
  }
  return v1::READINESS_TOPIC_UNSPECIFIED;
}

v1::ErrorStatistics ToProto(const errors::ErrorStatistics& stats) {
  v1::ErrorStatistics out;
  out.set_total(stats.total);
  for (const auto& [category, count] : stats.by_category) {
    (*out.mutable_by_category())[category] = count;
  }
  out.set_recent_24h(stats.recent_24h);
  out.set_critical_count(stats.critical_count);
  return out;
}

model::OutputFormat FromProto(v1::OutputFormat format, model::OutputFormat fallback) {
  switch (format) {
    case v1::OUTPUT_FORMAT_WAV:
      return model::OutputFormat::kWav;
    case v1::OUTPUT_FORMAT_MP3:
      return model::OutputFormat::kMp3;
    default:
      return fallback;
  }
}

std::optional<readiness::Topic> FromProto(v1::ReadinessTopic topic) {
  switch (topic) {
    case v1::READINESS_TOPIC_INITIALIZATION:
      return readiness::Topic::kInitialization;
    case v1::READINESS_TOPIC_VOICE:
      return readiness::Topic::kVoice;
    case v1::READINESS_TOPIC_CONVERTER:
      return readiness::Topic::kConverter;
    case v1::READINESS_TOPIC_OUTPUT_FOLDER:
      return readiness::Topic::kOutputFolder;
    case v1::READINESS_TOPIC_ACTION:
      return readiness::Topic::kAction;
    default:
      return std::nullopt;
  }
}

} // namespace speechmaker::service
