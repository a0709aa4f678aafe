#include "settings.hpp"

#include <stdexcept>

namespace speechmaker::config {

namespace {

void Require(bool condition, const std::string& what) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: " + what);
  }
}

std::chrono::milliseconds MillisOr(std::uint32_t value, std::chrono::milliseconds fallback) {
  return value > 0 ? std::chrono::milliseconds(value) : fallback;
}

} // namespace

Settings ResolveSettings(const speechmaker::runtime::config::RuntimeConfig& config) {
  Settings s;

  if (!config.server().bind_address().empty()) {
    s.bind_address = config.server().bind_address();
  }

  const auto& engine = config.engine();
  if (!engine.binary().empty()) {
    s.engine_binary = engine.binary();
  }
  s.voice_list_timeout            = MillisOr(engine.voice_list_timeout_ms(), s.voice_list_timeout);
  s.fast_start_voice_list_timeout = MillisOr(engine.fast_start_voice_list_timeout_ms(), s.fast_start_voice_list_timeout);
  s.synthesis_timeout             = MillisOr(engine.synthesis_timeout_ms(), s.synthesis_timeout);
  if (engine.voice_load_attempts() > 0) {
    Require(engine.voice_load_attempts() >= 2 && engine.voice_load_attempts() <= 5, "engine.voice_load_attempts must be within 2..5");
    s.voice_load_attempts = engine.voice_load_attempts();
  }

  const auto& converter      = config.converter();
  s.converter_bundled_path   = converter.bundled_path();
  if (!converter.system_binary().empty()) {
    s.converter_system_binary = converter.system_binary();
  }
  s.converter_detection_timeout = MillisOr(converter.detection_timeout_ms(), s.converter_detection_timeout);
  s.converter_operation_timeout = MillisOr(converter.operation_timeout_ms(), s.converter_operation_timeout);
  if (!converter.mp3_bitrate().empty()) {
    s.mp3_bitrate = converter.mp3_bitrate();
  }
  if (converter.sample_rate() > 0) {
    s.sample_rate = converter.sample_rate();
  }

  const auto& conversion = config.conversion();
  if (conversion.max_chunk_length() > 0) {
    Require(conversion.max_chunk_length() >= 1000 && conversion.max_chunk_length() <= 50000,
            "conversion.max_chunk_length must be within 1000..50000");
    s.max_chunk_length = conversion.max_chunk_length();
  }
  if (conversion.worker_pool_size() > 0) {
    Require(conversion.worker_pool_size() <= 16, "conversion.worker_pool_size must be within 1..16");
    s.worker_pool_size = conversion.worker_pool_size();
  }
  if (!conversion.default_output_format().empty()) {
    auto format = model::ParseOutputFormat(conversion.default_output_format());
    Require(format.has_value(), "conversion.default_output_format must be wav or mp3");
    s.default_output_format = *format;
  }
  if (conversion.voice_speed() != 0.0) {
    Require(conversion.voice_speed() >= 0.5 && conversion.voice_speed() <= 2.0, "conversion.voice_speed must be within 0.5..2.0");
    s.voice_speed = conversion.voice_speed();
  }
  s.default_output_path = conversion.default_output_path();

  const auto& retry = config.retry();
  if (retry.base_delay_ms() > 0) {
    s.retry_base_delay_ms = retry.base_delay_ms();
  }
  if (retry.cap_delay_ms() > 0) {
    s.retry_cap_delay_ms = retry.cap_delay_ms();
  }
  Require(s.retry_cap_delay_ms >= s.retry_base_delay_ms, "retry.cap_delay_ms must not be below retry.base_delay_ms");
  if (retry.max_attempts() > 0) {
    s.retry_max_attempts = retry.max_attempts();
  }

  if (config.errors().capacity() > 0) {
    s.error_log_capacity = config.errors().capacity();
  }
  s.fast_start = config.fast_start();

  return s;
}

} // namespace speechmaker::config
