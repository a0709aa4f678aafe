#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config/config.pb.h"
#include "internal/model/output_format.hpp"

namespace speechmaker::config {

/*
  RuntimeConfig with defaults applied and ranges enforced.
*/
struct Settings {
  std::string bind_address = "127.0.0.1:50061";

  std::string               engine_binary = "edge-tts";
  std::chrono::milliseconds voice_list_timeout{5000};
  std::chrono::milliseconds fast_start_voice_list_timeout{2000};
  std::chrono::milliseconds synthesis_timeout{120000};
  std::uint32_t             voice_load_attempts = 3;

  std::string               converter_bundled_path;
  std::string               converter_system_binary = "ffmpeg";
  std::chrono::milliseconds converter_detection_timeout{3000};
  std::chrono::milliseconds converter_operation_timeout{300000};
  std::string               mp3_bitrate = "128k";
  std::uint32_t             sample_rate = 44100;

  std::uint32_t       max_chunk_length      = 5000;
  std::uint32_t       worker_pool_size      = 3;
  model::OutputFormat default_output_format = model::OutputFormat::kWav;
  double              voice_speed           = 1.0;
  std::string         default_output_path;

  std::uint32_t retry_base_delay_ms = 1000;
  std::uint32_t retry_cap_delay_ms  = 10000;
  std::uint32_t retry_max_attempts  = 3;

  std::uint32_t error_log_capacity = 1000;
  bool          fast_start         = false;

  std::chrono::milliseconds EffectiveVoiceListTimeout() const {
    return fast_start ? fast_start_voice_list_timeout : voice_list_timeout;
  }
};

// Throws std::runtime_error("Invalid configuration: ...") on out-of-range values.
Settings ResolveSettings(const speechmaker::runtime::config::RuntimeConfig& config);

} // namespace speechmaker::config
