#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/audio/audio_converter.hpp"
#include "internal/util/process.hpp"

namespace speechmaker::audio {

class FfmpegConverter : public AudioConverter {
 public:
  struct Options {
    std::string               mp3_bitrate = "128k";
    std::uint32_t             sample_rate = 44100;
    std::chrono::milliseconds operation_timeout{300000};
  };

  FfmpegConverter(std::string binary, Options options, util::ProcessRunner runner = {});

  // Runs `<binary> -version` and checks the banner.
  static bool Validate(const std::string& binary, const util::Deadline& deadline, const util::ProcessRunner& runner = {});

  void Transcode(const std::string& input, const std::string& output, model::OutputFormat format,
                 const util::CancellationToken& cancel) override;

  void Merge(const std::vector<std::string>& inputs, const std::string& output, model::OutputFormat format,
             const util::CancellationToken& cancel) override;

  // ffmpeg concat demuxer list for `inputs`.
  static std::string ConcatList(const std::vector<std::string>& inputs);

  const std::string& binary() const {
    return binary_;
  }

 private:
  std::vector<std::string> CodecArgs(model::OutputFormat format) const;

  std::string         binary_;
  Options             options_;
  util::ProcessRunner runner_;
};

} // namespace speechmaker::audio
