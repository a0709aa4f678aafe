#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace speechmaker::audio {

struct WavFormat {
  std::uint16_t audio_format    = 1;
  std::uint16_t channels        = 0;
  std::uint32_t sample_rate     = 0;
  std::uint16_t bits_per_sample = 0;

  bool operator==(const WavFormat&) const = default;
};

struct WavInfo {
  WavFormat     format;
  std::uint64_t data_offset = 0;
  std::uint32_t data_size   = 0;
};

// Parses the RIFF header of a WAV file. Throws util::OperationError when the
// file is not a readable PCM WAV.
WavInfo ReadWavInfo(const std::string& path);

/*
  Concatenates PCM WAV files without an external tool.

  All inputs must share format; the output header is rewritten for the
  combined data size. Failures raise "Audio merging failed: ...".
*/
void MergeWavFiles(const std::vector<std::string>& inputs, const std::string& output);

// Writes a PCM WAV file. Used by tests and by the merger.
void WriteWavFile(const std::string& path, const WavFormat& format, const std::vector<char>& data);

} // namespace speechmaker::audio
