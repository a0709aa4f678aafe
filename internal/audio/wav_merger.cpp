#include "wav_merger.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <limits>

#include "internal/util/errors.hpp"

namespace speechmaker::audio {

namespace {

constexpr std::uint32_t kHeaderSize = 44;

std::uint32_t ReadU32(const char* p) {
  const auto* b = reinterpret_cast<const unsigned char*>(p);
  return static_cast<std::uint32_t>(b[0]) | static_cast<std::uint32_t>(b[1]) << 8 |
         static_cast<std::uint32_t>(b[2]) << 16 | static_cast<std::uint32_t>(b[3]) << 24;
}

std::uint16_t ReadU16(const char* p) {
  const auto* b = reinterpret_cast<const unsigned char*>(p);
  return static_cast<std::uint16_t>(b[0] | b[1] << 8);
}

void PutU32(std::ostream& out, std::uint32_t v) {
  const char bytes[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                         static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
  out.write(bytes, 4);
}

void PutU16(std::ostream& out, std::uint16_t v) {
  const char bytes[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
  out.write(bytes, 2);
}

[[noreturn]] void Fail(const std::string& detail) {
  throw util::OperationError("EBADWAV", "Audio merging failed: " + detail);
}

void WriteHeader(std::ostream& out, const WavFormat& format, std::uint32_t data_size) {
  const std::uint16_t block_align = static_cast<std::uint16_t>(format.channels * format.bits_per_sample / 8);
  const std::uint32_t byte_rate   = format.sample_rate * block_align;

  out.write("RIFF", 4);
  PutU32(out, 36 + data_size);
  out.write("WAVE", 4);

  out.write("fmt ", 4);
  PutU32(out, 16);
  PutU16(out, format.audio_format);
  PutU16(out, format.channels);
  PutU32(out, format.sample_rate);
  PutU32(out, byte_rate);
  PutU16(out, block_align);
  PutU16(out, format.bits_per_sample);

  out.write("data", 4);
  PutU32(out, data_size);
}

} // namespace

WavInfo ReadWavInfo(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    Fail("cannot open " + path);
  }

  std::array<char, 12> riff{};
  if (!in.read(riff.data(), riff.size()) || std::memcmp(riff.data(), "RIFF", 4) != 0 ||
      std::memcmp(riff.data() + 8, "WAVE", 4) != 0) {
    Fail(path + " is not a WAV file");
  }

  WavInfo info;
  bool    have_format = false;
  for (;;) {
    std::array<char, 8> header{};
    if (!in.read(header.data(), header.size())) {
      Fail(path + " has no data chunk");
    }
    const std::uint32_t size = ReadU32(header.data() + 4);

    if (std::memcmp(header.data(), "fmt ", 4) == 0) {
      std::array<char, 16> fmt{};
      if (size < fmt.size() || !in.read(fmt.data(), fmt.size())) {
        Fail(path + " has a truncated fmt chunk");
      }
      info.format.audio_format    = ReadU16(fmt.data());
      info.format.channels        = ReadU16(fmt.data() + 2);
      info.format.sample_rate     = ReadU32(fmt.data() + 4);
      info.format.bits_per_sample = ReadU16(fmt.data() + 14);
      have_format                 = true;
      in.seekg(size - fmt.size() + (size & 1), std::ios::cur);
    } else if (std::memcmp(header.data(), "data", 4) == 0) {
      if (!have_format) {
        Fail(path + " has data before fmt");
      }
      info.data_offset = static_cast<std::uint64_t>(in.tellg());
      info.data_size   = size;
      break;
    } else {
      // LIST, fact and other chunks are skipped; chunks are word aligned
      in.seekg(size + (size & 1), std::ios::cur);
    }
  }

  if (info.format.audio_format != 1) {
    Fail(path + " is not PCM");
  }
  return info;
}

void WriteWavFile(const std::string& path, const WavFormat& format, const std::vector<char>& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::OperationError("EACCES", "cannot write " + path);
  }
  WriteHeader(out, format, static_cast<std::uint32_t>(data.size()));
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

void MergeWavFiles(const std::vector<std::string>& inputs, const std::string& output) {
  if (inputs.empty()) {
    Fail("no input files");
  }

  std::vector<WavInfo> infos;
  infos.reserve(inputs.size());
  std::uint64_t total = 0;
  for (const auto& input : inputs) {
    infos.push_back(ReadWavInfo(input));
    if (!(infos.back().format == infos.front().format)) {
      Fail(input + " does not match the format of " + inputs.front());
    }
    total += infos.back().data_size;
  }
  if (total > std::numeric_limits<std::uint32_t>::max() - kHeaderSize) {
    Fail("combined audio exceeds the WAV size limit");
  }

  std::ofstream out(output, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("cannot write " + output);
  }
  WriteHeader(out, infos.front().format, static_cast<std::uint32_t>(total));

  std::vector<char> buffer(64 * 1024);
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    std::ifstream in(inputs[i], std::ios::binary);
    in.seekg(static_cast<std::streamoff>(infos[i].data_offset));
    std::uint64_t remaining = infos[i].data_size;
    while (remaining > 0) {
      const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
      if (!in.read(buffer.data(), want)) {
        Fail(inputs[i] + " is truncated");
      }
      out.write(buffer.data(), want);
      remaining -= static_cast<std::uint64_t>(want);
    }
  }

  if (!out.flush()) {
    Fail("write error on " + output);
  }
}

} // namespace speechmaker::audio
