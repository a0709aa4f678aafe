#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "internal/audio/wav_merger.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using speechmaker::audio::MergeWavFiles;
using speechmaker::audio::ReadWavInfo;
using speechmaker::audio::WavFormat;
using speechmaker::audio::WriteWavFile;

constexpr WavFormat kMono16{1, 1, 24000, 16};

fs::path TestDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "speechmaker_wav_merger_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::vector<char> Bytes(const std::string& s) {
  return {s.begin(), s.end()};
}

std::string DataOf(const std::string& path) {
  const auto    info = ReadWavInfo(path);
  std::ifstream in(path, std::ios::binary);
  in.seekg(static_cast<std::streamoff>(info.data_offset));
  std::string data(info.data_size, '\0');
  in.read(data.data(), static_cast<std::streamsize>(data.size()));
  return data;
}

void PutLe(std::ofstream& out, std::uint32_t v, int width) {
  for (int i = 0; i < width; ++i) {
    out.put(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

// fmt, then a LIST chunk with an odd size (padded), then data.
void WriteWavWithListChunk(const fs::path& path, const std::string& pcm) {
  const std::string list = "INFOabc";
  std::ofstream     out(path, std::ios::binary);
  out.write("RIFF", 4);
  PutLe(out, static_cast<std::uint32_t>(4 + 24 + 8 + list.size() + 1 + 8 + pcm.size()), 4);
  out.write("WAVE", 4);
  out.write("fmt ", 4);
  PutLe(out, 16, 4);
  PutLe(out, kMono16.audio_format, 2);
  PutLe(out, kMono16.channels, 2);
  PutLe(out, kMono16.sample_rate, 4);
  PutLe(out, kMono16.sample_rate * 2, 4);
  PutLe(out, 2, 2);
  PutLe(out, kMono16.bits_per_sample, 2);
  out.write("LIST", 4);
  PutLe(out, static_cast<std::uint32_t>(list.size()), 4);
  out.write(list.data(), static_cast<std::streamsize>(list.size()));
  out.put('\0');
  out.write("data", 4);
  PutLe(out, static_cast<std::uint32_t>(pcm.size()), 4);
  out.write(pcm.data(), static_cast<std::streamsize>(pcm.size()));
}

void TestMergeKeepsInputOrder() {
  const auto dir = TestDir("order");
  WriteWavFile((dir / "0.wav").string(), kMono16, Bytes("AAAA"));
  WriteWavFile((dir / "1.wav").string(), kMono16, Bytes("BBBBBB"));
  WriteWavFile((dir / "2.wav").string(), kMono16, Bytes("CC"));

  const auto out = (dir / "out.wav").string();
  MergeWavFiles({(dir / "0.wav").string(), (dir / "1.wav").string(), (dir / "2.wav").string()}, out);

  const auto info = ReadWavInfo(out);
  assert(info.format == kMono16);
  assert(info.data_size == 12);
  assert(info.data_offset == 44);
  assert(DataOf(out) == "AAAABBBBBBCC");
  assert(fs::file_size(out) == 44 + 12);
}

void TestExtraChunksAreSkipped() {
  const auto dir = TestDir("list_chunk");
  WriteWavWithListChunk(dir / "a.wav", "1234");
  WriteWavFile((dir / "b.wav").string(), kMono16, Bytes("5678"));

  const auto info = ReadWavInfo((dir / "a.wav").string());
  assert(info.data_size == 4);
  assert(DataOf((dir / "a.wav").string()) == "1234");

  const auto out = (dir / "out.wav").string();
  MergeWavFiles({(dir / "a.wav").string(), (dir / "b.wav").string()}, out);
  assert(DataOf(out) == "12345678");
}

void ExpectMergeFailure(const std::vector<std::string>& inputs, const std::string& output) {
  bool threw = false;
  try {
    MergeWavFiles(inputs, output);
  } catch (const speechmaker::util::OperationError& e) {
    threw = true;
    assert(std::string(e.what()).rfind("Audio merging failed", 0) == 0);
  }
  assert(threw);
}

void TestFormatMismatchFails() {
  const auto dir = TestDir("mismatch");
  WriteWavFile((dir / "a.wav").string(), kMono16, Bytes("AAAA"));
  WriteWavFile((dir / "b.wav").string(), WavFormat{1, 2, 24000, 16}, Bytes("BBBB"));
  ExpectMergeFailure({(dir / "a.wav").string(), (dir / "b.wav").string()}, (dir / "out.wav").string());
}

void TestNonWavInputFails() {
  const auto dir = TestDir("not_wav");
  WriteWavFile((dir / "a.wav").string(), kMono16, Bytes("AAAA"));
  {
    std::ofstream out(dir / "b.mp3", std::ios::binary);
    out << "ID3\x03\x00 not a riff file at all";
  }
  ExpectMergeFailure({(dir / "a.wav").string(), (dir / "b.mp3").string()}, (dir / "out.wav").string());
  ExpectMergeFailure({(dir / "missing.wav").string()}, (dir / "out.wav").string());
}

void TestNonPcmFails() {
  const auto dir = TestDir("float");
  WriteWavFile((dir / "a.wav").string(), WavFormat{3, 1, 24000, 32}, Bytes("AAAA"));
  ExpectMergeFailure({(dir / "a.wav").string()}, (dir / "out.wav").string());
}

void TestEmptyInputListFails() {
  const auto dir = TestDir("empty");
  ExpectMergeFailure({}, (dir / "out.wav").string());
}

} // namespace

int main() {
  TestMergeKeepsInputOrder();
  TestExtraChunksAreSkipped();
  TestFormatMismatchFails();
  TestNonWavInputFails();
  TestNonPcmFails();
  TestEmptyInputListFails();

  std::cout << "speechmaker_unit_wav_merger: pass\n";
  return 0;
}
