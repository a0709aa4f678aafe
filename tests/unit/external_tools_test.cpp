#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/audio/ffmpeg_converter.hpp"
#include "internal/engine/edge_tts_engine.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace {

namespace fs = std::filesystem;

using speechmaker::audio::FfmpegConverter;
using speechmaker::engine::EdgeTtsEngine;
using speechmaker::engine::SynthesisRequest;
using speechmaker::model::OutputFormat;
using speechmaker::util::CancellationToken;
using speechmaker::util::Deadline;
using speechmaker::util::OperationError;
using speechmaker::util::ProcessRunner;

constexpr auto kGenerous = std::chrono::milliseconds(10000);

fs::path TestDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "speechmaker_external_tools_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string WriteScript(const fs::path& dir, const std::string& name, const std::string& body) {
  const auto path = dir / name;
  {
    std::ofstream out(path, std::ios::trunc);
    out << "#!/bin/sh\n" << body;
  }
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path.string();
}

std::string ReadAll(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

template <typename Fn>
std::string ExpectOperationError(Fn&& fn) {
  try {
    fn();
  } catch (const OperationError& e) {
    return e.code() + "|" + e.what();
  }
  assert(false && "expected OperationError");
  return {};
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

const char* kFakeEdgeTts =
    "if [ \"$1\" = \"--list-voices\" ]; then\n"
    "  printf 'Name: en-US-AriaNeural, Gender: Female, Language: en-US\\n'\n"
    "  printf 'Name: de-DE-KatjaNeural, Gender: Female, Language: de-DE\\n'\n"
    "  exit 0\n"
    "fi\n"
    "echo \"$@\" > \"$(dirname \"$0\")/args.txt\"\n"
    "out=''\n"
    "while [ $# -gt 0 ]; do\n"
    "  if [ \"$1\" = \"--write-media\" ]; then out=\"$2\"; fi\n"
    "  shift\n"
    "done\n"
    "printf 'audio' > \"$out\"\n";

const char* kFakeFfmpeg =
    "dir=$(dirname \"$0\")\n"
    "if [ \"$1\" = \"-version\" ]; then echo 'ffmpeg version 6.1 Copyright (c) the FFmpeg developers'; exit 0; fi\n"
    "echo \"$@\" > \"$dir/args.txt\"\n"
    "prev=''\n"
    "for arg; do\n"
    "  if [ \"$prev\" = \"-i\" ]; then cp \"$arg\" \"$dir/input_seen.txt\"; fi\n"
    "  prev=\"$arg\"\n"
    "done\n"
    "printf 'converted' > \"$prev\"\n";

// ---------------------------------------------------------------------------

void TestRunnerCollectsOutputAndExitCode() {
  ProcessRunner runner;
  const auto    result = runner.Run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, Deadline::After(kGenerous));
  assert(result.exit_code == 3);
  assert(result.stdout_data == "out\n");
  assert(result.stderr_data == "err\n");
  assert(!result.timed_out);
  assert(!result.Succeeded());
}

void TestRunnerKillsOnDeadline() {
  ProcessRunner runner;
  const auto    started = std::chrono::steady_clock::now();
  const auto    result  = runner.Run({"/bin/sh", "-c", "exec sleep 5"}, Deadline::After(std::chrono::milliseconds(100)));
  assert(result.timed_out);
  assert(!result.Succeeded());
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
}

void TestRunnerHonoursCancellation() {
  ProcessRunner     runner;
  CancellationToken cancel;
  cancel.Cancel();
  const auto result = runner.Run({"/bin/sh", "-c", "exec sleep 5"}, Deadline::After(kGenerous), cancel);
  assert(result.cancelled);
}

void TestRunnerReportsMissingProgram() {
  ProcessRunner runner;
  const auto    error = ExpectOperationError(
      [&] { runner.Run({"speechmaker-definitely-not-installed"}, Deadline::After(kGenerous)); });
  assert(StartsWith(error, "ENOENT|"));

  bool threw = false;
  try {
    runner.Run({}, Deadline::Never());
  } catch (const speechmaker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

// ---------------------------------------------------------------------------

void TestEngineListsVoices() {
  const auto    dir = TestDir("engine_list");
  EdgeTtsEngine engine(WriteScript(dir, "edge-tts", kFakeEdgeTts));

  const auto voices = engine.ListVoices(Deadline::After(kGenerous), CancellationToken{});
  assert(voices.size() == 2);
  assert(voices[0].id == "en-US-AriaNeural");
  assert(voices[0].is_default);
  assert(voices[1].locale == "de-DE");
}

void TestEngineListFailures() {
  const auto dir = TestDir("engine_list_failures");

  EdgeTtsEngine empty(WriteScript(dir, "empty", "exit 0\n"));
  assert(StartsWith(ExpectOperationError([&] { empty.ListVoices(Deadline::After(kGenerous), CancellationToken{}); }),
                    "ENOVOICES|No TTS voices found"));

  EdgeTtsEngine failing(WriteScript(dir, "failing", "echo 'network unreachable' >&2\nexit 1\n"));
  const auto    error =
      ExpectOperationError([&] { failing.ListVoices(Deadline::After(kGenerous), CancellationToken{}); });
  assert(StartsWith(error, "EXIT_NONZERO|Failed to execute"));
  assert(error.find("network unreachable") != std::string::npos);

  EdgeTtsEngine slow(WriteScript(dir, "slow", "exec sleep 5\n"));
  assert(StartsWith(ExpectOperationError([&] {
                      slow.ListVoices(Deadline::After(std::chrono::milliseconds(100)), CancellationToken{});
                    }),
                    "ETIMEDOUT|"));

  CancellationToken cancel;
  cancel.Cancel();
  assert(StartsWith(ExpectOperationError([&] { slow.ListVoices(Deadline::After(kGenerous), cancel); }), "ECANCELED|"));

  EdgeTtsEngine missing((dir / "not-there").string());
  assert(StartsWith(ExpectOperationError([&] { missing.ListVoices(Deadline::After(kGenerous), CancellationToken{}); }),
                    "ENOENT|"));
}

void TestEngineSynthesisCommand() {
  EdgeTtsEngine    engine("edge-tts");
  SynthesisRequest request{"Hello there.", "en-GB-RyanNeural", 0.5, "/tmp/out.mp3"};
  const auto       argv = engine.SynthesisCommand(request);
  const std::vector<std::string> expected = {"edge-tts", "--voice",       "en-GB-RyanNeural", "--rate", "-50%",
                                             "--text",   "Hello there.", "--write-media",    "/tmp/out.mp3"};
  assert(argv == expected);
  assert(engine.NativeFormat() == speechmaker::model::OutputFormat::kMp3);
}

void TestEngineSynthesizes() {
  const auto    dir = TestDir("engine_synth");
  EdgeTtsEngine engine(WriteScript(dir, "edge-tts", kFakeEdgeTts));

  SynthesisRequest request{"It's a test; with \"quotes\" and $dollars.", "en-US-AriaNeural", 1.5,
                           (dir / "chunk_0.mp3").string()};
  engine.Synthesize(request, Deadline::After(kGenerous), CancellationToken{});

  assert(ReadAll(dir / "chunk_0.mp3") == "audio");
  const auto args = ReadAll(dir / "args.txt");
  assert(args.find("--rate +50%") != std::string::npos);
  assert(args.find("$dollars") != std::string::npos);
}

void TestEngineSynthesisFailures() {
  const auto dir = TestDir("engine_synth_failures");

  EdgeTtsEngine failing(WriteScript(dir, "failing", "echo 'invalid voice' >&2\nexit 2\n"));
  SynthesisRequest request{"Hello.", "en-US-AriaNeural", 1.0, (dir / "out.wav").string()};
  assert(StartsWith(ExpectOperationError(
                        [&] { failing.Synthesize(request, Deadline::After(kGenerous), CancellationToken{}); }),
                    "EXIT_NONZERO|TTS conversion failed: invalid voice"));

  EdgeTtsEngine silent(WriteScript(dir, "silent", "exit 0\n"));
  assert(ExpectOperationError([&] { silent.Synthesize(request, Deadline::After(kGenerous), CancellationToken{}); })
             .find("no audio written") != std::string::npos);

  EdgeTtsEngine slow(WriteScript(dir, "slow", "exec sleep 5\n"));
  assert(StartsWith(ExpectOperationError([&] {
                      slow.Synthesize(request, Deadline::After(std::chrono::milliseconds(100)), CancellationToken{});
                    }),
                    "ETIMEDOUT|"));

  SynthesisRequest empty_text = request;
  empty_text.text             = "";
  assert(StartsWith(
      ExpectOperationError([&] { silent.Synthesize(empty_text, Deadline::After(kGenerous), CancellationToken{}); }),
      "EEMPTY|"));

  SynthesisRequest too_fast = request;
  too_fast.speed            = 2.5;
  bool threw                = false;
  try {
    silent.Synthesize(too_fast, Deadline::After(kGenerous), CancellationToken{});
  } catch (const speechmaker::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

// ---------------------------------------------------------------------------

void TestConverterValidate() {
  const auto dir = TestDir("ffmpeg_validate");
  assert(FfmpegConverter::Validate(WriteScript(dir, "ffmpeg", kFakeFfmpeg), Deadline::After(kGenerous)));
  assert(!FfmpegConverter::Validate(WriteScript(dir, "impostor", "echo 'usage: impostor'\n"), Deadline::After(kGenerous)));
  assert(!FfmpegConverter::Validate(WriteScript(dir, "broken", "exit 1\n"), Deadline::After(kGenerous)));
  assert(!FfmpegConverter::Validate((dir / "not-there").string(), Deadline::After(kGenerous)));
}

void TestConcatListQuoting() {
  const auto list = FfmpegConverter::ConcatList({"/tmp/a.wav", "/tmp/it's.wav"});
  assert(list == "file '/tmp/a.wav'\nfile '/tmp/it'\\''s.wav'\n");
}

void TestConverterTranscode() {
  const auto      dir = TestDir("ffmpeg_transcode");
  FfmpegConverter converter(WriteScript(dir, "ffmpeg", kFakeFfmpeg), FfmpegConverter::Options{});
  {
    std::ofstream in(dir / "in.wav");
    in << "pcm";
  }

  converter.Transcode((dir / "in.wav").string(), (dir / "out.mp3").string(), OutputFormat::kMp3, CancellationToken{});
  assert(ReadAll(dir / "out.mp3") == "converted");
  assert(ReadAll(dir / "input_seen.txt") == "pcm");
  const auto args = ReadAll(dir / "args.txt");
  assert(args.find("-codec:a libmp3lame -b:a 128k -ar 44100") != std::string::npos);

  converter.Transcode((dir / "in.wav").string(), (dir / "out.wav").string(), OutputFormat::kWav, CancellationToken{});
  assert(ReadAll(dir / "args.txt").find("pcm_s16le") != std::string::npos);
}

void TestConverterMerge() {
  const auto      dir = TestDir("ffmpeg_merge");
  FfmpegConverter converter(WriteScript(dir, "ffmpeg", kFakeFfmpeg), FfmpegConverter::Options{});

  const auto output = (dir / "speech.wav").string();
  converter.Merge({(dir / "chunk_0.wav").string(), (dir / "chunk_1.wav").string()}, output, OutputFormat::kWav,
                  CancellationToken{});

  assert(ReadAll(output) == "converted");
  assert(ReadAll(dir / "args.txt").find("-f concat -safe 0") != std::string::npos);
  assert(ReadAll(dir / "input_seen.txt") ==
         FfmpegConverter::ConcatList({(dir / "chunk_0.wav").string(), (dir / "chunk_1.wav").string()}));
  assert(!fs::exists(output + ".concat.txt"));
}

void TestConverterFailures() {
  const auto      dir = TestDir("ffmpeg_failures");
  FfmpegConverter failing(WriteScript(dir, "ffmpeg", "echo 'Unknown encoder libmp3lame' >&2\nexit 1\n"),
                          FfmpegConverter::Options{});

  const auto transcode = ExpectOperationError([&] {
    failing.Transcode((dir / "in.wav").string(), (dir / "out.mp3").string(), OutputFormat::kMp3, CancellationToken{});
  });
  assert(StartsWith(transcode, "EXIT_NONZERO|MP3 conversion failed"));
  assert(transcode.find("Unknown encoder") != std::string::npos);

  const auto merge = ExpectOperationError([&] {
    failing.Merge({(dir / "a.wav").string()}, (dir / "out.wav").string(), OutputFormat::kWav, CancellationToken{});
  });
  assert(StartsWith(merge, "EXIT_NONZERO|Audio merging failed"));
  assert(!fs::exists(dir / "out.wav.concat.txt"));

  CancellationToken cancel;
  cancel.Cancel();
  FfmpegConverter slow(WriteScript(dir, "slow", "exec sleep 5\n"), FfmpegConverter::Options{});
  assert(StartsWith(ExpectOperationError([&] {
                      slow.Transcode((dir / "in.wav").string(), (dir / "out.mp3").string(), OutputFormat::kMp3, cancel);
                    }),
                    "ECANCELED|"));
}

} // namespace

int main() {
  TestRunnerCollectsOutputAndExitCode();
  TestRunnerKillsOnDeadline();
  TestRunnerHonoursCancellation();
  TestRunnerReportsMissingProgram();

  TestEngineListsVoices();
  TestEngineListFailures();
  TestEngineSynthesisCommand();
  TestEngineSynthesizes();
  TestEngineSynthesisFailures();

  TestConverterValidate();
  TestConcatListQuoting();
  TestConverterTranscode();
  TestConverterMerge();
  TestConverterFailures();

  std::cout << "speechmaker_unit_external_tools: pass\n";
  return 0;
}
