#include "ffmpeg_converter.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace speechmaker::audio {

namespace {

std::string Tail(const std::string& text, std::size_t max = 400) {
  return text.size() <= max ? text : text.substr(text.size() - max);
}

void CheckResult(const util::ProcessResult& result, const std::string& failure) {
  if (result.cancelled) {
    throw util::OperationError("ECANCELED", failure + ": cancelled");
  }
  if (result.timed_out) {
    throw util::OperationError("ETIMEDOUT", failure + ": timed out");
  }
  if (result.exit_code != 0) {
    throw util::OperationError("EXIT_NONZERO", failure + ": " + Tail(result.stderr_data));
  }
}

} // namespace

FfmpegConverter::FfmpegConverter(std::string binary, Options options, util::ProcessRunner runner)
    : binary_(std::move(binary)), options_(std::move(options)), runner_(runner) {
  if (binary_.empty()) {
    throw util::InvalidArgument("converter binary must not be empty");
  }
}

bool FfmpegConverter::Validate(const std::string& binary, const util::Deadline& deadline, const util::ProcessRunner& runner) {
  try {
    const auto result = runner.Run({binary, "-version"}, deadline);
    return result.Succeeded() && result.stdout_data.find("ffmpeg version") != std::string::npos;
  } catch (const util::OperationError& e) {
    SPEECHMAKER_LOG_DEBUG("converter validation failed",
                          {observability::StringField("binary", binary), observability::StringField("code", e.code())});
    return false;
  }
}

std::vector<std::string> FfmpegConverter::CodecArgs(model::OutputFormat format) const {
  if (format == model::OutputFormat::kMp3) {
    return {"-codec:a", "libmp3lame", "-b:a", options_.mp3_bitrate, "-ar", std::to_string(options_.sample_rate)};
  }
  return {"-codec:a", "pcm_s16le", "-ar", std::to_string(options_.sample_rate)};
}

void FfmpegConverter::Transcode(const std::string& input, const std::string& output, model::OutputFormat format,
                                const util::CancellationToken& cancel) {
  std::vector<std::string> argv = {binary_, "-y", "-i", input};
  for (auto& arg : CodecArgs(format)) {
    argv.push_back(std::move(arg));
  }
  argv.push_back(output);

  const auto result = runner_.Run(argv, util::Deadline::After(options_.operation_timeout), cancel);
  CheckResult(result, format == model::OutputFormat::kMp3 ? "MP3 conversion failed" : "Audio conversion failed");
}

std::string FfmpegConverter::ConcatList(const std::vector<std::string>& inputs) {
  std::string list;
  for (const auto& input : inputs) {
    const auto absolute = std::filesystem::absolute(input).string();
    list += "file '";
    for (char c : absolute) {
      if (c == '\'') {
        list += "'\\''";
      } else {
        list += c;
      }
    }
    list += "'\n";
  }
  return list;
}

void FfmpegConverter::Merge(const std::vector<std::string>& inputs, const std::string& output, model::OutputFormat format,
                            const util::CancellationToken& cancel) {
  if (inputs.empty()) {
    throw util::InvalidArgument("Audio merging failed: no input files");
  }

  const std::string list_path = output + ".concat.txt";
  {
    std::ofstream list(list_path, std::ios::trunc);
    if (!list) {
      throw util::OperationError("EACCES", "Audio merging failed: cannot write " + list_path);
    }
    list << ConcatList(inputs);
  }

  std::vector<std::string> argv = {binary_, "-y", "-f", "concat", "-safe", "0", "-i", list_path};
  for (auto& arg : CodecArgs(format)) {
    argv.push_back(std::move(arg));
  }
  argv.push_back(output);

  util::ProcessResult result;
  try {
    result = runner_.Run(argv, util::Deadline::After(options_.operation_timeout), cancel);
  } catch (const util::OperationError&) {
    std::error_code ec;
    std::filesystem::remove(list_path, ec);
    throw;
  }

  std::error_code ec;
  std::filesystem::remove(list_path, ec);
  if (ec) {
    SPEECHMAKER_LOG_WARN("failed to remove concat list", {observability::StringField("path", list_path),
                                                          observability::StringField("error", ec.message())});
  }

  CheckResult(result, "Audio merging failed");
}

} // namespace speechmaker::audio
