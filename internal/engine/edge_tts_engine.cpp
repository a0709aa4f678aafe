#include "edge_tts_engine.hpp"

#include <filesystem>
#include <system_error>

#include "internal/engine/voice_list_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace speechmaker::engine {

namespace {

constexpr double kMinSpeed = 0.5;
constexpr double kMaxSpeed = 2.0;

std::string FirstLine(const std::string& text) {
  const auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

void ThrowOnAbnormalExit(const util::ProcessResult& result, const std::string& what) {
  if (result.cancelled) {
    throw util::OperationError("ECANCELED", what + " was cancelled");
  }
  if (result.timed_out) {
    throw util::OperationError("ETIMEDOUT", what + " timed out");
  }
}

} // namespace

EdgeTtsEngine::EdgeTtsEngine(std::string binary, util::ProcessRunner runner)
    : binary_(std::move(binary)), runner_(runner) {
  if (binary_.empty()) {
    throw util::InvalidArgument("voice engine binary must not be empty");
  }
}

std::vector<model::Voice> EdgeTtsEngine::ListVoices(const util::Deadline& deadline, const util::CancellationToken& cancel) {
  const auto result = runner_.Run({binary_, "--list-voices"}, deadline, cancel);
  ThrowOnAbnormalExit(result, "Voice listing");
  if (result.exit_code != 0) {
    throw util::OperationError("EXIT_NONZERO", "Failed to execute " + binary_ + ": " + FirstLine(result.stderr_data));
  }

  auto voices = ParseVoiceList(result.stdout_data);
  if (voices.empty()) {
    throw util::OperationError("ENOVOICES", "No TTS voices found");
  }

  SPEECHMAKER_LOG_DEBUG("voice list parsed", {observability::IntField("count", static_cast<std::int64_t>(voices.size()))});
  return voices;
}

std::vector<std::string> EdgeTtsEngine::SynthesisCommand(const SynthesisRequest& request) const {
  return {binary_, "--voice", request.voice_id, "--rate", FormatRate(request.speed),
          "--text", request.text, "--write-media", request.output_path};
}

void EdgeTtsEngine::Synthesize(const SynthesisRequest& request, const util::Deadline& deadline,
                               const util::CancellationToken& cancel) {
  if (request.voice_id.empty()) {
    throw util::InvalidArgument("voice id is required");
  }
  if (request.speed < kMinSpeed || request.speed > kMaxSpeed) {
    throw util::InvalidArgument("speed must be between 0.5 and 2.0");
  }
  if (request.text.empty()) {
    throw util::OperationError("EEMPTY", "Text cannot be empty");
  }

  const auto result = runner_.Run(SynthesisCommand(request), deadline, cancel);
  ThrowOnAbnormalExit(result, "TTS conversion");
  if (result.exit_code != 0) {
    throw util::OperationError("EXIT_NONZERO", "TTS conversion failed: " + FirstLine(result.stderr_data));
  }

  std::error_code ec;
  const auto      size = std::filesystem::file_size(request.output_path, ec);
  if (ec || size == 0) {
    throw util::OperationError("EXIT_NONZERO", "TTS conversion failed: no audio written to " + request.output_path);
  }
}

} // namespace speechmaker::engine
