#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audio/audio_converter.hpp"
#include "internal/engine/voice_engine.hpp"
#include "internal/errors/error_classifier.hpp"
#include "internal/model/chunk_job.hpp"
#include "internal/model/output_format.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/deadline.hpp"

namespace speechmaker::conversion {

struct ConversionRequest {
  std::string         session_id;
  std::string         text;
  std::string         voice_id;
  double              speed  = 1.0;
  model::OutputFormat format = model::OutputFormat::kWav;
  std::string         output_path;
};

struct ConversionProgress {
  int         percent = 0;
  std::string phase;
  std::size_t current = 0;
  std::size_t total   = 0;
};

using ProgressCallback = std::function<void(const ConversionProgress&)>;

struct ConversionResult {
  std::string output_path;
  std::size_t chunk_count = 0;
};

/*
  ConversionOrchestrator

  Splits the text, synthesizes chunks on a bounded worker pool and assembles
  the final artifact in chunk index order.

  - retryable chunk failures go back to the queue after a backoff
  - the first terminal chunk failure aborts unscheduled chunks and raises
    errors::SessionError carrying the chunk files produced so far
  - cancellation kills running engine calls and always cleans up
  - chunk files are written in the engine's native format
  - a single WAV chunk becomes the output directly; otherwise the converter
    transcodes it
  - without a converter WAV chunks are merged natively; MP3 output, or an
    engine whose native format differs from the request, is refused

  Progress: 5 initializing, 20..80 converting, 85 merging, 100 complete.
  The progress callback is invoked from worker threads, one call at a time.
*/
class ConversionOrchestrator {
 public:
  struct Options {
    std::size_t               max_chunk_length = 5000;
    std::size_t               worker_pool_size = 3;
    std::chrono::milliseconds synthesis_timeout{120000};
    std::filesystem::path     temp_root;
  };

  ConversionOrchestrator(Options options, std::shared_ptr<engine::VoiceEngine> engine,
                         std::shared_ptr<errors::ErrorClassifier> classifier, std::shared_ptr<retry::RetryPolicy> retry);

  // Chunks the request text into a pending session.
  model::ConversionSession Plan(const ConversionRequest& request) const;

  // `converter` may be null when no converter is available.
  ConversionResult Convert(const ConversionRequest& request, const std::shared_ptr<audio::AudioConverter>& converter,
                           const util::CancellationToken& cancel, const ProgressCallback& progress = {});

  // Best-effort removal; failures are classified as cleanup and logged.
  void CleanupChunks(const std::vector<std::string>& paths);

  const Options& options() const {
    return options_;
  }

 private:
  void RunChunks(model::ConversionSession& session, const util::CancellationToken& cancel,
                 const ProgressCallback& progress, std::optional<model::ErrorRecord>& failure);

  void Finalize(const model::ConversionSession& session, model::OutputFormat native,
                const std::vector<std::string>& ordered, const std::shared_ptr<audio::AudioConverter>& converter,
                const util::CancellationToken& cancel);

  [[noreturn]] void Fail(model::ConversionSession& session, model::ErrorRecord record, std::vector<std::string> partials);

  std::filesystem::path WorkDir(const std::string& session_id) const;

  Options                                  options_;
  std::shared_ptr<engine::VoiceEngine>     engine_;
  std::shared_ptr<errors::ErrorClassifier> classifier_;
  std::shared_ptr<retry::RetryPolicy>      retry_;
};

} // namespace speechmaker::conversion
