#include "conversion_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include "internal/audio/wav_merger.hpp"
#include "internal/chunking/text_chunker.hpp"
#include "internal/conversion/chunk_scheduler.hpp"
#include "internal/errors/classified_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errno_codes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace speechmaker::conversion {

namespace {

using model::ChunkStatus;
using observability::IntField;
using observability::StringField;

constexpr int kPercentInitializing = 5;
constexpr int kPercentConvertStart = 20;
constexpr int kPercentConvertSpan  = 60;
constexpr int kPercentMerging      = 85;
constexpr int kPercentComplete     = 100;

void Transition(model::ChunkJob& job, ChunkStatus to) {
  if (!model::CanTransition(job.status, to)) {
    throw util::InvalidState("illegal chunk transition for chunk " + std::to_string(job.index));
  }
  job.status = to;
}

void Terminate(model::ConversionSession& session, model::SessionStatus status) {
  if (model::IsTerminal(session.status)) {
    throw util::InvalidState("session " + session.id + " already terminated");
  }
  session.status = status;
}

bool HasText(const std::string& text) {
  return std::any_of(text.begin(), text.end(), [](unsigned char c) { return !std::isspace(c); });
}

std::string ChunkFileName(std::size_t index, model::OutputFormat format) {
  char name[32];
  std::snprintf(name, sizeof(name), "chunk_%04zu.", index);
  return name + std::string(model::Extension(format));
}

void MoveFile(const std::string& from, const std::string& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec == std::errc::cross_device_link) {
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
    std::filesystem::remove(from);
    return;
  }
  if (ec) {
    throw std::filesystem::filesystem_error("Output path could not be written", from, to, ec);
  }
}

} // namespace

ConversionOrchestrator::ConversionOrchestrator(Options options, std::shared_ptr<engine::VoiceEngine> engine,
                                               std::shared_ptr<errors::ErrorClassifier> classifier,
                                               std::shared_ptr<retry::RetryPolicy> retry)
    : options_(std::move(options)),
      engine_(std::move(engine)),
      classifier_(std::move(classifier)),
      retry_(std::move(retry)) {
  if (!engine_ || !classifier_ || !retry_) {
    throw util::InvalidArgument("conversion orchestrator requires engine, classifier and retry policy");
  }
  if (options_.worker_pool_size == 0) {
    throw util::InvalidArgument("worker pool size must be positive");
  }
  if (options_.temp_root.empty()) {
    options_.temp_root = std::filesystem::temp_directory_path() / "speechmaker";
  }
}

std::filesystem::path ConversionOrchestrator::WorkDir(const std::string& session_id) const {
  return options_.temp_root / session_id;
}

model::ConversionSession ConversionOrchestrator::Plan(const ConversionRequest& request) const {
  model::ConversionSession session;
  session.id       = request.session_id.empty() ? util::GenerateSessionId() : request.session_id;
  session.voice_id = request.voice_id;
  session.speed    = request.speed;
  session.format   = request.format;
  session.output_path = request.output_path;

  auto texts = chunking::Split(request.text, options_.max_chunk_length);
  session.jobs.reserve(texts.size());
  for (std::size_t i = 0; i < texts.size(); ++i) {
    model::ChunkJob job;
    job.index = i;
    job.text  = std::move(texts[i]);
    session.jobs.push_back(std::move(job));
  }
  return session;
}

ConversionResult ConversionOrchestrator::Convert(const ConversionRequest& request,
                                                 const std::shared_ptr<audio::AudioConverter>& converter,
                                                 const util::CancellationToken& cancel, const ProgressCallback& progress) {
  auto report = [&](int percent, const char* phase, std::size_t current, std::size_t total) {
    if (progress) {
      progress(ConversionProgress{percent, phase, current, total});
    }
  };

  if (!HasText(request.text)) {
    model::ConversionSession session;
    session.id = request.session_id;
    Fail(session, classifier_->Classify(errors::RawError{"EEMPTY", "Text cannot be empty", errors::ErrorDomain::kConversion,
                                                         "convert", {}}),
         {});
  }

  auto session = Plan(request);
  const std::size_t total = session.jobs.size();

  if (session.output_path.empty()) {
    Fail(session, classifier_->Classify(errors::RawError{"ENOENT", "Output path is not set", errors::ErrorDomain::kOutput,
                                                         "convert", {}}),
         {});
  }
  if (session.format == model::OutputFormat::kMp3 && !converter) {
    Fail(session, classifier_->Classify(errors::RawError{"ECONVERTER",
                                                         "MP3 output requires the audio converter, which is not available",
                                                         errors::ErrorDomain::kConverter, "convert", {}}),
         {});
  }

  const auto native = engine_->NativeFormat();
  if (native != session.format && !converter) {
    Fail(session,
         classifier_->Classify(errors::RawError{"ECONVERTER",
                                                "Converting engine output (" + std::string(model::Extension(native)) +
                                                    ") to " + std::string(model::Extension(session.format)) +
                                                    " requires the audio converter, which is not available",
                                                errors::ErrorDomain::kConverter, "convert", {}}),
         {});
  }

  SPEECHMAKER_LOG_INFO("conversion started", {StringField("session", session.id), IntField("chunks", total),
                                              StringField("voice", session.voice_id),
                                              StringField("format", model::Extension(session.format))});
  report(kPercentInitializing, "initializing", 0, total);

  const auto      work_dir = WorkDir(session.id);
  std::error_code ec;
  std::filesystem::create_directories(work_dir, ec);
  if (ec) {
    Fail(session,
         classifier_->Classify(errors::RawError{util::ErrnoName(ec.value()),
                                                "Output path for temporary audio is not writable: " + ec.message(),
                                                errors::ErrorDomain::kOutput, "prepare", work_dir.string()}),
         {});
  }
  for (auto& job : session.jobs) {
    job.output_path = (work_dir / ChunkFileName(job.index, native)).string();
  }

  session.status = model::SessionStatus::kRunning;
  report(kPercentConvertStart, "converting", 0, total);

  std::optional<model::ErrorRecord> failure;
  RunChunks(session, cancel, progress, failure);

  for (const auto& job : session.jobs) {
    retry_->Reset(session.id + "#" + std::to_string(job.index));
  }

  std::vector<std::string> ordered;
  std::vector<std::string> produced;
  ordered.reserve(total);
  for (const auto& job : session.jobs) {
    ordered.push_back(job.output_path);
    if (std::filesystem::exists(job.output_path, ec)) {
      produced.push_back(job.output_path);
    }
  }

  if (cancel.IsCancelled()) {
    CleanupChunks(ordered);
    auto record = classifier_->Classify(
        errors::RawError{"ECANCELED", "Conversion was cancelled", errors::ErrorDomain::kConversion, "convert", {}});
    Terminate(session, model::SessionStatus::kCancelled);
    throw errors::SessionError(std::move(record), {});
  }
  if (failure) {
    if (produced.empty()) {
      CleanupChunks(ordered);
    }
    Fail(session, std::move(*failure), std::move(produced));
  }

  if (total > 1) {
    report(kPercentMerging, "merging", total, total);
  }

  try {
    Finalize(session, native, ordered, converter, cancel);
  } catch (const std::exception& e) {
    const auto domain = dynamic_cast<const std::filesystem::filesystem_error*>(&e) ? errors::ErrorDomain::kOutput
                                                                                   : errors::ErrorDomain::kConverter;
    auto record = classifier_->Classify(e, domain, total > 1 ? "merge" : "finalize", session.output_path);
    CleanupChunks(ordered);
    Fail(session, std::move(record), {});
  }

  CleanupChunks(ordered);
  Terminate(session, model::SessionStatus::kSucceeded);
  report(kPercentComplete, "complete", total, total);

  SPEECHMAKER_LOG_INFO("conversion completed",
                       {StringField("session", session.id), StringField("output", session.output_path)});
  return ConversionResult{session.output_path, total};
}

void ConversionOrchestrator::RunChunks(model::ConversionSession& session, const util::CancellationToken& cancel,
                                       const ProgressCallback& progress, std::optional<model::ErrorRecord>& failure) {
  const std::size_t total = session.jobs.size();

  ChunkScheduler scheduler;
  std::mutex     mutex;
  std::size_t    completed   = 0;
  std::size_t    outstanding = total;

  for (std::size_t i = 0; i < total; ++i) {
    scheduler.Enqueue(ChunkTask{i, 0});
  }

  auto key_for = [&](std::size_t index) { return session.id + "#" + std::to_string(index); };

  auto fail_session = [&](model::ErrorRecord record) {
    std::lock_guard lock(mutex);
    if (!failure && !cancel.IsCancelled()) {
      failure = std::move(record);
    }
    const auto dropped = scheduler.Abort();
    if (dropped > 0) {
      SPEECHMAKER_LOG_WARN("aborted unscheduled chunks",
                           {StringField("session", session.id), IntField("dropped", static_cast<std::int64_t>(dropped))});
    }
  };

  auto process = [&](const ChunkTask& task) {
    auto&                    job = session.jobs[task.index];
    const auto               key = key_for(task.index);
    engine::SynthesisRequest request;
    std::uint32_t            attempt = 0;
    {
      std::lock_guard lock(mutex);
      if (cancel.IsCancelled() || failure) {
        scheduler.Abort();
        return;
      }
      Transition(job, ChunkStatus::kInProgress);
      attempt           = retry_->NextAttempt(key);
      job.attempt_count = static_cast<int>(attempt);
      request           = engine::SynthesisRequest{job.text, session.voice_id, session.speed, job.output_path};
    }

    std::optional<model::ErrorRecord> error;
    try {
      engine_->Synthesize(request, util::Deadline::After(options_.synthesis_timeout), cancel);
    } catch (const std::exception& e) {
      error = classifier_->Classify(e, errors::ErrorDomain::kConversion, "synthesize_chunk", session.voice_id);
    }

    if (!error) {
      std::lock_guard lock(mutex);
      Transition(job, ChunkStatus::kSucceeded);
      retry_->Reset(key);
      ++completed;
      if (progress) {
        const int percent = kPercentConvertStart + static_cast<int>(kPercentConvertSpan * completed / total);
        progress(ConversionProgress{percent, "converting", completed, total});
      }
      if (--outstanding == 0) {
        scheduler.Shutdown();
      }
      return;
    }

    bool retryable = false;
    {
      std::lock_guard lock(mutex);
      Transition(job, ChunkStatus::kFailed);
      retryable = error->category != model::ErrorCategory::kCancelled && retry_->ShouldRetry(*error) &&
                  retry_->HasAttemptsLeft(key) && !failure && !cancel.IsCancelled();
    }

    if (retryable) {
      SPEECHMAKER_LOG_WARN("chunk failed, retrying", {StringField("session", session.id),
                                                      IntField("chunk", static_cast<std::int64_t>(task.index)),
                                                      IntField("attempt", attempt)});
      if (retry_->WaitBeforeRetry(key, attempt - 1, cancel)) {
        std::lock_guard lock(mutex);
        if (!failure && !cancel.IsCancelled()) {
          Transition(job, ChunkStatus::kPending);
          scheduler.Enqueue(ChunkTask{task.index, attempt});
          return;
        }
      }
    }

    fail_session(std::move(*error));
  };

  auto worker = [&] {
    while (auto task = scheduler.Dequeue()) {
      try {
        process(*task);
      } catch (const std::exception& e) {
        fail_session(classifier_->Classify(e, errors::ErrorDomain::kConversion, "schedule_chunk"));
      }
    }
  };

  const std::size_t        pool = std::min(options_.worker_pool_size, total);
  std::vector<std::thread> workers;
  workers.reserve(pool);
  for (std::size_t i = 0; i < pool; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& t : workers) {
    t.join();
  }
}

void ConversionOrchestrator::Finalize(const model::ConversionSession& session, model::OutputFormat native,
                                      const std::vector<std::string>& ordered,
                                      const std::shared_ptr<audio::AudioConverter>& converter,
                                      const util::CancellationToken& cancel) {
  if (ordered.size() == 1) {
    if (native == session.format && session.format == model::OutputFormat::kWav) {
      MoveFile(ordered.front(), session.output_path);
    } else {
      converter->Transcode(ordered.front(), session.output_path, session.format, cancel);
    }
    return;
  }

  if (converter) {
    converter->Merge(ordered, session.output_path, session.format, cancel);
  } else {
    // only reachable for WAV chunks
    audio::MergeWavFiles(ordered, session.output_path);
  }
}

void ConversionOrchestrator::Fail(model::ConversionSession& session, model::ErrorRecord record,
                                  std::vector<std::string> partials) {
  Terminate(session, model::SessionStatus::kFailed);
  SPEECHMAKER_LOG_ERROR("conversion failed", {StringField("session", session.id), StringField("error_id", record.id),
                                              StringField("category", model::ToString(record.category))});
  throw errors::SessionError(std::move(record), std::move(partials));
}

void ConversionOrchestrator::CleanupChunks(const std::vector<std::string>& paths) {
  std::set<std::filesystem::path> dirs;
  for (const auto& path : paths) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
      classifier_->Classify(errors::RawError{util::ErrnoName(ec.value()),
                                             "Failed to remove temporary file: " + ec.message(),
                                             errors::ErrorDomain::kCleanup, "cleanup", path});
    }
    dirs.insert(std::filesystem::path(path).parent_path());
  }

  for (const auto& dir : dirs) {
    if (dir.empty() || dir.parent_path() != options_.temp_root) {
      continue;
    }
    std::error_code ec;
    if (std::filesystem::is_empty(dir, ec) && !ec) {
      std::filesystem::remove(dir, ec);
      if (ec) {
        classifier_->Classify(errors::RawError{util::ErrnoName(ec.value()),
                                               "Failed to remove temporary folder: " + ec.message(),
                                               errors::ErrorDomain::kCleanup, "cleanup", dir.string()});
      }
    }
  }
}

} // namespace speechmaker::conversion
