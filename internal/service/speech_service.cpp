#include "speech_service.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <iterator>
#include <utility>
#include <vector>

#include "internal/audio/audio_converter.hpp"
#include "internal/conversion/conversion_orchestrator.hpp"
#include "internal/errors/classified_error.hpp"
#include "internal/errors/error_classifier.hpp"
#include "internal/files/file_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/readiness/readiness_state_machine.hpp"
#include "internal/resources/resource_resolver.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace speechmaker::service {

using namespace speechmaker::v1;
using observability::StringField;

namespace {

constexpr double   kMinSpeed           = 0.5;
constexpr double   kMaxSpeed           = 2.0;
constexpr uint32_t kDefaultRecentLimit = 50;

constexpr auto        kWatchIdleInterval = std::chrono::milliseconds(200);
constexpr std::size_t kMaxQueuedUpdates  = 64;

constexpr readiness::Topic kAllTopics[] = {readiness::Topic::kInitialization, readiness::Topic::kVoice,
                                           readiness::Topic::kConverter, readiness::Topic::kOutputFolder,
                                           readiness::Topic::kAction};

using QueuedUpdate = std::pair<readiness::Topic, readiness::ReadinessSnapshot>;

// Hands updates from readiness observers to the watching thread.
struct WatchQueue {
  std::mutex               mutex;
  std::condition_variable  cv;
  std::deque<QueuedUpdate> updates;
};

template <typename Fn>
auto Handle(const char* route, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    SPEECHMAKER_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

ConversionEvent FailedEvent(const std::string& session_id, const model::ErrorRecord& record) {
  ConversionEvent event;
  event.set_session_id(session_id);
  *event.mutable_failed()->mutable_error() = ToProto(record);
  return event;
}

} // namespace

SpeechService::SpeechService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.classifier || !ctx_.retry || !ctx_.resolver || !ctx_.readiness || !ctx_.orchestrator || !ctx_.files) {
    throw util::InvalidArgument("speech service context is incomplete");
  }
}

SpeechService::~SpeechService() {
  Shutdown();
}

void SpeechService::ApplyDefaultOutputFolder() {
  std::string folder;
  if (!ctx_.settings.default_output_path.empty() && ctx_.files->ValidateOutputDirectory(ctx_.settings.default_output_path)) {
    folder = ctx_.settings.default_output_path;
  } else {
    folder = ctx_.files->DefaultOutputFolder();
  }
  if (folder.empty()) {
    SPEECHMAKER_LOG_WARN("no writable default output folder; an output folder must be chosen");
  }
  ctx_.readiness->SetDefaultOutputFolder(std::move(folder));
}

void SpeechService::LoadVoices() {
  auto catalog = ctx_.resolver->ResolveVoices();
  ctx_.readiness->SetVoices(!catalog.voices.empty(), std::move(catalog.voices), catalog.attempts,
                            std::move(catalog.last_error));
}

void SpeechService::Initialize() {
  const auto started_at = std::chrono::steady_clock::now();
  ctx_.readiness->SetInitializing(true);

  ApplyDefaultOutputFolder();

  auto converter = std::async(std::launch::async, [this] { return ctx_.resolver->ResolveConverter(); });
  LoadVoices();
  ctx_.readiness->SetConverterStatus(converter.get());

  ctx_.readiness->SetInitializing(false);

  const auto snapshot = ctx_.readiness->Snapshot();
  SPEECHMAKER_LOG_INFO(
      "initialization finished",
      {observability::BoolField("ready", snapshot.ready),
       observability::IntField("voices", static_cast<std::int64_t>(snapshot.voices.size())),
       observability::BoolField("mp3_available", snapshot.mp3_available),
       observability::IntField("elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                                 std::chrono::steady_clock::now() - started_at)
                                                 .count())});
}

void SpeechService::StartInitialization() {
  std::lock_guard lock(init_mutex_);
  if (init_thread_.joinable()) {
    throw util::InvalidState("initialization already started");
  }
  init_thread_ = std::thread([this] {
    try {
      Initialize();
    } catch (const std::exception& e) {
      SPEECHMAKER_LOG_ERROR("initialization failed", {StringField("error", e.what())});
      ctx_.readiness->SetInitializing(false);
    }
  });
}

void SpeechService::WaitForInitialization() {
  std::lock_guard lock(init_mutex_);
  if (init_thread_.joinable()) {
    init_thread_.join();
  }
}

void SpeechService::Shutdown() {
  shutdown_.Cancel();
  ctx_.resolver->Cancel();
  {
    std::lock_guard lock(sessions_mutex_);
    for (auto& [id, token] : sessions_) {
      token.Cancel();
    }
  }
  WaitForInitialization();
}

GetReadinessResponse SpeechService::GetReadiness(const GetReadinessRequest&) {
  return Handle("SpeechService.GetReadiness", [&] {
    GetReadinessResponse resp;
    *resp.mutable_snapshot() = ToProto(ctx_.readiness->Snapshot());
    return resp;
  });
}

void SpeechService::WatchReadiness(const WatchReadinessRequest& req, const ReadinessSink& sink, const StopCheck& stop) {
  Handle("SpeechService.WatchReadiness", [&] {
    std::vector<readiness::Topic> topics;
    for (const int value : req.topics()) {
      const auto topic = FromProto(static_cast<ReadinessTopic>(value));
      if (!topic) {
        throw util::InvalidArgument("unknown readiness topic " + std::to_string(value));
      }
      topics.push_back(*topic);
    }
    if (topics.empty()) {
      topics.assign(std::begin(kAllTopics), std::end(kAllTopics));
    }

    auto queue = std::make_shared<WatchQueue>();

    struct Subscriptions {
      readiness::ReadinessStateMachine*                             machine;
      std::vector<readiness::ReadinessStateMachine::SubscriptionId> ids;
      ~Subscriptions() {
        for (const auto id : ids) {
          machine->Unsubscribe(id);
        }
      }
    } subscriptions{ctx_.readiness.get(), {}};

    for (const auto topic : topics) {
      subscriptions.ids.push_back(
          ctx_.readiness->Subscribe(topic, [queue](readiness::Topic t, const readiness::ReadinessSnapshot& snapshot) {
            {
              std::lock_guard lock(queue->mutex);
              if (queue->updates.size() >= kMaxQueuedUpdates) {
                queue->updates.pop_front();
              }
              queue->updates.emplace_back(t, snapshot);
            }
            queue->cv.notify_one();
          }));
    }

    ReadinessUpdate initial;
    initial.set_topic(READINESS_TOPIC_UNSPECIFIED);
    *initial.mutable_snapshot() = ToProto(ctx_.readiness->Snapshot());
    const std::uint64_t baseline = initial.snapshot().sequence();
    std::uint64_t       last     = baseline;
    if (!sink(initial)) {
      return;
    }

    while (true) {
      std::deque<QueuedUpdate> batch;
      {
        std::unique_lock lock(queue->mutex);
        queue->cv.wait_for(lock, kWatchIdleInterval, [&] { return !queue->updates.empty(); });
        batch.swap(queue->updates);
      }
      if (shutdown_.IsCancelled() || (stop && stop())) {
        return;
      }

      for (const auto& [topic, snapshot] : batch) {
        // covered by the initial snapshot, or by a newer one already sent
        if (snapshot.sequence <= baseline || snapshot.sequence < last) {
          continue;
        }
        last = snapshot.sequence;

        ReadinessUpdate update;
        update.set_topic(ToProto(topic));
        *update.mutable_snapshot() = ToProto(snapshot);
        if (!sink(update)) {
          return;
        }
      }
    }
  });
}

ListVoicesResponse SpeechService::ListVoices(const ListVoicesRequest&) {
  return Handle("SpeechService.ListVoices", [&] {
    ListVoicesResponse resp;
    for (const auto& voice : ctx_.readiness->Snapshot().voices) {
      *resp.add_voices() = ToProto(voice);
    }
    return resp;
  });
}

RetryVoiceLoadingResponse SpeechService::RetryVoiceLoading(const RetryVoiceLoadingRequest&) {
  return Handle("SpeechService.RetryVoiceLoading", [&] {
    ctx_.resolver->Clear(model::ResourceKind::kVoiceCatalog);
    LoadVoices();

    const auto                snapshot = ctx_.readiness->Snapshot();
    RetryVoiceLoadingResponse resp;
    resp.set_success(snapshot.voices_loaded);
    resp.set_voice_count(static_cast<uint32_t>(snapshot.voices.size()));
    resp.set_attempts(snapshot.voice_load_attempts);
    if (snapshot.voice_load_error) {
      *resp.mutable_error() = ToProto(*snapshot.voice_load_error);
    }
    return resp;
  });
}

GetConverterStatusResponse SpeechService::GetConverterStatus(const GetConverterStatusRequest&) {
  return Handle("SpeechService.GetConverterStatus", [&] {
    GetConverterStatusResponse resp;
    *resp.mutable_status() = ToProto(ctx_.resolver->ResolveConverter());
    return resp;
  });
}

ReinitializeResponse SpeechService::Reinitialize(const ReinitializeRequest&) {
  return Handle("SpeechService.Reinitialize", [&] {
    WaitForInitialization();
    ctx_.resolver->Clear();
    Initialize();

    ReinitializeResponse resp;
    *resp.mutable_snapshot() = ToProto(ctx_.readiness->Snapshot());
    return resp;
  });
}

SetOutputFolderResponse SpeechService::SetOutputFolder(const SetOutputFolderRequest& req) {
  return Handle("SpeechService.SetOutputFolder", [&] {
    if (!req.path().empty() && !ctx_.files->ValidateOutputDirectory(req.path())) {
      throw errors::ClassifiedError(ctx_.classifier->Classify(errors::RawError{
          "EACCES", "Output path is not writable: " + req.path(), errors::ErrorDomain::kOutput, "set_output_folder",
          req.path()}));
    }
    ctx_.readiness->SetOutputFolder(req.path());

    SetOutputFolderResponse resp;
    *resp.mutable_snapshot() = ToProto(ctx_.readiness->Snapshot());
    return resp;
  });
}

ConversionEvent SpeechService::Convert(const ConvertRequest& req, const EventSink& sink) {
  return Handle("SpeechService.Convert", [&] {
    const auto snapshot = ctx_.readiness->Snapshot();
    if (!snapshot.ready) {
      throw util::InvalidState("speech service is not ready");
    }
    if (req.source_case() == ConvertRequest::SOURCE_NOT_SET) {
      throw util::InvalidArgument("either text or file_path is required");
    }

    const double speed = req.speed() == 0.0 ? ctx_.settings.voice_speed : req.speed();
    if (speed < kMinSpeed || speed > kMaxSpeed) {
      throw util::InvalidArgument("speed must be between 0.5 and 2.0");
    }
    const auto format = FromProto(req.output_format(), ctx_.settings.default_output_format);

    std::string voice_id = req.voice_id();
    if (voice_id.empty()) {
      for (const auto& voice : snapshot.voices) {
        if (voice.is_default) {
          voice_id = voice.id;
          break;
        }
      }
      if (voice_id.empty() && !snapshot.voices.empty()) {
        voice_id = snapshot.voices.front().id;
      }
    }

    const std::string       session_id = util::GenerateSessionId();
    util::CancellationToken token;
    {
      std::lock_guard lock(sessions_mutex_);
      sessions_.emplace(session_id, token);
    }
    struct SessionGuard {
      SpeechService*     self;
      const std::string& id;
      ~SessionGuard() {
        std::lock_guard lock(self->sessions_mutex_);
        self->sessions_.erase(id);
      }
    } session_guard{this, session_id};

    auto emit = [&](const ConversionEvent& event) {
      if (sink && !sink(event)) {
        token.Cancel();
      }
    };

    ConversionEvent terminal;
    try {
      bool known_voice = false;
      for (const auto& voice : snapshot.voices) {
        known_voice = known_voice || voice.id == voice_id;
      }
      if (!known_voice) {
        throw errors::ClassifiedError(ctx_.classifier->Classify(errors::RawError{
            "EVOICE", "Voice " + voice_id + " not found", errors::ErrorDomain::kVoice, "convert", voice_id}));
      }

      const std::string text = req.source_case() == ConvertRequest::kFilePath ? ctx_.files->ReadTextFile(req.file_path())
                                                                              : req.text();

      const std::string folder = req.output_folder().empty() ? snapshot.EffectiveOutputFolder() : req.output_folder();
      if (!ctx_.files->ValidateOutputDirectory(folder)) {
        throw errors::ClassifiedError(ctx_.classifier->Classify(errors::RawError{
            "EACCES", "Output path is not writable: " + folder, errors::ErrorDomain::kOutput, "convert", folder}));
      }

      conversion::ConversionRequest request;
      request.session_id  = session_id;
      request.text        = text;
      request.voice_id    = voice_id;
      request.speed       = speed;
      request.format      = format;
      request.output_path = ctx_.files->GenerateUniqueFileName(
          folder, "speech_" + util::FileSafeTimestamp(util::Now()), "." + std::string(model::Extension(format)));

      std::shared_ptr<audio::AudioConverter> converter;
      if (snapshot.converter && snapshot.converter->available && ctx_.converter_factory) {
        converter = ctx_.converter_factory(*snapshot.converter);
      }

      const auto result = ctx_.orchestrator->Convert(
          request, converter, token, [&](const conversion::ConversionProgress& progress) {
            ConversionEvent event;
            event.set_session_id(session_id);
            auto* p = event.mutable_progress();
            p->set_percent(static_cast<uint32_t>(progress.percent));
            p->set_phase(progress.phase);
            p->set_current(static_cast<uint32_t>(progress.current));
            p->set_total(static_cast<uint32_t>(progress.total));
            emit(event);
          });

      terminal.set_session_id(session_id);
      terminal.mutable_completed()->set_output_path(result.output_path);
      terminal.mutable_completed()->set_chunk_count(static_cast<uint32_t>(result.chunk_count));
    } catch (const errors::SessionError& e) {
      ctx_.orchestrator->CleanupChunks(e.partial_outputs());
      terminal = FailedEvent(session_id, e.record());
    } catch (const errors::ClassifiedError& e) {
      terminal = FailedEvent(session_id, e.record());
    } catch (const std::exception& e) {
      terminal = FailedEvent(session_id, ctx_.classifier->Classify(e, errors::ErrorDomain::kConversion, "convert"));
    }

    emit(terminal);
    return terminal;
  });
}

std::size_t SpeechService::ActiveSessionCount() const {
  std::lock_guard lock(sessions_mutex_);
  return sessions_.size();
}

CancelResponse SpeechService::Cancel(const CancelRequest& req) {
  return Handle("SpeechService.Cancel", [&] {
    CancelResponse  resp;
    std::lock_guard lock(sessions_mutex_);
    const auto      it = sessions_.find(req.session_id());
    if (it != sessions_.end()) {
      it->second.Cancel();
      resp.set_cancelled(true);
      SPEECHMAKER_LOG_INFO("conversion cancel requested", {StringField("session", req.session_id())});
    }
    return resp;
  });
}

GetRecentErrorsResponse SpeechService::GetRecentErrors(const GetRecentErrorsRequest& req) {
  return Handle("SpeechService.GetRecentErrors", [&] {
    GetRecentErrorsResponse resp;
    for (const auto& record : ctx_.classifier->Recent(req.limit() == 0 ? kDefaultRecentLimit : req.limit())) {
      *resp.add_errors() = ToProto(record);
    }
    return resp;
  });
}

GetErrorStatisticsResponse SpeechService::GetErrorStatistics(const GetErrorStatisticsRequest&) {
  return Handle("SpeechService.GetErrorStatistics", [&] {
    GetErrorStatisticsResponse resp;
    *resp.mutable_statistics() = ToProto(ctx_.classifier->Stats());
    return resp;
  });
}

ClearErrorsResponse SpeechService::ClearErrors(const ClearErrorsRequest&) {
  return Handle("SpeechService.ClearErrors", [&] {
    ctx_.classifier->Clear();
    return ClearErrorsResponse{};
  });
}

ResetRetriesResponse SpeechService::ResetRetries(const ResetRetriesRequest& req) {
  return Handle("SpeechService.ResetRetries", [&] {
    if (req.key().empty()) {
      ctx_.retry->ResetAll();
      ctx_.resolver->ResetRetries();
    } else if (req.key() == resources::ResourceResolver::kVoiceRetryKey) {
      ctx_.resolver->ResetRetries();
    } else {
      ctx_.retry->Reset(req.key());
    }
    return ResetRetriesResponse{};
  });
}

} // namespace speechmaker::service
