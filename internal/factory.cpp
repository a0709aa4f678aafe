#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <string>

#include "internal/audio/ffmpeg_converter.hpp"
#include "internal/conversion/conversion_orchestrator.hpp"
#include "internal/engine/edge_tts_engine.hpp"
#include "internal/errors/error_classifier.hpp"
#include "internal/files/file_manager.hpp"
#include "internal/grpc/speech_server.hpp"
#include "internal/readiness/readiness_state_machine.hpp"
#include "internal/resources/converter_probe.hpp"
#include "internal/resources/resource_resolver.hpp"
#include "internal/retry/retry_policy.hpp"

namespace speechmaker::factory {

namespace {

// Fast start trades voice listing robustness for a quicker ready state.
constexpr std::uint32_t kFastStartVoiceAttempts = 2;

} // namespace

service::ServiceContext BuildContext(const config::Settings& settings) {
  service::ServiceContext ctx;
  ctx.settings = settings;

  // ------------------------------------------------------------------
  // Error handling
  // ------------------------------------------------------------------
  ctx.classifier = std::make_shared<errors::ErrorClassifier>(settings.error_log_capacity);

  retry::RetryPolicy::Options retry_options;
  retry_options.base_delay_ms = settings.retry_base_delay_ms;
  retry_options.cap_delay_ms  = settings.retry_cap_delay_ms;
  retry_options.max_attempts  = settings.retry_max_attempts;
  ctx.retry                   = std::make_shared<retry::RetryPolicy>(retry_options);

  // ------------------------------------------------------------------
  // External tools
  // ------------------------------------------------------------------
  auto engine = std::make_shared<engine::EdgeTtsEngine>(settings.engine_binary);
  auto probe  = std::make_shared<resources::SystemConverterProbe>(settings.converter_system_binary);

  resources::ResourceResolver::Options resolver_options;
  resolver_options.bundled_converter_path = settings.converter_bundled_path.empty()
                                                ? resources::DefaultBundledConverterPath()
                                                : settings.converter_bundled_path;
  resolver_options.converter_timeout      = settings.converter_detection_timeout;
  resolver_options.voice_list_timeout     = settings.EffectiveVoiceListTimeout();
  resolver_options.voice_load_attempts    = settings.fast_start
                                                ? std::min(settings.voice_load_attempts, kFastStartVoiceAttempts)
                                                : settings.voice_load_attempts;
  resolver_options.retry_base_delay_ms    = settings.retry_base_delay_ms;
  resolver_options.retry_cap_delay_ms     = settings.retry_cap_delay_ms;
  ctx.resolver = std::make_shared<resources::ResourceResolver>(resolver_options, probe, engine, ctx.classifier);

  // ------------------------------------------------------------------
  // Conversion
  // ------------------------------------------------------------------
  conversion::ConversionOrchestrator::Options orchestrator_options;
  orchestrator_options.max_chunk_length  = settings.max_chunk_length;
  orchestrator_options.worker_pool_size  = settings.worker_pool_size;
  orchestrator_options.synthesis_timeout = settings.synthesis_timeout;
  ctx.orchestrator =
      std::make_shared<conversion::ConversionOrchestrator>(orchestrator_options, engine, ctx.classifier, ctx.retry);

  ctx.readiness = std::make_shared<readiness::ReadinessStateMachine>();
  ctx.files     = std::make_shared<files::FileManager>(ctx.classifier);

  audio::FfmpegConverter::Options converter_options;
  converter_options.mp3_bitrate       = settings.mp3_bitrate;
  converter_options.sample_rate       = settings.sample_rate;
  converter_options.operation_timeout = settings.converter_operation_timeout;
  ctx.converter_factory = [converter_options](const model::ResourceStatus& status) {
    return std::make_shared<audio::FfmpegConverter>(status.path, converter_options);
  };

  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const speechmaker::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto settings = config::ResolveSettings(config);

  app.speech_service = std::make_shared<service::SpeechService>(BuildContext(settings));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SpeechServer>(app.speech_service));

  return app;
}

} // namespace speechmaker::factory
