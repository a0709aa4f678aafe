#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/conversion/conversion_orchestrator.hpp"
#include "internal/engine/voice_engine.hpp"
#include "internal/errors/classified_error.hpp"
#include "internal/errors/error_classifier.hpp"
#include "internal/files/file_manager.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/speech_server.hpp"
#include "internal/readiness/readiness_state_machine.hpp"
#include "internal/resources/converter_probe.hpp"
#include "internal/resources/resource_resolver.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/service/speech_service.hpp"
#include "speechmaker/v1.hpp"

namespace {

namespace fs = std::filesystem;

using speechmaker::model::ErrorCategory;

class NoConverterProbe : public speechmaker::resources::ConverterProbe {
 public:
  bool CheckBundled(const std::string&) override {
    return false;
  }

  std::optional<std::string> FindSystem(const speechmaker::util::Deadline&) override {
    return std::nullopt;
  }
};

class OneVoiceEngine : public speechmaker::engine::VoiceEngine {
 public:
  std::vector<speechmaker::model::Voice> ListVoices(const speechmaker::util::Deadline&,
                                                    const speechmaker::util::CancellationToken&) override {
    return {speechmaker::model::Voice{"en-US-AriaNeural", "Aria", "en-US", "Female", true}};
  }

  speechmaker::model::OutputFormat NativeFormat() const override {
    return speechmaker::model::OutputFormat::kWav;
  }

  void Synthesize(const speechmaker::engine::SynthesisRequest&, const speechmaker::util::Deadline&,
                  const speechmaker::util::CancellationToken&) override {
    throw speechmaker::util::OperationError("EXIT_NONZERO", "TTS conversion failed: not expected in this test");
  }
};

std::shared_ptr<speechmaker::service::SpeechService> BuildService(const fs::path& root) {
  fs::remove_all(root);
  fs::create_directories(root);

  auto classifier = std::make_shared<speechmaker::errors::ErrorClassifier>();
  auto retry      = std::make_shared<speechmaker::retry::RetryPolicy>(speechmaker::retry::RetryPolicy::Options{1, 4, 3});
  auto engine     = std::make_shared<OneVoiceEngine>();

  speechmaker::conversion::ConversionOrchestrator::Options orchestrator_options;
  orchestrator_options.temp_root = root / "tmp";

  speechmaker::service::ServiceContext ctx;
  ctx.settings.default_output_path = (root / "out").string();
  ctx.classifier                   = classifier;
  ctx.retry                        = retry;
  ctx.readiness                    = std::make_shared<speechmaker::readiness::ReadinessStateMachine>();
  ctx.resolver                     = std::make_shared<speechmaker::resources::ResourceResolver>(
      speechmaker::resources::ResourceResolver::Options{}, std::make_shared<NoConverterProbe>(), engine, classifier);
  ctx.orchestrator =
      std::make_shared<speechmaker::conversion::ConversionOrchestrator>(orchestrator_options, engine, classifier, retry);
  ctx.files = std::make_shared<speechmaker::files::FileManager>(classifier);
  return std::make_shared<speechmaker::service::SpeechService>(std::move(ctx));
}

fs::path TestRoot(const std::string& name) {
  return fs::temp_directory_path() / "speechmaker_grpc_status_tests" / name;
}

void TestUtilErrorsMapToStatusCodes() {
  using namespace speechmaker::util;
  using speechmaker::grpc::ToStatus;

  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestCategoriesMapToStatusCodes() {
  using speechmaker::grpc::ToStatusCode;

  assert(ToStatusCode(ErrorCategory::kCancelled) == ::grpc::StatusCode::CANCELLED);
  assert(ToStatusCode(ErrorCategory::kFileNotFound) == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatusCode(ErrorCategory::kAccessDenied) == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatusCode(ErrorCategory::kFileTooLarge) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatusCode(ErrorCategory::kOutputLocation) == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatusCode(ErrorCategory::kEngineUnresponsive) == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatusCode(ErrorCategory::kTooManyOpenFiles) == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatusCode(ErrorCategory::kMergeFailed) == ::grpc::StatusCode::INTERNAL);
  assert(ToStatusCode(ErrorCategory::kUnknown) == ::grpc::StatusCode::INTERNAL);
}

void TestClassifiedErrorCarriesRecord() {
  speechmaker::model::ErrorRecord record;
  record.id           = "err_1_abc";
  record.category     = ErrorCategory::kFileTooLarge;
  record.user_message = "File too large: 12.00MB (maximum 10MB)";
  record.can_retry    = true;

  const auto status = speechmaker::grpc::ToStatus(speechmaker::errors::ClassifiedError(record));
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == record.user_message);

  speechmaker::v1::ErrorRecord details;
  assert(details.ParseFromString(status.error_details()));
  assert(details.id() == "err_1_abc");
  assert(details.category() == "file_too_large");
  assert(details.can_retry());
}

void TestReadinessReportedBeforeInitialization() {
  auto                          service = BuildService(TestRoot("not_ready"));
  speechmaker::grpc::SpeechServer server(service);

  speechmaker::v1::GetReadinessRequest  req;
  speechmaker::v1::GetReadinessResponse resp;
  ::grpc::ServerContext                 grpc_ctx;
  assert(server.GetReadiness(&grpc_ctx, &req, &resp).ok());
  assert(!resp.snapshot().ready());
}

void TestInvalidOutputFolderIsFailedPrecondition() {
  const auto root    = TestRoot("output_folder");
  auto       service = BuildService(root);
  service->Initialize();
  speechmaker::grpc::SpeechServer server(service);

  {
    std::ofstream blocker(root / "blocker");
    blocker << "x";
  }

  speechmaker::v1::SetOutputFolderRequest req;
  req.set_path((root / "blocker" / "nested").string());
  speechmaker::v1::SetOutputFolderResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.SetOutputFolder(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  speechmaker::v1::ErrorRecord details;
  assert(details.ParseFromString(status.error_details()));
  assert(details.category() == "output_location");
  assert(details.suggested_action() == "select_folder");
}

void TestUnaryCallsSucceedWhenReady() {
  auto service = BuildService(TestRoot("ready"));
  service->Initialize();
  speechmaker::grpc::SpeechServer server(service);

  {
    speechmaker::v1::ListVoicesRequest  req;
    speechmaker::v1::ListVoicesResponse resp;
    ::grpc::ServerContext               grpc_ctx;
    assert(server.ListVoices(&grpc_ctx, &req, &resp).ok());
    assert(resp.voices_size() == 1);
  }
  {
    speechmaker::v1::GetConverterStatusRequest  req;
    speechmaker::v1::GetConverterStatusResponse resp;
    ::grpc::ServerContext                       grpc_ctx;
    assert(server.GetConverterStatus(&grpc_ctx, &req, &resp).ok());
    assert(!resp.status().available());
    assert(resp.status().kind() == "audio_converter");
  }
  {
    speechmaker::v1::CancelRequest req;
    req.set_session_id("unknown");
    speechmaker::v1::CancelResponse resp;
    ::grpc::ServerContext           grpc_ctx;
    assert(server.Cancel(&grpc_ctx, &req, &resp).ok());
    assert(!resp.cancelled());
  }
}

} // namespace

int main() {
  TestUtilErrorsMapToStatusCodes();
  TestCategoriesMapToStatusCodes();
  TestClassifiedErrorCarriesRecord();
  TestReadinessReportedBeforeInitialization();
  TestInvalidOutputFolderIsFailedPrecondition();
  TestUnaryCallsSucceedWhenReady();

  std::cout << "speechmaker_unit_grpc_status: pass\n";
  return 0;
}
