#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "speechmaker/v1.hpp"
#include "speechmaker/v1/speech_service.grpc.pb.h"

using namespace speechmaker::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  speechctl <addr> readiness\n"
            << "  speechctl <addr> watch [initialization|voice|converter|output-folder|action ...]\n"
            << "  speechctl <addr> voices\n"
            << "  speechctl <addr> retry-voices\n"
            << "  speechctl <addr> converter\n"
            << "  speechctl <addr> reinit\n"
            << "  speechctl <addr> set-folder [path]\n"
            << "  speechctl <addr> convert (--text <text> | --file <path>) [--voice <id>] [--speed <x>]"
               " [--format wav|mp3] [--out <folder>]\n"
            << "  speechctl <addr> cancel <session_id>\n"
            << "  speechctl <addr> errors [limit]\n"
            << "  speechctl <addr> stats\n"
            << "  speechctl <addr> clear-errors\n"
            << "  speechctl <addr> reset-retries [key]\n";
}

static std::optional<OutputFormat> ParseFormat(const std::string& value) {
  if (value == "wav") {
    return OUTPUT_FORMAT_WAV;
  }
  if (value == "mp3") {
    return OUTPUT_FORMAT_MP3;
  }
  return std::nullopt;
}

static std::optional<ReadinessTopic> ParseTopic(const std::string& value) {
  if (value == "initialization") return READINESS_TOPIC_INITIALIZATION;
  if (value == "voice") return READINESS_TOPIC_VOICE;
  if (value == "converter") return READINESS_TOPIC_CONVERTER;
  if (value == "output-folder") return READINESS_TOPIC_OUTPUT_FOLDER;
  if (value == "action") return READINESS_TOPIC_ACTION;
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  ErrorRecord record;
  if (!status.error_details().empty() && record.ParseFromString(status.error_details())) {
    std::cerr << "category=" << record.category() << " action=" << record.suggested_action() << "\n";
    for (const auto& step : record.troubleshooting()) {
      std::cerr << "  - " << step << "\n";
    }
  }
  return 2;
}

static void PrintError(const ErrorRecord& record) {
  std::cout << record.id() << " " << record.category() << " " << Severity_Name(record.severity()) << " "
            << record.user_message() << " (retry=" << (record.can_retry() ? "yes" : "no")
            << " action=" << record.suggested_action() << ")\n";
}

static void PrintReadiness(const ReadinessSnapshot& s) {
  std::cout << "ready=" << s.ready() << "\n";
  std::cout << "initializing=" << s.initializing() << "\n";
  std::cout << "voices_loaded=" << s.voices_loaded() << " voices=" << s.voice_count()
            << " attempts=" << s.voice_load_attempts() << "\n";
  if (s.has_voice_load_error()) {
    std::cout << "voice_error=" << s.voice_load_error().user_message() << "\n";
  }
  if (s.has_converter()) {
    std::cout << "converter=" << (s.converter().available() ? s.converter().path() : "<none>") << "\n";
  }
  std::cout << "mp3_available=" << s.mp3_available() << "\n";
  std::cout << "output_folder=" << (s.output_folder_set() ? s.output_folder() : s.default_output_folder()) << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SpeechMakerService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "readiness") {
    GetReadinessRequest  req;
    GetReadinessResponse resp;

    auto status = stub->GetReadiness(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintReadiness(resp.snapshot());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    WatchReadinessRequest req;
    for (int i = 3; i < argc; ++i) {
      auto topic = ParseTopic(argv[i]);
      if (!topic.has_value()) {
        std::cerr << "unknown topic: " << argv[i] << "\n";
        return 1;
      }
      req.add_topics(topic.value());
    }

    auto reader = stub->WatchReadiness(&ctx, req);

    ReadinessUpdate update;
    while (reader->Read(&update)) {
      std::cout << "--- #" << update.snapshot().sequence() << " " << ReadinessTopic_Name(update.topic()) << "\n";
      PrintReadiness(update.snapshot());
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "voices") {
    ListVoicesRequest  req;
    ListVoicesResponse resp;

    auto status = stub->ListVoices(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& voice : resp.voices()) {
      std::cout << voice.id() << (voice.is_default() ? " *" : "") << "  " << voice.display_name() << "  "
                << voice.locale() << "  " << voice.gender() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry-voices") {
    RetryVoiceLoadingRequest  req;
    RetryVoiceLoadingResponse resp;

    auto status = stub->RetryVoiceLoading(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "success=" << resp.success() << " voices=" << resp.voice_count() << " attempts=" << resp.attempts()
              << "\n";
    if (resp.has_error()) PrintError(resp.error());
    return resp.success() ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "converter") {
    GetConverterStatusRequest  req;
    GetConverterStatusResponse resp;

    auto status = stub->GetConverterStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& s = resp.status();
    std::cout << "available=" << s.available() << "\n";
    std::cout << "source=" << ResourceSource_Name(s.source()) << "\n";
    std::cout << "path=" << s.path() << "\n";
    std::cout << "detection_ms=" << s.detection_latency_ms() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reinit") {
    ReinitializeRequest  req;
    ReinitializeResponse resp;

    auto status = stub->Reinitialize(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintReadiness(resp.snapshot());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-folder") {
    SetOutputFolderRequest req;
    req.set_path(argc >= 4 ? argv[3] : "");

    SetOutputFolderResponse resp;

    auto status = stub->SetOutputFolder(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintReadiness(resp.snapshot());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "convert") {
    ConvertRequest req;
    for (int i = 3; i + 1 < argc; i += 2) {
      const std::string flag  = argv[i];
      const std::string value = argv[i + 1];
      if (flag == "--text") {
        req.set_text(value);
      } else if (flag == "--file") {
        req.set_file_path(value);
      } else if (flag == "--voice") {
        req.set_voice_id(value);
      } else if (flag == "--speed") {
        req.set_speed(std::stod(value));
      } else if (flag == "--format") {
        auto parsed = ParseFormat(value);
        if (!parsed.has_value()) {
          std::cerr << "unsupported format: " << value << "\n";
          return 1;
        }
        req.set_output_format(parsed.value());
      } else if (flag == "--out") {
        req.set_output_folder(value);
      } else {
        std::cerr << "unknown option: " << flag << "\n";
        return 1;
      }
    }
    if (req.source_case() == ConvertRequest::SOURCE_NOT_SET) {
      Usage();
      return 1;
    }

    auto reader = stub->Convert(&ctx, req);

    ConversionEvent event;
    int             rc = 2;
    while (reader->Read(&event)) {
      if (event.has_progress()) {
        std::cout << "[" << event.session_id() << "] " << event.progress().percent() << "% "
                  << event.progress().phase();
        if (event.progress().total() > 0) {
          std::cout << " (" << event.progress().current() << "/" << event.progress().total() << ")";
        }
        std::cout << "\n";
      } else if (event.has_completed()) {
        std::cout << "output=" << event.completed().output_path() << "\n";
        std::cout << "chunks=" << event.completed().chunk_count() << "\n";
        rc = 0;
      } else if (event.has_failed()) {
        PrintError(event.failed().error());
        for (const auto& step : event.failed().error().troubleshooting()) {
          std::cout << "  - " << step << "\n";
        }
      }
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return rc;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelRequest req;
    req.set_session_id(argv[3]);

    CancelResponse resp;

    auto status = stub->Cancel(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.cancelled() ? "cancelled" : "no such session") << "\n";
    return resp.cancelled() ? 0 : 1;
  }

  // ------------------------------------------------------------

  if (cmd == "errors") {
    GetRecentErrorsRequest req;
    if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));

    GetRecentErrorsResponse resp;

    auto status = stub->GetRecentErrors(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.errors()) PrintError(record);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    GetErrorStatisticsRequest  req;
    GetErrorStatisticsResponse resp;

    auto status = stub->GetErrorStatistics(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& s = resp.statistics();
    std::cout << "total=" << s.total() << "\n";
    std::cout << "recent_24h=" << s.recent_24h() << "\n";
    std::cout << "critical=" << s.critical_count() << "\n";
    for (const auto& [category, count] : s.by_category()) {
      std::cout << category << "=" << count << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear-errors") {
    ClearErrorsRequest  req;
    ClearErrorsResponse resp;

    auto status = stub->ClearErrors(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reset-retries") {
    ResetRetriesRequest req;
    if (argc >= 4) req.set_key(argv[3]);

    ResetRetriesResponse resp;

    auto status = stub->ResetRetries(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "reset\n";
    return 0;
  }

  Usage();
  return 1;
}
