#include <pthread.h>

#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

namespace {

struct Options {
  std::string config_path;
  bool        fast_start = false;
  bool        help       = false;
};

void PrintUsage(std::ostream& out) {
  out << "Usage: speechmaker [--config <file.yaml>] [--fast-start]\n"
      << "  --config      configuration file (default: $" << speechmaker::config::ConfigLoader::kPathEnv << " or "
      << speechmaker::config::ConfigLoader::kDefaultPath << ")\n"
      << "  --fast-start  shorter voice list timeout during initialization\n";
}

bool ParseArgs(int argc, char** argv, Options* options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      options->config_path = argv[++i];
    } else if (arg == "--fast-start") {
      options->fast_start = true;
    } else if (arg == "-h" || arg == "--help") {
      options->help = true;
    } else if (!arg.empty() && arg[0] != '-' && options->config_path.empty()) {
      options->config_path = arg;
    } else {
      std::cerr << "speechmaker: unexpected argument '" << arg << "'\n";
      return false;
    }
  }
  return true;
}

// SIGINT/SIGTERM are blocked in every thread and collected by sigwait in main.
sigset_t BlockShutdownSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  return signals;
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, &options)) {
    PrintUsage(std::cerr);
    return 1;
  }
  if (options.help) {
    PrintUsage(std::cout);
    return 0;
  }

  const sigset_t shutdown_signals = BlockShutdownSignals();

  const auto config_path = speechmaker::config::ConfigLoader::ResolvePath(options.config_path);

  speechmaker::runtime::config::RuntimeConfig config;
  try {
    config = speechmaker::config::ConfigLoader::LoadFromYaml(config_path);
    if (options.fast_start) {
      config.set_fast_start(true);
    }
    speechmaker::observability::InitializeLogging(config.logging());
  } catch (const std::exception& e) {
    std::cerr << "speechmaker: " << e.what() << std::endl;
    return 1;
  }

  using speechmaker::observability::BoolField;
  using speechmaker::observability::StringField;

  int exit_code = 0;
  try {
    const auto settings = speechmaker::config::ResolveSettings(config);
    auto       app      = speechmaker::factory::Build(config);

    speechmaker::runtime::Server server(settings.bind_address, std::move(app.grpc_services));
    server.Start();

    // voices and converter load in the background; RPCs report readiness meanwhile
    app.speech_service->StartInitialization();
    SPEECHMAKER_LOG_INFO("speechmaker listening", {StringField("bind_address", settings.bind_address),
                                                   StringField("config", config_path),
                                                   BoolField("fast_start", settings.fast_start)});

    int signal_number = 0;
    sigwait(&shutdown_signals, &signal_number);
    SPEECHMAKER_LOG_INFO("speechmaker stopping", {StringField("signal", signal_number == SIGINT ? "SIGINT" : "SIGTERM")});

    // cancel running conversions before the transport goes away
    app.speech_service->Shutdown();
    server.Stop();
  } catch (const std::exception& e) {
    SPEECHMAKER_LOG_ERROR("speechmaker failed", {StringField("error", e.what())});
    exit_code = 2;
  }

  speechmaker::observability::ShutdownLogging();
  return exit_code;
}
