#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/config/settings.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/speech_service.hpp"

namespace speechmaker::factory {

/*
  Application

  Owns the long-lived objects of the daemon. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  std::shared_ptr<service::SpeechService>      speech_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Wires the production components (edge-tts engine, ffmpeg probe and converter).
service::ServiceContext BuildContext(const config::Settings& settings);

/*
  Build

  Composition root: the only place that knows the concrete engine and
  converter types.
*/
Application Build(const speechmaker::runtime::config::RuntimeConfig& config);

} // namespace speechmaker::factory
