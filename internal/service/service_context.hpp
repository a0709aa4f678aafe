#pragma once

#include <functional>
#include <memory>

#include "internal/config/settings.hpp"

namespace speechmaker::audio { class AudioConverter; }
namespace speechmaker::conversion { class ConversionOrchestrator; }
namespace speechmaker::errors { class ErrorClassifier; }
namespace speechmaker::files { class FileManager; }
namespace speechmaker::model { struct ResourceStatus; }
namespace speechmaker::readiness { class ReadinessStateMachine; }
namespace speechmaker::resources { class ResourceResolver; }
namespace speechmaker::retry { class RetryPolicy; }

namespace speechmaker::service {

// Builds a converter for an available ResourceStatus.
using ConverterFactory = std::function<std::shared_ptr<audio::AudioConverter>(const model::ResourceStatus&)>;

/*
  Dependency container for the speech service.
*/
struct ServiceContext {
  config::Settings settings;

  std::shared_ptr<errors::ErrorClassifier>            classifier;
  std::shared_ptr<retry::RetryPolicy>                 retry;
  std::shared_ptr<resources::ResourceResolver>        resolver;
  std::shared_ptr<readiness::ReadinessStateMachine>   readiness;
  std::shared_ptr<conversion::ConversionOrchestrator> orchestrator;
  std::shared_ptr<files::FileManager>                 files;
  ConverterFactory                                    converter_factory;
};

} // namespace speechmaker::service
