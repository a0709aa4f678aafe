#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/engine/voice_engine.hpp"
#include "internal/errors/error_classifier.hpp"
#include "internal/resources/converter_probe.hpp"
#include "internal/resources/resource_resolver.hpp"
#include "internal/util/errors.hpp"

namespace {

using speechmaker::model::ErrorCategory;
using speechmaker::model::ResourceKind;
using speechmaker::model::ResourceSource;
using speechmaker::resources::ResourceResolver;

class FakeProbe : public speechmaker::resources::ConverterProbe {
 public:
  bool CheckBundled(const std::string& path) override {
    ++bundled_checks;
    return path == bundled_path;
  }

  std::optional<std::string> FindSystem(const speechmaker::util::Deadline&) override {
    ++system_calls;
    std::this_thread::sleep_for(delay);
    return system_path;
  }

  std::string                bundled_path;
  std::optional<std::string> system_path;
  std::chrono::milliseconds  delay{0};
  std::atomic<int>           bundled_checks{0};
  std::atomic<int>           system_calls{0};
};

class FakeEngine : public speechmaker::engine::VoiceEngine {
 public:
  std::vector<speechmaker::model::Voice> ListVoices(const speechmaker::util::Deadline&,
                                                    const speechmaker::util::CancellationToken& cancel) override {
    const int call = ++calls;
    if (cancel.IsCancelled()) {
      throw speechmaker::util::OperationError("ECANCELED", "voice listing cancelled");
    }
    if (call <= failures) {
      throw speechmaker::util::OperationError(failure_code, "edge-tts failed");
    }
    return {speechmaker::model::Voice{"en-US-AriaNeural", "Aria", "en-US", "Female", true},
            speechmaker::model::Voice{"de-DE-KatjaNeural", "Katja", "de-DE", "Female", false}};
  }

  speechmaker::model::OutputFormat NativeFormat() const override {
    return speechmaker::model::OutputFormat::kWav;
  }

  void Synthesize(const speechmaker::engine::SynthesisRequest&, const speechmaker::util::Deadline&,
                  const speechmaker::util::CancellationToken&) override {
  }

  int              failures     = 0;
  std::string      failure_code = "ETIMEDOUT";
  std::atomic<int> calls{0};
};

ResourceResolver::Options FastOptions() {
  ResourceResolver::Options options;
  options.converter_timeout   = std::chrono::milliseconds(500);
  options.voice_list_timeout  = std::chrono::milliseconds(500);
  options.voice_load_attempts = 3;
  options.retry_base_delay_ms = 1;
  options.retry_cap_delay_ms  = 4;
  return options;
}

struct Fixture {
  std::shared_ptr<FakeProbe>                            probe      = std::make_shared<FakeProbe>();
  std::shared_ptr<FakeEngine>                           engine     = std::make_shared<FakeEngine>();
  std::shared_ptr<speechmaker::errors::ErrorClassifier> classifier = std::make_shared<speechmaker::errors::ErrorClassifier>();

  ResourceResolver Make(ResourceResolver::Options options = FastOptions()) {
    return ResourceResolver(std::move(options), probe, engine, classifier);
  }
};

void TestConcurrentConverterResolutionRunsOnce() {
  Fixture f;
  f.probe->system_path = "/usr/bin/ffmpeg";
  f.probe->delay       = std::chrono::milliseconds(100);
  auto resolver        = f.Make();

  std::vector<std::thread>                         threads;
  std::vector<speechmaker::model::ResourceStatus> results(8);
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] { results[i] = resolver.ResolveConverter(); });
  }
  for (auto& t : threads) t.join();

  assert(f.probe->system_calls == 1);
  for (const auto& status : results) {
    assert(status.available);
    assert(status.path == "/usr/bin/ffmpeg");
  }

  // cached afterwards
  (void)resolver.ResolveConverter();
  assert(f.probe->system_calls == 1);
  assert(resolver.Cached(ResourceKind::kAudioConverter).has_value());
}

void TestSystemConverterUsedWhenBundledMissing() {
  Fixture f;
  f.probe->bundled_path = "/opt/app/resources/ffmpeg/linux/x64/ffmpeg";
  f.probe->system_path  = "/usr/bin/ffmpeg";
  auto options          = FastOptions();
  options.bundled_converter_path = "/nonexistent/ffmpeg";
  auto resolver                  = f.Make(options);

  const auto status = resolver.ResolveConverter();
  assert(status.available);
  assert(status.source == ResourceSource::kSystem);
  assert(status.path == "/usr/bin/ffmpeg");
  assert(status.kind == ResourceKind::kAudioConverter);
}

void TestBundledConverterSkipsSystemSearch() {
  Fixture f;
  f.probe->bundled_path          = "/opt/app/ffmpeg";
  f.probe->system_path           = "/usr/bin/ffmpeg";
  auto options                   = FastOptions();
  options.bundled_converter_path = "/opt/app/ffmpeg";
  auto resolver                  = f.Make(options);

  const auto status = resolver.ResolveConverter();
  assert(status.available);
  assert(status.source == ResourceSource::kBundled);
  assert(f.probe->system_calls == 0);
}

void TestLateConverterIsTreatedAsAbsent() {
  Fixture f;
  f.probe->system_path      = "/usr/bin/ffmpeg";
  f.probe->delay            = std::chrono::milliseconds(80);
  auto options              = FastOptions();
  options.converter_timeout = std::chrono::milliseconds(10);
  auto resolver             = f.Make(options);

  const auto status = resolver.ResolveConverter();
  assert(!status.available);
  assert(status.source == ResourceSource::kNone);
}

void TestVoiceListingSucceedsOnThirdAttempt() {
  Fixture f;
  f.engine->failures = 2;
  auto resolver      = f.Make();

  const auto catalog = resolver.ResolveVoices();
  assert(!catalog.voices.empty());
  assert(catalog.attempts == 3);
  assert(!catalog.last_error.has_value());
  assert(catalog.status.available);
  assert(catalog.status.source == ResourceSource::kEngine);
  assert(f.engine->calls == 3);
  assert(f.classifier->Stats().total == 2);
}

void TestVoiceListingExhaustionIsCached() {
  Fixture f;
  f.engine->failures = 10;
  auto resolver      = f.Make();

  const auto catalog = resolver.ResolveVoices();
  assert(catalog.voices.empty());
  assert(catalog.attempts == 3);
  assert(catalog.last_error.has_value());
  assert(catalog.last_error->category == ErrorCategory::kEngineUnresponsive);
  assert(!catalog.status.available);

  (void)resolver.ResolveVoices();
  assert(f.engine->calls == 3);

  resolver.Clear(ResourceKind::kVoiceCatalog);
  f.engine->failures = 0;
  const auto retried = resolver.ResolveVoices();
  assert(retried.voices.size() == 2);
  assert(retried.attempts == 1);
}

void TestMissingEngineIsCritical() {
  Fixture f;
  f.engine->failures     = 10;
  f.engine->failure_code = "ENOENT";
  auto resolver          = f.Make();

  const auto catalog = resolver.ResolveVoices();
  assert(catalog.last_error->category == ErrorCategory::kVoiceUnavailable);
  assert(catalog.last_error->severity == speechmaker::model::Severity::kCritical);
  assert(catalog.attempts == 3);
}

void TestCancelledListingIsNotCached() {
  Fixture f;
  auto    resolver = f.Make();
  resolver.Cancel();

  const auto catalog = resolver.ResolveVoices();
  assert(catalog.last_error.has_value());
  assert(catalog.last_error->category == ErrorCategory::kCancelled);
  assert(catalog.attempts == 1);
  assert(!resolver.Cached(ResourceKind::kVoiceCatalog).has_value());
}

void TestClearStartsNewCacheLifetime() {
  Fixture f;
  f.probe->system_path = "/usr/bin/ffmpeg";
  auto resolver        = f.Make();

  (void)resolver.Resolve(ResourceKind::kAudioConverter);
  (void)resolver.Resolve(ResourceKind::kVoiceCatalog);
  assert(f.probe->system_calls == 1);
  assert(f.engine->calls == 1);

  resolver.Clear();
  assert(!resolver.Cached(ResourceKind::kAudioConverter).has_value());
  assert(!resolver.Cached(ResourceKind::kVoiceCatalog).has_value());

  (void)resolver.Resolve(ResourceKind::kAudioConverter);
  (void)resolver.Resolve(ResourceKind::kVoiceCatalog);
  assert(f.probe->system_calls == 2);
  assert(f.engine->calls == 2);
}

void TestConcurrentVoiceResolutionListsOnce() {
  Fixture f;
  f.engine->failures = 10;
  auto resolver      = f.Make();

  std::vector<std::thread>                          threads;
  std::vector<speechmaker::resources::VoiceCatalog> results(6);
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i] { results[i] = resolver.ResolveVoices(); });
  }
  for (auto& t : threads) t.join();

  assert(f.engine->calls == 3);
  for (const auto& catalog : results) {
    assert(catalog.attempts == 3);
    assert(catalog.last_error.has_value());
  }
}

void TestClearDuringVoiceLoadKeepsEachAttemptBudget() {
  Fixture f;
  f.engine->failures = 1 << 30;
  auto resolver      = f.Make();

  for (int round = 0; round < 50; ++round) {
    std::vector<std::thread>                          threads;
    std::vector<speechmaker::resources::VoiceCatalog> results(6);
    for (int i = 0; i < 6; ++i) {
      threads.emplace_back([&, i] {
        resolver.Clear(ResourceKind::kVoiceCatalog);
        results[i] = resolver.ResolveVoices();
      });
    }
    for (auto& t : threads) t.join();

    for (const auto& catalog : results) {
      assert(catalog.attempts == 3);
      assert(catalog.last_error->category == ErrorCategory::kEngineUnresponsive);
    }
  }
}

} // namespace

int main() {
  TestConcurrentConverterResolutionRunsOnce();
  TestSystemConverterUsedWhenBundledMissing();
  TestBundledConverterSkipsSystemSearch();
  TestLateConverterIsTreatedAsAbsent();
  TestVoiceListingSucceedsOnThirdAttempt();
  TestVoiceListingExhaustionIsCached();
  TestMissingEngineIsCritical();
  TestCancelledListingIsNotCached();
  TestClearStartsNewCacheLifetime();
  TestConcurrentVoiceResolutionListsOnce();
  TestClearDuringVoiceLoadKeepsEachAttemptBudget();

  std::cout << "speechmaker_unit_resource_resolver: pass\n";
  return 0;
}
