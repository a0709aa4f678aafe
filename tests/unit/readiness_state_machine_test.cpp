#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/readiness/readiness_state_machine.hpp"

namespace {

using speechmaker::readiness::ComputeReady;
using speechmaker::readiness::ReadinessSnapshot;
using speechmaker::readiness::ReadinessStateMachine;
using speechmaker::readiness::Topic;

std::vector<speechmaker::model::Voice> OneVoice() {
  return {speechmaker::model::Voice{"en-US-AriaNeural", "Aria", "en-US", "Female", true}};
}

void TestReadyForAllCombinations() {
  for (int mask = 0; mask < 16; ++mask) {
    const bool initializing   = mask & 1;
    const bool voices_loaded  = mask & 2;
    const bool folder_set     = mask & 4;
    const bool default_folder = mask & 8;

    ReadinessStateMachine machine;
    machine.SetInitializing(initializing);
    machine.SetVoices(voices_loaded, voices_loaded ? OneVoice() : std::vector<speechmaker::model::Voice>{}, 1,
                      std::nullopt);
    machine.SetOutputFolder(folder_set ? "/data/out" : "");
    machine.SetDefaultOutputFolder(default_folder ? "/home/u/SpeechMaker" : "");

    const bool expected = !initializing && voices_loaded && (folder_set || default_folder);
    assert(machine.IsReady() == expected);
    assert(machine.Snapshot().ready == expected);
    assert(ComputeReady(initializing, voices_loaded, folder_set, default_folder) == expected);
  }
}

void TestStartsInitializingAndNotReady() {
  ReadinessStateMachine machine;
  const auto            snapshot = machine.Snapshot();
  assert(snapshot.initializing);
  assert(!snapshot.ready);
  assert(!snapshot.mp3_available);
}

void TestConverterGatesMp3NotReadiness() {
  ReadinessStateMachine machine;
  machine.SetDefaultOutputFolder("/home/u/SpeechMaker");
  machine.SetVoices(true, OneVoice(), 1, std::nullopt);
  machine.SetInitializing(false);
  assert(machine.IsReady());

  speechmaker::model::ResourceStatus missing;
  machine.SetConverterStatus(missing);
  assert(machine.IsReady());
  assert(!machine.Snapshot().mp3_available);

  speechmaker::model::ResourceStatus found;
  found.available = true;
  found.source    = speechmaker::model::ResourceSource::kSystem;
  found.path      = "/usr/bin/ffmpeg";
  machine.SetConverterStatus(found);
  assert(machine.IsReady());
  assert(machine.Snapshot().mp3_available);
}

void TestEffectiveOutputFolderPrefersUserChoice() {
  ReadinessStateMachine machine;
  machine.SetDefaultOutputFolder("/home/u/SpeechMaker");
  assert(machine.Snapshot().EffectiveOutputFolder() == "/home/u/SpeechMaker");

  machine.SetOutputFolder("/data/out");
  assert(machine.Snapshot().EffectiveOutputFolder() == "/data/out");

  machine.SetOutputFolder("");
  assert(!machine.Snapshot().output_folder_set);
  assert(machine.Snapshot().EffectiveOutputFolder() == "/home/u/SpeechMaker");
}

void TestObserversReceiveTheirTopicAndActionOnFlip() {
  ReadinessStateMachine    machine;
  std::vector<std::string> events;

  machine.Subscribe(Topic::kVoice, [&](Topic topic, const ReadinessSnapshot& s) {
    events.push_back(std::string(ToString(topic)) + ":" + std::to_string(s.voices.size()));
  });
  machine.Subscribe(Topic::kAction, [&](Topic topic, const ReadinessSnapshot& s) {
    events.push_back(std::string(ToString(topic)) + ":" + (s.ready ? "ready" : "blocked"));
  });

  machine.SetDefaultOutputFolder("/tmp/out");
  machine.SetInitializing(false);
  assert(events.empty());

  machine.SetVoices(true, OneVoice(), 1, std::nullopt);
  assert((events == std::vector<std::string>{"voice:1", "action:ready"}));

  // no flip, no action event
  machine.SetConverterStatus(speechmaker::model::ResourceStatus{});
  assert(events.size() == 2);

  machine.SetInitializing(true);
  assert(events.back() == "action:blocked");
}

void TestThrowingObserverDoesNotStopOthers() {
  ReadinessStateMachine machine;
  int                   calls = 0;

  machine.Subscribe(Topic::kOutputFolder, [](Topic, const ReadinessSnapshot&) {
    throw std::runtime_error("observer failure");
  });
  machine.Subscribe(Topic::kOutputFolder, [&](Topic, const ReadinessSnapshot&) { ++calls; });

  machine.SetOutputFolder("/data/out");
  assert(calls == 1);
  assert(machine.Snapshot().output_folder == "/data/out");
}

void TestObserverThrowingNonStdExceptionIsContained() {
  ReadinessStateMachine machine;
  int                   calls = 0;

  machine.Subscribe(Topic::kConverter, [](Topic, const ReadinessSnapshot&) { throw 42; });
  machine.Subscribe(Topic::kConverter, [&](Topic, const ReadinessSnapshot&) { ++calls; });

  machine.SetConverterStatus(speechmaker::model::ResourceStatus{});
  machine.SetConverterStatus(speechmaker::model::ResourceStatus{});
  assert(calls == 2);
}

void TestSequenceAdvancesWithEveryChange() {
  ReadinessStateMachine machine;
  assert(machine.Snapshot().sequence == 0);

  machine.SetOutputFolder("/data/out");
  machine.SetConverterStatus(speechmaker::model::ResourceStatus{});
  assert(machine.Snapshot().sequence == 2);
}

void TestConcurrentUpdatesAreDeliveredInOrder() {
  ReadinessStateMachine machine;

  // observers are serialized, so plain locals are safe here
  std::uint64_t last           = 0;
  bool          in_order       = true;
  int           in_flight      = 0;
  bool          overlapped     = false;
  std::uint64_t final_delivery = 0;

  machine.Subscribe(Topic::kOutputFolder, [&](Topic, const ReadinessSnapshot& s) {
    overlapped = overlapped || ++in_flight > 1;
    in_order   = in_order && s.sequence > last;
    last       = s.sequence;
    std::this_thread::yield();
    --in_flight;
  });
  machine.Subscribe(Topic::kOutputFolder, [&](Topic, const ReadinessSnapshot& s) { final_delivery = s.sequence; });

  constexpr int            kThreads = 8;
  constexpr int            kUpdates = 200;
  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      for (int i = 0; i < kUpdates; ++i) {
        machine.SetOutputFolder("/data/out/" + std::to_string(t) + "/" + std::to_string(i));
      }
    });
  }
  go = true;
  for (auto& thread : threads) {
    thread.join();
  }

  assert(in_order);
  assert(!overlapped);
  assert(last == machine.Snapshot().sequence);
  assert(final_delivery == machine.Snapshot().sequence);
}

void TestObserverMayChangeStateDuringDelivery() {
  ReadinessStateMachine      machine;
  std::vector<std::uint64_t> seen;

  machine.Subscribe(Topic::kOutputFolder, [&](Topic, const ReadinessSnapshot& s) {
    if (s.output_folder == "/data/first") {
      machine.SetOutputFolder("/data/second");
    }
  });
  machine.Subscribe(Topic::kOutputFolder, [&](Topic, const ReadinessSnapshot& s) { seen.push_back(s.sequence); });

  machine.SetOutputFolder("/data/first");

  // the nested change reached the second observer first; the older snapshot is skipped
  assert((seen == std::vector<std::uint64_t>{2}));
  assert(machine.Snapshot().output_folder == "/data/second");
}

void TestUnsubscribeStopsNotifications() {
  ReadinessStateMachine machine;
  int                   calls = 0;
  const auto id = machine.Subscribe(Topic::kConverter, [&](Topic, const ReadinessSnapshot&) { ++calls; });

  machine.SetConverterStatus(speechmaker::model::ResourceStatus{});
  assert(calls == 1);
  assert(machine.Unsubscribe(id));
  assert(!machine.Unsubscribe(id));

  machine.SetConverterStatus(speechmaker::model::ResourceStatus{});
  assert(calls == 1);
}

void TestObserverMayReadStateWithoutDeadlock() {
  ReadinessStateMachine machine;
  bool                  seen_ready = false;
  machine.Subscribe(Topic::kAction, [&](Topic, const ReadinessSnapshot&) { seen_ready = machine.IsReady(); });

  machine.SetDefaultOutputFolder("/tmp/out");
  machine.SetVoices(true, OneVoice(), 1, std::nullopt);
  machine.SetInitializing(false);
  assert(seen_ready);
}

} // namespace

int main() {
  TestReadyForAllCombinations();
  TestStartsInitializingAndNotReady();
  TestConverterGatesMp3NotReadiness();
  TestEffectiveOutputFolderPrefersUserChoice();
  TestObserversReceiveTheirTopicAndActionOnFlip();
  TestThrowingObserverDoesNotStopOthers();
  TestObserverThrowingNonStdExceptionIsContained();
  TestSequenceAdvancesWithEveryChange();
  TestConcurrentUpdatesAreDeliveredInOrder();
  TestObserverMayChangeStateDuringDelivery();
  TestUnsubscribeStopsNotifications();
  TestObserverMayReadStateWithoutDeadlock();

  std::cout << "speechmaker_unit_readiness_state_machine: pass\n";
  return 0;
}
