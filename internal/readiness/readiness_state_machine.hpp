#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/error_record.hpp"
#include "internal/model/resource_status.hpp"
#include "internal/model/voice.hpp"

namespace speechmaker::readiness {

enum class Topic {
  kInitialization,
  kVoice,
  kConverter,
  kOutputFolder,
  kAction,
};

std::string_view ToString(Topic topic);

struct ReadinessSnapshot {
  // Increases by one with every committed change.
  std::uint64_t sequence = 0;

  bool ready        = false;
  bool initializing = true;

  bool                              voices_loaded = false;
  std::vector<model::Voice>         voices;
  std::uint32_t                     voice_load_attempts = 0;
  std::optional<model::ErrorRecord> voice_load_error;

  std::optional<model::ResourceStatus> converter;
  bool                                 mp3_available = false;

  bool        output_folder_set = false;
  std::string output_folder;
  std::string default_output_folder;

  // Folder a conversion should write to, or empty.
  const std::string& EffectiveOutputFolder() const {
    return output_folder_set ? output_folder : default_output_folder;
  }
};

// ready = !initializing && voices_loaded && (output_folder_set || has_default_folder)
constexpr bool ComputeReady(bool initializing, bool voices_loaded, bool output_folder_set, bool has_default_folder) {
  return !initializing && voices_loaded && (output_folder_set || has_default_folder);
}

/*
  ReadinessStateMachine

  Aggregates independently arriving facts into one readiness signal.

  Each setter recomputes `ready` and notifies the observers of its topic;
  observers of Topic::kAction are additionally notified whenever `ready`
  flips. Observers run outside the state lock, each in isolation: a
  throwing observer is logged and the others are still called.

  Deliveries are serialized, and an observer never sees a snapshot older
  than one it has already received; a stale snapshot is skipped for that
  subscription. Observers may call back into the machine.

  The audio converter only gates MP3 selection, never readiness.
*/
class ReadinessStateMachine {
 public:
  using Observer       = std::function<void(Topic, const ReadinessSnapshot&)>;
  using SubscriptionId = std::uint64_t;

  SubscriptionId Subscribe(Topic topic, Observer observer);
  bool           Unsubscribe(SubscriptionId id);

  void SetInitializing(bool initializing);
  void SetVoices(bool loaded, std::vector<model::Voice> voices, std::uint32_t attempts,
                 std::optional<model::ErrorRecord> error);
  void SetConverterStatus(const model::ResourceStatus& status);

  // Empty clears the user choice.
  void SetOutputFolder(std::string folder);
  // Empty means no fallback folder.
  void SetDefaultOutputFolder(std::string folder);

  ReadinessSnapshot Snapshot() const;
  bool              IsReady() const;

 private:
  struct Subscription {
    Topic         topic;
    Observer      observer;
    std::uint64_t delivered = 0;
  };

  // Runs `mutate` under the lock, then notifies `topic` (and kAction on a flip).
  template <typename Mutate>
  void Update(Topic topic, Mutate&& mutate);

  void Notify(Topic topic, const ReadinessSnapshot& snapshot);
  void Recompute();

  mutable std::mutex                     mutex_;
  std::recursive_mutex                   notify_mutex_;
  ReadinessSnapshot                      state_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  SubscriptionId                         next_id_ = 1;
};

} // namespace speechmaker::readiness
