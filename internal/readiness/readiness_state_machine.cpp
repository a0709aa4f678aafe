#include "readiness_state_machine.hpp"

#include "internal/observability/logging.hpp"

namespace speechmaker::readiness {

std::string_view ToString(Topic topic) {
  switch (topic) {
    case Topic::kInitialization:
      return "initialization";
    case Topic::kVoice:
      return "voice";
    case Topic::kConverter:
      return "converter";
    case Topic::kOutputFolder:
      return "outputFolder";
    case Topic::kAction:
      return "action";
  }
  return "unknown";
}

ReadinessStateMachine::SubscriptionId ReadinessStateMachine::Subscribe(Topic topic, Observer observer) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  subscriptions_.emplace(id, Subscription{topic, std::move(observer)});
  return id;
}

bool ReadinessStateMachine::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  return subscriptions_.erase(id) > 0;
}

void ReadinessStateMachine::Recompute() {
  state_.ready = ComputeReady(state_.initializing, state_.voices_loaded, state_.output_folder_set,
                              !state_.default_output_folder.empty());
  state_.mp3_available = state_.converter.has_value() && state_.converter->available;
}

template <typename Mutate>
void ReadinessStateMachine::Update(Topic topic, Mutate&& mutate) {
  ReadinessSnapshot snapshot;
  bool              flipped = false;
  {
    std::lock_guard lock(mutex_);
    const bool      was_ready = state_.ready;
    mutate(state_);
    Recompute();
    ++state_.sequence;
    flipped  = was_ready != state_.ready;
    snapshot = state_;
  }

  std::lock_guard notify_lock(notify_mutex_);
  Notify(topic, snapshot);
  if (flipped) {
    SPEECHMAKER_LOG_INFO("readiness changed", {observability::BoolField("ready", snapshot.ready),
                                               observability::StringField("cause", ToString(topic))});
    if (topic != Topic::kAction) {
      Notify(Topic::kAction, snapshot);
    }
  }
}

void ReadinessStateMachine::Notify(Topic topic, const ReadinessSnapshot& snapshot) {
  std::vector<std::pair<SubscriptionId, Observer>> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, sub] : subscriptions_) {
      if (sub.topic == topic) {
        targets.emplace_back(id, sub.observer);
      }
    }
  }

  for (const auto& [id, observer] : targets) {
    {
      // an observer may have unsubscribed or been handed a newer snapshot meanwhile
      std::lock_guard lock(mutex_);
      const auto      it = subscriptions_.find(id);
      if (it == subscriptions_.end() || it->second.delivered >= snapshot.sequence) {
        continue;
      }
      it->second.delivered = snapshot.sequence;
    }

    try {
      observer(topic, snapshot);
    } catch (const std::exception& e) {
      SPEECHMAKER_LOG_ERROR("readiness observer failed",
                            {observability::StringField("topic", ToString(topic)),
                             observability::IntField("subscription", static_cast<std::int64_t>(id)),
                             observability::StringField("error", e.what())});
    } catch (...) {
      SPEECHMAKER_LOG_ERROR("readiness observer failed",
                            {observability::StringField("topic", ToString(topic)),
                             observability::IntField("subscription", static_cast<std::int64_t>(id)),
                             observability::StringField("error", "unknown exception")});
    }
  }
}

void ReadinessStateMachine::SetInitializing(bool initializing) {
  Update(Topic::kInitialization, [&](ReadinessSnapshot& s) { s.initializing = initializing; });
}

void ReadinessStateMachine::SetVoices(bool loaded, std::vector<model::Voice> voices, std::uint32_t attempts,
                                      std::optional<model::ErrorRecord> error) {
  Update(Topic::kVoice, [&](ReadinessSnapshot& s) {
    s.voices_loaded       = loaded;
    s.voices              = std::move(voices);
    s.voice_load_attempts = attempts;
    s.voice_load_error    = std::move(error);
  });
}

void ReadinessStateMachine::SetConverterStatus(const model::ResourceStatus& status) {
  Update(Topic::kConverter, [&](ReadinessSnapshot& s) { s.converter = status; });
}

void ReadinessStateMachine::SetOutputFolder(std::string folder) {
  Update(Topic::kOutputFolder, [&](ReadinessSnapshot& s) {
    s.output_folder_set = !folder.empty();
    s.output_folder     = std::move(folder);
  });
}

void ReadinessStateMachine::SetDefaultOutputFolder(std::string folder) {
  Update(Topic::kOutputFolder, [&](ReadinessSnapshot& s) { s.default_output_folder = std::move(folder); });
}

ReadinessSnapshot ReadinessStateMachine::Snapshot() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool ReadinessStateMachine::IsReady() const {
  std::lock_guard lock(mutex_);
  return state_.ready;
}

} // namespace speechmaker::readiness
