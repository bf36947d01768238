#include "events/EventBus.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "core/Log.hpp"

namespace {

// Events worth a line in the log. Per-frame traffic (PlayerMoved,
// ScoreChanged, ...) stays quiet.
bool IsLoggedEvent(GameEvent event) {
  switch (event) {
  case GameEvent::PowerUpActivated:
  case GameEvent::PowerUpDeactivated:
  case GameEvent::PlayerCrashed:
  case GameEvent::GameStarted:
  case GameEvent::GamePaused:
  case GameEvent::GameResumed:
  case GameEvent::GameOver:
  case GameEvent::ThemeChanged:
  case GameEvent::ThemeSelected:
    return true;
  default:
    return false;
  }
}

std::string DescribePayload(const EventPayload &payload) {
  if (const auto *type = std::get_if<PowerUpType>(&payload)) {
    return GetPowerUpName(*type);
  }
  if (const auto *theme = std::get_if<ThemeType>(&payload)) {
    return GetThemeName(*theme);
  }
  if (const auto *data = std::get_if<GameOverData>(&payload)) {
    return data->Describe() +
           (data->IsHighScore() ? " (new high score)" : "");
  }
  if (const auto *value = std::get_if<int>(&payload)) {
    return std::to_string(*value);
  }
  if (const auto *text = std::get_if<std::string>(&payload)) {
    return *text;
  }
  return {};
}

} // namespace

void EventBus::Init() {
  live = true;
  LOG_DEBUG("[EventBus] Initialized ({} existing subscribers)",
            TotalSubscriberCount());
}

void EventBus::Teardown() {
  ClearAll();
  live = false;
  LOG_DEBUG("[EventBus] Torn down");
}

SubscriptionId EventBus::Subscribe(GameEvent event, EventHandler handler) {
  if (!IsValid(event) || !handler) {
    LOG_WARN("[EventBus] Rejected subscription to {}", GetGameEventName(event));
    return kInvalidSubscription;
  }

  auto subscriber = std::make_shared<Subscriber>();
  subscriber->id = nextId++;
  subscriber->handler = std::move(handler);
  const SubscriptionId id = subscriber->id;
  subscribers[Slot(event)].push_back(std::move(subscriber));
  return id;
}

void EventBus::Unsubscribe(GameEvent event, SubscriptionId id) {
  if (!IsValid(event) || id == kInvalidSubscription) {
    return;
  }
  auto &list = subscribers[Slot(event)];
  list.erase(std::remove_if(list.begin(), list.end(),
                            [id](const std::shared_ptr<const Subscriber> &s) {
                              return s->id == id;
                            }),
             list.end());
}

void EventBus::Publish(GameEvent event, const EventPayload &payload) {
  if (!IsValid(event)) {
    return;
  }

  if (IsLoggedEvent(event)) {
    const std::string detail = DescribePayload(payload);
    if (detail.empty()) {
      LOG_INFO("[GameEvents] {}", GetGameEventName(event));
    } else {
      LOG_INFO("[GameEvents] {}: {}", GetGameEventName(event), detail);
    }
  }

  // Copy of shared pointers; handlers can mutate the live list freely.
  const SubscriberList snapshot = subscribers[Slot(event)];
  for (const auto &subscriber : snapshot) {
    try {
      subscriber->handler(payload);
    } catch (const std::exception &e) {
      LOG_ERROR("[EventBus] Handler {} for {} threw: {}", subscriber->id,
                GetGameEventName(event), e.what());
    } catch (...) {
      LOG_ERROR("[EventBus] Handler {} for {} threw a non-standard exception",
                subscriber->id, GetGameEventName(event));
    }
  }
}

void EventBus::ClearAll() {
  for (auto &list : subscribers) {
    list.clear();
  }
  LOG_DEBUG("[EventBus] All events cleared");
}

size_t EventBus::SubscriberCount(GameEvent event) const {
  if (!IsValid(event)) {
    return 0;
  }
  return subscribers[Slot(event)].size();
}

size_t EventBus::TotalSubscriberCount() const {
  size_t total = 0;
  for (const auto &list : subscribers) {
    total += list.size();
  }
  return total;
}
