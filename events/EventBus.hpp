#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "events/GameEvents.hpp"

using EventHandler = std::function<void(const EventPayload &)>;
using SubscriptionId = uint32_t;

constexpr SubscriptionId kInvalidSubscription = 0u;

// Synchronous, single-threaded publish/subscribe hub for gameplay events.
//
// One bus lives per session: Init() when the match begins, Teardown() when
// it ends. Handlers run on the publishing thread, in registration order.
// Publish() iterates a snapshot of the subscriber list, so handlers may
// publish, subscribe or unsubscribe (themselves included) while a dispatch
// is in flight. A handler removed mid-dispatch still sees that event.
class EventBus {
public:
  EventBus() = default;
  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  void Init();
  void Teardown();
  bool IsLive() const { return live; }

  SubscriptionId Subscribe(GameEvent event, EventHandler handler);

  // Handler receives the payload only when it holds a T.
  template <typename T>
  SubscriptionId SubscribeTo(GameEvent event,
                             std::function<void(const T &)> handler) {
    return Subscribe(event, [fn = std::move(handler)](const EventPayload &p) {
      if (const T *value = std::get_if<T>(&p)) {
        fn(*value);
      }
    });
  }

  // Unknown ids are ignored.
  void Unsubscribe(GameEvent event, SubscriptionId id);

  void Publish(GameEvent event, const EventPayload &payload = {});

  void ClearAll();

  size_t SubscriberCount(GameEvent event) const;
  size_t TotalSubscriberCount() const;

private:
  struct Subscriber {
    SubscriptionId id = kInvalidSubscription;
    EventHandler handler;
  };
  using SubscriberList = std::vector<std::shared_ptr<const Subscriber>>;

  static size_t Slot(GameEvent event) { return static_cast<size_t>(event); }
  static bool IsValid(GameEvent event) {
    return static_cast<size_t>(event) < kGameEventCount;
  }

  std::array<SubscriberList, kGameEventCount> subscribers{};
  SubscriptionId nextId = 1u;
  bool live = false;
};
