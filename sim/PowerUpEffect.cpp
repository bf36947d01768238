#include "sim/PowerUpEffect.hpp"

#include "core/Log.hpp"
#include "events/EventBus.hpp"
#include "game/Player.hpp"

void PowerUpEffect::Activate(Player *target) {
  if (target == nullptr) {
    LOG_DEBUG("[{}] Activate skipped: no player", GetPowerUpName(Type()));
    return;
  }

  // Handing an active effect to a different player moves it over cleanly.
  if (active && target != player) {
    Revert();
    active = false;
  }

  const bool firstActivation = !active;
  player = target;
  active = true;
  Apply(firstActivation);

  if (firstActivation && bus) {
    bus->Publish(GameEvent::PowerUpActivated, Type());
  }
}

void PowerUpEffect::Deactivate() {
  if (!active) {
    return;
  }
  active = false;
  Revert();

  if (bus) {
    bus->Publish(GameEvent::PowerUpDeactivated, Type());
  }
}
