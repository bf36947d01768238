#include "sim/PowerUpEffect.hpp"

#include "core/Log.hpp"
#include "game/Player.hpp"

SpeedBoostEffect::SpeedBoostEffect(EventBus *bus, const float speedMultiplier)
    : PowerUpEffect(bus), speedMultiplier(speedMultiplier) {}

void SpeedBoostEffect::SetSpeedMultiplier(const float multiplier) {
  if (multiplier <= 0.0f) {
    LOG_WARN("[SpeedBoostEffect] Ignoring speed multiplier {}", multiplier);
    return;
  }
  speedMultiplier = multiplier;
  if (IsActive()) {
    Apply(false);
  }
}

void SpeedBoostEffect::Apply(const bool firstActivation) {
  player->SetSpeedMultiplier(speedMultiplier);
  player->SetInvincible(true);
  if (firstActivation) {
    LOG_DEBUG("[SpeedBoostEffect] Activated with {:.1f}x speed",
              speedMultiplier);
  }
}

// Speed is left alone: it eases back to normal through the player's decay.
void SpeedBoostEffect::Revert() {
  if (player) {
    player->SetInvincible(false);
  }
}

void SpeedBoostEffect::Update(const float dt) {
  (void)dt;
  if (!IsActive() || player == nullptr) {
    return;
  }
  // Hold the boost against the player's per-tick decay.
  player->SetSpeedMultiplier(speedMultiplier);
}
