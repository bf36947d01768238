#include "sim/PowerUpEffect.hpp"

#include <cmath>

#include "core/Log.hpp"
#include "game/Player.hpp"

ShieldEffect::ShieldEffect(EventBus *bus) : PowerUpEffect(bus) {}

void ShieldEffect::Apply(const bool firstActivation) {
  player->SetInvincible(true);

  if (firstActivation) {
    bubble.scale = cfg::kShieldBaseScale;
    bubble.pulseTimer = 0.0f;
  }
  bubble.visible = true;
  bubble.position = player->Position();
}

void ShieldEffect::Revert() {
  if (player) {
    player->SetInvincible(false);
  }
  bubble.visible = false;
}

void ShieldEffect::Update(const float dt) {
  if (!IsActive() || !bubble.visible || player == nullptr) {
    return;
  }

  bubble.position = player->Position();
  bubble.rotationDeg =
      std::fmod(bubble.rotationDeg + cfg::kShieldRotationSpeed * dt, 360.0f);
  bubble.pulseTimer += dt * cfg::kShieldPulseSpeed;
  bubble.scale = cfg::kShieldBaseScale +
                 std::sin(bubble.pulseTimer) * cfg::kShieldPulseIntensity;
}

void ShieldEffect::OnHitAbsorbed() {
  if (!IsActive()) {
    return;
  }
  ++hitsAbsorbed;
  LOG_INFO("[ShieldEffect] Absorbed a hit");
}
