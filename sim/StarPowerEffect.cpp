#include "sim/PowerUpEffect.hpp"

#include "core/Log.hpp"
#include "core/MathUtils.hpp"
#include "game/CoinManager.hpp"
#include "game/Player.hpp"

StarPowerEffect::StarPowerEffect(EventBus *bus, CoinManager *coins,
                                 const StarPowerSettings &settings)
    : PowerUpEffect(bus), coins(coins), settings(settings) {}

void StarPowerEffect::Apply(const bool firstActivation) {
  // Re-applying mid-flight keeps the first ground reference.
  if (firstActivation) {
    startAltitude = player->Position().y;
    currentHeight = startAltitude;
    player->BeginFlight();
  }
  player->SetInvincible(true);

  if (coins) {
    coins->EnableMagnet(&player->Position(), settings.collectRange);
  } else {
    LOG_DEBUG("[StarPowerEffect] No coin manager, mega-magnet skipped");
  }
}

void StarPowerEffect::Revert() {
  if (player) {
    player->SetInvincible(false);
    player->EndFlight();
    player->SetAltitude(startAltitude);
  }
  if (coins) {
    coins->DisableMagnet();
  }
  currentHeight = startAltitude;
}

void StarPowerEffect::Update(const float dt) {
  if (!IsActive() || player == nullptr) {
    return;
  }
  const float t = mathx::Clamp01(settings.transitionSpeed * dt);
  currentHeight = mathx::Lerp(currentHeight, TargetHeight(), t);
  player->SetAltitude(currentHeight);
}
