#include "sim/PowerUpEffect.hpp"

#include "core/Log.hpp"
#include "game/CoinManager.hpp"
#include "game/Player.hpp"

MagnetEffect::MagnetEffect(EventBus *bus, CoinManager *coins,
                           const float baseRange)
    : PowerUpEffect(bus), coins(coins), baseRange(baseRange) {}

void MagnetEffect::SetRangeMultiplier(const float multiplier) {
  if (multiplier <= 0.0f) {
    LOG_WARN("[MagnetEffect] Ignoring range multiplier {}", multiplier);
    return;
  }
  rangeMultiplier = multiplier;
  if (IsActive()) {
    Apply(false);
  }
}

void MagnetEffect::Apply(const bool firstActivation) {
  if (!coins) {
    LOG_DEBUG("[MagnetEffect] No coin manager, magnet pull skipped");
    return;
  }
  coins->EnableMagnet(&player->Position(), CurrentRange());
  if (firstActivation) {
    LOG_DEBUG("[MagnetEffect] Activated with range {:.1f}", CurrentRange());
  }
}

void MagnetEffect::Revert() {
  if (coins) {
    coins->DisableMagnet();
  }
}
