#include "sim/PowerUpEffect.hpp"

#include "core/Log.hpp"
#include "game/ScoreManager.hpp"

MultiplierEffect::MultiplierEffect(EventBus *bus, ScoreManager *score,
                                   const int multiplierValue)
    : PowerUpEffect(bus), score(score),
      multiplierValue(multiplierValue < 1 ? 1 : multiplierValue) {}

void MultiplierEffect::SetMultiplierValue(const int value) {
  multiplierValue = value < 1 ? 1 : value;
  if (IsActive()) {
    Apply(false);
  }
}

void MultiplierEffect::Apply(const bool firstActivation) {
  if (!score) {
    LOG_DEBUG("[MultiplierEffect] No score manager, multiplier skipped");
    return;
  }
  score->SetScoreMultiplier(multiplierValue);
  if (firstActivation) {
    LOG_DEBUG("[MultiplierEffect] Activated - {}x score", multiplierValue);
  }
}

void MultiplierEffect::Revert() {
  if (score) {
    score->SetScoreMultiplier(1);
  }
}
