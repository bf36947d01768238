#pragma once

#include <array>
#include <string>

#include "core/Config.hpp"
#include "sim/PowerUp.hpp"
#include "sim/PowerUpEffect.hpp"

// Runtime-tunable power-up parameters. Defaults mirror cfg:: so a missing
// tuning file changes nothing.
struct PowerUpTuning {
  // Indexed by EffectIndex(type).
  std::array<float, kPowerUpEffectCount> durations = {
      cfg::kMagnetDuration, cfg::kShieldDuration, cfg::kSpeedBoostDuration,
      cfg::kStarPowerDuration, cfg::kMultiplierDuration};
  std::array<float, kPowerUpEffectCount> mysteryWeights = {
      cfg::kMysteryWeights[0], cfg::kMysteryWeights[1],
      cfg::kMysteryWeights[2], cfg::kMysteryWeights[3],
      cfg::kMysteryWeights[4]};
  float warningTime = cfg::kPowerUpWarningTime;

  float magnetRange = cfg::kMagnetRange;
  float speedBoostMultiplier = cfg::kSpeedBoostMultiplier;
  int multiplierValue = cfg::kMultiplierValue;
  StarPowerSettings starPower{};

  float DurationFor(PowerUpType type) const {
    return HasEffect(type) ? durations[EffectIndex(type)] : 0.0f;
  }
};

// Reads overrides from a JSON file. Fields that are absent keep their
// current value. On failure tuning is left untouched and false is returned.
bool LoadTuningFromFile(PowerUpTuning &tuning, const std::string &path);
