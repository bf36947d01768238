#include "sim/PowerUpTuning.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

#include "core/Log.hpp"

using json = nlohmann::json;

namespace {

constexpr int kTuningVersion = 1;

// JSON keys per effect, in EffectIndex order.
constexpr const char *kEffectKeys[kPowerUpEffectCount] = {
    "magnet", "shield", "speedBoost", "starPower", "multiplier"};

// Keeps the current value when the key is missing or not strictly positive.
float PositiveOr(const json &j, const char *key, float current) {
  const float v = j.value(key, current);
  if (v <= 0.0f) {
    LOG_WARN("[Tuning] '{}' must be positive, keeping {}", key, current);
    return current;
  }
  return v;
}

} // namespace

bool LoadTuningFromFile(PowerUpTuning &tuning, const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open tuning file: {}", path);
    return false;
  }

  PowerUpTuning t = tuning;
  try {
    json data = json::parse(f);

    const int version = data.value("version", kTuningVersion);
    if (version != kTuningVersion) {
      LOG_ERROR("Unsupported tuning version {} in {}", version, path);
      return false;
    }

    if (data.contains("durations") && data["durations"].is_object()) {
      const auto &d = data["durations"];
      for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
        t.durations[i] = PositiveOr(d, kEffectKeys[i], t.durations[i]);
      }
    }

    if (data.contains("mysteryWeights") && data["mysteryWeights"].is_object()) {
      const auto &w = data["mysteryWeights"];
      for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
        const float v = w.value(kEffectKeys[i], t.mysteryWeights[i]);
        t.mysteryWeights[i] = v < 0.0f ? 0.0f : v;
      }
    }

    t.warningTime = data.value("warningTime", t.warningTime);
    if (t.warningTime < 0.0f) {
      t.warningTime = 0.0f;
    }

    if (data.contains("magnet")) {
      t.magnetRange = PositiveOr(data["magnet"], "range", t.magnetRange);
    }
    if (data.contains("speedBoost")) {
      t.speedBoostMultiplier =
          PositiveOr(data["speedBoost"], "multiplier", t.speedBoostMultiplier);
    }
    if (data.contains("multiplier")) {
      const int v = data["multiplier"].value("value", t.multiplierValue);
      t.multiplierValue = v < 1 ? 1 : v;
    }
    if (data.contains("starPower")) {
      const auto &s = data["starPower"];
      t.starPower.flyHeight = s.value("flyHeight", t.starPower.flyHeight);
      t.starPower.transitionSpeed =
          PositiveOr(s, "transitionSpeed", t.starPower.transitionSpeed);
      t.starPower.collectRange =
          PositiveOr(s, "collectRange", t.starPower.collectRange);
    }
  } catch (const json::exception &e) {
    LOG_ERROR("JSON parse error in {}: {}", path, e.what());
    return false;
  }

  tuning = t;
  LOG_INFO("Loaded power-up tuning from {}", path);
  return true;
}
