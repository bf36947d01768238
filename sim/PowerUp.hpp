#pragma once

#include <cstddef>

#include <raylib.h>

// Collectible power-up kinds. Values are stable: they are used as array
// indices and in saved/serialized data.
enum class PowerUpType : int {
  Magnet = 0,
  Shield = 1,
  SpeedBoost = 2,
  StarPower = 3,
  Multiplier = 4,
  MysteryBox = 5  // Resolves to one of the above on pickup
};

constexpr size_t kPowerUpEffectCount = 5;

// A power-up pickup placed on the track.
struct PowerUpPickup {
  Vector3 position{};
  PowerUpType type = PowerUpType::Magnet;
  bool active = true;
};

const char *GetPowerUpName(PowerUpType type);
const char *GetPowerUpDescription(PowerUpType type);

// True for types that map to a concrete effect (everything but MysteryBox).
inline bool HasEffect(PowerUpType type) {
  const int v = static_cast<int>(type);
  return v >= 0 && v < static_cast<int>(kPowerUpEffectCount);
}

inline size_t EffectIndex(PowerUpType type) {
  return static_cast<size_t>(type);
}
