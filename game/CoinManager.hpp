#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <raylib.h>

#include "core/Config.hpp"

class EventBus;

using CoinId = uint32_t;

struct Coin {
  CoinId id = 0u;
  Vector3 position{};
  int value = cfg::kRegularCoinValue;
  bool collected = false;
  bool attracted = false; // flying toward the magnet anchor
};

// Tracks live coins, drives the magnet pull and reports pickups through
// CoinsCollected events.
class CoinManager {
public:
  explicit CoinManager(EventBus *bus = nullptr);

  CoinId SpawnCoin(const Vector3 &position, int value = cfg::kRegularCoinValue);
  void RemoveCoin(CoinId id);
  void Clear();

  // anchor must outlive the magnet (normally the player's position).
  // A null anchor or non-positive radius disables the magnet instead.
  void EnableMagnet(const Vector3 *anchor, float radius);
  void DisableMagnet();
  bool IsMagnetActive() const { return magnetActive; }
  float MagnetRange() const { return magnetActive ? magnetRange : 0.0f; }
  const Vector3 *MagnetAnchor() const { return magnetAnchor; }

  // Advances attraction and collects coins touching the player.
  void Update(float dt, const Vector3 &playerPosition);

  size_t ActiveCoinCount() const;
  size_t AttractedCoinCount() const;
  std::vector<CoinId> CoinsInRange(const Vector3 &position, float range) const;
  const Coin *FindCoin(CoinId id) const;
  int CollectedValue() const { return collectedValue; }

private:
  void ScanForAttraction();
  void CollectAndCull(const Vector3 &playerPosition);

  EventBus *bus = nullptr;
  std::vector<Coin> coins;
  CoinId nextId = 1u;

  bool magnetActive = false;
  const Vector3 *magnetAnchor = nullptr;
  float magnetRange = 0.0f;
  float scanTimer = 0.0f;

  int collectedValue = 0;
};
