#include "game/CoinManager.hpp"

#include <algorithm>

#include "core/Log.hpp"
#include "core/MathUtils.hpp"
#include "events/EventBus.hpp"

namespace {
constexpr float kCoinDespawnDistance = 50.0f; // behind the player
}

CoinManager::CoinManager(EventBus *bus) : bus(bus) {}

CoinId CoinManager::SpawnCoin(const Vector3 &position, const int value) {
  Coin coin{};
  coin.id = nextId++;
  coin.position = position;
  coin.value = value > 0 ? value : cfg::kRegularCoinValue;
  coins.push_back(coin);
  return coin.id;
}

void CoinManager::RemoveCoin(const CoinId id) {
  coins.erase(std::remove_if(coins.begin(), coins.end(),
                             [id](const Coin &c) { return c.id == id; }),
              coins.end());
}

void CoinManager::Clear() {
  coins.clear();
  collectedValue = 0;
  DisableMagnet();
}

void CoinManager::EnableMagnet(const Vector3 *anchor, const float radius) {
  if (anchor == nullptr || radius <= 0.0f) {
    LOG_WARN("[CoinManager] Invalid magnet request (anchor={}, radius={})",
             anchor != nullptr, radius);
    DisableMagnet();
    return;
  }
  magnetActive = true;
  magnetAnchor = anchor;
  magnetRange = radius;
  // Scan on the very next update rather than waiting a full interval.
  scanTimer = 0.0f;
  LOG_DEBUG("[CoinManager] Magnet enabled - Range: {:.1f}", radius);
}

void CoinManager::DisableMagnet() {
  if (!magnetActive && magnetAnchor == nullptr) {
    return;
  }
  magnetActive = false;
  magnetAnchor = nullptr;
  magnetRange = 0.0f;
  for (auto &coin : coins) {
    coin.attracted = false;
  }
  LOG_DEBUG("[CoinManager] Magnet disabled");
}

void CoinManager::Update(const float dt, const Vector3 &playerPosition) {
  if (magnetActive) {
    scanTimer -= dt;
    if (scanTimer <= 0.0f) {
      scanTimer = cfg::kMagnetUpdateInterval;
      ScanForAttraction();
    }

    const float step = cfg::kCoinAttractSpeed * dt;
    for (auto &coin : coins) {
      if (coin.attracted && !coin.collected) {
        coin.position = mathx::MoveToward(coin.position, *magnetAnchor, step);
      }
    }
  }

  CollectAndCull(playerPosition);
}

void CoinManager::ScanForAttraction() {
  const Vector3 &anchor = *magnetAnchor;
  for (auto &coin : coins) {
    if (coin.collected || coin.attracted) {
      continue;
    }
    if (mathx::Distance(coin.position, anchor) <= magnetRange) {
      coin.attracted = true;
    }
  }
}

void CoinManager::CollectAndCull(const Vector3 &playerPosition) {
  std::vector<int> pickedUp;
  for (auto &coin : coins) {
    if (coin.collected) {
      continue;
    }
    if (mathx::Distance(coin.position, playerPosition) <=
        cfg::kCoinPickupRadius) {
      coin.collected = true;
      collectedValue += coin.value;
      pickedUp.push_back(coin.value);
    }
  }

  const float cullZ = playerPosition.z - kCoinDespawnDistance;
  coins.erase(std::remove_if(coins.begin(), coins.end(),
                             [cullZ](const Coin &c) {
                               return c.collected || c.position.z < cullZ;
                             }),
              coins.end());

  // Published after the list settles: handlers may spawn or remove coins.
  if (bus) {
    for (const int value : pickedUp) {
      bus->Publish(GameEvent::CoinsCollected, value);
    }
  }
}

size_t CoinManager::ActiveCoinCount() const {
  return static_cast<size_t>(
      std::count_if(coins.begin(), coins.end(),
                    [](const Coin &c) { return !c.collected; }));
}

size_t CoinManager::AttractedCoinCount() const {
  return static_cast<size_t>(
      std::count_if(coins.begin(), coins.end(), [](const Coin &c) {
        return c.attracted && !c.collected;
      }));
}

std::vector<CoinId> CoinManager::CoinsInRange(const Vector3 &position,
                                              const float range) const {
  std::vector<CoinId> result;
  for (const auto &coin : coins) {
    if (!coin.collected && mathx::Distance(coin.position, position) <= range) {
      result.push_back(coin.id);
    }
  }
  return result;
}

const Coin *CoinManager::FindCoin(const CoinId id) const {
  for (const auto &coin : coins) {
    if (coin.id == id) {
      return &coin;
    }
  }
  return nullptr;
}
