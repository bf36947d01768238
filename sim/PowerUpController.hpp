#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "events/EventBus.hpp"
#include "sim/PowerUp.hpp"
#include "sim/PowerUpEffect.hpp"
#include "sim/PowerUpTuning.hpp"

class CoinManager;
class Player;
class ScoreManager;

// Owns one instance of every effect and runs their timers. At most one
// effect is active at a time: activating a different type first shuts the
// current one down.
class PowerUpController {
public:
  // normalizedRemaining is remaining / duration, in [0, 1].
  using TimeListener =
      std::function<void(PowerUpType type, float normalizedRemaining)>;
  using WarningListener = std::function<void(PowerUpType type)>;

  // rngState drives mystery box rolls; when null the controller keeps a
  // private fixed-seed state.
  PowerUpController(EventBus *bus, Player *player, CoinManager *coins,
                    ScoreManager *score, const PowerUpTuning &tuning = {},
                    uint32_t *rngState = nullptr);
  ~PowerUpController();
  PowerUpController(const PowerUpController &) = delete;
  PowerUpController &operator=(const PowerUpController &) = delete;

  // Pickup entry point. Resolves MysteryBox, activates, and returns the
  // type that was actually applied.
  PowerUpType Collect(PowerUpType type);
  PowerUpType RollMysteryBox();

  bool Activate(PowerUpType type);
  bool Activate(PowerUpType type, float duration);
  void Deactivate(PowerUpType type);
  void DeactivateAll();

  void Update(float dt);

  // Returns true when the hit was absorbed by an active effect.
  bool HandleObstacleHit();

  bool IsActive(PowerUpType type) const;
  std::optional<PowerUpType> ActiveType() const;
  float RemainingTime(PowerUpType type) const;
  size_t ActiveCount() const;
  bool IsWarning() const;
  int TotalActivations() const { return totalActivations; }

  // Character abilities.
  void SetDurationMultiplier(float multiplier);
  float DurationMultiplier() const { return durationMultiplier; }
  void SetMagnetRangeMultiplier(float multiplier);

  void SetTimeListener(TimeListener listener) {
    timeListener = std::move(listener);
  }
  void SetWarningListener(WarningListener listener) {
    warningListener = std::move(listener);
  }

  const PowerUpTuning &Tuning() const { return tuning; }
  // Null for MysteryBox and out-of-range values; resolve the box first.
  PowerUpEffect *Effect(PowerUpType type);
  const PowerUpEffect *Effect(PowerUpType type) const;
  MagnetEffect &Magnet() { return *magnet; }
  ShieldEffect &Shield() { return *shield; }
  SpeedBoostEffect &SpeedBoost() { return *speedBoost; }
  StarPowerEffect &StarPower() { return *starPower; }
  MultiplierEffect &Multiplier() { return *multiplier; }

private:
  struct Timer {
    float duration = 0.0f;
    float remaining = 0.0f;
    bool warned = false;
  };

  EventBus *bus = nullptr;
  Player *player = nullptr;
  PowerUpTuning tuning{};
  uint32_t ownRng = 0x2545F491u;
  uint32_t *rng = nullptr;

  // Typed views into effects[]; the array owns them.
  MagnetEffect *magnet = nullptr;
  ShieldEffect *shield = nullptr;
  SpeedBoostEffect *speedBoost = nullptr;
  StarPowerEffect *starPower = nullptr;
  MultiplierEffect *multiplier = nullptr;
  std::array<std::unique_ptr<PowerUpEffect>, kPowerUpEffectCount> effects{};
  std::array<Timer, kPowerUpEffectCount> timers{};

  float durationMultiplier = 1.0f;
  int totalActivations = 0;

  TimeListener timeListener;
  WarningListener warningListener;

  SubscriptionId startedSub = kInvalidSubscription;
  SubscriptionId gameOverSub = kInvalidSubscription;
};
