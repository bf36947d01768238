#pragma once

#include <raylib.h>

#include "core/Config.hpp"
#include "sim/PowerUp.hpp"

class CoinManager;
class EventBus;
class Player;
class ScoreManager;

// A timed gameplay modifier. Instances are created once per session and
// reused for every activation; the controller decides when they run.
//
// Activate() with a null player does nothing. Activating an active effect
// re-applies its parameters without announcing it again. Deactivate() on an
// inactive effect does nothing. Collaborators (coin manager, score manager)
// may be null; the matching part of the effect is then skipped.
class PowerUpEffect {
public:
  explicit PowerUpEffect(EventBus *bus) : bus(bus) {}
  virtual ~PowerUpEffect() = default;
  PowerUpEffect(const PowerUpEffect &) = delete;
  PowerUpEffect &operator=(const PowerUpEffect &) = delete;

  virtual PowerUpType Type() const = 0;

  void Activate(Player *target);
  void Deactivate();

  // Called every tick whether or not the effect is active.
  virtual void Update(float dt) { (void)dt; }

  bool IsActive() const { return active; }
  const Player *Target() const { return player; }

protected:
  // firstActivation is false when re-applying to an already active effect.
  virtual void Apply(bool firstActivation) = 0;
  virtual void Revert() = 0;

  Player *player = nullptr;

private:
  EventBus *bus = nullptr;
  bool active = false;
};

// Pulls coins toward the player.
class MagnetEffect : public PowerUpEffect {
public:
  MagnetEffect(EventBus *bus, CoinManager *coins,
               float baseRange = cfg::kMagnetRange);

  PowerUpType Type() const override { return PowerUpType::Magnet; }

  // Character ability scaling; takes effect immediately when active.
  void SetRangeMultiplier(float multiplier);
  float RangeMultiplier() const { return rangeMultiplier; }
  float CurrentRange() const { return baseRange * rangeMultiplier; }

protected:
  void Apply(bool firstActivation) override;
  void Revert() override;

private:
  CoinManager *coins = nullptr;
  float baseRange = cfg::kMagnetRange;
  float rangeMultiplier = 1.0f;
};

// Bubble drawn around the player while a shield is up.
struct ShieldBubble {
  bool visible = false;
  Vector3 position{};
  float scale = cfg::kShieldBaseScale;
  float rotationDeg = 0.0f;
  float pulseTimer = 0.0f;
};

// Makes the player invincible until it absorbs a hit or times out.
class ShieldEffect : public PowerUpEffect {
public:
  explicit ShieldEffect(EventBus *bus);

  PowerUpType Type() const override { return PowerUpType::Shield; }
  void Update(float dt) override;

  // Collision code calls this, then has the controller deactivate.
  void OnHitAbsorbed();
  int HitsAbsorbed() const { return hitsAbsorbed; }
  const ShieldBubble &Bubble() const { return bubble; }

protected:
  void Apply(bool firstActivation) override;
  void Revert() override;

private:
  ShieldBubble bubble{};
  int hitsAbsorbed = 0;
};

// Speed multiplier plus invincibility. On deactivation only invincibility
// is removed; the player's own decay brings speed back down.
class SpeedBoostEffect : public PowerUpEffect {
public:
  explicit SpeedBoostEffect(EventBus *bus,
                            float speedMultiplier = cfg::kSpeedBoostMultiplier);

  PowerUpType Type() const override { return PowerUpType::SpeedBoost; }
  void Update(float dt) override;

  void SetSpeedMultiplier(float multiplier);
  float SpeedMultiplier() const { return speedMultiplier; }

protected:
  void Apply(bool firstActivation) override;
  void Revert() override;

private:
  float speedMultiplier = cfg::kSpeedBoostMultiplier;
};

struct StarPowerSettings {
  float flyHeight = cfg::kStarFlyHeight;
  float transitionSpeed = cfg::kStarTransitionSpeed;
  float collectRange = cfg::kStarCollectRange;
};

// Flight above the track with invincibility and a wide coin magnet.
// Altitude eases toward startAltitude + flyHeight each tick.
class StarPowerEffect : public PowerUpEffect {
public:
  StarPowerEffect(EventBus *bus, CoinManager *coins,
                  const StarPowerSettings &settings = {});

  PowerUpType Type() const override { return PowerUpType::StarPower; }
  void Update(float dt) override;

  const StarPowerSettings &Settings() const { return settings; }
  float StartAltitude() const { return startAltitude; }
  float CurrentHeight() const { return currentHeight; }
  float TargetHeight() const { return startAltitude + settings.flyHeight; }

protected:
  void Apply(bool firstActivation) override;
  void Revert() override;

private:
  CoinManager *coins = nullptr;
  StarPowerSettings settings{};
  float startAltitude = 0.0f;
  float currentHeight = 0.0f;
};

// Score multiplier (integer, >= 1) on the score manager.
class MultiplierEffect : public PowerUpEffect {
public:
  MultiplierEffect(EventBus *bus, ScoreManager *score,
                   int multiplierValue = cfg::kMultiplierValue);

  PowerUpType Type() const override { return PowerUpType::Multiplier; }

  void SetMultiplierValue(int value);
  int MultiplierValue() const { return multiplierValue; }

protected:
  void Apply(bool firstActivation) override;
  void Revert() override;

private:
  ScoreManager *score = nullptr;
  int multiplierValue = cfg::kMultiplierValue;
};
