#include "sim/PowerUpController.hpp"

#include <algorithm>

#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "game/Player.hpp"

PowerUpController::PowerUpController(EventBus *bus, Player *player,
                                     CoinManager *coins, ScoreManager *score,
                                     const PowerUpTuning &tuning,
                                     uint32_t *rngState)
    : bus(bus), player(player), tuning(tuning),
      rng(rngState ? rngState : &ownRng) {
  auto magnetFx = std::make_unique<MagnetEffect>(bus, coins, tuning.magnetRange);
  auto shieldFx = std::make_unique<ShieldEffect>(bus);
  auto speedFx =
      std::make_unique<SpeedBoostEffect>(bus, tuning.speedBoostMultiplier);
  auto starFx = std::make_unique<StarPowerEffect>(bus, coins, tuning.starPower);
  auto multFx =
      std::make_unique<MultiplierEffect>(bus, score, tuning.multiplierValue);

  magnet = magnetFx.get();
  shield = shieldFx.get();
  speedBoost = speedFx.get();
  starPower = starFx.get();
  multiplier = multFx.get();

  effects[EffectIndex(PowerUpType::Magnet)] = std::move(magnetFx);
  effects[EffectIndex(PowerUpType::Shield)] = std::move(shieldFx);
  effects[EffectIndex(PowerUpType::SpeedBoost)] = std::move(speedFx);
  effects[EffectIndex(PowerUpType::StarPower)] = std::move(starFx);
  effects[EffectIndex(PowerUpType::Multiplier)] = std::move(multFx);

  if (bus) {
    startedSub = bus->Subscribe(GameEvent::GameStarted,
                                [this](const EventPayload &) { DeactivateAll(); });
    gameOverSub = bus->Subscribe(GameEvent::GameOver,
                                 [this](const EventPayload &) { DeactivateAll(); });
  }
}

PowerUpController::~PowerUpController() {
  if (bus) {
    bus->Unsubscribe(GameEvent::GameStarted, startedSub);
    bus->Unsubscribe(GameEvent::GameOver, gameOverSub);
  }
}

PowerUpType PowerUpController::RollMysteryBox() {
  const size_t idx =
      core::PickWeighted(*rng, tuning.mysteryWeights.data(), kPowerUpEffectCount);
  return static_cast<PowerUpType>(idx);
}

PowerUpType PowerUpController::Collect(PowerUpType type) {
  if (type == PowerUpType::MysteryBox) {
    type = RollMysteryBox();
    LOG_INFO("[PowerUps] Mystery box revealed: {}", GetPowerUpName(type));
  }
  Activate(type);
  return type;
}

bool PowerUpController::Activate(PowerUpType type) {
  return Activate(type, tuning.DurationFor(type) * durationMultiplier);
}

bool PowerUpController::Activate(PowerUpType type, float duration) {
  if (!HasEffect(type)) {
    LOG_WARN("[PowerUps] {} has no effect to activate", GetPowerUpName(type));
    return false;
  }
  if (duration <= 0.0f) {
    LOG_WARN("[PowerUps] Ignoring {} with duration {}", GetPowerUpName(type),
             duration);
    return false;
  }
  if (player == nullptr) {
    LOG_WARN("[PowerUps] No player, {} not activated", GetPowerUpName(type));
    return false;
  }

  // Only one effect at a time.
  for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
    if (i != EffectIndex(type) && effects[i]->IsActive()) {
      Deactivate(static_cast<PowerUpType>(i));
    }
  }

  const size_t idx = EffectIndex(type);
  Timer &timer = timers[idx];
  if (effects[idx]->IsActive()) {
    timer.remaining = std::max(timer.remaining, duration);
    timer.duration = std::max(timer.duration, timer.remaining);
    if (timer.remaining > tuning.warningTime) {
      timer.warned = false;
    }
    LOG_INFO("[PowerUps] Extended {} to {:.1f}s", GetPowerUpName(type),
             timer.remaining);
  } else {
    timer.duration = duration;
    timer.remaining = duration;
    timer.warned = false;
    LOG_INFO("[PowerUps] Activated {} for {:.1f}s", GetPowerUpName(type),
             duration);
  }

  effects[idx]->Activate(player);
  ++totalActivations;
  return true;
}

void PowerUpController::Deactivate(PowerUpType type) {
  if (!HasEffect(type)) {
    return;
  }
  const size_t idx = EffectIndex(type);
  timers[idx] = Timer{};
  if (effects[idx]->IsActive()) {
    effects[idx]->Deactivate();
    LOG_INFO("[PowerUps] Deactivated {}", GetPowerUpName(type));
  }
}

void PowerUpController::DeactivateAll() {
  for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
    Deactivate(static_cast<PowerUpType>(i));
  }
}

void PowerUpController::Update(float dt) {
  for (auto &effect : effects) {
    effect->Update(dt);
  }

  for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
    if (!effects[i]->IsActive()) {
      continue;
    }
    const PowerUpType type = static_cast<PowerUpType>(i);
    Timer &timer = timers[i];
    timer.remaining -= dt;

    if (timeListener && timer.duration > 0.0f) {
      const float t = std::max(timer.remaining, 0.0f) / timer.duration;
      timeListener(type, std::min(t, 1.0f));
    }

    if (!timer.warned && timer.remaining <= tuning.warningTime) {
      timer.warned = true;
      LOG_DEBUG("[PowerUps] {} running out", GetPowerUpName(type));
      if (warningListener) {
        warningListener(type);
      }
    }

    // Listeners may have cleared the timer already.
    if (effects[i]->IsActive() && timers[i].remaining <= 0.0f) {
      Deactivate(type);
    }
  }
}

bool PowerUpController::HandleObstacleHit() {
  if (shield->IsActive()) {
    shield->OnHitAbsorbed();
    Deactivate(PowerUpType::Shield);
    return true;
  }
  return speedBoost->IsActive() || starPower->IsActive();
}

bool PowerUpController::IsActive(PowerUpType type) const {
  const PowerUpEffect *effect = Effect(type);
  return effect != nullptr && effect->IsActive();
}

std::optional<PowerUpType> PowerUpController::ActiveType() const {
  for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
    if (effects[i]->IsActive()) {
      return static_cast<PowerUpType>(i);
    }
  }
  return std::nullopt;
}

float PowerUpController::RemainingTime(PowerUpType type) const {
  if (!IsActive(type)) {
    return 0.0f;
  }
  return std::max(timers[EffectIndex(type)].remaining, 0.0f);
}

size_t PowerUpController::ActiveCount() const {
  return static_cast<size_t>(
      std::count_if(effects.begin(), effects.end(),
                    [](const auto &e) { return e->IsActive(); }));
}

bool PowerUpController::IsWarning() const {
  const auto active = ActiveType();
  return active && timers[EffectIndex(*active)].warned;
}

void PowerUpController::SetDurationMultiplier(float multiplierValue) {
  if (multiplierValue <= 0.0f) {
    LOG_WARN("[PowerUps] Ignoring duration multiplier {}", multiplierValue);
    return;
  }
  durationMultiplier = multiplierValue;
}

void PowerUpController::SetMagnetRangeMultiplier(float multiplierValue) {
  magnet->SetRangeMultiplier(multiplierValue);
}

PowerUpEffect *PowerUpController::Effect(PowerUpType type) {
  return HasEffect(type) ? effects[EffectIndex(type)].get() : nullptr;
}

const PowerUpEffect *PowerUpController::Effect(PowerUpType type) const {
  return HasEffect(type) ? effects[EffectIndex(type)].get() : nullptr;
}
