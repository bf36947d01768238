#include "game/ScoreManager.hpp"

#include <cmath>

#include <spdlog/fmt/fmt.h>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "game/ProgressStore.hpp"

ScoreManager::ScoreManager(EventBus *bus) : bus(bus) {
  if (!bus) {
    return;
  }
  startedSub = bus->Subscribe(GameEvent::GameStarted,
                              [this](const EventPayload &) { ResetSession(); });
  coinsSub = bus->SubscribeTo<int>(
      GameEvent::CoinsCollected, [this](const int &amount) { AddCoins(amount); });
}

ScoreManager::~ScoreManager() {
  if (bus) {
    bus->Unsubscribe(GameEvent::GameStarted, startedSub);
    bus->Unsubscribe(GameEvent::CoinsCollected, coinsSub);
  }
}

void ScoreManager::ResetSession() {
  currentScore = 0;
  sessionCoins = 0;
  distanceTraveled = 0.0f;
  pendingDistance = 0.0f;
  scoreMultiplier = 1;
  if (bus) {
    bus->Publish(GameEvent::ScoreChanged, currentScore);
  }
  LOG_DEBUG("[ScoreManager] Session reset");
}

void ScoreManager::StartTracking(const float playerZ) {
  lastPlayerZ = playerZ;
  tracking = true;
}

void ScoreManager::Update(const float playerZ) {
  if (!tracking) {
    return;
  }
  const float delta = playerZ - lastPlayerZ;
  lastPlayerZ = playerZ;
  if (delta <= 0.0f) {
    return;
  }

  distanceTraveled += delta;
  pendingDistance += delta;

  // Whole points only; the remainder carries into the next tick.
  const float rate =
      static_cast<float>(cfg::kPointsPerMeter * scoreMultiplier);
  const int points = static_cast<int>(std::floor(pendingDistance * rate));
  if (points > 0) {
    pendingDistance -= static_cast<float>(points) / rate;
    AddScore(points);
  }
}

void ScoreManager::AddScore(const int points) {
  if (points <= 0) {
    return;
  }
  currentScore += points;
  if (bus) {
    bus->Publish(GameEvent::ScoreChanged, currentScore);
  }
}

void ScoreManager::AddCoins(const int amount) {
  if (amount <= 0) {
    return;
  }
  sessionCoins += amount;
  AddScore(amount * cfg::kPointsPerCoin * scoreMultiplier);
}

void ScoreManager::SetScoreMultiplier(const int multiplier) {
  scoreMultiplier = multiplier < 1 ? 1 : multiplier;
  LOG_DEBUG("[ScoreManager] Score multiplier set to: {}x", scoreMultiplier);
}

std::string ScoreManager::FormattedDistance() const {
  if (distanceTraveled < 1000.0f) {
    return fmt::format("{:.0f}m", distanceTraveled);
  }
  return fmt::format("{:.2f}km", distanceTraveled / 1000.0f);
}

GameOverData ScoreManager::CreateGameOverData(const ThemeType theme,
                                              const float duration,
                                              ProgressStore *store) {
  tracking = false;

  const int coinsEarned = sessionCoins + cfg::kBaseCoinsPerRun;
  bool isHighScore = false;
  if (store) {
    isHighScore = store->UpdateHighScore(currentScore, theme);
    store->AddCoins(coinsEarned);
    store->IncrementGamesPlayed();
    store->AddDistanceRun(distanceTraveled);
  } else {
    LOG_DEBUG("[ScoreManager] No progress store; high score not checked");
  }

  return GameOverData(currentScore, coinsEarned, distanceTraveled, isHighScore,
                      theme, duration);
}
