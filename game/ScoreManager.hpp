#pragma once

#include <string>

#include "events/EventBus.hpp"
#include "events/GameEvents.hpp"

class ProgressStore;

// Distance and coin scoring for one run. Listens for GameStarted (reset)
// and CoinsCollected on the bus it was given.
class ScoreManager {
public:
  explicit ScoreManager(EventBus *bus = nullptr);
  ~ScoreManager();
  ScoreManager(const ScoreManager &) = delete;
  ScoreManager &operator=(const ScoreManager &) = delete;

  void ResetSession();
  void StartTracking(float playerZ);
  void StopTracking() { tracking = false; }
  bool IsTracking() const { return tracking; }

  // Awards distance points for forward progress since the last call.
  void Update(float playerZ);

  void AddScore(int points);
  void AddCoins(int amount);

  // Clamped to >= 1.
  void SetScoreMultiplier(int multiplier);
  int ScoreMultiplier() const { return scoreMultiplier; }

  int CurrentScore() const { return currentScore; }
  int SessionCoins() const { return sessionCoins; }
  float DistanceTraveled() const { return distanceTraveled; }
  std::string FormattedDistance() const;

  // Stops tracking and snapshots the run. When a store is given, the high
  // score, coin bank and lifetime stats are updated in it (not saved).
  GameOverData CreateGameOverData(ThemeType theme, float duration,
                                  ProgressStore *store);

private:
  EventBus *bus = nullptr;
  SubscriptionId startedSub = kInvalidSubscription;
  SubscriptionId coinsSub = kInvalidSubscription;

  int currentScore = 0;
  int sessionCoins = 0;
  float distanceTraveled = 0.0f;
  float pendingDistance = 0.0f; // not yet converted to points
  int scoreMultiplier = 1;
  float lastPlayerZ = 0.0f;
  bool tracking = false;
};
