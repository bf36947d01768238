#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <raylib.h>

#include "events/EventBus.hpp"
#include "events/GameEvents.hpp"
#include "game/CoinManager.hpp"
#include "game/Player.hpp"
#include "game/ScoreManager.hpp"
#include "sim/PowerUpController.hpp"
#include "sim/PowerUpTuning.hpp"

class ProgressStore;

enum class SessionState {
  Idle,
  Running,
  Paused,
  Over,
};

struct SessionStats {
  int powerUpsCollected = 0;
  int coinsSpawned = 0;
  int obstacleHits = 0;
  int hitsAbsorbed = 0;
};

// One match, from GameStarted to GameOver. Owns the event bus and every
// gameplay system subscribed to it; the bus is declared first so it
// outlives them all.
//
// Collision detection lives outside; it reports through OnPowerUpPickup,
// OnCoinSpawn and OnObstacleHit.
class Session {
public:
  explicit Session(uint32_t seed = 1u, const PowerUpTuning &tuning = {},
                   ProgressStore *store = nullptr);
  ~Session();
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Starts a fresh run. A run still in progress is ended first.
  void Begin(ThemeType theme);

  // One fixed tick. Does nothing unless running.
  void Step(float dt);

  // Returns the type actually applied (MysteryBox resolved).
  std::optional<PowerUpType> OnPowerUpPickup(PowerUpType type);
  CoinId OnCoinSpawn(const Vector3 &position,
                     int value = cfg::kRegularCoinValue);
  // Returns true when the player survives the hit. A fatal hit ends the run.
  bool OnObstacleHit();

  void Pause();
  void Resume();
  void ChangeTheme(ThemeType theme);

  // Saves progress when a store is attached, publishes GameOver and tears
  // the bus down. Empty when no run was in progress. A GameOver handler may
  // call Begin(); the new run then keeps its subscriptions.
  std::optional<GameOverData> End();

  EventBus &Bus() { return bus; }
  Player &GetPlayer() { return *live.player; }
  const Player &GetPlayer() const { return *live.player; }
  CoinManager &Coins() { return *live.coins; }
  ScoreManager &Score() { return *live.score; }
  const ScoreManager &Score() const { return *live.score; }
  PowerUpController &PowerUps() { return *live.powerUps; }
  const PowerUpController &PowerUps() const { return *live.powerUps; }

  SessionState State() const { return state; }
  bool IsRunning() const { return state == SessionState::Running; }
  ThemeType Theme() const { return theme; }
  float RunTime() const { return runTime; }
  uint64_t Ticks() const { return ticks; }
  uint32_t &RngState() { return rngState; }
  const SessionStats &Stats() const { return stats; }
  const std::optional<GameOverData> &LastGameOver() const {
    return lastGameOver;
  }

private:
  void BuildSystems();

  EventBus bus;
  uint32_t rngState = 1u;
  PowerUpTuning tuning{};
  ProgressStore *store = nullptr;

  // Everything one run subscribes to the bus.
  struct Systems {
    std::unique_ptr<Player> player;
    std::unique_ptr<CoinManager> coins;
    std::unique_ptr<ScoreManager> score;
    std::unique_ptr<PowerUpController> powerUps;

    // Controller first, player last.
    void Reset();
  };

  Systems live;
  // Replaced systems a running publish may still call into. Freed on the
  // next Step.
  std::vector<Systems> retired;

  SessionState state = SessionState::Idle;
  ThemeType theme = ThemeType::Train;
  float runTime = 0.0f;
  uint64_t ticks = 0;
  SessionStats stats{};
  std::optional<GameOverData> lastGameOver;
};
