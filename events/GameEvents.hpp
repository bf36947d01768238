#pragma once

#include <cstddef>
#include <string>
#include <variant>

#include <raylib.h>

#include "sim/PowerUp.hpp"

// Environment themes. Park is kept as an alias of Ground for old saves.
enum class ThemeType : int {
  Train = 0,
  Bus = 1,
  Ground = 2,
  Park = 2,
};

const char *GetThemeName(ThemeType theme);

// Every cross-system notification in the game. Order is stable; it indexes
// the subscriber table in EventBus.
enum class GameEvent : int {
  // Player
  ScoreChanged = 0,    // int: new score
  CoinsCollected,      // int: coin value
  PlayerMoved,         // Vector3: position
  PowerUpActivated,    // PowerUpType
  PowerUpDeactivated,  // PowerUpType
  PlayerJumped,
  PlayerSlide,
  PlayerCrashed,
  LaneChanged,         // int: new lane
  // Game state
  GameStarted,
  GamePaused,
  GameResumed,
  GameOver,            // GameOverData
  // Environment
  ThemeChanged,        // ThemeType
  ThemeSelected,       // ThemeType
  SegmentSpawned,      // SegmentInfo
  SegmentDespawned,    // SegmentInfo
  SegmentCountChanged,
  // UI
  ShowPanel,           // std::string: panel name
  HidePanel,           // std::string: panel name

  Count
};

constexpr size_t kGameEventCount = static_cast<size_t>(GameEvent::Count);

const char *GetGameEventName(GameEvent event);

// Track segment announced by the (external) level generator.
struct SegmentInfo {
  int index = 0;
  float startZ = 0.0f;
  float length = 0.0f;
  ThemeType theme = ThemeType::Train;
};

// Snapshot of a finished run. Built once by ScoreManager, never modified.
class GameOverData {
public:
  GameOverData(int finalScore, int coinsCollected, float distanceTraveled,
               bool isHighScore, ThemeType gameMode, float duration = 0.0f)
      : finalScore(finalScore),
        coinsCollected(coinsCollected),
        distanceTraveled(distanceTraveled),
        isHighScore(isHighScore),
        gameMode(gameMode),
        duration(duration) {}

  int FinalScore() const { return finalScore; }
  int CoinsCollected() const { return coinsCollected; }
  float DistanceTraveled() const { return distanceTraveled; }
  bool IsHighScore() const { return isHighScore; }
  ThemeType GameMode() const { return gameMode; }
  float Duration() const { return duration; }

  std::string Describe() const;

private:
  int finalScore;
  int coinsCollected;
  float distanceTraveled;
  bool isHighScore;
  ThemeType gameMode;
  float duration;
};

// Payload carried by a published event. std::monostate for signal-only
// events (PlayerJumped, GameStarted, ...).
using EventPayload = std::variant<std::monostate, int, Vector3, PowerUpType,
                                  ThemeType, SegmentInfo, GameOverData,
                                  std::string>;
