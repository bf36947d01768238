#include "events/GameEvents.hpp"

#include <spdlog/fmt/fmt.h>

const char *GetThemeName(ThemeType theme) {
  switch (theme) {
  case ThemeType::Train:
    return "Train";
  case ThemeType::Bus:
    return "Bus";
  case ThemeType::Ground:
    return "Ground";
  }
  return "Unknown";
}

const char *GetGameEventName(GameEvent event) {
  switch (event) {
  case GameEvent::ScoreChanged: return "ScoreChanged";
  case GameEvent::CoinsCollected: return "CoinsCollected";
  case GameEvent::PlayerMoved: return "PlayerMoved";
  case GameEvent::PowerUpActivated: return "PowerUpActivated";
  case GameEvent::PowerUpDeactivated: return "PowerUpDeactivated";
  case GameEvent::PlayerJumped: return "PlayerJumped";
  case GameEvent::PlayerSlide: return "PlayerSlide";
  case GameEvent::PlayerCrashed: return "PlayerCrashed";
  case GameEvent::LaneChanged: return "LaneChanged";
  case GameEvent::GameStarted: return "GameStarted";
  case GameEvent::GamePaused: return "GamePaused";
  case GameEvent::GameResumed: return "GameResumed";
  case GameEvent::GameOver: return "GameOver";
  case GameEvent::ThemeChanged: return "ThemeChanged";
  case GameEvent::ThemeSelected: return "ThemeSelected";
  case GameEvent::SegmentSpawned: return "SegmentSpawned";
  case GameEvent::SegmentDespawned: return "SegmentDespawned";
  case GameEvent::SegmentCountChanged: return "SegmentCountChanged";
  case GameEvent::ShowPanel: return "ShowPanel";
  case GameEvent::HidePanel: return "HidePanel";
  case GameEvent::Count: break;
  }
  return "Unknown";
}

std::string GameOverData::Describe() const {
  return fmt::format("Score: {}, Coins: {}, Distance: {:.1f}m, Mode: {}",
                     finalScore, coinsCollected, distanceTraveled,
                     GetThemeName(gameMode));
}
