#pragma once

#include <string>
#include <utility>

#include "events/GameEvents.hpp"

// Lifetime stats persisted between runs.
struct ProgressData {
  int highScore = 0;
  ThemeType highScoreTheme = ThemeType::Train;
  int totalCoins = 0;
  int gamesPlayed = 0;
  float totalDistance = 0.0f;
};

// Local JSON save file. A missing file is a fresh profile, not an error.
class ProgressStore {
public:
  ProgressStore() = default;
  explicit ProgressStore(std::string path) : path(std::move(path)) {}

  bool Load();
  bool Save() const;

  const std::string &FilePath() const { return path; }
  const ProgressData &Data() const { return data; }

  int GetHighScore() const { return data.highScore; }
  // Returns true when score beats the stored best (and records it).
  bool UpdateHighScore(int score, ThemeType theme);
  void AddCoins(int amount);
  void IncrementGamesPlayed() { ++data.gamesPlayed; }
  void AddDistanceRun(float distance);

private:
  std::string path;
  ProgressData data{};
};
