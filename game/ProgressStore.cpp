#include "game/ProgressStore.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "core/Log.hpp"

using json = nlohmann::json;

namespace {
constexpr int kProgressVersion = 1;

ThemeType ThemeFromInt(const int value) {
  if (value < 0 || value > static_cast<int>(ThemeType::Ground)) {
    return ThemeType::Train;
  }
  return static_cast<ThemeType>(value);
}
} // namespace

bool ProgressStore::Load() {
  data = {};
  if (path.empty()) {
    return true;
  }

  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_INFO("[Progress] No save at {}, starting fresh", path);
    return true;
  }

  try {
    const json j = json::parse(f);
    if (j.value("version", 0) != kProgressVersion) {
      LOG_WARN("[Progress] Unknown save version in {}, ignoring", path);
      return false;
    }
    data.highScore = j.value("highScore", 0);
    data.highScoreTheme = ThemeFromInt(j.value("highScoreTheme", 0));
    data.totalCoins = j.value("totalCoins", 0);
    data.gamesPlayed = j.value("gamesPlayed", 0);
    data.totalDistance = j.value("totalDistance", 0.0f);
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("[Progress] Failed to read {}: {}", path, e.what());
    data = {};
    return false;
  }
}

bool ProgressStore::Save() const {
  if (path.empty()) {
    return false;
  }

  const json j = {
      {"version", kProgressVersion},
      {"highScore", data.highScore},
      {"highScoreTheme", static_cast<int>(data.highScoreTheme)},
      {"totalCoins", data.totalCoins},
      {"gamesPlayed", data.gamesPlayed},
      {"totalDistance", data.totalDistance},
  };

  std::ofstream f(path, std::ios::trunc);
  if (!f.is_open()) {
    LOG_ERROR("[Progress] Cannot write {}", path);
    return false;
  }
  f << j.dump(2) << '\n';
  return static_cast<bool>(f);
}

bool ProgressStore::UpdateHighScore(const int score, const ThemeType theme) {
  if (score <= data.highScore) {
    return false;
  }
  data.highScore = score;
  data.highScoreTheme = theme;
  return true;
}

void ProgressStore::AddCoins(const int amount) {
  if (amount > 0) {
    data.totalCoins += amount;
  }
}

void ProgressStore::AddDistanceRun(const float distance) {
  if (distance > 0.0f) {
    data.totalDistance += distance;
  }
}
