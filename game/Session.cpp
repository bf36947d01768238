#include "game/Session.hpp"

#include "core/Log.hpp"
#include "game/ProgressStore.hpp"

Session::Session(const uint32_t seed, const PowerUpTuning &tuning,
                 ProgressStore *store)
    : rngState(seed == 0u ? 1u : seed), tuning(tuning), store(store) {
  BuildSystems();
}

Session::~Session() {
  // Drop subscribers before the bus goes away.
  retired.clear();
  live.Reset();
}

void Session::Systems::Reset() {
  powerUps.reset();
  score.reset();
  coins.reset();
  player.reset();
}

void Session::BuildSystems() {
  // Begin() can run inside a GameOver publish whose snapshot still calls
  // the current systems, so they are parked instead of destroyed.
  if (live.player) {
    retired.push_back(std::move(live));
  }

  live.player = std::make_unique<Player>(&bus);
  live.coins = std::make_unique<CoinManager>(&bus);
  live.score = std::make_unique<ScoreManager>(&bus);
  live.powerUps = std::make_unique<PowerUpController>(
      &bus, live.player.get(), live.coins.get(), live.score.get(), tuning,
      &rngState);
}

void Session::Begin(const ThemeType selected) {
  if (state == SessionState::Running || state == SessionState::Paused) {
    LOG_WARN("[Session] Begin while a run is active; ending it first");
    End();
  }

  // The previous teardown dropped every subscription; start from scratch.
  bus.Init();
  BuildSystems();

  theme = selected;
  runTime = 0.0f;
  ticks = 0;
  stats = SessionStats{};
  lastGameOver.reset();

  live.player->Reset();
  live.player->StartRunning();
  state = SessionState::Running;

  bus.Publish(GameEvent::ThemeSelected, theme);
  bus.Publish(GameEvent::GameStarted);
  live.score->StartTracking(live.player->Position().z);
}

void Session::Step(const float dt) {
  if (state != SessionState::Running) {
    return;
  }
  retired.clear();
  runTime += dt;
  ++ticks;

  // Effects first so boosts and flight are applied to this tick's motion.
  live.powerUps->Update(dt);
  live.player->Update(dt);
  live.coins->Update(dt, live.player->Position());
  live.score->Update(live.player->Position().z);
}

std::optional<PowerUpType> Session::OnPowerUpPickup(const PowerUpType type) {
  if (state != SessionState::Running) {
    return std::nullopt;
  }
  ++stats.powerUpsCollected;
  return live.powerUps->Collect(type);
}

CoinId Session::OnCoinSpawn(const Vector3 &position, const int value) {
  ++stats.coinsSpawned;
  return live.coins->SpawnCoin(position, value);
}

bool Session::OnObstacleHit() {
  if (state != SessionState::Running) {
    return true;
  }
  ++stats.obstacleHits;

  if (live.powerUps->HandleObstacleHit()) {
    ++stats.hitsAbsorbed;
    return true;
  }

  live.player->Crash();
  End();
  return false;
}

void Session::Pause() {
  if (state != SessionState::Running) {
    return;
  }
  state = SessionState::Paused;
  bus.Publish(GameEvent::GamePaused);
}

void Session::Resume() {
  if (state != SessionState::Paused) {
    return;
  }
  state = SessionState::Running;
  bus.Publish(GameEvent::GameResumed);
}

void Session::ChangeTheme(const ThemeType next) {
  if (next == theme) {
    return;
  }
  theme = next;
  bus.Publish(GameEvent::ThemeChanged, theme);
}

std::optional<GameOverData> Session::End() {
  if (state != SessionState::Running && state != SessionState::Paused) {
    return std::nullopt;
  }
  state = SessionState::Over;

  GameOverData data = live.score->CreateGameOverData(theme, runTime, store);
  if (store && !store->Save()) {
    LOG_ERROR("[Session] Progress could not be saved to {}", store->FilePath());
  }

  lastGameOver = data;
  bus.Publish(GameEvent::GameOver, data);
  if (state != SessionState::Over) {
    // Restarted from a GameOver handler; the bus belongs to the new run.
    return data;
  }

  bus.Teardown();
  return data;
}
