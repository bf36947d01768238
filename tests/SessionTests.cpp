#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "events/EventBus.hpp"
#include "game/CoinManager.hpp"
#include "game/Player.hpp"
#include "game/ProgressStore.hpp"
#include "game/ScoreManager.hpp"
#include "game/Session.hpp"
#include "sim/PowerUpController.hpp"

namespace {
bool NearlyEqual(const float a, const float b, const float eps = 1e-3f) {
  return std::fabs(a - b) <= eps;
}

// Controller with real collaborators on a live bus.
struct ControllerRig {
  EventBus bus;
  Player player{&bus};
  CoinManager coins{&bus};
  ScoreManager score{&bus};
  uint32_t rng = 0xC0FFEEu;
  std::vector<std::string> trace;
  PowerUpController controller;

  explicit ControllerRig(const PowerUpTuning &tuning = {})
      : controller(&bus, &player, &coins, &score, tuning, &rng) {
    bus.Init();
    bus.SubscribeTo<PowerUpType>(
        GameEvent::PowerUpActivated, [this](const PowerUpType &t) {
          trace.push_back(std::string("+") + GetPowerUpName(t));
        });
    bus.SubscribeTo<PowerUpType>(
        GameEvent::PowerUpDeactivated, [this](const PowerUpType &t) {
          trace.push_back(std::string("-") + GetPowerUpName(t));
        });
  }

  void Advance(const float seconds) {
    const int steps = static_cast<int>(std::lround(seconds / cfg::kFixedDt));
    for (int i = 0; i < steps; ++i) {
      controller.Update(cfg::kFixedDt);
    }
  }
};

std::string TempPath(const char *name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

bool TestMutualExclusion() {
  ControllerRig rig;
  rig.controller.Activate(PowerUpType::Magnet);
  rig.controller.Activate(PowerUpType::Shield);

  const std::vector<std::string> expected = {"+Coin Magnet", "-Coin Magnet",
                                             "+Shield"};
  return rig.trace == expected && rig.controller.ActiveCount() == 1 &&
         rig.controller.ActiveType() == PowerUpType::Shield &&
         !rig.coins.IsMagnetActive() && rig.player.IsInvincible();
}

bool TestSwitchingFromStarPowerLandsPlayer() {
  ControllerRig rig;
  rig.controller.Activate(PowerUpType::StarPower);
  rig.Advance(1.0f);
  const bool flying = rig.player.IsFlying() && rig.player.Position().y > 1.0f;

  rig.controller.Activate(PowerUpType::Multiplier);
  return flying && !rig.player.IsFlying() &&
         NearlyEqual(rig.player.Position().y, 0.0f) &&
         !rig.player.IsInvincible() && rig.score.ScoreMultiplier() == 2 &&
         rig.controller.ActiveCount() == 1;
}

bool TestReactivationExtendsTimer() {
  ControllerRig rig;
  rig.controller.Activate(PowerUpType::Magnet, 10.0f);
  rig.Advance(4.0f);

  rig.controller.Activate(PowerUpType::Magnet, 3.0f);
  const bool kept = NearlyEqual(rig.controller.RemainingTime(PowerUpType::Magnet),
                                6.0f, 0.05f);

  rig.controller.Activate(PowerUpType::Magnet, 8.0f);
  const bool extended = NearlyEqual(
      rig.controller.RemainingTime(PowerUpType::Magnet), 8.0f, 0.05f);

  return kept && extended && rig.trace.size() == 1 &&
         rig.controller.TotalActivations() == 3;
}

bool TestExpiryAndWarning() {
  ControllerRig rig;
  std::vector<PowerUpType> warnings;
  float lastFraction = 1.0f;
  bool fractionsInRange = true;
  rig.controller.SetWarningListener(
      [&](PowerUpType type) { warnings.push_back(type); });
  rig.controller.SetTimeListener([&](PowerUpType, float fraction) {
    fractionsInRange = fractionsInRange && fraction >= 0.0f &&
                       fraction <= 1.0f && fraction <= lastFraction;
    lastFraction = fraction;
  });

  rig.controller.Activate(PowerUpType::SpeedBoost);
  rig.Advance(1.5f);
  const bool quiet = warnings.empty() && !rig.controller.IsWarning();

  rig.Advance(1.0f);
  const bool warned = warnings.size() == 1 && rig.controller.IsWarning() &&
                      rig.controller.IsActive(PowerUpType::SpeedBoost);

  rig.Advance(3.0f);
  return quiet && warned && warnings.size() == 1 && fractionsInRange &&
         !rig.controller.IsActive(PowerUpType::SpeedBoost) &&
         rig.trace.back() == "-Speed Boost" &&
         !rig.player.IsInvincible();
}

bool TestDurationMultiplier() {
  ControllerRig rig;
  rig.controller.SetDurationMultiplier(1.5f);
  rig.controller.SetDurationMultiplier(-1.0f); // ignored
  rig.controller.Activate(PowerUpType::Magnet);
  return NearlyEqual(rig.controller.RemainingTime(PowerUpType::Magnet),
                     cfg::kMagnetDuration * 1.5f);
}

bool TestMagnetRangeAbility() {
  ControllerRig rig;
  rig.controller.Activate(PowerUpType::Magnet);
  rig.controller.SetMagnetRangeMultiplier(1.5f);
  return NearlyEqual(rig.coins.MagnetRange(), cfg::kMagnetRange * 1.5f);
}

bool TestInvalidActivationsRejected() {
  ControllerRig rig;
  const bool mystery = rig.controller.Activate(PowerUpType::MysteryBox);
  const bool zero = rig.controller.Activate(PowerUpType::Shield, 0.0f);

  PowerUpController headless(&rig.bus, nullptr, nullptr, nullptr);
  const bool noPlayer = headless.Activate(PowerUpType::Shield);

  return !mystery && !zero && !noPlayer && rig.controller.ActiveCount() == 0 &&
         headless.ActiveCount() == 0 && rig.trace.empty();
}

bool TestMysteryBoxResolvesToEffect() {
  ControllerRig rig;
  for (int i = 0; i < 20; ++i) {
    const PowerUpType got = rig.controller.Collect(PowerUpType::MysteryBox);
    if (!HasEffect(got) || !rig.controller.IsActive(got) ||
        rig.controller.ActiveCount() != 1) {
      return false;
    }
  }
  return true;
}

bool TestEffectLookupSkipsMysteryBox() {
  ControllerRig rig;
  const PowerUpController &view = rig.controller;
  return rig.controller.Effect(PowerUpType::MysteryBox) == nullptr &&
         view.Effect(PowerUpType::MysteryBox) == nullptr &&
         rig.controller.Effect(PowerUpType::Shield) == &rig.controller.Shield() &&
         view.Effect(PowerUpType::Multiplier)->Type() ==
             PowerUpType::Multiplier &&
         !rig.controller.IsActive(PowerUpType::MysteryBox);
}

bool TestMysteryBoxDeterministicForSeed() {
  ControllerRig a;
  ControllerRig b;
  for (int i = 0; i < 50; ++i) {
    if (a.controller.RollMysteryBox() != b.controller.RollMysteryBox()) {
      return false;
    }
  }
  return true;
}

bool TestMysteryBoxHonoursWeights() {
  PowerUpTuning tuning{};
  tuning.mysteryWeights = {0.0f, 0.0f, 0.0f, 1.0f, 0.0f};
  ControllerRig rig(tuning);
  for (int i = 0; i < 25; ++i) {
    if (rig.controller.RollMysteryBox() != PowerUpType::StarPower) {
      return false;
    }
  }
  return true;
}

bool TestShieldAbsorbsOneHit() {
  ControllerRig rig;
  rig.controller.Activate(PowerUpType::Shield);

  const bool first = rig.controller.HandleObstacleHit();
  const bool second = rig.controller.HandleObstacleHit();

  return first && !second && rig.controller.Shield().HitsAbsorbed() == 1 &&
         !rig.controller.IsActive(PowerUpType::Shield) &&
         !rig.player.IsInvincible();
}

bool TestInvincibleEffectsKeepRunning() {
  ControllerRig rig;
  rig.controller.Activate(PowerUpType::StarPower);
  const bool star = rig.controller.HandleObstacleHit() &&
                    rig.controller.IsActive(PowerUpType::StarPower);

  rig.controller.Activate(PowerUpType::SpeedBoost);
  const bool speed = rig.controller.HandleObstacleHit() &&
                     rig.controller.IsActive(PowerUpType::SpeedBoost);

  rig.controller.Activate(PowerUpType::Magnet);
  const bool magnet = !rig.controller.HandleObstacleHit();

  return star && speed && magnet;
}

bool TestGameStartAndOverClearEffects() {
  ControllerRig rig;
  rig.controller.Activate(PowerUpType::Multiplier);
  rig.bus.Publish(GameEvent::GameStarted);
  const bool clearedOnStart = rig.controller.ActiveCount() == 0;

  rig.controller.Activate(PowerUpType::Shield);
  rig.bus.Publish(GameEvent::GameOver,
                  GameOverData(0, 0, 0.0f, false, ThemeType::Train));
  return clearedOnStart && rig.controller.ActiveCount() == 0 &&
         rig.score.ScoreMultiplier() == 1 && !rig.player.IsInvincible();
}

bool TestControllerUnsubscribesOnDestruction() {
  EventBus bus;
  Player player{&bus};
  const size_t before = bus.TotalSubscriberCount();
  {
    PowerUpController controller(&bus, &player, nullptr, nullptr);
    if (bus.TotalSubscriberCount() != before + 2) {
      return false;
    }
  }
  return bus.TotalSubscriberCount() == before;
}

bool TestPlayerLanesAndActions() {
  EventBus bus;
  std::vector<int> lanes;
  int jumps = 0;
  int slides = 0;
  int crashes = 0;
  bus.SubscribeTo<int>(GameEvent::LaneChanged,
                       [&](const int &lane) { lanes.push_back(lane); });
  bus.Subscribe(GameEvent::PlayerJumped, [&](const EventPayload &) { ++jumps; });
  bus.Subscribe(GameEvent::PlayerSlide, [&](const EventPayload &) { ++slides; });
  bus.Subscribe(GameEvent::PlayerCrashed,
                [&](const EventPayload &) { ++crashes; });

  Player player(&bus);
  const bool idleBlocked = !player.TryChangeLane(1) && !player.TryJump();
  player.StartRunning();

  const bool left = player.TryChangeLane(-1);
  const bool wall = !player.TryChangeLane(-1);
  const bool right = player.TryChangeLane(1) && player.TryChangeLane(1);
  const bool farWall = !player.TryChangeLane(1);

  const bool jumped = player.TryJump() && !player.TryJump();
  for (int i = 0; i < 15; ++i) {
    player.Update(cfg::kFixedDt);
  }
  const bool airborne = player.Position().y > 1.0f;
  const bool slid = player.TrySlide();
  const bool grounded = NearlyEqual(player.Position().y, cfg::kGroundY);

  player.Crash();
  player.Crash();

  return idleBlocked && left && wall && right && farWall && jumped &&
         airborne && slid && grounded && lanes == std::vector<int>{0, 1, 2} &&
         jumps == 1 && slides == 1 && crashes == 1 && !player.IsAlive() &&
         !player.TryJump();
}

bool TestPlayerSpeedRampAndCap() {
  Player player;
  player.StartRunning();
  for (int i = 0; i < 600; ++i) {
    player.Update(cfg::kFixedDt);
  }
  const bool ramped = player.RunSpeed() > cfg::kBaseRunSpeed &&
                      player.RunSpeed() <= cfg::kMaxRunSpeed;

  player.SetSpeedMultiplier(10.0f);
  const bool capped = player.CurrentSpeed() <=
                      cfg::kMaxRunSpeed * cfg::kBoostedSpeedCap + 1e-3f;
  player.SetSpeedMultiplier(-1.0f); // ignored
  return ramped && capped && NearlyEqual(player.SpeedMultiplier(), 10.0f);
}

bool TestCoinQueriesAndRemoval() {
  CoinManager coins;
  const CoinId near = coins.SpawnCoin(Vector3{0.0f, 0.0f, 2.0f});
  const CoinId far = coins.SpawnCoin(Vector3{0.0f, 0.0f, 20.0f}, 5);
  const CoinId side = coins.SpawnCoin(Vector3{cfg::kLaneWidth, 0.0f, 2.0f});

  const Vector3 origin{0.0f, 0.0f, 0.0f};
  const std::vector<CoinId> inRange = coins.CoinsInRange(origin, 4.0f);
  const bool queried = inRange == std::vector<CoinId>{near, side} &&
                       coins.FindCoin(far) != nullptr &&
                       coins.FindCoin(far)->value == 5 &&
                       coins.FindCoin(999u) == nullptr;

  coins.RemoveCoin(near);
  coins.RemoveCoin(999u); // unknown ids are ignored
  return queried && coins.FindCoin(near) == nullptr &&
         coins.ActiveCoinCount() == 2 &&
         coins.CoinsInRange(origin, 4.0f) == std::vector<CoinId>{side};
}

bool TestRemoveAttractedCoinWhileMagnetActive() {
  EventBus bus;
  bus.Init();
  int reported = 0;
  bus.SubscribeTo<int>(GameEvent::CoinsCollected,
                       [&](const int &value) { reported += value; });

  CoinManager coins(&bus);
  const Vector3 anchor{0.0f, 0.0f, 0.0f};
  const Vector3 away{50.0f, 0.0f, 0.0f};
  const CoinId pulled = coins.SpawnCoin(Vector3{0.0f, 0.0f, 4.0f});
  coins.SpawnCoin(Vector3{0.0f, 0.0f, 30.0f});
  coins.EnableMagnet(&anchor, 8.0f);
  coins.Update(cfg::kFixedDt, away);
  const bool attracted = coins.AttractedCoinCount() == 1 &&
                         coins.FindCoin(pulled)->attracted;

  coins.RemoveCoin(pulled);
  for (int i = 0; i < 60; ++i) {
    coins.Update(cfg::kFixedDt, anchor);
  }

  return attracted && coins.IsMagnetActive() &&
         coins.AttractedCoinCount() == 0 && coins.FindCoin(pulled) == nullptr &&
         coins.ActiveCoinCount() == 1 && coins.CollectedValue() == 0 &&
         reported == 0;
}

bool TestScoreFormattingAndGameOver() {
  ScoreManager score;
  score.StartTracking(0.0f);
  score.Update(87.4f);
  const std::string meters = score.FormattedDistance();
  score.Update(1234.5f);
  const std::string km = score.FormattedDistance();

  ProgressStore store;
  const GameOverData first =
      score.CreateGameOverData(ThemeType::Train, 30.0f, &store);
  const GameOverData second =
      score.CreateGameOverData(ThemeType::Train, 30.0f, &store);

  return meters == "87m" && km == "1.23km" && !score.IsTracking() &&
         score.CurrentScore() == 1234 && first.IsHighScore() &&
         !second.IsHighScore() && store.Data().gamesPlayed == 2 &&
         store.Data().totalCoins == 2 * cfg::kBaseCoinsPerRun;
}

bool TestSessionBeginAnnouncesThemeThenStart() {
  Session session(7u);
  std::vector<std::string> trace;
  session.Bus().SubscribeTo<ThemeType>(
      GameEvent::ThemeSelected, [&](const ThemeType &t) {
        trace.push_back(std::string("selected:") + GetThemeName(t));
      });
  session.Bus().Subscribe(GameEvent::GameStarted, [&](const EventPayload &) {
    trace.push_back("started");
  });
  session.Bus().SubscribeTo<ThemeType>(
      GameEvent::ThemeChanged, [&](const ThemeType &t) {
        trace.push_back(std::string("changed:") + GetThemeName(t));
      });

  session.Begin(ThemeType::Bus);
  session.ChangeTheme(ThemeType::Bus); // unchanged, silent
  session.ChangeTheme(ThemeType::Ground);

  const std::vector<std::string> expected = {"selected:Bus", "started",
                                             "changed:Ground"};
  return trace == expected && session.IsRunning() && session.Bus().IsLive() &&
         session.Theme() == ThemeType::Ground &&
         session.GetPlayer().IsRunning();
}

bool TestSessionMagnetCollectsOffLaneCoin() {
  Session withMagnet(11u);
  withMagnet.Begin(ThemeType::Train);
  withMagnet.OnPowerUpPickup(PowerUpType::Magnet);
  withMagnet.OnCoinSpawn(Vector3{cfg::kLaneWidth, 0.0f, 3.0f});

  Session without(11u);
  without.Begin(ThemeType::Train);
  without.OnCoinSpawn(Vector3{cfg::kLaneWidth, 0.0f, 3.0f});

  for (int i = 0; i < 60; ++i) {
    withMagnet.Step(cfg::kFixedDt);
    without.Step(cfg::kFixedDt);
  }

  return withMagnet.Coins().CollectedValue() == cfg::kRegularCoinValue &&
         withMagnet.Score().SessionCoins() == cfg::kRegularCoinValue &&
         without.Coins().CollectedValue() == 0 &&
         without.Score().SessionCoins() == 0;
}

bool TestSessionMultiplierDoublesCoinPoints() {
  Session session(3u);
  session.Begin(ThemeType::Train);
  session.OnPowerUpPickup(PowerUpType::Multiplier);

  const int before = session.Score().CurrentScore();
  session.Bus().Publish(GameEvent::CoinsCollected, cfg::kSpecialCoinValue);
  const int gained = session.Score().CurrentScore() - before;

  return gained == cfg::kSpecialCoinValue * cfg::kPointsPerCoin * 2;
}

bool TestSessionDistanceScoring() {
  Session session(5u);
  session.Begin(ThemeType::Train);
  for (int i = 0; i < 120; ++i) {
    session.Step(cfg::kFixedDt);
  }
  const float distance = session.Score().DistanceTraveled();
  const int score = session.Score().CurrentScore();

  // Whole points per meter, remainder carried.
  return distance > 25.0f && score == static_cast<int>(std::floor(distance)) &&
         NearlyEqual(distance, session.GetPlayer().DistanceRun(), 0.01f) &&
         NearlyEqual(session.RunTime(), 2.0f);
}

bool TestSessionPauseFreezesTime() {
  Session session(9u);
  session.Begin(ThemeType::Train);
  session.Step(cfg::kFixedDt);
  session.Pause();
  const float z = session.GetPlayer().Position().z;
  for (int i = 0; i < 30; ++i) {
    session.Step(cfg::kFixedDt);
  }
  const bool frozen = session.State() == SessionState::Paused &&
                      NearlyEqual(session.GetPlayer().Position().z, z);
  session.Resume();
  session.Step(cfg::kFixedDt);
  return frozen && session.IsRunning() && session.GetPlayer().Position().z > z;
}

bool TestSessionShieldSurvivesObstacle() {
  Session session(13u);
  session.Begin(ThemeType::Train);
  session.OnPowerUpPickup(PowerUpType::Shield);

  const bool survived = session.OnObstacleHit();
  return survived && session.IsRunning() &&
         session.Stats().hitsAbsorbed == 1 &&
         !session.PowerUps().IsActive(PowerUpType::Shield);
}

bool TestSessionFatalHitEndsRun() {
  Session session(17u);
  session.Begin(ThemeType::Bus);
  std::optional<GameOverData> seen;
  session.Bus().SubscribeTo<GameOverData>(
      GameEvent::GameOver, [&](const GameOverData &d) { seen = d; });
  for (int i = 0; i < 30; ++i) {
    session.Step(cfg::kFixedDt);
  }

  const bool survived = session.OnObstacleHit();
  return !survived && session.State() == SessionState::Over &&
         session.GetPlayer().State() == PlayerState::Crashed && seen &&
         seen->GameMode() == ThemeType::Bus && session.LastGameOver() &&
         !session.Bus().IsLive() && session.Bus().TotalSubscriberCount() == 0;
}

bool TestSessionEndBuildsGameOverData() {
  Session session(21u);
  session.Begin(ThemeType::Ground);
  session.Bus().Publish(GameEvent::CoinsCollected, 3);
  for (int i = 0; i < 60; ++i) {
    session.Step(cfg::kFixedDt);
  }

  const std::optional<GameOverData> data = session.End();
  const std::optional<GameOverData> again = session.End();

  return data && !again &&
         data->CoinsCollected() == 3 + cfg::kBaseCoinsPerRun &&
         data->FinalScore() == session.Score().CurrentScore() &&
         NearlyEqual(data->Duration(), 1.0f) &&
         data->GameMode() == ThemeType::Ground && !data->IsHighScore();
}

bool TestSessionRestartGetsFreshSystems() {
  Session session(23u);
  session.Begin(ThemeType::Train);
  session.OnPowerUpPickup(PowerUpType::StarPower);
  for (int i = 0; i < 60; ++i) {
    session.Step(cfg::kFixedDt);
  }
  session.End();

  session.Begin(ThemeType::Train);
  return session.IsRunning() && session.PowerUps().ActiveCount() == 0 &&
         session.Score().CurrentScore() == 0 &&
         NearlyEqual(session.GetPlayer().Position().y, 0.0f) &&
         session.Stats().powerUpsCollected == 0 &&
         session.Bus().TotalSubscriberCount() > 0;
}

bool TestSessionRestartFromGameOverHandler() {
  Session session(29u);
  int restarts = 0;
  // Registered before Begin so the run's own GameOver handlers come after it.
  session.Bus().Subscribe(GameEvent::GameOver, [&](const EventPayload &) {
    if (restarts++ == 0) {
      session.Begin(ThemeType::Bus);
    }
  });
  session.Begin(ThemeType::Train);
  session.Step(cfg::kFixedDt);

  const std::optional<GameOverData> data = session.End();
  if (!data || restarts != 1 || !session.IsRunning() ||
      !session.Bus().IsLive() || session.Bus().TotalSubscriberCount() == 0 ||
      session.LastGameOver() || session.Theme() != ThemeType::Bus) {
    return false;
  }

  session.Step(cfg::kFixedDt);
  const int before = session.Score().CurrentScore();
  session.Bus().Publish(GameEvent::CoinsCollected, 3);
  const bool scored =
      session.Score().CurrentScore() - before == 3 * cfg::kPointsPerCoin;

  session.OnPowerUpPickup(PowerUpType::Multiplier);
  const bool activated = session.PowerUps().IsActive(PowerUpType::Multiplier);
  session.Bus().Publish(GameEvent::GameStarted);

  return scored && activated && session.PowerUps().ActiveCount() == 0 &&
         session.IsRunning();
}

bool TestProgressRoundTrip() {
  const std::string path = TempPath("escaperun_progress_test.json");
  std::remove(path.c_str());

  ProgressStore store(path);
  if (!store.Load() || store.GetHighScore() != 0) {
    return false;
  }
  const bool first = store.UpdateHighScore(900, ThemeType::Bus);
  const bool lower = store.UpdateHighScore(500, ThemeType::Train);
  store.AddCoins(42);
  store.IncrementGamesPlayed();
  store.AddDistanceRun(321.0f);
  if (!store.Save()) {
    return false;
  }

  ProgressStore reloaded(path);
  const bool loaded = reloaded.Load();
  std::remove(path.c_str());

  const ProgressData &d = reloaded.Data();
  return first && !lower && loaded && d.highScore == 900 &&
         d.highScoreTheme == ThemeType::Bus && d.totalCoins == 42 &&
         d.gamesPlayed == 1 && NearlyEqual(d.totalDistance, 321.0f);
}

bool TestSessionUpdatesProgressStore() {
  const std::string path = TempPath("escaperun_progress_session.json");
  std::remove(path.c_str());
  ProgressStore store(path);
  if (!store.Load()) {
    return false;
  }

  bool firstHigh = false;
  {
    Session session(29u, PowerUpTuning{}, &store);
    session.Begin(ThemeType::Train);
    for (int i = 0; i < 120; ++i) {
      session.Step(cfg::kFixedDt);
    }
    const std::optional<GameOverData> data = session.End();
    firstHigh = data && data->IsHighScore();
  }

  ProgressStore reloaded(path);
  const bool loaded = reloaded.Load();
  std::remove(path.c_str());

  return firstHigh && loaded && reloaded.Data().gamesPlayed == 1 &&
         reloaded.Data().highScore > 0 &&
         reloaded.Data().totalCoins == cfg::kBaseCoinsPerRun;
}

} // namespace

int main() {
  Log::Init(nullptr);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("mutual_exclusion", TestMutualExclusion());
  run("switching_from_star_power_lands_player",
      TestSwitchingFromStarPowerLandsPlayer());
  run("reactivation_extends_timer", TestReactivationExtendsTimer());
  run("expiry_and_warning", TestExpiryAndWarning());
  run("duration_multiplier", TestDurationMultiplier());
  run("magnet_range_ability", TestMagnetRangeAbility());
  run("invalid_activations_rejected", TestInvalidActivationsRejected());
  run("mystery_box_resolves_to_effect", TestMysteryBoxResolvesToEffect());
  run("effect_lookup_skips_mystery_box", TestEffectLookupSkipsMysteryBox());
  run("mystery_box_deterministic_for_seed",
      TestMysteryBoxDeterministicForSeed());
  run("mystery_box_honours_weights", TestMysteryBoxHonoursWeights());
  run("shield_absorbs_one_hit", TestShieldAbsorbsOneHit());
  run("invincible_effects_keep_running", TestInvincibleEffectsKeepRunning());
  run("game_start_and_over_clear_effects",
      TestGameStartAndOverClearEffects());
  run("controller_unsubscribes_on_destruction",
      TestControllerUnsubscribesOnDestruction());
  run("player_lanes_and_actions", TestPlayerLanesAndActions());
  run("player_speed_ramp_and_cap", TestPlayerSpeedRampAndCap());
  run("coin_queries_and_removal", TestCoinQueriesAndRemoval());
  run("remove_attracted_coin_while_magnet_active",
      TestRemoveAttractedCoinWhileMagnetActive());
  run("score_formatting_and_game_over", TestScoreFormattingAndGameOver());
  run("session_begin_announces_theme", TestSessionBeginAnnouncesThemeThenStart());
  run("session_magnet_collects_off_lane_coin",
      TestSessionMagnetCollectsOffLaneCoin());
  run("session_multiplier_doubles_coin_points",
      TestSessionMultiplierDoublesCoinPoints());
  run("session_distance_scoring", TestSessionDistanceScoring());
  run("session_pause_freezes_time", TestSessionPauseFreezesTime());
  run("session_shield_survives_obstacle", TestSessionShieldSurvivesObstacle());
  run("session_fatal_hit_ends_run", TestSessionFatalHitEndsRun());
  run("session_end_builds_game_over_data",
      TestSessionEndBuildsGameOverData());
  run("session_restart_gets_fresh_systems",
      TestSessionRestartGetsFreshSystems());
  run("session_restart_from_game_over_handler",
      TestSessionRestartFromGameOverHandler());
  run("progress_round_trip", TestProgressRoundTrip());
  run("session_updates_progress_store", TestSessionUpdatesProgressStore());

  Log::Shutdown();
  return (failed == 0) ? 0 : 1;
}
