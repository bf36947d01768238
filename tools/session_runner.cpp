// session_runner - headless power-up session driver
//
// Plays one endless-runner session with a deterministic scripted bot and
// reports what the power-up system did. Used for tuning checks and
// regression runs without a window.
//
// Usage:
//   session_runner [options]
//     --seed <hex|dec>     Session seed (default: 0xC0FFEE)
//     --ticks <n>          Max ticks at 60 Hz (default: 7200 = 2 min)
//     --theme <name>       train|bus|ground (default: train)
//     --tuning <path>      Power-up tuning JSON (default: assets/config/powerups.json)
//     --progress <path>    Progress file to update (default: none)
//     --json               Output as JSON instead of plain text
//     --quiet              Only output final summary line
//     -h, --help           Print usage

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "game/ProgressStore.hpp"
#include "game/Session.hpp"
#include "sim/PowerUpTuning.hpp"

namespace {

struct RunnerArgs {
  uint32_t seed = 0xC0FFEEu;
  int maxTicks = 7200; // 2 minutes at 60 Hz
  ThemeType theme = ThemeType::Train;
  std::string tuningPath;
  std::string progressPath;
  bool json = false;
  bool quiet = false;
  bool help = false;
};

// Scripted bot cadence, in ticks.
constexpr int kCoinEvery = 20;
constexpr int kPickupEvery = 420;
constexpr int kObstacleEvery = 180;
constexpr int kLaneChangeEvery = 50;
constexpr int kJumpEvery = 95;
constexpr float kSpawnAhead = 25.0f;
constexpr float kPickupAheadMin = 15.0f;
constexpr float kPickupAheadMax = 30.0f;
constexpr float kDodgeChance = 0.8f;

uint32_t ParseSeed(const char *str) {
  // Accept 0x prefix for hex, otherwise decimal.
  return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

ThemeType ParseTheme(const char *str) {
  if (std::strcmp(str, "bus") == 0)
    return ThemeType::Bus;
  if (std::strcmp(str, "ground") == 0 || std::strcmp(str, "park") == 0)
    return ThemeType::Ground;
  return ThemeType::Train;
}

RunnerArgs ParseArgs(int argc, char *argv[]) {
  RunnerArgs args{};
  for (int i = 1; i < argc; ++i) {
    if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
      args.seed = ParseSeed(argv[++i]);
    } else if ((std::strcmp(argv[i], "--ticks") == 0) && i + 1 < argc) {
      args.maxTicks = std::atoi(argv[++i]);
      if (args.maxTicks < 0)
        args.maxTicks = 0;
    } else if ((std::strcmp(argv[i], "--theme") == 0) && i + 1 < argc) {
      args.theme = ParseTheme(argv[++i]);
    } else if ((std::strcmp(argv[i], "--tuning") == 0) && i + 1 < argc) {
      args.tuningPath = argv[++i];
    } else if ((std::strcmp(argv[i], "--progress") == 0) && i + 1 < argc) {
      args.progressPath = argv[++i];
    } else if (std::strcmp(argv[i], "--json") == 0) {
      args.json = true;
    } else if (std::strcmp(argv[i], "--quiet") == 0) {
      args.quiet = true;
    } else if (std::strcmp(argv[i], "-h") == 0 ||
               std::strcmp(argv[i], "--help") == 0) {
      args.help = true;
    }
  }
  return args;
}

void PrintUsage() {
  std::printf(
      "session_runner - headless EscapeRun power-up session driver\n"
      "\n"
      "Usage: session_runner [options]\n"
      "  --seed <hex|dec>     Session seed (default: 0xC0FFEE)\n"
      "  --ticks <n>          Max ticks at 60 Hz (default: 7200 = 2 min)\n"
      "  --theme <name>       train|bus|ground (default: train)\n"
      "  --tuning <path>      Power-up tuning JSON (default: "
      "assets/config/powerups.json)\n"
      "  --progress <path>    Progress file to update (default: none)\n"
      "  --json               Output as JSON\n"
      "  --quiet              Only final summary line\n"
      "  -h, --help           This message\n");
}

// Event tallies gathered from the bus while the session runs.
struct RunTally {
  std::array<int, kPowerUpEffectCount> activations{};
  int coinValue = 0;
  int lanesChanged = 0;
  int jumps = 0;
  int pickupsMissed = 0;
};

void SubscribeTally(EventBus &bus, RunTally &tally) {
  bus.SubscribeTo<PowerUpType>(GameEvent::PowerUpActivated,
                               [&tally](const PowerUpType &type) {
                                 if (HasEffect(type))
                                   ++tally.activations[EffectIndex(type)];
                               });
  bus.SubscribeTo<int>(GameEvent::CoinsCollected,
                       [&tally](const int &value) { tally.coinValue += value; });
  bus.Subscribe(GameEvent::LaneChanged,
                [&tally](const EventPayload &) { ++tally.lanesChanged; });
  bus.Subscribe(GameEvent::PlayerJumped,
                [&tally](const EventPayload &) { ++tally.jumps; });
}

float LaneX(int lane) {
  return static_cast<float>(lane - cfg::kCenterLane) * cfg::kLaneWidth;
}

// Pickups the player reaches in their lane are collected; the rest are
// missed once passed.
void SweepPickups(Session &session, std::vector<PowerUpPickup> &pickups,
                  RunTally &tally) {
  const Vector3 &pos = session.GetPlayer().Position();
  for (auto &pickup : pickups) {
    if (!pickup.active || pos.z < pickup.position.z) {
      continue;
    }
    pickup.active = false;
    if (std::fabs(pos.x - pickup.position.x) <= cfg::kLaneWidth * 0.5f) {
      session.OnPowerUpPickup(pickup.type);
    } else {
      ++tally.pickupsMissed;
    }
  }
  pickups.erase(std::remove_if(pickups.begin(), pickups.end(),
                               [](const PowerUpPickup &p) { return !p.active; }),
                pickups.end());
}

// One tick of scripted input and track spawns.
void BotStep(Session &session, std::vector<PowerUpPickup> &pickups,
             RunTally &tally, uint32_t &botRng, int tick) {
  Player &player = session.GetPlayer();

  if (tick % kCoinEvery == 0) {
    const int lane = core::NextInt(botRng, 0, cfg::kLaneCount - 1);
    const bool special = core::NextFloat01(botRng) < 0.1f;
    session.OnCoinSpawn({LaneX(lane), cfg::kGroundY,
                         player.Position().z + kSpawnAhead},
                        special ? cfg::kSpecialCoinValue
                                : cfg::kRegularCoinValue);
  }

  if (tick % kLaneChangeEvery == 0) {
    player.TryChangeLane(core::NextFloat01(botRng) < 0.5f ? -1 : 1);
  }
  if (tick % kJumpEvery == 0) {
    player.TryJump();
  }

  if (tick > 0 && tick % kPickupEvery == 0) {
    PowerUpPickup pickup{};
    const int kind = core::NextInt(botRng, 0, static_cast<int>(PowerUpType::MysteryBox));
    pickup.type = static_cast<PowerUpType>(kind);
    // Placed in the lane the player is heading for so most are reached.
    pickup.position = {LaneX(player.Lane()), cfg::kGroundY,
                       player.Position().z +
                           core::NextRange(botRng, kPickupAheadMin,
                                           kPickupAheadMax)};
    pickups.push_back(pickup);
  }
  SweepPickups(session, pickups, tally);

  if (tick > 0 && tick % kObstacleEvery == 0) {
    if (core::NextFloat01(botRng) >= kDodgeChance) {
      session.OnObstacleHit();
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  const RunnerArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage();
    return 0;
  }

  CrashHandler::Init();
  Log::Init(nullptr);
  if (args.quiet || args.json) {
    Log::SetLevel(spdlog::level::warn);
  }

  // --- Tuning ---
  PowerUpTuning tuning{};
  const std::string tuningPath = args.tuningPath.empty()
                                     ? assets::Path("config/powerups.json")
                                     : args.tuningPath;
  bool tuningLoaded = false;
  if (!args.tuningPath.empty() || assets::Exists("config/powerups.json")) {
    tuningLoaded = LoadTuningFromFile(tuning, tuningPath);
  }

  std::unique_ptr<ProgressStore> store;
  if (!args.progressPath.empty()) {
    store = std::make_unique<ProgressStore>(args.progressPath);
    if (!store->Load()) {
      LOG_WARN("Progress file unreadable, starting a fresh profile");
      store = std::make_unique<ProgressStore>(args.progressPath);
    }
  }

  // --- Run ---
  Session session(args.seed == 0u ? 1u : args.seed, tuning, store.get());
  session.Begin(args.theme);

  RunTally tally{};
  SubscribeTally(session.Bus(), tally);
  uint32_t botRng = args.seed ^ 0x12345678u;
  std::vector<PowerUpPickup> pickups;

  using Clock = std::chrono::steady_clock;
  const auto wallStart = Clock::now();

  int ticksRun = 0;
  for (int t = 0; t < args.maxTicks; ++t) {
    BotStep(session, pickups, tally, botRng, t);
    if (!session.IsRunning()) {
      break;
    }
    session.Step(cfg::kFixedDt);
    ++ticksRun;
  }

  const bool survived = session.IsRunning();
  const std::optional<GameOverData> result =
      survived ? session.End() : session.LastGameOver();

  const auto wallEnd = Clock::now();
  const float wallMs =
      std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();

  const SessionStats &stats = session.Stats();
  const int score = result ? result->FinalScore() : session.Score().CurrentScore();
  const int coins = result ? result->CoinsCollected() : 0;
  const float distance = session.Score().DistanceTraveled();
  const bool highScore = result && result->IsHighScore();

  // --- Output ---
  if (args.json) {
    nlohmann::json out;
    char seedStr[16];
    std::snprintf(seedStr, sizeof(seedStr), "0x%08X", args.seed);
    out["seed"] = seedStr;
    out["theme"] = GetThemeName(args.theme);
    out["tuning_loaded"] = tuningLoaded;
    out["ticks_run"] = ticksRun;
    out["ticks_max"] = args.maxTicks;
    out["run_time"] = session.RunTime();
    out["distance"] = distance;
    out["score"] = score;
    out["coins"] = coins;
    out["coin_value_collected"] = tally.coinValue;
    out["high_score"] = highScore;
    out["status"] = survived ? "SURVIVED" : "CRASHED";
    out["pickups"] = stats.powerUpsCollected;
    out["pickups_missed"] = tally.pickupsMissed;
    out["obstacle_hits"] = stats.obstacleHits;
    out["hits_absorbed"] = stats.hitsAbsorbed;
    out["lane_changes"] = tally.lanesChanged;
    out["jumps"] = tally.jumps;
    auto &activations = out["activations"];
    for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
      activations[GetPowerUpName(static_cast<PowerUpType>(i))] =
          tally.activations[i];
    }
    out["wall_ms"] = wallMs;
    std::printf("%s\n", out.dump(2).c_str());
  } else if (args.quiet) {
    std::printf("seed=0x%08X  status=%-9s  score=%-8d  dist=%-8.1f  "
                "pickups=%-3d  absorbed=%-3d  time=%.2fs\n",
                args.seed, survived ? "SURVIVED" : "CRASHED", score, distance,
                stats.powerUpsCollected, stats.hitsAbsorbed, session.RunTime());
  } else {
    std::printf("=== EscapeRun Session Runner ===\n");
    std::printf("seed:        0x%08X\n", args.seed);
    std::printf("theme:       %s\n", GetThemeName(args.theme));
    std::printf("tuning:      %s\n", tuningLoaded ? tuningPath.c_str() : "defaults");
    std::printf("ticks:       %d / %d\n", ticksRun, args.maxTicks);
    std::printf("run_time:    %.2f s\n", session.RunTime());
    std::printf("distance:    %s\n", session.Score().FormattedDistance().c_str());
    std::printf("score:       %d%s\n", score, highScore ? " (new high score)" : "");
    std::printf("coins:       %d\n", coins);
    std::printf("pickups:     %d (%d missed)\n", stats.powerUpsCollected,
                tally.pickupsMissed);
    for (size_t i = 0; i < kPowerUpEffectCount; ++i) {
      const auto type = static_cast<PowerUpType>(i);
      std::printf("  %-14s %-3d %s\n", GetPowerUpName(type),
                  tally.activations[i], GetPowerUpDescription(type));
    }
    std::printf("hits:        %d (%d absorbed)\n", stats.obstacleHits,
                stats.hitsAbsorbed);
    std::printf("status:      %s\n", survived ? "SURVIVED" : "CRASHED");
    std::printf("wall_time:   %.2f ms\n", wallMs);
  }

  Log::Shutdown();
  return survived ? 0 : 1;
}
