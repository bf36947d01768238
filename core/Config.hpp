#pragma once

namespace cfg {
constexpr float kFixedDt = 1.0f / 60.0f;

// --- Player movement ---
constexpr int kLaneCount = 3;
constexpr int kCenterLane = 1;
constexpr float kLaneWidth = 2.5f;
constexpr float kLaneChangeSpeed = 10.0f; // lateral easing rate
constexpr float kJumpHeight = 2.5f;
constexpr float kJumpDuration = 0.5f;
constexpr float kSlideDuration = 0.8f;
constexpr float kGroundY = 0.0f;

// --- Run speed ---
constexpr float kBaseRunSpeed = 15.0f;
constexpr float kMaxRunSpeed = 35.0f;
constexpr float kSpeedIncreaseRate = 0.1f; // units/s gained per second
constexpr float kBoostedSpeedCap = 2.0f;   // x kMaxRunSpeed
constexpr float kSpeedMultiplierDecay = 0.5f; // multiplier units per second

// --- Coins ---
constexpr float kMagnetUpdateInterval = 0.1f;
constexpr float kCoinAttractSpeed = 20.0f;
constexpr float kCoinPickupRadius = 1.0f;
constexpr int kRegularCoinValue = 1;
constexpr int kSpecialCoinValue = 5;

// --- Scoring ---
constexpr int kPointsPerMeter = 1;
constexpr int kPointsPerCoin = 10;
constexpr int kBaseCoinsPerRun = 5;

// --- Power-up durations (seconds) ---
constexpr float kMagnetDuration = 10.0f;
constexpr float kShieldDuration = 10.0f;
constexpr float kSpeedBoostDuration = 5.0f;
constexpr float kStarPowerDuration = 8.0f;
constexpr float kMultiplierDuration = 15.0f;
constexpr float kPowerUpWarningTime = 3.0f; // warn this long before expiry

// --- Power-up magnitudes ---
constexpr float kMagnetRange = 5.0f;
constexpr float kSpeedBoostMultiplier = 2.0f;
constexpr int kMultiplierValue = 2;
constexpr float kStarFlyHeight = 3.0f;
constexpr float kStarTransitionSpeed = 5.0f;
constexpr float kStarCollectRange = 8.0f;

// Shield bubble animation
constexpr float kShieldBaseScale = 2.0f;
constexpr float kShieldPulseSpeed = 2.0f;
constexpr float kShieldPulseIntensity = 0.2f;
constexpr float kShieldRotationSpeed = 30.0f; // deg per second

// Mystery box roll weights: Magnet, Shield, SpeedBoost, StarPower, Multiplier
constexpr float kMysteryWeights[5] = {0.25f, 0.20f, 0.20f, 0.15f, 0.20f};

} // namespace cfg
