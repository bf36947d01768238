#include "game/Player.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/MathUtils.hpp"
#include "events/EventBus.hpp"

namespace {

float LaneToWorldX(const int lane) {
  return static_cast<float>(lane - cfg::kCenterLane) * cfg::kLaneWidth;
}

// Parabolic jump offset for normalized jump time t in [0, 1].
float JumpOffset(const float t) {
  return 4.0f * cfg::kJumpHeight * t * (1.0f - t);
}

} // namespace

Player::Player(EventBus *bus) : bus(bus) { Reset(); }

void Player::Reset() {
  position = Vector3{0.0f, cfg::kGroundY, 0.0f};
  lane = cfg::kCenterLane;
  state = PlayerState::Idle;
  runSpeed = cfg::kBaseRunSpeed;
  speedMultiplier = 1.0f;
  invincible = false;
  flying = false;
  jumpTimer = 0.0f;
  slideTimer = 0.0f;
  distanceRun = 0.0f;
}

void Player::StartRunning() {
  if (state == PlayerState::Crashed) {
    return;
  }
  state = PlayerState::Running;
}

void Player::Update(const float dt) {
  if (!IsRunning()) {
    return;
  }
  UpdateSpeed(dt);
  UpdateActionTimers(dt);
  UpdatePosition(dt);

  if (bus) {
    bus->Publish(GameEvent::PlayerMoved, position);
  }
}

void Player::UpdateSpeed(const float dt) {
  runSpeed = mathx::Clamp(runSpeed + cfg::kSpeedIncreaseRate * dt,
                          cfg::kBaseRunSpeed, cfg::kMaxRunSpeed);
  speedMultiplier =
      mathx::MoveToward(speedMultiplier, 1.0f, cfg::kSpeedMultiplierDecay * dt);
}

void Player::UpdateActionTimers(const float dt) {
  if (state == PlayerState::Jumping) {
    jumpTimer = mathx::ClampMinZero(jumpTimer - dt);
    if (jumpTimer <= 0.0f) {
      state = PlayerState::Running;
    }
  } else if (state == PlayerState::Sliding) {
    slideTimer = mathx::ClampMinZero(slideTimer - dt);
    if (slideTimer <= 0.0f) {
      state = PlayerState::Running;
    }
  }
}

void Player::UpdatePosition(const float dt) {
  const float step = CurrentSpeed() * dt;
  position.z += step;
  distanceRun += step;

  const float targetX = LaneToWorldX(lane);
  position.x = mathx::Lerp(position.x, targetX,
                           mathx::Clamp01(cfg::kLaneChangeSpeed * dt));

  if (flying) {
    return;
  }
  if (state == PlayerState::Jumping) {
    const float t = 1.0f - jumpTimer / cfg::kJumpDuration;
    position.y = cfg::kGroundY + JumpOffset(mathx::Clamp01(t));
  } else {
    position.y = cfg::kGroundY;
  }
}

bool Player::TryChangeLane(const int direction) {
  if (!IsRunning() || direction == 0) {
    return false;
  }
  const int target = lane + (direction > 0 ? 1 : -1);
  if (target < 0 || target >= cfg::kLaneCount) {
    return false;
  }
  lane = target;
  if (bus) {
    bus->Publish(GameEvent::LaneChanged, lane);
  }
  return true;
}

bool Player::TryJump() {
  if (!IsRunning() || state == PlayerState::Jumping || flying) {
    return false;
  }
  // A jump cancels a slide in progress.
  slideTimer = 0.0f;
  state = PlayerState::Jumping;
  jumpTimer = cfg::kJumpDuration;
  if (bus) {
    bus->Publish(GameEvent::PlayerJumped);
  }
  return true;
}

bool Player::TrySlide() {
  if (!IsRunning() || state == PlayerState::Sliding || flying) {
    return false;
  }
  // Sliding mid-air drops straight back to the ground.
  jumpTimer = 0.0f;
  position.y = cfg::kGroundY;
  state = PlayerState::Sliding;
  slideTimer = cfg::kSlideDuration;
  if (bus) {
    bus->Publish(GameEvent::PlayerSlide);
  }
  return true;
}

void Player::Crash() {
  if (state == PlayerState::Crashed) {
    return;
  }
  state = PlayerState::Crashed;
  LOG_INFO("[Player] Crashed at z={:.1f}", position.z);
  if (bus) {
    bus->Publish(GameEvent::PlayerCrashed);
  }
}

void Player::SetInvincible(const bool value) {
  if (invincible == value) {
    return;
  }
  invincible = value;
  LOG_DEBUG("[Player] Invincibility: {}", invincible);
}

void Player::SetSpeedMultiplier(const float multiplier) {
  if (multiplier <= 0.0f) {
    LOG_WARN("[Player] Ignoring non-positive speed multiplier {}", multiplier);
    return;
  }
  speedMultiplier = multiplier;
}

float Player::CurrentSpeed() const {
  return mathx::Clamp(runSpeed * speedMultiplier, 0.0f,
                      cfg::kMaxRunSpeed * cfg::kBoostedSpeedCap);
}

void Player::BeginFlight() {
  flying = true;
  jumpTimer = 0.0f;
  slideTimer = 0.0f;
  if (state == PlayerState::Jumping || state == PlayerState::Sliding) {
    state = PlayerState::Running;
  }
}

void Player::EndFlight() { flying = false; }

void Player::SetAltitude(const float y) { position.y = y; }
