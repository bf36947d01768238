#pragma once

#include <raylib.h>

class EventBus;

enum class PlayerState {
  Idle,
  Running,
  Jumping,
  Sliding,
  Crashed,
};

// Three-lane runner. Owns the state power-ups act on: invincibility, the
// speed multiplier and altitude while flying.
//
// The bus is optional; without one the player simply stays silent.
class Player {
public:
  explicit Player(EventBus *bus = nullptr);

  void Reset();
  void StartRunning();

  // One fixed simulation tick.
  void Update(float dt);

  bool TryChangeLane(int direction);
  bool TryJump();
  bool TrySlide();

  // Fatal obstacle contact. Callers check invincibility first.
  void Crash();

  void SetInvincible(bool invincible);
  bool IsInvincible() const { return invincible; }

  // Boost multiplier on top of the run speed. It decays back toward 1 on
  // its own; effects that want to hold it re-apply it every tick.
  void SetSpeedMultiplier(float multiplier);
  float SpeedMultiplier() const { return speedMultiplier; }
  float RunSpeed() const { return runSpeed; }
  float CurrentSpeed() const;

  // While flying, altitude is driven externally through SetAltitude().
  void BeginFlight();
  void EndFlight();
  bool IsFlying() const { return flying; }
  void SetAltitude(float y);

  const Vector3 &Position() const { return position; }
  void SetPosition(const Vector3 &pos) { position = pos; }
  int Lane() const { return lane; }
  PlayerState State() const { return state; }
  bool IsAlive() const { return state != PlayerState::Crashed; }
  bool IsRunning() const {
    return state == PlayerState::Running || state == PlayerState::Jumping ||
           state == PlayerState::Sliding;
  }
  float DistanceRun() const { return distanceRun; }

private:
  void UpdateSpeed(float dt);
  void UpdateActionTimers(float dt);
  void UpdatePosition(float dt);

  EventBus *bus = nullptr;

  Vector3 position{};
  int lane = 1;
  PlayerState state = PlayerState::Idle;

  float runSpeed = 0.0f;
  float speedMultiplier = 1.0f;
  bool invincible = false;
  bool flying = false;

  float jumpTimer = 0.0f;
  float slideTimer = 0.0f;
  float distanceRun = 0.0f;
};
