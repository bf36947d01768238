#pragma once

#include <cmath>

#include <raylib.h>

// Small scalar/vector helpers shared by the gameplay code. raylib only
// supplies the Vector3 type here; nothing in this header touches a window.
namespace mathx {

inline float ClampMinZero(const float value) {
  return value < 0.0f ? 0.0f : value;
}

inline float Clamp(const float value, const float minValue,
                   const float maxValue) {
  if (value < minValue) {
    return minValue;
  }
  if (value > maxValue) {
    return maxValue;
  }
  return value;
}

inline float Clamp01(const float value) { return Clamp(value, 0.0f, 1.0f); }

inline float Lerp(const float a, const float b, const float t) {
  return a + (b - a) * t;
}

inline float MoveToward(const float current, const float target,
                        const float maxDelta) {
  if (current < target) {
    const float next = current + maxDelta;
    return (next > target) ? target : next;
  }
  const float next = current - maxDelta;
  return (next < target) ? target : next;
}

inline float Distance(const Vector3 &a, const Vector3 &b) {
  const float dx = a.x - b.x;
  const float dy = a.y - b.y;
  const float dz = a.z - b.z;
  return std::sqrt(dx * dx + dy * dy + dz * dz);
}

// Moves `current` toward `target` by at most maxDelta units.
inline Vector3 MoveToward(const Vector3 &current, const Vector3 &target,
                          const float maxDelta) {
  const float dist = Distance(current, target);
  if (dist <= maxDelta || dist <= 1e-6f) {
    return target;
  }
  const float t = maxDelta / dist;
  return Vector3{current.x + (target.x - current.x) * t,
                 current.y + (target.y - current.y) * t,
                 current.z + (target.z - current.z) * t};
}

} // namespace mathx
