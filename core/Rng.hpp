#pragma once

#include <cstddef>
#include <cstdint>

namespace core {

// Xorshift32 helpers. All state is explicit so sessions stay deterministic
// for a given seed.
uint32_t NextU32(uint32_t& state);
float NextFloat01(uint32_t& state);
float NextRange(uint32_t& state, float minValue, float maxValue);
int NextInt(uint32_t& state, int minInclusive, int maxInclusive);

// Returns an index into weights[0..count) chosen proportionally to its
// weight, or 0 when every weight is zero.
size_t PickWeighted(uint32_t& state, const float* weights, size_t count);

}  // namespace core
