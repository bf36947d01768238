#include "core/Rng.hpp"

namespace core {
uint32_t NextU32(uint32_t& state) {
    if (state == 0u) {
        state = 0xA341316Cu;
    }
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

float NextFloat01(uint32_t& state) {
    constexpr float invMaxU32 = 1.0f / 4294967295.0f;
    return static_cast<float>(NextU32(state)) * invMaxU32;
}

float NextRange(uint32_t& state, const float minValue, const float maxValue) {
    return minValue + (maxValue - minValue) * NextFloat01(state);
}

int NextInt(uint32_t& state, const int minInclusive, const int maxInclusive) {
    if (maxInclusive <= minInclusive) {
        return minInclusive;
    }
    const uint32_t span = static_cast<uint32_t>(maxInclusive - minInclusive) + 1u;
    return minInclusive + static_cast<int>(NextU32(state) % span);
}

size_t PickWeighted(uint32_t& state, const float* weights, const size_t count) {
    float total = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        if (weights[i] > 0.0f) {
            total += weights[i];
        }
    }
    if (count == 0 || total <= 0.0f) {
        return 0;
    }

    const float roll = NextFloat01(state) * total;
    float cumulative = 0.0f;
    size_t lastPicked = 0;
    for (size_t i = 0; i < count; ++i) {
        if (weights[i] <= 0.0f) {
            continue;
        }
        cumulative += weights[i];
        lastPicked = i;
        if (roll <= cumulative) {
            return i;
        }
    }
    // Float rounding can leave roll a hair above the final sum.
    return lastPicked;
}
}  // namespace core
