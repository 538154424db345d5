/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DICE_ROLLER_HPP
#define DICE_ROLLER_HPP

/**
 * @file DiceRoller.hpp
 * @brief Random rolls for combat and content generation
 *
 * DiceRoller wraps a std::mt19937. Seeded instances give reproducible
 * sequences (spawn counts, weather, loot); the default instance per thread is
 * seeded from std::random_device. rollRange() and unit() are virtual so tests
 * can script exact outcomes.
 */

#include <cstdint>
#include <random>
#include <string_view>

namespace AnchorMud {

/**
 * @brief FNV-1a over a key, mixed with a base seed and a salt
 * (splitmix64 finalizer). Stable across platforms and runs.
 */
inline uint64_t deriveSeed(uint64_t base, std::string_view key, uint64_t salt = 0) {
    uint64_t hash = 14695981039346656037ULL;
    for (char c : key) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 1099511628211ULL;
    }
    uint64_t z = base ^ hash ^ (salt * 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

class DiceRoller {
public:
    DiceRoller() : m_rng(std::random_device{}()) {}
    explicit DiceRoller(uint64_t seed) : m_rng(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32))) {}
    virtual ~DiceRoller() = default;

    /**
     * @brief Uniform integer in [min, max]; returns min when max < min
     */
    virtual int rollRange(int min, int max) {
        if (max <= min) {
            return min;
        }
        std::uniform_int_distribution<int> dist(min, max);
        return dist(m_rng);
    }

    /**
     * @brief Uniform float in [0, 1)
     */
    virtual float unit() {
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        return dist(m_rng);
    }

    int d100() { return rollRange(1, 100); }
    int d20() { return rollRange(1, 20); }

    /**
     * @brief Shared per-thread roller for unseeded rolls
     */
    static DiceRoller& threadLocal() {
        static thread_local DiceRoller roller;
        return roller;
    }

private:
    std::mt19937 m_rng;
};

} // namespace AnchorMud

#endif // DICE_ROLLER_HPP
