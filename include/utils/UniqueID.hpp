/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace AnchorMud {

// One counter per id space
enum class IdSpace : uint8_t {
    Entity = 0,       // EntityRegistry slots
    Encounter = 1,    // Creatures spawned together by one encounter roll
    CombatSession = 2,

    COUNT
};

/**
 * @brief Process-wide id generator. Ids within a space are never reused
 * while the server runs, so a stale reference cannot alias a newer one.
 */
class UniqueID {
public:
    using IDType = uint64_t;

    static constexpr IDType INVALID_ID = 0;

    static IDType generate(IdSpace space = IdSpace::Entity) {
        return counter(space).fetch_add(1, std::memory_order_relaxed);
    }

    /// Next id that generate() would hand out (diagnostics only)
    static IDType peek(IdSpace space) {
        return counter(space).load(std::memory_order_relaxed);
    }

private:
    static std::atomic<IDType>& counter(IdSpace space) {
        return s_counters[static_cast<size_t>(space)];
    }

    // All counters start at 1 so INVALID_ID is never produced
    static inline std::array<std::atomic<IDType>, static_cast<size_t>(IdSpace::COUNT)>
        s_counters{{{1}, {1}, {1}}};
};

} // namespace AnchorMud

#endif // UNIQUE_ID_HPP
