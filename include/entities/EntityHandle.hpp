/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HANDLE_HPP
#define ENTITY_HANDLE_HPP

/**
 * @file EntityHandle.hpp
 * @brief Lightweight, copyable reference to an entity in the EntityRegistry
 *
 * Handles are the only way one subsystem refers to an entity owned by
 * another. A handle never dangles: once the entity is destroyed the
 * registry rejects the handle (its slot generation no longer matches), and
 * callers purge the stale reference instead of dereferencing it.
 */

#include "utils/UniqueID.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

enum class EntityKind : uint8_t {
    Player = 0,   // Connected character, owned by a session
    Creature = 1, // Spawned from a spawn rule or encounter table
    NPC = 2,      // Schedule-bound townsfolk, shopkeepers, guards
    Item = 3,     // Dropped loot and room loot

    COUNT
};

namespace EntityTraits {

/// Returns true if this entity kind has hit points and fights
constexpr bool isCombatant(EntityKind kind) noexcept {
    return kind == EntityKind::Player || kind == EntityKind::Creature ||
           kind == EntityKind::NPC;
}

/// Returns true if a session owns this kind of entity
constexpr bool isSessionOwned(EntityKind kind) noexcept {
    return kind == EntityKind::Player;
}

/// Returns string name for EntityKind (for debugging)
constexpr const char* kindToString(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Player:   return "Player";
        case EntityKind::Creature: return "Creature";
        case EntityKind::NPC:      return "NPC";
        case EntityKind::Item:     return "Item";
        default:                   return "Unknown";
    }
}

} // namespace EntityTraits

struct EntityHandle {
    using IDType = AnchorMud::UniqueID::IDType;  // uint64_t
    using Generation = uint8_t;

    static constexpr IDType INVALID_ID = 0;
    static constexpr Generation INVALID_GENERATION = 0;

    IDType id{INVALID_ID};
    EntityKind kind{EntityKind::Creature};
    Generation generation{INVALID_GENERATION};
    uint16_t padding{0};

    constexpr EntityHandle() noexcept = default;

    constexpr EntityHandle(IDType entityId, EntityKind entityKind,
                          Generation gen) noexcept
        : id(entityId), kind(entityKind), generation(gen), padding(0) {}

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return id != INVALID_ID && generation != INVALID_GENERATION;
    }

    [[nodiscard]] constexpr IDType getId() const noexcept { return id; }
    [[nodiscard]] constexpr EntityKind getKind() const noexcept { return kind; }
    [[nodiscard]] constexpr Generation getGeneration() const noexcept {
        return generation;
    }

    [[nodiscard]] constexpr bool isPlayer() const noexcept {
        return kind == EntityKind::Player;
    }
    [[nodiscard]] constexpr bool isCreature() const noexcept {
        return kind == EntityKind::Creature;
    }
    [[nodiscard]] constexpr bool isNPC() const noexcept {
        return kind == EntityKind::NPC;
    }
    [[nodiscard]] constexpr bool isItem() const noexcept {
        return kind == EntityKind::Item;
    }
    [[nodiscard]] constexpr bool isCombatant() const noexcept {
        return EntityTraits::isCombatant(kind);
    }

    [[nodiscard]] constexpr bool
    operator==(const EntityHandle& other) const noexcept {
        return id == other.id && generation == other.generation && kind == other.kind;
    }

    [[nodiscard]] constexpr bool
    operator!=(const EntityHandle& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] constexpr bool
    operator<(const EntityHandle& other) const noexcept {
        if (id != other.id) return id < other.id;
        if (generation != other.generation) return generation < other.generation;
        return static_cast<uint8_t>(kind) < static_cast<uint8_t>(other.kind);
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        std::size_t h = static_cast<std::size_t>(id);
        h ^= static_cast<std::size_t>(kind) << 48;
        h ^= static_cast<std::size_t>(generation) << 56;
        return h;
    }

    [[nodiscard]] std::string toString() const {
        if (!isValid()) {
            return "EntityHandle::INVALID";
        }
        return "EntityHandle(" + std::to_string(id) + ":" +
               EntityTraits::kindToString(kind) + ":" +
               std::to_string(generation) + ")";
    }
};

static_assert(sizeof(EntityHandle) == 16, "EntityHandle should be 16 bytes (8-byte aligned)");

inline constexpr EntityHandle INVALID_ENTITY_HANDLE{};

// Stream output operator for Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, const EntityHandle& handle) {
    return os << handle.toString();
}

namespace std {
template <>
struct hash<EntityHandle> {
    std::size_t operator()(const EntityHandle& handle) const noexcept {
        return handle.hash();
    }
};
} // namespace std

#endif // ENTITY_HANDLE_HPP
