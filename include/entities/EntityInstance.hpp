/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_INSTANCE_HPP
#define ENTITY_INSTANCE_HPP

/**
 * @file EntityInstance.hpp
 * @brief Runtime data for one live entity, tagged by kind
 *
 * The payload variant carries the per-kind fields (player, creature, npc,
 * item); the shared core (template id, name, expiry, reservation, spawn
 * bookkeeping) lives on EntityInstance itself. The template id is fixed at
 * construction.
 */

#include "entities/EntityHandle.hpp"
#include "world/WorldData.hpp"
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct ArmorPiece {
    std::string templateId;
    std::string name;
    AnchorMud::ArmorStats stats;
    int durability{0};
    bool brokenAnnounced{false};

    [[nodiscard]] bool isBroken() const { return durability <= 0; }
};

struct WeaponState {
    std::string templateId;
    std::string name;
    AnchorMud::AttackProfile profile;
    int durability{0};
    int maxDurability{0};
};

struct CombatStats {
    int hpCurrent{1};
    int hpMax{1};
    int staminaCurrent{0};
    int staminaMax{0};
    int accuracy{50};
    int avoidance{40};
    int initiativeBonus{0};
    AnchorMud::AttackProfile naturalAttack;  // Creature claws, or unset for players
    bool hasNaturalAttack{false};
    std::optional<WeaponState> weapon;
    std::vector<ArmorPiece> armor;
    std::vector<std::string> maneuvers;
    AnchorMud::BehaviorProfile behavior;
    std::string lootTableId;
};

struct PlayerData {
    std::string sessionId;
    std::string accountName;
    CombatStats combat;
    std::vector<std::string> inventory;   // Item template ids carried
    bool connected{true};
    double disconnectedAt{0.0};

    [[nodiscard]] bool graceExpired(double now, double graceSeconds) const {
        return !connected && now - disconnectedAt >= graceSeconds;
    }
};

struct CreatureData {
    CombatStats combat;
};

struct NpcData {
    CombatStats combat;
    bool hostile{false};
};

struct ItemData {
    int quantity{1};
    int durability{0};
    int maxDurability{0};
};

using EntityPayload = std::variant<PlayerData, CreatureData, NpcData, ItemData>;

/**
 * @brief Binds an entity to a room. Room changes go through
 * EntityRegistry::moveTo and nothing else.
 */
struct EntityPosition {
    std::string roomId;
    std::optional<AnchorMud::RangeBand> band;
    EntityHandle engagedTarget;
};

class EntityInstance {
public:
    EntityInstance(std::string templateId, std::string displayName, EntityPayload data)
        : m_templateId(std::move(templateId)), name(std::move(displayName)),
          payload(std::move(data)) {}

    [[nodiscard]] const std::string& getTemplateId() const { return m_templateId; }

    [[nodiscard]] EntityKind getKind() const {
        switch (payload.index()) {
            case 0: return EntityKind::Player;
            case 1: return EntityKind::Creature;
            case 2: return EntityKind::NPC;
            default: return EntityKind::Item;
        }
    }

    [[nodiscard]] bool isCombatant() const { return combat() != nullptr; }

    CombatStats* combat() {
        return const_cast<CombatStats*>(std::as_const(*this).combat());
    }

    [[nodiscard]] const CombatStats* combat() const {
        if (const auto* p = std::get_if<PlayerData>(&payload)) return &p->combat;
        if (const auto* c = std::get_if<CreatureData>(&payload)) return &c->combat;
        if (const auto* n = std::get_if<NpcData>(&payload)) return &n->combat;
        return nullptr;
    }

    PlayerData* player() { return std::get_if<PlayerData>(&payload); }
    [[nodiscard]] const PlayerData* player() const { return std::get_if<PlayerData>(&payload); }
    ItemData* item() { return std::get_if<ItemData>(&payload); }
    [[nodiscard]] const ItemData* item() const { return std::get_if<ItemData>(&payload); }

    [[nodiscard]] bool isExpired(double now) const {
        return expiresAt.has_value() && now >= *expiresAt;
    }

private:
    std::string m_templateId;

public:
    std::string name;
    EntityPayload payload;
    std::optional<double> expiresAt;
    EntityHandle reservedFor;      // Loot reservation for one player
    std::string spawnRuleId;       // Rule whose alive count this instance holds
    std::string homeRoom;          // Leash origin for pursuers
    uint64_t encounterId{0};       // Shared by one random-encounter group
};

#endif // ENTITY_INSTANCE_HPP
