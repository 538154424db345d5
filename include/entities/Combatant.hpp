/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBATANT_HPP
#define COMBATANT_HPP

/**
 * @file Combatant.hpp
 * @brief One capability interface over the three fighting entity kinds
 *
 * A Combatant is a short-lived view over an EntityInstance copy taken under
 * the room lock. The combat code reads and mutates through the view, then
 * writes the instance back to the registry.
 */

#include "entities/EntityInstance.hpp"
#include <memory>
#include <string>
#include <string_view>

enum class CombatSide : uint8_t {
    Players = 0,
    World = 1
};

class Combatant {
public:
    virtual ~Combatant() = default;

    Combatant(const Combatant&) = delete;
    Combatant& operator=(const Combatant&) = delete;

    [[nodiscard]] EntityHandle getHandle() const { return m_handle; }
    [[nodiscard]] std::string_view getName() const { return m_instance.name; }
    [[nodiscard]] virtual CombatSide getSide() const = 0;

    /**
     * @brief Whether reaching zero hit points destroys the instance.
     * Players are restored elsewhere instead of being removed.
     */
    [[nodiscard]] virtual bool isRemovedOnDeath() const = 0;

    /**
     * @brief The attack a basic attack uses: equipped weapon, natural
     * attack, or the unarmed fallback, in that order.
     */
    [[nodiscard]] virtual const AnchorMud::AttackProfile& getAttackProfile() const;

    [[nodiscard]] int getAccuracy() const;
    [[nodiscard]] std::string getWeaponName() const {
        return m_stats.weapon.has_value() ? m_stats.weapon->name : std::string();
    }
    [[nodiscard]] bool hasWeapon() const { return m_stats.weapon.has_value(); }
    [[nodiscard]] int getAvoidance() const { return m_stats.avoidance; }
    [[nodiscard]] int getInitiativeBonus() const { return m_stats.initiativeBonus; }
    [[nodiscard]] int getHitPoints() const { return m_stats.hpCurrent; }
    [[nodiscard]] int getMaxHitPoints() const { return m_stats.hpMax; }
    [[nodiscard]] int getStamina() const { return m_stats.staminaCurrent; }
    [[nodiscard]] bool isAlive() const { return m_stats.hpCurrent > 0; }
    [[nodiscard]] const AnchorMud::BehaviorProfile& getBehavior() const {
        return m_stats.behavior;
    }
    [[nodiscard]] bool knowsManeuver(std::string_view maneuverId) const;

    [[nodiscard]] bool canTarget(const Combatant& other) const {
        return other.getHandle() != getHandle() && other.getSide() != getSide();
    }

    /**
     * @brief Subtract hit points, clamped to [0, max].
     * @return Hit points remaining
     */
    int applyDamage(int amount);
    void restoreHitPoints(int amount);

    bool spendStamina(int cost);
    void regainStamina(int amount);

    std::vector<ArmorPiece>& getArmor() { return m_stats.armor; }

    /**
     * @brief Wear the equipped weapon after a hit.
     * @return true if the weapon broke and was unequipped
     */
    bool wearWeapon(int amount);

protected:
    Combatant(EntityHandle handle, EntityInstance& instance, CombatStats& stats,
              const AnchorMud::AttackProfile& unarmed)
        : m_handle(handle), m_instance(instance), m_stats(stats), m_unarmed(unarmed) {}

    EntityHandle m_handle;
    EntityInstance& m_instance;
    CombatStats& m_stats;
    const AnchorMud::AttackProfile& m_unarmed;
};

class PlayerCombatant final : public Combatant {
public:
    PlayerCombatant(EntityHandle handle, EntityInstance& instance, PlayerData& data,
                    const AnchorMud::AttackProfile& unarmed)
        : Combatant(handle, instance, data.combat, unarmed) {}

    [[nodiscard]] CombatSide getSide() const override { return CombatSide::Players; }
    [[nodiscard]] bool isRemovedOnDeath() const override { return false; }
};

class CreatureCombatant final : public Combatant {
public:
    CreatureCombatant(EntityHandle handle, EntityInstance& instance, CreatureData& data,
                      const AnchorMud::AttackProfile& unarmed)
        : Combatant(handle, instance, data.combat, unarmed) {}

    [[nodiscard]] CombatSide getSide() const override { return CombatSide::World; }
    [[nodiscard]] bool isRemovedOnDeath() const override { return true; }
};

class NpcCombatant final : public Combatant {
public:
    NpcCombatant(EntityHandle handle, EntityInstance& instance, NpcData& data,
                 const AnchorMud::AttackProfile& unarmed)
        : Combatant(handle, instance, data.combat, unarmed), m_hostile(data.hostile) {}

    [[nodiscard]] CombatSide getSide() const override { return CombatSide::World; }
    [[nodiscard]] bool isRemovedOnDeath() const override { return true; }
    [[nodiscard]] bool isHostile() const { return m_hostile; }

private:
    bool m_hostile;
};

/**
 * @brief Build the matching view for a combatant instance.
 * @return nullptr for items
 */
std::unique_ptr<Combatant> makeCombatant(EntityHandle handle, EntityInstance& instance,
                                         const AnchorMud::AttackProfile& unarmed);

#endif // COMBATANT_HPP
