/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_RESOLVER_HPP
#define COMBAT_RESOLVER_HPP

/**
 * @file CombatResolver.hpp
 * @brief Single-attack resolution: hit contest, damage, armor, wear
 *
 * The resolver owns no state besides its tuning. It mutates the two
 * Combatant views it is given (hit points, armor durability, weapon
 * durability); the caller writes the instances back to the registry and
 * turns the outcome into events.
 */

#include "core/RuntimeSettings.hpp"
#include "entities/Combatant.hpp"
#include <string>
#include <vector>

namespace AnchorMud {
class DiceRoller;
}

// Situational inputs for one attack
struct AttackContext {
    int accuracyBonus{0};           // Maneuver bonus
    int damageBonus{0};             // Maneuver bonus, added before scaling
    float damageMultiplier{1.0f};
    uint8_t attackerModifiers{AnchorMud::CombatModifier::NONE};
    uint8_t defenderModifiers{AnchorMud::CombatModifier::NONE};
    int situationalAccuracy{0};     // Weather, range
    float extraWearChance{0.0f};
};

struct ArmorAbsorption {
    std::string pieceName;
    int absorbed{0};
    bool broke{false};   // Reached zero durability on this hit
};

struct AttackOutcome {
    bool hit{false};
    bool critical{false};
    bool glancing{false};
    int attackRoll{0};
    int defenseRoll{0};
    int effectiveAccuracy{0};
    int effectiveAvoidance{0};
    int rawDamage{0};      // Damage entering armor mitigation
    int finalDamage{0};    // Damage applied to hit points
    int remainingHitPoints{0};
    bool killed{false};
    bool weaponBroke{false};
    std::string weaponName;
    std::string verb;
    AnchorMud::DamageType damageType{AnchorMud::DamageType::Bludgeoning};
    std::vector<ArmorAbsorption> absorptions;
};

class CombatResolver {
public:
    static constexpr int EXPOSED_PENALTY = 15;
    static constexpr int PINNED_PENALTY = 25;
    static constexpr int STAGGERED_PENALTY = 15;
    static constexpr float GLANCING_BAND = 0.8f;

    explicit CombatResolver(const AnchorMud::RuntimeSettings& settings = {});

    /**
     * @brief Resolve one attack from attacker against defender.
     *
     * Roll order: attacker d100, defender d100, then on a hit the critical
     * fraction and the damage roll. Scripted rollers in tests rely on it.
     */
    AttackOutcome resolveAttack(Combatant& attacker, Combatant& defender,
                                const AttackContext& context,
                                AnchorMud::DiceRoller& roller) const;

    /**
     * @brief Run raw damage through the defender's armor in slot order.
     *
     * A piece absorbs min(remaining, reduction, durability) and loses
     * exactly that much durability. Broken pieces absorb nothing.
     * @return Damage that passes through
     */
    int applyArmor(int rawDamage, AnchorMud::DamageType type, std::vector<ArmorPiece>& armor,
                   std::vector<ArmorAbsorption>& absorptions) const;

    /**
     * @brief Reduction a piece offers against a damage type, ignoring durability
     */
    [[nodiscard]] int reductionFor(const ArmorPiece& piece, AnchorMud::DamageType type) const;

    [[nodiscard]] static int effectiveAccuracy(int accuracy, uint8_t attackerModifiers, int bonus);
    [[nodiscard]] static int effectiveAvoidance(int avoidance, uint8_t defenderModifiers);

    /**
     * @brief d100 contest: attacker must roll under their accuracy, and
     * either beat the defender's roll or see the defender fail theirs.
     */
    [[nodiscard]] static bool contestHits(int attackRoll, int attackTarget,
                                          int defenseRoll, int defenseTarget);

    /**
     * @brief Disengage check: d100 under avoidance offset by the strongest
     * opposition, clamped to [5, 95].
     */
    bool resolveDisengage(int avoidance, int opposition, int penalty,
                          AnchorMud::DiceRoller& roller) const;

    [[nodiscard]] int disengageChance(int avoidance, int opposition, int penalty) const;

    int rollInitiative(const Combatant& combatant, AnchorMud::DiceRoller& roller) const;

    [[nodiscard]] const AnchorMud::AttackProfile& getUnarmedProfile() const { return m_unarmed; }

    /**
     * @brief Seconds between basic attacks for a weapon speed
     */
    [[nodiscard]] double attackInterval(float speed) const;

private:
    AnchorMud::RuntimeSettings m_settings;
    AnchorMud::AttackProfile m_unarmed;
};

#endif // COMBAT_RESOLVER_HPP
