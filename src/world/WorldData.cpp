/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldData.hpp"

namespace AnchorMud {

const char* damageTypeToString(DamageType type) {
    switch (type) {
        case DamageType::Slashing: return "slashing";
        case DamageType::Piercing: return "piercing";
        case DamageType::Bludgeoning: return "bludgeoning";
        case DamageType::Fire: return "fire";
        case DamageType::Cold: return "cold";
        case DamageType::Poison: return "poison";
        default: return "unknown";
    }
}

std::optional<DamageType> parseDamageType(const std::string& text) {
    for (size_t i = 0; i < DAMAGE_TYPE_COUNT; ++i) {
        auto type = static_cast<DamageType>(i);
        if (text == damageTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const char* rangeBandToString(RangeBand band) {
    switch (band) {
        case RangeBand::Engaged: return "engaged";
        case RangeBand::Near: return "near";
        case RangeBand::Far: return "far";
        default: return "unknown";
    }
}

std::optional<RangeBand> parseRangeBand(const std::string& text) {
    if (text == "engaged" || text == "melee") return RangeBand::Engaged;
    if (text == "near") return RangeBand::Near;
    if (text == "far" || text == "distant") return RangeBand::Far;
    return std::nullopt;
}

std::optional<PursuitMode> parsePursuitMode(const std::string& text) {
    if (text == "none") return PursuitMode::None;
    if (text == "short") return PursuitMode::Short;
    if (text == "long") return PursuitMode::Long;
    return std::nullopt;
}

std::optional<ThreatProfile> parseThreatProfile(const std::string& text) {
    if (text == "minion") return ThreatProfile::Minion;
    if (text == "standard") return ThreatProfile::Standard;
    if (text == "elite") return ThreatProfile::Elite;
    if (text == "boss") return ThreatProfile::Boss;
    return std::nullopt;
}

std::optional<Exposure> parseExposure(const std::string& text) {
    if (text == "indoor") return Exposure::Indoor;
    if (text == "sheltered") return Exposure::Sheltered;
    if (text == "outdoor") return Exposure::Outdoor;
    if (text == "coastal") return Exposure::Coastal;
    return std::nullopt;
}

const char* armorSlotToString(ArmorSlot slot) {
    switch (slot) {
        case ArmorSlot::Head: return "head";
        case ArmorSlot::Chest: return "chest";
        case ArmorSlot::Arms: return "arms";
        case ArmorSlot::Legs: return "legs";
        case ArmorSlot::Shield: return "shield";
        default: return "unknown";
    }
}

std::optional<ArmorSlot> parseArmorSlot(const std::string& text) {
    if (text == "head") return ArmorSlot::Head;
    if (text == "chest") return ArmorSlot::Chest;
    if (text == "arms") return ArmorSlot::Arms;
    if (text == "legs") return ArmorSlot::Legs;
    if (text == "shield") return ArmorSlot::Shield;
    return std::nullopt;
}

std::optional<ReactionTrigger> parseReactionTrigger(const std::string& text) {
    if (text.empty() || text == "none") return ReactionTrigger::None;
    if (text == "on_disengage") return ReactionTrigger::OnDisengage;
    if (text == "on_attacked") return ReactionTrigger::OnAttacked;
    return std::nullopt;
}

uint8_t parseCombatModifier(const std::string& text) {
    if (text == "exposed") return CombatModifier::EXPOSED;
    if (text == "pinned") return CombatModifier::PINNED;
    if (text == "staggered") return CombatModifier::STAGGERED;
    return CombatModifier::NONE;
}

} // namespace AnchorMud
