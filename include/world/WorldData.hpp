/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_DATA_HPP
#define WORLD_DATA_HPP

/**
 * @file WorldData.hpp
 * @brief Immutable content templates: rooms, creatures, NPCs, items,
 * maneuvers, loot tables, spawn and encounter rules.
 *
 * Templates are produced once by a content source and then only read.
 * Fields not covered by the typed core go into the per-template
 * `extensions` map.
 */

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace AnchorMud {

enum class DamageType : uint8_t {
    Slashing = 0,
    Piercing,
    Bludgeoning,
    Fire,
    Cold,
    Poison,
    COUNT
};

// Distance from the melee fray within one room
enum class RangeBand : uint8_t {
    Engaged = 0,
    Near = 1,
    Far = 2
};

enum class PursuitMode : uint8_t { None, Short, Long };

enum class ThreatProfile : uint8_t { Minion, Standard, Elite, Boss };

enum class Exposure : uint8_t { Indoor, Sheltered, Outdoor, Coastal };

enum class ArmorSlot : uint8_t { Head, Chest, Arms, Legs, Shield };

enum class ReactionTrigger : uint8_t { None, OnDisengage, OnAttacked };

// Combat modifiers overlaid on Engaged/Supporting; stored as a bitmask
namespace CombatModifier {
    constexpr uint8_t NONE = 0;
    constexpr uint8_t EXPOSED = 1 << 0;
    constexpr uint8_t PINNED = 1 << 1;
    constexpr uint8_t STAGGERED = 1 << 2;
}

constexpr size_t DAMAGE_TYPE_COUNT = static_cast<size_t>(DamageType::COUNT);

const char* damageTypeToString(DamageType type);
std::optional<DamageType> parseDamageType(const std::string& text);
const char* rangeBandToString(RangeBand band);
std::optional<RangeBand> parseRangeBand(const std::string& text);
std::optional<PursuitMode> parsePursuitMode(const std::string& text);
std::optional<ThreatProfile> parseThreatProfile(const std::string& text);
std::optional<Exposure> parseExposure(const std::string& text);
std::optional<ArmorSlot> parseArmorSlot(const std::string& text);
const char* armorSlotToString(ArmorSlot slot);
std::optional<ReactionTrigger> parseReactionTrigger(const std::string& text);
uint8_t parseCombatModifier(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, RangeBand band) {
    return os << rangeBandToString(band);
}

inline std::ostream& operator<<(std::ostream& os, DamageType type) {
    return os << damageTypeToString(type);
}

// Bit per DamageType
using DamageMask = uint32_t;

constexpr DamageMask damageBit(DamageType type) {
    return DamageMask{1} << static_cast<uint32_t>(type);
}

struct AttackProfile {
    std::string verb{"hit"};
    float speed{1.0f};          // Multiplier on the base attack interval
    int accuracyBonus{0};
    int minDamage{1};
    int maxDamage{1};
    DamageType damageType{DamageType::Bludgeoning};
    float critChance{0.01f};    // 0..1
    RangeBand reach{RangeBand::Engaged}; // Farthest band this attack can strike
};

struct BehaviorProfile {
    PursuitMode pursuit{PursuitMode::None};
    int leashRooms{0};          // 0 = use the pursuit mode default
    float leashSeconds{0.0f};   // 0 = use the pursuit mode default
    bool aggressive{false};     // Engages players who enter its room
    ThreatProfile threat{ThreatProfile::Standard};
};

struct ArmorStats {
    ArmorSlot slot{ArmorSlot::Chest};
    int reduction{0};
    DamageMask primaryTypes{0};
    DamageMask secondaryTypes{0};
    int maxDurability{0};
};

struct ItemTemplate {
    std::string id;
    std::string name;
    std::string description;
    bool stackable{false};
    int maxDurability{0};
    std::optional<AttackProfile> weapon;
    std::optional<ArmorStats> armor;
    std::unordered_map<std::string, std::string> extensions;
};

struct CombatTemplate {
    int hpMax{10};
    int staminaMax{10};
    int accuracy{50};
    int avoidance{40};
    int initiativeBonus{0};
    AttackProfile attack;
    BehaviorProfile behavior;
    std::vector<std::string> armorItems;   // ItemTemplate ids
    std::vector<std::string> maneuvers;
    std::string lootTableId;
};

struct CreatureTemplate {
    std::string id;
    std::string name;
    std::string description;
    CombatTemplate combat;
    std::unordered_map<std::string, std::string> extensions;
};

struct NpcTemplate {
    std::string id;
    std::string name;
    std::string description;
    CombatTemplate combat;
    bool hostile{false};
    std::unordered_map<std::string, std::string> extensions;
};

struct ManeuverDef {
    std::string id;
    std::string name;
    int staminaCost{0};
    int accuracyBonus{0};
    int damageBonus{0};
    float damageMultiplier{1.0f};
    uint8_t appliesModifier{CombatModifier::NONE};
    int modifierRounds{1};
    float tickerDelay{0.0f};     // In-game seconds added to the ticker's next fire
    ReactionTrigger trigger{ReactionTrigger::None};
};

struct LootEntry {
    std::string itemTemplateId;
    int chance{100};             // Percent, rolled on d100
    int minQuantity{1};
    int maxQuantity{1};
};

struct LootTable {
    std::string id;
    std::vector<LootEntry> entries;
};

struct SpawnRule {
    std::string id;
    std::string creatureTemplateId;
    int maxAlive{1};
    int64_t cooldownSeconds{60};
    int minCount{1};
    int maxCount{1};
    std::optional<int64_t> expirySeconds;
    RangeBand band{RangeBand::Near};
};

struct LootRule {
    std::string id;
    std::string lootTableId;
    int maxPresent{1};
    int64_t cooldownSeconds{300};
    int64_t expirySeconds{600};
};

struct EncounterMember {
    std::string creatureTemplateId;
    int minCount{1};
    int maxCount{1};
};

struct EncounterRow {
    int minRoll{1};
    int maxRoll{100};
    std::string label;
    std::vector<EncounterMember> members;
};

struct EncounterTable {
    std::string zoneId;
    std::vector<EncounterRow> rows;
};

struct RoomDef {
    std::string id;
    std::string name;
    std::string description;
    std::string zone;
    std::string region;
    Exposure exposure{Exposure::Indoor};
    std::map<std::string, std::string> exits;  // direction -> room id
    bool noPursuit{false};
    bool safe{false};                          // No combat may start here
    std::vector<SpawnRule> spawnRules;
    std::vector<LootRule> lootRules;
    std::vector<std::string> tags;
};

// One schedule binding: minutes since midnight, end exclusive, may wrap
struct ScheduleEntry {
    int startMinute{0};
    int endMinute{0};
    std::string roomId;
};

struct NpcScheduleDef {
    std::string npcTemplateId;
    std::vector<ScheduleEntry> entries;
    std::string shopRoom;   // Shop that is open only while the keeper is in it
};

struct RegionDef {
    std::string id;
    std::string initialWeather{"clear"};
    std::optional<uint64_t> seed;
};

// Weighted next-state table per current weather type, kept sorted by name
using WeatherWeights = std::vector<std::pair<std::string, int>>;
using WeatherTransitionTable = std::map<std::string, WeatherWeights>;

} // namespace AnchorMud

#endif // WORLD_DATA_HPP
