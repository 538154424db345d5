/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/JsonContentSource.hpp"
#include "core/Logger.hpp"
#include "core/WorldClock.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <exception>
#include <unordered_set>

using namespace AnchorMud;

namespace {

using KeySet = std::unordered_set<std::string>;

void collectExtensions(const JsonValue& node, const KeySet& known,
                       std::unordered_map<std::string, std::string>& out) {
    const JsonObject* object = node.tryAsObject();
    if (!object) {
        return;
    }
    for (const auto& [key, value] : *object) {
        if (known.count(key) > 0) {
            continue;
        }
        if (value.isString()) {
            out[key] = value.asString();
        } else if (value.isNumber() || value.isBool()) {
            out[key] = value.toString();
        }
    }
}

std::vector<std::string> readStringArray(const JsonValue& node) {
    std::vector<std::string> values;
    if (const JsonArray* array = node.tryAsArray()) {
        for (const auto& entry : *array) {
            if (auto text = entry.tryAsString()) {
                values.push_back(*text);
            }
        }
    }
    return values;
}

DamageMask readDamageMask(const JsonValue& node) {
    DamageMask mask = 0;
    for (const auto& name : readStringArray(node)) {
        if (auto type = parseDamageType(name)) {
            mask |= damageBit(*type);
        } else {
            CONTENT_WARN("Unknown damage type: " + name);
        }
    }
    return mask;
}

AttackProfile readAttack(const JsonValue& node, const std::string& fallbackVerb) {
    AttackProfile attack;
    attack.verb = node.getString("verb", fallbackVerb);
    attack.speed = static_cast<float>(node.getNumber("speed", 1.0));
    attack.accuracyBonus = node.getInt("accuracy", 0);
    attack.minDamage = node.getInt("min_damage", 1);
    attack.maxDamage = std::max(attack.minDamage, node.getInt("max_damage", attack.minDamage));
    attack.damageType = parseDamageType(node.getString("damage_type", "bludgeoning"))
                            .value_or(DamageType::Bludgeoning);
    attack.critChance = static_cast<float>(node.getNumber("crit_chance", 0.01));
    attack.reach = parseRangeBand(node.getString("reach", "engaged")).value_or(RangeBand::Engaged);
    return attack;
}

CombatTemplate readCombat(const JsonValue& node) {
    CombatTemplate combat;
    combat.hpMax = std::max(1, node.getInt("hp", 10));
    combat.staminaMax = node.getInt("stamina", 10);
    combat.accuracy = node.getInt("accuracy", 50);
    combat.avoidance = node.getInt("avoidance", 40);
    combat.initiativeBonus = node.getInt("initiative", 0);
    combat.attack = readAttack(node["attack"], "hit");
    combat.behavior.pursuit = parsePursuitMode(node.getString("pursuit", "none"))
                                  .value_or(PursuitMode::None);
    combat.behavior.leashRooms = node.getInt("leash_rooms", 0);
    combat.behavior.leashSeconds = static_cast<float>(node.getNumber("leash_seconds", 0.0));
    combat.behavior.aggressive = node.getBool("aggressive", false);
    combat.behavior.threat = parseThreatProfile(node.getString("threat", "standard"))
                                 .value_or(ThreatProfile::Standard);
    combat.armorItems = readStringArray(node["armor"]);
    combat.maneuvers = readStringArray(node["maneuvers"]);
    combat.lootTableId = node.getString("loot_table");
    return combat;
}

const KeySet COMBAT_KEYS = {"id", "name", "description", "hp", "stamina", "accuracy",
                            "avoidance", "initiative", "attack", "pursuit", "leash_rooms",
                            "leash_seconds", "aggressive", "threat", "armor", "maneuvers",
                            "loot_table", "hostile"};

void readRooms(const JsonValue& root, ContentBundle& out) {
    const JsonArray* rooms = root["rooms"].tryAsArray();
    if (!rooms) {
        return;
    }
    for (const auto& node : *rooms) {
        RoomDef room;
        room.id = node.getString("id");
        if (room.id.empty()) {
            CONTENT_WARN("Skipping room without id");
            continue;
        }
        room.name = node.getString("name", room.id);
        room.description = node.getString("description");
        room.zone = node.getString("zone");
        room.region = node.getString("region");
        room.exposure = parseExposure(node.getString("exposure", "indoor")).value_or(Exposure::Indoor);
        room.noPursuit = node.getBool("no_pursuit", false);
        room.safe = node.getBool("safe", false);
        room.tags = readStringArray(node["tags"]);
        if (const JsonObject* exits = node["exits"].tryAsObject()) {
            for (const auto& [direction, target] : *exits) {
                if (auto targetId = target.tryAsString()) {
                    room.exits[direction] = *targetId;
                }
            }
        }
        if (const JsonArray* spawns = node["spawns"].tryAsArray()) {
            for (const auto& s : *spawns) {
                SpawnRule rule;
                rule.id = s.getString("id");
                rule.creatureTemplateId = s.getString("creature");
                rule.maxAlive = std::max(1, s.getInt("max_alive", 1));
                rule.cooldownSeconds = static_cast<int64_t>(s.getNumber("cooldown", 60));
                rule.minCount = std::max(1, s.getInt("min_count", 1));
                rule.maxCount = std::max(rule.minCount, s.getInt("max_count", rule.minCount));
                if (s.hasKey("expiry")) {
                    rule.expirySeconds = static_cast<int64_t>(s.getNumber("expiry", 0));
                }
                rule.band = parseRangeBand(s.getString("band", "near")).value_or(RangeBand::Near);
                if (rule.id.empty()) {
                    rule.id = room.id + ":" + rule.creatureTemplateId;
                }
                room.spawnRules.push_back(std::move(rule));
            }
        }
        if (const JsonArray* loot = node["loot"].tryAsArray()) {
            for (const auto& l : *loot) {
                LootRule rule;
                rule.lootTableId = l.getString("table");
                rule.id = l.getString("id", room.id + ":" + rule.lootTableId);
                rule.maxPresent = std::max(1, l.getInt("max_present", 1));
                rule.cooldownSeconds = static_cast<int64_t>(l.getNumber("cooldown", 300));
                rule.expirySeconds = static_cast<int64_t>(l.getNumber("expiry", 600));
                room.lootRules.push_back(std::move(rule));
            }
        }
        out.rooms[room.id] = std::move(room);
    }
}

void readItems(const JsonValue& root, ContentBundle& out) {
    const JsonArray* items = root["items"].tryAsArray();
    if (!items) {
        return;
    }
    static const KeySet known = {"id", "name", "description", "stackable", "durability",
                                 "weapon", "armor"};
    for (const auto& node : *items) {
        ItemTemplate item;
        item.id = node.getString("id");
        if (item.id.empty()) {
            continue;
        }
        item.name = node.getString("name", item.id);
        item.description = node.getString("description");
        item.stackable = node.getBool("stackable", false);
        item.maxDurability = node.getInt("durability", 0);
        if (node["weapon"].isObject()) {
            item.weapon = readAttack(node["weapon"], "hit");
        }
        if (node["armor"].isObject()) {
            const JsonValue& a = node["armor"];
            ArmorStats armor;
            armor.slot = parseArmorSlot(a.getString("slot", "chest")).value_or(ArmorSlot::Chest);
            armor.reduction = a.getInt("reduction", 0);
            armor.primaryTypes = readDamageMask(a["primary"]);
            armor.secondaryTypes = readDamageMask(a["secondary"]);
            armor.maxDurability = a.getInt("durability", item.maxDurability);
            item.armor = armor;
        }
        collectExtensions(node, known, item.extensions);
        out.items[item.id] = std::move(item);
    }
}

void readCombatants(const JsonValue& root, ContentBundle& out) {
    if (const JsonArray* creatures = root["creatures"].tryAsArray()) {
        for (const auto& node : *creatures) {
            CreatureTemplate creature;
            creature.id = node.getString("id");
            if (creature.id.empty()) {
                continue;
            }
            creature.name = node.getString("name", creature.id);
            creature.description = node.getString("description");
            creature.combat = readCombat(node);
            collectExtensions(node, COMBAT_KEYS, creature.extensions);
            out.creatures[creature.id] = std::move(creature);
        }
    }
    if (const JsonArray* npcs = root["npcs"].tryAsArray()) {
        for (const auto& node : *npcs) {
            NpcTemplate npc;
            npc.id = node.getString("id");
            if (npc.id.empty()) {
                continue;
            }
            npc.name = node.getString("name", npc.id);
            npc.description = node.getString("description");
            npc.combat = readCombat(node);
            npc.hostile = node.getBool("hostile", false);
            collectExtensions(node, COMBAT_KEYS, npc.extensions);
            out.npcs[npc.id] = std::move(npc);
        }
    }
}

void readManeuvers(const JsonValue& root, ContentBundle& out) {
    const JsonArray* maneuvers = root["maneuvers"].tryAsArray();
    if (!maneuvers) {
        return;
    }
    for (const auto& node : *maneuvers) {
        ManeuverDef def;
        def.id = node.getString("id");
        if (def.id.empty()) {
            continue;
        }
        def.name = node.getString("name", def.id);
        def.staminaCost = node.getInt("stamina_cost", 0);
        def.accuracyBonus = node.getInt("accuracy_bonus", 0);
        def.damageBonus = node.getInt("damage_bonus", 0);
        def.damageMultiplier = static_cast<float>(node.getNumber("damage_multiplier", 1.0));
        def.appliesModifier = parseCombatModifier(node.getString("applies", ""));
        def.modifierRounds = std::max(1, node.getInt("rounds", 1));
        def.tickerDelay = static_cast<float>(node.getNumber("ticker_delay", 0.0));
        def.trigger = parseReactionTrigger(node.getString("trigger", "none"))
                          .value_or(ReactionTrigger::None);
        out.maneuvers[def.id] = std::move(def);
    }
}

void readTables(const JsonValue& root, ContentBundle& out) {
    if (const JsonArray* tables = root["loot_tables"].tryAsArray()) {
        for (const auto& node : *tables) {
            LootTable table;
            table.id = node.getString("id");
            if (const JsonArray* entries = node["entries"].tryAsArray()) {
                for (const auto& e : *entries) {
                    LootEntry entry;
                    entry.itemTemplateId = e.getString("item");
                    entry.chance = std::clamp(e.getInt("chance", 100), 0, 100);
                    entry.minQuantity = std::max(1, e.getInt("min", 1));
                    entry.maxQuantity = std::max(entry.minQuantity, e.getInt("max", entry.minQuantity));
                    table.entries.push_back(std::move(entry));
                }
            }
            out.lootTables[table.id] = std::move(table);
        }
    }

    if (const JsonArray* encounters = root["encounters"].tryAsArray()) {
        for (const auto& node : *encounters) {
            EncounterTable table;
            table.zoneId = node.getString("zone");
            if (const JsonArray* rows = node["rows"].tryAsArray()) {
                for (const auto& r : *rows) {
                    EncounterRow row;
                    row.minRoll = r.getInt("min", 1);
                    row.maxRoll = r.getInt("max", 100);
                    row.label = r.getString("label");
                    if (const JsonArray* members = r["members"].tryAsArray()) {
                        for (const auto& m : *members) {
                            EncounterMember member;
                            member.creatureTemplateId = m.getString("creature");
                            member.minCount = std::max(1, m.getInt("min", 1));
                            member.maxCount = std::max(member.minCount, m.getInt("max", member.minCount));
                            row.members.push_back(std::move(member));
                        }
                    }
                    table.rows.push_back(std::move(row));
                }
            }
            out.encounters[table.zoneId] = std::move(table);
        }
    }

    if (const JsonObject* transitions = root["weather_transitions"].tryAsObject()) {
        for (const auto& [from, weights] : *transitions) {
            WeatherWeights row;
            if (const JsonObject* targets = weights.tryAsObject()) {
                for (const auto& [to, weight] : *targets) {
                    if (auto w = weight.tryAsInt(); w && *w > 0) {
                        row.emplace_back(to, *w);
                    }
                }
            }
            // Object key order is unspecified; sort so rolls are reproducible
            std::sort(row.begin(), row.end());
            out.weatherTransitions[from] = std::move(row);
        }
    }
}

void readWorldBindings(const JsonValue& root, ContentBundle& out) {
    if (const JsonArray* regions = root["regions"].tryAsArray()) {
        for (const auto& node : *regions) {
            RegionDef region;
            region.id = node.getString("id");
            region.initialWeather = node.getString("weather", "clear");
            if (auto seed = node["seed"].tryAsNumber()) {
                region.seed = static_cast<uint64_t>(*seed);
            }
            out.regions[region.id] = std::move(region);
        }
    }

    if (const JsonArray* schedules = root["schedules"].tryAsArray()) {
        for (const auto& node : *schedules) {
            NpcScheduleDef schedule;
            schedule.npcTemplateId = node.getString("npc");
            schedule.shopRoom = node.getString("shop_room");
            if (const JsonArray* entries = node["entries"].tryAsArray()) {
                for (const auto& e : *entries) {
                    auto start = WorldClock::parseTimeOfDay(e.getString("start"));
                    auto end = WorldClock::parseTimeOfDay(e.getString("end"));
                    if (!start || !end) {
                        CONTENT_WARN("Bad schedule time for " + schedule.npcTemplateId);
                        continue;
                    }
                    schedule.entries.push_back(ScheduleEntry{*start, *end, e.getString("room")});
                }
            }
            out.schedules.push_back(std::move(schedule));
        }
    }
}

} // namespace

bool JsonContentSource::load(ContentBundle& out) {
    JsonReader reader;
    if (!reader.loadFromFile(m_path)) {
        CONTENT_ERROR("Failed to read content file " + m_path + ": " + reader.getLastError());
        return false;
    }
    return readDocument(reader.getRoot(), out);
}

bool JsonContentSource::loadFromString(const std::string& json, ContentBundle& out) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONTENT_ERROR("Failed to parse content: " + reader.getLastError());
        return false;
    }
    return readDocument(reader.getRoot(), out);
}

bool JsonContentSource::readDocument(const JsonValue& root, ContentBundle& out) {
    if (!root.isObject()) {
        CONTENT_ERROR("Content root must be an object");
        return false;
    }

    try {
        readRooms(root, out);
        readItems(root, out);
        readCombatants(root, out);
        readManeuvers(root, out);
        readTables(root, out);
        readWorldBindings(root, out);
    } catch (const std::exception& e) {
        CONTENT_ERROR(std::string("Malformed content document: ") + e.what());
        return false;
    }
    return true;
}
