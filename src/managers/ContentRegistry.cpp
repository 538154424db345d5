/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ContentRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <iterator>

using namespace AnchorMud;

namespace {

template <typename Map>
const typename Map::mapped_type* findIn(const std::unique_ptr<const ContentBundle>& bundle,
                                        const Map ContentBundle::*member,
                                        const std::string& id) {
    if (!bundle) {
        return nullptr;
    }
    const Map& map = (*bundle).*member;
    auto it = map.find(id);
    return it == map.end() ? nullptr : &it->second;
}

const std::unordered_map<std::string, std::string>& directionAliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"n", "north"}, {"s", "south"}, {"e", "east"}, {"w", "west"},
        {"u", "up"},    {"d", "down"},  {"ne", "northeast"}, {"nw", "northwest"},
        {"se", "southeast"}, {"sw", "southwest"}};
    return aliases;
}

} // namespace

bool ContentRegistry::load(IContentSource& source) {
    if (m_loaded.load(std::memory_order_acquire)) {
        CONTENT_WARN("Content already loaded; call clean() before reloading");
        return false;
    }

    auto bundle = std::make_unique<ContentBundle>();
    if (!source.load(*bundle)) {
        CONTENT_ERROR("Content source failed: " + source.describe());
        return false;
    }

    if (bundle->rooms.empty()) {
        CONTENT_ERROR("Content source produced no rooms: " + source.describe());
        return false;
    }

    const size_t dropped = validate(*bundle);
    if (dropped > 0) {
        CONTENT_WARN("Dropped " + std::to_string(dropped) + " dangling content references");
    }

    CONTENT_INFO("Loaded " + std::to_string(bundle->rooms.size()) + " rooms, " +
                 std::to_string(bundle->creatures.size()) + " creatures, " +
                 std::to_string(bundle->npcs.size()) + " npcs, " +
                 std::to_string(bundle->items.size()) + " items from " + source.describe());

    m_bundle = std::move(bundle);
    m_loaded.store(true, std::memory_order_release);
    return true;
}

void ContentRegistry::clean() {
    m_loaded.store(false, std::memory_order_release);
    m_bundle.reset();
}

size_t ContentRegistry::validate(ContentBundle& bundle) const {
    size_t dropped = 0;

    for (auto& [roomId, room] : bundle.rooms) {
        for (auto it = room.exits.begin(); it != room.exits.end();) {
            if (bundle.rooms.find(it->second) == bundle.rooms.end()) {
                CONTENT_WARN("Room " + roomId + " exit " + it->first + " leads to unknown room " +
                             it->second);
                it = room.exits.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }

        auto badSpawn = std::remove_if(room.spawnRules.begin(), room.spawnRules.end(),
            [&](const SpawnRule& rule) {
                if (bundle.creatures.count(rule.creatureTemplateId) > 0) {
                    return false;
                }
                CONTENT_WARN("Room " + roomId + " spawn rule " + rule.id +
                             " names unknown creature " + rule.creatureTemplateId);
                return true;
            });
        dropped += static_cast<size_t>(std::distance(badSpawn, room.spawnRules.end()));
        room.spawnRules.erase(badSpawn, room.spawnRules.end());

        auto badLoot = std::remove_if(room.lootRules.begin(), room.lootRules.end(),
            [&](const LootRule& rule) {
                return bundle.lootTables.count(rule.lootTableId) == 0;
            });
        dropped += static_cast<size_t>(std::distance(badLoot, room.lootRules.end()));
        room.lootRules.erase(badLoot, room.lootRules.end());

        for (auto& rule : room.spawnRules) {
            if (rule.maxCount < rule.minCount) {
                std::swap(rule.minCount, rule.maxCount);
            }
        }
    }

    for (auto& [tableId, table] : bundle.lootTables) {
        auto bad = std::remove_if(table.entries.begin(), table.entries.end(),
            [&](const LootEntry& entry) {
                if (bundle.items.count(entry.itemTemplateId) > 0) {
                    return false;
                }
                CONTENT_WARN("Loot table " + tableId + " names unknown item " +
                             entry.itemTemplateId);
                return true;
            });
        dropped += static_cast<size_t>(std::distance(bad, table.entries.end()));
        table.entries.erase(bad, table.entries.end());
    }

    for (auto& [zone, table] : bundle.encounters) {
        for (auto& row : table.rows) {
            auto bad = std::remove_if(row.members.begin(), row.members.end(),
                [&](const EncounterMember& member) {
                    return bundle.creatures.count(member.creatureTemplateId) == 0;
                });
            dropped += static_cast<size_t>(std::distance(bad, row.members.end()));
            row.members.erase(bad, row.members.end());
        }
    }

    return dropped;
}

const RoomDef* ContentRegistry::getRoom(const std::string& id) const {
    return findIn(m_bundle, &ContentBundle::rooms, id);
}

const CreatureTemplate* ContentRegistry::getCreature(const std::string& id) const {
    return findIn(m_bundle, &ContentBundle::creatures, id);
}

const NpcTemplate* ContentRegistry::getNpc(const std::string& id) const {
    return findIn(m_bundle, &ContentBundle::npcs, id);
}

const ItemTemplate* ContentRegistry::getItem(const std::string& id) const {
    return findIn(m_bundle, &ContentBundle::items, id);
}

const ManeuverDef* ContentRegistry::getManeuver(const std::string& id) const {
    return findIn(m_bundle, &ContentBundle::maneuvers, id);
}

const LootTable* ContentRegistry::getLootTable(const std::string& id) const {
    return findIn(m_bundle, &ContentBundle::lootTables, id);
}

const EncounterTable* ContentRegistry::getEncounterTable(const std::string& zone) const {
    return findIn(m_bundle, &ContentBundle::encounters, zone);
}

const RegionDef* ContentRegistry::getRegion(const std::string& id) const {
    return findIn(m_bundle, &ContentBundle::regions, id);
}

const WeatherTransitionTable& ContentRegistry::getWeatherTransitions() const {
    static const WeatherTransitionTable empty;
    return m_bundle ? m_bundle->weatherTransitions : empty;
}

const std::vector<NpcScheduleDef>& ContentRegistry::getSchedules() const {
    static const std::vector<NpcScheduleDef> empty;
    return m_bundle ? m_bundle->schedules : empty;
}

std::vector<std::string> ContentRegistry::getRoomIds() const {
    std::vector<std::string> ids;
    if (!m_bundle) {
        return ids;
    }
    ids.reserve(m_bundle->rooms.size());
    for (const auto& [id, room] : m_bundle->rooms) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> ContentRegistry::getRegionIds() const {
    std::vector<std::string> ids;
    if (!m_bundle) {
        return ids;
    }
    for (const auto& [id, room] : m_bundle->rooms) {
        if (!room.region.empty()) {
            ids.push_back(room.region);
        }
    }
    for (const auto& [id, region] : m_bundle->regions) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

std::string ContentRegistry::resolveExit(const std::string& roomId,
                                         const std::string& direction) const {
    const RoomDef* room = getRoom(roomId);
    if (!room) {
        return {};
    }
    auto it = room->exits.find(direction);
    if (it == room->exits.end()) {
        auto alias = directionAliases().find(direction);
        if (alias != directionAliases().end()) {
            it = room->exits.find(alias->second);
        }
    }
    return it == room->exits.end() ? std::string{} : it->second;
}
