/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTENT_REGISTRY_HPP
#define CONTENT_REGISTRY_HPP

/**
 * @file ContentRegistry.hpp
 * @brief Read-only store of content templates
 *
 * Templates are produced by an IContentSource (JSON files for the server,
 * in-memory bundles for tests and tools) exactly once at startup. After
 * load() nothing mutates them, so lookups take no lock and the returned
 * pointers stay valid until clean().
 */

#include "world/WorldData.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct ContentBundle {
    std::unordered_map<std::string, AnchorMud::RoomDef> rooms;
    std::unordered_map<std::string, AnchorMud::CreatureTemplate> creatures;
    std::unordered_map<std::string, AnchorMud::NpcTemplate> npcs;
    std::unordered_map<std::string, AnchorMud::ItemTemplate> items;
    std::unordered_map<std::string, AnchorMud::ManeuverDef> maneuvers;
    std::unordered_map<std::string, AnchorMud::LootTable> lootTables;
    std::unordered_map<std::string, AnchorMud::EncounterTable> encounters;  // by zone
    std::unordered_map<std::string, AnchorMud::RegionDef> regions;
    AnchorMud::WeatherTransitionTable weatherTransitions;
    std::vector<AnchorMud::NpcScheduleDef> schedules;
};

/**
 * @brief External content-loading collaborator
 */
class IContentSource {
public:
    virtual ~IContentSource() = default;

    /**
     * @brief Fill the bundle.
     * @return false with a logged reason if the content cannot be produced
     */
    virtual bool load(ContentBundle& out) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Content built in code
 */
class InMemoryContentSource : public IContentSource {
public:
    explicit InMemoryContentSource(ContentBundle bundle) : m_bundle(std::move(bundle)) {}

    bool load(ContentBundle& out) override {
        out = m_bundle;
        return true;
    }

    [[nodiscard]] std::string describe() const override { return "in-memory bundle"; }

private:
    ContentBundle m_bundle;
};

class ContentRegistry {
public:
    static ContentRegistry& Instance() {
        static ContentRegistry instance;
        return instance;
    }

    /**
     * @brief Load and cross-check content from a source.
     *
     * Dangling references (exits to unknown rooms, spawn rules naming
     * unknown creatures, loot entries naming unknown items) are dropped with
     * a warning rather than failing the whole load.
     */
    bool load(IContentSource& source);

    [[nodiscard]] bool isLoaded() const { return m_loaded.load(std::memory_order_acquire); }

    void clean();

    [[nodiscard]] const AnchorMud::RoomDef* getRoom(const std::string& id) const;
    [[nodiscard]] const AnchorMud::CreatureTemplate* getCreature(const std::string& id) const;
    [[nodiscard]] const AnchorMud::NpcTemplate* getNpc(const std::string& id) const;
    [[nodiscard]] const AnchorMud::ItemTemplate* getItem(const std::string& id) const;
    [[nodiscard]] const AnchorMud::ManeuverDef* getManeuver(const std::string& id) const;
    [[nodiscard]] const AnchorMud::LootTable* getLootTable(const std::string& id) const;
    [[nodiscard]] const AnchorMud::EncounterTable* getEncounterTable(const std::string& zone) const;
    [[nodiscard]] const AnchorMud::RegionDef* getRegion(const std::string& id) const;

    [[nodiscard]] const AnchorMud::WeatherTransitionTable& getWeatherTransitions() const;
    [[nodiscard]] const std::vector<AnchorMud::NpcScheduleDef>& getSchedules() const;
    [[nodiscard]] std::vector<std::string> getRoomIds() const;
    [[nodiscard]] std::vector<std::string> getRegionIds() const;

    /**
     * @brief Exit lookup, also accepting the short forms n/s/e/w/u/d.
     * @return Destination room id, empty if there is no such exit
     */
    [[nodiscard]] std::string resolveExit(const std::string& roomId,
                                          const std::string& direction) const;

private:
    ContentRegistry() = default;
    ~ContentRegistry() = default;
    ContentRegistry(const ContentRegistry&) = delete;
    ContentRegistry& operator=(const ContentRegistry&) = delete;

    size_t validate(ContentBundle& bundle) const;

    std::unique_ptr<const ContentBundle> m_bundle;
    std::atomic<bool> m_loaded{false};
};

#endif // CONTENT_REGISTRY_HPP
