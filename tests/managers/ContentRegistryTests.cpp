/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file ContentRegistryTests.cpp
 * @brief Tests for static world content loading and lookup
 *
 * Tests cover:
 * - Loading from an in-memory bundle and lookups by id
 * - Load guards (double load, empty sources, failing sources)
 * - Validation of dangling references
 * - Exit resolution with direction aliases
 * - JSON content documents, including the shipped world file
 */

#define BOOST_TEST_MODULE ContentRegistryTests
#include <boost/test/unit_test.hpp>

#include "common/TestWorldFixture.hpp"
#include "world/JsonContentSource.hpp"

#include <algorithm>

using namespace AnchorMud;

namespace {

class FailingContentSource : public IContentSource
{
public:
    bool load(ContentBundle&) override { return false; }
    std::string describe() const override { return "failing source"; }
};

} // namespace

struct ContentFixture
{
    ContentFixture() { ContentRegistry::Instance().clean(); }
    ~ContentFixture() { ContentRegistry::Instance().clean(); }

    ContentRegistry& content = ContentRegistry::Instance();
};

BOOST_FIXTURE_TEST_SUITE(LoadTests, ContentFixture)

BOOST_AUTO_TEST_CASE(TestLoadInMemoryBundle)
{
    InMemoryContentSource source(TestWorld::makeTestBundle());
    BOOST_REQUIRE(content.load(source));
    BOOST_CHECK(content.isLoaded());

    const RoomDef* den = content.getRoom("den");
    BOOST_REQUIRE(den != nullptr);
    BOOST_CHECK_EQUAL(den->name, "the Rat Den");
    BOOST_REQUIRE_EQUAL(den->spawnRules.size(), 1u);
    BOOST_CHECK_EQUAL(den->spawnRules[0].creatureTemplateId, "rat");

    BOOST_REQUIRE(content.getCreature("wolf") != nullptr);
    BOOST_CHECK(content.getCreature("wolf")->combat.behavior.aggressive);
    BOOST_REQUIRE(content.getNpc("bandit") != nullptr);
    BOOST_CHECK(content.getNpc("bandit")->hostile);
    BOOST_REQUIRE(content.getItem("cap") != nullptr);
    BOOST_CHECK(content.getItem("cap")->armor.has_value());
    BOOST_REQUIRE(content.getManeuver("trip") != nullptr);
    BOOST_CHECK_EQUAL(static_cast<int>(content.getManeuver("trip")->appliesModifier),
                      static_cast<int>(CombatModifier::EXPOSED));
    BOOST_REQUIRE(content.getLootTable("rat_loot") != nullptr);
    BOOST_REQUIRE(content.getEncounterTable("wilds") != nullptr);
    BOOST_CHECK_EQUAL(content.getEncounterTable("wilds")->rows.size(), 2u);
    BOOST_CHECK_EQUAL(content.getSchedules().size(), 1u);

    BOOST_CHECK(content.getRoom("nowhere") == nullptr);
    BOOST_CHECK(content.getCreature("dragon") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestRoomAndRegionIdsAreSorted)
{
    InMemoryContentSource source(TestWorld::makeTestBundle());
    BOOST_REQUIRE(content.load(source));

    auto rooms = content.getRoomIds();
    BOOST_REQUIRE_EQUAL(rooms.size(), 7u);
    BOOST_CHECK(std::is_sorted(rooms.begin(), rooms.end()));
    BOOST_CHECK_EQUAL(rooms.front(), "chapel");

    auto regions = content.getRegionIds();
    BOOST_REQUIRE_EQUAL(regions.size(), 1u);
    BOOST_CHECK_EQUAL(regions[0], "coast");
}

BOOST_AUTO_TEST_CASE(TestSecondLoadIsRefused)
{
    InMemoryContentSource source(TestWorld::makeTestBundle());
    BOOST_REQUIRE(content.load(source));
    BOOST_CHECK(!content.load(source));

    content.clean();
    BOOST_CHECK(!content.isLoaded());
    BOOST_CHECK(content.getRoom("den") == nullptr);
    BOOST_CHECK(content.getSchedules().empty());
    BOOST_CHECK(content.getWeatherTransitions().empty());
    BOOST_CHECK(content.load(source));
}

BOOST_AUTO_TEST_CASE(TestEmptyAndFailingSources)
{
    InMemoryContentSource empty(ContentBundle{});
    BOOST_CHECK(!content.load(empty));

    FailingContentSource failing;
    BOOST_CHECK(!content.load(failing));
    BOOST_CHECK(!content.isLoaded());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ValidationTests, ContentFixture)

BOOST_AUTO_TEST_CASE(TestDanglingReferencesAreDropped)
{
    ContentBundle bundle = TestWorld::makeTestBundle();
    bundle.rooms["den"].exits["east"] = "collapsed_tunnel";

    SpawnRule ghosts;
    ghosts.id = "den_ghosts";
    ghosts.creatureTemplateId = "ghost";
    bundle.rooms["den"].spawnRules.push_back(ghosts);

    LootRule treasure;
    treasure.id = "den_treasure";
    treasure.lootTableId = "missing_table";
    bundle.rooms["den"].lootRules.push_back(treasure);

    bundle.lootTables["rat_loot"].entries.push_back(LootEntry{"gold_crown", 100, 1, 1});
    bundle.encounters["wilds"].rows[0].members.push_back(EncounterMember{"ghost", 1, 1});

    InMemoryContentSource source(bundle);
    BOOST_REQUIRE(content.load(source));

    const RoomDef* den = content.getRoom("den");
    BOOST_CHECK_EQUAL(den->exits.count("east"), 0u);
    BOOST_CHECK_EQUAL(den->exits.count("up"), 1u);
    BOOST_REQUIRE_EQUAL(den->spawnRules.size(), 1u);
    BOOST_CHECK_EQUAL(den->spawnRules[0].id, "den_rats");
    BOOST_REQUIRE_EQUAL(den->lootRules.size(), 1u);
    BOOST_CHECK_EQUAL(den->lootRules[0].id, "den_scraps");
    BOOST_CHECK_EQUAL(content.getLootTable("rat_loot")->entries.size(), 1u);
    BOOST_CHECK_EQUAL(content.getEncounterTable("wilds")->rows[0].members.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestInvertedSpawnCountsAreSwapped)
{
    ContentBundle bundle = TestWorld::makeTestBundle();
    bundle.rooms["den"].spawnRules[0].minCount = 3;
    bundle.rooms["den"].spawnRules[0].maxCount = 1;

    InMemoryContentSource source(bundle);
    BOOST_REQUIRE(content.load(source));
    const SpawnRule& rule = content.getRoom("den")->spawnRules[0];
    BOOST_CHECK_EQUAL(rule.minCount, 1);
    BOOST_CHECK_EQUAL(rule.maxCount, 3);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ExitTests, ContentFixture)

BOOST_AUTO_TEST_CASE(TestResolveExitWithAliases)
{
    InMemoryContentSource source(TestWorld::makeTestBundle());
    BOOST_REQUIRE(content.load(source));

    BOOST_CHECK_EQUAL(content.resolveExit("start", "north"), "gate");
    BOOST_CHECK_EQUAL(content.resolveExit("start", "n"), "gate");
    BOOST_CHECK_EQUAL(content.resolveExit("gate", "d"), "den");
    BOOST_CHECK_EQUAL(content.resolveExit("den", "u"), "gate");
    BOOST_CHECK(content.resolveExit("start", "south").empty());
    BOOST_CHECK(content.resolveExit("start", "x").empty());
    BOOST_CHECK(content.resolveExit("nowhere", "north").empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(JsonContentTests, ContentFixture)

BOOST_AUTO_TEST_CASE(TestParseMinimalDocument)
{
    const std::string json = R"({
        "rooms": [
            { "id": "quay", "name": "The Quay", "exposure": "coastal", "region": "harbour",
              "exits": { "east": "shed" },
              "spawns": [ { "creature": "gull", "max_alive": 2, "min_count": 3, "max_count": 1,
                            "expiry": 120, "band": "far" } ] },
            { "id": "shed", "exits": { "west": "quay" } },
            { "name": "No id here" }
        ],
        "creatures": [
            { "id": "gull", "name": "a herring gull", "hp": 3, "pursuit": "short",
              "colour": "grey", "weight": 2,
              "attack": { "verb": "peck", "min_damage": 2, "max_damage": 1, "damage_type": "piercing" } }
        ],
        "weather_transitions": { "clear": { "wind": 20, "clear": 80, "never": 0 } }
    })";

    ContentBundle bundle;
    BOOST_REQUIRE(JsonContentSource::loadFromString(json, bundle));
    BOOST_CHECK_EQUAL(bundle.rooms.size(), 2u);

    const RoomDef& quay = bundle.rooms.at("quay");
    BOOST_CHECK(quay.exposure == Exposure::Coastal);
    BOOST_CHECK_EQUAL(bundle.rooms.at("shed").name, "shed");
    BOOST_REQUIRE_EQUAL(quay.spawnRules.size(), 1u);
    const SpawnRule& rule = quay.spawnRules[0];
    BOOST_CHECK_EQUAL(rule.id, "quay:gull");
    BOOST_CHECK_EQUAL(rule.minCount, 3);
    BOOST_CHECK_EQUAL(rule.maxCount, 3);
    BOOST_REQUIRE(rule.expirySeconds.has_value());
    BOOST_CHECK_EQUAL(*rule.expirySeconds, 120);
    BOOST_CHECK(rule.band == RangeBand::Far);

    const CreatureTemplate& gull = bundle.creatures.at("gull");
    BOOST_CHECK_EQUAL(gull.combat.attack.verb, "peck");
    BOOST_CHECK_EQUAL(gull.combat.attack.maxDamage, 2);
    BOOST_CHECK(gull.combat.behavior.pursuit == PursuitMode::Short);
    BOOST_CHECK_EQUAL(gull.extensions.at("colour"), "grey");
    BOOST_CHECK_EQUAL(gull.extensions.count("weight"), 1u);

    const WeatherWeights& clear = bundle.weatherTransitions.at("clear");
    BOOST_REQUIRE_EQUAL(clear.size(), 2u);
    BOOST_CHECK_EQUAL(clear[0].first, "clear");
    BOOST_CHECK_EQUAL(clear[1].first, "wind");
}

BOOST_AUTO_TEST_CASE(TestMalformedDocumentsFail)
{
    ContentBundle bundle;
    BOOST_CHECK(!JsonContentSource::loadFromString("{ \"rooms\": [ ", bundle));
    BOOST_CHECK(!JsonContentSource::loadFromString("[1, 2, 3]", bundle));

    JsonContentSource missing("/nonexistent/world.json");
    BOOST_CHECK(!content.load(missing));
}

BOOST_AUTO_TEST_CASE(TestShippedWorldLoads)
{
    JsonContentSource source(std::string(ANCHOR_TEST_CONTENT_DIR) + "/world.json");
    BOOST_REQUIRE(content.load(source));

    BOOST_CHECK_EQUAL(content.getRoomIds().size(), 6u);
    BOOST_CHECK(content.getRoom("harbor_square")->safe);
    BOOST_CHECK(content.getRoom("tidewall")->noPursuit);
    BOOST_CHECK_EQUAL(content.resolveExit("harbor_square", "n"), "market_row");

    const CreatureTemplate* wrecker = content.getCreature("wrecker");
    BOOST_REQUIRE(wrecker != nullptr);
    BOOST_CHECK(wrecker->combat.behavior.pursuit == PursuitMode::Long);
    BOOST_CHECK_EQUAL(wrecker->combat.behavior.leashRooms, 2);
    BOOST_REQUIRE_EQUAL(wrecker->combat.armorItems.size(), 1u);
    BOOST_CHECK_EQUAL(wrecker->combat.armorItems[0], "oilskin_coat");

    const ItemTemplate* coat = content.getItem("oilskin_coat");
    BOOST_REQUIRE(coat != nullptr && coat->armor.has_value());
    BOOST_CHECK_EQUAL(coat->armor->maxDurability, 30);
    BOOST_CHECK(coat->armor->secondaryTypes & damageBit(DamageType::Piercing));

    BOOST_CHECK(content.getManeuver("riposte")->trigger == ReactionTrigger::OnAttacked);
    BOOST_CHECK(content.getManeuver("parting_cut")->trigger == ReactionTrigger::OnDisengage);
    BOOST_CHECK_EQUAL(static_cast<int>(content.getManeuver("pin")->appliesModifier),
                      static_cast<int>(CombatModifier::PINNED));

    const RegionDef* coast = content.getRegion("saltmarsh_coast");
    BOOST_REQUIRE(coast != nullptr);
    BOOST_CHECK_EQUAL(coast->initialWeather, "fog");
    BOOST_REQUIRE(coast->seed.has_value());
    BOOST_CHECK_EQUAL(*coast->seed, 4242u);
    BOOST_CHECK_EQUAL(content.getRegionIds().size(), 2u);

    BOOST_REQUIRE_EQUAL(content.getSchedules().size(), 2u);
    const NpcScheduleDef& smith = content.getSchedules()[0];
    BOOST_CHECK_EQUAL(smith.npcTemplateId, "brannock");
    BOOST_CHECK_EQUAL(smith.shopRoom, "smithy");
    BOOST_REQUIRE_EQUAL(smith.entries.size(), 2u);
    BOOST_CHECK_EQUAL(smith.entries[0].startMinute, 7 * 60);
    BOOST_CHECK_EQUAL(smith.entries[0].endMinute, 19 * 60);

    BOOST_CHECK_EQUAL(content.getWeatherTransitions().size(), 6u);
}

BOOST_AUTO_TEST_SUITE_END()
