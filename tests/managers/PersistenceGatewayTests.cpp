/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file PersistenceGatewayTests.cpp
 * @brief Tests for the persistence gateway and the file character store
 *
 * Tests cover:
 * - Save coalescing per account
 * - Retry with exponential backoff and the give-up point
 * - Shutdown flush
 * - Service failures surfacing as rejection or an unavailable store
 * - Binary character files on disk
 */

#define BOOST_TEST_MODULE PersistenceGatewayTests
#include <boost/test/unit_test.hpp>

#include "managers/FileCharacterStore.hpp"
#include "managers/PersistenceGateway.hpp"
#include "mocks/MockPersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace {

CharacterSheet makeSheet(const std::string& account, int hp)
{
    CharacterSheet sheet;
    sheet.accountName = account;
    sheet.characterName = "Wren";
    sheet.roomId = "quay";
    sheet.hpCurrent = hp;
    return sheet;
}

} // namespace

struct GatewayFixture
{
    GatewayFixture()
    {
        settings.retryBaseSeconds = 1.0f;
        settings.maxRetries = 2;
        service = std::make_shared<MockPersistenceService>();
        BOOST_REQUIRE(gateway.init(service, settings));
    }

    ~GatewayFixture()
    {
        service->defaultSaveResult = true;
        service->throwOnSave = false;
        gateway.clean();
    }

    PersistenceGateway& gateway = PersistenceGateway::Instance();
    AnchorMud::RuntimeSettings settings;
    std::shared_ptr<MockPersistenceService> service;
};

// ============================================================================
// Queueing
// ============================================================================

BOOST_AUTO_TEST_SUITE(QueueTests)

BOOST_AUTO_TEST_CASE(TestInitRequiresService)
{
    AnchorMud::RuntimeSettings settings;
    BOOST_CHECK(!PersistenceGateway::Instance().init(nullptr, settings));
    BOOST_CHECK(!PersistenceGateway::Instance().isInitialized());
}

BOOST_FIXTURE_TEST_CASE(TestLatestSheetWins, GatewayFixture)
{
    gateway.queueSave(makeSheet("wren", 12));
    gateway.queueSave(makeSheet("wren", 7));
    gateway.queueSave(makeSheet("otto", 20));
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 2u);

    BOOST_CHECK_EQUAL(gateway.update(0.0), 2u);
    BOOST_CHECK_EQUAL(service->saveCallCount(), 2u);
    BOOST_CHECK_EQUAL(service->stored.at("wren").hpCurrent, 7);
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 0u);
    BOOST_CHECK_EQUAL(gateway.getCompletedCount(), 2u);
}

BOOST_FIXTURE_TEST_CASE(TestNothingDueNothingStarted, GatewayFixture)
{
    BOOST_CHECK_EQUAL(gateway.update(5.0), 0u);
    BOOST_CHECK_EQUAL(service->saveCallCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Retry and backoff
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RetryTests, GatewayFixture)

BOOST_AUTO_TEST_CASE(TestBackoffDoubles)
{
    BOOST_CHECK_CLOSE(gateway.backoffFor(1), 1.0, 0.001);
    BOOST_CHECK_CLOSE(gateway.backoffFor(2), 2.0, 0.001);
    BOOST_CHECK_CLOSE(gateway.backoffFor(3), 4.0, 0.001);
    BOOST_CHECK_CLOSE(gateway.backoffFor(20), 300.0, 0.001);
}

BOOST_AUTO_TEST_CASE(TestRetryHonoursBackoff)
{
    service->queueSaveResults({false, true});
    gateway.queueSave(makeSheet("wren", 9));

    BOOST_CHECK_EQUAL(gateway.update(0.0), 1u);
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 1u);
    BOOST_CHECK_EQUAL(gateway.getFailedAttemptCount(), 1u);

    BOOST_CHECK_EQUAL(gateway.update(0.5), 0u);
    BOOST_CHECK_EQUAL(gateway.update(1.0), 1u);
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 0u);
    BOOST_CHECK_EQUAL(gateway.getCompletedCount(), 1u);
    BOOST_CHECK_EQUAL(service->stored.at("wren").hpCurrent, 9);
}

BOOST_AUTO_TEST_CASE(TestGivesUpAfterMaxRetries)
{
    service->defaultSaveResult = false;
    gateway.queueSave(makeSheet("wren", 9));

    BOOST_CHECK_EQUAL(gateway.update(0.0), 1u);   // first attempt, retry at 1
    BOOST_CHECK_EQUAL(gateway.update(1.0), 1u);   // retry 1, next at 3
    BOOST_CHECK_EQUAL(gateway.update(2.9), 0u);
    BOOST_CHECK_EQUAL(gateway.update(3.0), 1u);   // retry 2 fails, dropped

    BOOST_CHECK_EQUAL(service->saveCallCount(), 3u);
    BOOST_CHECK_EQUAL(gateway.getFailedAttemptCount(), 3u);
    BOOST_CHECK_EQUAL(gateway.getDroppedCount(), 1u);
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 0u);
    BOOST_CHECK_EQUAL(gateway.update(100.0), 0u);
}

BOOST_AUTO_TEST_CASE(TestRequeueResetsRetries)
{
    service->queueSaveResults({false, false});
    gateway.queueSave(makeSheet("wren", 9));
    gateway.update(0.0);
    gateway.update(1.0);

    // Fresh sheet is due immediately and gets the full retry allowance again
    gateway.queueSave(makeSheet("wren", 4));
    BOOST_CHECK_EQUAL(gateway.update(1.0), 1u);
    BOOST_CHECK_EQUAL(gateway.getDroppedCount(), 0u);
    BOOST_CHECK_EQUAL(service->stored.at("wren").hpCurrent, 4);
}

BOOST_AUTO_TEST_CASE(TestThrowingSaveCountsAsFailure)
{
    service->throwOnSave = true;
    gateway.queueSave(makeSheet("wren", 9));
    BOOST_CHECK_EQUAL(gateway.update(0.0), 1u);
    BOOST_CHECK_EQUAL(gateway.getFailedAttemptCount(), 1u);
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Shutdown
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(FlushTests, GatewayFixture)

BOOST_AUTO_TEST_CASE(TestFlushIgnoresBackoff)
{
    service->queueSaveResults({false});
    gateway.queueSave(makeSheet("wren", 9));
    gateway.update(0.0);
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 1u);

    BOOST_CHECK_EQUAL(gateway.flush(), 0u);
    BOOST_CHECK_EQUAL(service->stored.at("wren").hpCurrent, 9);
}

BOOST_AUTO_TEST_CASE(TestFlushReportsLeftovers)
{
    service->defaultSaveResult = false;
    gateway.queueSave(makeSheet("wren", 9));
    gateway.queueSave(makeSheet("otto", 3));
    BOOST_CHECK_EQUAL(gateway.flush(), 2u);
}

BOOST_AUTO_TEST_CASE(TestCleanFlushesPending)
{
    gateway.queueSave(makeSheet("wren", 9));
    gateway.clean();
    BOOST_CHECK(!gateway.isInitialized());
    BOOST_CHECK_EQUAL(service->stored.count("wren"), 1u);
    BOOST_CHECK_EQUAL(gateway.getPendingCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Reads
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ReadTests, GatewayFixture)

BOOST_AUTO_TEST_CASE(TestValidateAccount)
{
    service->credentials["wren"] = "tide";
    BOOST_CHECK(gateway.validateAccount("wren", "tide"));
    BOOST_CHECK(!gateway.validateAccount("wren", "ebb"));
    BOOST_CHECK(!gateway.validateAccount("nobody", "tide"));

    service->throwOnValidate = true;
    BOOST_CHECK(!gateway.validateAccount("wren", "tide"));
}

BOOST_AUTO_TEST_CASE(TestLoadCharacter)
{
    service->stored["wren"] = makeSheet("wren", 11);
    CharacterLoad wren = gateway.loadCharacter("wren");
    BOOST_REQUIRE(wren.found());
    BOOST_CHECK_EQUAL(wren.sheet->hpCurrent, 11);

    CharacterLoad otto = gateway.loadCharacter("otto");
    BOOST_CHECK(otto.status == LoadStatus::NotFound);
    BOOST_CHECK(!otto.sheet.has_value());
}

BOOST_AUTO_TEST_CASE(TestStoreFailureIsNotAbsence)
{
    service->stored["wren"] = makeSheet("wren", 11);
    service->throwOnLoad = true;

    CharacterLoad wren = gateway.loadCharacter("wren");
    BOOST_CHECK(wren.unavailable());
    BOOST_CHECK(!wren.found());
    BOOST_CHECK(!wren.sheet.has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FileCharacterStore
// ============================================================================

struct StoreFixture
{
    StoreFixture()
        : directory((std::filesystem::temp_directory_path() / "anchormud_store_test").string())
    {
        std::filesystem::remove_all(directory);
    }

    ~StoreFixture()
    {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }

    std::string directory;
};

BOOST_FIXTURE_TEST_SUITE(FileStoreTests, StoreFixture)

BOOST_AUTO_TEST_CASE(TestAccountNameShape)
{
    BOOST_CHECK(FileCharacterStore::isValidAccountName("wren"));
    BOOST_CHECK(FileCharacterStore::isValidAccountName("old_salt9"));
    BOOST_CHECK(!FileCharacterStore::isValidAccountName("ab"));
    BOOST_CHECK(!FileCharacterStore::isValidAccountName("seventeen_chars_x"));
    BOOST_CHECK(!FileCharacterStore::isValidAccountName("bad name"));
    BOOST_CHECK(!FileCharacterStore::isValidAccountName("../etc"));
}

BOOST_AUTO_TEST_CASE(TestSaveAndLoad)
{
    FileCharacterStore store(directory);
    CharacterSheet sheet = makeSheet("wren", 13);
    sheet.weaponItem = "cutlass";
    sheet.weaponDurability = 17;
    sheet.armorItems = {"oilskin_coat"};
    sheet.maneuvers = {"riposte", "pin"};
    sheet.inventory = {"rat_pelt", "copper_coin"};

    BOOST_REQUIRE(store.saveCharacter(sheet));
    BOOST_CHECK(store.exists("wren"));
    BOOST_CHECK(!std::filesystem::exists(directory + "/wren.chr.tmp"));

    auto loaded = store.loadCharacter("wren");
    BOOST_REQUIRE(loaded.has_value());
    BOOST_CHECK_EQUAL(loaded->characterName, "Wren");
    BOOST_CHECK_EQUAL(loaded->roomId, "quay");
    BOOST_CHECK_EQUAL(loaded->hpCurrent, 13);
    BOOST_CHECK_EQUAL(loaded->weaponItem, "cutlass");
    BOOST_CHECK_EQUAL(loaded->weaponDurability, 17);
    BOOST_CHECK(loaded->armorItems == sheet.armorItems);
    BOOST_CHECK(loaded->maneuvers == sheet.maneuvers);
    BOOST_CHECK(loaded->inventory == sheet.inventory);
}

BOOST_AUTO_TEST_CASE(TestMissingAndInvalid)
{
    FileCharacterStore store(directory);
    BOOST_CHECK(!store.loadCharacter("wren").has_value());
    BOOST_CHECK(!store.loadCharacter("no").has_value());
    BOOST_CHECK(!store.saveCharacter(makeSheet("bad name", 1)));
    BOOST_CHECK(store.validateAccount("wren", "anything"));
    BOOST_CHECK(!store.validateAccount("x", "anything"));
}

BOOST_AUTO_TEST_CASE(TestCorruptFileIsUnavailableThroughGateway)
{
    std::filesystem::create_directories(directory);
    {
        std::ofstream out(directory + "/wren.chr", std::ios::binary);
        out << "garbage";
    }

    auto store = std::make_shared<FileCharacterStore>(directory);
    BOOST_CHECK_THROW(store->loadCharacter("wren"), std::runtime_error);

    AnchorMud::RuntimeSettings settings;
    PersistenceGateway& gateway = PersistenceGateway::Instance();
    BOOST_REQUIRE(gateway.init(store, settings));
    BOOST_CHECK(gateway.loadCharacter("wren").unavailable());
    BOOST_CHECK(gateway.loadCharacter("nobody").status == LoadStatus::NotFound);
    gateway.clean();
}

BOOST_AUTO_TEST_SUITE_END()
