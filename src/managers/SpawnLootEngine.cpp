/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SpawnLootEngine.hpp"
#include "core/Logger.hpp"
#include "events/LootEvent.hpp"
#include "events/PresenceEvent.hpp"
#include "managers/ContentRegistry.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/EventManager.hpp"
#include "utils/UniqueID.hpp"
#include <algorithm>
#include <set>

using namespace AnchorMud;

namespace {

uint32_t peekFireCount(RoomRecord& record, const std::string& ruleId) {
    std::lock_guard<std::mutex> lock(record.timerMutex);
    auto it = record.timers.find(ruleId);
    return it == record.timers.end() ? 0u : it->second.fireCount;
}

void announce(PresenceChange change, EntityHandle handle, const std::string& name,
              const std::string& roomId) {
    auto event = std::make_shared<PresenceEvent>(change, handle, name);
    event->setRoomId(roomId);
    EventManager::Instance().dispatchEvent(event, EventManager::DispatchMode::Deferred);
}

} // namespace

bool SpawnLootEngine::init(const RuntimeSettings& settings) {
    m_config.encounterRollChance = std::clamp(settings.encounterRollChance, 0.0f, 1.0f);
    m_config.encounterCooldownSeconds = settings.encounterCooldownSeconds;
    m_config.wanderExpirySeconds = settings.wanderExpirySeconds;
    resetStats();
    m_initialized.store(true, std::memory_order_release);
    SPAWN_INFO("SpawnLootEngine initialized");
    return true;
}

void SpawnLootEngine::clean() {
    {
        std::lock_guard<std::mutex> lock(m_predicateMutex);
        m_inCombat = nullptr;
    }
    resetStats();
    m_initialized.store(false, std::memory_order_release);
}

void SpawnLootEngine::setCombatPredicate(std::function<bool(EntityHandle)> inCombat) {
    std::lock_guard<std::mutex> lock(m_predicateMutex);
    m_inCombat = std::move(inCombat);
}

// ============================================================================
// ROOM RULES
// ============================================================================

SpawnReport SpawnLootEngine::evaluateRoom(RoomLock& room, double now) {
    SpawnReport report;
    const RoomDef* def = ContentRegistry::Instance().getRoom(room.roomId());
    if (!def) {
        return report;
    }
    RoomRecord& record = room.record();
    auto& content = ContentRegistry::Instance();

    for (const auto& rule : def->spawnRules) {
        DiceRoller seeded(deriveSeed(record.seed, rule.id, peekFireCount(record, rule.id)));
        const int wanted = seeded.rollRange(rule.minCount, rule.maxCount);

        int granted = 0;
        if (!RoomStateManager::Instance().tryConsumeSpawnEligibility(
                record, rule.id, rule.maxAlive, rule.cooldownSeconds, now, wanted, &granted)) {
            continue;  // Not eligible, or a racing entry already fired it
        }

        std::optional<double> expiry;
        if (rule.expirySeconds) {
            expiry = now + static_cast<double>(*rule.expirySeconds);
        }

        int created = 0;
        for (int i = 0; i < granted; ++i) {
            EntityHandle handle = spawnCreature(rule.creatureTemplateId, def->id, rule.band,
                                                expiry, rule.id);
            if (handle.isValid()) {
                report.creatures.push_back(handle);
                ++created;
            }
        }
        RoomStateManager::Instance().releaseReservedSlots(record, rule.id, granted - created);
    }

    for (const auto& rule : def->lootRules) {
        const LootTable* table = content.getLootTable(rule.lootTableId);
        if (!table) {
            continue;
        }
        DiceRoller seeded(deriveSeed(record.seed, rule.id, peekFireCount(record, rule.id)));

        std::vector<std::pair<const LootEntry*, int>> drops;
        for (const auto& entry : table->entries) {
            if (seeded.d100() <= entry.chance) {
                drops.emplace_back(&entry, seeded.rollRange(entry.minQuantity, entry.maxQuantity));
            }
        }

        int granted = 0;
        if (!RoomStateManager::Instance().tryConsumeSpawnEligibility(
                record, rule.id, rule.maxPresent, rule.cooldownSeconds, now,
                std::max<int>(1, static_cast<int>(drops.size())), &granted)) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            ++m_rollsByTable[table->id];
        }
        m_lootRolls.fetch_add(1, std::memory_order_relaxed);

        int created = 0;
        const double expiry = now + static_cast<double>(rule.expirySeconds);
        for (const auto& [entry, quantity] : drops) {
            if (created >= granted) {
                break;
            }
            EntityHandle item = spawnItem(entry->itemTemplateId, def->id, quantity, expiry, rule.id);
            if (item.isValid()) {
                report.items.push_back(item);
                ++created;
            }
        }
        RoomStateManager::Instance().releaseReservedSlots(record, rule.id, granted - created);
    }

    if (!report.empty()) {
        SPAWN_DEBUG("Room " + def->id + " produced " + std::to_string(report.creatures.size()) +
                    " creatures and " + std::to_string(report.items.size()) + " items");
    }
    return report;
}

SpawnReport SpawnLootEngine::rollEncounter(RoomLock& room, double now, DiceRoller& dice) {
    SpawnReport report;
    auto& content = ContentRegistry::Instance();
    const RoomDef* def = content.getRoom(room.roomId());
    if (!def || def->safe || def->zone.empty()) {
        return report;
    }
    const EncounterTable* table = content.getEncounterTable(def->zone);
    if (!table || table->rows.empty()) {
        return report;
    }

    RoomRecord& record = room.record();
    if (now - record.lastEncounterRollAt < static_cast<double>(m_config.encounterCooldownSeconds)) {
        return report;
    }
    record.lastEncounterRollAt = now;
    record.encounterEligibleAt = now + static_cast<double>(m_config.encounterCooldownSeconds);

    if (dice.unit() >= m_config.encounterRollChance) {
        return report;
    }

    const int roll = dice.d100();
    auto row = std::find_if(table->rows.begin(), table->rows.end(), [roll](const EncounterRow& r) {
        return roll >= r.minRoll && roll <= r.maxRoll;
    });
    if (row == table->rows.end() || row->members.empty()) {
        return report;
    }

    report.encounterId = UniqueID::generate(IdSpace::Encounter);
    const double expiry = now + static_cast<double>(m_config.wanderExpirySeconds);
    for (const auto& member : row->members) {
        const int count = dice.rollRange(member.minCount, member.maxCount);
        for (int i = 0; i < count; ++i) {
            EntityHandle handle = spawnCreature(member.creatureTemplateId, def->id, RangeBand::Near,
                                                expiry, {}, report.encounterId);
            if (handle.isValid()) {
                report.creatures.push_back(handle);
            }
        }
    }

    if (report.creatures.empty()) {
        report.encounterId = 0;
        return report;
    }
    record.activeEncounters.push_back(report.encounterId);
    SPAWN_INFO("Encounter '" + row->label + "' (" + std::to_string(report.creatures.size()) +
               " creatures) in " + def->id);
    return report;
}

// ============================================================================
// INSTANCE FACTORIES
// ============================================================================

CombatStats SpawnLootEngine::makeCombatStats(const CombatTemplate& combat) {
    CombatStats stats;
    stats.hpMax = std::max(1, combat.hpMax);
    stats.hpCurrent = stats.hpMax;
    stats.staminaMax = std::max(0, combat.staminaMax);
    stats.staminaCurrent = stats.staminaMax;
    stats.accuracy = combat.accuracy;
    stats.avoidance = combat.avoidance;
    stats.initiativeBonus = combat.initiativeBonus;
    stats.naturalAttack = combat.attack;
    stats.hasNaturalAttack = true;
    stats.maneuvers = combat.maneuvers;
    stats.behavior = combat.behavior;
    stats.lootTableId = combat.lootTableId;

    auto& content = ContentRegistry::Instance();
    for (const auto& itemId : combat.armorItems) {
        const ItemTemplate* item = content.getItem(itemId);
        if (!item || !item->armor) {
            SPAWN_WARN("Armor item " + itemId + " is missing or not armor");
            continue;
        }
        ArmorPiece piece;
        piece.templateId = item->id;
        piece.name = item->name;
        piece.stats = *item->armor;
        piece.durability = item->armor->maxDurability;
        stats.armor.push_back(std::move(piece));
    }
    return stats;
}

EntityHandle SpawnLootEngine::spawnCreature(const std::string& templateId, const std::string& roomId,
                                            RangeBand band, std::optional<double> expiresAt,
                                            const std::string& ruleId, uint64_t encounterId) {
    const CreatureTemplate* tpl = ContentRegistry::Instance().getCreature(templateId);
    if (!tpl) {
        SPAWN_WARN("Unknown creature template: " + templateId);
        return INVALID_ENTITY_HANDLE;
    }

    EntityInstance instance(tpl->id, tpl->name, CreatureData{makeCombatStats(tpl->combat)});
    instance.expiresAt = expiresAt;
    instance.spawnRuleId = ruleId;
    instance.homeRoom = roomId;
    instance.encounterId = encounterId;

    EntityHandle handle = EntityRegistry::Instance().createEntity(
        std::move(instance), EntityPosition{roomId, band, INVALID_ENTITY_HANDLE});
    if (handle.isValid()) {
        m_spawned.fetch_add(1, std::memory_order_relaxed);
        announce(PresenceChange::Spawned, handle, tpl->name, roomId);
    }
    return handle;
}

EntityHandle SpawnLootEngine::spawnNpc(const std::string& templateId, const std::string& roomId) {
    const NpcTemplate* tpl = ContentRegistry::Instance().getNpc(templateId);
    if (!tpl) {
        SPAWN_WARN("Unknown NPC template: " + templateId);
        return INVALID_ENTITY_HANDLE;
    }

    NpcData data;
    data.combat = makeCombatStats(tpl->combat);
    data.hostile = tpl->hostile;
    EntityInstance instance(tpl->id, tpl->name, std::move(data));
    instance.homeRoom = roomId;

    EntityHandle handle = EntityRegistry::Instance().createEntity(
        std::move(instance), EntityPosition{roomId, RangeBand::Near, INVALID_ENTITY_HANDLE});
    if (handle.isValid()) {
        m_spawned.fetch_add(1, std::memory_order_relaxed);
    }
    return handle;
}

EntityHandle SpawnLootEngine::spawnItem(const std::string& templateId, const std::string& roomId,
                                        int quantity, std::optional<double> expiresAt,
                                        const std::string& ruleId, EntityHandle reservedFor) {
    const ItemTemplate* tpl = ContentRegistry::Instance().getItem(templateId);
    if (!tpl) {
        SPAWN_WARN("Unknown item template: " + templateId);
        return INVALID_ENTITY_HANDLE;
    }

    ItemData data;
    data.quantity = std::max(1, quantity);
    data.maxDurability = tpl->armor ? tpl->armor->maxDurability : tpl->maxDurability;
    data.durability = data.maxDurability;

    EntityInstance instance(tpl->id, tpl->name, data);
    instance.expiresAt = expiresAt;
    instance.spawnRuleId = ruleId;
    instance.homeRoom = roomId;
    instance.reservedFor = reservedFor;

    EntityHandle handle = EntityRegistry::Instance().createEntity(
        std::move(instance), EntityPosition{roomId, std::nullopt, INVALID_ENTITY_HANDLE});
    if (handle.isValid()) {
        m_spawned.fetch_add(1, std::memory_order_relaxed);
    }
    return handle;
}

// ============================================================================
// DEATH AND LOOT
// ============================================================================

std::shared_ptr<LootEvent> SpawnLootEngine::handleDeath(RoomLock& room, EntityHandle handle,
                                                        const EntityInstance& dead,
                                                        EntityHandle killer, double now,
                                                        DiceRoller* dice) {
    if (!EntityRegistry::Instance().destroyEntity(handle)) {
        SPAWN_WARN("Death of already removed entity " + handle.toString());
        return nullptr;
    }
    releaseInstance(room.record(), dead);

    const CombatStats* stats = dead.combat();
    const std::string tableId = stats ? stats->lootTableId : std::string{};

    auto event = std::make_shared<LootEvent>(handle, dead.name, tableId);
    event->setRoomId(room.roomId());

    if (!tableId.empty()) {
        const EntityHandle reservation = killer.isPlayer() ? killer : INVALID_ENTITY_HANDLE;
        auto items = rollLootTable(tableId, room.roomId(), now,
                                   dice ? *dice : DiceRoller::threadLocal(), reservation);
        for (EntityHandle item : items) {
            auto instance = EntityRegistry::Instance().getInstance(item);
            event->addItem(item, instance ? instance->name : std::string("something"));
        }
    }

    EventManager::Instance().dispatchEvent(event, EventManager::DispatchMode::Deferred);
    return event;
}

std::vector<EntityHandle> SpawnLootEngine::rollLootTable(const std::string& tableId,
                                                         const std::string& roomId, double now,
                                                         DiceRoller& dice,
                                                         EntityHandle reservedFor) {
    std::vector<EntityHandle> items;
    const LootTable* table = ContentRegistry::Instance().getLootTable(tableId);
    if (!table) {
        SPAWN_WARN("Unknown loot table: " + tableId);
        return items;
    }

    m_lootRolls.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_rollsByTable[tableId];
    }

    const double expiry = now + static_cast<double>(m_config.dropExpirySeconds);
    for (const auto& entry : table->entries) {
        if (dice.d100() > entry.chance) {
            continue;
        }
        const int quantity = dice.rollRange(entry.minQuantity, entry.maxQuantity);
        const ItemTemplate* tpl = ContentRegistry::Instance().getItem(entry.itemTemplateId);
        const int instances = (tpl && tpl->stackable) ? 1 : quantity;
        const int perInstance = (tpl && tpl->stackable) ? quantity : 1;
        for (int i = 0; i < instances; ++i) {
            EntityHandle item = spawnItem(entry.itemTemplateId, roomId, perInstance, expiry, {},
                                          reservedFor);
            if (item.isValid()) {
                items.push_back(item);
            }
        }
    }

    SPAWN_DEBUG("Loot table " + tableId + " dropped " + std::to_string(items.size()) +
                " items in " + roomId);
    return items;
}

bool SpawnLootEngine::takeItem(RoomLock& room, EntityHandle item, EntityHandle taker) {
    auto& registry = EntityRegistry::Instance();
    auto position = registry.getPosition(item);
    auto instance = registry.getInstance(item);
    if (!item.isItem() || !position || !instance || position->roomId != room.roomId()) {
        return false;
    }
    if (instance->reservedFor.isValid() && instance->reservedFor != taker &&
        registry.isValidHandle(instance->reservedFor)) {
        return false;
    }
    if (!registry.destroyEntity(item)) {
        return false;
    }
    releaseInstance(room.record(), *instance);
    return true;
}

// ============================================================================
// EXPIRY
// ============================================================================

size_t SpawnLootEngine::expireInRoom(RoomLock& room, double now) {
    auto& registry = EntityRegistry::Instance();
    size_t removed = 0;

    for (EntityHandle handle : registry.getEntitiesInRoom(room.roomId())) {
        if (!handle.isItem() && !handle.isCreature()) {
            continue;
        }
        auto instance = registry.getInstance(handle);
        if (!instance || !instance->isExpired(now)) {
            continue;
        }
        if (handle.isCreature() && isProtected(handle)) {
            continue;  // Engaged creatures outlive their wander timer
        }
        if (!registry.destroyEntity(handle)) {
            continue;
        }
        releaseInstance(room.record(), *instance);
        if (handle.isCreature()) {
            announce(PresenceChange::Despawned, handle, instance->name, room.roomId());
        }
        ++removed;
    }

    if (removed > 0) {
        SPAWN_DEBUG("Expired " + std::to_string(removed) + " instances in " + room.roomId());
    }
    return removed;
}

size_t SpawnLootEngine::sweepExpired(double now) {
    auto& registry = EntityRegistry::Instance();
    std::set<std::string> rooms;

    for (EntityKind kind : {EntityKind::Item, EntityKind::Creature}) {
        for (EntityHandle handle : registry.getAllEntities(kind)) {
            auto instance = registry.getInstance(handle);
            if (!instance || !instance->isExpired(now)) {
                continue;
            }
            if (auto position = registry.getPosition(handle)) {
                rooms.insert(position->roomId);
            }
        }
    }

    size_t removed = 0;
    for (const auto& roomId : rooms) {
        RoomLock room = RoomStateManager::Instance().lockRoom(roomId);
        removed += expireInRoom(room, now);
    }
    return removed;
}

uint64_t SpawnLootEngine::getLootRollCount(const std::string& tableId) const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    auto it = m_rollsByTable.find(tableId);
    return it == m_rollsByTable.end() ? 0 : it->second;
}

void SpawnLootEngine::resetStats() {
    m_lootRolls.store(0);
    m_spawned.store(0);
    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_rollsByTable.clear();
}

void SpawnLootEngine::releaseInstance(RoomRecord& record, const EntityInstance& instance) {
    if (!instance.spawnRuleId.empty()) {
        const std::string& owner = instance.homeRoom.empty() ? record.roomId : instance.homeRoom;
        RoomStateManager::Instance().notifyRuleInstanceRemoved(owner, instance.spawnRuleId);
    }

    if (instance.encounterId != 0 && instance.homeRoom == record.roomId) {
        bool membersLeft = false;
        for (EntityHandle other : EntityRegistry::Instance().getAllEntities(EntityKind::Creature)) {
            auto otherInstance = EntityRegistry::Instance().getInstance(other);
            if (otherInstance && otherInstance->encounterId == instance.encounterId) {
                membersLeft = true;
                break;
            }
        }
        if (!membersLeft) {
            auto& active = record.activeEncounters;
            active.erase(std::remove(active.begin(), active.end(), instance.encounterId),
                         active.end());
        }
    }
}

bool SpawnLootEngine::isProtected(EntityHandle handle) const {
    auto position = EntityRegistry::Instance().getPosition(handle);
    if (position && position->engagedTarget.isValid()) {
        return true;
    }
    std::function<bool(EntityHandle)> predicate;
    {
        std::lock_guard<std::mutex> lock(m_predicateMutex);
        predicate = m_inCombat;
    }
    return predicate && predicate(handle);
}
