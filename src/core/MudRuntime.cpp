/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/MudRuntime.hpp"
#include "controllers/combat/CombatController.hpp"
#include "controllers/combat/PursuitController.hpp"
#include "controllers/world/UpkeepController.hpp"
#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "core/WorldClock.hpp"
#include "events/PresenceEvent.hpp"
#include "events/WeatherEvent.hpp"
#include "managers/ContentRegistry.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/RoomStateManager.hpp"
#include "managers/ScheduleResolver.hpp"
#include "managers/SpawnLootEngine.hpp"
#include "utils/DiceRoller.hpp"
#include <algorithm>
#include <initializer_list>

using AnchorMud::DiceRoller;
using AnchorMud::RangeBand;

namespace {

// A mover can slip out between reading its position and taking the lock
constexpr int MAX_LOCK_ATTEMPTS = 4;

const char* oppositeDirection(const std::string& direction)
{
    if (direction == "north" || direction == "n") return "south";
    if (direction == "south" || direction == "s") return "north";
    if (direction == "east" || direction == "e") return "west";
    if (direction == "west" || direction == "w") return "east";
    if (direction == "up" || direction == "u") return "below";
    if (direction == "down" || direction == "d") return "above";
    return "";
}

void announce(const std::string& roomId, PresenceChange change, EntityHandle entity,
              const std::string& name, const std::string& direction = {})
{
    auto event = std::make_shared<PresenceEvent>(change, entity, name, direction);
    event->setRoomId(roomId);
    if (!EventManager::Instance().dispatchEvent(event, EventManager::DispatchMode::Deferred)) {
        RUNTIME_DEBUG("Dropped presence event for " + name + " in " + roomId);
    }
}

} // namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

bool MudRuntime::init(const AnchorMud::RuntimeSettings& settings, IContentSource& content,
                      std::shared_ptr<IPersistenceService> persistence, bool startWorkers)
{
    if (m_initialized.load(std::memory_order_acquire)) {
        RUNTIME_WARN("MudRuntime already initialized");
        return true;
    }
    m_settings = settings;

    if (startWorkers && !AnchorMud::ThreadSystem::Exists()) {
        if (!AnchorMud::ThreadSystem::Instance().init()) {
            RUNTIME_CRITICAL("Failed to start the worker pool");
            return false;
        }
        m_ownsThreadSystem = true;
    }

    if (!EventManager::Instance().init()) {
        RUNTIME_CRITICAL("Failed to initialize EventManager");
        return false;
    }

    auto& contentRegistry = ContentRegistry::Instance();
    if (!contentRegistry.load(content)) {
        RUNTIME_CRITICAL("Failed to load content from " + content.describe());
        return false;
    }
    if (!contentRegistry.getRoom(m_settings.respawnRoom)) {
        RUNTIME_WARN("Respawn room '" + m_settings.respawnRoom + "' is not in the content");
    }

    if (!WorldClock::Instance().init(m_settings.startSeconds, m_settings.timeRatio)) {
        RUNTIME_CRITICAL("Failed to initialize WorldClock");
        return false;
    }
    if (!EntityRegistry::Instance().init() ||
        !RoomStateManager::Instance().init(m_settings.worldSeed, m_settings.roomResetSeconds) ||
        !SpawnLootEngine::Instance().init(m_settings) ||
        !ScheduleResolver::Instance().init()) {
        RUNTIME_CRITICAL("Failed to initialize world state managers");
        return false;
    }
    [[maybe_unused]] const size_t bindings = ScheduleResolver::Instance().loadSchedules(contentRegistry.getSchedules());
    RUNTIME_DEBUG(std::to_string(bindings) + " schedule binding(s) loaded");

    if (!PersistenceGateway::Instance().init(std::move(persistence), m_settings)) {
        RUNTIME_CRITICAL("Failed to initialize PersistenceGateway");
        return false;
    }

    auto& weather = m_controllers.add<WeatherController>(m_settings);
    auto& combat = m_controllers.add<CombatController>(m_settings, &weather);
    auto& pursuit = m_controllers.add<PursuitController>(combat, m_settings, &weather);
    auto& upkeep = m_controllers.add<UpkeepController>(m_settings, combat, &weather);
    mp_weather = &weather;
    mp_combat = &combat;
    mp_pursuit = &pursuit;
    mp_upkeep = &upkeep;

    CombatController* combatPtr = mp_combat;
    SpawnLootEngine::Instance().setCombatPredicate(
        [combatPtr](EntityHandle handle) { return combatPtr->isInCombat(handle); });
    ScheduleResolver::Instance().setBusyPredicate(
        [this](const std::string& npcId) { return busyReason(npcId); });
    combat.setArrivalHandler([this](RoomLock& room, EntityHandle player, double now) {
        arrive(room, player, now);
    });
    upkeep.setDisconnectHandler([this](EntityHandle player) {
        return removePlayer(player, true);
    });

    m_controllers.subscribeAll();
    registerOutputHandlers();

    std::string controllerNames;
    for (const auto& name : m_controllers.names()) {
        controllerNames += (controllerNames.empty() ? "" : ", ") + name;
    }
    m_initialized.store(true, std::memory_order_release);
    RUNTIME_INFO("MudRuntime initialized: " + std::to_string(contentRegistry.getRoomIds().size()) +
                 " rooms, controllers [" + controllerNames + "]");
    return true;
}

void MudRuntime::clean()
{
    const bool wasInitialized = m_initialized.exchange(false, std::memory_order_acq_rel);

    for (const auto& token : m_outputTokens) {
        EventManager::Instance().removeHandler(token);
    }
    m_outputTokens.clear();

    if (wasInitialized) {
        // Everyone still in the world gets one last save
        auto& registry = EntityRegistry::Instance();
        for (EntityHandle player : registry.getAllEntities(EntityKind::Player)) {
            auto instance = registry.getInstance(player);
            auto position = registry.getPosition(player);
            if (instance && position) {
                PersistenceGateway::Instance().queueSave(makeSheet(*instance, position->roomId));
            }
        }
    }

    SpawnLootEngine::Instance().setCombatPredicate(nullptr);
    m_controllers.clear();
    mp_combat = nullptr;
    mp_pursuit = nullptr;
    mp_weather = nullptr;
    mp_upkeep = nullptr;
    m_roller = nullptr;

    PersistenceGateway::Instance().clean();
    ScheduleResolver::Instance().clean();
    SpawnLootEngine::Instance().clean();
    RoomStateManager::Instance().clean();
    EntityRegistry::Instance().clean();
    WorldClock::Instance().clean();
    ContentRegistry::Instance().clean();
    EventManager::Instance().clean();

    if (m_ownsThreadSystem) {
        AnchorMud::ThreadSystem::Instance().clean();
        m_ownsThreadSystem = false;
    }

    {
        std::lock_guard<std::mutex> lock(m_busyMutex);
        m_busy.clear();
    }
    if (wasInitialized) {
        RUNTIME_INFO("MudRuntime shut down");
    }
}

void MudRuntime::update(float realDeltaSeconds)
{
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    WorldClock::Instance().update(realDeltaSeconds);
    m_controllers.updateAll(WorldClock::Instance().now());
    EventManager::Instance().update();
    PersistenceGateway::Instance().update(PersistenceGateway::steadyNow());
}

CombatController& MudRuntime::getCombat() { return *mp_combat; }
PursuitController& MudRuntime::getPursuit() { return *mp_pursuit; }
WeatherController& MudRuntime::getWeather() { return *mp_weather; }
UpkeepController& MudRuntime::getUpkeep() { return *mp_upkeep; }

void MudRuntime::setDiceRoller(DiceRoller* roller)
{
    m_roller = roller;
    if (mp_combat) {
        mp_combat->setDiceRoller(roller);
    }
    if (mp_pursuit) {
        mp_pursuit->setDiceRoller(roller);
    }
}

// ============================================================================
// SESSIONS
// ============================================================================

PlayerData MudRuntime::makePlayerData(const CharacterSheet& sheet, const std::string& sessionId)
{
    const auto& content = ContentRegistry::Instance();

    PlayerData data;
    data.sessionId = sessionId;
    data.accountName = sheet.accountName;
    data.inventory = sheet.inventory;

    CombatStats& combat = data.combat;
    combat.hpMax = std::max(1, sheet.hpMax);
    combat.hpCurrent = std::clamp(sheet.hpCurrent, 1, combat.hpMax);
    combat.staminaMax = std::max(0, sheet.staminaMax);
    combat.staminaCurrent = std::clamp(sheet.staminaCurrent, 0, combat.staminaMax);
    combat.accuracy = sheet.accuracy;
    combat.avoidance = sheet.avoidance;
    combat.initiativeBonus = sheet.initiativeBonus;
    combat.maneuvers = sheet.maneuvers;

    if (!sheet.weaponItem.empty()) {
        const auto* item = content.getItem(sheet.weaponItem);
        if (item && item->weapon) {
            WeaponState weapon;
            weapon.templateId = item->id;
            weapon.name = item->name;
            weapon.profile = *item->weapon;
            weapon.maxDurability = item->maxDurability;
            weapon.durability = sheet.weaponDurability > 0
                                    ? std::min(sheet.weaponDurability, item->maxDurability)
                                    : item->maxDurability;
            if (weapon.durability > 0) {
                combat.weapon = weapon;
            }
        } else {
            RUNTIME_WARN("Sheet for " + sheet.accountName + " names unknown weapon " +
                         sheet.weaponItem);
        }
    }

    for (const auto& armorId : sheet.armorItems) {
        const auto* item = content.getItem(armorId);
        if (!item || !item->armor) {
            RUNTIME_WARN("Sheet for " + sheet.accountName + " names unknown armor " + armorId);
            continue;
        }
        ArmorPiece piece;
        piece.templateId = item->id;
        piece.name = item->name;
        piece.stats = *item->armor;
        piece.durability = item->armor->maxDurability > 0 ? item->armor->maxDurability
                                                          : item->maxDurability;
        combat.armor.push_back(piece);
    }
    return data;
}

CharacterSheet MudRuntime::makeSheet(const EntityInstance& player, const std::string& roomId)
{
    CharacterSheet sheet;
    sheet.characterName = player.name;
    sheet.roomId = roomId;
    if (const auto* data = player.player()) {
        sheet.accountName = data->accountName;
        sheet.inventory = data->inventory;
    }
    if (const auto* combat = player.combat()) {
        sheet.hpCurrent = combat->hpCurrent;
        sheet.hpMax = combat->hpMax;
        sheet.staminaCurrent = combat->staminaCurrent;
        sheet.staminaMax = combat->staminaMax;
        sheet.accuracy = combat->accuracy;
        sheet.avoidance = combat->avoidance;
        sheet.initiativeBonus = combat->initiativeBonus;
        sheet.maneuvers = combat->maneuvers;
        if (combat->weapon) {
            sheet.weaponItem = combat->weapon->templateId;
            sheet.weaponDurability = combat->weapon->durability;
        }
        for (const auto& piece : combat->armor) {
            if (!piece.isBroken()) {
                sheet.armorItems.push_back(piece.templateId);
            }
        }
    }
    return sheet;
}

EntityHandle MudRuntime::connectPlayer(const std::string& accountName, const std::string& credential,
                                       const std::string& sessionId)
{
    if (!m_initialized.load(std::memory_order_acquire)) {
        RUNTIME_ERROR("connectPlayer called before init");
        return {};
    }

    auto& gateway = PersistenceGateway::Instance();
    if (!gateway.validateAccount(accountName, credential)) {
        RUNTIME_WARN("Rejected login for " + accountName);
        return {};
    }

    auto& registry = EntityRegistry::Instance();
    const double now = WorldClock::Instance().now();

    // Take over a body still inside its grace period
    for (EntityHandle existing : registry.getAllEntities(EntityKind::Player)) {
        auto instance = registry.getInstance(existing);
        if (!instance || !instance->player() || instance->player()->accountName != accountName) {
            continue;
        }
        const bool wasConnected = instance->player()->connected;
        // Under the body's room lock so a grace removal sees the reconnect
        ActionResult claimed = withActorRoom(existing, [&](RoomLock&) {
            bool updated = registry.modifyInstance(existing, [&sessionId](EntityInstance& inst) {
                inst.player()->connected = true;
                inst.player()->sessionId = sessionId;
            });
            return updated ? ActionResult::success()
                           : ActionResult::failure(ActionStatus::InvalidTarget, "Gone.");
        });
        if (!claimed.ok()) {
            break;  // Removed while we looked; load fresh
        }
        RUNTIME_INFO(accountName + (wasConnected ? " took over its session" : " reconnected"));
        deliver(existing, wasConnected ? "You take over your body from another session."
                                       : "You reconnect.");
        return existing;
    }

    CharacterLoad load = gateway.loadCharacter(accountName);
    if (load.unavailable()) {
        // A fresh body here would overwrite the stored one on the next save
        RUNTIME_WARN("Refused login for " + accountName + ": character store unavailable");
        return {};
    }
    std::optional<CharacterSheet> sheet = std::move(load.sheet);
    if (!sheet) {
        CharacterSheet fresh;
        fresh.accountName = accountName;
        fresh.characterName = accountName;
        fresh.roomId = m_settings.respawnRoom;
        sheet = fresh;
        RUNTIME_INFO("New character for " + accountName);
    }

    std::string roomId = sheet->roomId;
    if (!ContentRegistry::Instance().getRoom(roomId)) {
        roomId = m_settings.respawnRoom;
    }
    if (!ContentRegistry::Instance().getRoom(roomId)) {
        RUNTIME_ERROR("No room to place " + accountName + " in");
        return {};
    }

    EntityInstance instance("player", sheet->characterName, makePlayerData(*sheet, sessionId));
    RoomLock room = RoomStateManager::Instance().lockRoom(roomId);
    EntityHandle handle = registry.createEntity(std::move(instance),
                                                EntityPosition{roomId, std::nullopt, {}});
    if (!handle.isValid()) {
        RUNTIME_ERROR("Failed to place " + accountName + " in " + roomId);
        return {};
    }
    announce(roomId, PresenceChange::Entered, handle, sheet->characterName);
    arrive(room, handle, now);
    room.unlock();

    RUNTIME_INFO(sheet->characterName + " entered the world in " + roomId);
    return handle;
}

void MudRuntime::disconnectPlayer(EntityHandle player)
{
    if (!mp_combat) {
        return;
    }
    const double now = WorldClock::Instance().now();
    std::optional<CharacterSheet> sheet;

    ActionResult result = withActorRoom(player, [&](RoomLock& room) {
        mp_combat->removeFromCombat(room, player, "lost their link", now);
        auto& registry = EntityRegistry::Instance();
        bool marked = registry.modifyInstance(player, [now](EntityInstance& inst) {
            if (auto* data = inst.player()) {
                data->connected = false;
                data->disconnectedAt = now;
            }
        });
        if (!marked) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "Gone.");
        }
        if (auto instance = registry.getInstance(player)) {
            sheet = makeSheet(*instance, room.roomId());
        }
        return ActionResult::success();
    });

    if (!result.ok()) {
        RUNTIME_WARN("Disconnect for unknown player " + player.toString());
        return;
    }
    if (sheet) {
        PersistenceGateway::Instance().queueSave(*sheet);
        RUNTIME_INFO(sheet->characterName + " disconnected, grace " +
                     std::to_string(m_settings.disconnectGraceSeconds) + "s");
    }
}

bool MudRuntime::removePlayer(EntityHandle player, bool onlyIfGraceExpired)
{
    if (!mp_combat) {
        return false;
    }
    const double now = WorldClock::Instance().now();
    std::optional<CharacterSheet> sheet;
    std::string name;

    ActionResult result = withActorRoom(player, [&](RoomLock& room) {
        auto& registry = EntityRegistry::Instance();
        auto instance = registry.getInstance(player);
        if (!instance) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "Gone.");
        }
        if (onlyIfGraceExpired &&
            (!instance->player() ||
             !instance->player()->graceExpired(now, m_settings.disconnectGraceSeconds))) {
            return ActionResult::failure(ActionStatus::Rejected, "Reconnected.");
        }
        mp_combat->removeFromCombat(room, player, "left the world", now);
        mp_pursuit->forget(player);
        sheet = makeSheet(*instance, room.roomId());
        name = instance->name;
        if (!registry.destroyEntity(player)) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "Gone.");
        }
        announce(room.roomId(), PresenceChange::Left, player, name);
        return ActionResult::success();
    });

    if (!result.ok()) {
        RUNTIME_DEBUG(player.toString() + " not removed: " + result.message);
        return false;
    }
    if (sheet) {
        PersistenceGateway::Instance().queueSave(*sheet);
    }
    RUNTIME_INFO(name + " left the world");
    return true;
}

// ============================================================================
// INTENTS
// ============================================================================

template <typename Fn>
ActionResult MudRuntime::withActorRoom(EntityHandle actor, Fn&& fn)
{
    auto& registry = EntityRegistry::Instance();
    for (int attempt = 0; attempt < MAX_LOCK_ATTEMPTS; ++attempt) {
        auto position = registry.getPosition(actor);
        if (!position) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "You are not in the world.");
        }
        RoomLock room = RoomStateManager::Instance().lockRoom(position->roomId);
        auto confirmed = registry.getPosition(actor);
        if (!confirmed) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "You are not in the world.");
        }
        if (confirmed->roomId != room.roomId()) {
            continue;  // Moved between the read and the lock
        }
        ActionResult result = fn(room);
        room.unlock();
        if (mp_combat) {
            // Players defeated by this intent leave with no room held
            mp_combat->processRespawns(WorldClock::Instance().now());
        }
        return result;
    }
    RUNTIME_WARN("Could not pin down the room of " + actor.toString());
    return ActionResult::failure(ActionStatus::Rejected, "You are too busy moving around.");
}

EntityHandle MudRuntime::findTarget(const std::string& roomId, EntityHandle actor,
                                    const std::string& name) const
{
    for (EntityHandle handle : EntityRegistry::Instance().findInRoomByName(roomId, name)) {
        if (handle != actor && handle.isCombatant()) {
            return handle;
        }
    }
    return {};
}

void MudRuntime::arrive(RoomLock& room, EntityHandle actor, double now)
{
    auto& spawner = SpawnLootEngine::Instance();
    spawner.expireInRoom(room, now);

    SpawnReport spawned = spawner.evaluateRoom(room, now);
    DiceRoller& dice = m_roller ? *m_roller : DiceRoller::threadLocal();
    SpawnReport encounter = spawner.rollEncounter(room, now, dice);
    if (!spawned.empty() || !encounter.empty()) {
        RUNTIME_DEBUG(room.roomId() + " populated on arrival of " + actor.toString());
    }
    mp_combat->engageAggressors(room, now);
}

ActionResult MudRuntime::attack(EntityHandle actor, const std::string& targetName)
{
    if (!mp_combat) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    const double now = WorldClock::Instance().now();
    return withActorRoom(actor, [&](RoomLock& room) {
        EntityHandle target = findTarget(room.roomId(), actor, targetName);
        if (!target.isValid()) {
            return ActionResult::failure(ActionStatus::InvalidTarget,
                                         "You don't see '" + targetName + "' here.");
        }
        return mp_combat->attack(room, actor, target, now);
    });
}

ActionResult MudRuntime::attack(EntityHandle actor, EntityHandle target)
{
    if (!mp_combat) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    const double now = WorldClock::Instance().now();
    return withActorRoom(actor, [&](RoomLock& room) {
        return mp_combat->attack(room, actor, target, now);
    });
}

ActionResult MudRuntime::useManeuver(EntityHandle actor, const std::string& maneuverId,
                                     const std::string& targetName)
{
    if (!mp_combat) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    const double now = WorldClock::Instance().now();
    return withActorRoom(actor, [&](RoomLock& room) {
        EntityHandle target;
        if (!targetName.empty()) {
            target = findTarget(room.roomId(), actor, targetName);
            if (!target.isValid()) {
                return ActionResult::failure(ActionStatus::InvalidTarget,
                                             "You don't see '" + targetName + "' here.");
            }
        }
        return mp_combat->useManeuver(room, actor, maneuverId, target, now);
    });
}

ActionResult MudRuntime::disengage(EntityHandle actor)
{
    if (!mp_pursuit) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    const double now = WorldClock::Instance().now();
    return withActorRoom(actor, [&](RoomLock& room) {
        return mp_pursuit->disengage(room, actor, now);
    });
}

ActionResult MudRuntime::joinCombat(EntityHandle actor)
{
    if (!mp_combat) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    const double now = WorldClock::Instance().now();
    return withActorRoom(actor, [&](RoomLock& room) {
        return mp_combat->joinCombat(room, actor, now);
    });
}

ActionResult MudRuntime::advance(EntityHandle actor)
{
    if (!mp_combat) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    const double now = WorldClock::Instance().now();
    return withActorRoom(actor, [&](RoomLock& room) {
        return mp_combat->advance(room, actor, now);
    });
}

ActionResult MudRuntime::ready(EntityHandle actor, const std::string& maneuverId)
{
    if (!mp_combat) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    return withActorRoom(actor, [&](RoomLock& room) {
        return mp_combat->ready(room, actor, maneuverId);
    });
}

ActionResult MudRuntime::move(EntityHandle actor, const std::string& direction)
{
    if (!mp_combat || !mp_pursuit) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }

    auto& registry = EntityRegistry::Instance();
    auto& content = ContentRegistry::Instance();
    const double now = WorldClock::Instance().now();

    for (int attempt = 0; attempt < MAX_LOCK_ATTEMPTS; ++attempt) {
        auto position = registry.getPosition(actor);
        if (!position) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "You are not in the world.");
        }
        const std::string fromId = position->roomId;
        const std::string toId = content.resolveExit(fromId, direction);
        if (toId.empty()) {
            return ActionResult::failure(ActionStatus::NoExit, "You can't go that way.");
        }
        if (toId == fromId) {
            return ActionResult::success(renderRoom(toId, actor));
        }

        auto [first, second] = RoomStateManager::Instance().lockRooms(fromId, toId);
        RoomLock& from = first.roomId() == fromId ? first : second;
        RoomLock& to = first.roomId() == toId ? first : second;

        auto confirmed = registry.getPosition(actor);
        if (!confirmed) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "You are not in the world.");
        }
        if (confirmed->roomId != fromId) {
            continue;
        }

        ActionResult departure = mp_pursuit->checkDeparture(from, actor, now);
        if (!departure.ok()) {
            return departure;
        }

        auto instance = registry.getInstance(actor);
        const std::string name = instance ? instance->name : std::string("Someone");
        if (!registry.moveTo(actor, toId, std::nullopt)) {
            return ActionResult::failure(ActionStatus::InvalidTarget, "You are not in the world.");
        }
        announce(fromId, PresenceChange::Left, actor, name, direction);
        announce(toId, PresenceChange::Entered, actor, name, oppositeDirection(direction));

        std::vector<EntityHandle> followers =
            mp_pursuit->onCombatantLeft(from, to, actor, direction, now);
        if (!followers.empty()) {
            RUNTIME_DEBUG(std::to_string(followers.size()) + " pursuer(s) followed " + name +
                          " into " + toId);
        }
        arrive(to, actor, now);

        first.unlock();
        second.unlock();
        return ActionResult::success(renderRoom(toId, actor));
    }

    RUNTIME_WARN("Move of " + actor.toString() + " kept racing other movers");
    return ActionResult::failure(ActionStatus::Rejected, "You stumble and stay where you are.");
}

ActionResult MudRuntime::pickUp(EntityHandle actor, const std::string& itemName)
{
    if (!mp_combat) {
        return ActionResult::failure(ActionStatus::Rejected, "The world is not running.");
    }
    return withActorRoom(actor, [&](RoomLock& room) {
        auto& registry = EntityRegistry::Instance();
        EntityHandle item;
        for (EntityHandle handle : registry.findInRoomByName(room.roomId(), itemName)) {
            if (handle.isItem()) {
                item = handle;
                break;
            }
        }
        if (!item.isValid()) {
            return ActionResult::failure(ActionStatus::InvalidTarget,
                                         "There is no '" + itemName + "' here.");
        }

        auto taken = registry.getInstance(item);
        if (!taken || !SpawnLootEngine::Instance().takeItem(room, item, actor)) {
            return ActionResult::failure(ActionStatus::Rejected, "That is not yours to take.");
        }

        const auto* itemTemplate = ContentRegistry::Instance().getItem(taken->getTemplateId());
        const int quantity = taken->item() ? taken->item()->quantity : 1;
        std::string message = "You pick up " + taken->name + ".";

        bool stored = registry.modifyInstance(actor, [&](EntityInstance& inst) {
            auto* data = inst.player();
            auto* combat = inst.combat();
            if (!data || !combat) {
                return;
            }
            if (itemTemplate && itemTemplate->weapon && !combat->weapon) {
                WeaponState weapon;
                weapon.templateId = itemTemplate->id;
                weapon.name = itemTemplate->name;
                weapon.profile = *itemTemplate->weapon;
                weapon.maxDurability = itemTemplate->maxDurability;
                weapon.durability = taken->item() && taken->item()->durability > 0
                                        ? taken->item()->durability
                                        : itemTemplate->maxDurability;
                combat->weapon = weapon;
                message = "You pick up and wield " + taken->name + ".";
                return;
            }
            if (itemTemplate && itemTemplate->armor) {
                const auto slot = itemTemplate->armor->slot;
                bool slotTaken = std::any_of(combat->armor.begin(), combat->armor.end(),
                                             [slot](const ArmorPiece& piece) {
                                                 return piece.stats.slot == slot && !piece.isBroken();
                                             });
                if (!slotTaken) {
                    ArmorPiece piece;
                    piece.templateId = itemTemplate->id;
                    piece.name = itemTemplate->name;
                    piece.stats = *itemTemplate->armor;
                    piece.durability = itemTemplate->armor->maxDurability > 0
                                           ? itemTemplate->armor->maxDurability
                                           : itemTemplate->maxDurability;
                    combat->armor.push_back(piece);
                    message = "You pick up and put on " + taken->name + ".";
                    return;
                }
            }
            for (int i = 0; i < quantity; ++i) {
                data->inventory.push_back(taken->getTemplateId());
            }
        });
        if (!stored) {
            RUNTIME_WARN(taken->name + " was picked up by a vanished entity");
            return ActionResult::failure(ActionStatus::InvalidTarget, "You are not in the world.");
        }
        return ActionResult::success(message);
    });
}

// ============================================================================
// RENDERING
// ============================================================================

std::string MudRuntime::renderRoom(const std::string& roomId, EntityHandle viewer)
{
    const auto* room = ContentRegistry::Instance().getRoom(roomId);
    if (!room) {
        return "You are nowhere at all.";
    }
    const double now = WorldClock::Instance().now();

    std::string out = room->name + "\n" + room->description;

    if (mp_weather) {
        std::string overlay = mp_weather->getOverlay(roomId, now);
        if (!overlay.empty()) {
            out += "\n" + overlay;
        }
    }

    if (std::find(room->tags.begin(), room->tags.end(), "shop") != room->tags.end()) {
        out += ScheduleResolver::Instance().isShopOpen(roomId) ? "\nThe shop is open."
                                                               : "\nThe shop is closed.";
    }

    auto& registry = EntityRegistry::Instance();
    for (EntityHandle handle : registry.getEntitiesInRoom(roomId)) {
        if (handle == viewer) {
            continue;
        }
        auto instance = registry.getInstance(handle);
        if (!instance) {
            continue;
        }
        if (handle.isItem()) {
            const int quantity = instance->item() ? instance->item()->quantity : 1;
            out += "\n" + instance->name +
                   (quantity > 1 ? " (x" + std::to_string(quantity) + ")" : std::string()) +
                   " lies here.";
            continue;
        }
        std::string line = "\n" + instance->name + " is here";
        if (const auto* data = instance->player(); data && !data->connected) {
            line += ", staring blankly";
        }
        if (mp_combat && mp_combat->isInCombat(handle)) {
            const auto* combat = instance->combat();
            line += std::string(", fighting (") +
                    CombatController::healthBand(combat->hpCurrent, combat->hpMax) + ")";
        }
        out += line + ".";
    }

    if (room->exits.empty()) {
        out += "\nThere are no obvious exits.";
    } else {
        std::string exits;
        for (const auto& [direction, destination] : room->exits) {
            exits += (exits.empty() ? "" : ", ") + direction;
        }
        out += "\nExits: " + exits + ".";
    }
    return out;
}

std::string MudRuntime::look(EntityHandle viewer)
{
    auto position = EntityRegistry::Instance().getPosition(viewer);
    if (!position) {
        return "You are not in the world.";
    }
    return renderRoom(position->roomId, viewer);
}

// ============================================================================
// OUTPUT ROUTING
// ============================================================================

void MudRuntime::setOutputSink(OutputSink sink)
{
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_sink = std::move(sink);
}

void MudRuntime::setBusy(const std::string& npcId, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(m_busyMutex);
    if (reason.empty()) {
        m_busy.erase(npcId);
    } else {
        m_busy[npcId] = reason;
    }
}

std::optional<std::string> MudRuntime::busyReason(const std::string& npcId) const
{
    EntityHandle handle = ScheduleResolver::Instance().getHandle(npcId);
    if (handle.isValid() && mp_combat && mp_combat->isInCombat(handle)) {
        return std::string("in combat");
    }
    std::lock_guard<std::mutex> lock(m_busyMutex);
    auto it = m_busy.find(npcId);
    if (it != m_busy.end()) {
        return it->second;
    }
    return std::nullopt;
}

void MudRuntime::registerOutputHandlers()
{
    auto& events = EventManager::Instance();
    for (EventTypeId type : {EventTypeId::Combat, EventTypeId::CombatState,
                             EventTypeId::RoundSummary, EventTypeId::Weather,
                             EventTypeId::Presence, EventTypeId::Notice, EventTypeId::Loot}) {
        m_outputTokens.push_back(events.registerHandlerWithToken(
            type, [this](const EventData& data) { routeEvent(data); }));
    }
}

void MudRuntime::routeEvent(const EventData& data)
{
    if (!data.event) {
        return;
    }
    const Event& event = *data.event;

    if (event.getTypeId() == EventTypeId::Weather) {
        const auto* weather = dynamic_cast<const WeatherEvent*>(&event);
        if (!weather) {
            return;
        }
        const std::string text = weather->getMessage();
        for (const auto& roomId : EntityRegistry::Instance().getRoomsWithPlayers()) {
            const auto* room = ContentRegistry::Instance().getRoom(roomId);
            if (room && room->region == weather->getRegion() &&
                room->exposure != AnchorMud::Exposure::Indoor) {
                broadcastToRoom(roomId, text, {});
            }
        }
        return;
    }

    const std::string text = event.getMessage();
    if (text.empty()) {
        return;
    }
    if (!event.isRoomBroadcast()) {
        deliver(event.getRecipient(), text);
        return;
    }

    EntityHandle skip;
    if (const auto* presence = dynamic_cast<const PresenceEvent*>(&event)) {
        skip = presence->getEntity();
    }
    broadcastToRoom(event.getRoomId(), text, skip);
}

void MudRuntime::deliver(EntityHandle recipient, const std::string& text)
{
    if (!recipient.isPlayer()) {
        return;
    }
    auto instance = EntityRegistry::Instance().getInstance(recipient);
    if (!instance || !instance->player() || !instance->player()->connected) {
        return;
    }
    OutputSink sink;
    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        sink = m_sink;
    }
    if (sink) {
        sink(recipient, text);
    }
}

void MudRuntime::broadcastToRoom(const std::string& roomId, const std::string& text,
                                 EntityHandle skip)
{
    if (roomId.empty()) {
        return;
    }
    for (EntityHandle player : EntityRegistry::Instance().getEntitiesInRoom(roomId, EntityKind::Player)) {
        if (player != skip) {
            deliver(player, text);
        }
    }
}
