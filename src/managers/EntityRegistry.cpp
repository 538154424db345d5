/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityRegistry.hpp"
#include "core/Logger.hpp"
#include "utils/UniqueID.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>

namespace {
std::string toLower(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}
} // namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

bool EntityRegistry::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        REGISTRY_INFO("EntityRegistry already initialized");
        return true;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    constexpr size_t INITIAL_CAPACITY = 1024;
    m_slots.reserve(INITIAL_CAPACITY);
    m_idToIndex.reserve(INITIAL_CAPACITY);

    m_initialized.store(true, std::memory_order_release);
    REGISTRY_INFO("EntityRegistry initialized");
    return true;
}

void EntityRegistry::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    REGISTRY_INFO("EntityRegistry shutting down with " +
                  std::to_string(m_idToIndex.size()) + " live entities");
    m_slots.clear();
    m_freeSlots.clear();
    m_idToIndex.clear();
    m_roomIndex.clear();
    m_initialized.store(false, std::memory_order_release);
}

// ============================================================================
// CREATION / DESTRUCTION
// ============================================================================

EntityHandle EntityRegistry::createEntity(EntityInstance instance, EntityPosition position) {
    if (position.roomId.empty()) {
        REGISTRY_ERROR("Refusing to create '" + instance.name + "' without a room");
        return INVALID_ENTITY_HANDLE;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    size_t index = allocateSlot();
    Slot& slot = m_slots[index];
    slot.id = AnchorMud::UniqueID::generate(AnchorMud::IdSpace::Entity);
    slot.generation = nextGeneration(index);

    EntityHandle handle(slot.id, instance.getKind(), slot.generation);

    if (auto* stats = instance.combat()) {
        stats->hpCurrent = std::clamp(stats->hpCurrent, 0, stats->hpMax);
    }
    slot.instance.emplace(std::move(instance));
    slot.position = std::move(position);
    slot.position.engagedTarget = INVALID_ENTITY_HANDLE;

    m_idToIndex[slot.id] = index;
    m_roomIndex[slot.position.roomId].insert(handle);

    REGISTRY_DEBUG("Created " + handle.toString() + " '" + slot.instance->name +
                   "' in " + slot.position.roomId);
    return handle;
}

bool EntityRegistry::destroyEntity(EntityHandle handle) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return false;
    }

    Slot& slot = m_slots[index];
    unindex(slot.position.roomId, handle);
    m_idToIndex.erase(slot.id);

    slot.instance.reset();
    slot.position = EntityPosition{};
    slot.id = EntityHandle::INVALID_ID;
    // Generation is kept so the next occupant gets a different one
    m_freeSlots.push_back(index);

    REGISTRY_DEBUG("Destroyed " + handle.toString());
    return true;
}

bool EntityRegistry::isValidHandle(EntityHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return findSlot(handle) != INVALID_INDEX;
}

// ============================================================================
// INSTANCE ACCESS
// ============================================================================

std::optional<EntityInstance> EntityRegistry::getInstance(EntityHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return std::nullopt;
    }
    return m_slots[index].instance;
}

bool EntityRegistry::replaceInstance(EntityHandle handle, const EntityInstance& instance) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return false;
    }

    EntityInstance& stored = *m_slots[index].instance;
    if (stored.getTemplateId() != instance.getTemplateId() ||
        stored.getKind() != instance.getKind()) {
        REGISTRY_ERROR("Rejected write-back to " + handle.toString() +
                       ": template or kind mismatch");
        return false;
    }

    stored = instance;
    if (auto* stats = stored.combat()) {
        stats->hpCurrent = std::clamp(stats->hpCurrent, 0, stats->hpMax);
    }
    return true;
}

// ============================================================================
// POSITIONS
// ============================================================================

std::optional<EntityPosition> EntityRegistry::getPosition(EntityHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return std::nullopt;
    }
    return m_slots[index].position;
}

bool EntityRegistry::moveTo(EntityHandle handle, const std::string& roomId,
                            std::optional<AnchorMud::RangeBand> band) {
    if (roomId.empty()) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return false;
    }

    EntityPosition& position = m_slots[index].position;
    if (position.roomId != roomId) {
        unindex(position.roomId, handle);
        m_roomIndex[roomId].insert(handle);
        position.roomId = roomId;
    }
    position.band = band;
    position.engagedTarget = INVALID_ENTITY_HANDLE;
    return true;
}

bool EntityRegistry::setRangeBand(EntityHandle handle, std::optional<AnchorMud::RangeBand> band) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return false;
    }
    m_slots[index].position.band = band;
    return true;
}

bool EntityRegistry::setEngagedTarget(EntityHandle handle, EntityHandle target) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return false;
    }
    if (target.isValid() && findSlot(target) == INVALID_INDEX) {
        return false;
    }
    m_slots[index].position.engagedTarget = target;
    return true;
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<EntityHandle> EntityRegistry::getEntitiesInRoom(const std::string& roomId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_roomIndex.find(roomId);
    if (it == m_roomIndex.end()) {
        return {};
    }
    return std::vector<EntityHandle>(it->second.begin(), it->second.end());
}

std::vector<EntityHandle> EntityRegistry::getEntitiesInRoom(const std::string& roomId,
                                                            EntityKind kind) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<EntityHandle> result;
    auto it = m_roomIndex.find(roomId);
    if (it == m_roomIndex.end()) {
        return result;
    }
    for (const auto& handle : it->second) {
        if (handle.getKind() == kind) {
            result.push_back(handle);
        }
    }
    return result;
}

size_t EntityRegistry::countInRoom(const std::string& roomId, EntityKind kind) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_roomIndex.find(roomId);
    if (it == m_roomIndex.end()) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
        [kind](const EntityHandle& handle) { return handle.getKind() == kind; }));
}

std::vector<EntityHandle> EntityRegistry::findInRoomByName(const std::string& roomId,
                                                           const std::string& name) const {
    std::vector<EntityHandle> result;
    if (name.empty()) {
        return result;
    }
    const std::string needle = toLower(name);

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_roomIndex.find(roomId);
    if (it == m_roomIndex.end()) {
        return result;
    }
    for (const auto& handle : it->second) {
        size_t index = findSlot(handle);
        if (index == INVALID_INDEX) {
            continue;
        }
        const std::string candidate = toLower(m_slots[index].instance->name);
        if (candidate.rfind(needle, 0) == 0 ||
            candidate.find(" " + needle) != std::string::npos) {
            result.push_back(handle);
        }
    }
    return result;
}

std::vector<EntityHandle> EntityRegistry::getAllEntities(EntityKind kind) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<EntityHandle> result;
    for (const auto& slot : m_slots) {
        if (slot.instance.has_value() && slot.instance->getKind() == kind) {
            result.emplace_back(slot.id, kind, slot.generation);
        }
    }
    return result;
}

std::vector<std::string> EntityRegistry::getRoomsWithPlayers() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> rooms;
    for (const auto& [roomId, members] : m_roomIndex) {
        if (std::any_of(members.begin(), members.end(),
                        [](const EntityHandle& h) { return h.isPlayer(); })) {
            rooms.push_back(roomId);
        }
    }
    std::sort(rooms.begin(), rooms.end());
    return rooms;
}

size_t EntityRegistry::getEntityCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_idToIndex.size();
}

size_t EntityRegistry::purgeStaleTargets(const std::string& roomId) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_roomIndex.find(roomId);
    if (it == m_roomIndex.end()) {
        return 0;
    }

    size_t purged = 0;
    for (const auto& handle : it->second) {
        size_t index = findSlot(handle);
        if (index == INVALID_INDEX) {
            continue;
        }
        EntityPosition& position = m_slots[index].position;
        if (!position.engagedTarget.isValid()) {
            continue;
        }
        size_t targetIndex = findSlot(position.engagedTarget);
        if (targetIndex == INVALID_INDEX ||
            m_slots[targetIndex].position.roomId != roomId) {
            REGISTRY_WARN("Purged stale target " + position.engagedTarget.toString() +
                          " held by " + handle.toString());
            position.engagedTarget = INVALID_ENTITY_HANDLE;
            ++purged;
        }
    }
    return purged;
}

// ============================================================================
// INTERNAL HELPERS
// ============================================================================

size_t EntityRegistry::findSlot(EntityHandle handle) const {
    if (!handle.isValid()) {
        return INVALID_INDEX;
    }
    auto it = m_idToIndex.find(handle.getId());
    if (it == m_idToIndex.end()) {
        return INVALID_INDEX;
    }
    const Slot& slot = m_slots[it->second];
    if (slot.generation != handle.getGeneration() || !slot.instance.has_value()) {
        return INVALID_INDEX;
    }
    return it->second;
}

size_t EntityRegistry::allocateSlot() {
    if (!m_freeSlots.empty()) {
        size_t index = m_freeSlots.back();
        m_freeSlots.pop_back();
        return index;
    }
    m_slots.emplace_back();
    return m_slots.size() - 1;
}

uint8_t EntityRegistry::nextGeneration(size_t index) const {
    uint8_t next = static_cast<uint8_t>(m_slots[index].generation + 1);
    return next == EntityHandle::INVALID_GENERATION ? uint8_t{1} : next;
}

void EntityRegistry::unindex(const std::string& roomId, EntityHandle handle) {
    auto it = m_roomIndex.find(roomId);
    if (it == m_roomIndex.end()) {
        return;
    }
    it->second.erase(handle);
    if (it->second.empty()) {
        m_roomIndex.erase(it);
    }
}
