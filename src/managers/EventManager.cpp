/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EventManager.hpp"
#include "core/Logger.hpp"
#include "events/Event.hpp"
#include <algorithm>
#include <exception>

EventManager &EventManager::Instance() {
  static EventManager instance;
  return instance;
}

bool EventManager::init() {
  if (m_initialized.load()) {
    EVENT_WARN("EventManager already initialized");
    return true;
  }

  // Allow re-initialization after clean()
  m_isShutdown.store(false);

  {
    std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
    for (auto &handlerContainer : m_handlersByType) {
      handlerContainer.clear();
      constexpr size_t HANDLER_CONTAINER_CAPACITY = 16;
      handlerContainer.reserve(HANDLER_CONTAINER_CAPACITY);
    }
  }

  {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    m_pendingDispatch.clear();
  }
  m_droppedEvents.store(0);

  m_initialized.store(true);
  EVENT_INFO("EventManager initialized");
  return true;
}

bool EventManager::isInitialized() const { return m_initialized.load(); }

bool EventManager::isShutdown() const { return m_isShutdown.load(); }

void EventManager::clean() {
  if (!m_initialized.load(std::memory_order_acquire) || m_isShutdown.load()) {
    return;
  }

  // Stop accepting work before tearing down
  m_isShutdown.store(true);
  m_initialized.store(false, std::memory_order_release);

  clearAllHandlers();

  {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    m_pendingDispatch.clear();
  }
}

void EventManager::update() {
  if (!m_initialized.load(std::memory_order_acquire)) {
    return;
  }

  std::vector<PendingDispatch> local;
  {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    local.reserve(m_pendingDispatch.size());
    while (!m_pendingDispatch.empty()) {
      local.push_back(std::move(m_pendingDispatch.front()));
      m_pendingDispatch.pop_front();
    }
  }

  if (local.empty()) {
    return;
  }

  // Higher priority first, arrival order kept within one priority
  std::stable_sort(local.begin(), local.end(),
                   [](const PendingDispatch &a, const PendingDispatch &b) {
                     return a.data.priority > b.data.priority;
                   });

  for (const auto &pd : local) {
    invokeHandlers(pd.typeId, pd.data, "deferred dispatch");
  }
}

void EventManager::registerHandler(EventTypeId typeId,
                                   FastEventHandler handler) {
  (void)registerHandlerWithToken(typeId, std::move(handler));
}

EventManager::HandlerToken
EventManager::registerHandlerWithToken(EventTypeId typeId,
                                       FastEventHandler handler) {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  const size_t idx = static_cast<size_t>(typeId);
  uint64_t id = m_nextHandlerId.fetch_add(1, std::memory_order_relaxed);

  m_handlersByType[idx].push_back(HandlerEntry{std::move(handler), id});
  return HandlerToken{typeId, id};
}

bool EventManager::removeHandler(const HandlerToken &token) {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  const size_t idx = static_cast<size_t>(token.typeId);
  if (idx >= m_handlersByType.size()) {
    return false;
  }

  auto &entries = m_handlersByType[idx];
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&token](const HandlerEntry &entry) {
                           return entry.id == token.id;
                         });
  if (it == entries.end()) {
    return false;
  }
  entries.erase(it);
  return true;
}

void EventManager::removeHandlers(EventTypeId typeId) {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  m_handlersByType[static_cast<size_t>(typeId)].clear();
}

void EventManager::clearAllHandlers() {
  std::unique_lock<std::shared_mutex> lock(m_handlersMutex);
  for (auto &entries : m_handlersByType) {
    entries.clear();
  }
  EVENT_DEBUG("All event handlers cleared");
}

size_t EventManager::getHandlerCount(EventTypeId typeId) const {
  std::shared_lock<std::shared_mutex> lock(m_handlersMutex);
  return m_handlersByType[static_cast<size_t>(typeId)].size();
}

bool EventManager::dispatchEvent(const EventPtr &event,
                                 DispatchMode mode) const {
  if (!event || m_isShutdown.load(std::memory_order_acquire)) {
    return false;
  }

  const EventTypeId typeId = event->getTypeId();
  EventData data;
  data.event = event;
  data.typeId = typeId;
  data.priority = event->getPriority() > 0
                      ? static_cast<uint32_t>(event->getPriority())
                      : defaultPriority(typeId);

  if (mode == DispatchMode::Immediate) {
    if (getHandlerCount(typeId) == 0) {
      return false;
    }
    invokeHandlers(typeId, data, "immediate dispatch");
    return true;
  }

  enqueueDispatch(typeId, data);
  return true;
}

size_t EventManager::getPendingCount() const {
  std::lock_guard<std::mutex> lock(m_dispatchMutex);
  return m_pendingDispatch.size();
}

void EventManager::setMaxDispatchQueue(size_t maxQueued) {
  std::lock_guard<std::mutex> lock(m_dispatchMutex);
  m_maxDispatchQueue = std::max<size_t>(1, maxQueued);
}

uint32_t EventManager::defaultPriority(EventTypeId typeId) {
  switch (typeId) {
  case EventTypeId::Combat:
  case EventTypeId::CombatState:
    return EventPriority::HIGH;
  case EventTypeId::Presence:
  case EventTypeId::Notice:
  case EventTypeId::Loot:
    return EventPriority::NORMAL;
  case EventTypeId::Weather:
  case EventTypeId::RoundSummary:
    return EventPriority::LOW;
  default:
    return EventPriority::DEFERRED;
  }
}

void EventManager::invokeHandlers(EventTypeId typeId, const EventData &data,
                                  const char *errorContext) const {
  // Copy under the shared lock so a handler may register or remove handlers
  std::vector<FastEventHandler> handlers;
  {
    std::shared_lock<std::shared_mutex> lock(m_handlersMutex);
    const auto &entries = m_handlersByType[static_cast<size_t>(typeId)];
    handlers.reserve(entries.size());
    for (const auto &entry : entries) {
      if (entry) {
        handlers.push_back(entry.callable);
      }
    }
  }

  if (data.event) {
    data.event->execute();
  }

  for (const auto &handler : handlers) {
    try {
      handler(data);
    } catch (const std::exception &e) {
      EVENT_ERROR(std::string("Handler exception in ") + errorContext + ": " +
                  e.what());
    }
  }
}

void EventManager::enqueueDispatch(EventTypeId typeId,
                                   const EventData &data) const {
  std::lock_guard<std::mutex> lock(m_dispatchMutex);
  if (m_pendingDispatch.size() >= m_maxDispatchQueue) {
    m_pendingDispatch.pop_front();
    m_droppedEvents.fetch_add(1, std::memory_order_relaxed);
  }
  m_pendingDispatch.push_back(PendingDispatch{typeId, data});
}
