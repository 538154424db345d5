/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_MANAGER_HPP
#define EVENT_MANAGER_HPP

/**
 * @file EventManager.hpp
 * @brief Type-indexed event bus between the runtime and the session layer
 *
 * - Handlers are registered per EventTypeId and removed by token
 * - Immediate dispatch runs handlers on the calling thread
 * - Deferred dispatch queues the event; update() drains the queue in
 *   priority order on the server loop thread
 * - Handler exceptions are caught and logged per handler
 */

#include "events/EventTypeId.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

// Forward declarations
class Event;

using EventPtr = std::shared_ptr<Event>;
using EventWeakPtr = std::weak_ptr<Event>;

/**
 * @brief What a handler receives
 */
struct EventData {
  EventPtr event;
  uint32_t priority{0};
  EventTypeId typeId{EventTypeId::Custom};
};

/**
 * @brief Event priority constants for priority-based processing
 */
struct EventPriority {
  static constexpr uint32_t CRITICAL = 1000;  // Deaths, defeat
  static constexpr uint32_t HIGH = 800;       // Strikes, state changes
  static constexpr uint32_t NORMAL = 500;     // Presence, notices, loot
  static constexpr uint32_t LOW = 200;        // Weather, round digests
  static constexpr uint32_t DEFERRED = 0;
};

using FastEventHandler = std::function<void(const EventData &)>;

class EventManager {
public:
  static EventManager &Instance();

  // Dispatch control for handler execution
  enum class DispatchMode : uint8_t { Deferred = 0, Immediate = 1 };

  bool init();
  bool isInitialized() const;
  void clean();

  /**
   * @brief Drain the deferred queue. Called once per server tick.
   */
  void update();

  bool isShutdown() const;

  // Token-based handler management
  struct HandlerToken {
    EventTypeId typeId;
    uint64_t id;
  };
  HandlerToken registerHandlerWithToken(EventTypeId typeId,
                                        FastEventHandler handler);
  void registerHandler(EventTypeId typeId, FastEventHandler handler);
  bool removeHandler(const HandlerToken &token);
  void removeHandlers(EventTypeId typeId);
  void clearAllHandlers();
  size_t getHandlerCount(EventTypeId typeId) const;

  /**
   * @brief Send an event to every handler of its type.
   * @return false if the manager is shut down, the event is null, or (in
   * Immediate mode) no handler is registered
   */
  bool dispatchEvent(const EventPtr &event,
                     DispatchMode mode = DispatchMode::Deferred) const;

  size_t getPendingCount() const;
  void setMaxDispatchQueue(size_t maxQueued);
  uint64_t getDroppedCount() const {
    return m_droppedEvents.load(std::memory_order_relaxed);
  }

private:
  EventManager() = default;
  ~EventManager() = default;
  EventManager(const EventManager &) = delete;
  EventManager &operator=(const EventManager &) = delete;

  struct HandlerEntry {
    FastEventHandler callable;
    uint64_t id{0};
    explicit operator bool() const { return static_cast<bool>(callable); }
  };

  struct PendingDispatch {
    EventTypeId typeId;
    EventData data;
  };

  static uint32_t defaultPriority(EventTypeId typeId);
  void invokeHandlers(EventTypeId typeId, const EventData &data,
                      const char *errorContext) const;
  void enqueueDispatch(EventTypeId typeId, const EventData &data) const;

  std::array<std::vector<HandlerEntry>, static_cast<size_t>(EventTypeId::COUNT)>
      m_handlersByType;
  std::atomic<uint64_t> m_nextHandlerId{1};
  mutable std::shared_mutex m_handlersMutex;

  mutable std::mutex m_dispatchMutex;
  mutable std::deque<PendingDispatch> m_pendingDispatch;
  size_t m_maxDispatchQueue{8192};
  mutable std::atomic<uint64_t> m_droppedEvents{0};

  std::atomic<bool> m_initialized{false};
  std::atomic<bool> m_isShutdown{false};
};

#endif // EVENT_MANAGER_HPP
