/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_TYPE_ID_HPP
#define EVENT_TYPE_ID_HPP

#include <cstdint>

// Strongly typed event type enumeration for fast lookups
enum class EventTypeId : uint8_t {
  Combat = 0,
  CombatState = 1,
  RoundSummary = 2,
  Weather = 3,
  Presence = 4,
  Notice = 5,
  Loot = 6,
  Custom = 7,
  COUNT = 8
};

#endif // EVENT_TYPE_ID_HPP
