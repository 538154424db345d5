/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RUNTIME_SETTINGS_HPP
#define RUNTIME_SETTINGS_HPP

#include <cstdint>
#include <string>

namespace AnchorMud {

/**
 * @brief Plain snapshot of every tunable the runtime reads.
 *
 * Member initializers are the shipped defaults. Build one from the
 * SettingsManager with SettingsManager::snapshot(); subsystems copy the
 * fields they need at init() so a hot settings change never races a
 * half-applied combat round.
 */
struct RuntimeSettings {
  // clock
  int timeRatio{3};
  int64_t startSeconds{0};

  // combat
  float baseAttackInterval{3.0f};
  float minAttackInterval{0.2f};
  float roundSeconds{6.0f};
  int maxReactionsPerRound{2};
  float secondaryArmorRate{0.5f};
  int unarmedMinDamage{1};
  int unarmedMaxDamage{1};
  float unarmedCritChance{0.01f};
  float critMultiplier{2.0f};
  int staminaRegenPerRound{2};

  // pursuit
  bool leaveEndsCombat{false};
  float fleeWindowSeconds{6.0f};
  int disengageDifficulty{50};
  int shortLeashRooms{1};
  float shortLeashSeconds{30.0f};
  int longLeashRooms{3};
  float longLeashSeconds{120.0f};

  // rooms
  int64_t roomResetSeconds{3600};
  int64_t idleHorizonSeconds{600};
  float sweepIntervalSeconds{5.0f};
  uint32_t worldSeed{1337};

  // encounters
  float encounterRollChance{0.35f};
  int64_t encounterCooldownSeconds{120};
  int64_t wanderExpirySeconds{900};

  // weather
  int64_t weatherMinDuration{600};
  int64_t weatherMaxDuration{1800};
  float weatherEvaluationInterval{30.0f};

  // session
  float disconnectGraceSeconds{30.0f};
  std::string respawnRoom{"start"};

  // persistence
  float retryBaseSeconds{1.0f};
  int maxRetries{8};
};

} // namespace AnchorMud

#endif // RUNTIME_SETTINGS_HPP
