/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_TYPES_HPP
#define COMBAT_TYPES_HPP

/**
 * @file CombatTypes.hpp
 * @brief Shared vocabulary of the combat layer: participant states and the
 * result value every player intent returns.
 */

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

enum class CombatState : uint8_t {
    Observing = 0,
    Engaged,
    Supporting,
    Disengaging
};

inline const char* combatStateToString(CombatState state) {
    switch (state) {
        case CombatState::Observing: return "Observing";
        case CombatState::Engaged: return "Engaged";
        case CombatState::Supporting: return "Supporting";
        case CombatState::Disengaging: return "Disengaging";
        default: return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, CombatState state) {
    return os << combatStateToString(state);
}

enum class ActionStatus : uint8_t {
    Ok = 0,
    InvalidTarget,
    InsufficientResource,
    AlreadyAttacking,
    NotInCombat,
    AlreadyInCombat,
    MustDisengage,
    NoExit,
    PursuitBlocked,
    UnknownManeuver,
    Rejected
};

inline const char* actionStatusToString(ActionStatus status) {
    switch (status) {
        case ActionStatus::Ok: return "Ok";
        case ActionStatus::InvalidTarget: return "InvalidTarget";
        case ActionStatus::InsufficientResource: return "InsufficientResource";
        case ActionStatus::AlreadyAttacking: return "AlreadyAttacking";
        case ActionStatus::NotInCombat: return "NotInCombat";
        case ActionStatus::AlreadyInCombat: return "AlreadyInCombat";
        case ActionStatus::MustDisengage: return "MustDisengage";
        case ActionStatus::NoExit: return "NoExit";
        case ActionStatus::PursuitBlocked: return "PursuitBlocked";
        case ActionStatus::UnknownManeuver: return "UnknownManeuver";
        case ActionStatus::Rejected: return "Rejected";
        default: return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, ActionStatus status) {
    return os << actionStatusToString(status);
}

/**
 * @brief Outcome of a player intent. Failures are values with a
 * player-facing message, never exceptions.
 */
struct ActionResult {
    ActionStatus status{ActionStatus::Ok};
    std::string message;

    [[nodiscard]] bool ok() const { return status == ActionStatus::Ok; }

    static ActionResult success(std::string text = {}) {
        return ActionResult{ActionStatus::Ok, std::move(text)};
    }
    static ActionResult failure(ActionStatus code, std::string text) {
        return ActionResult{code, std::move(text)};
    }
};

#endif // COMBAT_TYPES_HPP
