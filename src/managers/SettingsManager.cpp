/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <fstream>

namespace AnchorMud {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (!categoryObj) {
            SETTINGS_WARN("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                if (numValue == static_cast<int>(numValue)) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARN("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = settingValue;
        }
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root{JsonObject{}};
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonValue& category = root[categoryName];
            for (const auto& [key, value] : categorySettings) {
                category[key] = std::visit([](auto&& arg) -> JsonValue {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, float>) {
                        return JsonValue(static_cast<double>(arg));
                    } else {
                        return JsonValue(arg);
                    }
                }, value);
            }
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << root.toString() << "\n";

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

template<typename T>
void SettingsManager::setDefault(const std::string& category, const std::string& key, const T& value) {
    if (!has(category, key)) {
        set(category, key, value);
    }
}

void SettingsManager::applyDefaults() {
    const RuntimeSettings d;

    setDefault("clock", "time_ratio", d.timeRatio);
    setDefault("clock", "start_seconds", static_cast<int>(d.startSeconds));

    setDefault("combat", "base_attack_interval", d.baseAttackInterval);
    setDefault("combat", "min_attack_interval", d.minAttackInterval);
    setDefault("combat", "round_seconds", d.roundSeconds);
    setDefault("combat", "max_reactions_per_round", d.maxReactionsPerRound);
    setDefault("combat", "secondary_armor_rate", d.secondaryArmorRate);
    setDefault("combat", "unarmed_min_damage", d.unarmedMinDamage);
    setDefault("combat", "unarmed_max_damage", d.unarmedMaxDamage);
    setDefault("combat", "unarmed_crit_chance", d.unarmedCritChance);
    setDefault("combat", "crit_multiplier", d.critMultiplier);
    setDefault("combat", "stamina_regen_per_round", d.staminaRegenPerRound);

    setDefault("pursuit", "leave_ends_combat", d.leaveEndsCombat);
    setDefault("pursuit", "flee_window_seconds", d.fleeWindowSeconds);
    setDefault("pursuit", "disengage_difficulty", d.disengageDifficulty);
    setDefault("pursuit", "short_leash_rooms", d.shortLeashRooms);
    setDefault("pursuit", "short_leash_seconds", d.shortLeashSeconds);
    setDefault("pursuit", "long_leash_rooms", d.longLeashRooms);
    setDefault("pursuit", "long_leash_seconds", d.longLeashSeconds);

    setDefault("rooms", "reset_seconds", static_cast<int>(d.roomResetSeconds));
    setDefault("rooms", "idle_horizon_seconds", static_cast<int>(d.idleHorizonSeconds));
    setDefault("rooms", "sweep_interval_seconds", d.sweepIntervalSeconds);
    setDefault("rooms", "world_seed", static_cast<int>(d.worldSeed));

    setDefault("encounters", "roll_chance", d.encounterRollChance);
    setDefault("encounters", "cooldown_seconds", static_cast<int>(d.encounterCooldownSeconds));
    setDefault("encounters", "wander_expiry_seconds", static_cast<int>(d.wanderExpirySeconds));

    setDefault("weather", "min_duration", static_cast<int>(d.weatherMinDuration));
    setDefault("weather", "max_duration", static_cast<int>(d.weatherMaxDuration));
    setDefault("weather", "evaluation_interval", d.weatherEvaluationInterval);

    setDefault("session", "disconnect_grace_seconds", d.disconnectGraceSeconds);
    setDefault("session", "respawn_room", d.respawnRoom);

    setDefault("persistence", "retry_base_seconds", d.retryBaseSeconds);
    setDefault("persistence", "max_retries", d.maxRetries);
}

RuntimeSettings SettingsManager::snapshot() const {
    RuntimeSettings s;

    s.timeRatio = std::max(1, get<int>("clock", "time_ratio", s.timeRatio));
    s.startSeconds = get<int64_t>("clock", "start_seconds", s.startSeconds);

    s.baseAttackInterval = get<float>("combat", "base_attack_interval", s.baseAttackInterval);
    s.minAttackInterval = get<float>("combat", "min_attack_interval", s.minAttackInterval);
    s.roundSeconds = get<float>("combat", "round_seconds", s.roundSeconds);
    s.maxReactionsPerRound = get<int>("combat", "max_reactions_per_round", s.maxReactionsPerRound);
    s.secondaryArmorRate = get<float>("combat", "secondary_armor_rate", s.secondaryArmorRate);
    s.unarmedMinDamage = get<int>("combat", "unarmed_min_damage", s.unarmedMinDamage);
    s.unarmedMaxDamage = get<int>("combat", "unarmed_max_damage", s.unarmedMaxDamage);
    s.unarmedCritChance = get<float>("combat", "unarmed_crit_chance", s.unarmedCritChance);
    s.critMultiplier = get<float>("combat", "crit_multiplier", s.critMultiplier);
    s.staminaRegenPerRound = get<int>("combat", "stamina_regen_per_round", s.staminaRegenPerRound);

    s.leaveEndsCombat = get<bool>("pursuit", "leave_ends_combat", s.leaveEndsCombat);
    s.fleeWindowSeconds = get<float>("pursuit", "flee_window_seconds", s.fleeWindowSeconds);
    s.disengageDifficulty = get<int>("pursuit", "disengage_difficulty", s.disengageDifficulty);
    s.shortLeashRooms = get<int>("pursuit", "short_leash_rooms", s.shortLeashRooms);
    s.shortLeashSeconds = get<float>("pursuit", "short_leash_seconds", s.shortLeashSeconds);
    s.longLeashRooms = get<int>("pursuit", "long_leash_rooms", s.longLeashRooms);
    s.longLeashSeconds = get<float>("pursuit", "long_leash_seconds", s.longLeashSeconds);

    s.roomResetSeconds = get<int64_t>("rooms", "reset_seconds", s.roomResetSeconds);
    s.idleHorizonSeconds = get<int64_t>("rooms", "idle_horizon_seconds", s.idleHorizonSeconds);
    s.sweepIntervalSeconds = get<float>("rooms", "sweep_interval_seconds", s.sweepIntervalSeconds);
    s.worldSeed = get<uint32_t>("rooms", "world_seed", s.worldSeed);

    s.encounterRollChance = get<float>("encounters", "roll_chance", s.encounterRollChance);
    s.encounterCooldownSeconds = get<int64_t>("encounters", "cooldown_seconds", s.encounterCooldownSeconds);
    s.wanderExpirySeconds = get<int64_t>("encounters", "wander_expiry_seconds", s.wanderExpirySeconds);

    s.weatherMinDuration = get<int64_t>("weather", "min_duration", s.weatherMinDuration);
    s.weatherMaxDuration = std::max(s.weatherMinDuration,
                                    get<int64_t>("weather", "max_duration", s.weatherMaxDuration));
    s.weatherEvaluationInterval = get<float>("weather", "evaluation_interval", s.weatherEvaluationInterval);

    s.disconnectGraceSeconds = get<float>("session", "disconnect_grace_seconds", s.disconnectGraceSeconds);
    s.respawnRoom = get<std::string>("session", "respawn_room", s.respawnRoom);

    s.retryBaseSeconds = get<float>("persistence", "retry_base_seconds", s.retryBaseSeconds);
    s.maxRetries = get<int>("persistence", "max_retries", s.maxRetries);

    return s;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    if (categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }

    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});

    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [callbackId](const ListenerInfo& info) {
                return info.id == callbackId;
            }),
        m_listeners.end()
    );
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                callbacks.push_back(listener.callback);
            }
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(category, key, newValue);
        } catch (const std::exception& e) {
            SETTINGS_ERROR("Settings listener for '" + category + "." + key + "' threw: " + e.what());
        }
    }
}

} // namespace AnchorMud
