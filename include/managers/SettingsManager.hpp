/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

/**
 * @file SettingsManager.hpp
 * @brief Category/key runtime configuration backed by a JSON file
 *
 * Values are int, float, bool or string. Numeric reads coerce between int
 * and float so "3" and "3.0" in the JSON file both satisfy a float key.
 *
 * Categories used by the runtime: clock, combat, pursuit, rooms,
 * encounters, weather, session, persistence. See RuntimeSettings for the
 * keys and their defaults.
 */

#include "core/RuntimeSettings.hpp"
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace AnchorMud {

class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merge a JSON file of {category: {key: value}} into the store.
     * @return false if the file is missing, unparsable, or not an object
     */
    bool loadFromFile(const std::string& filepath);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Write every runtime key with its default value, keeping any
     * value that is already present.
     */
    void applyDefaults();

    /**
     * @brief Read every runtime key into a RuntimeSettings, falling back to
     * the defaults for missing or mistyped keys.
     */
    [[nodiscard]] RuntimeSettings snapshot() const;

    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    [[nodiscard]] bool has(const std::string& category, const std::string& key) const;

    bool remove(const std::string& category, const std::string& key);

    void clearAll();

    size_t registerChangeListener(const std::string& category, ChangeCallback callback);

    void unregisterChangeListener(size_t callbackId);

    [[nodiscard]] std::vector<std::string> getCategories() const;

    [[nodiscard]] std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);

    template<typename T>
    void setDefault(const std::string& category, const std::string& key, const T& value);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
        return defaultValue;
    } else if constexpr (std::is_arithmetic_v<T>) {
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<T>(*asInt);
        }
        if (const float* asFloat = std::get_if<float>(&stored)) {
            return static_cast<T>(*asFloat);
        }
        return defaultValue;
    } else {
        return defaultValue;
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, bool>) {
        settingValue = value;
    } else if constexpr (std::is_integral_v<T>) {
        settingValue = static_cast<int>(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        settingValue = static_cast<float>(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Notify outside the lock so listeners may read settings
    notifyListeners(category, key, settingValue);

    return true;
}

} // namespace AnchorMud

#endif // SETTINGS_MANAGER_HPP
