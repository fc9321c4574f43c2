/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <cmath>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace Mythweave {

class JsonValue;

/**
 * @brief Category/key store for simulation tuning values
 *
 * Each tool or test owns its own instance and hands it to
 * WorldConfig::fromSettings() or AutosaveConfig::fromSettings(). Reads take a
 * shared lock, writes an exclusive one. Change listeners run on the writing
 * thread after the lock is released; a listener that throws is logged and
 * the remaining listeners still run.
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/world_settings.json");
 *   float sleep = settings.get<float>("behavior", "sleep_threshold", 20.0f);
 *   settings.set("events", "history_cap", 2000);
 *   settings.saveToFile("res/world_settings.json");
 */
class SettingsManager {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                              const std::string& key,
                                              const SettingValue& newValue)>;

    SettingsManager() = default;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    /**
     * @brief Merge settings from a JSON file
     * @return false when the file is missing, malformed or not an object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Merge settings from a parsed document
     *
     * The root must be an object of category objects. Categories that are
     * not objects and values that are not scalars are skipped with a warning.
     * Whole numbers are stored as int, other numbers as float.
     */
    bool loadFromJson(const JsonValue& root);

    /**
     * @brief Write every category as pretty printed JSON
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed read, defaultValue when the key is missing or the stored
     * type does not convert
     *
     * int, int64_t, float and double convert among each other since JSON
     * does not distinguish 20 from 20.0. bool and std::string only read
     * values stored with that type.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Typed write followed by change notification
     * @return false for value types that cannot be stored
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Watch one category, or every category with an empty name
     * @return Id for unregisterChangeListener()
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using Category = std::map<std::string, SettingValue>;

    struct Listener {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };

    std::map<std::string, Category> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    std::vector<Listener> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId{0};

    std::optional<SettingValue> find(const std::string& category, const std::string& key) const;
    void store(const std::string& category, const std::string& key, SettingValue value);
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    template<typename T>
    static std::optional<T> convert(const SettingValue& stored);

    template<typename T>
    static std::optional<SettingValue> toSettingValue(const T& value);
};

template<typename T>
std::optional<T> SettingsManager::convert(const SettingValue& stored) {
    if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* exact = std::get_if<T>(&stored)) {
            return *exact;
        }
        return std::nullopt;
    } else if constexpr (std::is_arithmetic_v<T>) {
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<T>(*asInt);
        }
        if (const float* asFloat = std::get_if<float>(&stored)) {
            if constexpr (std::is_integral_v<T>) {
                return static_cast<T>(std::trunc(*asFloat));
            } else {
                return static_cast<T>(*asFloat);
            }
        }
        return std::nullopt;
    } else {
        static_assert(std::is_arithmetic_v<T>, "unsupported setting type");
        return std::nullopt;
    }
}

template<typename T>
std::optional<SettingsManager::SettingValue> SettingsManager::toSettingValue(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return SettingValue(value);
    } else if constexpr (std::is_integral_v<T>) {
        return SettingValue(static_cast<int>(value));
    } else if constexpr (std::is_floating_point_v<T>) {
        return SettingValue(static_cast<float>(value));
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        return SettingValue(std::string(value));
    } else {
        return std::nullopt;
    }
}

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const std::optional<SettingValue> stored = find(category, key);
    if (!stored) {
        return defaultValue;
    }
    return convert<T>(*stored).value_or(defaultValue);
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    std::optional<SettingValue> converted = toSettingValue(value);
    if (!converted) {
        return false;
    }
    store(category, key, *converted);
    notifyListeners(category, key, *converted);
    return true;
}

} // namespace Mythweave

#endif // SETTINGS_MANAGER_HPP
