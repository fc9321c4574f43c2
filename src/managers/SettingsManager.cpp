/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <exception>
#include <format>
#include <fstream>
#include <limits>

namespace Mythweave {

namespace {

std::optional<SettingsManager::SettingValue> fromJson(const JsonValue& value) {
    using SettingValue = SettingsManager::SettingValue;
    if (value.isBool()) {
        return SettingValue(value.asBool());
    }
    if (value.isString()) {
        return SettingValue(value.asString());
    }
    if (value.isNumber()) {
        const double number = value.asNumber();
        const bool fitsInt = number >= std::numeric_limits<int>::min() &&
                             number <= std::numeric_limits<int>::max();
        if (fitsInt && std::trunc(number) == number) {
            return SettingValue(static_cast<int>(number));
        }
        return SettingValue(static_cast<float>(number));
    }
    return std::nullopt;
}

JsonValue toJson(const SettingsManager::SettingValue& value) {
    return std::visit([](const auto& stored) -> JsonValue {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, float>) {
            return JsonValue(static_cast<double>(stored));
        } else {
            return JsonValue(stored);
        }
    }, value);
}

std::string describe(const SettingsManager::SettingValue& value) {
    return std::visit([](const auto& stored) -> std::string {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, bool>) {
            return stored ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + stored + "'";
        } else {
            return std::format("{}", stored);
        }
    }, value);
}

} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from {}: {}", filepath, reader.getLastError()));
        return false;
    }
    if (!loadFromJson(reader.getRoot())) {
        SETTINGS_ERROR(std::format("Settings file {} does not hold an object of categories", filepath));
        return false;
    }
    SETTINGS_INFO(std::format("Loaded settings from {}", filepath));
    return true;
}

bool SettingsManager::loadFromJson(const JsonValue& root) {
    if (!root.isObject()) {
        return false;
    }

    // Convert everything first so the merge happens under one lock
    std::map<std::string, Category> incoming;
    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARN(std::format("Skipping '{}', categories must be objects", categoryName));
            continue;
        }
        Category& category = incoming[categoryName];
        for (const auto& [key, value] : categoryValue.asObject()) {
            if (auto converted = fromJson(value)) {
                category[key] = std::move(*converted);
            } else {
                SETTINGS_WARN(std::format("Skipping {}.{}, only scalar values are supported",
                                          categoryName, key));
            }
        }
        if (category.empty()) {
            incoming.erase(categoryName);
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    for (auto& [categoryName, category] : incoming) {
        Category& target = m_settings[categoryName];
        for (auto& [key, value] : category) {
            target[key] = std::move(value);
        }
    }
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root{JsonObject{}};
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, category] : m_settings) {
            JsonValue& node = root[categoryName];
            node = JsonValue(JsonObject{});
            for (const auto& [key, value] : category) {
                node[key] = toJson(value);
            }
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR(std::format("Cannot open {} for writing", filepath));
        return false;
    }
    file << root.toPrettyString() << "\n";
    file.close();
    if (file.fail()) {
        SETTINGS_ERROR(std::format("Failed writing settings to {}", filepath));
        return false;
    }

    SETTINGS_INFO(std::format("Saved settings to {}", filepath));
    return true;
}

std::optional<SettingsManager::SettingValue> SettingsManager::find(const std::string& category,
                                                                   const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    const auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return std::nullopt;
    }
    const auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return std::nullopt;
    }
    return keyIt->second;
}

void SettingsManager::store(const std::string& category, const std::string& key, SettingValue value) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(value);
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    return find(category, key).has_value();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    const auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    const size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    std::erase_if(m_listeners, [callbackId](const Listener& listener) {
        return listener.id == callbackId;
    });
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& entry : m_settings) {
        categories.push_back(entry.first);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> keys;
    const auto categoryIt = m_settings.find(category);
    if (categoryIt != m_settings.end()) {
        keys.reserve(categoryIt->second.size());
        for (const auto& entry : categoryIt->second) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key,
                                      const SettingValue& newValue) {
    SETTINGS_DEBUG(std::format("{}.{} = {}", category, key, describe(newValue)));

    // Snapshot under the lock so a callback may register or unregister listeners
    std::vector<Listener> matching;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                matching.push_back(listener);
            }
        }
    }

    for (const auto& listener : matching) {
        try {
            listener.callback(category, key, newValue);
        } catch (const std::exception& e) {
            SETTINGS_ERROR(std::format("Change listener {} failed for {}.{}: {}",
                                       listener.id, category, key, e.what()));
        }
    }
}

} // namespace Mythweave
