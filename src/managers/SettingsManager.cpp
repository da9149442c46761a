/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace DelveEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return applyDocument(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return applyDocument(reader.getRoot(), "<string>");
}

bool SettingsManager::applyDocument(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    struct Change {
        std::string category;
        std::string key;
        SettingValue value;
    };
    std::vector<Change> changed;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

        for (const auto& [categoryName, categoryValue] : *rootObj) {
            const JsonObject* categoryObj = categoryValue.tryAsObject();
            if (!categoryObj) {
                SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
                continue;
            }

            for (const auto& [key, value] : *categoryObj) {
                SettingValue settingValue;
                if (value.isBool()) {
                    settingValue = value.asBool();
                } else if (value.isNumber()) {
                    const double number = value.asNumber();
                    if (std::floor(number) == number && std::abs(number) <= 2147483647.0) {
                        settingValue = static_cast<int>(number);
                    } else {
                        settingValue = static_cast<float>(number);
                    }
                } else if (value.isString()) {
                    settingValue = value.asString();
                } else {
                    SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                    continue;
                }

                m_settings[categoryName][key] = settingValue;
                changed.push_back({categoryName, key, settingValue});
            }
        }
    }

    for (const Change& change : changed) {
        notifyListeners(change.category, change.key, change.value);
    }

    SETTINGS_INFO("Loaded " + std::to_string(changed.size()) + " settings from " + source);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    file << "{\n";
    size_t categoryIndex = 0;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        file << "  " << JsonReader::escapeString(categoryName) << ": {\n";

        size_t keyIndex = 0;
        for (const auto& [key, value] : categorySettings) {
            file << "    " << JsonReader::escapeString(key) << ": ";

            std::visit([&file](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, bool>) {
                    file << (arg ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    file << JsonReader::escapeString(arg);
                } else {
                    file << arg;
                }
            }, value);

            file << (++keyIndex < categorySettings.size() ? ",\n" : "\n");
        }

        file << "  }" << (++categoryIndex < m_settings.size() ? ",\n" : "\n");
    }
    file << "}\n";

    if (!file.good()) {
        SETTINGS_ERROR("Failed while writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() &&
           categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
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

    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [callbackId](const ListenerInfo& info) { return info.id == callbackId; }),
        m_listeners.end());
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
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
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key,
                                      const SettingValue& newValue) {
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
        callback(category, key, newValue);
    }
}

} // namespace DelveEngine
