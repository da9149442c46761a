/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace DelveEngine {

class JsonValue;

/**
 * @brief Thread-safe settings store grouped by category
 *
 * Values are typed (int, float, bool, string), persisted as a two-level JSON
 * object ({"category": {"key": value}}) and written back in sorted order so
 * saved files diff cleanly.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int radius = settings.get<int>("visibility", "sight_radius", 20);
 *   settings.set("visibility", "omniscient", true);
 */
class SettingsManager {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                              const std::string& key,
                                              const SettingValue& newValue)>;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    /**
     * @brief Merges settings from a JSON file into the current set
     * @return false if the file is missing or malformed; current values are kept
     */
    bool loadFromFile(const std::string& filepath);

    // Same as loadFromFile for an in-memory document
    bool loadFromString(const std::string& json);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed lookup
     *
     * Returns defaultValue when the setting is missing or stored with another
     * type. An int is accepted where a float is requested.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    // Triggers change listeners. Returns false for unsupported types.
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    // An empty category watches everything
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    SettingsManager() = default;
    ~SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    bool applyDocument(const JsonValue& root, const std::string& source);
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId{0};
};

// Template implementations must be in header for linking

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

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&value)) {
            return static_cast<float>(*asInt);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(&value)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Listeners run outside the settings lock so they may read settings
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace DelveEngine

#endif // SETTINGS_MANAGER_HPP
