/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "managers/SettingsManager.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace DelveEngine;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_settings.json";

    SettingsTestFixture() {
        // Ensure test_data directory exists
        std::filesystem::create_directories("tests/test_data");

        // Clear any existing settings
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        // Cleanup test files
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
        file.close();
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    auto& settings = SettingsManager::Instance();

    // Set and get int value
    BOOST_CHECK(settings.set("world", "width", 80));
    BOOST_CHECK_EQUAL(settings.get<int>("world", "width", 0), 80);

    // Test default value when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("world", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    auto& settings = SettingsManager::Instance();

    // Set and get float value
    BOOST_CHECK(settings.set("terrain", "troll_chance", 0.33f));
    BOOST_CHECK_CLOSE(settings.get<float>("terrain", "troll_chance", 0.0f), 0.33f, 0.001f);

    // Test default value
    BOOST_CHECK_CLOSE(settings.get<float>("terrain", "nonexistent", 1.0f), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestGetSetBool) {
    auto& settings = SettingsManager::Instance();

    // Set and get bool value
    BOOST_CHECK(settings.set("visibility", "omniscient", true));
    BOOST_CHECK_EQUAL(settings.get<bool>("visibility", "omniscient", false), true);

    // Change to false
    BOOST_CHECK(settings.set("visibility", "omniscient", false));
    BOOST_CHECK_EQUAL(settings.get<bool>("visibility", "omniscient", true), false);
}

BOOST_AUTO_TEST_CASE(TestGetSetString) {
    auto& settings = SettingsManager::Instance();

    // Set and get string value
    BOOST_CHECK(settings.set("world", "generator", std::string("rooms")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("world", "generator", ""), "rooms");

    // String literals are stored as strings
    BOOST_CHECK(settings.set("world", "name", "Depths"));
    BOOST_CHECK_EQUAL(settings.get<std::string>("world", "name", ""), "Depths");

    // Test default value
    BOOST_CHECK_EQUAL(settings.get<std::string>("world", "nonexistent", "default"), "default");
}

BOOST_AUTO_TEST_CASE(TestHasMethod) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "key", 42);

    BOOST_CHECK(settings.has("test", "key"));
    BOOST_CHECK(!settings.has("test", "nonexistent"));
    BOOST_CHECK(!settings.has("nonexistent", "key"));
}

BOOST_AUTO_TEST_CASE(TestRemoveMethod) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "key1", 1);
    settings.set("test", "key2", 2);

    BOOST_CHECK(settings.has("test", "key1"));
    BOOST_CHECK(settings.remove("test", "key1"));
    BOOST_CHECK(!settings.has("test", "key1"));

    // key2 should still exist
    BOOST_CHECK(settings.has("test", "key2"));

    // Removing non-existent key returns false
    BOOST_CHECK(!settings.remove("test", "nonexistent"));
}

BOOST_AUTO_TEST_CASE(TestClearCategory) {
    auto& settings = SettingsManager::Instance();

    settings.set("category1", "key1", 1);
    settings.set("category1", "key2", 2);
    settings.set("category2", "key1", 3);

    BOOST_CHECK(settings.clearCategory("category1"));

    BOOST_CHECK(!settings.has("category1", "key1"));
    BOOST_CHECK(!settings.has("category1", "key2"));

    // category2 should still exist
    BOOST_CHECK(settings.has("category2", "key1"));

    // Clearing non-existent category returns false
    BOOST_CHECK(!settings.clearCategory("nonexistent"));
}

BOOST_AUTO_TEST_CASE(TestClearAll) {
    auto& settings = SettingsManager::Instance();

    settings.set("cat1", "key1", 1);
    settings.set("cat2", "key2", 2);

    settings.clearAll();

    BOOST_CHECK(!settings.has("cat1", "key1"));
    BOOST_CHECK(!settings.has("cat2", "key2"));
}

BOOST_AUTO_TEST_CASE(TestGetCategories) {
    auto& settings = SettingsManager::Instance();

    settings.clearAll();
    settings.set("world", "key", 1);
    settings.set("visibility", "key", 2);
    settings.set("terrain", "key", 3);

    auto categories = settings.getCategories();

    BOOST_REQUIRE_EQUAL(categories.size(), 3);

    // Categories come back sorted
    BOOST_CHECK_EQUAL(categories[0], "terrain");
    BOOST_CHECK_EQUAL(categories[1], "visibility");
    BOOST_CHECK_EQUAL(categories[2], "world");
}

BOOST_AUTO_TEST_CASE(TestGetKeys) {
    auto& settings = SettingsManager::Instance();

    settings.clearAll();
    settings.set("test", "key1", 1);
    settings.set("test", "key2", 2);
    settings.set("test", "key3", 3);

    auto keys = settings.getKeys("test");

    BOOST_CHECK_EQUAL(keys.size(), 3);

    // Empty category
    auto emptyKeys = settings.getKeys("nonexistent");
    BOOST_CHECK_EQUAL(emptyKeys.size(), 0);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    auto& settings = SettingsManager::Instance();

    // Create test JSON file
    std::string jsonContent = R"({
  "world": {
    "width": 80,
    "height": 50,
    "name": "Depths"
  },
  "visibility": {
    "sight_radius": 12,
    "omniscient": false
  },
  "terrain": {
    "troll_chance": 0.8
  }
})";

    createTestFile(jsonContent);

    // Load settings
    BOOST_CHECK(settings.loadFromFile(testFile));

    // Verify loaded values
    BOOST_CHECK_EQUAL(settings.get<int>("world", "width", 0), 80);
    BOOST_CHECK_EQUAL(settings.get<int>("world", "height", 0), 50);
    BOOST_CHECK_EQUAL(settings.get<std::string>("world", "name", ""), "Depths");
    BOOST_CHECK_EQUAL(settings.get<int>("visibility", "sight_radius", 0), 12);
    BOOST_CHECK_EQUAL(settings.get<bool>("visibility", "omniscient", true), false);
    BOOST_CHECK_CLOSE(settings.get<float>("terrain", "troll_chance", 0.0f), 0.8f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSaveToFile) {
    auto& settings = SettingsManager::Instance();

    settings.clearAll();
    settings.set("world", "width", 64);
    settings.set("visibility", "omniscient", true);
    settings.set("terrain", "troll_chance", 0.9f);
    settings.set("world", "name", std::string("The \"Pit\""));

    // Save to file
    BOOST_CHECK(settings.saveToFile(testFile));

    // Verify file exists
    BOOST_CHECK(std::filesystem::exists(testFile));

    // Clear settings and reload to verify persistence
    settings.clearAll();
    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("world", "width", 0), 64);
    BOOST_CHECK_EQUAL(settings.get<bool>("visibility", "omniscient", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("terrain", "troll_chance", 0.0f), 0.9f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("world", "name", ""), "The \"Pit\"");
}

BOOST_AUTO_TEST_CASE(TestChangeListener) {
    auto& settings = SettingsManager::Instance();

    int callbackCount = 0;
    std::string lastCategory;
    std::string lastKey;

    // Register listener
    auto callbackId = settings.registerChangeListener("world",
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue& value) {
            callbackCount++;
            lastCategory = category;
            lastKey = key;
            (void)value;  // Suppress unused warning
        });

    // Make changes
    settings.set("world", "width", 80);
    settings.set("world", "height", 50);
    settings.set("visibility", "sight_radius", 8);  // Different category, shouldn't trigger

    // Should have been called twice (only for world category)
    BOOST_CHECK_EQUAL(callbackCount, 2);
    BOOST_CHECK_EQUAL(lastCategory, "world");
    BOOST_CHECK_EQUAL(lastKey, "height");

    // Unregister and verify no more calls
    settings.unregisterChangeListener(callbackId);
    settings.set("world", "rng_seed", 7);

    BOOST_CHECK_EQUAL(callbackCount, 2);  // Should still be 2
}

BOOST_AUTO_TEST_CASE(TestGlobalChangeListener) {
    auto& settings = SettingsManager::Instance();

    int callbackCount = 0;

    // Register global listener (empty category string)
    auto callbackId = settings.registerChangeListener("",
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue& value) {
            (void)category;  // Suppress unused warning
            (void)key;       // Suppress unused warning
            (void)value;     // Suppress unused warning
            callbackCount++;
        });

    // Make changes to different categories
    settings.set("world", "width", 80);
    settings.set("visibility", "sight_radius", 8);
    settings.set("terrain", "max_rooms", 20);

    // Should have been called for all changes
    BOOST_CHECK_EQUAL(callbackCount, 3);

    settings.unregisterChangeListener(callbackId);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    auto& settings = SettingsManager::Instance();

    settings.clearAll();

    const int numThreads = 10;
    const int operationsPerThread = 100;

    std::vector<std::thread> threads;

    // Launch multiple threads doing concurrent operations
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&settings, t, count=operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                std::string category = "category" + std::to_string(t);
                std::string key = "key" + std::to_string(i);

                // Write
                settings.set(category, key, i * t);

                // Read
                int value = settings.get<int>(category, key, -1);

                // Should not be -1 (default value)
                BOOST_CHECK(value != -1);

                // Check existence
                BOOST_CHECK(settings.has(category, key));
            }
        });
    }

    // Wait for all threads
    for (auto& thread : threads) {
        thread.join();
    }

    // Verify all values were written
    for (int t = 0; t < numThreads; ++t) {
        std::string category = "category" + std::to_string(t);
        for (int i = 0; i < operationsPerThread; ++i) {
            std::string key = "key" + std::to_string(i);
            BOOST_CHECK(settings.has(category, key));
        }
    }
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();

    // Try to load non-existent file
    BOOST_CHECK(!settings.loadFromFile("nonexistent_file.json"));

    // Try to load invalid JSON
    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestLoadFromStringMerges) {
    auto& settings = SettingsManager::Instance();

    settings.set("world", "width", 40);
    settings.set("world", "height", 30);

    BOOST_CHECK(settings.loadFromString(R"({"world": {"width": 60}})"));
    BOOST_CHECK_EQUAL(settings.get<int>("world", "width", 0), 60);
    // Keys missing from the document keep their values
    BOOST_CHECK_EQUAL(settings.get<int>("world", "height", 0), 30);
}

BOOST_AUTO_TEST_CASE(TestLoadNotifiesListeners) {
    auto& settings = SettingsManager::Instance();

    std::vector<std::string> changedKeys;
    auto callbackId = settings.registerChangeListener("visibility",
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue& value) {
            (void)category;
            (void)value;
            changedKeys.push_back(key);
        });

    BOOST_CHECK(settings.loadFromString(R"({"visibility": {"sight_radius": 5, "omniscient": true}})"));
    BOOST_CHECK_EQUAL(changedKeys.size(), 2);

    settings.unregisterChangeListener(callbackId);
}

BOOST_AUTO_TEST_CASE(TestMalformedStringKeepsSettings) {
    auto& settings = SettingsManager::Instance();

    settings.set("world", "width", 40);
    BOOST_CHECK(!settings.loadFromString(R"({"world": {"width": 99)"));
    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
    BOOST_CHECK_EQUAL(settings.get<int>("world", "width", 0), 40);
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    auto& settings = SettingsManager::Instance();

    // Store as int
    settings.set("test", "value", 42);

    // An int widens to float; other types fall back to the default
    BOOST_CHECK_CLOSE(settings.get<float>("test", "value", 99.9f), 42.0f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("test", "value", "default"), "default");
}

BOOST_AUTO_TEST_SUITE_END()
