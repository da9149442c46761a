/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <charconv>
#include <stdexcept>
#include <string>

namespace DelveEngine {

namespace {
void reject(const std::string& message) {
    GAMESTATE_ERROR("Invalid configuration: " + message);
    throw std::invalid_argument(message);
}

// Ints are taken as 32-bit seeds (negative values wrap). Wider seeds must be
// written as decimal strings, since JSON numbers past int range load as floats.
uint64_t readSeed(const SettingsManager& settings) {
    if (!settings.has("world", "rng_seed")) {
        return 0;
    }

    const std::string text = settings.get<std::string>("world", "rng_seed", "");
    if (!text.empty()) {
        uint64_t seed = 0;
        const char* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, seed);
        if (ec != std::errc() || ptr != end) {
            reject("rng_seed must be a decimal 64-bit integer, got \"" + text + "\"");
        }
        return seed;
    }

    // Two different fallbacks agree only when the stored value is an int
    const int seed = settings.get<int>("world", "rng_seed", 0);
    if (seed != 0 || settings.get<int>("world", "rng_seed", 1) == 0) {
        return static_cast<uint64_t>(static_cast<uint32_t>(seed));
    }
    reject("rng_seed must be an integer in int range or a decimal string");
    return 0;
}
} // anonymous namespace

GameConfig GameConfig::fromSettings(const SettingsManager& settings) {
    GameConfig config;

    config.worldSize.width = settings.get<int>("world", "width", config.worldSize.width);
    config.worldSize.height = settings.get<int>("world", "height", config.worldSize.height);

    config.rngSeed = readSeed(settings);

    config.sightRadius = settings.get<int>("visibility", "sight_radius", config.sightRadius);
    config.omniscient = settings.get<bool>("visibility", "omniscient", config.omniscient);

    config.terrain.maxRooms = settings.get<int>("terrain", "max_rooms", config.terrain.maxRooms);
    config.terrain.roomMinSize = settings.get<int>("terrain", "room_min_size", config.terrain.roomMinSize);
    config.terrain.roomMaxSize = settings.get<int>("terrain", "room_max_size", config.terrain.roomMaxSize);
    config.terrain.maxNpcsPerRoom =
        settings.get<int>("terrain", "max_npcs_per_room", config.terrain.maxNpcsPerRoom);

    config.benchmarkMode = settings.get<bool>("logging", "benchmark_mode", config.benchmarkMode);
    return config;
}

void GameConfig::validate() const {
    if (worldSize.width <= 0 || worldSize.height <= 0) {
        reject("world size must be positive, got " + std::to_string(worldSize.width) + "x" +
               std::to_string(worldSize.height));
    }
    if (sightRadius < 1) {
        reject("sight radius must be at least 1, got " + std::to_string(sightRadius));
    }
    if (terrain.maxRooms < 1) {
        reject("max_rooms must be at least 1");
    }
    if (terrain.roomMinSize < 1 || terrain.roomMaxSize < terrain.roomMinSize) {
        reject("room size bounds are inverted: min " + std::to_string(terrain.roomMinSize) +
               ", max " + std::to_string(terrain.roomMaxSize));
    }
    if (terrain.maxNpcsPerRoom < 0) {
        reject("max_npcs_per_room must not be negative");
    }
}

} // namespace DelveEngine
