/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_CONFIG_HPP
#define GAME_CONFIG_HPP

#include "world/TerrainGenerator.hpp"
#include "world/VisibilityGrid.hpp"
#include "utils/Coord.hpp"
#include <cstdint>

namespace DelveEngine {

class SettingsManager;

// Everything a GameState needs to start a run
struct GameConfig {
    Size worldSize{40, 30};
    uint64_t rngSeed{0};
    int sightRadius{VisibilityGrid::DEFAULT_SIGHT_RADIUS};
    bool omniscient{false};
    RoomsAndCorridorsConfig terrain{};
    bool benchmarkMode{false};

    /**
     * @brief Reads the world/visibility/terrain/logging categories
     *
     * Missing keys fall back to the defaults above. The result is not
     * validated; call validate() before use. world.rng_seed is an int, or a
     * decimal string for seeds wider than 32 bits; anything else throws
     * std::invalid_argument.
     */
    static GameConfig fromSettings(const SettingsManager& settings);

    // Throws std::invalid_argument describing the first bad value
    void validate() const;

    [[nodiscard]] VisibilityAlgorithm visibilityAlgorithm() const {
        return omniscient ? VisibilityAlgorithm::Omniscient : VisibilityAlgorithm::Shadowcast;
    }
};

} // namespace DelveEngine

#endif // GAME_CONFIG_HPP
