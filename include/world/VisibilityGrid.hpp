/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VISIBILITY_GRID_HPP
#define VISIBILITY_GRID_HPP

#include "world/Components.hpp"
#include "world/Shadowcast.hpp"
#include "world/SpatialTable.hpp"
#include "utils/Coord.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <vector>

namespace DelveEngine {

enum class CellVisibility : uint8_t {
    Never,       // not seen yet, nothing remembered
    Previously,  // seen before, shows the remembered tiles
    Currently    // inside the current field of view
};

inline std::ostream& operator<<(std::ostream& os, CellVisibility visibility) {
    switch (visibility) {
        case CellVisibility::Never:      return os << "Never";
        case CellVisibility::Previously: return os << "Previously";
        case CellVisibility::Currently:  return os << "Currently";
    }
    return os << "Unknown";
}

enum class VisibilityAlgorithm : uint8_t {
    Shadowcast,
    Omniscient   // debug override: the whole map is in view
};

inline std::ostream& operator<<(std::ostream& os, VisibilityAlgorithm algorithm) {
    return os << (algorithm == VisibilityAlgorithm::Omniscient ? "Omniscient" : "Shadowcast");
}

// Tile of each layer as it looked when the cell was last in view
using RememberedTiles = std::array<std::optional<Tile>, LAYER_COUNT>;

// Read-only view of the world handed to VisibilityGrid::update
struct VisibilityQuery {
    std::function<bool(Coord)> isOpaque;
    std::function<RememberedTiles(Coord)> sampleTiles;
};

/**
 * @brief Persistent fog-of-war state for one map
 *
 * Instead of rewriting every cell on each update, the grid keeps an update
 * counter and stamps each cell with the counter value from when it was last in
 * view. A cell is Currently when its stamp equals the counter, Previously when
 * it is older, and Never when it was never stamped. Advancing the counter
 * demotes the whole previous field of view in O(1), and a cell can never go
 * back to Never.
 */
class VisibilityGrid {
public:
    static constexpr int DEFAULT_SIGHT_RADIUS = 20;

    explicit VisibilityGrid(Size size, int sightRadius = DEFAULT_SIGHT_RADIUS);

    /**
     * @brief Recomputes the field of view from viewer
     *
     * Cells marked in this update become Currently and their remembered tiles
     * are refreshed through query.sampleTiles. Everything that was Currently
     * before and is not marked again drops to Previously.
     */
    void update(Coord viewer, const VisibilityQuery& query, VisibilityAlgorithm algorithm);

    // Never for coordinates outside the grid
    [[nodiscard]] CellVisibility cellVisibility(Coord coord) const;

    [[nodiscard]] std::optional<Tile> rememberedTile(Coord coord, Layer layer) const;
    [[nodiscard]] size_t countCells(CellVisibility visibility) const;

    [[nodiscard]] int sightRadius() const { return m_sightRadius; }
    void setSightRadius(int sightRadius);

    [[nodiscard]] Size size() const { return m_size; }
    [[nodiscard]] uint64_t updateCount() const { return m_counter; }

private:
    void markCurrently(Coord coord, const VisibilityQuery& query);

    Size m_size;
    int m_sightRadius;
    uint64_t m_counter{0};
    std::vector<uint64_t> m_lastSeen;
    std::vector<RememberedTiles> m_remembered;
    ShadowcastContext m_shadowcast;
};

} // namespace DelveEngine

#endif // VISIBILITY_GRID_HPP
