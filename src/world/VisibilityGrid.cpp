/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/VisibilityGrid.hpp"
#include "core/Logger.hpp"
#include <stdexcept>
#include <string>

namespace DelveEngine {

VisibilityGrid::VisibilityGrid(Size size, int sightRadius)
    : m_size(size), m_sightRadius(sightRadius) {
    if (size.width <= 0 || size.height <= 0) {
        throw std::invalid_argument("VisibilityGrid dimensions must be positive");
    }
    if (sightRadius < 1) {
        throw std::invalid_argument("Sight radius must be at least 1, got " +
                                    std::to_string(sightRadius));
    }
    m_lastSeen.assign(size.count(), 0);
    m_remembered.assign(size.count(), RememberedTiles{});
}

void VisibilityGrid::setSightRadius(int sightRadius) {
    if (sightRadius < 1) {
        VISIBILITY_ERROR("Rejected sight radius " + std::to_string(sightRadius));
        throw std::invalid_argument("Sight radius must be at least 1, got " +
                                    std::to_string(sightRadius));
    }
    m_sightRadius = sightRadius;
}

void VisibilityGrid::markCurrently(Coord coord, const VisibilityQuery& query) {
    const size_t index = m_size.indexOf(coord);
    m_lastSeen[index] = m_counter;
    if (query.sampleTiles) {
        m_remembered[index] = query.sampleTiles(coord);
    }
}

void VisibilityGrid::update(Coord viewer, const VisibilityQuery& query,
                            VisibilityAlgorithm algorithm) {
    ++m_counter;

    if (algorithm == VisibilityAlgorithm::Omniscient) {
        for (size_t i = 0; i < m_lastSeen.size(); ++i) {
            markCurrently(m_size.coordOf(i), query);
        }
        return;
    }

    if (!m_size.contains(viewer)) {
        VISIBILITY_WARN("Viewer outside the grid, nothing is in view this update");
        return;
    }

    auto isOpaque = [&query](Coord coord) {
        return query.isOpaque ? query.isOpaque(coord) : false;
    };
    m_shadowcast.observe(viewer, m_size, m_sightRadius, isOpaque,
                         [this, &query](Coord coord) { markCurrently(coord, query); });
}

CellVisibility VisibilityGrid::cellVisibility(Coord coord) const {
    if (!m_size.contains(coord)) {
        return CellVisibility::Never;
    }
    const uint64_t lastSeen = m_lastSeen[m_size.indexOf(coord)];
    if (lastSeen == 0) {
        return CellVisibility::Never;
    }
    return lastSeen == m_counter ? CellVisibility::Currently : CellVisibility::Previously;
}

std::optional<Tile> VisibilityGrid::rememberedTile(Coord coord, Layer layer) const {
    if (!m_size.contains(coord)) {
        return std::nullopt;
    }
    return m_remembered[m_size.indexOf(coord)][static_cast<size_t>(layer)];
}

size_t VisibilityGrid::countCells(CellVisibility visibility) const {
    size_t count = 0;
    for (uint64_t lastSeen : m_lastSeen) {
        CellVisibility state = CellVisibility::Never;
        if (lastSeen != 0) {
            state = lastSeen == m_counter ? CellVisibility::Currently
                                          : CellVisibility::Previously;
        }
        if (state == visibility) {
            ++count;
        }
    }
    return count;
}

} // namespace DelveEngine
