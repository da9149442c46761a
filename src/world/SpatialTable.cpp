/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/SpatialTable.hpp"
#include "core/Logger.hpp"
#include <stdexcept>
#include <string>

namespace DelveEngine {

namespace {
const LayerOccupants EMPTY_OCCUPANTS{};

std::string coordToString(const Coord& coord) {
    return "(" + std::to_string(coord.x) + ", " + std::to_string(coord.y) + ")";
}
} // anonymous namespace

SpatialTable::SpatialTable(Size size) : m_size(size) {
    if (size.width <= 0 || size.height <= 0) {
        throw std::invalid_argument("SpatialTable dimensions must be positive: " +
                                    std::to_string(size.width) + "x" +
                                    std::to_string(size.height));
    }
    m_cells.assign(size.count(), LayerOccupants{});
}

const SpatialTable::Placement* SpatialTable::findPlacement(Entity entity) const {
    if (!entity.isValid() || entity.index >= m_placements.size()) {
        return nullptr;
    }
    const Placement& placement = m_placements[entity.index];
    return placement.entity == entity ? &placement : nullptr;
}

SpatialTable::Placement& SpatialTable::placementSlot(Entity entity) {
    if (entity.index >= m_placements.size()) {
        m_placements.resize(static_cast<size_t>(entity.index) + 1);
    }
    return m_placements[entity.index];
}

void SpatialTable::vacate(const Location& location, Entity entity) {
    if (!location.layer || !m_size.contains(location.coord)) {
        return;
    }
    std::optional<Entity>& slot = m_cells[m_size.indexOf(location.coord)].get(*location.layer);
    if (slot && *slot == entity) {
        slot.reset();
    }
}

UpdateResult SpatialTable::update(Entity entity, Location location) {
    if (!entity.isValid()) {
        SPATIAL_ERROR("update() called with invalid entity handle");
        throw std::invalid_argument("SpatialTable::update requires a valid entity");
    }

    if (!m_size.contains(location.coord)) {
        SPATIAL_DEBUG("Rejected placement of " + entity.toString() + " outside grid at " +
                      coordToString(location.coord));
        return UpdateResult{SpatialStatus::OUT_OF_BOUNDS, INVALID_ENTITY};
    }

    if (location.layer) {
        const std::optional<Entity>& occupant =
            m_cells[m_size.indexOf(location.coord)].get(*location.layer);
        if (occupant && *occupant != entity) {
            return UpdateResult{SpatialStatus::OCCUPIED, *occupant};
        }
    }

    Placement& placement = placementSlot(entity);
    if (placement.entity.isValid() && placement.entity != entity) {
        // A stale handle still owns this index; it can no longer be looked up, so drop it
        SPATIAL_WARN("Dropping stale placement of " + placement.entity.toString() +
                     " reused by " + entity.toString());
        vacate(placement.location, placement.entity);
        placement = Placement{};
        --m_placementCount;
    }

    if (placement.entity.isValid()) {
        vacate(placement.location, entity);
    } else {
        ++m_placementCount;
    }

    if (location.layer) {
        m_cells[m_size.indexOf(location.coord)].get(*location.layer) = entity;
    }
    placement.entity = entity;
    placement.location = location;

    return UpdateResult{};
}

UpdateResult SpatialTable::updateCoord(Entity entity, Coord coord) {
    const Placement* placement = findPlacement(entity);
    if (!placement) {
        return UpdateResult{SpatialStatus::NOT_PLACED, INVALID_ENTITY};
    }
    return update(entity, Location{coord, placement->location.layer});
}

UpdateResult SpatialTable::updateLayer(Entity entity, Layer layer) {
    const Placement* placement = findPlacement(entity);
    if (!placement) {
        return UpdateResult{SpatialStatus::NOT_PLACED, INVALID_ENTITY};
    }
    return update(entity, Location{placement->location.coord, layer});
}

std::optional<Location> SpatialTable::remove(Entity entity) {
    const Placement* placement = findPlacement(entity);
    if (!placement) {
        return std::nullopt;
    }

    const Location location = placement->location;
    vacate(location, entity);
    m_placements[entity.index] = Placement{};
    --m_placementCount;
    return location;
}

std::optional<Coord> SpatialTable::coordOf(Entity entity) const {
    const Placement* placement = findPlacement(entity);
    if (!placement) {
        return std::nullopt;
    }
    return placement->location.coord;
}

std::optional<Location> SpatialTable::locationOf(Entity entity) const {
    const Placement* placement = findPlacement(entity);
    if (!placement) {
        return std::nullopt;
    }
    return placement->location;
}

std::optional<Layer> SpatialTable::layerOf(Entity entity) const {
    const Placement* placement = findPlacement(entity);
    if (!placement) {
        return std::nullopt;
    }
    return placement->location.layer;
}

const LayerOccupants* SpatialTable::layersAt(Coord coord) const {
    if (!m_size.contains(coord)) {
        return nullptr;
    }
    return &m_cells[m_size.indexOf(coord)];
}

const LayerOccupants& SpatialTable::layersAtChecked(Coord coord) const {
    if (!m_size.contains(coord)) {
        return EMPTY_OCCUPANTS;
    }
    return m_cells[m_size.indexOf(coord)];
}

bool SpatialTable::verifyConsistency() const {
    size_t slotReferences = 0;

    for (size_t i = 0; i < m_cells.size(); ++i) {
        const Coord coord = m_size.coordOf(i);
        for (Layer layer : ALL_LAYERS) {
            const std::optional<Entity>& occupant = m_cells[i].get(layer);
            if (!occupant) {
                continue;
            }
            ++slotReferences;
            const Placement* placement = findPlacement(*occupant);
            if (!placement || placement->location != Location{coord, layer}) {
                SPATIAL_ERROR("Cell " + coordToString(coord) + " layer " + layerToString(layer) +
                              " references " + occupant->toString() +
                              " which is placed elsewhere");
                return false;
            }
        }
    }

    size_t placements = 0;
    size_t layeredPlacements = 0;
    for (const Placement& placement : m_placements) {
        if (!placement.entity.isValid()) {
            continue;
        }
        ++placements;
        if (!placement.location.layer) {
            continue;
        }
        ++layeredPlacements;
        const LayerOccupants* occupants = layersAt(placement.location.coord);
        if (!occupants || occupants->get(*placement.location.layer) != placement.entity) {
            SPATIAL_ERROR(placement.entity.toString() + " claims a slot it does not hold");
            return false;
        }
    }

    return placements == m_placementCount && layeredPlacements == slotReferences;
}

void SpatialTable::clear() {
    m_cells.assign(m_size.count(), LayerOccupants{});
    m_placements.clear();
    m_placementCount = 0;
}

} // namespace DelveEngine
