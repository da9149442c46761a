/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_TABLE_HPP
#define SPATIAL_TABLE_HPP

#include "entities/Entity.hpp"
#include "utils/Coord.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace DelveEngine {

// Mutually exclusive occupancy channels per coordinate
enum class Layer : uint8_t {
    Floor = 0,
    Feature = 1,
    Character = 2,
    Corpse = 3
};

inline constexpr size_t LAYER_COUNT = 4;

inline constexpr std::array<Layer, LAYER_COUNT> ALL_LAYERS = {
    Layer::Floor, Layer::Feature, Layer::Character, Layer::Corpse
};

constexpr const char* layerToString(Layer layer) {
    switch (layer) {
        case Layer::Floor:     return "Floor";
        case Layer::Feature:   return "Feature";
        case Layer::Character: return "Character";
        case Layer::Corpse:    return "Corpse";
    }
    return "Unknown";
}

// Corpses draw at the character depth; layerless placements draw underneath everything
constexpr int layerRenderDepth(std::optional<Layer> layer) {
    if (!layer) {
        return -1;
    }
    switch (*layer) {
        case Layer::Floor:     return 0;
        case Layer::Feature:   return 1;
        case Layer::Character: return 2;
        case Layer::Corpse:    return 2;
    }
    return -1;
}

inline std::ostream& operator<<(std::ostream& os, Layer layer) {
    return os << layerToString(layer);
}

struct Location {
    Coord coord{};
    std::optional<Layer> layer{};

    constexpr bool operator==(const Location& other) const {
        return coord == other.coord && layer == other.layer;
    }

    constexpr bool operator!=(const Location& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const Location& location) {
    os << location.coord << "@";
    if (location.layer) {
        return os << *location.layer;
    }
    return os << "NoLayer";
}

// Occupant of each layer at one coordinate
struct LayerOccupants {
    std::optional<Entity> floor;
    std::optional<Entity> feature;
    std::optional<Entity> character;
    std::optional<Entity> corpse;

    const std::optional<Entity>& get(Layer layer) const {
        switch (layer) {
            case Layer::Floor:     return floor;
            case Layer::Feature:   return feature;
            case Layer::Character: return character;
            case Layer::Corpse:    break;
        }
        return corpse;
    }

    std::optional<Entity>& get(Layer layer) {
        switch (layer) {
            case Layer::Floor:     return floor;
            case Layer::Feature:   return feature;
            case Layer::Character: return character;
            case Layer::Corpse:    break;
        }
        return corpse;
    }

    bool isEmpty() const {
        return !floor && !feature && !character && !corpse;
    }
};

enum class SpatialStatus : uint8_t { SUCCESS, OCCUPIED, OUT_OF_BOUNDS, NOT_PLACED };

inline std::ostream& operator<<(std::ostream& os, const SpatialStatus& status) {
    switch (status) {
        case SpatialStatus::SUCCESS: return os << "SUCCESS";
        case SpatialStatus::OCCUPIED: return os << "OCCUPIED";
        case SpatialStatus::OUT_OF_BOUNDS: return os << "OUT_OF_BOUNDS";
        case SpatialStatus::NOT_PLACED: return os << "NOT_PLACED";
        default: return os << "UNKNOWN";
    }
}

// Outcome of a placement attempt. occupiedBy is only set for OCCUPIED.
struct UpdateResult {
    SpatialStatus status{SpatialStatus::SUCCESS};
    Entity occupiedBy{};

    [[nodiscard]] bool isSuccess() const { return status == SpatialStatus::SUCCESS; }
    [[nodiscard]] bool isOccupied() const { return status == SpatialStatus::OCCUPIED; }
};

/**
 * @brief Authoritative occupancy index for a fixed rectangular grid
 *
 * Two indices are kept in lockstep:
 * - coordinate -> occupant per layer (dense, row-major)
 * - entity index -> current location (dense, generation-checked)
 *
 * Every mutation goes through update/updateCoord/updateLayer/remove. A failed
 * update leaves both indices untouched and reports why, so the caller decides
 * whether to evict the occupant or give up.
 */
class SpatialTable {
public:
    explicit SpatialTable(Size size);

    [[nodiscard]] UpdateResult update(Entity entity, Location location);
    [[nodiscard]] UpdateResult updateCoord(Entity entity, Coord coord);
    [[nodiscard]] UpdateResult updateLayer(Entity entity, Layer layer);

    // Vacates the entity's slot. Returns where it was, if anywhere.
    std::optional<Location> remove(Entity entity);

    [[nodiscard]] std::optional<Coord> coordOf(Entity entity) const;
    [[nodiscard]] std::optional<Location> locationOf(Entity entity) const;
    [[nodiscard]] std::optional<Layer> layerOf(Entity entity) const;

    // nullptr when coord is outside the grid
    [[nodiscard]] const LayerOccupants* layersAt(Coord coord) const;
    // Out-of-range coords read as "no occupants"
    [[nodiscard]] const LayerOccupants& layersAtChecked(Coord coord) const;

    [[nodiscard]] bool isValid(Coord coord) const { return m_size.contains(coord); }
    [[nodiscard]] Size gridSize() const { return m_size; }
    [[nodiscard]] size_t placementCount() const { return m_placementCount; }

    // Walks both indices and checks they describe the same placements
    [[nodiscard]] bool verifyConsistency() const;

    void clear();

private:
    struct Placement {
        Entity entity{};      // INVALID_ENTITY when the slot has no placement
        Location location{};
    };

    const Placement* findPlacement(Entity entity) const;
    Placement& placementSlot(Entity entity);

    // Drops the entity from its current cell slot, if it holds one
    void vacate(const Location& location, Entity entity);

    Size m_size;
    std::vector<LayerOccupants> m_cells;
    std::vector<Placement> m_placements;
    size_t m_placementCount{0};
};

} // namespace DelveEngine

#endif // SPATIAL_TABLE_HPP
