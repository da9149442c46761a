/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRAIN_GENERATOR_HPP
#define TERRAIN_GENERATOR_HPP

#include "world/Components.hpp"
#include "utils/Coord.hpp"
#include <cstdint>
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace DelveEngine {

enum class TerrainTileKind : uint8_t {
    Floor,
    Wall,
    Npc,
    Player
};

// Initial contents of one cell. npcType only matters for Npc.
struct TerrainTile {
    TerrainTileKind kind{TerrainTileKind::Wall};
    NpcType npcType{NpcType::Orc};

    static constexpr TerrainTile floor() { return TerrainTile{TerrainTileKind::Floor}; }
    static constexpr TerrainTile wall() { return TerrainTile{TerrainTileKind::Wall}; }
    static constexpr TerrainTile player() { return TerrainTile{TerrainTileKind::Player}; }
    static constexpr TerrainTile npc(NpcType type) { return TerrainTile{TerrainTileKind::Npc, type}; }

    constexpr bool operator==(const TerrainTile& other) const {
        return kind == other.kind &&
               (kind != TerrainTileKind::Npc || npcType == other.npcType);
    }
    constexpr bool operator!=(const TerrainTile& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const TerrainTile& tile);

/**
 * @brief Dense row-major grid of terrain tiles, the generator's output
 *
 * ASCII form, one string per row:
 *   '#' wall   '.' floor   '@' player   'o' orc   'T' troll
 */
class TerrainGrid {
public:
    explicit TerrainGrid(Size size, TerrainTile fill = TerrainTile::wall());

    // Throws std::invalid_argument on ragged rows, an empty map or unknown characters
    static TerrainGrid fromAscii(const std::vector<std::string>& rows);

    [[nodiscard]] std::vector<std::string> toAscii() const;

    [[nodiscard]] Size size() const { return m_size; }

    // Both throw std::out_of_range outside the grid
    [[nodiscard]] const TerrainTile& at(Coord coord) const;
    void set(Coord coord, TerrainTile tile);

    [[nodiscard]] size_t count(TerrainTileKind kind) const;

    // Visits every cell exactly once, row by row
    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (size_t i = 0; i < m_tiles.size(); ++i) {
            fn(m_size.coordOf(i), m_tiles[i]);
        }
    }

private:
    Size m_size;
    std::vector<TerrainTile> m_tiles;
};

/**
 * @brief Produces the initial map for a new world
 *
 * Implementations must cover the whole grid and should place exactly one
 * player; World::populate rejects a grid without one.
 */
class TerrainGenerator {
public:
    virtual ~TerrainGenerator() = default;

    [[nodiscard]] virtual TerrainGrid generate(Size size, std::mt19937_64& rng) const = 0;
};

struct RoomsAndCorridorsConfig {
    int maxRooms{12};
    int roomMinSize{4};
    int roomMaxSize{9};
    int maxNpcsPerRoom{2};
};

/**
 * @brief Classic rooms-and-corridors dungeon
 *
 * Rectangular rooms are dropped at random positions and rejected if they touch
 * an existing room. Each new room is joined to the previous one by an L-shaped
 * corridor. The player starts in the centre of the first room; every other
 * room gets up to maxNpcsPerRoom monsters (two orcs for every troll on average).
 */
class RoomsAndCorridorsGenerator : public TerrainGenerator {
public:
    // Share of spawned NPCs that are trolls; the rest are orcs
    static constexpr double TROLL_CHANCE = 0.2;

    explicit RoomsAndCorridorsGenerator(RoomsAndCorridorsConfig config = {});

    [[nodiscard]] TerrainGrid generate(Size size, std::mt19937_64& rng) const override;

    [[nodiscard]] const RoomsAndCorridorsConfig& getConfig() const { return m_config; }

private:
    struct Room {
        int x, y, w, h;   // floor cells only, walls surround them

        Coord center() const { return Coord(x + w / 2, y + h / 2); }

        // True when the rooms overlap or would share a wall
        bool touches(const Room& other) const {
            return x <= other.x + other.w && other.x <= x + w &&
                   y <= other.y + other.h && other.y <= y + h;
        }
    };

    static void carveRoom(TerrainGrid& grid, const Room& room);
    static void carveHorizontal(TerrainGrid& grid, int x1, int x2, int y);
    static void carveVertical(TerrainGrid& grid, int y1, int y2, int x);
    void placeNpcs(TerrainGrid& grid, const Room& room, std::mt19937_64& rng) const;

    RoomsAndCorridorsConfig m_config;
};

} // namespace DelveEngine

#endif // TERRAIN_GENERATOR_HPP
