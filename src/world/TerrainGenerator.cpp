/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TerrainGenerator.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace DelveEngine {

std::ostream& operator<<(std::ostream& os, const TerrainTile& tile) {
    switch (tile.kind) {
        case TerrainTileKind::Floor:  return os << "Floor";
        case TerrainTileKind::Wall:   return os << "Wall";
        case TerrainTileKind::Npc:    return os << "Npc(" << tile.npcType << ")";
        case TerrainTileKind::Player: return os << "Player";
    }
    return os << "Unknown";
}

// ---------------------------------------------------------------------------
// TerrainGrid
// ---------------------------------------------------------------------------

TerrainGrid::TerrainGrid(Size size, TerrainTile fill) : m_size(size) {
    if (size.width <= 0 || size.height <= 0) {
        throw std::invalid_argument("TerrainGrid dimensions must be positive");
    }
    m_tiles.assign(size.count(), fill);
}

TerrainGrid TerrainGrid::fromAscii(const std::vector<std::string>& rows) {
    if (rows.empty() || rows.front().empty()) {
        TERRAIN_ERROR("ASCII map is empty");
        throw std::invalid_argument("ASCII map is empty");
    }

    const int width = static_cast<int>(rows.front().size());
    TerrainGrid grid(Size(width, static_cast<int>(rows.size())), TerrainTile::floor());

    for (size_t y = 0; y < rows.size(); ++y) {
        const std::string& row = rows[y];
        if (static_cast<int>(row.size()) != width) {
            TERRAIN_ERROR("ASCII map row " + std::to_string(y) + " has length " +
                          std::to_string(row.size()) + ", expected " + std::to_string(width));
            throw std::invalid_argument("ASCII map rows must all have the same length");
        }

        for (size_t x = 0; x < row.size(); ++x) {
            TerrainTile tile;
            switch (row[x]) {
                case '#': tile = TerrainTile::wall(); break;
                case '.': tile = TerrainTile::floor(); break;
                case '@': tile = TerrainTile::player(); break;
                case 'o': tile = TerrainTile::npc(NpcType::Orc); break;
                case 'T': tile = TerrainTile::npc(NpcType::Troll); break;
                default:
                    TERRAIN_ERROR(std::string("Unknown ASCII map character '") + row[x] + "'");
                    throw std::invalid_argument(std::string("Unknown ASCII map character: ") + row[x]);
            }
            grid.set(Coord(static_cast<int>(x), static_cast<int>(y)), tile);
        }
    }

    return grid;
}

std::vector<std::string> TerrainGrid::toAscii() const {
    std::vector<std::string> rows(static_cast<size_t>(m_size.height),
                                  std::string(static_cast<size_t>(m_size.width), '#'));
    forEach([&rows](Coord coord, const TerrainTile& tile) {
        char glyph = '#';
        switch (tile.kind) {
            case TerrainTileKind::Floor:  glyph = '.'; break;
            case TerrainTileKind::Wall:   glyph = '#'; break;
            case TerrainTileKind::Player: glyph = '@'; break;
            case TerrainTileKind::Npc:
                glyph = tile.npcType == NpcType::Troll ? 'T' : 'o';
                break;
        }
        rows[static_cast<size_t>(coord.y)][static_cast<size_t>(coord.x)] = glyph;
    });
    return rows;
}

const TerrainTile& TerrainGrid::at(Coord coord) const {
    if (!m_size.contains(coord)) {
        throw std::out_of_range("TerrainGrid::at outside grid");
    }
    return m_tiles[m_size.indexOf(coord)];
}

void TerrainGrid::set(Coord coord, TerrainTile tile) {
    if (!m_size.contains(coord)) {
        throw std::out_of_range("TerrainGrid::set outside grid");
    }
    m_tiles[m_size.indexOf(coord)] = tile;
}

size_t TerrainGrid::count(TerrainTileKind kind) const {
    return static_cast<size_t>(std::count_if(m_tiles.begin(), m_tiles.end(),
        [kind](const TerrainTile& tile) { return tile.kind == kind; }));
}

// ---------------------------------------------------------------------------
// RoomsAndCorridorsGenerator
// ---------------------------------------------------------------------------

RoomsAndCorridorsGenerator::RoomsAndCorridorsGenerator(RoomsAndCorridorsConfig config)
    : m_config(config) {
    if (config.roomMinSize < 1 || config.roomMaxSize < config.roomMinSize) {
        throw std::invalid_argument("Room size bounds must satisfy 1 <= min <= max");
    }
    if (config.maxRooms < 1 || config.maxNpcsPerRoom < 0) {
        throw std::invalid_argument("Room count must be positive and NPC count non-negative");
    }
}

void RoomsAndCorridorsGenerator::carveRoom(TerrainGrid& grid, const Room& room) {
    for (int y = room.y; y < room.y + room.h; ++y) {
        for (int x = room.x; x < room.x + room.w; ++x) {
            grid.set(Coord(x, y), TerrainTile::floor());
        }
    }
}

void RoomsAndCorridorsGenerator::carveHorizontal(TerrainGrid& grid, int x1, int x2, int y) {
    for (int x = std::min(x1, x2); x <= std::max(x1, x2); ++x) {
        grid.set(Coord(x, y), TerrainTile::floor());
    }
}

void RoomsAndCorridorsGenerator::carveVertical(TerrainGrid& grid, int y1, int y2, int x) {
    for (int y = std::min(y1, y2); y <= std::max(y1, y2); ++y) {
        grid.set(Coord(x, y), TerrainTile::floor());
    }
}

void RoomsAndCorridorsGenerator::placeNpcs(TerrainGrid& grid, const Room& room,
                                           std::mt19937_64& rng) const {
    std::uniform_int_distribution<int> countDist(0, m_config.maxNpcsPerRoom);
    std::uniform_int_distribution<int> xDist(room.x, room.x + room.w - 1);
    std::uniform_int_distribution<int> yDist(room.y, room.y + room.h - 1);
    std::bernoulli_distribution trollDist(TROLL_CHANCE);

    const int npcCount = countDist(rng);
    for (int i = 0; i < npcCount; ++i) {
        const Coord coord(xDist(rng), yDist(rng));
        const NpcType npcType = trollDist(rng) ? NpcType::Troll : NpcType::Orc;
        // A collision just means one fewer monster
        if (grid.at(coord).kind == TerrainTileKind::Floor) {
            grid.set(coord, TerrainTile::npc(npcType));
        }
    }
}

TerrainGrid RoomsAndCorridorsGenerator::generate(Size size, std::mt19937_64& rng) const {
    TerrainGrid grid(size, TerrainTile::wall());
    std::vector<Room> rooms;
    rooms.reserve(static_cast<size_t>(m_config.maxRooms));

    std::uniform_int_distribution<int> sizeDist(m_config.roomMinSize, m_config.roomMaxSize);
    std::uniform_int_distribution<int> coinFlip(0, 1);

    for (int attempt = 0; attempt < m_config.maxRooms; ++attempt) {
        const int w = sizeDist(rng);
        const int h = sizeDist(rng);
        // Leave at least one wall cell on every side
        if (w > size.width - 2 || h > size.height - 2) {
            continue;
        }

        std::uniform_int_distribution<int> xDist(1, size.width - 1 - w);
        std::uniform_int_distribution<int> yDist(1, size.height - 1 - h);
        const Room room{xDist(rng), yDist(rng), w, h};

        const bool overlaps = std::any_of(rooms.begin(), rooms.end(),
            [&room](const Room& other) { return room.touches(other); });
        if (overlaps) {
            continue;
        }

        carveRoom(grid, room);
        if (!rooms.empty()) {
            const Coord from = rooms.back().center();
            const Coord to = room.center();
            if (coinFlip(rng) == 0) {
                carveHorizontal(grid, from.x, to.x, from.y);
                carveVertical(grid, from.y, to.y, to.x);
            } else {
                carveVertical(grid, from.y, to.y, from.x);
                carveHorizontal(grid, from.x, to.x, to.y);
            }
        }
        rooms.push_back(room);
    }

    if (rooms.empty()) {
        // Map too small for the configured rooms: open it up instead
        const Room fallback = (size.width >= 3 && size.height >= 3)
            ? Room{1, 1, size.width - 2, size.height - 2}
            : Room{0, 0, size.width, size.height};
        TERRAIN_WARN("No room fit in " + std::to_string(size.width) + "x" +
                     std::to_string(size.height) + ", using a single open room");
        carveRoom(grid, fallback);
        rooms.push_back(fallback);
    }

    for (size_t i = 1; i < rooms.size(); ++i) {
        placeNpcs(grid, rooms[i], rng);
    }
    grid.set(rooms.front().center(), TerrainTile::player());

    TERRAIN_INFO("Generated " + std::to_string(rooms.size()) + " rooms with " +
                 std::to_string(grid.count(TerrainTileKind::Npc)) + " NPCs");
    return grid;
}

} // namespace DelveEngine
