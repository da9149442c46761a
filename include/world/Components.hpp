/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPONENTS_HPP
#define COMPONENTS_HPP

#include "ai/Agent.hpp"
#include "entities/ComponentTable.hpp"
#include <cstdint>
#include <ostream>

namespace DelveEngine {

enum class NpcType : uint8_t {
    Orc,
    Troll
};

constexpr const char* npcTypeName(NpcType npcType) {
    switch (npcType) {
        case NpcType::Orc:   return "orc";
        case NpcType::Troll: return "troll";
    }
    return "unknown";
}

constexpr uint32_t PLAYER_MAX_HIT_POINTS = 20;

constexpr uint32_t npcMaxHitPoints(NpcType npcType) {
    switch (npcType) {
        case NpcType::Orc:   return 2;
        case NpcType::Troll: return 6;
    }
    return 1;
}

inline std::ostream& operator<<(std::ostream& os, NpcType npcType) {
    return os << npcTypeName(npcType);
}

enum class TileKind : uint8_t {
    Floor,
    Wall,
    Npc,
    NpcCorpse,
    Player,
    PlayerCorpse
};

// Render/kind discriminant. npcType only matters for Npc and NpcCorpse.
struct Tile {
    TileKind kind{TileKind::Floor};
    NpcType npcType{NpcType::Orc};

    static constexpr Tile floor() { return Tile{TileKind::Floor}; }
    static constexpr Tile wall() { return Tile{TileKind::Wall}; }
    static constexpr Tile player() { return Tile{TileKind::Player}; }
    static constexpr Tile playerCorpse() { return Tile{TileKind::PlayerCorpse}; }
    static constexpr Tile npc(NpcType type) { return Tile{TileKind::Npc, type}; }
    static constexpr Tile npcCorpse(NpcType type) { return Tile{TileKind::NpcCorpse, type}; }

    constexpr bool isCharacter() const {
        return kind == TileKind::Npc || kind == TileKind::Player;
    }

    constexpr bool isCorpse() const {
        return kind == TileKind::NpcCorpse || kind == TileKind::PlayerCorpse;
    }

    constexpr bool operator==(const Tile& other) const {
        if (kind != other.kind) return false;
        if (kind == TileKind::Npc || kind == TileKind::NpcCorpse) {
            return npcType == other.npcType;
        }
        return true;
    }

    constexpr bool operator!=(const Tile& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const Tile& tile) {
    switch (tile.kind) {
        case TileKind::Floor:        return os << "Floor";
        case TileKind::Wall:         return os << "Wall";
        case TileKind::Npc:          return os << "Npc(" << tile.npcType << ")";
        case TileKind::NpcCorpse:    return os << "NpcCorpse(" << tile.npcType << ")";
        case TileKind::Player:       return os << "Player";
        case TileKind::PlayerCorpse: return os << "PlayerCorpse";
    }
    return os << "Unknown";
}

struct HitPoints {
    uint32_t current{0};
    uint32_t max{0};

    static constexpr HitPoints full(uint32_t maxHitPoints) {
        return HitPoints{maxHitPoints, maxHitPoints};
    }

    constexpr bool isDepleted() const { return current == 0; }
};

/**
 * @brief One table per component kind
 *
 * An entity holds a component only while alive; removeEntity() purges it from
 * every table in one call.
 */
struct Components {
    ComponentTable<Tile> tile;
    ComponentTable<NpcType> npcType;
    ComponentTable<HitPoints> hitPoints;
    ComponentTable<Agent> agent;

    void removeEntity(Entity entity) {
        tile.remove(entity);
        npcType.remove(entity);
        hitPoints.remove(entity);
        agent.remove(entity);
    }

    void clear() {
        tile.clear();
        npcType.clear();
        hitPoints.clear();
        agent.clear();
    }
};

} // namespace DelveEngine

#endif // COMPONENTS_HPP
