/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_HPP
#define WORLD_HPP

/**
 * @file World.hpp
 * @brief Owner and sole mutator of entities, components and placements
 *
 * World resolves everything that changes the map: spawning from terrain,
 * character movement, bump attacks and death. Geometry problems (walls, map
 * edges, friendly characters in the way) are reported as MoveOutcome values
 * and change nothing. Broken invariants, such as moving a character that was
 * never placed, throw std::logic_error.
 */

#include "ai/Agent.hpp"
#include "entities/Entity.hpp"
#include "events/TurnEvent.hpp"
#include "world/Components.hpp"
#include "world/SpatialTable.hpp"
#include "world/TerrainGenerator.hpp"
#include "world/VisibilityGrid.hpp"
#include "utils/Coord.hpp"
#include <cstdint>
#include <optional>
#include <ostream>

namespace DelveEngine {

enum class MoveOutcome : uint8_t {
    MOVED,
    ATTACKED,
    OUT_OF_BOUNDS,
    BLOCKED_BY_FEATURE,
    BLOCKED_BY_ALLY
};

inline std::ostream& operator<<(std::ostream& os, MoveOutcome outcome) {
    switch (outcome) {
        case MoveOutcome::MOVED: return os << "MOVED";
        case MoveOutcome::ATTACKED: return os << "ATTACKED";
        case MoveOutcome::OUT_OF_BOUNDS: return os << "OUT_OF_BOUNDS";
        case MoveOutcome::BLOCKED_BY_FEATURE: return os << "BLOCKED_BY_FEATURE";
        case MoveOutcome::BLOCKED_BY_ALLY: return os << "BLOCKED_BY_ALLY";
        default: return os << "UNKNOWN";
    }
}

// What populate() spawned
struct Populate {
    Entity playerEntity{};
    size_t npcCount{0};
    size_t entityCount{0};
};

class World {
public:
    static constexpr uint32_t BUMP_DAMAGE = 1;

    explicit World(Size size);

    /**
     * @brief Spawns the entities described by a terrain grid
     *
     * Every cell gets a Floor entity. Walls add a Feature, NPCs and the player
     * add a Character. Throws std::invalid_argument if the grid size differs
     * from the world or the grid does not hold exactly one player.
     */
    Populate populate(const TerrainGrid& terrain);

    Entity spawnFloor(Coord coord);
    Entity spawnWall(Coord coord);
    Entity spawnNpc(Coord coord, NpcType npcType);
    Entity spawnPlayer(Coord coord);

    // Purges components, placement and the id in one step
    void removeEntity(Entity entity);

    // In bounds, no Feature and no NPC in the Character slot
    [[nodiscard]] bool canNpcEnter(Coord coord) const;
    // In bounds and no Feature
    [[nodiscard]] bool canNpcEnterIgnoringOtherNpcs(Coord coord) const;
    // Features block sight. Out-of-range cells count as opaque.
    [[nodiscard]] bool isOpaque(Coord coord) const;

    /**
     * @brief Moves a living character one cell, or bumps whoever is there
     *
     * A character of the opposite side in the target cell is attacked instead;
     * one of the same side blocks the move. Events produced by the attack are
     * appended to events. Throws std::logic_error if the entity is not a placed
     * living character.
     */
    MoveOutcome maybeMoveCharacter(Entity character, CardinalDirection direction,
                                   TurnEvents& events);

    // Skipped (nothing happens) when the victim has no HitPoints
    void characterBumpAttack(Entity attacker, Entity victim, TurnEvents& events);

    /**
     * @brief Turns a character into a corpse at its current cell
     *
     * An older corpse already on the cell is removed from the world first.
     * The Agent component is dropped so the corpse never acts again.
     */
    void characterDie(Entity victim, Entity killer, TurnEvents& events);

    /**
     * @brief Applies one scheduler decision to an NPC
     *
     * Records the decision on the NPC's Agent, reports Wait as an NpcWait
     * event and runs Move through maybeMoveCharacter.
     * @return the movement outcome, or nullopt for Wait
     */
    std::optional<MoveOutcome> applyNpcAction(Entity npc, const NpcAction& action,
                                              TurnEvents& events,
                                              std::optional<uint32_t> observedDistance = std::nullopt);

    // Drops the Agent of everything that is no longer a living character
    size_t pruneDeadAgents();

    [[nodiscard]] bool isLivingCharacter(Entity entity) const;
    [[nodiscard]] std::optional<Coord> entityCoord(Entity entity) const;

    // Current tile of each layer at coord, for the visibility memory
    [[nodiscard]] RememberedTiles sampleTiles(Coord coord) const;

    [[nodiscard]] Size size() const { return m_spatialTable.gridSize(); }

    [[nodiscard]] const Components& components() const { return m_components; }
    [[nodiscard]] const SpatialTable& spatialTable() const { return m_spatialTable; }
    [[nodiscard]] const EntityAllocator& entityAllocator() const { return m_entityAllocator; }

private:
    Entity spawnAt(Location location, Tile tile);

    EntityAllocator m_entityAllocator;
    Components m_components;
    SpatialTable m_spatialTable;
};

} // namespace DelveEngine

#endif // WORLD_HPP
