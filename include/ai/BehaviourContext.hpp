/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOUR_CONTEXT_HPP
#define BEHAVIOUR_CONTEXT_HPP

#include "ai/Agent.hpp"
#include "entities/Entity.hpp"
#include "utils/Coord.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace DelveEngine {

class World;

/**
 * @brief Per-turn NPC decision cache
 *
 * update() floods a distance field outward from the player over every cell an
 * NPC could walk through if other NPCs were not in the way. decide() then
 * steps each NPC to the neighbour with the smallest distance, checking
 * neighbours North, East, South, West and keeping the first of equal
 * candidates. The context only reads the world; decisions are applied by
 * World::applyNpcAction.
 */
class BehaviourContext {
public:
    static constexpr uint32_t UNREACHABLE = std::numeric_limits<uint32_t>::max();

    explicit BehaviourContext(Size size);

    // Rebuilds the distance field for this turn
    void update(const World& world, Coord playerCoord);

    // Wait when boxed in, unreachable, already closest, or not placed
    [[nodiscard]] NpcAction decide(const World& world, Entity npc) const;

    // nullopt when out of range or unreachable
    [[nodiscard]] std::optional<uint32_t> distanceAt(Coord coord) const;

    [[nodiscard]] std::optional<Coord> target() const { return m_target; }
    [[nodiscard]] Size gridSize() const { return m_size; }

private:
    uint32_t rawDistance(Coord coord) const;

    Size m_size;
    std::optional<Coord> m_target;
    std::vector<uint32_t> m_distances;
    std::vector<Coord> m_frontier;  // reused BFS queue
};

} // namespace DelveEngine

#endif // BEHAVIOUR_CONTEXT_HPP
