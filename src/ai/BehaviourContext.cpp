/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/BehaviourContext.hpp"
#include "core/Logger.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace DelveEngine {

BehaviourContext::BehaviourContext(Size size) : m_size(size) {
    if (size.width <= 0 || size.height <= 0) {
        throw std::invalid_argument("BehaviourContext dimensions must be positive");
    }
    m_distances.assign(size.count(), UNREACHABLE);
    m_frontier.reserve(size.count());
}

void BehaviourContext::update(const World& world, Coord playerCoord) {
    std::fill(m_distances.begin(), m_distances.end(), UNREACHABLE);
    m_frontier.clear();

    if (world.size() != m_size) {
        BEHAVIOUR_ERROR("World size differs from the behaviour context size");
        throw std::invalid_argument("BehaviourContext size does not match world");
    }
    if (!m_size.contains(playerCoord)) {
        BEHAVIOUR_WARN("Player coordinate outside the map, every NPC will wait");
        m_target.reset();
        return;
    }

    m_target = playerCoord;
    m_distances[m_size.indexOf(playerCoord)] = 0;
    m_frontier.push_back(playerCoord);

    // Breadth-first: m_frontier doubles as the queue, head walks forward
    for (size_t head = 0; head < m_frontier.size(); ++head) {
        const Coord current = m_frontier[head];
        const uint32_t nextDistance = m_distances[m_size.indexOf(current)] + 1;

        for (CardinalDirection direction : CARDINAL_DIRECTIONS) {
            const Coord neighbour = current + directionOffset(direction);
            if (!world.canNpcEnterIgnoringOtherNpcs(neighbour)) {
                continue;
            }
            uint32_t& distance = m_distances[m_size.indexOf(neighbour)];
            if (distance != UNREACHABLE) {
                continue;
            }
            distance = nextDistance;
            m_frontier.push_back(neighbour);
        }
    }

    BEHAVIOUR_DEBUG("Distance field reached " + std::to_string(m_frontier.size()) + " cells");
}

uint32_t BehaviourContext::rawDistance(Coord coord) const {
    if (!m_size.contains(coord)) {
        return UNREACHABLE;
    }
    return m_distances[m_size.indexOf(coord)];
}

std::optional<uint32_t> BehaviourContext::distanceAt(Coord coord) const {
    const uint32_t distance = rawDistance(coord);
    if (distance == UNREACHABLE) {
        return std::nullopt;
    }
    return distance;
}

NpcAction BehaviourContext::decide(const World& world, Entity npc) const {
    const std::optional<Coord> npcCoord = world.entityCoord(npc);
    if (!npcCoord || !m_target) {
        return NpcAction::wait();
    }

    const uint32_t ownDistance = rawDistance(*npcCoord);
    uint32_t bestDistance = UNREACHABLE;
    std::optional<CardinalDirection> bestDirection;

    for (CardinalDirection direction : CARDINAL_DIRECTIONS) {
        const Coord neighbour = *npcCoord + directionOffset(direction);
        // The player's cell passes this check; stepping into it becomes an attack
        if (!world.canNpcEnter(neighbour)) {
            continue;
        }
        const uint32_t distance = rawDistance(neighbour);
        if (distance < bestDistance) {
            bestDistance = distance;
            bestDirection = direction;
        }
    }

    if (!bestDirection || bestDistance >= ownDistance) {
        return NpcAction::wait();
    }
    return NpcAction::move(*bestDirection);
}

} // namespace DelveEngine
