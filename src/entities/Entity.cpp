/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Entity.hpp"
#include "core/Logger.hpp"

namespace DelveEngine {

Entity EntityAllocator::alloc() {
    Entity::Index index;

    if (!m_freeSlots.empty()) {
        index = m_freeSlots.back();
        m_freeSlots.pop_back();
    } else {
        index = static_cast<Entity::Index>(m_generations.size());
        m_generations.emplace_back(1);
        m_alive.emplace_back(0);
    }

    m_alive[index] = 1;
    ++m_liveCount;
    return Entity(index, m_generations[index]);
}

bool EntityAllocator::free(Entity entity) {
    if (!isAlive(entity)) {
        ENTITY_WARN("free() called with stale or invalid handle " + entity.toString());
        return false;
    }

    const Entity::Index index = entity.index;
    m_alive[index] = 0;

    // Increment generation for stale handle detection, skipping the invalid value on wrap
    ++m_generations[index];
    if (m_generations[index] == Entity::INVALID_GENERATION) {
        m_generations[index] = 1;
    }

    m_freeSlots.push_back(index);
    --m_liveCount;
    return true;
}

bool EntityAllocator::isAlive(Entity entity) const {
    if (!entity.isValid() || entity.index >= m_generations.size()) {
        return false;
    }
    return m_alive[entity.index] != 0 && m_generations[entity.index] == entity.generation;
}

void EntityAllocator::clear() {
    m_generations.clear();
    m_alive.clear();
    m_freeSlots.clear();
    m_liveCount = 0;
}

} // namespace DelveEngine
