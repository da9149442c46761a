/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace DelveEngine {

/**
 * @brief Lightweight handle for referencing entities in the world store
 *
 * An Entity carries no data of its own. It is an index into the allocator's
 * slot array plus the generation that slot had when the entity was created:
 * - Component tables and the spatial table key their storage by index
 * - Every lookup compares the generation, so a stale handle never aliases
 *   whatever entity later reuses the same index
 *
 * Handles are cheap to copy and compare, and are passed by value throughout.
 */
struct Entity {
    using Index = uint32_t;
    using Generation = uint32_t;

    static constexpr Generation INVALID_GENERATION = 0;

    Index index{0};
    Generation generation{INVALID_GENERATION};

    constexpr Entity() noexcept = default;
    constexpr Entity(Index entityIndex, Generation gen) noexcept
        : index(entityIndex), generation(gen) {}

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return generation != INVALID_GENERATION;
    }

    [[nodiscard]] constexpr bool operator==(const Entity& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    [[nodiscard]] constexpr bool operator!=(const Entity& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] constexpr bool operator<(const Entity& other) const noexcept {
        if (index != other.index) return index < other.index;
        return generation < other.generation;
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        return std::hash<uint64_t>{}(static_cast<uint64_t>(generation) << 32 | index);
    }

    [[nodiscard]] std::string toString() const {
        if (!isValid()) {
            return "Entity::INVALID";
        }
        return "Entity(" + std::to_string(index) + ":" + std::to_string(generation) + ")";
    }
};

inline constexpr Entity INVALID_ENTITY{};

inline std::ostream& operator<<(std::ostream& os, const Entity& entity) {
    return os << entity.toString();
}

/**
 * @brief Hands out recyclable entity identifiers
 *
 * Freed indices go on a free list and are reused LIFO. Each free bumps the
 * slot generation, so handles to the previous occupant stop resolving.
 */
class EntityAllocator {
public:
    EntityAllocator() = default;

    // Amortized O(1)
    Entity alloc();

    /**
     * @brief Invalidates an entity and makes its index reusable
     * @return false if the handle was already stale or invalid (nothing changes)
     */
    bool free(Entity entity);

    [[nodiscard]] bool isAlive(Entity entity) const;

    [[nodiscard]] size_t liveCount() const { return m_liveCount; }
    [[nodiscard]] size_t capacity() const { return m_generations.size(); }

    void clear();

private:
    std::vector<Entity::Generation> m_generations;
    std::vector<uint8_t> m_alive;
    std::vector<Entity::Index> m_freeSlots;
    size_t m_liveCount{0};
};

} // namespace DelveEngine

// Hash function for std::unordered_map support
namespace std {
template <>
struct hash<DelveEngine::Entity> {
    std::size_t operator()(const DelveEngine::Entity& entity) const noexcept {
        return entity.hash();
    }
};
} // namespace std

#endif // ENTITY_HPP
