/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPONENT_TABLE_HPP
#define COMPONENT_TABLE_HPP

#include "entities/Entity.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace DelveEngine {

/**
 * @brief Sparse map from entity to one component value
 *
 * Entries are keyed by entity index and stamped with the owning generation.
 * A lookup through a handle whose generation does not match behaves as if the
 * component were absent. Iteration runs in ascending index order, which keeps
 * system scans (rendering, AI) deterministic from turn to turn.
 *
 * Usage:
 *   ComponentTable<HitPoints> hitPoints;
 *   hitPoints.insert(entity, HitPoints::full(6));
 *   if (HitPoints* hp = hitPoints.getMut(entity)) { ... }
 */
template <typename T>
class ComponentTable {
public:
    struct Entry {
        Entity::Generation generation;
        T value;
    };

    // Overwrites any existing value for the same index
    void insert(Entity entity, T value) {
        auto it = m_entries.find(entity.index);
        if (it != m_entries.end()) {
            it->second.generation = entity.generation;
            it->second.value = std::move(value);
            return;
        }
        m_entries.emplace(entity.index, Entry{entity.generation, std::move(value)});
    }

    [[nodiscard]] const T* get(Entity entity) const {
        auto it = m_entries.find(entity.index);
        if (it == m_entries.end() || it->second.generation != entity.generation) {
            return nullptr;
        }
        return &it->second.value;
    }

    [[nodiscard]] T* getMut(Entity entity) {
        auto it = m_entries.find(entity.index);
        if (it == m_entries.end() || it->second.generation != entity.generation) {
            return nullptr;
        }
        return &it->second.value;
    }

    [[nodiscard]] bool contains(Entity entity) const {
        return get(entity) != nullptr;
    }

    std::optional<T> remove(Entity entity) {
        auto it = m_entries.find(entity.index);
        if (it == m_entries.end() || it->second.generation != entity.generation) {
            return std::nullopt;
        }
        std::optional<T> removed(std::move(it->second.value));
        m_entries.erase(it);
        return removed;
    }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (const auto& [index, entry] : m_entries) {
            fn(Entity(index, entry.generation), entry.value);
        }
    }

    template <typename Fn>
    void forEachMut(Fn&& fn) {
        for (auto& [index, entry] : m_entries) {
            fn(Entity(index, entry.generation), entry.value);
        }
    }

    // Snapshot of the holders, safe to walk while the table is mutated
    [[nodiscard]] std::vector<Entity> entities() const {
        std::vector<Entity> result;
        result.reserve(m_entries.size());
        for (const auto& [index, entry] : m_entries) {
            result.emplace_back(index, entry.generation);
        }
        return result;
    }

    [[nodiscard]] size_t size() const { return m_entries.size(); }
    [[nodiscard]] bool empty() const { return m_entries.empty(); }
    void clear() { m_entries.clear(); }

private:
    boost::container::flat_map<Entity::Index, Entry> m_entries;
};

} // namespace DelveEngine

#endif // COMPONENT_TABLE_HPP
