/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityStorageTests
#include <boost/test/unit_test.hpp>

#include "entities/ComponentTable.hpp"
#include "entities/Entity.hpp"
#include "world/Components.hpp"
#include <string>
#include <unordered_set>
#include <vector>

using namespace DelveEngine;

BOOST_AUTO_TEST_SUITE(EntityAllocatorTests)

BOOST_AUTO_TEST_CASE(DefaultEntityIsInvalid) {
    Entity entity;
    BOOST_CHECK(!entity.isValid());
    BOOST_CHECK_EQUAL(entity, INVALID_ENTITY);
    BOOST_CHECK_EQUAL(entity.toString(), "Entity::INVALID");
}

BOOST_AUTO_TEST_CASE(AllocReturnsDistinctLiveEntities) {
    EntityAllocator allocator;
    std::unordered_set<Entity> seen;

    for (int i = 0; i < 100; ++i) {
        Entity entity = allocator.alloc();
        BOOST_CHECK(entity.isValid());
        BOOST_CHECK(allocator.isAlive(entity));
        BOOST_CHECK(seen.insert(entity).second);
    }

    BOOST_CHECK_EQUAL(allocator.liveCount(), 100u);
    BOOST_CHECK_EQUAL(allocator.capacity(), 100u);
}

BOOST_AUTO_TEST_CASE(FreedIndexIsReusedWithNewGeneration) {
    EntityAllocator allocator;
    Entity first = allocator.alloc();
    allocator.alloc();

    BOOST_CHECK(allocator.free(first));
    BOOST_CHECK(!allocator.isAlive(first));

    Entity reused = allocator.alloc();
    BOOST_CHECK_EQUAL(reused.index, first.index);
    BOOST_CHECK_NE(reused.generation, first.generation);
    BOOST_CHECK(allocator.isAlive(reused));
    BOOST_CHECK(!allocator.isAlive(first));
    BOOST_CHECK_EQUAL(allocator.capacity(), 2u);
}

BOOST_AUTO_TEST_CASE(DoubleFreeIsRejected) {
    EntityAllocator allocator;
    Entity entity = allocator.alloc();

    BOOST_CHECK(allocator.free(entity));
    BOOST_CHECK(!allocator.free(entity));
    BOOST_CHECK(!allocator.free(INVALID_ENTITY));
    BOOST_CHECK(!allocator.free(Entity(42, 1)));
    BOOST_CHECK_EQUAL(allocator.liveCount(), 0u);
}

BOOST_AUTO_TEST_CASE(ClearForgetsEverything) {
    EntityAllocator allocator;
    Entity entity = allocator.alloc();
    allocator.alloc();

    allocator.clear();
    BOOST_CHECK_EQUAL(allocator.liveCount(), 0u);
    BOOST_CHECK_EQUAL(allocator.capacity(), 0u);
    BOOST_CHECK(!allocator.isAlive(entity));
}

BOOST_AUTO_TEST_CASE(EntityOrderingIsByIndexThenGeneration) {
    BOOST_CHECK(Entity(1, 5) < Entity(2, 1));
    BOOST_CHECK(Entity(3, 1) < Entity(3, 2));
    BOOST_CHECK(!(Entity(3, 2) < Entity(3, 2)));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ComponentTableTests)

BOOST_AUTO_TEST_CASE(InsertAndGet) {
    EntityAllocator allocator;
    ComponentTable<int> table;
    Entity entity = allocator.alloc();

    BOOST_CHECK(table.empty());
    table.insert(entity, 7);
    BOOST_REQUIRE(table.get(entity) != nullptr);
    BOOST_CHECK_EQUAL(*table.get(entity), 7);
    BOOST_CHECK(table.contains(entity));
    BOOST_CHECK_EQUAL(table.size(), 1u);
}

BOOST_AUTO_TEST_CASE(InsertOverwrites) {
    EntityAllocator allocator;
    ComponentTable<std::string> table;
    Entity entity = allocator.alloc();

    table.insert(entity, "first");
    table.insert(entity, "second");
    BOOST_CHECK_EQUAL(table.size(), 1u);
    BOOST_CHECK_EQUAL(*table.get(entity), "second");
}

BOOST_AUTO_TEST_CASE(StaleHandleSeesNothing) {
    EntityAllocator allocator;
    ComponentTable<int> table;
    Entity stale = allocator.alloc();
    table.insert(stale, 1);

    allocator.free(stale);
    Entity reused = allocator.alloc();
    BOOST_REQUIRE_EQUAL(reused.index, stale.index);

    table.insert(reused, 2);
    BOOST_CHECK(table.get(stale) == nullptr);
    BOOST_CHECK(table.getMut(stale) == nullptr);
    BOOST_CHECK(!table.remove(stale).has_value());
    BOOST_CHECK_EQUAL(*table.get(reused), 2);
}

BOOST_AUTO_TEST_CASE(GetMutModifiesInPlace) {
    EntityAllocator allocator;
    ComponentTable<HitPoints> table;
    Entity entity = allocator.alloc();
    table.insert(entity, HitPoints::full(6));

    table.getMut(entity)->current -= 2;
    BOOST_CHECK_EQUAL(table.get(entity)->current, 4u);
    BOOST_CHECK_EQUAL(table.get(entity)->max, 6u);
}

BOOST_AUTO_TEST_CASE(RemoveReturnsValue) {
    EntityAllocator allocator;
    ComponentTable<int> table;
    Entity entity = allocator.alloc();
    table.insert(entity, 99);

    std::optional<int> removed = table.remove(entity);
    BOOST_REQUIRE(removed.has_value());
    BOOST_CHECK_EQUAL(*removed, 99);
    BOOST_CHECK(!table.contains(entity));
    BOOST_CHECK(!table.remove(entity).has_value());
}

BOOST_AUTO_TEST_CASE(IterationIsInAscendingIndexOrder) {
    EntityAllocator allocator;
    ComponentTable<int> table;
    std::vector<Entity> entities;
    for (int i = 0; i < 5; ++i) {
        entities.push_back(allocator.alloc());
    }

    // Insert out of order
    table.insert(entities[3], 3);
    table.insert(entities[0], 0);
    table.insert(entities[4], 4);
    table.insert(entities[1], 1);

    std::vector<int> visited;
    table.forEach([&visited](Entity, const int& value) { visited.push_back(value); });
    BOOST_CHECK_EQUAL_COLLECTIONS(visited.begin(), visited.end(),
                                  std::vector<int>({0, 1, 3, 4}).begin(),
                                  std::vector<int>({0, 1, 3, 4}).end());

    std::vector<Entity> holders = table.entities();
    BOOST_REQUIRE_EQUAL(holders.size(), 4u);
    BOOST_CHECK_EQUAL(holders.front(), entities[0]);
    BOOST_CHECK_EQUAL(holders.back(), entities[4]);
}

BOOST_AUTO_TEST_CASE(EntitiesSnapshotSurvivesRemoval) {
    EntityAllocator allocator;
    ComponentTable<int> table;
    for (int i = 0; i < 4; ++i) {
        table.insert(allocator.alloc(), i);
    }

    for (Entity entity : table.entities()) {
        if (*table.get(entity) % 2 == 0) {
            table.remove(entity);
        }
    }
    BOOST_CHECK_EQUAL(table.size(), 2u);
}

BOOST_AUTO_TEST_CASE(ForEachMutUpdatesValues) {
    EntityAllocator allocator;
    ComponentTable<int> table;
    Entity a = allocator.alloc();
    Entity b = allocator.alloc();
    table.insert(a, 1);
    table.insert(b, 2);

    table.forEachMut([](Entity, int& value) { value *= 10; });
    BOOST_CHECK_EQUAL(*table.get(a), 10);
    BOOST_CHECK_EQUAL(*table.get(b), 20);
}

BOOST_AUTO_TEST_CASE(ComponentsRemoveEntityClearsAllTables) {
    EntityAllocator allocator;
    Components components;
    Entity npc = allocator.alloc();
    components.tile.insert(npc, Tile::npc(NpcType::Troll));
    components.npcType.insert(npc, NpcType::Troll);
    components.hitPoints.insert(npc, HitPoints::full(npcMaxHitPoints(NpcType::Troll)));
    components.agent.insert(npc, Agent{});

    components.removeEntity(npc);
    BOOST_CHECK(components.tile.empty());
    BOOST_CHECK(components.npcType.empty());
    BOOST_CHECK(components.hitPoints.empty());
    BOOST_CHECK(components.agent.empty());
}

BOOST_AUTO_TEST_SUITE_END()
