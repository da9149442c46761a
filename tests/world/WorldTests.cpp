/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorldTests
#include <boost/test/unit_test.hpp>

#include "world/World.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace DelveEngine;

namespace {

// World populated from an ASCII map, with the player handle kept
struct MapFixture {
    World world;
    Entity player;

    explicit MapFixture(const std::vector<std::string>& rows)
        : world(TerrainGrid::fromAscii(rows).size()) {
        player = world.populate(TerrainGrid::fromAscii(rows)).playerEntity;
    }

    Entity characterAt(Coord coord) const {
        const std::optional<Entity>& character =
            world.spatialTable().layersAtChecked(coord).character;
        return character ? *character : INVALID_ENTITY;
    }

    Entity corpseAt(Coord coord) const {
        const std::optional<Entity>& corpse = world.spatialTable().layersAtChecked(coord).corpse;
        return corpse ? *corpse : INVALID_ENTITY;
    }
};

size_t countEvents(const TurnEvents& events, TurnEventType type) {
    size_t count = 0;
    for (const TurnEvent& event : events) {
        if (event.type == type) {
            ++count;
        }
    }
    return count;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(WorldPopulateTests)

BOOST_AUTO_TEST_CASE(PopulateSpawnsFloorUnderEverything) {
    MapFixture map({
        "###",
        "#@o",
        "T.#"
    });

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            BOOST_CHECK(map.world.spatialTable().layersAtChecked(Coord(x, y)).floor.has_value());
        }
    }
    BOOST_CHECK(map.world.spatialTable().layersAtChecked(Coord(0, 0)).feature.has_value());
    BOOST_CHECK_EQUAL(map.characterAt(Coord(1, 1)), map.player);
    BOOST_CHECK_EQUAL(*map.world.components().tile.get(map.player), Tile::player());
    BOOST_CHECK_EQUAL(map.world.components().hitPoints.get(map.player)->current,
                      PLAYER_MAX_HIT_POINTS);
    BOOST_CHECK(!map.world.components().agent.contains(map.player));
    BOOST_CHECK(map.world.spatialTable().verifyConsistency());
}

BOOST_AUTO_TEST_CASE(PopulateReportsCounts) {
    World world(Size(3, 2));
    Populate result = world.populate(TerrainGrid::fromAscii({"@oT", "#.."}));

    BOOST_CHECK_EQUAL(result.npcCount, 2u);
    // six floors, one wall, three characters
    BOOST_CHECK_EQUAL(result.entityCount, 10u);
    BOOST_CHECK_EQUAL(world.components().agent.size(), 2u);

    const Entity troll = *world.spatialTable().layersAtChecked(Coord(2, 0)).character;
    BOOST_CHECK_EQUAL(*world.components().npcType.get(troll), NpcType::Troll);
    BOOST_CHECK_EQUAL(world.components().hitPoints.get(troll)->current,
                      npcMaxHitPoints(NpcType::Troll));
}

BOOST_AUTO_TEST_CASE(PopulateRejectsBadTerrain) {
    World world(Size(3, 1));
    BOOST_CHECK_THROW(world.populate(TerrainGrid::fromAscii({"@.", ".."})),
                      std::invalid_argument);
    BOOST_CHECK_THROW(world.populate(TerrainGrid::fromAscii({"..."})), std::invalid_argument);
    BOOST_CHECK_THROW(world.populate(TerrainGrid::fromAscii({"@.@"})), std::invalid_argument);
    BOOST_CHECK_EQUAL(world.entityAllocator().liveCount(), 0u);
}

BOOST_AUTO_TEST_CASE(SpawnIntoTakenSlotThrows) {
    World world(Size(2, 2));
    world.spawnWall(Coord(0, 0));
    BOOST_CHECK_THROW(world.spawnWall(Coord(0, 0)), std::logic_error);
    BOOST_CHECK_THROW(world.spawnFloor(Coord(5, 5)), std::logic_error);
    BOOST_CHECK_EQUAL(world.entityAllocator().liveCount(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WorldMovementTests)

BOOST_AUTO_TEST_CASE(MoveIntoOpenFloor) {
    MapFixture map({"@.."});
    TurnEvents events;

    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events),
                      MoveOutcome::MOVED);
    BOOST_CHECK_EQUAL(*map.world.entityCoord(map.player), Coord(1, 0));
    BOOST_CHECK_EQUAL(map.characterAt(Coord(0, 0)), INVALID_ENTITY);
    BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_CASE(EdgeOfMapClampsMovement) {
    MapFixture map({"@.."});
    TurnEvents events;

    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::West, events),
                      MoveOutcome::OUT_OF_BOUNDS);
    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::North, events),
                      MoveOutcome::OUT_OF_BOUNDS);
    BOOST_CHECK_EQUAL(*map.world.entityCoord(map.player), Coord(0, 0));
}

BOOST_AUTO_TEST_CASE(WallBlocksMovement) {
    MapFixture map({"@#."});
    TurnEvents events;

    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events),
                      MoveOutcome::BLOCKED_BY_FEATURE);
    BOOST_CHECK_EQUAL(*map.world.entityCoord(map.player), Coord(0, 0));
    BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_CASE(NpcsDoNotAttackEachOther) {
    MapFixture map({"@oT"});
    TurnEvents events;
    const Entity orc = map.characterAt(Coord(1, 0));
    const Entity troll = map.characterAt(Coord(2, 0));

    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(troll, CardinalDirection::West, events),
                      MoveOutcome::BLOCKED_BY_ALLY);
    BOOST_CHECK_EQUAL(map.world.components().hitPoints.get(orc)->current,
                      npcMaxHitPoints(NpcType::Orc));
    BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_CASE(UnplacedOrDeadCharacterCannotMove) {
    MapFixture map({"@o."});
    TurnEvents events;
    const Entity orc = map.characterAt(Coord(1, 0));

    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    BOOST_REQUIRE(!map.world.isLivingCharacter(orc));

    BOOST_CHECK_THROW(map.world.maybeMoveCharacter(orc, CardinalDirection::East, events),
                      std::logic_error);
    BOOST_CHECK_THROW(map.world.maybeMoveCharacter(Entity(999, 1), CardinalDirection::East, events),
                      std::logic_error);
}

BOOST_AUTO_TEST_CASE(NpcEntryRules) {
    MapFixture map({"@o#."});

    BOOST_CHECK(map.world.canNpcEnter(Coord(0, 0)));   // the player is a target
    BOOST_CHECK(!map.world.canNpcEnter(Coord(1, 0)));  // another NPC
    BOOST_CHECK(!map.world.canNpcEnter(Coord(2, 0)));
    BOOST_CHECK(map.world.canNpcEnter(Coord(3, 0)));
    BOOST_CHECK(!map.world.canNpcEnter(Coord(4, 0)));

    BOOST_CHECK(map.world.canNpcEnterIgnoringOtherNpcs(Coord(1, 0)));
    BOOST_CHECK(!map.world.canNpcEnterIgnoringOtherNpcs(Coord(2, 0)));

    BOOST_CHECK(map.world.isOpaque(Coord(2, 0)));
    BOOST_CHECK(!map.world.isOpaque(Coord(1, 0)));
    BOOST_CHECK(map.world.isOpaque(Coord(-1, 0)));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WorldCombatTests)

BOOST_AUTO_TEST_CASE(OrcDiesAfterTwoBumps) {
    MapFixture map({
        "####",
        "#@o#",
        "####"
    });
    const Entity orc = map.characterAt(Coord(2, 1));
    TurnEvents events;

    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events),
                      MoveOutcome::ATTACKED);
    BOOST_CHECK_EQUAL(map.world.components().hitPoints.get(orc)->current, 1u);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].type, TurnEventType::Attack);
    BOOST_CHECK_EQUAL(events[0].damage, 1u);
    BOOST_CHECK_EQUAL(events[0].remainingHitPoints, 1u);
    BOOST_CHECK(map.world.isLivingCharacter(orc));

    events.clear();
    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events),
                      MoveOutcome::ATTACKED);
    BOOST_CHECK_EQUAL(countEvents(events, TurnEventType::Attack), 1u);
    BOOST_CHECK_EQUAL(countEvents(events, TurnEventType::Death), 1u);

    BOOST_CHECK(!map.world.isLivingCharacter(orc));
    BOOST_CHECK_EQUAL(*map.world.components().tile.get(orc), Tile::npcCorpse(NpcType::Orc));
    BOOST_CHECK(!map.world.components().agent.contains(orc));
    BOOST_CHECK_EQUAL(map.characterAt(Coord(2, 1)), INVALID_ENTITY);
    BOOST_CHECK_EQUAL(map.corpseAt(Coord(2, 1)), orc);
    BOOST_CHECK(map.world.spatialTable().verifyConsistency());

    // The corpse does not block the way
    events.clear();
    BOOST_CHECK_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events),
                      MoveOutcome::MOVED);
    BOOST_CHECK_EQUAL(*map.world.entityCoord(map.player), Coord(2, 1));
}

BOOST_AUTO_TEST_CASE(TrollNeedsSixBumps) {
    MapFixture map({"@T"});
    const Entity troll = map.characterAt(Coord(1, 0));
    TurnEvents events;

    for (int i = 0; i < 5; ++i) {
        map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    }
    BOOST_CHECK(map.world.isLivingCharacter(troll));
    BOOST_CHECK_EQUAL(map.world.components().hitPoints.get(troll)->current, 1u);
    BOOST_CHECK_EQUAL(countEvents(events, TurnEventType::Death), 0u);

    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    BOOST_CHECK(!map.world.isLivingCharacter(troll));
    BOOST_CHECK_EQUAL(*map.world.components().tile.get(troll), Tile::npcCorpse(NpcType::Troll));
}

BOOST_AUTO_TEST_CASE(DeathEventNamesKillerAndVictim) {
    MapFixture map({"@o"});
    const Entity orc = map.characterAt(Coord(1, 0));
    TurnEvents events;
    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);

    const TurnEvent& death = events.back();
    BOOST_CHECK_EQUAL(death.type, TurnEventType::Death);
    BOOST_CHECK_EQUAL(death.actor, map.player);
    BOOST_CHECK_EQUAL(death.target, orc);
    BOOST_CHECK_EQUAL(*death.targetTile, Tile::npc(NpcType::Orc));
}

BOOST_AUTO_TEST_CASE(PlayerCanDie) {
    MapFixture map({"@o"});
    const Entity orc = map.characterAt(Coord(1, 0));
    TurnEvents events;

    for (uint32_t i = 0; i < PLAYER_MAX_HIT_POINTS; ++i) {
        BOOST_REQUIRE(map.world.isLivingCharacter(map.player));
        map.world.maybeMoveCharacter(orc, CardinalDirection::West, events);
    }

    BOOST_CHECK(!map.world.isLivingCharacter(map.player));
    BOOST_CHECK_EQUAL(*map.world.components().tile.get(map.player), Tile::playerCorpse());
    BOOST_CHECK_EQUAL(map.corpseAt(Coord(0, 0)), map.player);
    BOOST_CHECK_EQUAL(map.world.components().hitPoints.get(map.player)->current, 0u);
}

BOOST_AUTO_TEST_CASE(NewCorpseReplacesOldOne) {
    MapFixture map({"@oo"});
    const Entity first = map.characterAt(Coord(1, 0));
    const Entity second = map.characterAt(Coord(2, 0));
    TurnEvents events;

    // Kill the first orc, then let the second step onto its corpse
    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    BOOST_REQUIRE_EQUAL(map.corpseAt(Coord(1, 0)), first);
    BOOST_REQUIRE_EQUAL(map.world.maybeMoveCharacter(second, CardinalDirection::West, events),
                        MoveOutcome::MOVED);

    events.clear();
    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);
    map.world.maybeMoveCharacter(map.player, CardinalDirection::East, events);

    BOOST_CHECK_EQUAL(countEvents(events, TurnEventType::CorpseReplaced), 1u);
    BOOST_CHECK_EQUAL(map.corpseAt(Coord(1, 0)), second);
    BOOST_CHECK(!map.world.entityAllocator().isAlive(first));
    BOOST_CHECK(!map.world.components().tile.contains(first));
    BOOST_CHECK(map.world.spatialTable().verifyConsistency());

    const TurnEvent& replaced = events.back();
    BOOST_CHECK_EQUAL(replaced.actor, second);
    BOOST_CHECK_EQUAL(replaced.target, first);
}

BOOST_AUTO_TEST_CASE(AttackOnTargetWithoutHitPointsIsSkipped) {
    World world(Size(2, 1));
    const Entity wall = world.spawnWall(Coord(0, 0));
    const Entity npc = world.spawnNpc(Coord(1, 0), NpcType::Orc);
    TurnEvents events;

    world.characterBumpAttack(npc, wall, events);
    BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WorldAgentTests)

BOOST_AUTO_TEST_CASE(ApplyNpcActionRecordsDecision) {
    MapFixture map({"@.o"});
    const Entity orc = map.characterAt(Coord(2, 0));
    TurnEvents events;

    std::optional<MoveOutcome> outcome =
        map.world.applyNpcAction(orc, NpcAction::move(CardinalDirection::West), events, 2u);
    BOOST_REQUIRE(outcome.has_value());
    BOOST_CHECK_EQUAL(*outcome, MoveOutcome::MOVED);

    const Agent* agent = map.world.components().agent.get(orc);
    BOOST_REQUIRE(agent != nullptr);
    BOOST_CHECK_EQUAL(agent->lastAction, NpcAction::move(CardinalDirection::West));
    BOOST_CHECK_EQUAL(agent->turnsActed, 1u);
    BOOST_CHECK_EQUAL(*agent->lastDistance, 2u);

    outcome = map.world.applyNpcAction(orc, NpcAction::wait(), events);
    BOOST_CHECK(!outcome.has_value());
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].type, TurnEventType::NpcWait);
    BOOST_CHECK_EQUAL(events[0].actor, orc);
    BOOST_CHECK_EQUAL(agent->turnsActed, 2u);
    BOOST_CHECK(!agent->lastDistance.has_value());
}

BOOST_AUTO_TEST_CASE(OnlyLivingCharactersKeepAgents) {
    MapFixture map({
        "#####",
        "#oo@#",
        "#####"
    });
    const Entity frontOrc = map.characterAt(Coord(2, 1));
    const Entity backOrc = map.characterAt(Coord(1, 1));
    BOOST_CHECK_EQUAL(map.world.pruneDeadAgents(), 0u);
    BOOST_CHECK_EQUAL(map.world.components().agent.size(), 2u);

    // Kill the nearer orc, then walk in and kill the second
    TurnEvents events;
    for (int i = 0; i < 2; ++i) {
        map.world.maybeMoveCharacter(map.player, CardinalDirection::West, events);
    }
    BOOST_REQUIRE(!map.world.isLivingCharacter(frontOrc));
    BOOST_CHECK_EQUAL(map.world.pruneDeadAgents(), 0u);

    BOOST_REQUIRE_EQUAL(map.world.maybeMoveCharacter(map.player, CardinalDirection::West, events),
                        MoveOutcome::MOVED);
    for (int i = 0; i < 2; ++i) {
        map.world.maybeMoveCharacter(map.player, CardinalDirection::West, events);
    }
    BOOST_REQUIRE(!map.world.isLivingCharacter(backOrc));
    BOOST_CHECK_EQUAL(map.world.pruneDeadAgents(), 0u);

    BOOST_CHECK(map.world.components().agent.empty());
    map.world.components().agent.forEach([&map](Entity entity, const Agent&) {
        BOOST_CHECK(map.world.isLivingCharacter(entity));
    });
}

BOOST_AUTO_TEST_CASE(RemoveEntityPurgesEverything) {
    MapFixture map({"@o"});
    const Entity orc = map.characterAt(Coord(1, 0));

    map.world.removeEntity(orc);
    BOOST_CHECK(!map.world.entityAllocator().isAlive(orc));
    BOOST_CHECK(!map.world.entityCoord(orc).has_value());
    BOOST_CHECK(!map.world.components().tile.contains(orc));
    BOOST_CHECK(!map.world.components().agent.contains(orc));
    BOOST_CHECK_EQUAL(map.characterAt(Coord(1, 0)), INVALID_ENTITY);
}

BOOST_AUTO_TEST_CASE(SampleTilesReportsEveryLayer) {
    MapFixture map({"@#"});
    const RememberedTiles player = map.world.sampleTiles(Coord(0, 0));
    BOOST_CHECK_EQUAL(*player[static_cast<size_t>(Layer::Floor)], Tile::floor());
    BOOST_CHECK_EQUAL(*player[static_cast<size_t>(Layer::Character)], Tile::player());
    BOOST_CHECK(!player[static_cast<size_t>(Layer::Feature)].has_value());

    const RememberedTiles wall = map.world.sampleTiles(Coord(1, 0));
    BOOST_CHECK_EQUAL(*wall[static_cast<size_t>(Layer::Feature)], Tile::wall());

    const RememberedTiles outside = map.world.sampleTiles(Coord(5, 5));
    for (const std::optional<Tile>& tile : outside) {
        BOOST_CHECK(!tile.has_value());
    }
}

BOOST_AUTO_TEST_SUITE_END()
