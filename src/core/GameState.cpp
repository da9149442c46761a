/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameState.hpp"
#include "core/Logger.hpp"
#include <stdexcept>
#include <string>

namespace DelveEngine {

namespace {
GameConfig validated(GameConfig config, Size worldSize) {
    config.worldSize = worldSize;
    config.validate();
    return config;
}
} // anonymous namespace

GameState::GameState(const GameConfig& config, Size worldSize)
    : m_config(validated(config, worldSize)),
      m_rng(m_config.rngSeed),
      m_world(m_config.worldSize),
      m_behaviour(m_config.worldSize),
      m_visibilityGrid(m_config.worldSize, m_config.sightRadius),
      m_algorithm(m_config.visibilityAlgorithm()) {}

GameState::GameState(const GameConfig& config, const TerrainGenerator& generator)
    : GameState(config, config.worldSize) {
    populate(generator.generate(m_config.worldSize, m_rng));
}

GameState::GameState(const GameConfig& config, const TerrainGrid& terrain)
    : GameState(config, terrain.size()) {
    populate(terrain);
}

void GameState::populate(const TerrainGrid& terrain) {
    const Populate result = m_world.populate(terrain);
    m_player = result.playerEntity;
    updateVisibility();

    GAMESTATE_INFO("New run: " + std::to_string(m_config.worldSize.width) + "x" +
                   std::to_string(m_config.worldSize.height) + ", seed " +
                   std::to_string(m_config.rngSeed) + ", " +
                   std::to_string(result.npcCount) + " NPCs");
}

TurnResult GameState::applyCommand(const PlayerCommand& command) {
    TurnResult result;
    result.turn = m_turn;

    if (!isPlayerAlive()) {
        GAMESTATE_DEBUG("Ignoring command, the player is dead");
        result.playerAlive = false;
        return result;
    }

    ++m_turn;
    result.turn = m_turn;
    result.turnTaken = true;

    if (command.type == PlayerCommandType::Move) {
        result.playerOutcome = m_world.maybeMoveCharacter(m_player, command.direction, result.events);
    }

    runNpcTurn(result.events);
    updateVisibility();

    result.playerAlive = isPlayerAlive();
    if (!result.playerAlive) {
        GAMESTATE_INFO("The player died on turn " + std::to_string(m_turn));
    }
    return result;
}

TurnResult GameState::maybeMovePlayer(CardinalDirection direction) {
    return applyCommand(PlayerCommand::move(direction));
}

TurnResult GameState::waitPlayer() {
    return applyCommand(PlayerCommand::wait());
}

void GameState::runNpcTurn(TurnEvents& events) {
    m_world.pruneDeadAgents();

    m_behaviour.update(m_world, playerCoord());

    // Snapshot: acting NPCs may kill the player but never add or remove agents
    for (const Entity npc : m_world.components().agent.entities()) {
        if (!m_world.isLivingCharacter(npc)) {
            continue;
        }

        const NpcAction action = m_behaviour.decide(m_world, npc);
        std::optional<uint32_t> distance;
        if (const std::optional<Coord> coord = m_world.entityCoord(npc)) {
            distance = m_behaviour.distanceAt(*coord);
        }
        m_world.applyNpcAction(npc, action, events, distance);
    }
}

void GameState::updateVisibility() {
    const World& world = m_world;
    VisibilityQuery query;
    query.isOpaque = [&world](Coord coord) { return world.isOpaque(coord); };
    query.sampleTiles = [&world](Coord coord) { return world.sampleTiles(coord); };

    m_visibilityGrid.update(playerCoord(), query, m_algorithm);
}

bool GameState::isPlayerAlive() const {
    return m_world.isLivingCharacter(m_player);
}

Coord GameState::playerCoord() const {
    const std::optional<Coord> coord = m_world.entityCoord(m_player);
    if (!coord) {
        GAMESTATE_CRITICAL("Player " + m_player.toString() + " has no coordinate");
        throw std::logic_error("Player entity has no coordinate");
    }
    return *coord;
}

void GameState::setVisibilityAlgorithm(VisibilityAlgorithm algorithm) {
    m_algorithm = algorithm;
    updateVisibility();
}

std::vector<EntityToRender> GameState::entitiesToRender() const {
    std::vector<EntityToRender> entities;
    entities.reserve(m_world.components().tile.size());
    forEachEntityToRender([&entities](const EntityToRender& entity) {
        entities.push_back(entity);
    });
    return entities;
}

} // namespace DelveEngine
