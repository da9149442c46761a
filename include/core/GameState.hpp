/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

/**
 * @file GameState.hpp
 * @brief Turn driver for one dungeon run
 *
 * A turn is one strictly ordered pass:
 *   1. the player's command (move, bump attack or wait)
 *   2. agents of dead characters are pruned
 *   3. the behaviour context is rebuilt around the player
 *   4. every living NPC decides and acts, in ascending entity order
 *   5. visibility is recomputed from the player's cell
 *
 * GameState owns all run state, including the RNG, so two runs built from the
 * same config and terrain play out identically.
 */

#include "ai/BehaviourContext.hpp"
#include "core/GameConfig.hpp"
#include "events/TurnEvent.hpp"
#include "world/SpatialTable.hpp"
#include "world/TerrainGenerator.hpp"
#include "world/VisibilityGrid.hpp"
#include "world/World.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <random>
#include <vector>

namespace DelveEngine {

enum class PlayerCommandType : uint8_t { Move, Wait };

struct PlayerCommand {
    PlayerCommandType type{PlayerCommandType::Wait};
    CardinalDirection direction{CardinalDirection::North};

    static constexpr PlayerCommand move(CardinalDirection dir) {
        return PlayerCommand{PlayerCommandType::Move, dir};
    }
    static constexpr PlayerCommand wait() { return PlayerCommand{}; }
};

inline std::ostream& operator<<(std::ostream& os, const PlayerCommand& command) {
    if (command.type == PlayerCommandType::Wait) {
        return os << "Wait";
    }
    return os << "Move(" << command.direction << ")";
}

struct TurnResult {
    uint64_t turn{0};                          // turn number after this command
    bool turnTaken{false};                     // false once the player is dead
    std::optional<MoveOutcome> playerOutcome;  // nullopt for Wait
    TurnEvents events;
    bool playerAlive{true};
};

// One drawable entity: what it is, where it is, and how well it is seen
struct EntityToRender {
    Entity entity;
    Tile tile;
    Location location;
    CellVisibility visibility;
};

class GameState {
public:
    // Generates terrain with the config's seed. Throws std::invalid_argument on a bad config.
    GameState(const GameConfig& config, const TerrainGenerator& generator);
    // Uses a ready-made map; its size overrides config.worldSize
    GameState(const GameConfig& config, const TerrainGrid& terrain);

    TurnResult applyCommand(const PlayerCommand& command);
    TurnResult maybeMovePlayer(CardinalDirection direction);
    TurnResult waitPlayer();

    // Fresh snapshot on every call
    [[nodiscard]] std::vector<EntityToRender> entitiesToRender() const;

    // Same data without building a vector
    template <typename Fn>
    void forEachEntityToRender(Fn&& fn) const {
        const SpatialTable& spatialTable = m_world.spatialTable();
        m_world.components().tile.forEach([&](Entity entity, const Tile& tile) {
            const std::optional<Location> location = spatialTable.locationOf(entity);
            if (!location) {
                return;
            }
            fn(EntityToRender{entity, tile, *location,
                              m_visibilityGrid.cellVisibility(location->coord)});
        });
    }

    // True while the player still occupies the Character layer
    [[nodiscard]] bool isPlayerAlive() const;
    [[nodiscard]] Entity playerEntity() const { return m_player; }
    // Throws std::logic_error if the player has no placement
    [[nodiscard]] Coord playerCoord() const;
    [[nodiscard]] uint64_t turnCount() const { return m_turn; }

    [[nodiscard]] VisibilityAlgorithm visibilityAlgorithm() const { return m_algorithm; }
    // Takes effect immediately; does not consume a turn
    void setVisibilityAlgorithm(VisibilityAlgorithm algorithm);

    [[nodiscard]] const World& world() const { return m_world; }
    [[nodiscard]] const VisibilityGrid& visibilityGrid() const { return m_visibilityGrid; }
    [[nodiscard]] const BehaviourContext& behaviourContext() const { return m_behaviour; }
    [[nodiscard]] const GameConfig& config() const { return m_config; }

private:
    GameState(const GameConfig& config, Size worldSize);

    void populate(const TerrainGrid& terrain);
    void runNpcTurn(TurnEvents& events);
    void updateVisibility();

    GameConfig m_config;
    std::mt19937_64 m_rng;
    World m_world;
    BehaviourContext m_behaviour;
    VisibilityGrid m_visibilityGrid;
    Entity m_player{};
    uint64_t m_turn{0};
    VisibilityAlgorithm m_algorithm;
};

} // namespace DelveEngine

#endif // GAME_STATE_HPP
