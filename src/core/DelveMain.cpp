/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Logger.hpp"
#include "events/TurnEvent.hpp"
#include "managers/SettingsManager.hpp"
#include "world/TerrainGenerator.hpp"
#include <exception>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace DelveEngine;

namespace {

const std::string GAME_NAME{"Delve"};
const std::string DEFAULT_SETTINGS_PATH{"res/settings.json"};

char glyphOf(const Tile& tile) {
  switch (tile.kind) {
  case TileKind::Floor:
    return '.';
  case TileKind::Wall:
    return '#';
  case TileKind::Player:
    return '@';
  case TileKind::PlayerCorpse:
    return '&';
  case TileKind::Npc:
    return tile.npcType == NpcType::Troll ? 'T' : 'o';
  case TileKind::NpcCorpse:
    return '%';
  }
  return '?';
}

struct FrameCell {
  char glyph{' '};
  int depth{-2};
  bool character{false};
};

// Characters win over corpses drawn at the same depth
void plot(FrameCell& cell, const Tile& tile, std::optional<Layer> layer) {
  const int depth = layerRenderDepth(layer);
  const bool character = layer == Layer::Character;
  if (depth > cell.depth || (depth == cell.depth && character && !cell.character)) {
    cell.glyph = glyphOf(tile);
    cell.depth = depth;
    cell.character = character;
  }
}

void renderFrame(const GameState& game) {
  const Size size = game.world().size();
  std::vector<FrameCell> frame(size.count());

  game.forEachEntityToRender([&frame, size](const EntityToRender& entity) {
    if (entity.visibility == CellVisibility::Currently) {
      plot(frame[size.indexOf(entity.location.coord)], entity.tile, entity.location.layer);
    }
  });

  // Remembered cells show the map as it was last seen
  const VisibilityGrid& grid = game.visibilityGrid();
  for (size_t i = 0; i < frame.size(); ++i) {
    const Coord coord = size.coordOf(i);
    if (grid.cellVisibility(coord) != CellVisibility::Previously) {
      continue;
    }
    for (Layer layer : ALL_LAYERS) {
      if (std::optional<Tile> tile = grid.rememberedTile(coord, layer)) {
        plot(frame[i], *tile, layer);
      }
    }
  }

  std::string line;
  for (int y = 0; y < size.height; ++y) {
    line.clear();
    for (int x = 0; x < size.width; ++x) {
      line += frame[size.indexOf(Coord(x, y))].glyph;
    }
    std::cout << line << '\n';
  }
}

bool isEventVisible(const GameState& game, const TurnEvent& event) {
  if (event.type != TurnEventType::NpcWait) {
    return true;
  }
  const std::optional<Coord> coord = game.world().entityCoord(event.actor);
  return coord && game.visibilityGrid().cellVisibility(*coord) == CellVisibility::Currently;
}

std::optional<PlayerCommand> parseCommand(char key) {
  switch (key) {
  case 'w':
  case 'k':
    return PlayerCommand::move(CardinalDirection::North);
  case 'd':
  case 'l':
    return PlayerCommand::move(CardinalDirection::East);
  case 's':
  case 'j':
    return PlayerCommand::move(CardinalDirection::South);
  case 'a':
  case 'h':
    return PlayerCommand::move(CardinalDirection::West);
  case '.':
  case ' ':
    return PlayerCommand::wait();
  default:
    return std::nullopt;
  }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
  const std::string settingsPath = argc > 1 ? argv[1] : DEFAULT_SETTINGS_PATH;

  auto& settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile(settingsPath)) {
    GAMESTATE_WARN("Failed to load " + settingsPath + " - using defaults");
  }

  std::optional<GameState> game;
  try {
    GameConfig config = GameConfig::fromSettings(settingsManager);
    if (config.benchmarkMode) {
      DELVE_ENABLE_BENCHMARK_MODE();
    }
    if (config.rngSeed == 0) {
      std::random_device device;
      config.rngSeed = (static_cast<uint64_t>(device()) << 32) | device();
    }
    std::cout << "RNG Seed: " << config.rngSeed << '\n';

    const RoomsAndCorridorsGenerator generator(config.terrain);
    game.emplace(config, generator);
  } catch (const std::exception& e) {
    GAMESTATE_CRITICAL("Failed to start " + GAME_NAME + ": " + e.what());
    std::cerr << "Failed to start: " << e.what() << '\n';
    return -1;
  }

  std::cout << "wasd/hjkl move, '.' waits, 'o' toggles omniscience, 'q' quits\n";
  renderFrame(*game);

  std::string input;
  while (std::getline(std::cin, input)) {
    for (char key : input) {
      if (key == 'q') {
        return 0;
      }
      if (key == 'o') {
        game->setVisibilityAlgorithm(game->visibilityAlgorithm() == VisibilityAlgorithm::Omniscient
                                         ? VisibilityAlgorithm::Shadowcast
                                         : VisibilityAlgorithm::Omniscient);
        continue;
      }

      const std::optional<PlayerCommand> command = parseCommand(key);
      if (!command) {
        continue;
      }

      const TurnResult result = game->applyCommand(*command);
      for (const TurnEvent& event : result.events) {
        if (isEventVisible(*game, event)) {
          std::cout << describeEvent(event) << '\n';
        }
      }
      if (result.turnTaken && !result.playerAlive) {
        std::cout << "Game over after " << result.turn << " turns\n";
      }
    }

    renderFrame(*game);
    if (!game->isPlayerAlive()) {
      break;
    }
  }

  GAMESTATE_INFO(GAME_NAME + " shutting down");
  return 0;
}
