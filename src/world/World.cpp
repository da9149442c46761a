/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/World.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace DelveEngine {

namespace {
std::string coordToString(const Coord& coord) {
    return "(" + std::to_string(coord.x) + ", " + std::to_string(coord.y) + ")";
}

std::optional<Tile> corpseOf(const Tile& tile) {
    switch (tile.kind) {
        case TileKind::Player: return Tile::playerCorpse();
        case TileKind::Npc:    return Tile::npcCorpse(tile.npcType);
        default:               return std::nullopt;
    }
}
} // anonymous namespace

World::World(Size size) : m_spatialTable(size) {}

Entity World::spawnAt(Location location, Tile tile) {
    const Entity entity = m_entityAllocator.alloc();
    const UpdateResult result = m_spatialTable.update(entity, location);
    if (!result.isSuccess()) {
        m_entityAllocator.free(entity);
        WORLD_CRITICAL("Cannot spawn at " + coordToString(location.coord) + ": slot " +
                       (result.isOccupied() ? "occupied by " + result.occupiedBy.toString()
                                            : std::string("outside the map")));
        throw std::logic_error("World spawn target is not free");
    }
    m_components.tile.insert(entity, tile);
    return entity;
}

Entity World::spawnFloor(Coord coord) {
    return spawnAt(Location{coord, Layer::Floor}, Tile::floor());
}

Entity World::spawnWall(Coord coord) {
    return spawnAt(Location{coord, Layer::Feature}, Tile::wall());
}

Entity World::spawnNpc(Coord coord, NpcType npcType) {
    const Entity entity = spawnAt(Location{coord, Layer::Character}, Tile::npc(npcType));
    m_components.npcType.insert(entity, npcType);
    m_components.hitPoints.insert(entity, HitPoints::full(npcMaxHitPoints(npcType)));
    m_components.agent.insert(entity, Agent{});
    return entity;
}

Entity World::spawnPlayer(Coord coord) {
    const Entity entity = spawnAt(Location{coord, Layer::Character}, Tile::player());
    m_components.hitPoints.insert(entity, HitPoints::full(PLAYER_MAX_HIT_POINTS));
    return entity;
}

Populate World::populate(const TerrainGrid& terrain) {
    if (terrain.size() != size()) {
        WORLD_ERROR("Terrain is " + std::to_string(terrain.size().width) + "x" +
                    std::to_string(terrain.size().height) + " but the world is " +
                    std::to_string(size().width) + "x" + std::to_string(size().height));
        throw std::invalid_argument("Terrain size does not match world size");
    }

    const size_t playerTiles = terrain.count(TerrainTileKind::Player);
    if (playerTiles != 1) {
        WORLD_ERROR("Terrain must contain exactly one player, found " +
                    std::to_string(playerTiles));
        throw std::invalid_argument("Terrain must contain exactly one player");
    }

    Populate result;
    const size_t entitiesBefore = m_entityAllocator.liveCount();

    terrain.forEach([this, &result](Coord coord, const TerrainTile& tile) {
        spawnFloor(coord);
        switch (tile.kind) {
            case TerrainTileKind::Floor:
                break;
            case TerrainTileKind::Wall:
                spawnWall(coord);
                break;
            case TerrainTileKind::Npc:
                spawnNpc(coord, tile.npcType);
                ++result.npcCount;
                break;
            case TerrainTileKind::Player:
                result.playerEntity = spawnPlayer(coord);
                break;
        }
    });

    result.entityCount = m_entityAllocator.liveCount() - entitiesBefore;
    WORLD_INFO("Populated world with " + std::to_string(result.entityCount) +
               " entities, " + std::to_string(result.npcCount) + " NPCs");
    return result;
}

void World::removeEntity(Entity entity) {
    m_components.removeEntity(entity);
    m_spatialTable.remove(entity);
    if (!m_entityAllocator.free(entity)) {
        WORLD_WARN("removeEntity() on stale handle " + entity.toString());
    }
}

bool World::canNpcEnter(Coord coord) const {
    const LayerOccupants* layers = m_spatialTable.layersAt(coord);
    if (!layers || layers->feature) {
        return false;
    }
    return !(layers->character && m_components.npcType.contains(*layers->character));
}

bool World::canNpcEnterIgnoringOtherNpcs(Coord coord) const {
    const LayerOccupants* layers = m_spatialTable.layersAt(coord);
    return layers && !layers->feature;
}

bool World::isOpaque(Coord coord) const {
    const LayerOccupants* layers = m_spatialTable.layersAt(coord);
    return !layers || layers->feature.has_value();
}

MoveOutcome World::maybeMoveCharacter(Entity character, CardinalDirection direction,
                                      TurnEvents& events) {
    const std::optional<Location> location = m_spatialTable.locationOf(character);
    if (!location) {
        WORLD_CRITICAL(character.toString() + " has no coordinate");
        throw std::logic_error("maybeMoveCharacter: character has no coordinate");
    }
    if (location->layer != Layer::Character) {
        WORLD_CRITICAL(character.toString() + " is not a living character");
        throw std::logic_error("maybeMoveCharacter: entity is not a living character");
    }

    const Coord target = location->coord + directionOffset(direction);
    if (!m_spatialTable.isValid(target)) {
        WORLD_DEBUG(character.toString() + " cannot leave the map at " + coordToString(target));
        return MoveOutcome::OUT_OF_BOUNDS;
    }

    const LayerOccupants& destination = m_spatialTable.layersAtChecked(target);
    if (destination.character) {
        const Entity occupant = *destination.character;
        const bool moverIsNpc = m_components.npcType.contains(character);
        const bool occupantIsNpc = m_components.npcType.contains(occupant);
        if (moverIsNpc == occupantIsNpc) {
            WORLD_DEBUG(character.toString() + " bumped into ally " + occupant.toString());
            return MoveOutcome::BLOCKED_BY_ALLY;
        }
        characterBumpAttack(character, occupant, events);
        return MoveOutcome::ATTACKED;
    }

    if (destination.feature) {
        WORLD_DEBUG(character.toString() + " blocked by feature at " + coordToString(target));
        return MoveOutcome::BLOCKED_BY_FEATURE;
    }

    const UpdateResult result = m_spatialTable.updateCoord(character, target);
    if (!result.isSuccess()) {
        WORLD_CRITICAL("Character slot at " + coordToString(target) +
                       " was free but the move failed");
        throw std::logic_error("maybeMoveCharacter: spatial update failed");
    }
    return MoveOutcome::MOVED;
}

void World::characterBumpAttack(Entity attacker, Entity victim, TurnEvents& events) {
    HitPoints* hitPoints = m_components.hitPoints.getMut(victim);
    if (!hitPoints) {
        WORLD_DEBUG(victim.toString() + " has no hit points, attack skipped");
        return;
    }

    const uint32_t damage = std::min(BUMP_DAMAGE, hitPoints->current);
    hitPoints->current -= damage;

    TurnEvent event;
    event.type = TurnEventType::Attack;
    event.actor = attacker;
    event.target = victim;
    if (const Tile* tile = m_components.tile.get(attacker)) {
        event.actorTile = *tile;
    }
    if (const Tile* tile = m_components.tile.get(victim)) {
        event.targetTile = *tile;
    }
    event.damage = damage;
    event.remainingHitPoints = hitPoints->current;
    events.push_back(event);

    if (hitPoints->isDepleted()) {
        characterDie(victim, attacker, events);
    }
}

void World::characterDie(Entity victim, Entity killer, TurnEvents& events) {
    const Tile* tile = m_components.tile.get(victim);
    const std::optional<Tile> corpseTile = tile ? corpseOf(*tile) : std::nullopt;
    if (!corpseTile) {
        WORLD_CRITICAL(victim.toString() + " died without a character tile");
        throw std::logic_error("characterDie: victim is not a character");
    }

    TurnEvent death;
    death.type = TurnEventType::Death;
    death.actor = killer;
    death.target = victim;
    death.targetTile = *tile;
    if (const Tile* killerTile = m_components.tile.get(killer)) {
        death.actorTile = *killerTile;
    }
    events.push_back(death);

    UpdateResult result = m_spatialTable.updateLayer(victim, Layer::Corpse);
    if (result.isOccupied()) {
        // One corpse per cell, the newest wins
        const Entity oldCorpse = result.occupiedBy;
        TurnEvent replaced;
        replaced.type = TurnEventType::CorpseReplaced;
        replaced.actor = victim;
        replaced.target = oldCorpse;
        replaced.actorTile = *corpseTile;
        if (const Tile* oldTile = m_components.tile.get(oldCorpse)) {
            replaced.targetTile = *oldTile;
        }

        removeEntity(oldCorpse);
        events.push_back(replaced);
        result = m_spatialTable.updateLayer(victim, Layer::Corpse);
    }

    if (!result.isSuccess()) {
        WORLD_CRITICAL(victim.toString() + " could not be moved to the corpse layer");
        throw std::logic_error("characterDie: corpse placement failed");
    }

    m_components.tile.insert(victim, *corpseTile);
    m_components.agent.remove(victim);
    WORLD_DEBUG(victim.toString() + " died");
}

std::optional<MoveOutcome> World::applyNpcAction(Entity npc, const NpcAction& action,
                                                 TurnEvents& events,
                                                 std::optional<uint32_t> observedDistance) {
    if (Agent* agent = m_components.agent.getMut(npc)) {
        agent->lastAction = action;
        ++agent->turnsActed;
        agent->lastDistance = observedDistance;
    }

    if (action.isWait()) {
        TurnEvent event;
        event.type = TurnEventType::NpcWait;
        event.actor = npc;
        if (const Tile* tile = m_components.tile.get(npc)) {
            event.actorTile = *tile;
        }
        events.push_back(event);
        return std::nullopt;
    }

    return maybeMoveCharacter(npc, action.direction, events);
}

size_t World::pruneDeadAgents() {
    size_t pruned = 0;
    for (const Entity entity : m_components.agent.entities()) {
        if (!isLivingCharacter(entity)) {
            m_components.agent.remove(entity);
            ++pruned;
        }
    }
    if (pruned > 0) {
        BEHAVIOUR_DEBUG("Pruned " + std::to_string(pruned) + " dead agents");
    }
    return pruned;
}

bool World::isLivingCharacter(Entity entity) const {
    return m_spatialTable.layerOf(entity) == Layer::Character;
}

std::optional<Coord> World::entityCoord(Entity entity) const {
    return m_spatialTable.coordOf(entity);
}

RememberedTiles World::sampleTiles(Coord coord) const {
    RememberedTiles tiles{};
    const LayerOccupants& layers = m_spatialTable.layersAtChecked(coord);
    for (Layer layer : ALL_LAYERS) {
        const std::optional<Entity>& occupant = layers.get(layer);
        if (!occupant) {
            continue;
        }
        if (const Tile* tile = m_components.tile.get(*occupant)) {
            tiles[static_cast<size_t>(layer)] = *tile;
        }
    }
    return tiles;
}

} // namespace DelveEngine
