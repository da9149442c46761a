/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/TurnEvent.hpp"

namespace DelveEngine {

namespace {

bool isPlayerTile(const std::optional<Tile>& tile) {
    return tile && (tile->kind == TileKind::Player || tile->kind == TileKind::PlayerCorpse);
}

// "the orc", "the troll corpse", "something" when the tile is unknown
std::string nameOf(const std::optional<Tile>& tile) {
    if (!tile) {
        return "something";
    }
    switch (tile->kind) {
        case TileKind::Npc:
            return std::string("the ") + npcTypeName(tile->npcType);
        case TileKind::NpcCorpse:
            return std::string("the ") + npcTypeName(tile->npcType) + " corpse";
        case TileKind::Player:
            return "you";
        case TileKind::PlayerCorpse:
            return "your corpse";
        case TileKind::Wall:
            return "the wall";
        case TileKind::Floor:
            return "the floor";
    }
    return "something";
}

std::string capitalize(std::string text) {
    if (!text.empty() && text[0] >= 'a' && text[0] <= 'z') {
        text[0] = static_cast<char>(text[0] - 'a' + 'A');
    }
    return text;
}

} // anonymous namespace

const char* turnEventTypeToString(TurnEventType type) {
    switch (type) {
        case TurnEventType::Attack:         return "Attack";
        case TurnEventType::Death:          return "Death";
        case TurnEventType::CorpseReplaced: return "CorpseReplaced";
        case TurnEventType::NpcWait:        return "NpcWait";
    }
    return "Unknown";
}

std::string describeEvent(const TurnEvent& event) {
    switch (event.type) {
        case TurnEventType::Attack:
            if (isPlayerTile(event.actorTile)) {
                return "You hit " + nameOf(event.targetTile);
            }
            return capitalize(nameOf(event.actorTile)) + " hits " + nameOf(event.targetTile);

        case TurnEventType::Death:
            if (isPlayerTile(event.targetTile)) {
                return "You die";
            }
            if (isPlayerTile(event.actorTile)) {
                return "You kill " + nameOf(event.targetTile);
            }
            return capitalize(nameOf(event.targetTile)) + " dies";

        case TurnEventType::CorpseReplaced:
            return capitalize(nameOf(event.targetTile)) + " is buried under " +
                   nameOf(event.actorTile);

        case TurnEventType::NpcWait:
            return capitalize(nameOf(event.actorTile)) + " ponders its existence";
    }
    return "";
}

} // namespace DelveEngine
