/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TURN_EVENT_HPP
#define TURN_EVENT_HPP

/**
 * @file TurnEvent.hpp
 * @brief Notifications produced while a turn resolves
 *
 * The world never prints anything. Combat, deaths and idle NPCs are reported
 * as TurnEvents appended to the list the caller passes in; the presentation
 * layer decides whether and how to show them:
 * - Attack: actor hit target for damage, target has remainingHitPoints left
 * - Death: target died (actor is the killer, if any)
 * - CorpseReplaced: target (an older corpse) was removed so actor's corpse fits
 * - NpcWait: actor chose to wait this turn
 */

#include "entities/Entity.hpp"
#include "world/Components.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace DelveEngine {

enum class TurnEventType : uint8_t {
    Attack,
    Death,
    CorpseReplaced,
    NpcWait
};

struct TurnEvent {
    TurnEventType type{TurnEventType::NpcWait};
    Entity actor{};
    Entity target{};
    std::optional<Tile> actorTile;
    std::optional<Tile> targetTile;
    uint32_t damage{0};
    uint32_t remainingHitPoints{0};
};

// Most turns produce a handful of events
using TurnEvents = boost::container::small_vector<TurnEvent, 16>;

[[nodiscard]] const char* turnEventTypeToString(TurnEventType type);

// Player-facing message, e.g. "You hit the orc" or "The troll ponders its existence"
[[nodiscard]] std::string describeEvent(const TurnEvent& event);

inline std::ostream& operator<<(std::ostream& os, TurnEventType type) {
    return os << turnEventTypeToString(type);
}

} // namespace DelveEngine

#endif // TURN_EVENT_HPP
