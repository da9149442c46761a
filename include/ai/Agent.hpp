/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_HPP
#define AGENT_HPP

#include "utils/Coord.hpp"
#include <cstdint>
#include <optional>
#include <ostream>

namespace DelveEngine {

enum class NpcActionType : uint8_t { Wait, Move };

// One decision per NPC per turn
struct NpcAction {
    NpcActionType type{NpcActionType::Wait};
    CardinalDirection direction{CardinalDirection::North};

    static constexpr NpcAction wait() { return NpcAction{}; }
    static constexpr NpcAction move(CardinalDirection dir) {
        return NpcAction{NpcActionType::Move, dir};
    }

    constexpr bool isWait() const { return type == NpcActionType::Wait; }

    constexpr bool operator==(const NpcAction& other) const {
        // Direction is meaningless for Wait
        return type == other.type &&
               (type == NpcActionType::Wait || direction == other.direction);
    }

    constexpr bool operator!=(const NpcAction& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const NpcAction& action) {
    if (action.isWait()) {
        return os << "Wait";
    }
    return os << "Move(" << action.direction << ")";
}

/**
 * @brief Per-NPC scratch state for the behaviour scheduler
 *
 * Only NPC-controlled characters carry one; it is dropped when the character dies.
 */
struct Agent {
    NpcAction lastAction{};
    uint32_t turnsActed{0};
    std::optional<uint32_t> lastDistance; // distance-to-player seen when last deciding
};

} // namespace DelveEngine

#endif // AGENT_HPP
