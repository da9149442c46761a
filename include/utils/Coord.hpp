/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COORD_HPP
#define COORD_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace DelveEngine {

// Integer grid coordinate. x grows east, y grows south.
struct Coord {
    int x{0};
    int y{0};

    constexpr Coord() = default;
    constexpr Coord(int xPos, int yPos) : x(xPos), y(yPos) {}

    constexpr Coord operator+(const Coord& other) const {
        return Coord(x + other.x, y + other.y);
    }

    constexpr Coord operator-(const Coord& other) const {
        return Coord(x - other.x, y - other.y);
    }

    constexpr bool operator==(const Coord& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Coord& other) const {
        return !(*this == other);
    }

    // Squared euclidean distance, used for sight-radius checks
    static constexpr int distanceSquared(const Coord& a, const Coord& b) {
        const int dx = a.x - b.x;
        const int dy = a.y - b.y;
        return dx * dx + dy * dy;
    }

    // Taxicab distance, matches cardinal-only movement
    static constexpr int manhattan(const Coord& a, const Coord& b) {
        const int dx = a.x - b.x;
        const int dy = a.y - b.y;
        return (dx < 0 ? -dx : dx) + (dy < 0 ? -dy : dy);
    }
};

struct Size {
    int width{0};
    int height{0};

    constexpr Size() = default;
    constexpr Size(int w, int h) : width(w), height(h) {}

    constexpr std::size_t count() const {
        return (width > 0 && height > 0)
                   ? static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
                   : 0;
    }

    constexpr bool contains(const Coord& coord) const {
        return coord.x >= 0 && coord.y >= 0 && coord.x < width && coord.y < height;
    }

    // Row-major index; caller guarantees contains(coord)
    constexpr std::size_t indexOf(const Coord& coord) const {
        return static_cast<std::size_t>(coord.y) * static_cast<std::size_t>(width) +
               static_cast<std::size_t>(coord.x);
    }

    constexpr Coord coordOf(std::size_t index) const {
        return Coord(static_cast<int>(index % static_cast<std::size_t>(width)),
                     static_cast<int>(index / static_cast<std::size_t>(width)));
    }

    constexpr bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }

    constexpr bool operator!=(const Size& other) const {
        return !(*this == other);
    }
};

enum class CardinalDirection : uint8_t {
    North = 0,
    East = 1,
    South = 2,
    West = 3
};

// Fixed iteration order. The behaviour scheduler uses it as its tie-break priority.
inline constexpr std::array<CardinalDirection, 4> CARDINAL_DIRECTIONS = {
    CardinalDirection::North,
    CardinalDirection::East,
    CardinalDirection::South,
    CardinalDirection::West
};

constexpr Coord directionOffset(CardinalDirection direction) {
    switch (direction) {
        case CardinalDirection::North: return Coord(0, -1);
        case CardinalDirection::East:  return Coord(1, 0);
        case CardinalDirection::South: return Coord(0, 1);
        case CardinalDirection::West:  return Coord(-1, 0);
    }
    return Coord(0, 0);
}

constexpr CardinalDirection oppositeDirection(CardinalDirection direction) {
    switch (direction) {
        case CardinalDirection::North: return CardinalDirection::South;
        case CardinalDirection::East:  return CardinalDirection::West;
        case CardinalDirection::South: return CardinalDirection::North;
        case CardinalDirection::West:  return CardinalDirection::East;
    }
    return direction;
}

constexpr const char* directionToString(CardinalDirection direction) {
    switch (direction) {
        case CardinalDirection::North: return "North";
        case CardinalDirection::East:  return "East";
        case CardinalDirection::South: return "South";
        case CardinalDirection::West:  return "West";
    }
    return "Unknown";
}

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const Coord& coord) {
    return os << "(" << coord.x << ", " << coord.y << ")";
}

inline std::ostream& operator<<(std::ostream& os, const Size& size) {
    return os << size.width << "x" << size.height;
}

inline std::ostream& operator<<(std::ostream& os, CardinalDirection direction) {
    return os << directionToString(direction);
}

} // namespace DelveEngine

#endif // COORD_HPP
