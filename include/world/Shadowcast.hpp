/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHADOWCAST_HPP
#define SHADOWCAST_HPP

/**
 * @file Shadowcast.hpp
 * @brief Eight-octant recursive shadowcasting with exact integer slopes
 *
 * Each octant is scanned outward one row at a time between a steep (start)
 * and shallow (end) slope. An opaque cell narrows the active range; when the
 * scan leaves an opaque run it recurses into the sub-range on the far side,
 * so recursion depth never exceeds the sight radius.
 */

#include "utils/Coord.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace DelveEngine {

class ShadowcastContext {
public:
    using OpacityFn = std::function<bool(Coord)>;
    using VisitFn = std::function<void(Coord)>;

    ShadowcastContext() = default;

    /**
     * @brief Visits every cell visible from viewer within radius
     *
     * The viewer cell is always visited. Opaque cells are visited too (walls are
     * seen) but hide what lies behind them. Each in-range cell is visited at most
     * once per call; cells outside size are never passed to either callback.
     */
    void observe(Coord viewer, Size size, int radius,
                 const OpacityFn& isOpaque, const VisitFn& visit);

private:
    // numerator / denominator, denominator always positive
    struct Slope {
        int numerator;
        int denominator;

        bool operator<(const Slope& other) const {
            return static_cast<int64_t>(numerator) * other.denominator <
                   static_cast<int64_t>(other.numerator) * denominator;
        }
        bool operator>(const Slope& other) const { return other < *this; }
    };

    // Maps (column, row) offsets of the canonical octant into grid offsets
    struct Octant {
        int xx, xy, yx, yy;
    };

    struct Scan {
        Coord viewer;
        Size size;
        int radius;
        Octant octant;
        const OpacityFn* isOpaque;
        const VisitFn* visit;
    };

    void castLight(const Scan& scan, int row, Slope start, Slope end);
    void visitOnce(const Scan& scan, Coord coord);

    // Per-cell stamp of the observe() call that last visited it
    std::vector<uint32_t> m_visitStamp;
    uint32_t m_stamp{0};
    Size m_stampSize{};
};

} // namespace DelveEngine

#endif // SHADOWCAST_HPP
