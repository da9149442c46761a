/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Shadowcast.hpp"
#include <algorithm>
#include <array>

namespace DelveEngine {

namespace {
struct OctantTransform {
    int xx, xy, yx, yy;
};

constexpr std::array<OctantTransform, 8> OCTANTS = {{
    { 1,  0,  0,  1},
    { 0,  1,  1,  0},
    { 0, -1,  1,  0},
    {-1,  0,  0,  1},
    {-1,  0,  0, -1},
    { 0, -1, -1,  0},
    { 0,  1, -1,  0},
    { 1,  0,  0, -1}
}};
} // anonymous namespace

void ShadowcastContext::observe(Coord viewer, Size size, int radius,
                                const OpacityFn& isOpaque, const VisitFn& visit) {
    if (!size.contains(viewer)) {
        return;
    }

    if (m_stampSize != size) {
        m_visitStamp.assign(size.count(), 0);
        m_stampSize = size;
        m_stamp = 0;
    }
    if (++m_stamp == 0) {
        std::fill(m_visitStamp.begin(), m_visitStamp.end(), 0);
        m_stamp = 1;
    }

    Scan scan{viewer, size, radius, Octant{1, 0, 0, 1}, &isOpaque, &visit};
    visitOnce(scan, viewer);

    if (radius <= 0) {
        return;
    }

    for (const OctantTransform& transform : OCTANTS) {
        scan.octant = Octant{transform.xx, transform.xy, transform.yx, transform.yy};
        castLight(scan, 1, Slope{1, 1}, Slope{0, 1});
    }
}

void ShadowcastContext::visitOnce(const Scan& scan, Coord coord) {
    uint32_t& stamp = m_visitStamp[scan.size.indexOf(coord)];
    if (stamp == m_stamp) {
        return;
    }
    stamp = m_stamp;
    (*scan.visit)(coord);
}

void ShadowcastContext::castLight(const Scan& scan, int row, Slope start, Slope end) {
    if (start < end) {
        return;
    }

    const int radiusSquared = scan.radius * scan.radius;
    Slope newStart = start;

    for (int distance = row; distance <= scan.radius; ++distance) {
        bool blocked = false;

        // column runs from the steep edge (-distance) toward the axis (0)
        for (int dx = -distance, dy = -distance; dx <= 0; ++dx) {
            const int column = -dx;
            const Slope leftSlope{2 * column + 1, 2 * distance - 1};
            const Slope rightSlope{2 * column - 1, 2 * distance + 1};

            if (start < rightSlope) {
                continue;
            }
            if (end > leftSlope) {
                break;
            }

            const Coord offset(dx * scan.octant.xx + dy * scan.octant.xy,
                               dx * scan.octant.yx + dy * scan.octant.yy);
            const Coord target = scan.viewer + offset;

            if (!scan.size.contains(target)) {
                continue;
            }

            if (offset.x * offset.x + offset.y * offset.y <= radiusSquared) {
                visitOnce(scan, target);
            }

            const bool opaque = (*scan.isOpaque)(target);
            if (blocked) {
                if (opaque) {
                    newStart = rightSlope;
                    continue;
                }
                blocked = false;
                start = newStart;
            } else if (opaque && distance < scan.radius) {
                blocked = true;
                castLight(scan, distance + 1, start, leftSlope);
                newStart = rightSlope;
            }
        }

        if (blocked) {
            break;
        }
    }
}

} // namespace DelveEngine
