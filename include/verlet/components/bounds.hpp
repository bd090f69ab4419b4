#pragma once

#include "verlet/math/vector_math.hpp"

namespace Components {

    /**
     * @brief Axis-aligned rectangle the particles are kept inside.
     *
     * Built from the min corner and the max corner. Immutable for the
     * lifetime of a scenario.
     */
    struct Bounds {
        double minX = 0.0;
        double maxX = 0.0;
        double minY = 0.0;
        double maxY = 0.0;

        Bounds() = default;
        Bounds(double minX, double minY, double maxX, double maxY)
            : minX(minX), maxX(maxX), minY(minY), maxY(maxY) {}

        bool isValid() const { return minX <= maxX && minY <= maxY; }

        bool contains(const Position& p) const {
            return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
        }
    };

} // namespace Components
