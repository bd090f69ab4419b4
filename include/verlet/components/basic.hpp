#ifndef VERLET_COMPONENTS_BASIC_HPP
#define VERLET_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "verlet/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position class from vector_math.hpp
    using Position = ::Position;

    /**
     * Position one substep ago. Together with Position it encodes the
     * implicit Verlet velocity (position - previous).
     */
    struct PreviousPosition {
        double x = 0.0;
        double y = 0.0;

        PreviousPosition(double x = 0.0, double y = 0.0) : x(x), y(y) {}
    };

    // Per-substep acceleration accumulator, cleared by every integration
    struct Acceleration {
        double x = 0.0;
        double y = 0.0;

        Acceleration(double x = 0.0, double y = 0.0) : x(x), y(y) {}
    };

    struct Radius {
        double value = 1.0; // Default radius of 1.0

        explicit Radius(double v = 1.0) : value(v) {}
    };

    struct ParticleId {
        int value = 0;

        explicit ParticleId(int v = 0) : value(v) {}
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif
