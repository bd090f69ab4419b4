/**
 * @file coordinates.hpp
 * @brief Conversion between simulation units and display units
 *
 * The solver works in simulation units. A display collaborator places and
 * sizes its shapes by multiplying with a scale factor of its choosing.
 */
#pragma once

#include "verlet/core/constants.hpp"
#include "verlet/math/vector_math.hpp"

namespace Simulation {

/**
 * @class Coordinates
 * @brief Uniform scale between simulation space and display space
 */
class Coordinates {
public:
    /**
     * @param scale Display units per simulation unit (must be non-zero)
     */
    explicit Coordinates(double scale = SimulatorConstants::GameScale);

    double unitsToDisplay(double units) const;
    double displayToUnits(double display) const;

    Position unitsToDisplay(const Position& p) const;
    Position displayToUnits(const Position& p) const;

    double getScale() const { return scale; }

    /**
     * @throws std::invalid_argument if scale is zero
     */
    void setScale(double newScale);

private:
    double scale;  ///< Display units per simulation unit
};

} // namespace Simulation
