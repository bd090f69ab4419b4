/**
 * @file coordinates.cpp
 * @brief Implementation of coordinate conversion utilities
 */

#include "verlet/core/coordinates.hpp"

#include <stdexcept>

namespace Simulation {

Coordinates::Coordinates(double scale)
    : scale(1.0)
{
    setScale(scale);
}

double Coordinates::unitsToDisplay(double units) const {
    return units * scale;
}

double Coordinates::displayToUnits(double display) const {
    return display / scale;
}

Position Coordinates::unitsToDisplay(const Position& p) const {
    return {unitsToDisplay(p.x), unitsToDisplay(p.y)};
}

Position Coordinates::displayToUnits(const Position& p) const {
    return {displayToUnits(p.x), displayToUnits(p.y)};
}

void Coordinates::setScale(double newScale) {
    if (newScale == 0.0) {
        throw std::invalid_argument("Display scale must be non-zero");
    }
    scale = newScale;
}

} // namespace Simulation
