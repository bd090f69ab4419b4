#include "verlet/core/constants.hpp"
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace SimulatorConstants {

    const double Gravity  = -9.80;
    const double Friction = 0.99;
    const double Bounce   = 0.95;
    const int    Substeps = 8;
    const double Epsilon  = 1e-9;

    // Display
    const double       GameScale      = 20.0;
    const unsigned int StepsPerSecond = 60;

    // List scenarios:
    std::vector<SimulationType> getAllScenarios() {
        return {
            SimulationType::FALLING_POINTS,
            SimulationType::FREE_FALL,
            SimulationType::PARTICLE_PILE
        };
    }

    std::string getScenarioName(SimulationType scenario) {
        switch (scenario) {
            case SimulationType::FALLING_POINTS: return "FALLING_POINTS";
            case SimulationType::FREE_FALL:      return "FREE_FALL";
            case SimulationType::PARTICLE_PILE:  return "PARTICLE_PILE";
            default: return "UNKNOWN";
        }
    }

    bool parseScenarioName(const std::string& name, SimulationType& out) {
        for (auto scenario : getAllScenarios()) {
            if (getScenarioName(scenario) == name) {
                out = scenario;
                return true;
            }
        }
        return false;
    }

    bool parseFrameCount(const std::string& text, int& out) {
        std::size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(text, &consumed);
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }
        // Trailing characters ("12abc") are not a frame count
        if (consumed != text.size() || value < 0) {
            return false;
        }
        out = value;
        return true;
    }

} // namespace SimulatorConstants
