#ifndef VERLET_SIMULATOR_CONSTANTS_HPP
#define VERLET_SIMULATOR_CONSTANTS_HPP

#include <vector>
#include <string>

namespace SimulatorConstants {

    /**
     * @brief The scenarios the host can load.
     */
    enum class SimulationType {
        FALLING_POINTS,
        FREE_FALL,
        PARTICLE_PILE
    };

    // Solver defaults
    extern const double Gravity;   // vertical acceleration, simulation units/s^2
    extern const double Friction;  // per-substep velocity damping
    extern const double Bounce;    // wall restitution
    extern const int Substeps;
    extern const double Epsilon;

    // Display / host loop
    extern const double GameScale;  // display units per simulation unit
    extern const unsigned int StepsPerSecond;

    std::vector<SimulationType> getAllScenarios();
    std::string getScenarioName(SimulationType scenario);

    /**
     * @brief Looks a scenario up by its name (case-sensitive, as printed by
     *        getScenarioName).
     * @return false if no scenario has that name; out is left untouched.
     */
    bool parseScenarioName(const std::string& name, SimulationType& out);

    /**
     * @brief Parses a non-negative frame count from the command line.
     * @return false unless the whole string is a number in [0, INT_MAX];
     *         out is left untouched on failure.
     */
    bool parseFrameCount(const std::string& text, int& out);
}

#endif // VERLET_SIMULATOR_CONSTANTS_HPP
