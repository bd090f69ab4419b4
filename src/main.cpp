/**
 * @fileoverview main.cpp
 * @brief Main entry point for the headless simulator.
 *
 * Usage: verlet [scenario] [frames]
 * Loads the named scenario (FALLING_POINTS by default) and runs it for the
 * given number of 1/60 s frames.
 */

#include <exception>
#include <iostream>
#include <string>

#include "verlet/core/constants.hpp"
#include "verlet/core/sim_manager.hpp"

namespace {

constexpr int DefaultFrames = 600;

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [scenario] [frames]" << std::endl;
    std::cerr << "Scenarios:";
    for (auto s : SimulatorConstants::getAllScenarios()) {
        std::cerr << " " << SimulatorConstants::getScenarioName(s);
    }
    std::cerr << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    SimulatorConstants::SimulationType scenario =
        SimulatorConstants::SimulationType::FALLING_POINTS;
    int frames = DefaultFrames;

    if (argc > 3) {
        printUsage(argv[0]);
        return 1;
    }

    if (argc > 1 && !SimulatorConstants::parseScenarioName(argv[1], scenario)) {
        std::cerr << "[Main] Error: unknown scenario '" << argv[1] << "'" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (argc > 2) {
        if (!SimulatorConstants::parseFrameCount(argv[2], frames)) {
            std::cerr << "[Main] Error: invalid frame count '" << argv[2] << "'" << std::endl;
            return 1;
        }
    }

    try {
        SimManager manager(std::cout);
        manager.selectScenario(scenario);
        manager.run(static_cast<unsigned int>(frames));
    } catch (const std::exception& e) {
        std::cerr << "[Main] Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
