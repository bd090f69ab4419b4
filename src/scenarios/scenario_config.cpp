#include "verlet/scenarios/scenario_config.hpp"

#include <stdexcept>
#include <string>

void validateScenarioSystemConfig(const ScenarioSystemConfig& cfg) {
    const auto& shared = cfg.sharedConfig;

    if (shared.Substeps < 1) {
        throw std::invalid_argument("Substeps must be at least 1, got " +
                                    std::to_string(shared.Substeps));
    }
    if (shared.Friction < 0.0) {
        throw std::invalid_argument("Friction must be non-negative, got " +
                                    std::to_string(shared.Friction));
    }
    if (shared.Bounce < 0.0) {
        throw std::invalid_argument("Bounce must be non-negative, got " +
                                    std::to_string(shared.Bounce));
    }
    if (shared.activeSystems.empty()) {
        throw std::invalid_argument("At least one system must be active");
    }
}
