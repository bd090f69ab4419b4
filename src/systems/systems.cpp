#include "verlet/systems/systems.hpp"

namespace Systems {

std::vector<SystemType> getDefaultSystems() {
    return {
        SystemType::GRAVITY,
        SystemType::VERLET_INTEGRATION,
        SystemType::COLLISION,
        SystemType::BOUNDARY,
    };
}

std::string getSystemName(SystemType type) {
    switch (type) {
        case SystemType::GRAVITY:            return "GRAVITY";
        case SystemType::VERLET_INTEGRATION: return "VERLET_INTEGRATION";
        case SystemType::COLLISION:          return "COLLISION";
        case SystemType::BOUNDARY:           return "BOUNDARY";
        default: return "UNKNOWN";
    }
}

} // namespace Systems
