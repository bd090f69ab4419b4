#include "verlet/core/debug.hpp"

#include <algorithm>
#include <ostream>

// Initialize static members
long DebugStats::contacts_checked = 0;
long DebugStats::contacts_resolved = 0;
long DebugStats::degenerate_contacts = 0;
long DebugStats::skipped_contacts = 0;
long DebugStats::boundary_clamps = 0;
double DebugStats::max_penetration = 0.0;

void DebugStats::reset() {
    contacts_checked = 0;
    contacts_resolved = 0;
    degenerate_contacts = 0;
    skipped_contacts = 0;
    boundary_clamps = 0;
    max_penetration = 0.0;
}

void DebugStats::recordContactCheck(bool colliding, double penetration) {
    contacts_checked++;
    if (colliding) {
        contacts_resolved++;
        max_penetration = std::max(max_penetration, penetration);
    }
}

void DebugStats::recordDegenerateContact(bool skipped) {
    degenerate_contacts++;
    if (skipped) {
        skipped_contacts++;
    }
}

void DebugStats::recordBoundaryClamp() {
    boundary_clamps++;
}

void DebugStats::printContactStats(std::ostream& out) {
    out << "Contact stats:\n"
        << "  Pairs checked: " << contacts_checked << "\n"
        << "  Pairs resolved: " << contacts_resolved << "\n"
        << "  Degenerate pairs: " << degenerate_contacts
        << " (" << skipped_contacts << " skipped)\n"
        << "  Max penetration: " << max_penetration << " units\n"
        << "  Boundary clamps: " << boundary_clamps << "\n";
}
