/**
 * @file profile.cpp
 * @brief Implementation of the profiling table described in profile.hpp
 */

#include "verlet/core/profile.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <utility>
#include <vector>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration duration) {
    auto& data = getInstance().sections[name];

    data.total_time += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);
}

Profiler::ProfileData Profiler::getStats(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end()) {
        return ProfileData{};
    }
    return it->second;
}

void Profiler::printStats(std::ostream& out) {
    const auto& sections = getInstance().sections;

    std::vector<std::pair<std::string, ProfileData>> rows(sections.begin(), sections.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::ios_base::fmtflags const flags = out.flags();
    std::streamsize const precision = out.precision();

    out << "\nProfiling Statistics:\n";
    for (const auto& [name, pd] : rows) {
        double const totalMs = std::chrono::duration<double, std::milli>(pd.total_time).count();
        double const avgUs = pd.call_count > 0
            ? std::chrono::duration<double, std::micro>(pd.total_time).count() / pd.call_count
            : 0.0;
        double const minUs = std::chrono::duration<double, std::micro>(pd.min_time).count();
        double const maxUs = std::chrono::duration<double, std::micro>(pd.max_time).count();

        out << "  " << std::left << std::setw(28) << name << std::right
            << " [" << pd.call_count << " calls] "
            << std::fixed << std::setprecision(2) << totalMs << "ms"
            << " (avg " << avgUs << "us, min " << minUs << "us, max " << maxUs << "us)\n";
    }
    out.flags(flags);
    out.precision(precision);
}

void Profiler::reset() {
    getInstance().sections.clear();
}

// ------------------ ScopedProfiler RAII Wrapper ------------------

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
    , start_time(Profiler::Clock::now())
{
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::record(section_name, Profiler::Clock::now() - start_time);
}

} // namespace Profiling
