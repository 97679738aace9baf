#include "simulate.hpp"
#include "evaluate.hpp"
#include "optimize.hpp"
#include "debug.hpp"

#include <algorithm>
#include <utility>

DayResult simulateDay(int day, const Site& start, Strategy strategy, const ZoneIndex& zones,
                      const SearchSettings& settings, uint32_t seed) {
    std::mt19937 rng(seed);
    Route route = planRoute(strategy, start, zones, settings, rng);
    RouteMetrics metrics = routeMetrics(start, route, settings);

    DBG("Day " << day << " in " << start.zone << ": " << route.size() << " stops, value "
        << metrics.value << ", " << metrics.timeMinutes << " min");
    return DayResult{day, start, std::move(route), metrics, start.zone};
}

std::vector<Site> pickStartingPoints(const ZoneIndex& zones, int numDays, std::mt19937& rng) {
    std::vector<Site> points;
    const auto& names = zones.zones();
    if (names.empty()) return points;

    std::uniform_int_distribution<size_t> pickZone(0, names.size() - 1);
    for (int day = 0; day < numDays; ++day) {
        const auto& sites = zones.sitesIn(names[pickZone(rng)]);
        std::uniform_int_distribution<size_t> pickSite(0, sites.size() - 1);
        points.push_back(sites[pickSite(rng)]);
    }
    return points;
}

std::vector<DayResult> simulateDays(const std::vector<Site>& startingPoints, Strategy strategy,
                                    const ZoneIndex& zones, const SearchSettings& settings, uint32_t seed) {
    std::vector<DayResult> results;
    results.reserve(startingPoints.size());

    for (size_t i = 0; i < startingPoints.size(); ++i) {
        const int day = static_cast<int>(i) + 1;
        std::seed_seq seq{seed, static_cast<uint32_t>(day)};
        uint32_t daySeed;
        seq.generate(&daySeed, &daySeed + 1);
        results.push_back(simulateDay(day, startingPoints[i], strategy, zones, settings, daySeed));
    }
    return results;
}

RunSummary summarizeDays(const std::vector<DayResult>& results) {
    RunSummary summary;
    for (const auto& r : results) {
        summary.value += r.metrics.value;
        summary.distanceKm += r.metrics.distanceKm;
        summary.timeMinutes += r.metrics.timeMinutes;
        summary.stops += r.route.size();

        auto it = std::find_if(summary.zones.begin(), summary.zones.end(),
                               [&](const RunSummary::ZoneTotals& z) { return z.zone == r.zone; });
        if (it == summary.zones.end()) {
            summary.zones.push_back({r.zone, 0.0, 0});
            it = summary.zones.end() - 1;
        }
        it->value += r.metrics.value;
        it->days += 1;
    }
    return summary;
}
