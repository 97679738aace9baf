#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "structures.hpp"
#include "zones.hpp"

// ==================== Day simulation ====================

// Totals over a run of days
struct RunSummary {
    double value = 0.0;
    double distanceKm = 0.0;
    double timeMinutes = 0.0;
    size_t stops = 0;

    struct ZoneTotals {
        std::string zone;
        double value = 0.0;
        int days = 0;
    };
    std::vector<ZoneTotals> zones; // first-appearance order
};

// Plans one day from start. The seed only matters for randomized strategies;
// the same inputs and seed always give the same result.
DayResult simulateDay(int day, const Site& start, Strategy strategy, const ZoneIndex& zones,
                      const SearchSettings& settings, uint32_t seed);

// One starting site per day: a random zone, then a random site in it
std::vector<Site> pickStartingPoints(const ZoneIndex& zones, int numDays, std::mt19937& rng);

// Days numbered from 1; each day gets its own seed derived from (seed, day)
std::vector<DayResult> simulateDays(const std::vector<Site>& startingPoints, Strategy strategy,
                                    const ZoneIndex& zones, const SearchSettings& settings, uint32_t seed);

RunSummary summarizeDays(const std::vector<DayResult>& results);
