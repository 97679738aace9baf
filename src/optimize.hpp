#pragma once

#include <random>
#include <string>
#include <vector>

#include "structures.hpp"
#include "zones.hpp"

// ==================== Route search ====================
//
// Every strategy returns a route that is feasible for the given settings, or
// an empty route when nothing fits. An empty route is a valid zero-value day.
// Candidate pools are sorted by ascending site id, so ties always go to the
// lowest id.

// Same-zone sites other than start, ascending id
std::vector<Site> candidatePool(const ZoneIndex& zones, const Site& start);

// Repeatedly appends the candidate with the best value / (travel + dwell) ratio
Route greedyRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings);

// Tries every subset of the pool up to settings.maxStops sites.
// Exponential in pool size; meant for pools no larger than maxStops.
Route exhaustiveRoute(const Site& start, const std::vector<Site>& pool, const SearchSettings& settings);

// Population search. Small pools go to exhaustiveRoute; if no random sample
// is feasible the greedy route is returned.
Route geneticRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings, std::mt19937& rng);

// Random subset of the pool, 1..maxStops sites in random order
Route sampleRoute(const std::vector<Site>& pool, int maxStops, std::mt19937& rng);

// Child from the union of both parents' sites, resampled to a random size
Route crossoverRoute(const Route& a, const Route& b, int maxStops, std::mt19937& rng);

// Adds, removes or replaces one site. Inapplicable moves return the route unchanged.
Route mutateRoute(const Route& route, const std::vector<Site>& pool, int maxStops, std::mt19937& rng);

// Baselines: first feasible of up to 100 random samples / richest sites first
Route randomRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings, std::mt19937& rng);
Route highValueRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings);

// Validates settings (std::invalid_argument) and runs the chosen strategy.
// The exhaustive strategy refuses pools with more than a few million subsets.
Route planRoute(Strategy strategy, const Site& start, const ZoneIndex& zones,
                const SearchSettings& settings, std::mt19937& rng);

std::string strategyName(Strategy strategy);

// Throws std::invalid_argument for an unknown name
Strategy parseStrategy(const std::string& name);
