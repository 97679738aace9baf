#pragma once

#include <vector>

#include "structures.hpp"
#include "geometry.hpp"

// ==================== Route evaluation ====================

// Distance, time and value of start -> route... -> start.
// Each visited site adds settings.dwellMinutes; an empty route is all zeros.
RouteMetrics routeMetrics(const Site& start, const Route& route, const SearchSettings& settings);

// Per-hop breakdown: route.size() + 1 legs, none for an empty route
std::vector<RouteLeg> routeLegs(const Site& start, const Route& route, const SearchSettings& settings);

// Stop count, zone and time budget. No side effects, safe to call concurrently.
bool isFeasible(const Site& start, const Route& route, const SearchSettings& settings);
