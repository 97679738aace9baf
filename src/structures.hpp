#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <boost/geometry.hpp>

template<typename T>
using HashSet = absl::flat_hash_set<T>;

template<typename K, typename V>
using HashMap = absl::flat_hash_map<K, V>;

namespace bg = boost::geometry;

// Geographic position, stored (lon, lat) in degrees as Boost.Geometry expects
typedef bg::model::point<double, 2, bg::cs::spherical_equatorial<bg::degree>> GeoPoint;

// ==================== Structures ====================

/*
* A reward-bearing site. Sites are validated when the zone index is built
* and never modified afterwards.
*/
struct Site {
    int id;
    double lat;
    double lon;
    std::string category;
    double reward;
    std::string zone;
};

// Ordered stops of one day, excluding the starting site
typedef std::vector<Site> Route;

struct RouteMetrics {
    double distanceKm = 0.0;
    double timeMinutes = 0.0;
    double value = 0.0;
};

// One hop of a route, the return leg included
struct RouteLeg {
    int fromId;
    int toId;
    double distanceKm;
    double travelMinutes;
};

struct DayResult {
    int day;
    Site start;
    Route route;
    RouteMetrics metrics;
    std::string zone;
};

// Limits and search parameters shared by every strategy
struct SearchSettings {
    double maxTimeMinutes = 180.0;
    int maxStops = 8;
    double dwellMinutes = 5.0;
    double walkingSpeedKmh = 5.0;

    // Population search
    int populationCap = 50;
    int generations = 100;
    double mutationRate = 0.1;
    double eliteFraction = 0.25;
};

enum class Strategy {
    Greedy,
    Genetic,     // population search, exhaustive on small pools
    Exhaustive,
    Random,
    HighValue
};
