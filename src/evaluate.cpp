#include "evaluate.hpp"

#include <algorithm>

RouteMetrics routeMetrics(const Site& start, const Route& route, const SearchSettings& settings) {
    RouteMetrics m;
    if (route.empty()) return m;

    const Site* current = &start;
    for (const auto& s : route) {
        double d = haversineKm(*current, s);
        m.distanceKm += d;
        m.timeMinutes += travelMinutes(d, settings.walkingSpeedKmh) + settings.dwellMinutes;
        m.value += s.reward;
        current = &s;
    }

    // Return leg, no dwell
    double back = haversineKm(*current, start);
    m.distanceKm += back;
    m.timeMinutes += travelMinutes(back, settings.walkingSpeedKmh);
    return m;
}

std::vector<RouteLeg> routeLegs(const Site& start, const Route& route, const SearchSettings& settings) {
    std::vector<RouteLeg> legs;
    if (route.empty()) return legs;

    legs.reserve(route.size() + 1);
    const Site* current = &start;
    auto addLeg = [&](const Site& to) {
        double d = haversineKm(*current, to);
        legs.push_back({current->id, to.id, d, travelMinutes(d, settings.walkingSpeedKmh)});
        current = &to;
    };
    for (const auto& s : route) {
        addLeg(s);
    }
    addLeg(start);
    return legs;
}

bool isFeasible(const Site& start, const Route& route, const SearchSettings& settings) {
    if (route.size() > static_cast<size_t>(std::max(settings.maxStops, 0))) return false;

    for (const auto& s : route) {
        if (s.zone != start.zone) return false;
    }

    return routeMetrics(start, route, settings).timeMinutes <= settings.maxTimeMinutes;
}
