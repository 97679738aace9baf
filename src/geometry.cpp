#include "geometry.hpp"

#include <algorithm>
#include <cmath>

GeoPoint sitePoint(const Site& s) {
    return GeoPoint(s.lon, s.lat);
}

double haversineKm(const GeoPoint& a, const GeoPoint& b) {
    // The comparable strategy returns the raw haversine term. Rounding can push
    // it slightly past 1 for antipodal points, which would make asin return NaN.
    double h = bg::comparable_distance(a, b, bg::strategy::distance::comparable::haversine<double>());
    h = std::clamp(h, 0.0, 1.0);
    return 2.0 * EARTH_RADIUS_KM * std::asin(std::sqrt(h));
}

double haversineKm(const Site& a, const Site& b) {
    return haversineKm(sitePoint(a), sitePoint(b));
}

double travelMinutes(double distanceKm, double speedKmh) {
    return distanceKm / speedKmh * 60.0;
}
