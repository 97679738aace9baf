#pragma once

#include <boost/geometry.hpp>

#include "structures.hpp"

namespace bg = boost::geometry;

constexpr double EARTH_RADIUS_KM = 6371.0;

// ==================== Geometry helpers ====================

GeoPoint sitePoint(const Site& s);

// Great-circle distance in km (haversine, spherical Earth)
double haversineKm(const GeoPoint& a, const GeoPoint& b);
double haversineKm(const Site& a, const Site& b);

// Minutes needed to walk the given distance
double travelMinutes(double distanceKm, double speedKmh = 5.0);
