#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

#include "structures.hpp"

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// Zone rectangles are plain (lon, lat) boxes in degrees
typedef bg::model::point<double, 2, bg::cs::cartesian> PlanePoint;
typedef bg::model::box<PlanePoint> Box;
typedef std::pair<Box, size_t> BoxValue;

// ==================== Zone grouping ====================

// Groups sites by zone, keeping catalog order inside each zone
HashMap<std::string, std::vector<Site>> groupByZone(const std::vector<Site>& sites);

/*
* Read-only index over a validated site catalog. Built once, then shared by
* every search call; all accessors are const and safe for concurrent readers.
*/
class ZoneIndex {
public:
    // Throws std::invalid_argument if the catalog does not validate
    explicit ZoneIndex(std::vector<Site> sites);

    // Every site of the zone except excludingId; empty for an unknown zone
    std::vector<Site> candidatesFor(const std::string& zone, int excludingId) const;

    const std::vector<Site>& sitesIn(const std::string& zone) const;
    bool contains(const std::string& zone) const;
    const Site* find(int id) const;

    // Zones in order of first appearance in the catalog
    const std::vector<std::string>& zones() const { return zoneOrder_; }
    const std::vector<Site>& sites() const { return sites_; }
    size_t size() const { return sites_.size(); }

private:
    std::vector<Site> sites_;
    HashMap<std::string, std::vector<Site>> byZone_;
    HashMap<int, size_t> byId_;
    std::vector<std::string> zoneOrder_;
};

// ==================== Zone boundaries ====================

/*
* Named rectangular zones. locate() answers with the first zone, in the order
* zones were added, whose rectangle covers the point (edges included).
*/
class ZoneBounds {
public:
    // Throws std::invalid_argument for an empty name or an inverted/non-finite rectangle
    void addZone(const std::string& name, double latMin, double latMax, double lonMin, double lonMax);

    std::optional<std::string> locate(double lat, double lon) const;

    size_t size() const { return names_.size(); }

private:
    bgi::rtree<BoxValue, bgi::rstar<16>> rtree_;
    std::vector<std::string> names_;
};
