#include "zones.hpp"
#include "catalog.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

HashMap<std::string, std::vector<Site>> groupByZone(const std::vector<Site>& sites) {
    HashMap<std::string, std::vector<Site>> groups;
    for (const auto& s : sites) {
        groups[s.zone].push_back(s);
    }
    return groups;
}

ZoneIndex::ZoneIndex(std::vector<Site> sites) : sites_(std::move(sites)) {
    validateCatalog(sites_);

    byZone_ = groupByZone(sites_);
    byId_.reserve(sites_.size());
    for (size_t i = 0; i < sites_.size(); ++i) {
        byId_.emplace(sites_[i].id, i);
        if (std::find(zoneOrder_.begin(), zoneOrder_.end(), sites_[i].zone) == zoneOrder_.end()) {
            zoneOrder_.push_back(sites_[i].zone);
        }
    }

    DBG("Indexed " << sites_.size() << " sites in " << zoneOrder_.size() << " zones");
}

std::vector<Site> ZoneIndex::candidatesFor(const std::string& zone, int excludingId) const {
    std::vector<Site> result;
    auto it = byZone_.find(zone);
    if (it == byZone_.end()) return result;

    result.reserve(it->second.size());
    for (const auto& s : it->second) {
        if (s.id != excludingId) result.push_back(s);
    }
    return result;
}

const std::vector<Site>& ZoneIndex::sitesIn(const std::string& zone) const {
    static const std::vector<Site> empty;
    auto it = byZone_.find(zone);
    return it == byZone_.end() ? empty : it->second;
}

bool ZoneIndex::contains(const std::string& zone) const {
    return byZone_.contains(zone);
}

const Site* ZoneIndex::find(int id) const {
    auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : &sites_[it->second];
}

void ZoneBounds::addZone(const std::string& name, double latMin, double latMax, double lonMin, double lonMax) {
    if (name.empty()) {
        throw std::invalid_argument("zone bounds need a name");
    }
    if (!std::isfinite(latMin) || !std::isfinite(latMax) || !std::isfinite(lonMin) || !std::isfinite(lonMax)) {
        throw std::invalid_argument("zone " + name + ": non-finite bounds");
    }
    if (latMin > latMax || lonMin > lonMax) {
        throw std::invalid_argument("zone " + name + ": minimum exceeds maximum");
    }

    rtree_.insert(std::make_pair(Box(PlanePoint(lonMin, latMin), PlanePoint(lonMax, latMax)), names_.size()));
    names_.push_back(name);
}

std::optional<std::string> ZoneBounds::locate(double lat, double lon) const {
    std::vector<BoxValue> hits;
    rtree_.query(bgi::covers(PlanePoint(lon, lat)), std::back_inserter(hits));
    if (hits.empty()) return std::nullopt;

    // Overlapping rectangles resolve to the one defined first
    size_t first = hits.front().second;
    for (const auto& h : hits) {
        first = std::min(first, h.second);
    }
    return names_[first];
}
