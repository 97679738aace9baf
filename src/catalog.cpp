#include "catalog.hpp"
#include "debug.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

void validateSite(const Site& s) {
    const std::string where = "site " + std::to_string(s.id) + ": ";
    if (!std::isfinite(s.lat) || !std::isfinite(s.lon)) {
        throw std::invalid_argument(where + "non-finite coordinates");
    }
    if (s.lat < -90.0 || s.lat > 90.0 || s.lon < -180.0 || s.lon > 180.0) {
        throw std::invalid_argument(where + "coordinates out of range");
    }
    if (!std::isfinite(s.reward) || s.reward < 0.0) {
        throw std::invalid_argument(where + "reward must be a non-negative number");
    }
    if (s.zone.empty()) {
        throw std::invalid_argument(where + "missing zone");
    }
}

void validateCatalog(const std::vector<Site>& sites) {
    HashSet<int> seen;
    seen.reserve(sites.size());
    for (const auto& s : sites) {
        validateSite(s);
        if (!seen.insert(s.id).second) {
            throw std::invalid_argument("duplicate site id " + std::to_string(s.id));
        }
    }
}

void validateSettings(const SearchSettings& settings) {
    if (!(settings.maxTimeMinutes > 0.0)) {
        throw std::invalid_argument("maxTimeMinutes must be positive");
    }
    if (settings.maxStops <= 0) {
        throw std::invalid_argument("maxStops must be positive");
    }
    if (!(settings.walkingSpeedKmh > 0.0) || !std::isfinite(settings.walkingSpeedKmh)) {
        throw std::invalid_argument("walkingSpeedKmh must be positive");
    }
    if (!(settings.dwellMinutes >= 0.0)) {
        throw std::invalid_argument("dwellMinutes must not be negative");
    }
    if (settings.populationCap <= 0) {
        throw std::invalid_argument("populationCap must be positive");
    }
    if (settings.generations < 0) {
        throw std::invalid_argument("generations must not be negative");
    }
    if (!(settings.mutationRate >= 0.0 && settings.mutationRate <= 1.0)) {
        throw std::invalid_argument("mutationRate must be within [0, 1]");
    }
    if (!(settings.eliteFraction > 0.0 && settings.eliteFraction <= 1.0)) {
        throw std::invalid_argument("eliteFraction must be within (0, 1]");
    }
}

namespace {

bool blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

// Nothing but whitespace left after the record
bool consumed(std::istringstream& fields) {
    fields >> std::ws;
    return fields.eof();
}

}  // namespace

ZoneBounds readZoneBounds(std::istream& in) {
    ZoneBounds bounds;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (blank(line)) continue;

        std::istringstream fields(line);
        std::string name;
        double latMin, latMax, lonMin, lonMax;
        if (!(fields >> name >> latMin >> latMax >> lonMin >> lonMax) || !consumed(fields)) {
            throw std::invalid_argument("zones line " + std::to_string(lineNo) + ": malformed record");
        }
        bounds.addZone(name, latMin, latMax, lonMin, lonMax);
    }
    DBG("Read " << bounds.size() << " zone rectangles");
    return bounds;
}

std::vector<Site> readCatalog(std::istream& in, const std::optional<ZoneBounds>& bounds) {
    std::vector<Site> sites;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (blank(line)) continue;

        std::istringstream fields(line);
        Site s;
        if (!(fields >> s.id >> s.lat >> s.lon >> s.category >> s.reward >> s.zone) || !consumed(fields)) {
            throw std::invalid_argument("catalog line " + std::to_string(lineNo) + ": malformed record");
        }
        if (s.zone == "-") {
            std::optional<std::string> zone;
            if (bounds) zone = bounds->locate(s.lat, s.lon);
            if (!zone) {
                throw std::invalid_argument("catalog line " + std::to_string(lineNo) + ": site "
                                            + std::to_string(s.id) + " lies outside every zone");
            }
            s.zone = *zone;
        }
        sites.push_back(s);
    }
    return sites;
}
