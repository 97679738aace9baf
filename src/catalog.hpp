#pragma once

#include <istream>
#include <optional>
#include <vector>

#include "structures.hpp"
#include "zones.hpp"

// ==================== Input validation ====================

// Throws std::invalid_argument for a malformed site record
void validateSite(const Site& s);

// Validates every site and rejects duplicate ids
void validateCatalog(const std::vector<Site>& sites);

// Throws std::invalid_argument for limits that make the search meaningless
void validateSettings(const SearchSettings& settings);

// ==================== Text input ====================

// "name latMin latMax lonMin lonMax" per line, blank lines skipped.
// Throws std::invalid_argument naming the first malformed line.
ZoneBounds readZoneBounds(std::istream& in);

// "id lat lon category reward zone" per line, blank lines skipped. A zone of
// "-" is looked up in bounds; a site outside every zone is rejected.
std::vector<Site> readCatalog(std::istream& in, const std::optional<ZoneBounds>& bounds);
