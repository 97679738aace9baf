#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include "structures.hpp"

// Compile with -DFIELDTOUR_DEBUG to enable debug logging
#if FIELDTOUR_DEBUG
    #define DBG(x) do { std::cerr << x << std::endl; } while (0)
#else
    #define DBG(x) do {} while (0)
#endif

// "start -> 4 -> 9 -> start" for log lines
inline std::string formatRoute(const Site& start, const Route& route) {
    std::ostringstream out;
    out << start.id;
    for (const auto& s : route) {
        out << " -> " << s.id;
    }
    out << " -> " << start.id;
    return out.str();
}
