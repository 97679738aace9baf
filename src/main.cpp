#include "simulate.hpp"
#include "optimize.hpp"
#include "evaluate.hpp"
#include "catalog.hpp"
#include "zones.hpp"

#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <iomanip>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>

// Simple settings structure
struct Settings {
    std::filesystem::path catalogFile = "./data/sites.txt";
    std::optional<std::filesystem::path> zonesFile; // rectangles for sites without a zone
    std::filesystem::path outputFile = "./data/days.txt";
    std::optional<std::filesystem::path> logFile; // optional log file
    std::string strategy = "greedy";
    int days = 5;
    uint32_t seed = 42;
    std::vector<int> startIds; // fixed starting sites; empty = random
    SearchSettings search;
};

// Read settings from a file (very simple: key value per line)
Settings loadSettings(const std::string& settingsFile) {
    Settings s;
    std::ifstream in(settingsFile);
    if (!in) {
        std::cerr << "No settings file found. Using defaults." << std::endl;
        return s;
    }

    std::string key;
    while (in >> key) {
        if (key == "catalog") {
            in >> s.catalogFile;
        } else if (key == "zones") {
            std::string path;
            in >> path;
            s.zonesFile = path;
        } else if (key == "output") {
            in >> s.outputFile;
        } else if (key == "logFile") {
            std::string path;
            in >> path;
            s.logFile = path;
        } else if (key == "strategy") {
            in >> s.strategy;
        } else if (key == "days") {
            in >> s.days;
        } else if (key == "seed") {
            in >> s.seed;
        } else if (key == "start") {
            int id;
            in >> id;
            s.startIds.push_back(id);
        } else if (key == "maxTime") {
            in >> s.search.maxTimeMinutes;
        } else if (key == "maxStops") {
            in >> s.search.maxStops;
        } else if (key == "dwell") {
            in >> s.search.dwellMinutes;
        } else if (key == "speed") {
            in >> s.search.walkingSpeedKmh;
        } else if (key == "populationCap") {
            in >> s.search.populationCap;
        } else if (key == "generations") {
            in >> s.search.generations;
        } else if (key == "mutationRate") {
            in >> s.search.mutationRate;
        } else if (key == "eliteFraction") {
            in >> s.search.eliteFraction;
        }
    }
    return s;
}

ZoneBounds loadZoneBounds(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open zones file: " + path.string());
    return readZoneBounds(in);
}

std::vector<Site> loadCatalog(const std::filesystem::path& path, const std::optional<ZoneBounds>& bounds) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open catalog file: " + path.string());
    return readCatalog(in, bounds);
}

void writeDay(std::ostream& out, const DayResult& r, const SearchSettings& search) {
    out << "day " << r.day << " zone " << r.zone << " start " << r.start.id
        << " (" << r.start.lat << ", " << r.start.lon << ")\n";
    const auto legs = routeLegs(r.start, r.route, search);
    for (size_t i = 0; i < legs.size(); ++i) {
        bool back = i + 1 == legs.size();
        out << "  " << legs[i].fromId << " -> " << legs[i].toId
            << " " << legs[i].distanceKm << " km " << legs[i].travelMinutes << " min";
        if (!back) out << " reward " << r.route[i].reward;
        out << "\n";
    }
    out << "  stops " << r.route.size() << " distance " << r.metrics.distanceKm
        << " km time " << r.metrics.timeMinutes << " min value " << r.metrics.value << "\n";
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    // Load settings
    Settings settings = loadSettings(argc > 1 ? argv[1] : "settings.txt");
    std::cout << "Settings:\n";
    std::cout << "  Catalog: " << settings.catalogFile << "\n";
    std::cout << "  Zones: " << (settings.zonesFile ? settings.zonesFile->string() : "from catalog") << "\n";
    std::cout << "  Output: " << settings.outputFile << "\n";
    std::cout << "  Log file: " << (settings.logFile ? settings.logFile->string() : "stdout") << "\n";
    std::cout << "  Strategy: " << settings.strategy << ", days: " << settings.days
              << ", seed: " << settings.seed << "\n";
    std::cout << "  Limits: " << settings.search.maxTimeMinutes << " min, "
              << settings.search.maxStops << " stops, " << settings.search.dwellMinutes << " min dwell, "
              << settings.search.walkingSpeedKmh << " km/h\n";

    // Set up logging
    std::ofstream logFile;
    std::ostream& logStream = [&]() -> std::ostream& {
        if (settings.logFile) {
            logFile.open(*settings.logFile); // overwrite mode
            if (logFile) {
                return logFile;
            } else {
                std::cerr << "Failed to open log file. Falling back to stdout.\n";
            }
        }
        return std::cout;
    }();

    Strategy strategy = Strategy::Greedy;
    std::optional<ZoneIndex> zones;
    try {
        strategy = parseStrategy(settings.strategy);
        validateSettings(settings.search);

        std::optional<ZoneBounds> bounds;
        if (settings.zonesFile) bounds = loadZoneBounds(*settings.zonesFile);
        zones.emplace(loadCatalog(settings.catalogFile, bounds));
    } catch (const std::exception& e) {
        logStream << "Error: " << e.what() << "\n";
        return 1;
    }

    logStream << "Loaded " << zones->size() << " sites in " << zones->zones().size() << " zones\n";
    for (const auto& z : zones->zones()) {
        double total = 0.0;
        for (const auto& s : zones->sitesIn(z)) total += s.reward;
        logStream << "  " << z << ": " << zones->sitesIn(z).size() << " sites, value " << total << "\n";
    }

    std::vector<Site> startingPoints;
    if (!settings.startIds.empty()) {
        for (int id : settings.startIds) {
            const Site* s = zones->find(id);
            if (!s) {
                logStream << "Error: unknown starting site " << id << "\n";
                return 1;
            }
            startingPoints.push_back(*s);
        }
    } else {
        std::mt19937 rng(settings.seed);
        startingPoints = pickStartingPoints(*zones, settings.days, rng);
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    std::vector<DayResult> results;
    try {
        results = simulateDays(startingPoints, strategy, *zones, settings.search, settings.seed);
    } catch (const std::exception& e) {
        logStream << "Error: " << e.what() << "\n";
        return 1;
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

    namespace fs = std::filesystem;
    if (settings.outputFile.has_parent_path() && !fs::exists(settings.outputFile.parent_path())) {
        fs::create_directories(settings.outputFile.parent_path());
    }
    std::ofstream outFile(settings.outputFile);
    if (!outFile) {
        logStream << "Failed to open output file: " << settings.outputFile << "\n";
        return 1;
    }
    outFile << std::fixed << std::setprecision(4);
    for (const auto& r : results) {
        writeDay(outFile, r, settings.search);
    }

    RunSummary summary = summarizeDays(results);
    logStream << std::fixed << std::setprecision(2);
    for (const auto& r : results) {
        logStream << "Day " << r.day << " (" << r.zone << "): value " << r.metrics.value
                  << ", " << r.route.size() << " stops, " << r.metrics.timeMinutes << " min\n";
    }
    logStream << "Total value " << summary.value << ", distance " << summary.distanceKm
              << " km, time " << summary.timeMinutes << " min, stops " << summary.stops << "\n";
    for (const auto& z : summary.zones) {
        logStream << "  " << z.zone << ": " << z.value << " over " << z.days << " days, "
                  << z.value / z.days << " per day\n";
    }
    logStream << "Finished " << results.size() << " days in " << duration << " ms\n";

    return 0;
}
