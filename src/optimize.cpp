#include "optimize.hpp"
#include "catalog.hpp"
#include "evaluate.hpp"
#include "debug.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace {

constexpr int RANDOM_ATTEMPTS = 100;
constexpr unsigned long long EXHAUSTIVE_SUBSET_LIMIT = 5000000;

// Number of subsets of size 1..k drawn from n sites, saturating past the limit
unsigned long long subsetCount(size_t n, size_t k) {
    unsigned long long total = 0;
    unsigned long long c = 1;
    for (size_t i = 1; i <= std::min(n, k); ++i) {
        c = c * (n - i + 1) / i;
        total += c;
        if (total > EXHAUSTIVE_SUBSET_LIMIT) break;
    }
    return total;
}

// Upper bound for a sampled route size, never below one
size_t sampleLimit(int maxStops, size_t available) {
    size_t limit = std::min(static_cast<size_t>(std::max(maxStops, 0)), available);
    return std::max<size_t>(limit, 1);
}

double routeValue(const Site& start, const Route& route, const SearchSettings& settings) {
    return routeMetrics(start, route, settings).value;
}

}  // namespace

std::vector<Site> candidatePool(const ZoneIndex& zones, const Site& start) {
    std::vector<Site> pool = zones.candidatesFor(start.zone, start.id);
    std::stable_sort(pool.begin(), pool.end(), [](const Site& a, const Site& b) {
        return a.id < b.id;
    });
    return pool;
}

Route greedyRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings) {
    std::vector<Site> available = candidatePool(zones, start);
    Route selected;
    Site current = start;
    const size_t maxStops = static_cast<size_t>(std::max(settings.maxStops, 0));

    while (selected.size() < maxStops && !available.empty()) {
        double bestScore = -1.0;
        size_t best = available.size();

        for (size_t i = 0; i < available.size(); ++i) {
            const Site& candidate = available[i];

            // Try the candidate at the end of the route
            selected.push_back(candidate);
            bool ok = isFeasible(start, selected, settings);
            selected.pop_back();
            if (!ok) continue;

            double cost = travelMinutes(haversineKm(current, candidate), settings.walkingSpeedKmh)
                        + settings.dwellMinutes;
            double score = cost > 0.0 ? candidate.reward / cost
                                      : std::numeric_limits<double>::infinity();
            if (score > bestScore) {
                bestScore = score;
                best = i;
            }
        }

        if (best == available.size()) break;

        current = available[best];
        selected.push_back(current);
        available.erase(available.begin() + best);
    }

    return selected;
}

Route exhaustiveRoute(const Site& start, const std::vector<Site>& pool, const SearchSettings& settings) {
    Route bestRoute;
    double bestValue = 0.0;
    const size_t n = pool.size();
    const size_t maxSize = std::min(static_cast<size_t>(std::max(settings.maxStops, 0)), n);

    Route route;
    for (size_t r = 1; r <= maxSize; ++r) {
        // idx is the current combination, advanced in lexicographic order
        std::vector<size_t> idx(r);
        std::iota(idx.begin(), idx.end(), 0);

        while (true) {
            route.clear();
            for (size_t i : idx) {
                route.push_back(pool[i]);
            }
            if (isFeasible(start, route, settings)) {
                double value = routeValue(start, route, settings);
                if (value > bestValue) {
                    bestValue = value;
                    bestRoute = route;
                }
            }

            // Rightmost position that can still move
            size_t pos = r;
            while (pos > 0 && idx[pos - 1] == n - r + (pos - 1)) {
                --pos;
            }
            if (pos == 0) break;
            ++idx[pos - 1];
            for (size_t j = pos; j < r; ++j) {
                idx[j] = idx[j - 1] + 1;
            }
        }
    }

    DBG("Exhaustive search over " << n << " sites, best value " << bestValue);
    return bestRoute;
}

Route sampleRoute(const std::vector<Site>& pool, int maxStops, std::mt19937& rng) {
    if (pool.empty()) return {};

    std::uniform_int_distribution<size_t> size(1, sampleLimit(maxStops, pool.size()));
    size_t k = size(rng);

    Route route = pool;
    std::shuffle(route.begin(), route.end(), rng);
    route.resize(k);
    return route;
}

Route crossoverRoute(const Route& a, const Route& b, int maxStops, std::mt19937& rng) {
    Route merged;
    HashSet<int> ids;
    for (const Route* parent : {&a, &b}) {
        for (const auto& s : *parent) {
            if (ids.insert(s.id).second) merged.push_back(s);
        }
    }
    if (merged.empty()) return merged;

    std::uniform_int_distribution<size_t> size(1, sampleLimit(maxStops, merged.size()));
    size_t k = size(rng);

    std::shuffle(merged.begin(), merged.end(), rng);
    merged.resize(k);
    return merged;
}

Route mutateRoute(const Route& route, const std::vector<Site>& pool, int maxStops, std::mt19937& rng) {
    if (route.empty()) return route;

    Route child = route;

    HashSet<int> used;
    for (const auto& s : child) {
        used.insert(s.id);
    }
    std::vector<const Site*> unused;
    for (const auto& s : pool) {
        if (!used.contains(s.id)) unused.push_back(&s);
    }

    auto pick = [&rng](size_t n) {
        return std::uniform_int_distribution<size_t>(0, n - 1)(rng);
    };

    enum { ADD, REMOVE, REPLACE };
    switch (std::uniform_int_distribution<int>(ADD, REPLACE)(rng)) {
    case ADD:
        if (child.size() < static_cast<size_t>(std::max(maxStops, 0)) && !unused.empty()) {
            child.push_back(*unused[pick(unused.size())]);
        }
        break;
    case REMOVE:
        if (child.size() > 1) {
            child.erase(child.begin() + pick(child.size()));
        }
        break;
    case REPLACE:
        if (!unused.empty()) {
            size_t at = pick(child.size());
            child[at] = *unused[pick(unused.size())];
        }
        break;
    }
    return child;
}

Route geneticRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings, std::mt19937& rng) {
    std::vector<Site> pool = candidatePool(zones, start);

    // Few enough candidates to try them all
    if (pool.size() <= static_cast<size_t>(std::max(settings.maxStops, 0))) {
        return exhaustiveRoute(start, pool, settings);
    }

    const size_t populationSize = std::min(static_cast<size_t>(settings.populationCap), pool.size() * 2);

    std::vector<Route> population;
    population.reserve(populationSize);
    for (size_t i = 0; i < populationSize; ++i) {
        Route r = sampleRoute(pool, settings.maxStops, rng);
        if (isFeasible(start, r, settings)) population.push_back(std::move(r));
    }

    if (population.empty()) {
        DBG("No feasible random sample for site " << start.id << ", falling back to greedy");
        return greedyRoute(start, zones, settings);
    }

    const size_t eliteSize = std::max<size_t>(1, static_cast<size_t>(populationSize * settings.eliteFraction));
    std::uniform_real_distribution<double> chance(0.0, 1.0);

    for (int gen = 0; gen < settings.generations; ++gen) {
        std::vector<double> values(population.size());
        for (size_t i = 0; i < population.size(); ++i) {
            values[i] = routeValue(start, population[i], settings);
        }
        std::vector<size_t> order(population.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) {
            return values[x] > values[y];
        });

        std::vector<Route> elite;
        for (size_t i = 0; i < std::min(eliteSize, order.size()); ++i) {
            elite.push_back(population[order[i]]);
        }
        std::uniform_int_distribution<size_t> pickElite(0, elite.size() - 1);

        std::vector<Route> next = elite;
        while (next.size() < populationSize) {
            // Two distinct parents when the elite allows it
            size_t p1 = pickElite(rng);
            size_t p2 = p1;
            if (elite.size() > 1) {
                while (p2 == p1) p2 = pickElite(rng);
            }

            Route child = crossoverRoute(elite[p1], elite[p2], settings.maxStops, rng);
            if (chance(rng) < settings.mutationRate) {
                child = mutateRoute(child, pool, settings.maxStops, rng);
            }

            if (isFeasible(start, child, settings)) {
                next.push_back(std::move(child));
            } else {
                next.push_back(elite[pickElite(rng)]);
            }
        }
        population = std::move(next);
    }

    size_t best = 0;
    double bestValue = routeValue(start, population[0], settings);
    for (size_t i = 1; i < population.size(); ++i) {
        double v = routeValue(start, population[i], settings);
        if (v > bestValue) {
            bestValue = v;
            best = i;
        }
    }

    DBG("Population search for site " << start.id << ": " << settings.generations
        << " generations, best value " << bestValue);
    return population[best];
}

Route randomRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings, std::mt19937& rng) {
    std::vector<Site> pool = candidatePool(zones, start);
    if (pool.empty()) return {};

    for (int attempt = 0; attempt < RANDOM_ATTEMPTS; ++attempt) {
        Route r = sampleRoute(pool, settings.maxStops, rng);
        if (isFeasible(start, r, settings)) return r;
    }
    return {};
}

Route highValueRoute(const Site& start, const ZoneIndex& zones, const SearchSettings& settings) {
    std::vector<Site> pool = candidatePool(zones, start);
    std::stable_sort(pool.begin(), pool.end(), [](const Site& a, const Site& b) {
        return a.reward > b.reward;
    });

    Route selected;
    for (const auto& s : pool) {
        selected.push_back(s);
        if (!isFeasible(start, selected, settings)) selected.pop_back();
    }
    return selected;
}

Route planRoute(Strategy strategy, const Site& start, const ZoneIndex& zones,
                const SearchSettings& settings, std::mt19937& rng) {
    validateSettings(settings);

    Route route;
    switch (strategy) {
    case Strategy::Greedy:
        route = greedyRoute(start, zones, settings);
        break;
    case Strategy::Genetic:
        route = geneticRoute(start, zones, settings, rng);
        break;
    case Strategy::Exhaustive: {
        std::vector<Site> pool = candidatePool(zones, start);
        if (subsetCount(pool.size(), static_cast<size_t>(settings.maxStops)) > EXHAUSTIVE_SUBSET_LIMIT) {
            throw std::invalid_argument("exhaustive search over " + std::to_string(pool.size())
                                        + " sites with up to " + std::to_string(settings.maxStops)
                                        + " stops is too large, use the genetic strategy");
        }
        route = exhaustiveRoute(start, pool, settings);
        break;
    }
    case Strategy::Random:
        route = randomRoute(start, zones, settings, rng);
        break;
    case Strategy::HighValue:
        route = highValueRoute(start, zones, settings);
        break;
    }

    DBG("[" << strategyName(strategy) << "] " << formatRoute(start, route));
    return route;
}

std::string strategyName(Strategy strategy) {
    switch (strategy) {
    case Strategy::Greedy: return "greedy";
    case Strategy::Genetic: return "genetic";
    case Strategy::Exhaustive: return "exhaustive";
    case Strategy::Random: return "random";
    case Strategy::HighValue: return "high_value";
    }
    return "unknown";
}

Strategy parseStrategy(const std::string& name) {
    for (Strategy s : {Strategy::Greedy, Strategy::Genetic, Strategy::Exhaustive,
                       Strategy::Random, Strategy::HighValue}) {
        if (strategyName(s) == name) return s;
    }
    throw std::invalid_argument("unknown strategy: " + name);
}
