#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "evaluate.hpp"
#include "optimize.hpp"
#include "zones.hpp"

void check(bool ok, const std::string& what) {
    if (!ok) throw std::runtime_error("check failed: " + what);
}

template<typename F>
bool throwsInvalid(F f) {
    try {
        f();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

std::vector<int> ids(const Route& route) {
    std::vector<int> out;
    for (const auto& s : route) out.push_back(s.id);
    return out;
}

bool uniqueIds(const Route& route) {
    std::set<int> seen;
    for (const auto& s : route) {
        if (!seen.insert(s.id).second) return false;
    }
    return true;
}

// Best feasible value over every subset, each visited in ascending-id order
double oracleValue(const Site& start, const std::vector<Site>& pool, const SearchSettings& settings) {
    double best = 0.0;
    for (unsigned mask = 1; mask < (1u << pool.size()); ++mask) {
        Route r;
        for (size_t i = 0; i < pool.size(); ++i) {
            if (mask & (1u << i)) r.push_back(pool[i]);
        }
        if (isFeasible(start, r, settings)) {
            best = std::max(best, routeMetrics(start, r, settings).value);
        }
    }
    return best;
}

// Sites scattered around (lat, lon) within roughly radiusKm
std::vector<Site> scatter(int firstId, int count, double lat, double lon, double radiusKm,
                          const std::string& zone, std::mt19937& rng) {
    std::uniform_real_distribution<double> offset(-radiusKm / 111.0, radiusKm / 111.0);
    std::uniform_real_distribution<double> reward(1.0, 50.0);
    std::vector<Site> sites;
    for (int i = 0; i < count; ++i) {
        sites.push_back(Site{firstId + i, lat + offset(rng), lon + offset(rng), "poi", std::round(reward(rng)), zone});
    }
    return sites;
}

void testScenario() {
    Site start{100, 41.9000, 12.5000, "start", 0.0, "Z1"};
    std::vector<Site> catalog = {
        start,
        Site{1, 41.9050, 12.5000, "museum", 10.0, "Z1"},
        Site{2, 41.9000, 12.5070, "bar", 20.0, "Z1"},
        Site{3, 41.8950, 12.5000, "shop", 5.0, "Z1"},
        Site{4, 41.9000, 12.4930, "bar", 8.0, "Z1"},
        Site{5, 41.9001, 12.5001, "bar", 500.0, "Z2"}
    };
    ZoneIndex zones(catalog);

    SearchSettings settings;
    settings.maxStops = 2;
    settings.maxTimeMinutes = 180.0;

    auto pool = candidatePool(zones, start);
    check(ids(pool) == std::vector<int>({1, 2, 3, 4}), "pool excludes the start and other zones");

    Route best = exhaustiveRoute(start, pool, settings);
    check(ids(best) == std::vector<int>({1, 2}), "two most valuable sites");
    RouteMetrics m = routeMetrics(start, best, settings);
    check(m.value == 30.0, "scenario value");
    check(std::abs(m.distanceKm - 1.93827) < 1e-4, "scenario distance");
    check(std::abs(m.timeMinutes - 33.2592) < 1e-3, "scenario time");

    // Population search hands pools no larger than maxStops to the exhaustive search
    SearchSettings four = settings;
    four.maxStops = 4;
    std::mt19937 rng(7);
    Route all = geneticRoute(start, zones, four, rng);
    check(ids(all) == ids(exhaustiveRoute(start, pool, four)), "small pool goes exhaustive");
    check(ids(all) == std::vector<int>({1, 2, 3, 4}), "every site fits");

    // Tight budget: only a single stop fits
    SearchSettings tight = settings;
    tight.maxTimeMinutes = 20.0;
    Route one = exhaustiveRoute(start, pool, tight);
    check(ids(one) == std::vector<int>({2}), "richest single stop under a tight budget");

    // Nothing fits
    tight.maxTimeMinutes = 5.0;
    check(exhaustiveRoute(start, pool, tight).empty(), "no feasible subset");

    // Richest first, keeping whatever still fits
    check(ids(highValueRoute(start, zones, settings)) == std::vector<int>({2, 1}), "high value order");
}

void testExhaustiveMatchesOracle() {
    std::mt19937 gen(2024);
    for (int round = 0; round < 6; ++round) {
        Site start{0, 41.88, 12.47, "start", 0.0, "J3"};
        std::vector<Site> catalog = scatter(1, 7, 41.88, 12.47, 1.5, "J3", gen);
        catalog.push_back(start);
        ZoneIndex zones(catalog);
        auto pool = candidatePool(zones, start);

        for (double budget : {20.0, 35.0, 50.0, 80.0}) {
            for (int stops : {1, 3, 7}) {
                SearchSettings settings;
                settings.maxTimeMinutes = budget;
                settings.maxStops = stops;

                Route r = exhaustiveRoute(start, pool, settings);
                check(isFeasible(start, r, settings), "exhaustive result is feasible");
                check(routeMetrics(start, r, settings).value == oracleValue(start, pool, settings),
                      "exhaustive matches the oracle");
            }
        }
    }
}

void testGreedy() {
    // One site dominates on value per minute
    Site start{0, 41.9000, 12.5000, "start", 0.0, "Z1"};
    std::vector<Site> catalog = {
        start,
        Site{1, 41.9080, 12.5000, "shop", 4.0, "Z1"},
        Site{2, 41.9000, 12.5100, "shop", 5.0, "Z1"},
        Site{3, 41.9030, 12.5010, "museum", 100.0, "Z1"},
        Site{4, 41.8920, 12.5000, "bar", 3.0, "Z1"},
        Site{5, 41.9000, 12.4900, "bar", 6.0, "Z1"}
    };
    ZoneIndex zones(catalog);
    SearchSettings settings;

    Route r = greedyRoute(start, zones, settings);
    check(!r.empty() && r.front().id == 3, "dominant site picked first");
    check(r.size() == 5, "every site fits the default budget");
    check(isFeasible(start, r, settings), "greedy route is feasible");
    check(uniqueIds(r), "no site visited twice");

    SearchSettings twoStops = settings;
    twoStops.maxStops = 2;
    check(greedyRoute(start, zones, twoStops).size() == 2, "greedy stops at maxStops");

    SearchSettings noTime = settings;
    noTime.maxTimeMinutes = 1.0;
    check(greedyRoute(start, zones, noTime).empty(), "greedy returns empty when nothing fits");

    // Equal score: the lower id wins regardless of catalog order
    Site origin{0, 0.0, 0.0, "start", 0.0, "E"};
    ZoneIndex tie({origin, Site{9, 0.0, 0.01, "bar", 5.0, "E"}, Site{4, 0.0, -0.01, "bar", 5.0, "E"}});
    SearchSettings single;
    single.maxStops = 1;
    check(ids(greedyRoute(origin, tie, single)) == std::vector<int>({4}), "ties go to the lowest id");

    // Unknown zone
    Site lost{50, 41.9, 12.5, "start", 0.0, "nowhere"};
    check(greedyRoute(lost, zones, settings).empty(), "no candidates, no route");
}

void testGeneticFallback() {
    Site start{0, 41.9000, 12.5000, "start", 0.0, "Z1"};
    // Everything is at least 4 km away
    std::vector<Site> catalog;
    for (int i = 1; i <= 12; ++i) {
        catalog.push_back(Site{i, 41.9400 + 0.002 * i, 12.5000, "bar", 10.0 + i, "Z1"});
    }
    catalog.push_back(start);
    ZoneIndex zones(catalog);

    SearchSettings settings;
    settings.maxStops = 3;
    settings.maxTimeMinutes = 30.0;
    std::mt19937 rng(5);
    Route genetic = geneticRoute(start, zones, settings, rng);
    check(ids(genetic) == ids(greedyRoute(start, zones, settings)), "no feasible sample falls back to greedy");
    check(genetic.empty(), "nothing fits");

    // Zero stops allowed: no sample can ever be feasible
    SearchSettings zero = settings;
    zero.maxStops = 0;
    zero.maxTimeMinutes = 600.0;
    Route none = geneticRoute(start, zones, zero, rng);
    check(ids(none) == ids(greedyRoute(start, zones, zero)), "zero stops falls back to greedy");
    check(none.empty(), "zero stops means an empty route");
}

void testGenetic() {
    std::mt19937 gen(99);
    Site start{0, 41.8660, 12.5100, "start", 0.0, "J4"};
    std::vector<Site> catalog = scatter(1, 20, 41.8660, 12.5100, 1.0, "J4", gen);
    std::vector<Site> elsewhere = scatter(100, 10, 41.8300, 12.4600, 1.0, "J1", gen);
    catalog.insert(catalog.end(), elsewhere.begin(), elsewhere.end());
    catalog.push_back(start);
    ZoneIndex zones(catalog);

    SearchSettings settings;
    settings.maxStops = 4;
    settings.maxTimeMinutes = 60.0;
    settings.generations = 40;

    std::mt19937 a(123), b(123);
    Route first = geneticRoute(start, zones, settings, a);
    Route second = geneticRoute(start, zones, settings, b);
    check(ids(first) == ids(second), "same seed, same route");
    check(isFeasible(start, first, settings), "population search result is feasible");
    check(uniqueIds(first), "population search never repeats a site");
    for (const auto& s : first) {
        check(s.zone == "J4" && s.id != start.id, "stays in the start zone");
    }

    // Every subset fits, so the search must find something
    SearchSettings roomy = settings;
    roomy.maxTimeMinutes = 600.0;
    std::mt19937 c(1);
    Route r = geneticRoute(start, zones, roomy, c);
    check(!r.empty() && r.size() <= 4, "roomy budget gives a non-empty route");
}

void testCrossoverAndMutation() {
    std::vector<Site> pool;
    for (int i = 1; i <= 6; ++i) {
        pool.push_back(Site{i, 41.9, 12.5 + 0.001 * i, "bar", 1.0 * i, "Z1"});
    }
    Route a = {pool[0], pool[1], pool[2]};
    Route b = {pool[2], pool[3], pool[4]};

    std::mt19937 rng(31);
    for (int trial = 0; trial < 200; ++trial) {
        Route child = crossoverRoute(a, b, 4, rng);
        check(!child.empty() && child.size() <= 4, "crossover size within bounds");
        check(uniqueIds(child), "crossover child has no duplicates");
        for (const auto& s : child) {
            check(s.id >= 1 && s.id <= 5, "crossover child comes from the parents");
        }
        check(crossoverRoute(a, b, 2, rng).size() <= 2, "crossover respects maxStops");
    }
    check(crossoverRoute({}, {}, 4, rng).empty(), "empty parents, empty child");
    check(ids(crossoverRoute({pool[5]}, {pool[5]}, 4, rng)) == std::vector<int>({6}), "identical single parents");

    for (int trial = 0; trial < 200; ++trial) {
        Route m = mutateRoute(a, pool, 4, rng);
        check(m.size() >= 2 && m.size() <= 4, "mutation changes size by at most one");
        check(uniqueIds(m), "mutation never duplicates a site");

        Route full = mutateRoute(a, pool, 3, rng);
        check(full.size() <= 3, "mutation does not grow past maxStops");
    }
    check(mutateRoute({}, pool, 4, rng).empty(), "empty route stays empty");

    // Nothing unused and nothing removable
    for (int trial = 0; trial < 20; ++trial) {
        check(ids(mutateRoute({pool[0]}, {pool[0]}, 4, rng)) == std::vector<int>({1}), "no applicable move");
    }

    // Same generator state, same child
    std::mt19937 x(8), y(8);
    check(ids(crossoverRoute(a, b, 4, x)) == ids(crossoverRoute(a, b, 4, y)), "crossover is seed-determined");
    check(ids(mutateRoute(a, pool, 4, x)) == ids(mutateRoute(a, pool, 4, y)), "mutation is seed-determined");
}

void testEveryStrategyIsFeasible() {
    std::mt19937 gen(4242);
    std::vector<Site> catalog = scatter(1, 15, 41.83, 12.46, 1.2, "J1", gen);
    std::vector<Site> j2 = scatter(100, 6, 41.83, 12.51, 1.2, "J2", gen);
    std::vector<Site> j5 = scatter(200, 1, 41.90, 12.46, 0.5, "J5", gen);
    catalog.insert(catalog.end(), j2.begin(), j2.end());
    catalog.insert(catalog.end(), j5.begin(), j5.end());
    ZoneIndex zones(catalog);

    SearchSettings settings;
    settings.maxStops = 5;
    settings.maxTimeMinutes = 75.0;
    settings.generations = 20;

    for (Strategy strategy : {Strategy::Greedy, Strategy::Genetic, Strategy::Exhaustive,
                              Strategy::Random, Strategy::HighValue}) {
        for (int startId : {1, 7, 100, 103, 200}) {
            const Site& start = *zones.find(startId);
            std::mt19937 rng(startId);
            Route r = planRoute(strategy, start, zones, settings, rng);
            check(isFeasible(start, r, settings), strategyName(strategy) + " result is feasible");
            check(uniqueIds(r), strategyName(strategy) + " never repeats a site");
            for (const auto& s : r) {
                check(s.id != start.id, strategyName(strategy) + " never revisits the start");
            }
        }
    }

    // A zone with only the start has nothing to visit
    std::mt19937 rng(0);
    check(planRoute(Strategy::Genetic, *zones.find(200), zones, settings, rng).empty(), "lonely start");
}

void testExhaustiveSizeGuard() {
    std::mt19937 gen(31);
    Site start{0, 41.87, 12.49, "start", 0.0, "J7"};
    std::vector<Site> catalog = scatter(1, 40, 41.87, 12.49, 1.0, "J7", gen);
    catalog.push_back(start);
    ZoneIndex zones(catalog);
    std::mt19937 rng(3);

    // 40 sites with up to 8 stops is over a hundred million subsets
    SearchSettings settings;
    check(throwsInvalid([&] { planRoute(Strategy::Exhaustive, start, zones, settings, rng); }),
          "oversized exhaustive search rejected");

    // The same zone is fine for the population search and for short routes
    settings.generations = 5;
    check(isFeasible(start, planRoute(Strategy::Genetic, start, zones, settings, rng), settings),
          "genetic handles the large zone");
    settings.maxStops = 2;
    Route pair = planRoute(Strategy::Exhaustive, start, zones, settings, rng);
    check(ids(pair) == ids(exhaustiveRoute(start, candidatePool(zones, start), settings)),
          "small subset counts still go exhaustive");
}

void testSettingsAndNames() {
    Site start{0, 41.9, 12.5, "start", 0.0, "Z1"};
    ZoneIndex zones({start, Site{1, 41.901, 12.5, "bar", 3.0, "Z1"}});
    std::mt19937 rng(0);

    SearchSettings bad;
    bad.maxStops = 0;
    check(throwsInvalid([&] { planRoute(Strategy::Greedy, start, zones, bad, rng); }), "zero stops rejected");
    bad = SearchSettings();
    bad.maxTimeMinutes = -1.0;
    check(throwsInvalid([&] { planRoute(Strategy::Greedy, start, zones, bad, rng); }), "negative budget rejected");
    bad = SearchSettings();
    bad.walkingSpeedKmh = 0.0;
    check(throwsInvalid([&] { planRoute(Strategy::Genetic, start, zones, bad, rng); }), "zero speed rejected");
    bad = SearchSettings();
    bad.mutationRate = 1.5;
    check(throwsInvalid([&] { planRoute(Strategy::Genetic, start, zones, bad, rng); }), "mutation rate rejected");

    for (Strategy s : {Strategy::Greedy, Strategy::Genetic, Strategy::Exhaustive,
                       Strategy::Random, Strategy::HighValue}) {
        check(parseStrategy(strategyName(s)) == s, "strategy name round trip");
    }
    check(parseStrategy("high_value") == Strategy::HighValue, "high_value name");
    check(throwsInvalid([] { parseStrategy("annealing"); }), "unknown strategy rejected");
}

int main() {
    try {
        testScenario();
        testExhaustiveMatchesOracle();
        testGreedy();
        testGeneticFallback();
        testGenetic();
        testCrossoverAndMutation();
        testEveryStrategyIsFeasible();
        testExhaustiveSizeGuard();
        testSettingsAndNames();
        std::cout << "OptimizeTest passed\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
