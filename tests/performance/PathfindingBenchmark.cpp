/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file PathfindingBenchmark.cpp
 * @brief Performance benchmarks for the hex pathfinding service
 *
 * Covers:
 * - Per-algorithm search time on a large weighted map
 * - Async request throughput through the ThreadSystem
 * - Cache hit cost versus a fresh search
 * - Obstacle density impact on search time
 * - Flow field generation time
 */

#define BOOST_TEST_MODULE PathfindingBenchmark
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/PathfindingManager.hpp"
#include "mocks/MockHexGrid.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <thread>
#include <utility>
#include <vector>

using namespace HexPath;
using namespace std::chrono;

namespace {

constexpr int MAP_SIZE = 200;

void populateMap(MockHexGrid& grid, float obstacleDensity, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);
    std::uniform_int_distribution<int> cost(1, 4);
    for (int row = 0; row < grid.getHeight(); ++row) {
        for (int col = 0; col < grid.getWidth(); ++col) {
            const CellId cell = grid.at(col, row);
            grid.setWalkable(cell, roll(rng) >= obstacleDensity);
            grid.setMovementCost(cell, cost(rng));
        }
    }
}

std::vector<std::pair<CellId, CellId>> makeQueries(const MockHexGrid& grid, size_t count,
                                                   uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> colDist(0, grid.getWidth() - 1);
    std::uniform_int_distribution<int> rowDist(0, grid.getHeight() - 1);
    std::vector<std::pair<CellId, CellId>> queries;
    queries.reserve(count);
    while (queries.size() < count) {
        const CellId start = grid.at(colDist(rng), rowDist(rng));
        const CellId goal = grid.at(colDist(rng), rowDist(rng));
        if (grid.isWalkable(start) && grid.isWalkable(goal)) {
            queries.emplace_back(start, goal);
        }
    }
    return queries;
}

struct TimingSummary {
    double average{0.0};
    double median{0.0};
    double p95{0.0};
};

TimingSummary summarize(std::vector<double> samples) {
    TimingSummary summary;
    if (samples.empty()) {
        return summary;
    }
    std::sort(samples.begin(), samples.end());
    summary.average = std::accumulate(samples.begin(), samples.end(), 0.0) / samples.size();
    summary.median = samples[samples.size() / 2];
    summary.p95 = samples[static_cast<size_t>(samples.size() * 0.95)];
    return summary;
}

} // namespace

class PathfindingBenchmarkFixture {
public:
    PathfindingBenchmarkFixture() : grid(MAP_SIZE, MAP_SIZE) {
        HEXPATH_ENABLE_BENCHMARK_MODE();
        threadSystem.init();
        populateMap(grid, 0.15f, 42); // Fixed seed for reproducible results

        std::cout << "\n=== Hex Pathfinding Benchmark Suite ===\n";
        std::cout << "Map: " << MAP_SIZE << "x" << MAP_SIZE << " cells, "
                  << threadSystem.getThreadCount() << " worker threads\n\n";
    }

    ~PathfindingBenchmarkFixture() {
        threadSystem.clean();
        HEXPATH_DISABLE_BENCHMARK_MODE();
    }

    ThreadSystem threadSystem;
    MockHexGrid grid;
};

BOOST_FIXTURE_TEST_SUITE(PathfindingBenchmarkSuite, PathfindingBenchmarkFixture)

BOOST_AUTO_TEST_CASE(BenchmarkAlgorithms) {
    std::cout << "=== Per-Algorithm Search Time ===\n";

    const auto queries = makeQueries(grid, 200, 7);
    PathfindingManager manager(grid);
    manager.setCachingEnabled(false);

    for (size_t i = 0; i < PathfindingManager::ALGORITHM_COUNT; ++i) {
        const auto type = static_cast<PathfindingManager::AlgorithmType>(i);
        manager.setAlgorithm(type);

        std::vector<double> times;
        times.reserve(queries.size());
        size_t successes = 0;
        size_t nodes = 0;

        for (const auto& [start, goal] : queries) {
            const auto begin = high_resolution_clock::now();
            PathResult result = manager.findPath(start, goal);
            const auto end = high_resolution_clock::now();
            times.push_back(duration_cast<microseconds>(end - begin).count() / 1000.0);
            nodes += static_cast<size_t>(result.getNodesExplored());
            if (result.isSuccess()) {
                ++successes;
            }
        }

        const TimingSummary summary = summarize(times);
        std::cout << std::left << std::setw(22) << manager.getCurrentAlgorithm().getName()
                  << std::right << std::fixed << std::setprecision(3)
                  << " avg " << summary.average << "ms"
                  << "  median " << summary.median << "ms"
                  << "  p95 " << summary.p95 << "ms"
                  << "  nodes/search " << (nodes / queries.size())
                  << "  success " << successes << "/" << queries.size() << "\n";

        BOOST_CHECK_GT(successes, 0u);
    }
    std::cout << "\n";
}

BOOST_AUTO_TEST_CASE(BenchmarkAsyncThroughput) {
    std::cout << "=== Async Request Throughput ===\n";

    PathfindingManager manager(grid, PathfindingConfig{}, &threadSystem);
    manager.setCachingEnabled(false);

    const std::vector<size_t> batchSizes = {10, 50, 100, 250};
    for (size_t batchSize : batchSizes) {
        const auto queries = makeQueries(grid, batchSize, static_cast<uint32_t>(batchSize));
        size_t delivered = 0;

        const auto submitStart = high_resolution_clock::now();
        for (const auto& [start, goal] : queries) {
            manager.findPathAsync(start, goal, PathfindingContext{},
                                  [&delivered](const PathResult&) { ++delivered; });
        }
        const auto submitEnd = high_resolution_clock::now();

        const auto deadline = submitEnd + seconds(10);
        while (manager.hasPendingWork() && high_resolution_clock::now() < deadline) {
            manager.update();
            std::this_thread::sleep_for(microseconds(100));
        }
        const auto done = high_resolution_clock::now();

        const double submitMs = duration_cast<microseconds>(submitEnd - submitStart).count() / 1000.0;
        const double totalMs = duration_cast<microseconds>(done - submitStart).count() / 1000.0;

        std::cout << "Batch size " << batchSize << ":\n";
        std::cout << "  Delivered: " << delivered << "/" << batchSize << "\n";
        std::cout << "  Submission: " << std::setprecision(3) << submitMs << "ms\n";
        std::cout << "  Total: " << totalMs << "ms\n";
        if (totalMs > 0.0) {
            std::cout << "  Throughput: " << std::setprecision(0)
                      << (delivered / (totalMs / 1000.0)) << " paths/sec\n";
        }
        std::cout << "\n";

        BOOST_CHECK_EQUAL(delivered, batchSize);
    }
}

BOOST_AUTO_TEST_CASE(BenchmarkCacheHits) {
    std::cout << "=== Cache Hit Cost ===\n";

    PathfindingConfig config;
    config.maxCacheSize = 1000;
    config.cacheDurationSeconds = 60.0f;
    PathfindingManager manager(grid, config);
    const auto queries = makeQueries(grid, 100, 99);

    const auto coldStart = high_resolution_clock::now();
    for (const auto& [start, goal] : queries) {
        manager.findPath(start, goal);
    }
    const auto coldEnd = high_resolution_clock::now();
    for (const auto& [start, goal] : queries) {
        manager.findPath(start, goal);
    }
    const auto warmEnd = high_resolution_clock::now();

    const double coldMs = duration_cast<microseconds>(coldEnd - coldStart).count() / 1000.0;
    const double warmMs = duration_cast<microseconds>(warmEnd - coldEnd).count() / 1000.0;
    const auto stats = manager.getStats();

    std::cout << "  Cold pass: " << std::setprecision(3) << coldMs << "ms\n";
    std::cout << "  Warm pass: " << warmMs << "ms\n";
    std::cout << "  Hit rate: " << std::setprecision(1) << (stats.cacheHitRate * 100.0f) << "%\n\n";

    // Every lookup is either a hit or a search
    BOOST_CHECK_EQUAL(stats.totalCacheHits + stats.totalPathsFound, 2 * queries.size());
    BOOST_CHECK_GT(stats.totalCacheHits, 0u);
}

BOOST_AUTO_TEST_CASE(BenchmarkObstacleDensity) {
    std::cout << "=== Obstacle Density Impact (A*) ===\n";

    for (float density : {0.0f, 0.1f, 0.2f, 0.3f}) {
        MockHexGrid densityGrid(100, 100);
        populateMap(densityGrid, density, 11);
        PathfindingManager manager(densityGrid);
        manager.setCachingEnabled(false);

        const auto queries = makeQueries(densityGrid, 100, 5);
        std::vector<double> times;
        size_t successes = 0;
        for (const auto& [start, goal] : queries) {
            const auto begin = high_resolution_clock::now();
            if (manager.findPath(start, goal).isSuccess()) {
                ++successes;
            }
            times.push_back(duration_cast<microseconds>(high_resolution_clock::now() - begin).count() /
                            1000.0);
        }

        const TimingSummary summary = summarize(times);
        std::cout << "  Density " << std::setprecision(0) << (density * 100.0f) << "%: avg "
                  << std::setprecision(3) << summary.average << "ms, p95 " << summary.p95
                  << "ms, success " << successes << "/" << queries.size() << "\n";
    }
    std::cout << "\n";
}

BOOST_AUTO_TEST_CASE(BenchmarkFlowField) {
    std::cout << "=== Flow Field Generation ===\n";

    PathfindingManager manager(grid);
    const CellId goal = makeQueries(grid, 1, 3).front().second;

    for (int maxDistance : {10, 50, -1}) {
        const auto begin = high_resolution_clock::now();
        FlowField field = manager.generateFlowField(goal, PathfindingContext{}, maxDistance);
        const double ms = duration_cast<microseconds>(high_resolution_clock::now() - begin).count() /
                          1000.0;

        std::cout << "  maxDistance " << maxDistance << ": " << field.getReachableCount()
                  << " cells in " << std::setprecision(3) << ms << "ms\n";
        BOOST_CHECK_GE(field.getReachableCount(), 1u);
    }
    std::cout << "\n";
}

BOOST_AUTO_TEST_SUITE_END()
