/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AlgorithmPropertyTests
#include <boost/test/unit_test.hpp>

#include "mocks/MockHexGrid.hpp"
#include "pathfinding/algorithms/AStarPathfinding.hpp"
#include "pathfinding/algorithms/BestFirstSearch.hpp"
#include "pathfinding/algorithms/BidirectionalAStar.hpp"
#include "pathfinding/algorithms/BreadthFirstSearch.hpp"
#include "pathfinding/algorithms/DijkstraPathfinding.hpp"
#include "pathfinding/algorithms/FlowFieldPathfinding.hpp"

#include <climits>
#include <memory>
#include <random>
#include <vector>

using namespace HexPath;

namespace {

// Random obstacles and costs, reproducible from the seed
MockHexGrid makeRandomGrid(std::mt19937& rng, int width, int height) {
    MockHexGrid grid(width, height);
    std::uniform_int_distribution<int> roll(0, 99);
    std::uniform_int_distribution<int> cost(1, 4);
    for (CellId cell = 0; cell < grid.getCellCount(); ++cell) {
        const int value = roll(rng);
        if (value < 18) {
            grid.setWalkable(cell, false);
        } else if (value < 22) {
            grid.setOccupant(cell, Occupant::Ally);
        } else if (value < 25) {
            grid.setTerrain(cell, "Forest");
        }
        grid.setMovementCost(cell, cost(rng));
    }
    return grid;
}

int pathCost(const MockHexGrid& grid, const std::vector<CellId>& path,
             const PathfindingContext& context) {
    int total = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        total += context.getEffectiveMovementCost(grid, path[i]);
    }
    return total;
}

void checkValidPath(const MockHexGrid& grid, const PathResult& result,
                    const PathfindingContext& context) {
    const auto& path = result.getPath();
    BOOST_REQUIRE(!path.empty());
    BOOST_CHECK_EQUAL(path.front(), result.getStartCell());
    BOOST_CHECK_EQUAL(path.back(), result.getGoalCell());
    for (size_t i = 1; i < path.size(); ++i) {
        BOOST_CHECK(grid.areAdjacent(path[i - 1], path[i]));
        BOOST_CHECK(!context.isObstacle(grid, path[i]));
    }
}

// Exhaustive depth-first search over simple paths
void bruteForce(const MockHexGrid& grid, const PathfindingContext& context, CellId current,
                CellId goal, int cost, std::vector<bool>& visited, int& best) {
    if (cost >= best) {
        return;
    }
    if (current == goal) {
        best = cost;
        return;
    }
    NeighborList neighbors;
    grid.getNeighbors(current, neighbors);
    for (CellId next : neighbors) {
        if (visited[next] || context.isObstacle(grid, next)) {
            continue;
        }
        visited[next] = true;
        bruteForce(grid, context, next, goal, cost + context.getEffectiveMovementCost(grid, next),
                   visited, best);
        visited[next] = false;
    }
}

} // namespace

BOOST_AUTO_TEST_SUITE(OptimalityTests)

BOOST_AUTO_TEST_CASE(DijkstraMatchesExhaustiveSearch) {
    std::mt19937 rng(20250601);
    DijkstraPathfinding dijkstra;
    PathfindingContext context;
    context.setTerrainCostMultiplier("Forest", 2.5f);

    for (int trial = 0; trial < 30; ++trial) {
        MockHexGrid grid = makeRandomGrid(rng, 4, 3);
        std::uniform_int_distribution<CellId> pick(0, static_cast<CellId>(grid.getCellCount() - 1));
        const CellId start = pick(rng);
        const CellId goal = pick(rng);

        PathResult result = dijkstra.findPath(grid, start, goal, context);
        if (start == goal || context.isObstacle(grid, goal)) {
            continue;
        }

        std::vector<bool> visited(grid.getCellCount(), false);
        visited[start] = true;
        int best = INT_MAX;
        bruteForce(grid, context, start, goal, 0, visited, best);

        BOOST_TEST_CONTEXT("trial " << trial) {
            if (best == INT_MAX) {
                BOOST_CHECK(!result.isSuccess());
            } else {
                BOOST_REQUIRE(result.isSuccess());
                BOOST_CHECK_EQUAL(result.getTotalCost(), best);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(OptimalAlgorithmsAgreeWithDijkstra) {
    std::mt19937 rng(777);
    DijkstraPathfinding dijkstra;
    std::vector<std::shared_ptr<IPathfindingAlgorithm>> candidates{
        std::make_shared<AStarPathfinding>(), std::make_shared<BidirectionalAStar>(),
        std::make_shared<FlowFieldPathfinding>()};

    PathfindingContext context;
    context.setTerrainCostMultiplier("Forest", 3.0f);

    for (int trial = 0; trial < 40; ++trial) {
        MockHexGrid grid = makeRandomGrid(rng, 9, 8);
        std::uniform_int_distribution<CellId> pick(0, static_cast<CellId>(grid.getCellCount() - 1));
        const CellId start = pick(rng);
        const CellId goal = pick(rng);
        const PathResult reference = dijkstra.findPath(grid, start, goal, context);

        for (const auto& algorithm : candidates) {
            PathResult result = algorithm->findPath(grid, start, goal, context);
            BOOST_TEST_CONTEXT("trial " << trial << " " << algorithm->getName()) {
                BOOST_CHECK_EQUAL(result.isSuccess(), reference.isSuccess());
                if (!reference.isSuccess()) {
                    BOOST_CHECK_EQUAL(result.getFailureReason(), reference.getFailureReason());
                    continue;
                }
                BOOST_CHECK_EQUAL(result.getTotalCost(), reference.getTotalCost());
                checkValidPath(grid, result, context);
                BOOST_CHECK_EQUAL(pathCost(grid, result.getPath(), context), result.getTotalCost());
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(NonOptimalAlgorithmsStillFindValidPaths) {
    std::mt19937 rng(4242);
    DijkstraPathfinding dijkstra;
    BreadthFirstSearch bfs;
    BestFirstSearch greedy;
    PathfindingContext context;

    for (int trial = 0; trial < 40; ++trial) {
        MockHexGrid grid = makeRandomGrid(rng, 8, 8);
        std::uniform_int_distribution<CellId> pick(0, static_cast<CellId>(grid.getCellCount() - 1));
        const CellId start = pick(rng);
        const CellId goal = pick(rng);
        const PathResult reference = dijkstra.findPath(grid, start, goal, context);

        PathResult stepResult = bfs.findPath(grid, start, goal, context);
        PathResult greedyResult = greedy.findPath(grid, start, goal, context);
        BOOST_TEST_CONTEXT("trial " << trial) {
            BOOST_CHECK_EQUAL(stepResult.isSuccess(), reference.isSuccess());
            BOOST_CHECK_EQUAL(greedyResult.isSuccess(), reference.isSuccess());
            if (!reference.isSuccess()) {
                continue;
            }
            checkValidPath(grid, stepResult, context);
            checkValidPath(grid, greedyResult, context);
            // Fewest steps, cost reported in steps
            BOOST_CHECK_EQUAL(stepResult.getTotalCost(),
                              static_cast<int>(stepResult.getPathLength()) - 1);
            BOOST_CHECK_LE(stepResult.getPathLength(), reference.getPathLength());
            BOOST_CHECK_EQUAL(greedyResult.getTotalCost(),
                              pathCost(grid, greedyResult.getPath(), context));
            BOOST_CHECK_GE(greedyResult.getTotalCost(), reference.getTotalCost());
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BudgetTests)

BOOST_AUTO_TEST_CASE(MovementLimitIsNeverExceeded) {
    std::mt19937 rng(99);
    DijkstraPathfinding dijkstra;
    std::vector<std::shared_ptr<IPathfindingAlgorithm>> candidates{
        std::make_shared<AStarPathfinding>(), std::make_shared<DijkstraPathfinding>(),
        std::make_shared<BidirectionalAStar>(), std::make_shared<FlowFieldPathfinding>()};

    for (int trial = 0; trial < 30; ++trial) {
        MockHexGrid grid = makeRandomGrid(rng, 8, 8);
        std::uniform_int_distribution<CellId> pick(0, static_cast<CellId>(grid.getCellCount() - 1));
        std::uniform_int_distribution<int> limitDist(1, 12);
        const CellId start = pick(rng);
        const CellId goal = pick(rng);
        const PathResult unlimited = dijkstra.findPath(grid, start, goal, PathfindingContext{});
        const PathfindingContext limited = PathfindingContext::createWithMovementLimit(limitDist(rng));

        for (const auto& algorithm : candidates) {
            PathResult result = algorithm->findPath(grid, start, goal, limited);
            BOOST_TEST_CONTEXT("trial " << trial << " " << algorithm->getName()) {
                if (result.isSuccess()) {
                    BOOST_CHECK_LE(result.getTotalCost(), limited.maxMovementPoints);
                }
                // Optimal searches succeed exactly when the optimum fits the budget
                const bool fits = unlimited.isSuccess() &&
                                  unlimited.getTotalCost() <= limited.maxMovementPoints;
                BOOST_CHECK_EQUAL(result.isSuccess(), fits);
                if (unlimited.isSuccess() && !fits) {
                    BOOST_CHECK_EQUAL(result.getFailureReason(),
                                      FailureReason::MOVEMENT_BUDGET_EXCEEDED);
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(NodeLimitCapsExploration) {
    MockHexGrid grid(30, 30);
    PathfindingContext context;
    context.maxSearchNodes = 50;
    std::vector<std::shared_ptr<IPathfindingAlgorithm>> candidates{
        std::make_shared<AStarPathfinding>(), std::make_shared<DijkstraPathfinding>(),
        std::make_shared<BreadthFirstSearch>(), std::make_shared<BestFirstSearch>(),
        std::make_shared<BidirectionalAStar>(), std::make_shared<FlowFieldPathfinding>()};

    // Two walls force a long serpentine route
    grid.blockColumn(10, {29});
    grid.blockColumn(20, {0});

    for (const auto& algorithm : candidates) {
        PathResult result = algorithm->findPath(grid, grid.at(0, 0), grid.at(29, 29), context);
        BOOST_TEST_CONTEXT(algorithm->getName()) {
            BOOST_CHECK_LE(result.getNodesExplored(), context.maxSearchNodes);
            if (!result.isSuccess()) {
                BOOST_CHECK_EQUAL(result.getFailureReason(), FailureReason::NODE_BUDGET_EXCEEDED);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(BidirectionalSuccessUnderNodeLimitIsOptimal) {
    std::mt19937 rng(2718);
    DijkstraPathfinding dijkstra;
    BidirectionalAStar bidirectional;
    PathfindingContext context;

    for (int trial = 0; trial < 25; ++trial) {
        MockHexGrid grid = makeRandomGrid(rng, 9, 9);
        std::uniform_int_distribution<CellId> pick(0, static_cast<CellId>(grid.getCellCount() - 1));
        const CellId start = pick(rng);
        const CellId goal = pick(rng);
        const PathResult reference = dijkstra.findPath(grid, start, goal, PathfindingContext{});

        for (int limit = 1; limit <= 60; ++limit) {
            context.maxSearchNodes = limit;
            PathResult result = bidirectional.findPath(grid, start, goal, context);
            BOOST_TEST_CONTEXT("trial " << trial << " limit " << limit) {
                BOOST_CHECK_LE(result.getNodesExplored(), limit);
                if (result.isSuccess()) {
                    BOOST_REQUIRE(reference.isSuccess());
                    BOOST_CHECK_EQUAL(result.getTotalCost(), reference.getTotalCost());
                } else if (reference.isSuccess()) {
                    BOOST_CHECK_EQUAL(result.getFailureReason(), FailureReason::NODE_BUDGET_EXCEEDED);
                }
            }
        }
    }

    // Adjacent cells are proven after a single expansion
    MockHexGrid open(5, 5);
    context.maxSearchNodes = 1;
    PathResult adjacent = bidirectional.findPath(open, open.at(1, 1), open.at(2, 1), context);
    BOOST_CHECK(adjacent.isSuccess());
    BOOST_CHECK_EQUAL(adjacent.getTotalCost(), 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DeterminismTests)

BOOST_AUTO_TEST_CASE(RepeatedQueriesReturnIdenticalPaths) {
    std::mt19937 rng(31337);
    std::vector<std::shared_ptr<IPathfindingAlgorithm>> candidates{
        std::make_shared<AStarPathfinding>(), std::make_shared<DijkstraPathfinding>(),
        std::make_shared<BreadthFirstSearch>(), std::make_shared<BestFirstSearch>(),
        std::make_shared<BidirectionalAStar>(), std::make_shared<FlowFieldPathfinding>()};
    PathfindingContext context;

    for (int trial = 0; trial < 10; ++trial) {
        MockHexGrid grid = makeRandomGrid(rng, 10, 10);
        std::uniform_int_distribution<CellId> pick(0, static_cast<CellId>(grid.getCellCount() - 1));
        const CellId start = pick(rng);
        const CellId goal = pick(rng);

        for (const auto& algorithm : candidates) {
            PathResult first = algorithm->findPath(grid, start, goal, context);
            // An unrelated query in between must not leak state into the next one
            algorithm->findPath(grid, goal, start, context);
            PathResult second = algorithm->findPath(grid, start, goal, context);
            BOOST_TEST_CONTEXT("trial " << trial << " " << algorithm->getName()) {
                BOOST_CHECK_EQUAL(first.isSuccess(), second.isSuccess());
                BOOST_CHECK(first.getPath() == second.getPath());
                BOOST_CHECK_EQUAL(first.getTotalCost(), second.getTotalCost());
                BOOST_CHECK_EQUAL(first.getNodesExplored(), second.getNodesExplored());
            }
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
