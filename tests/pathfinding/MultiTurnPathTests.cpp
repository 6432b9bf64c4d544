/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MultiTurnPathTests
#include <boost/test/unit_test.hpp>

#include "mocks/MockHexGrid.hpp"
#include "pathfinding/MultiTurnPathResult.hpp"
#include "pathfinding/algorithms/AStarPathfinding.hpp"

#include <string>
#include <vector>

using namespace HexPath;

namespace {

struct RowFixture {
    RowFixture() : grid(6, 1) {
        for (int col = 0; col < 6; ++col) {
            path.push_back(grid.at(col, 0));
        }
    }

    PathResult straightPath() const {
        int cost = 0;
        for (size_t i = 1; i < path.size(); ++i) {
            cost += context.getEffectiveMovementCost(grid, path[i]);
        }
        return PathResult::createSuccess(path.front(), path.back(), path, cost,
                                         static_cast<int>(path.size()), 0.1);
    }

    MockHexGrid grid;
    PathfindingContext context;
    std::vector<CellId> path;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(TurnSplittingTests, RowFixture)

BOOST_AUTO_TEST_CASE(EvenSplitWithPartialLastTurn) {
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 2, context);

    BOOST_REQUIRE(result.isSuccess());
    BOOST_CHECK_EQUAL(result.getTurnsRequired(), 3);
    BOOST_CHECK_EQUAL(result.getTotalCost(), 5);
    BOOST_CHECK((result.getCostPerTurn() == std::vector<int>{2, 2, 1}));
    BOOST_CHECK((result.getTurnPath(0) == std::vector<CellId>{path[0], path[1], path[2]}));
    BOOST_CHECK((result.getTurnPath(1) == std::vector<CellId>{path[2], path[3], path[4]}));
    BOOST_CHECK((result.getTurnPath(2) == std::vector<CellId>{path[4], path[5]}));
    BOOST_CHECK((result.getTurnEndpoints() == std::vector<CellId>{path[2], path[4], path[5]}));
    BOOST_CHECK(result.getCompletePath() == path);
    BOOST_CHECK(!result.isSingleTurnPath());
}

BOOST_AUTO_TEST_CASE(TurnsPartitionTheCompletePath) {
    grid.setMovementCost(path[2], 3);
    grid.setMovementCost(path[4], 2);
    for (int allowance = 1; allowance <= 8; ++allowance) {
        MultiTurnPathResult result =
            MultiTurnPathResult::createFromSinglePath(grid, straightPath(), allowance, context);
        BOOST_TEST_CONTEXT("allowance " << allowance) {
            BOOST_REQUIRE(result.isSuccess());
            std::vector<CellId> joined;
            int summed = 0;
            for (int turn = 0; turn < result.getTurnsRequired(); ++turn) {
                const auto segment = result.getTurnPath(turn);
                BOOST_REQUIRE_GE(segment.size(), 2u);
                if (turn > 0) {
                    BOOST_CHECK_EQUAL(segment.front(), result.getTurnEndpoint(turn - 1));
                }
                joined.insert(joined.end(), segment.begin() + (turn == 0 ? 0 : 1), segment.end());
                summed += result.getTurnCost(turn);
                // Only a single oversized step may exceed the allowance
                if (result.getTurnCost(turn) > allowance) {
                    BOOST_CHECK_EQUAL(segment.size(), 2u);
                }
            }
            BOOST_CHECK(joined == path);
            BOOST_CHECK_EQUAL(summed, result.getTotalCost());
            BOOST_CHECK_EQUAL(summed, straightPath().getTotalCost());
        }
    }
}

BOOST_AUTO_TEST_CASE(OversizedStepGetsItsOwnTurn) {
    grid.setMovementCost(path[2], 5);
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 3, context);

    BOOST_REQUIRE(result.isSuccess());
    BOOST_CHECK((result.getCostPerTurn() == std::vector<int>{1, 5, 3}));
    BOOST_CHECK((result.getTurnPath(1) == std::vector<CellId>{path[1], path[2]}));
    BOOST_CHECK(result.isTurnAtCapacity(1));
    BOOST_CHECK(!result.isTurnAtCapacity(0));
    BOOST_CHECK(result.isTurnAtCapacity(2));
}

BOOST_AUTO_TEST_CASE(SingleTurnWhenAllowanceCoversPath) {
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 10, context);
    BOOST_REQUIRE(result.isSuccess());
    BOOST_CHECK_EQUAL(result.getTurnsRequired(), 1);
    BOOST_CHECK(result.isSingleTurnPath());
    BOOST_CHECK_CLOSE(result.getAverageMovementEfficiency(), 0.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TrivialPathNeedsNoTurns) {
    PathResult stay = PathResult::createSuccess(path[3], path[3], {path[3]}, 0, 1, 0.0);
    MultiTurnPathResult result = MultiTurnPathResult::createFromSinglePath(grid, stay, 4, context);
    BOOST_REQUIRE(result.isSuccess());
    BOOST_CHECK_EQUAL(result.getTurnsRequired(), 0);
    BOOST_CHECK(result.isSingleTurnPath());
    BOOST_CHECK(result.getRemainingPath(0).empty());
    BOOST_CHECK_EQUAL(result.getAverageMovementEfficiency(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TerrainMultipliersApplyToTurns) {
    for (const CellId cell : path) {
        grid.setTerrain(cell, "Forest");
    }
    context.setTerrainCostMultiplier("Forest", 2.0f);
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 4, context);
    BOOST_REQUIRE(result.isSuccess());
    BOOST_CHECK((result.getCostPerTurn() == std::vector<int>{4, 4, 2}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TurnQueryTests, RowFixture)

BOOST_AUTO_TEST_CASE(RemainingPathAfterCompletedTurns) {
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 2, context);
    BOOST_CHECK(result.getRemainingPath(0) == path);
    BOOST_CHECK((result.getRemainingPath(1) ==
                 std::vector<CellId>{path[2], path[3], path[4], path[5]}));
    BOOST_CHECK((result.getRemainingPath(2) == std::vector<CellId>{path[4], path[5]}));
    BOOST_CHECK(result.getRemainingPath(3).empty());
    BOOST_CHECK(result.getRemainingPath(-1).empty());
}

BOOST_AUTO_TEST_CASE(OutOfRangeTurnsAreNeutral) {
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 2, context);
    BOOST_CHECK(result.getTurnPath(3).empty());
    BOOST_CHECK(result.getTurnPath(-1).empty());
    BOOST_CHECK_EQUAL(result.getTurnCost(7), 0);
    BOOST_CHECK_EQUAL(result.getTurnEndpoint(-2), INVALID_CELL);
    BOOST_CHECK(!result.isTurnAtCapacity(5));
}

BOOST_AUTO_TEST_CASE(EfficiencyIsMeanTurnUsage) {
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 2, context);
    // (2/2 + 2/2 + 1/2) / 3
    BOOST_CHECK_CLOSE(result.getAverageMovementEfficiency(), 2.5f / 3.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(BreakdownListsEveryTurn) {
    MultiTurnPathResult result =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 2, context);
    const std::string breakdown = result.getTurnBreakdown();
    BOOST_CHECK(breakdown.find("Multi-Turn Path: 3 turns, Total Cost: 5") != std::string::npos);
    BOOST_CHECK(breakdown.find("Turn 1: 3 cells, Cost: 2/2, Endpoint: (2, 0)") !=
                std::string::npos);
    BOOST_CHECK(breakdown.find("Turn 3: 2 cells, Cost: 1/2, Endpoint: (5, 0)") !=
                std::string::npos);
    BOOST_CHECK_EQUAL(result.toString(), "MultiTurnPath[3 turns, 6 cells, Cost: 5]");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TurnFailureTests, RowFixture)

BOOST_AUTO_TEST_CASE(NonPositiveAllowanceFails) {
    for (int allowance : {0, -3}) {
        MultiTurnPathResult result =
            MultiTurnPathResult::createFromSinglePath(grid, straightPath(), allowance, context);
        BOOST_CHECK(!result.isSuccess());
        BOOST_CHECK_EQUAL(result.getFailureReason(), FailureReason::INVALID_MOVEMENT_PER_TURN);
        BOOST_CHECK_EQUAL(result.getTurnsRequired(), 0);
    }
}

BOOST_AUTO_TEST_CASE(FailedBasePathPropagatesReason) {
    PathResult failed = PathResult::createFailure(path[0], path[5], FailureReason::GOAL_UNREACHABLE, 9);
    MultiTurnPathResult result = MultiTurnPathResult::createFromSinglePath(grid, failed, 3, context);
    BOOST_CHECK(!result.isSuccess());
    BOOST_CHECK_EQUAL(result.getFailureReason(), FailureReason::GOAL_UNREACHABLE);
    BOOST_CHECK_EQUAL(result.getBasePathResult().getNodesExplored(), 9);
    BOOST_CHECK(result.getRemainingPath(0).empty());
    BOOST_CHECK_EQUAL(result.getTurnBreakdown(), "Path Failed: goal unreachable");
    BOOST_CHECK_EQUAL(result.toString(), "MultiTurnPath[Failed: goal unreachable]");
}

BOOST_AUTO_TEST_CASE(SearchedPathSplitsLikeManualPath) {
    PathResult searched = AStarPathfinding().findPath(grid, path.front(), path.back(), context);
    BOOST_REQUIRE(searched.isSuccess());
    MultiTurnPathResult fromSearch =
        MultiTurnPathResult::createFromSinglePath(grid, searched, 2, context);
    MultiTurnPathResult fromManual =
        MultiTurnPathResult::createFromSinglePath(grid, straightPath(), 2, context);
    BOOST_CHECK(fromSearch.getCostPerTurn() == fromManual.getCostPerTurn());
    BOOST_CHECK(fromSearch.getTurnEndpoints() == fromManual.getTurnEndpoints());
}

BOOST_AUTO_TEST_SUITE_END()
