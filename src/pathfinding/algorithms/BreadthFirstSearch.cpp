/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/algorithms/BreadthFirstSearch.hpp"
#include "core/Logger.hpp"
#include "../internal/SearchSupport.hpp"
#include <boost/container/flat_set.hpp>
#include <deque>

namespace HexPath {

using namespace PathfindingInternal;

namespace {
thread_local NodePool t_pool;
thread_local std::deque<CellId> t_frontier;

struct BreadthFirstRun {
  CellId found{INVALID_CELL};
  std::vector<CellId> visitOrder;
  int nodesExplored{0};
  bool prunedByBudget{false};
  bool nodeLimitHit{false};
  bool cancelled{false};
};

/**
 * Expands cells in step order until isTarget accepts a dequeued cell.
 * maxSteps < 0 means unlimited; maxVisited == 0 means no cap on visited
 * cells. Step counts and parents are left in the thread's pool.
 */
template <typename TargetPredicate>
BreadthFirstRun runBreadthFirst(const IHexGrid &grid, CellId start,
                                const PathfindingContext &context, int maxSteps,
                                size_t maxVisited, TargetPredicate isTarget) {
  BreadthFirstRun run;
  NodePool &pool = t_pool;
  pool.reset(grid.getCellCount());
  auto &frontier = t_frontier;
  frontier.clear();

  pool.gCost[start] = 0;
  pool.state[start] = NodeState::Open;
  frontier.push_back(start);

  while (!frontier.empty()) {
    if (context.isCancellationRequested()) {
      run.cancelled = true;
      break;
    }
    if (run.nodesExplored >= context.maxSearchNodes) {
      run.nodeLimitHit = true;
      break;
    }

    const CellId current = frontier.front();
    frontier.pop_front();
    pool.state[current] = NodeState::Closed;
    ++run.nodesExplored;
    run.visitOrder.push_back(current);

    if (isTarget(current)) {
      run.found = current;
      break;
    }
    if (maxVisited > 0 && run.visitOrder.size() >= maxVisited) {
      break;
    }

    grid.getNeighbors(current, pool.neighbors);
    for (CellId neighbor : pool.neighbors) {
      if (pool.state[neighbor] != NodeState::Unseen ||
          !isTraversable(grid, neighbor, context)) {
        continue;
      }

      const int steps = pool.gCost[current] + 1;
      if (maxSteps >= 0 && steps > maxSteps) {
        run.prunedByBudget = true;
        continue;
      }

      pool.gCost[neighbor] = steps;
      pool.parent[neighbor] = current;
      pool.state[neighbor] = NodeState::Open;
      frontier.push_back(neighbor);
    }
  }

  return run;
}

PathResult buildResult(const IHexGrid &grid, CellId start, CellId goal,
                       const BreadthFirstRun &run,
                       const PathfindingContext &context,
                       const SearchTimer &timer) {
  CostMap costMap;
  CameFromMap cameFrom;
  if (context.storeDiagnosticData) {
    collectDiagnostics(t_pool, grid.getCellCount(), costMap, cameFrom);
  }

  if (run.found == INVALID_CELL) {
    return PathResult::createFailure(
        start, goal,
        exhaustionReason(grid, start, goal, context, run.cancelled,
                         run.nodeLimitHit, run.prunedByBudget),
        run.nodesExplored, timer.elapsedMs(), std::move(costMap),
        std::move(cameFrom));
  }

  std::vector<CellId> path = reconstructPath(t_pool.parent, start, run.found);
  const int steps = static_cast<int>(path.size()) - 1;
  return PathResult::createSuccess(start, run.found, std::move(path), steps,
                                   run.nodesExplored, timer.elapsedMs(),
                                   std::move(costMap), std::move(cameFrom));
}
} // namespace

PathResult BreadthFirstSearch::findPath(const IHexGrid &grid, CellId start,
                                        CellId goal,
                                        const PathfindingContext &context) const {
  SearchTimer timer;
  if (auto early = checkRequest(grid, start, goal, context, timer)) {
    return *early;
  }

  BreadthFirstRun run =
      runBreadthFirst(grid, start, context, context.maxMovementPoints, 0,
                      [goal](CellId cell) { return cell == goal; });
  if (run.nodeLimitHit) {
    SEARCH_WARN("BFS reached the node limit of " +
                std::to_string(context.maxSearchNodes) + " before the goal");
  }
  return buildResult(grid, start, goal, run, context, timer);
}

std::vector<CellId>
BreadthFirstSearch::getCellsWithinSteps(const IHexGrid &grid, CellId start,
                                        int maxSteps,
                                        const PathfindingContext &context) const {
  if (!grid.isValidCell(start) || maxSteps < 0) {
    return {};
  }
  return runBreadthFirst(grid, start, context, maxSteps, 0,
                         [](CellId) { return false; })
      .visitOrder;
}

PathResult
BreadthFirstSearch::findClosestTarget(const IHexGrid &grid, CellId start,
                                      const std::vector<CellId> &targets,
                                      const PathfindingContext &context) const {
  SearchTimer timer;
  if (!grid.isValidCell(start) || targets.empty()) {
    return PathResult::createFailure(start, INVALID_CELL,
                                     FailureReason::START_OR_GOAL_NULL, 0,
                                     timer.elapsedMs());
  }

  boost::container::flat_set<CellId> targetSet(targets.begin(), targets.end());
  BreadthFirstRun run = runBreadthFirst(
      grid, start, context, context.maxMovementPoints, 0,
      [&targetSet](CellId cell) { return targetSet.count(cell) > 0; });
  return buildResult(grid, start, run.found, run, context, timer);
}

std::vector<CellId>
BreadthFirstSearch::floodFill(const IHexGrid &grid, CellId start,
                              size_t maxCells,
                              const PathfindingContext &context) const {
  if (!grid.isValidCell(start) || maxCells == 0) {
    return {};
  }
  return runBreadthFirst(grid, start, context, -1, maxCells,
                         [](CellId) { return false; })
      .visitOrder;
}

std::unordered_map<CellId, int>
BreadthFirstSearch::getDistanceMap(const IHexGrid &grid, CellId start,
                                   const PathfindingContext &context,
                                   int maxSteps) const {
  std::unordered_map<CellId, int> distances;
  if (!grid.isValidCell(start)) {
    return distances;
  }

  BreadthFirstRun run = runBreadthFirst(grid, start, context, maxSteps, 0,
                                        [](CellId) { return false; });
  distances.reserve(run.visitOrder.size());
  for (CellId cell : run.visitOrder) {
    distances.emplace(cell, t_pool.gCost[cell]);
  }
  return distances;
}

} // namespace HexPath
