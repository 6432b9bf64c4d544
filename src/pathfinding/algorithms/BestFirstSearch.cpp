/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/algorithms/BestFirstSearch.hpp"
#include "core/Logger.hpp"
#include "pathfinding/PriorityQueue.hpp"
#include "../internal/SearchSupport.hpp"
#include <algorithm>

namespace HexPath {

using namespace PathfindingInternal;

namespace {
thread_local NodePool t_pool;
thread_local PriorityQueue<CellId, int> t_openSet;
} // namespace

PathResult BestFirstSearch::findPath(const IHexGrid &grid, CellId start,
                                     CellId goal,
                                     const PathfindingContext &context) const {
  SearchTimer timer;
  if (auto early = checkRequest(grid, start, goal, context, timer)) {
    return *early;
  }

  const size_t cellCount = grid.getCellCount();
  NodePool &pool = t_pool;
  pool.reset(cellCount);
  auto &openSet = t_openSet;
  openSet.clear();

  const HexCoord goalCoord = grid.getAxialCoord(goal);
  auto heuristic = [&](CellId cell) {
    return hexDistance(grid.getAxialCoord(cell), goalCoord);
  };

  pool.gCost[start] = 0;
  pool.state[start] = NodeState::Open;
  openSet.push(start, heuristic(start));

  int nodesExplored = 0;
  bool prunedByBudget = false;
  bool nodeLimitHit = false;
  bool cancelled = false;

  while (!openSet.empty()) {
    if (context.isCancellationRequested()) {
      cancelled = true;
      break;
    }
    if (nodesExplored >= context.maxSearchNodes) {
      nodeLimitHit = true;
      break;
    }

    const CellId current = openSet.pop();
    pool.state[current] = NodeState::Closed;
    ++nodesExplored;

    if (current == goal) {
      CostMap costMap;
      CameFromMap cameFrom;
      if (context.storeDiagnosticData) {
        collectDiagnostics(pool, cellCount, costMap, cameFrom);
      }
      return PathResult::createSuccess(
          start, goal, reconstructPath(pool.parent, start, goal),
          pool.gCost[goal], nodesExplored, timer.elapsedMs(),
          std::move(costMap), std::move(cameFrom));
    }

    grid.getNeighbors(current, pool.neighbors);
    for (CellId neighbor : pool.neighbors) {
      if (pool.state[neighbor] == NodeState::Closed ||
          !isTraversable(grid, neighbor, context)) {
        continue;
      }

      const int tentativeG =
          pool.gCost[current] + context.getEffectiveMovementCost(grid, neighbor);
      if (exceedsBudget(context, tentativeG)) {
        prunedByBudget = true;
        continue;
      }
      if (tentativeG >= pool.gCost[neighbor]) {
        continue;
      }

      // The key never changes; a cheaper parent only improves the path cost
      pool.gCost[neighbor] = tentativeG;
      pool.parent[neighbor] = current;
      if (pool.state[neighbor] == NodeState::Unseen) {
        pool.state[neighbor] = NodeState::Open;
        openSet.push(neighbor, heuristic(neighbor));
      }
    }
  }

  if (nodeLimitHit) {
    SEARCH_DEBUG("Best-First reached the node limit of " +
                 std::to_string(context.maxSearchNodes));
  }

  CostMap costMap;
  CameFromMap cameFrom;
  if (context.storeDiagnosticData) {
    collectDiagnostics(pool, cellCount, costMap, cameFrom);
  }
  return PathResult::createFailure(
      start, goal,
      exhaustionReason(grid, start, goal, context, cancelled, nodeLimitHit,
                       prunedByBudget),
      nodesExplored, timer.elapsedMs(), std::move(costMap),
      std::move(cameFrom));
}

bool BestFirstSearch::isReachable(const IHexGrid &grid, CellId start,
                                  CellId goal,
                                  const PathfindingContext &context,
                                  int maxNodes) const {
  PathfindingContext capped = context;
  capped.maxSearchNodes = maxNodes;
  capped.storeDiagnosticData = false;
  return findPath(grid, start, goal, capped).isSuccess();
}

PathResult
BestFirstSearch::findClosestTarget(const IHexGrid &grid, CellId start,
                                   const std::vector<CellId> &targets,
                                   const PathfindingContext &context) const {
  if (!grid.isValidCell(start) || targets.empty()) {
    return PathResult::createFailure(start, INVALID_CELL,
                                     FailureReason::START_OR_GOAL_NULL);
  }

  const HexCoord startCoord = grid.getAxialCoord(start);
  std::vector<CellId> ordered;
  ordered.reserve(targets.size());
  for (CellId target : targets) {
    if (grid.isValidCell(target)) {
      ordered.push_back(target);
    }
  }
  std::stable_sort(ordered.begin(), ordered.end(), [&](CellId a, CellId b) {
    return hexDistance(startCoord, grid.getAxialCoord(a)) <
           hexDistance(startCoord, grid.getAxialCoord(b));
  });

  PathResult lastFailure = PathResult::createFailure(
      start, INVALID_CELL, FailureReason::START_OR_GOAL_NULL);
  for (CellId target : ordered) {
    PathResult result = findPath(grid, start, target, context);
    if (result.isSuccess()) {
      return result;
    }
    lastFailure = std::move(result);
  }
  return lastFailure;
}

} // namespace HexPath
