/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/algorithms/AStarPathfinding.hpp"
#include "core/Logger.hpp"
#include "pathfinding/PriorityQueue.hpp"
#include "../internal/SearchSupport.hpp"

namespace HexPath {

using namespace PathfindingInternal;

namespace {
// Per-thread scratch so concurrent searches never share node state
thread_local NodePool t_pool;
thread_local PriorityQueue<CellId, SearchKey> t_openSet;
} // namespace

int AStarPathfinding::calculateHeuristic(const IHexGrid &grid, CellId from,
                                         CellId to) {
  return hexDistance(grid.getAxialCoord(from), grid.getAxialCoord(to));
}

PathResult AStarPathfinding::findPath(const IHexGrid &grid, CellId start,
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
  const int startH = heuristic(start);
  openSet.push(start, SearchKey{startH, startH});

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

      pool.gCost[neighbor] = tentativeG;
      pool.parent[neighbor] = current;
      pool.state[neighbor] = NodeState::Open;
      const int h = heuristic(neighbor);
      openSet.push(neighbor, SearchKey{tentativeG + h, h});
    }
  }

  const char *reason = exhaustionReason(grid, start, goal, context, cancelled,
                                        nodeLimitHit, prunedByBudget);
  if (nodeLimitHit) {
    SEARCH_WARN("A* reached the node limit of " +
                std::to_string(context.maxSearchNodes) + " before the goal");
  }

  CostMap costMap;
  CameFromMap cameFrom;
  if (context.storeDiagnosticData) {
    collectDiagnostics(pool, cellCount, costMap, cameFrom);
  }
  return PathResult::createFailure(start, goal, reason, nodesExplored,
                                   timer.elapsedMs(), std::move(costMap),
                                   std::move(cameFrom));
}

} // namespace HexPath
