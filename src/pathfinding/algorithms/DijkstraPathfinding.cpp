/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/algorithms/DijkstraPathfinding.hpp"
#include "core/Logger.hpp"
#include "pathfinding/PriorityQueue.hpp"
#include "../internal/SearchSupport.hpp"
#include <algorithm>
#include <sstream>

namespace HexPath {

using namespace PathfindingInternal;

namespace {
thread_local NodePool t_pool;
thread_local PriorityQueue<CellId, int> t_openSet;
} // namespace

int DijkstraResult::getCost(CellId cell) const {
  auto it = distances.find(cell);
  return it != distances.end() ? it->second : -1;
}

std::vector<CellId> DijkstraResult::extractPath(CellId target) const {
  if (!isReachable(target)) {
    return {};
  }

  std::vector<CellId> path{target};
  CellId current = target;
  while (current != startCell) {
    auto it = cameFrom.find(current);
    if (it == cameFrom.end() || path.size() > distances.size()) {
      return {};
    }
    current = it->second;
    path.push_back(current);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

std::string DijkstraResult::toString() const {
  std::ostringstream oss;
  if (!success) {
    oss << "Dijkstra Failed: " << failureReason;
    return oss.str();
  }
  oss << "Dijkstra: " << distances.size() << " cells reached, Explored: "
      << nodesExplored << " nodes" << (truncated ? " (truncated)" : "")
      << ", Time: " << computationTimeMs << "ms";
  return oss.str();
}

DijkstraResult
DijkstraPathfinding::findAllPaths(const IHexGrid &grid, CellId start,
                                  const PathfindingContext &context) const {
  SearchTimer timer;
  DijkstraResult result;
  result.startCell = start;

  if (!grid.isValidCell(start)) {
    result.failureReason = FailureReason::START_OR_GOAL_NULL;
    return result;
  }

  const size_t cellCount = grid.getCellCount();
  NodePool &pool = t_pool;
  pool.reset(cellCount);
  auto &openSet = t_openSet;
  openSet.clear();

  pool.gCost[start] = 0;
  pool.state[start] = NodeState::Open;
  openSet.push(start, 0);

  while (!openSet.empty()) {
    if (context.isCancellationRequested()) {
      result.cancelled = true;
      break;
    }
    if (result.nodesExplored >= context.maxSearchNodes) {
      result.truncated = true;
      break;
    }

    const CellId current = openSet.pop();
    pool.state[current] = NodeState::Closed;
    ++result.nodesExplored;

    result.settledOrder.push_back(current);
    result.distances.emplace(current, pool.gCost[current]);
    if (current != start) {
      result.cameFrom.emplace(current, pool.parent[current]);
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
        result.prunedByBudget = true;
        continue;
      }
      if (tentativeG >= pool.gCost[neighbor]) {
        continue;
      }

      pool.gCost[neighbor] = tentativeG;
      pool.parent[neighbor] = current;
      pool.state[neighbor] = NodeState::Open;
      openSet.push(neighbor, tentativeG);
    }
  }

  if (result.cancelled) {
    result.failureReason = FailureReason::CANCELLED;
  } else {
    result.success = true;
  }
  result.computationTimeMs = timer.elapsedMs();
  return result;
}

PathResult
DijkstraPathfinding::extractResult(const IHexGrid &grid,
                                   const DijkstraResult &tree, CellId goal,
                                   const PathfindingContext &context) const {
  const CellId start = tree.startCell;

  if (!tree.isReachable(goal)) {
    const char *reason =
        exhaustionReason(grid, start, goal, context, tree.cancelled,
                         tree.truncated, tree.prunedByBudget);
    if (tree.truncated) {
      SEARCH_WARN("Dijkstra reached the node limit of " +
                  std::to_string(context.maxSearchNodes) + " before the goal");
    }
    return PathResult::createFailure(
        start, goal, reason, tree.nodesExplored, tree.computationTimeMs,
        context.storeDiagnosticData ? tree.distances : CostMap{},
        context.storeDiagnosticData ? tree.cameFrom : CameFromMap{});
  }

  return PathResult::createSuccess(
      start, goal, tree.extractPath(goal), tree.getCost(goal),
      tree.nodesExplored, tree.computationTimeMs,
      context.storeDiagnosticData ? tree.distances : CostMap{},
      context.storeDiagnosticData ? tree.cameFrom : CameFromMap{});
}

PathResult DijkstraPathfinding::findPath(const IHexGrid &grid, CellId start,
                                         CellId goal,
                                         const PathfindingContext &context) const {
  SearchTimer timer;
  if (auto early = checkRequest(grid, start, goal, context, timer)) {
    return *early;
  }

  DijkstraResult tree = findAllPaths(grid, start, context);
  return extractResult(grid, tree, goal, context);
}

std::vector<CellId> DijkstraPathfinding::getCellsWithinDistance(
    const IHexGrid &grid, CellId start, int maxDistance,
    const PathfindingContext &context) const {
  if (maxDistance < 0) {
    return {};
  }

  PathfindingContext limited = context;
  if (!limited.hasMovementLimit() || maxDistance < limited.maxMovementPoints) {
    limited.maxMovementPoints = maxDistance;
  }
  return findAllPaths(grid, start, limited).settledOrder;
}

std::map<CellId, PathResult> DijkstraPathfinding::findPathsToMultipleGoals(
    const IHexGrid &grid, CellId start, const std::vector<CellId> &goals,
    const PathfindingContext &context) const {
  std::map<CellId, PathResult> results;
  if (goals.empty()) {
    return results;
  }

  // Diagnostics would copy the whole tree into every result
  PathfindingContext quiet = context;
  quiet.storeDiagnosticData = false;

  DijkstraResult tree = findAllPaths(grid, start, quiet);
  SearchTimer timer;
  for (CellId goal : goals) {
    if (auto early = checkRequest(grid, start, goal, quiet, timer)) {
      results.emplace(goal, std::move(*early));
      continue;
    }
    results.emplace(goal, extractResult(grid, tree, goal, quiet));
  }
  return results;
}

} // namespace HexPath
