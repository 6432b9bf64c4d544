/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "SearchSupport.hpp"
#include <algorithm>
#include <deque>

namespace HexPath::PathfindingInternal {

std::optional<PathResult> checkRequest(const IHexGrid &grid, CellId start,
                                       CellId goal,
                                       const PathfindingContext &context,
                                       const SearchTimer &timer) {
  if (!grid.isValidCell(start) || !grid.isValidCell(goal)) {
    return PathResult::createFailure(start, goal,
                                     FailureReason::START_OR_GOAL_NULL, 0,
                                     timer.elapsedMs());
  }

  if (start == goal) {
    return PathResult::createSuccess(start, goal, {start}, 0, 1,
                                     timer.elapsedMs());
  }

  if (!isTraversable(grid, goal, context)) {
    return PathResult::createFailure(start, goal,
                                     FailureReason::GOAL_NOT_TRAVERSABLE, 0,
                                     timer.elapsedMs());
  }

  return std::nullopt;
}

const char *exhaustionReason(const IHexGrid &grid, CellId start, CellId goal,
                             const PathfindingContext &context, bool cancelled,
                             bool nodeLimitHit, bool prunedByBudget) {
  if (cancelled) {
    return FailureReason::CANCELLED;
  }
  if (nodeLimitHit) {
    return FailureReason::NODE_BUDGET_EXCEEDED;
  }
  if (prunedByBudget && isConnected(grid, start, goal, context)) {
    return FailureReason::MOVEMENT_BUDGET_EXCEEDED;
  }
  return FailureReason::GOAL_UNREACHABLE;
}

bool isConnected(const IHexGrid &grid, CellId start, CellId goal,
                 const PathfindingContext &context) {
  if (!grid.isValidCell(start) || !grid.isValidCell(goal)) {
    return false;
  }
  if (start == goal) {
    return true;
  }

  // Runs on the failure path only; the search pool may still be in use
  std::vector<bool> seen(grid.getCellCount(), false);
  std::deque<CellId> frontier;
  NeighborList neighbors;
  seen[start] = true;
  frontier.push_back(start);

  while (!frontier.empty()) {
    const CellId current = frontier.front();
    frontier.pop_front();
    grid.getNeighbors(current, neighbors);
    for (CellId neighbor : neighbors) {
      if (seen[neighbor] || !isTraversable(grid, neighbor, context)) {
        continue;
      }
      if (neighbor == goal) {
        return true;
      }
      seen[neighbor] = true;
      frontier.push_back(neighbor);
    }
  }
  return false;
}

std::vector<CellId> reconstructPath(const std::vector<CellId> &parent,
                                    CellId start, CellId goal) {
  std::vector<CellId> path;
  CellId current = goal;
  // Parent chains are acyclic; the bound guards against corrupted input
  const size_t limit = parent.size() + 1;

  while (current != INVALID_CELL && path.size() <= limit) {
    path.push_back(current);
    if (current == start) {
      std::reverse(path.begin(), path.end());
      return path;
    }
    current = parent[current];
  }
  return {};
}

void collectDiagnostics(const NodePool &pool, size_t cellCount,
                        CostMap &costMap, CameFromMap &cameFrom) {
  for (size_t i = 0; i < cellCount; ++i) {
    if (pool.gCost[i] == INFINITE_COST) {
      continue;
    }
    CellId cell = static_cast<CellId>(i);
    costMap.emplace(cell, pool.gCost[i]);
    if (pool.parent[i] != INVALID_CELL) {
      cameFrom.emplace(cell, pool.parent[i]);
    }
  }
}

} // namespace HexPath::PathfindingInternal
