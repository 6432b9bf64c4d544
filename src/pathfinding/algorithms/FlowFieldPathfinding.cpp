/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/algorithms/FlowFieldPathfinding.hpp"
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

int FlowField::getCostToGoal(CellId cell) const {
  auto it = m_costs.find(cell);
  return it != m_costs.end() ? it->second : -1;
}

CellId FlowField::getNextCell(CellId cell) const {
  auto it = m_next.find(cell);
  return it != m_next.end() ? it->second : INVALID_CELL;
}

std::vector<CellId> FlowField::getPathFrom(CellId cell) const {
  if (!isReachable(cell)) {
    return {};
  }

  std::vector<CellId> path{cell};
  CellId current = cell;
  while (current != m_goal) {
    current = getNextCell(current);
    // Dead end or a cycle; neither occurs in a correctly built field
    if (current == INVALID_CELL || path.size() > m_costs.size()) {
      return {};
    }
    path.push_back(current);
  }
  return path;
}

std::vector<CellId> FlowField::getReachableCells() const {
  std::vector<CellId> cells;
  cells.reserve(m_costs.size());
  for (const auto &[cell, cost] : m_costs) {
    cells.push_back(cell);
  }
  std::sort(cells.begin(), cells.end(), [this](CellId a, CellId b) {
    int costA = m_costs.at(a);
    int costB = m_costs.at(b);
    return costA != costB ? costA < costB : a < b;
  });
  return cells;
}

std::string FlowField::toString() const {
  std::ostringstream oss;
  if (!isValid()) {
    oss << "FlowField[Failed: " << m_failureReason << "]";
    return oss.str();
  }
  oss << "FlowField[" << m_costs.size() << " cells, Max Cost: " << m_maxCost
      << ", Processed: " << m_nodesProcessed
      << (m_truncated ? ", truncated" : "") << "]";
  return oss.str();
}

FlowField FlowFieldPathfinding::generateFlowField(
    const IHexGrid &grid, CellId goal, const PathfindingContext &context,
    int maxDistance) const {
  return buildField(grid, goal, context, maxDistance, INVALID_CELL);
}

FlowField FlowFieldPathfinding::buildField(const IHexGrid &grid, CellId goal,
                                           const PathfindingContext &context,
                                           int maxDistance,
                                           CellId exemptCell) const {
  SearchTimer timer;
  FlowField field;
  field.m_goal = goal;

  if (!grid.isValidCell(goal)) {
    field.m_failureReason = FailureReason::START_OR_GOAL_NULL;
    return field;
  }
  if (context.isObstacle(grid, goal)) {
    field.m_failureReason = FailureReason::GOAL_NOT_TRAVERSABLE;
    return field;
  }

  PathfindingContext limits = context;
  if (maxDistance >= 0 &&
      (!limits.hasMovementLimit() || maxDistance < limits.maxMovementPoints)) {
    limits.maxMovementPoints = maxDistance;
  }

  const size_t cellCount = grid.getCellCount();
  NodePool &pool = t_pool;
  pool.reset(cellCount);
  auto &openSet = t_openSet;
  openSet.clear();

  pool.gCost[goal] = 0;
  pool.state[goal] = NodeState::Open;
  openSet.push(goal, 0);

  while (!openSet.empty()) {
    if (context.isCancellationRequested()) {
      field.m_cancelled = true;
      break;
    }
    if (field.m_nodesProcessed >= context.maxSearchNodes) {
      field.m_truncated = true;
      break;
    }

    const CellId current = openSet.pop();
    pool.state[current] = NodeState::Closed;
    ++field.m_nodesProcessed;

    // Every neighbor that steps onto current pays current's cost
    const int enterCost = context.getEffectiveMovementCost(grid, current);

    grid.getNeighbors(current, pool.neighbors);
    for (CellId neighbor : pool.neighbors) {
      if (pool.state[neighbor] == NodeState::Closed) {
        continue;
      }

      bool leafOnly = false;
      if (!isTraversable(grid, neighbor, context)) {
        if (neighbor != exemptCell &&
            !context.isBlockedOnlyByOccupant(grid, neighbor)) {
          continue;
        }
        leafOnly = true;
      }

      const int cost = pool.gCost[current] + enterCost;
      if (exceedsBudget(limits, cost)) {
        field.m_prunedByBudget = true;
        continue;
      }
      if (cost >= pool.gCost[neighbor]) {
        continue;
      }

      pool.gCost[neighbor] = cost;
      pool.parent[neighbor] = current;
      if (!leafOnly) {
        pool.state[neighbor] = NodeState::Open;
        openSet.push(neighbor, cost);
      }
    }
  }

  // Truncation leaves open cells whose costs are not final; keep settled ones
  for (size_t i = 0; i < cellCount; ++i) {
    const CellId cell = static_cast<CellId>(i);
    if (pool.gCost[i] == INFINITE_COST) {
      continue;
    }
    if (pool.state[i] == NodeState::Open) {
      continue;
    }
    if (pool.state[i] == NodeState::Unseen) {
      // Leaf: only valid when its successor was settled
      CellId next = pool.parent[i];
      if (next == INVALID_CELL || pool.state[next] != NodeState::Closed) {
        continue;
      }
    }
    field.m_costs.emplace(cell, pool.gCost[i]);
    field.m_maxCost = std::max(field.m_maxCost, pool.gCost[i]);
    if (pool.parent[i] != INVALID_CELL) {
      field.m_next.emplace(cell, pool.parent[i]);
    }
  }

  if (field.m_cancelled) {
    field.m_failureReason = FailureReason::CANCELLED;
  }
  field.m_generationTimeMs = timer.elapsedMs();
  return field;
}

PathResult
FlowFieldPathfinding::findPath(const IHexGrid &grid, CellId start,
                               CellId goal,
                               const PathfindingContext &context) const {
  SearchTimer timer;
  if (auto early = checkRequest(grid, start, goal, context, timer)) {
    return *early;
  }

  FlowField field = buildField(grid, goal, context, -1, start);

  CostMap costMap;
  if (context.storeDiagnosticData) {
    costMap.insert(field.m_costs.begin(), field.m_costs.end());
  }

  std::vector<CellId> path = field.getPathFrom(start);
  if (path.empty() || field.wasCancelled()) {
    if (field.wasTruncated()) {
      SEARCH_WARN("FlowField reached the node limit of " +
                  std::to_string(context.maxSearchNodes) + " before the start");
    }
    return PathResult::createFailure(
        start, goal,
        exhaustionReason(grid, start, goal, context, field.wasCancelled(),
                         field.wasTruncated(), field.wasPrunedByBudget()),
        field.getNodesProcessed(), timer.elapsedMs(), std::move(costMap));
  }

  // The field points toward the goal; cameFrom points back toward the start
  CameFromMap cameFrom;
  if (context.storeDiagnosticData) {
    for (size_t i = 1; i < path.size(); ++i) {
      cameFrom.emplace(path[i], path[i - 1]);
    }
  }

  return PathResult::createSuccess(start, goal, std::move(path),
                                   field.getCostToGoal(start),
                                   field.getNodesProcessed(), timer.elapsedMs(),
                                   std::move(costMap), std::move(cameFrom));
}

} // namespace HexPath
