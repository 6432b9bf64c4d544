/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/algorithms/BidirectionalAStar.hpp"
#include "core/Logger.hpp"
#include "pathfinding/PriorityQueue.hpp"
#include "../internal/SearchSupport.hpp"

namespace HexPath {

using namespace PathfindingInternal;

namespace {
thread_local NodePool t_forwardPool;
thread_local NodePool t_backwardPool;
thread_local PriorityQueue<CellId, SearchKey> t_forwardOpen;
thread_local PriorityQueue<CellId, SearchKey> t_backwardOpen;

int smallestF(const PriorityQueue<CellId, SearchKey> &openSet) {
  return openSet.empty() ? INFINITE_COST : openSet.topPriority().f;
}
} // namespace

PathResult BidirectionalAStar::findPath(const IHexGrid &grid, CellId start,
                                        CellId goal,
                                        const PathfindingContext &context) const {
  SearchTimer timer;
  if (auto early = checkRequest(grid, start, goal, context, timer)) {
    return *early;
  }

  const size_t cellCount = grid.getCellCount();
  NodePool &forward = t_forwardPool;
  NodePool &backward = t_backwardPool;
  forward.reset(cellCount);
  backward.reset(cellCount);
  auto &forwardOpen = t_forwardOpen;
  auto &backwardOpen = t_backwardOpen;
  forwardOpen.clear();
  backwardOpen.clear();

  const HexCoord startCoord = grid.getAxialCoord(start);
  const HexCoord goalCoord = grid.getAxialCoord(goal);
  auto toGoal = [&](CellId cell) {
    return hexDistance(grid.getAxialCoord(cell), goalCoord);
  };
  auto toStart = [&](CellId cell) {
    return hexDistance(grid.getAxialCoord(cell), startCoord);
  };

  forward.gCost[start] = 0;
  forward.state[start] = NodeState::Open;
  forwardOpen.push(start, SearchKey{toGoal(start), toGoal(start)});

  backward.gCost[goal] = 0;
  backward.state[goal] = NodeState::Open;
  backwardOpen.push(goal, SearchKey{toStart(goal), toStart(goal)});

  int bestCost = INFINITE_COST;
  CellId meetingCell = INVALID_CELL;
  auto updateMeeting = [&](CellId cell) {
    if (forward.gCost[cell] == INFINITE_COST ||
        backward.gCost[cell] == INFINITE_COST) {
      return;
    }
    const int total = forward.gCost[cell] + backward.gCost[cell];
    if (total < bestCost) {
      bestCost = total;
      meetingCell = cell;
    }
  };

  int nodesExplored = 0;
  bool prunedByBudget = false;
  bool nodeLimitHit = false;
  bool cancelled = false;
  bool expandForward = true;

  while (true) {
    if (context.isCancellationRequested()) {
      cancelled = true;
      break;
    }

    // Each frontier's smallest F bounds every undiscovered path from below
    const int forwardMin = smallestF(forwardOpen);
    const int backwardMin = smallestF(backwardOpen);
    if (forwardMin >= bestCost || backwardMin >= bestCost) {
      break;
    }

    if (nodesExplored >= context.maxSearchNodes) {
      nodeLimitHit = true;
      break;
    }

    if (expandForward) {
      const CellId current = forwardOpen.pop();
      forward.state[current] = NodeState::Closed;
      ++nodesExplored;

      grid.getNeighbors(current, forward.neighbors);
      for (CellId neighbor : forward.neighbors) {
        if (forward.state[neighbor] == NodeState::Closed ||
            !isTraversable(grid, neighbor, context)) {
          continue;
        }

        const int tentativeG = forward.gCost[current] +
                               context.getEffectiveMovementCost(grid, neighbor);
        if (exceedsBudget(context, tentativeG)) {
          prunedByBudget = true;
          continue;
        }
        if (tentativeG >= forward.gCost[neighbor]) {
          continue;
        }

        forward.gCost[neighbor] = tentativeG;
        forward.parent[neighbor] = current;
        forward.state[neighbor] = NodeState::Open;
        const int h = toGoal(neighbor);
        forwardOpen.push(neighbor, SearchKey{tentativeG + h, h});
        updateMeeting(neighbor);
      }
    } else {
      const CellId current = backwardOpen.pop();
      backward.state[current] = NodeState::Closed;
      ++nodesExplored;

      // Backward edges enter current; the start is never entered
      if (current != start) {
        const int enterCost = context.getEffectiveMovementCost(grid, current);
        grid.getNeighbors(current, backward.neighbors);
        for (CellId neighbor : backward.neighbors) {
          if (backward.state[neighbor] == NodeState::Closed ||
              (neighbor != start && !isTraversable(grid, neighbor, context))) {
            continue;
          }

          const int tentativeG = backward.gCost[current] + enterCost;
          if (exceedsBudget(context, tentativeG)) {
            prunedByBudget = true;
            continue;
          }
          if (tentativeG >= backward.gCost[neighbor]) {
            continue;
          }

          backward.gCost[neighbor] = tentativeG;
          backward.parent[neighbor] = current;
          backward.state[neighbor] = NodeState::Open;
          const int h = toStart(neighbor);
          backwardOpen.push(neighbor, SearchKey{tentativeG + h, h});
          updateMeeting(neighbor);
        }
      }
    }

    expandForward = !expandForward;
  }

  CostMap costMap;
  CameFromMap cameFrom;
  if (context.storeDiagnosticData) {
    collectDiagnostics(forward, cellCount, costMap, cameFrom);
  }

  // A meeting found before the frontiers proved it cheapest is not returned
  if (meetingCell == INVALID_CELL || cancelled || nodeLimitHit) {
    if (nodeLimitHit) {
      SEARCH_WARN("Bidirectional A* reached the node limit of " +
                  std::to_string(context.maxSearchNodes) +
                  (meetingCell == INVALID_CELL ? " before meeting"
                                               : " before proving the meeting"));
    }
    return PathResult::createFailure(
        start, goal,
        exhaustionReason(grid, start, goal, context, cancelled, nodeLimitHit,
                         prunedByBudget),
        nodesExplored, timer.elapsedMs(), std::move(costMap),
        std::move(cameFrom));
  }

  // Both halves fit the budget but the joined path may not
  if (exceedsBudget(context, bestCost)) {
    return PathResult::createFailure(start, goal,
                                     FailureReason::MOVEMENT_BUDGET_EXCEEDED,
                                     nodesExplored, timer.elapsedMs(),
                                     std::move(costMap), std::move(cameFrom));
  }

  std::vector<CellId> path = reconstructPath(forward.parent, start, meetingCell);
  for (CellId cell = backward.parent[meetingCell]; cell != INVALID_CELL;
       cell = backward.parent[cell]) {
    path.push_back(cell);
  }

  return PathResult::createSuccess(start, goal, std::move(path), bestCost,
                                   nodesExplored, timer.elapsedMs(),
                                   std::move(costMap), std::move(cameFrom));
}

} // namespace HexPath
