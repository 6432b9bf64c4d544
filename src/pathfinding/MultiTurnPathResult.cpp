/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/MultiTurnPathResult.hpp"
#include <sstream>

namespace HexPath {

MultiTurnPathResult MultiTurnPathResult::createFailure(CellId start,
                                                       CellId goal,
                                                       std::string failureReason,
                                                       int movementPerTurn,
                                                       PathResult basePath) {
  MultiTurnPathResult result;
  result.m_success = false;
  result.m_startCell = start;
  result.m_goalCell = goal;
  result.m_failureReason = std::move(failureReason);
  result.m_movementPerTurn = movementPerTurn;
  result.m_basePathResult = std::move(basePath);
  return result;
}

MultiTurnPathResult MultiTurnPathResult::createFromSinglePath(
    const IHexGrid &grid, const PathResult &basePath, int movementPerTurn,
    const PathfindingContext &context, bool costInSteps) {
  const CellId start = basePath.getStartCell();
  const CellId goal = basePath.getGoalCell();

  if (movementPerTurn <= 0) {
    return createFailure(start, goal, FailureReason::INVALID_MOVEMENT_PER_TURN,
                         movementPerTurn, basePath);
  }
  if (!basePath.isSuccess() || basePath.isEmpty()) {
    std::string reason = basePath.getFailureReason().empty()
                             ? std::string(FailureReason::GOAL_UNREACHABLE)
                             : basePath.getFailureReason();
    return createFailure(start, goal, std::move(reason), movementPerTurn,
                         basePath);
  }

  MultiTurnPathResult result;
  result.m_success = true;
  result.m_startCell = start;
  result.m_goalCell = goal;
  result.m_movementPerTurn = movementPerTurn;
  result.m_completePath = basePath.getPath();
  result.m_basePathResult = basePath;

  const auto &path = result.m_completePath;

  auto closeTurn = [&](std::vector<CellId> &&segment, int cost) {
    result.m_turnEndpoints.push_back(segment.back());
    result.m_turnEndpointCoords.push_back(grid.getOffsetCoord(segment.back()));
    result.m_pathPerTurn.push_back(std::move(segment));
    result.m_costPerTurn.push_back(cost);
    result.m_totalCost += cost;
  };

  std::vector<CellId> segment{path.front()};
  int segmentCost = 0;

  for (size_t i = 1; i < path.size(); ++i) {
    const int stepCost =
        costInSteps ? 1 : context.getEffectiveMovementCost(grid, path[i]);

    if (segment.size() > 1 && segmentCost + stepCost > movementPerTurn) {
      CellId resumeFrom = segment.back();
      closeTurn(std::move(segment), segmentCost);
      segment = {resumeFrom};
      segmentCost = 0;
    }

    segment.push_back(path[i]);
    segmentCost += stepCost;
  }

  // A path that never leaves the start needs no turns
  if (segment.size() > 1) {
    closeTurn(std::move(segment), segmentCost);
  }

  result.m_turnsRequired = static_cast<int>(result.m_pathPerTurn.size());
  return result;
}

std::vector<CellId> MultiTurnPathResult::getTurnPath(int turnIndex) const {
  if (turnIndex < 0 || turnIndex >= m_turnsRequired) {
    return {};
  }
  return m_pathPerTurn[static_cast<size_t>(turnIndex)];
}

int MultiTurnPathResult::getTurnCost(int turnIndex) const {
  if (turnIndex < 0 || turnIndex >= m_turnsRequired) {
    return 0;
  }
  return m_costPerTurn[static_cast<size_t>(turnIndex)];
}

CellId MultiTurnPathResult::getTurnEndpoint(int turnIndex) const {
  if (turnIndex < 0 || turnIndex >= m_turnsRequired) {
    return INVALID_CELL;
  }
  return m_turnEndpoints[static_cast<size_t>(turnIndex)];
}

std::vector<CellId> MultiTurnPathResult::getRemainingPath(
    int completedTurns) const {
  if (!m_success || completedTurns < 0 || completedTurns >= m_turnsRequired) {
    return {};
  }

  std::vector<CellId> remaining;
  for (size_t i = static_cast<size_t>(completedTurns); i < m_pathPerTurn.size();
       ++i) {
    const auto &turn = m_pathPerTurn[i];
    // Continuation turns repeat the previous endpoint
    size_t first = (i == static_cast<size_t>(completedTurns)) ? 0 : 1;
    remaining.insert(remaining.end(), turn.begin() + first, turn.end());
  }
  return remaining;
}

float MultiTurnPathResult::getAverageMovementEfficiency() const {
  if (!m_success || m_turnsRequired == 0) {
    return 0.0f;
  }

  float totalEfficiency = 0.0f;
  for (int cost : m_costPerTurn) {
    totalEfficiency +=
        static_cast<float>(cost) / static_cast<float>(m_movementPerTurn);
  }
  return totalEfficiency / static_cast<float>(m_turnsRequired);
}

bool MultiTurnPathResult::isTurnAtCapacity(int turnIndex) const {
  if (turnIndex < 0 || turnIndex >= m_turnsRequired) {
    return false;
  }
  return m_costPerTurn[static_cast<size_t>(turnIndex)] >= m_movementPerTurn;
}

std::string MultiTurnPathResult::getTurnBreakdown() const {
  if (!m_success) {
    return "Path Failed: " + m_failureReason;
  }

  std::ostringstream oss;
  oss << "Multi-Turn Path: " << m_turnsRequired
      << " turns, Total Cost: " << m_totalCost << "\n";
  for (size_t i = 0; i < m_pathPerTurn.size(); ++i) {
    oss << "  Turn " << (i + 1) << ": " << m_pathPerTurn[i].size()
        << " cells, Cost: " << m_costPerTurn[i] << "/" << m_movementPerTurn
        << ", Endpoint: " << m_turnEndpointCoords[i] << "\n";
  }
  return oss.str();
}

std::string MultiTurnPathResult::toString() const {
  if (!m_success) {
    return "MultiTurnPath[Failed: " + m_failureReason + "]";
  }
  return "MultiTurnPath[" + std::to_string(m_turnsRequired) + " turns, " +
         std::to_string(m_completePath.size()) +
         " cells, Cost: " + std::to_string(m_totalCost) + "]";
}

} // namespace HexPath
