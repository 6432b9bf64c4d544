/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/PathfindingContext.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace HexPath {

namespace {
// Keeps weighted costs clear of the impassable sentinel
constexpr double MAX_WEIGHTED_COST = 1000000.0;
} // namespace

PathfindingContext PathfindingContext::createWithMovementLimit(int maxMovement) {
  PathfindingContext context;
  context.maxMovementPoints = maxMovement;
  return context;
}

PathfindingContext PathfindingContext::createForExploration() {
  PathfindingContext context;
  context.requireExplored = false;
  context.maxMovementPoints = UNLIMITED_MOVEMENT;
  return context;
}

PathfindingContext PathfindingContext::createForCombat() {
  PathfindingContext context;
  context.allowMoveThroughAllies = true;
  return context;
}

bool PathfindingContext::isBlockedIgnoringOccupant(const IHexGrid &grid,
                                                   CellId cell) const {
  if (!grid.isValidCell(cell)) {
    return true;
  }
  if (!grid.isWalkable(cell) || grid.getMovementCost(cell) == IMPASSABLE_COST) {
    return true;
  }
  if (grid.isReserved(cell)) {
    return true;
  }
  if (requireExplored && !grid.isExplored(cell)) {
    return true;
  }
  return isDynamicObstacle(cell);
}

bool PathfindingContext::isBlockedByOccupant(const IHexGrid &grid,
                                             CellId cell) const {
  switch (grid.getOccupant(cell)) {
  case Occupant::Ally:
    return !allowMoveThroughAllies;
  case Occupant::Enemy:
    return !allowMoveThroughEnemies;
  case Occupant::None:
    break;
  }
  return false;
}

bool PathfindingContext::isObstacle(const IHexGrid &grid, CellId cell) const {
  return isBlockedIgnoringOccupant(grid, cell) ||
         isBlockedByOccupant(grid, cell);
}

bool PathfindingContext::isBlockedOnlyByOccupant(const IHexGrid &grid,
                                                 CellId cell) const {
  return !isBlockedIgnoringOccupant(grid, cell) &&
         isBlockedByOccupant(grid, cell);
}

float PathfindingContext::getTerrainCostMultiplier(
    const std::string &terrainLabel) const {
  auto it = terrainCostMultipliers.find(terrainLabel);
  return it != terrainCostMultipliers.end() ? it->second : 1.0f;
}

int PathfindingContext::getEffectiveMovementCost(const IHexGrid &grid,
                                                 CellId cell) const {
  int baseCost = grid.getMovementCost(cell);
  if (baseCost == IMPASSABLE_COST) {
    return IMPASSABLE_COST;
  }

  if (terrainCostMultipliers.empty()) {
    return std::max(1, baseCost);
  }

  double weighted = static_cast<double>(baseCost) *
                    getTerrainCostMultiplier(grid.getTerrainLabel(cell));
  weighted = std::clamp(weighted, 0.0, MAX_WEIGHTED_COST);
  return std::max(1, static_cast<int>(std::lround(weighted)));
}

std::string PathfindingContext::toString() const {
  std::ostringstream oss;
  oss << "PathfindingContext{maxMovement=" << maxMovementPoints
      << ", maxNodes=" << maxSearchNodes
      << ", requireExplored=" << (requireExplored ? "true" : "false")
      << ", allies=" << (allowMoveThroughAllies ? "pass" : "block")
      << ", enemies=" << (allowMoveThroughEnemies ? "pass" : "block")
      << ", dynamicObstacles=" << dynamicObstacles.size()
      << ", terrainMultipliers=" << terrainCostMultipliers.size() << "}";
  return oss.str();
}

} // namespace HexPath
