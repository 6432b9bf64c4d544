/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_CONTEXT_HPP
#define PATHFINDING_CONTEXT_HPP

#include "pathfinding/IHexGrid.hpp"
#include <atomic>
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <memory>
#include <string>

namespace HexPath {

// Cooperative cancellation flag, shared between requester and search
class CancellationToken {
public:
  void cancel() { m_cancelled.store(true, std::memory_order_release); }
  void reset() { m_cancelled.store(false, std::memory_order_release); }
  bool isCancelled() const {
    return m_cancelled.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> m_cancelled{false};
};

/**
 * @brief Per-query search rules: budgets, passability and terrain weighting
 *
 * A plain value: copy it freely. Searches never modify the context they
 * receive.
 */
struct PathfindingContext {
  static constexpr int UNLIMITED_MOVEMENT = -1;
  static constexpr int DEFAULT_MAX_SEARCH_NODES = 10000;

  // Movement budget in effective cost units (-1 = unlimited)
  int maxMovementPoints{UNLIMITED_MOVEMENT};
  // Expansion cap; the search fails once this many nodes were expanded
  int maxSearchNodes{DEFAULT_MAX_SEARCH_NODES};
  bool requireExplored{true};
  bool allowMoveThroughAllies{false};
  bool allowMoveThroughEnemies{false};
  bool storeDiagnosticData{true};
  bool useCaching{true};

  boost::container::flat_set<CellId> dynamicObstacles;
  // Terrain label -> cost multiplier
  boost::container::flat_map<std::string, float> terrainCostMultipliers;

  // Optional; copies of the context share the token
  std::shared_ptr<CancellationToken> cancellationToken;

  static PathfindingContext createDefault() { return PathfindingContext{}; }
  static PathfindingContext createWithMovementLimit(int maxMovement);
  // Ignores fog of war, unlimited movement
  static PathfindingContext createForExploration();
  // Friendly units may be passed through
  static PathfindingContext createForCombat();

  PathfindingContext clone() const { return *this; }

  bool hasMovementLimit() const { return maxMovementPoints >= 0; }

  /**
   * @brief True when the cell may not be entered under this context
   *
   * Checks walkability, impassable cost, occupancy (subject to the ally and
   * enemy pass-through flags), reservation, fog of war and the dynamic
   * obstacle set.
   */
  bool isObstacle(const IHexGrid &grid, CellId cell) const;

  // Only occupancy prevents entering the cell
  bool isBlockedOnlyByOccupant(const IHexGrid &grid, CellId cell) const;

  // max(1, round(baseCost * multiplier)); IMPASSABLE_COST passes through
  int getEffectiveMovementCost(const IHexGrid &grid, CellId cell) const;

  void addDynamicObstacle(CellId cell) { dynamicObstacles.insert(cell); }
  void removeDynamicObstacle(CellId cell) { dynamicObstacles.erase(cell); }
  void clearDynamicObstacles() { dynamicObstacles.clear(); }
  bool isDynamicObstacle(CellId cell) const {
    return dynamicObstacles.count(cell) > 0;
  }

  void setTerrainCostMultiplier(const std::string &terrainLabel,
                                float multiplier) {
    terrainCostMultipliers[terrainLabel] = multiplier;
  }
  float getTerrainCostMultiplier(const std::string &terrainLabel) const;

  bool isCancellationRequested() const {
    return cancellationToken && cancellationToken->isCancelled();
  }

  std::string toString() const;

private:
  bool isBlockedIgnoringOccupant(const IHexGrid &grid, CellId cell) const;
  bool isBlockedByOccupant(const IHexGrid &grid, CellId cell) const;
};

} // namespace HexPath

#endif // PATHFINDING_CONTEXT_HPP
