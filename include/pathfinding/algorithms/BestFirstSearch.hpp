/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEST_FIRST_SEARCH_HPP
#define BEST_FIRST_SEARCH_HPP

#include "pathfinding/IPathfindingAlgorithm.hpp"
#include <vector>

namespace HexPath {

/**
 * @brief Greedy best-first search ordered purely by distance to the goal
 *
 * Fast but not optimal: it commits to whatever looks closest and can walk
 * into concave obstacles before backing out. The reported cost is the real
 * effective cost of the path found.
 */
class BestFirstSearch : public IPathfindingAlgorithm {
public:
  static constexpr int DEFAULT_REACHABILITY_NODES = 1000;

  PathResult findPath(const IHexGrid &grid, CellId start, CellId goal,
                      const PathfindingContext &context) const override;

  std::string getName() const override { return "Best-First (Greedy)"; }
  std::string getDescription() const override {
    return "Greedy search that always expands the cell closest to the goal. "
           "Fast, not optimal.";
  }

  // Connectivity check with its own node cap
  bool isReachable(const IHexGrid &grid, CellId start, CellId goal,
                   const PathfindingContext &context,
                   int maxNodes = DEFAULT_REACHABILITY_NODES) const;

  // Tries targets nearest-first by hex distance; first success wins
  PathResult findClosestTarget(const IHexGrid &grid, CellId start,
                               const std::vector<CellId> &targets,
                               const PathfindingContext &context) const;
};

} // namespace HexPath

#endif // BEST_FIRST_SEARCH_HPP
