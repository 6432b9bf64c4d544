/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ASTAR_PATHFINDING_HPP
#define ASTAR_PATHFINDING_HPP

#include "pathfinding/IPathfindingAlgorithm.hpp"

namespace HexPath {

/**
 * @brief A* over the hex graph with the cube-distance heuristic
 *
 * Optimal for any cost assignment with per-step cost >= 1. Ties on F are
 * broken toward the lower heuristic so the search hugs the goal direction.
 */
class AStarPathfinding : public IPathfindingAlgorithm {
public:
  PathResult findPath(const IHexGrid &grid, CellId start, CellId goal,
                      const PathfindingContext &context) const override;

  std::string getName() const override { return "A*"; }
  std::string getDescription() const override {
    return "Optimal heuristic search using hex distance. Best general-purpose "
           "choice for single-target pathfinding.";
  }

  // Admissible and consistent for minimum step cost 1
  static int calculateHeuristic(const IHexGrid &grid, CellId from, CellId to);
};

} // namespace HexPath

#endif // ASTAR_PATHFINDING_HPP
