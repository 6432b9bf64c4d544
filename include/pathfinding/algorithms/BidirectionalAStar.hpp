/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BIDIRECTIONAL_ASTAR_HPP
#define BIDIRECTIONAL_ASTAR_HPP

#include "pathfinding/IPathfindingAlgorithm.hpp"

namespace HexPath {

/**
 * @brief A* run simultaneously from the start and from the goal
 *
 * The two frontiers expand alternately. The best meeting cost is tracked
 * over every cell labelled by both sides, and the search only stops once
 * either frontier's smallest F reaches that cost, so the result is optimal
 * rather than merely the first intersection.
 */
class BidirectionalAStar : public IPathfindingAlgorithm {
public:
  PathResult findPath(const IHexGrid &grid, CellId start, CellId goal,
                      const PathfindingContext &context) const override;

  std::string getName() const override { return "Bidirectional A*"; }
  std::string getDescription() const override {
    return "Optimal A* searching from both ends. Explores fewer cells on long "
           "open paths.";
  }
};

} // namespace HexPath

#endif // BIDIRECTIONAL_ASTAR_HPP
