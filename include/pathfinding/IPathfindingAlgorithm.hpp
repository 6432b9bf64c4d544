/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_PATHFINDING_ALGORITHM_HPP
#define I_PATHFINDING_ALGORITHM_HPP

#include "pathfinding/IHexGrid.hpp"
#include "pathfinding/PathResult.hpp"
#include "pathfinding/PathfindingContext.hpp"
#include <string>

namespace HexPath {

/**
 * @brief Strategy interface shared by every search algorithm
 *
 * Implementations keep no per-search state in the object; transient node
 * data lives in per-thread pools. A single instance may therefore serve
 * concurrent searches when supportsConcurrentExecution() returns true.
 *
 * findPath() never throws for bad input: invalid cells, unreachable goals
 * and exhausted budgets are reported through a failed PathResult.
 */
class IPathfindingAlgorithm {
public:
  virtual ~IPathfindingAlgorithm() = default;

  virtual PathResult findPath(const IHexGrid &grid, CellId start, CellId goal,
                              const PathfindingContext &context) const = 0;

  virtual std::string getName() const = 0;
  virtual std::string getDescription() const = 0;
  virtual bool supportsConcurrentExecution() const { return true; }
  // True when a result's totalCost counts steps rather than movement cost
  virtual bool measuresCostInSteps() const { return false; }
};

} // namespace HexPath

#endif // I_PATHFINDING_ALGORITHM_HPP
