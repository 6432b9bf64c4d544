/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BREADTH_FIRST_SEARCH_HPP
#define BREADTH_FIRST_SEARCH_HPP

#include "pathfinding/IPathfindingAlgorithm.hpp"
#include <unordered_map>
#include <vector>

namespace HexPath {

/**
 * @brief Unweighted breadth-first search
 *
 * Every traversable step costs 1: terrain weights are ignored, the reported
 * total cost is the step count and the movement budget limits steps. Finds
 * the path with the fewest steps.
 */
class BreadthFirstSearch : public IPathfindingAlgorithm {
public:
  PathResult findPath(const IHexGrid &grid, CellId start, CellId goal,
                      const PathfindingContext &context) const override;

  std::string getName() const override { return "BFS"; }
  std::string getDescription() const override {
    return "Unweighted search for the fewest steps. Ignores terrain costs; "
           "fast for range and flood queries.";
  }
  bool measuresCostInSteps() const override { return true; }

  // Cells at most maxSteps steps away in visit order, start first
  std::vector<CellId> getCellsWithinSteps(const IHexGrid &grid, CellId start,
                                          int maxSteps,
                                          const PathfindingContext &context) const;

  // Path to whichever target is the fewest steps away
  PathResult findClosestTarget(const IHexGrid &grid, CellId start,
                               const std::vector<CellId> &targets,
                               const PathfindingContext &context) const;

  // Connected traversable region around start, up to maxCells cells
  std::vector<CellId> floodFill(const IHexGrid &grid, CellId start,
                                size_t maxCells,
                                const PathfindingContext &context) const;

  // Step distance to every reached cell (maxSteps < 0 = unlimited)
  std::unordered_map<CellId, int>
  getDistanceMap(const IHexGrid &grid, CellId start,
                 const PathfindingContext &context, int maxSteps = -1) const;
};

} // namespace HexPath

#endif // BREADTH_FIRST_SEARCH_HPP
