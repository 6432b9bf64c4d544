/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DIJKSTRA_PATHFINDING_HPP
#define DIJKSTRA_PATHFINDING_HPP

#include "pathfinding/IPathfindingAlgorithm.hpp"
#include <map>
#include <string>
#include <vector>

namespace HexPath {

/**
 * @brief One-to-all shortest path tree rooted at a start cell
 *
 * Only settled cells are present, so every stored distance is final.
 */
struct DijkstraResult {
  bool success{false};
  CellId startCell{INVALID_CELL};
  CostMap distances;
  CameFromMap cameFrom;
  // Cells in the order they were settled (non-decreasing distance)
  std::vector<CellId> settledOrder;
  int nodesExplored{0};
  double computationTimeMs{0.0};
  // The node limit stopped the search before the frontier was exhausted
  bool truncated{false};
  bool prunedByBudget{false};
  bool cancelled{false};
  std::string failureReason;

  bool isReachable(CellId cell) const { return distances.count(cell) > 0; }
  // -1 when the cell was not reached
  int getCost(CellId cell) const;
  // start..target, or empty when target was not reached
  std::vector<CellId> extractPath(CellId target) const;
  std::string toString() const;
};

class DijkstraPathfinding : public IPathfindingAlgorithm {
public:
  PathResult findPath(const IHexGrid &grid, CellId start, CellId goal,
                      const PathfindingContext &context) const override;

  std::string getName() const override { return "Dijkstra"; }
  std::string getDescription() const override {
    return "Optimal uniform-cost search that settles every reachable cell. "
           "Use for distance maps and one-to-many queries.";
  }

  DijkstraResult findAllPaths(const IHexGrid &grid, CellId start,
                              const PathfindingContext &context) const;

  // Settled cells within maxDistance effective cost, start included
  std::vector<CellId> getCellsWithinDistance(const IHexGrid &grid,
                                             CellId start, int maxDistance,
                                             const PathfindingContext &context) const;

  // One search, one PathResult per requested goal
  std::map<CellId, PathResult>
  findPathsToMultipleGoals(const IHexGrid &grid, CellId start,
                           const std::vector<CellId> &goals,
                           const PathfindingContext &context) const;

private:
  PathResult extractResult(const IHexGrid &grid, const DijkstraResult &tree,
                           CellId goal,
                           const PathfindingContext &context) const;
};

} // namespace HexPath

#endif // DIJKSTRA_PATHFINDING_HPP
