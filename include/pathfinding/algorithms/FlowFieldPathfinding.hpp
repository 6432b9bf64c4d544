/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOW_FIELD_PATHFINDING_HPP
#define FLOW_FIELD_PATHFINDING_HPP

#include "pathfinding/IPathfindingAlgorithm.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace HexPath {

/**
 * @brief Cost-to-goal and next-step direction for every cell that can reach
 * one goal
 *
 * Built once per goal and shared by any number of units. Cells blocked only
 * by a unit standing on them get a direction but are never routed through,
 * so units can follow the field from their own cell.
 */
class FlowField {
public:
  FlowField() = default;

  CellId getGoal() const { return m_goal; }
  bool isValid() const { return m_failureReason.empty(); }
  const std::string &getFailureReason() const { return m_failureReason; }

  bool isReachable(CellId cell) const { return m_costs.count(cell) > 0; }
  // -1 when the cell cannot reach the goal
  int getCostToGoal(CellId cell) const;
  // INVALID_CELL at the goal or for unreachable cells
  CellId getNextCell(CellId cell) const;
  // cell..goal following the field, or empty when unreachable
  std::vector<CellId> getPathFrom(CellId cell) const;
  // Reachable cells ordered by cost to goal, goal first
  std::vector<CellId> getReachableCells() const;
  size_t getReachableCount() const { return m_costs.size(); }
  int getMaxCost() const { return m_maxCost; }

  int getNodesProcessed() const { return m_nodesProcessed; }
  double getGenerationTimeMs() const { return m_generationTimeMs; }
  bool wasTruncated() const { return m_truncated; }
  bool wasPrunedByBudget() const { return m_prunedByBudget; }
  bool wasCancelled() const { return m_cancelled; }

  std::string toString() const;

private:
  friend class FlowFieldPathfinding;

  CellId m_goal{INVALID_CELL};
  std::unordered_map<CellId, int> m_costs;
  std::unordered_map<CellId, CellId> m_next;
  int m_maxCost{0};
  int m_nodesProcessed{0};
  double m_generationTimeMs{0.0};
  bool m_truncated{false};
  bool m_prunedByBudget{false};
  bool m_cancelled{false};
  std::string m_failureReason;
};

class FlowFieldPathfinding : public IPathfindingAlgorithm {
public:
  PathResult findPath(const IHexGrid &grid, CellId start, CellId goal,
                      const PathfindingContext &context) const override;

  std::string getName() const override { return "FlowField"; }
  std::string getDescription() const override {
    return "Builds a cost field from the goal outward. Best when many units "
           "share a destination.";
  }

  /**
   * @brief Build the field for a goal
   *
   * @param maxDistance Largest cost-to-goal kept in the field (-1 for the
   * context's movement limit)
   */
  FlowField generateFlowField(const IHexGrid &grid, CellId goal,
                              const PathfindingContext &context,
                              int maxDistance = -1) const;

private:
  // exemptCell is allowed into the field as a leaf regardless of obstacles
  FlowField buildField(const IHexGrid &grid, CellId goal,
                       const PathfindingContext &context, int maxDistance,
                       CellId exemptCell) const;
};

} // namespace HexPath

#endif // FLOW_FIELD_PATHFINDING_HPP
