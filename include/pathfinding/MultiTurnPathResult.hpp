/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MULTI_TURN_PATH_RESULT_HPP
#define MULTI_TURN_PATH_RESULT_HPP

#include "pathfinding/PathResult.hpp"
#include "pathfinding/PathfindingContext.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace HexPath {

/**
 * @brief A path split into per-turn segments under a fixed movement allowance
 *
 * Every segment after the first begins with the endpoint of the previous
 * turn, so a unit can resume from where it stopped. A turn is closed when it
 * already holds at least one step and the next step would exceed the
 * allowance. A single step costing more than the allowance therefore fills a
 * turn on its own, and no turn is ever empty.
 */
class MultiTurnPathResult {
public:
  MultiTurnPathResult() = default;

  /**
   * @brief Split a single-search path into turns
   *
   * Step costs are the context's effective movement costs of the entered
   * cells, or 1 per step when the base search measured cost in steps, so
   * the per-turn costs always sum to the base path's total cost. A failed
   * base result or a non-positive allowance produces a failed multi-turn
   * result.
   */
  static MultiTurnPathResult createFromSinglePath(const IHexGrid &grid,
                                                  const PathResult &basePath,
                                                  int movementPerTurn,
                                                  const PathfindingContext &context,
                                                  bool costInSteps = false);

  static MultiTurnPathResult createFailure(CellId start, CellId goal,
                                           std::string failureReason,
                                           int movementPerTurn,
                                           PathResult basePath = {});

  bool isSuccess() const { return m_success; }
  CellId getStartCell() const { return m_startCell; }
  CellId getGoalCell() const { return m_goalCell; }
  const std::vector<CellId> &getCompletePath() const { return m_completePath; }
  const std::vector<std::vector<CellId>> &getPathPerTurn() const {
    return m_pathPerTurn;
  }
  const std::vector<int> &getCostPerTurn() const { return m_costPerTurn; }
  const std::vector<CellId> &getTurnEndpoints() const {
    return m_turnEndpoints;
  }
  int getTurnsRequired() const { return m_turnsRequired; }
  int getTotalCost() const { return m_totalCost; }
  int getMovementPerTurn() const { return m_movementPerTurn; }
  const std::string &getFailureReason() const { return m_failureReason; }
  const PathResult &getBasePathResult() const { return m_basePathResult; }

  // Out-of-range turn indices yield an empty path, zero cost or INVALID_CELL
  std::vector<CellId> getTurnPath(int turnIndex) const;
  int getTurnCost(int turnIndex) const;
  CellId getTurnEndpoint(int turnIndex) const;

  bool isSingleTurnPath() const { return m_success && m_turnsRequired <= 1; }

  // Cells still to be walked after completedTurns turns, starting with the
  // cell the unit is standing on
  std::vector<CellId> getRemainingPath(int completedTurns) const;

  // Mean of costPerTurn / movementPerTurn, 0 for failed or empty results
  float getAverageMovementEfficiency() const;

  bool isTurnAtCapacity(int turnIndex) const;

  std::string getTurnBreakdown() const;
  std::string toString() const;

private:
  bool m_success{false};
  CellId m_startCell{INVALID_CELL};
  CellId m_goalCell{INVALID_CELL};
  std::vector<CellId> m_completePath;
  std::vector<std::vector<CellId>> m_pathPerTurn;
  std::vector<int> m_costPerTurn;
  std::vector<CellId> m_turnEndpoints;
  std::vector<OffsetCoord> m_turnEndpointCoords;
  int m_turnsRequired{0};
  int m_totalCost{0};
  int m_movementPerTurn{0};
  std::string m_failureReason;
  PathResult m_basePathResult;
};

inline std::ostream &operator<<(std::ostream &os,
                                const MultiTurnPathResult &result) {
  return os << result.toString();
}

} // namespace HexPath

#endif // MULTI_TURN_PATH_RESULT_HPP
