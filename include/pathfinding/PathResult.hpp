/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_RESULT_HPP
#define PATH_RESULT_HPP

#include "pathfinding/IHexGrid.hpp"
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace HexPath {

// Failure reasons reported by searches and the manager
namespace FailureReason {
inline constexpr const char *START_OR_GOAL_NULL = "start or goal null";
inline constexpr const char *GOAL_UNREACHABLE = "goal unreachable";
inline constexpr const char *GOAL_NOT_TRAVERSABLE = "goal not traversable";
inline constexpr const char *MOVEMENT_BUDGET_EXCEEDED =
    "movement budget exceeded";
inline constexpr const char *NODE_BUDGET_EXCEEDED =
    "node exploration budget exceeded";
inline constexpr const char *CANCELLED = "cancelled";
inline constexpr const char *INVALID_MOVEMENT_PER_TURN =
    "movement per turn must be positive";
inline constexpr const char *ALGORITHM_ERROR = "algorithm error";
} // namespace FailureReason

using CostMap = std::unordered_map<CellId, int>;
using CameFromMap = std::unordered_map<CellId, CellId>;

/**
 * @brief Outcome of a single path search
 *
 * Immutable once built; use createSuccess() or createFailure().
 * The cost and parent maps are only filled when the search context asked
 * for diagnostic data.
 */
class PathResult {
public:
  PathResult() = default;

  static PathResult createSuccess(CellId start, CellId goal,
                                  std::vector<CellId> path, int totalCost,
                                  int nodesExplored, double computationTimeMs,
                                  CostMap costMap = {},
                                  CameFromMap cameFrom = {});

  static PathResult createFailure(CellId start, CellId goal,
                                  std::string failureReason,
                                  int nodesExplored = 0,
                                  double computationTimeMs = 0.0,
                                  CostMap costMap = {},
                                  CameFromMap cameFrom = {});

  bool isSuccess() const { return m_success; }
  CellId getStartCell() const { return m_startCell; }
  CellId getGoalCell() const { return m_goalCell; }
  const std::vector<CellId> &getPath() const { return m_path; }
  int getTotalCost() const { return m_totalCost; }
  int getNodesExplored() const { return m_nodesExplored; }
  double getComputationTimeMs() const { return m_computationTimeMs; }
  const std::string &getFailureReason() const { return m_failureReason; }
  const CostMap &getCostMap() const { return m_costMap; }
  const CameFromMap &getCameFrom() const { return m_cameFrom; }

  size_t getPathLength() const { return m_path.size(); }
  bool isEmpty() const { return m_path.empty(); }
  CellId getFirstCell() const {
    return m_path.empty() ? INVALID_CELL : m_path.front();
  }
  CellId getLastCell() const {
    return m_path.empty() ? INVALID_CELL : m_path.back();
  }
  bool containsCell(CellId cell) const;

  std::string toString() const;

private:
  bool m_success{false};
  CellId m_startCell{INVALID_CELL};
  CellId m_goalCell{INVALID_CELL};
  std::vector<CellId> m_path;
  int m_totalCost{0};
  int m_nodesExplored{0};
  double m_computationTimeMs{0.0};
  std::string m_failureReason;
  CostMap m_costMap;
  CameFromMap m_cameFrom;
};

inline std::ostream &operator<<(std::ostream &os, const PathResult &result) {
  return os << result.toString();
}

} // namespace HexPath

#endif // PATH_RESULT_HPP
