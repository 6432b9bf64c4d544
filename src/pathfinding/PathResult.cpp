/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/PathResult.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace HexPath {

PathResult PathResult::createSuccess(CellId start, CellId goal,
                                     std::vector<CellId> path, int totalCost,
                                     int nodesExplored,
                                     double computationTimeMs, CostMap costMap,
                                     CameFromMap cameFrom) {
  PathResult result;
  result.m_success = true;
  result.m_startCell = start;
  result.m_goalCell = goal;
  result.m_path = std::move(path);
  result.m_totalCost = totalCost;
  result.m_nodesExplored = nodesExplored;
  result.m_computationTimeMs = computationTimeMs;
  result.m_costMap = std::move(costMap);
  result.m_cameFrom = std::move(cameFrom);
  return result;
}

PathResult PathResult::createFailure(CellId start, CellId goal,
                                     std::string failureReason,
                                     int nodesExplored,
                                     double computationTimeMs, CostMap costMap,
                                     CameFromMap cameFrom) {
  PathResult result;
  result.m_success = false;
  result.m_startCell = start;
  result.m_goalCell = goal;
  result.m_failureReason = std::move(failureReason);
  result.m_nodesExplored = nodesExplored;
  result.m_computationTimeMs = computationTimeMs;
  result.m_costMap = std::move(costMap);
  result.m_cameFrom = std::move(cameFrom);
  return result;
}

bool PathResult::containsCell(CellId cell) const {
  return std::find(m_path.begin(), m_path.end(), cell) != m_path.end();
}

std::string PathResult::toString() const {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  if (m_success) {
    oss << "Path Found: " << m_path.size() << " cells, Cost: " << m_totalCost
        << ", ";
  } else {
    oss << "Path Failed: " << m_failureReason << ", ";
  }
  oss << "Explored: " << m_nodesExplored
      << " nodes, Time: " << m_computationTimeMs << "ms";
  return oss.str();
}

} // namespace HexPath
