/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SEARCH_SUPPORT_HPP
#define SEARCH_SUPPORT_HPP

#include "pathfinding/IHexGrid.hpp"
#include "pathfinding/PathResult.hpp"
#include "pathfinding/PathfindingContext.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace HexPath::PathfindingInternal {

inline constexpr int INFINITE_COST = std::numeric_limits<int>::max();

enum class NodeState : uint8_t { Unseen = 0, Open = 1, Closed = 2 };

/**
 * Per-cell search scratch space. Instances are thread_local inside each
 * algorithm so concurrent searches never share node state; buffers grow to
 * the largest grid seen and are reset, not reallocated, between searches.
 */
struct NodePool {
  std::vector<int> gCost;
  std::vector<CellId> parent;
  std::vector<NodeState> state;
  NeighborList neighbors;

  void ensureCapacity(size_t cellCount) {
    if (gCost.size() < cellCount) {
      gCost.resize(cellCount);
      parent.resize(cellCount);
      state.resize(cellCount);
    }
  }

  void reset(size_t cellCount) {
    ensureCapacity(cellCount);
    std::fill(gCost.begin(), gCost.begin() + cellCount, INFINITE_COST);
    std::fill(parent.begin(), parent.begin() + cellCount, INVALID_CELL);
    std::fill(state.begin(), state.begin() + cellCount, NodeState::Unseen);
  }
};

// Open-set key for A*-style searches: lower F first, then lower H
struct SearchKey {
  int f;
  int h;

  bool operator<(const SearchKey &other) const {
    return f != other.f ? f < other.f : h < other.h;
  }
};

class SearchTimer {
public:
  SearchTimer() : m_start(std::chrono::steady_clock::now()) {}

  double elapsedMs() const {
    return std::chrono::duration<double, std::milli>(
               std::chrono::steady_clock::now() - m_start)
        .count();
  }

private:
  std::chrono::steady_clock::time_point m_start;
};

/**
 * Common request checks shared by every algorithm, in order: invalid cells,
 * start == goal, and an untraversable goal. Returns the finished result when
 * no search is needed.
 */
std::optional<PathResult> checkRequest(const IHexGrid &grid, CellId start,
                                       CellId goal,
                                       const PathfindingContext &context,
                                       const SearchTimer &timer);

// True when the search may step onto this cell (never called for the start)
inline bool isTraversable(const IHexGrid &grid, CellId cell,
                          const PathfindingContext &context) {
  return !context.isObstacle(grid, cell);
}

inline bool exceedsBudget(const PathfindingContext &context, int cost) {
  return context.hasMovementLimit() && cost > context.maxMovementPoints;
}

/**
 * Failure reason for a search that ended without reaching the goal.
 * A budget-pruned search only reports the movement budget when the goal is
 * connected to the start at all; a walled-off goal is unreachable.
 */
const char *exhaustionReason(const IHexGrid &grid, CellId start, CellId goal,
                             const PathfindingContext &context, bool cancelled,
                             bool nodeLimitHit, bool prunedByBudget);

// Unbudgeted reachability of goal from start under the context's obstacles
bool isConnected(const IHexGrid &grid, CellId start, CellId goal,
                 const PathfindingContext &context);

// Walks parent links back from goal; empty if the chain does not reach start
std::vector<CellId> reconstructPath(const std::vector<CellId> &parent,
                                    CellId start, CellId goal);

// Copies labelled cells of the pool into diagnostic maps
void collectDiagnostics(const NodePool &pool, size_t cellCount,
                        CostMap &costMap, CameFromMap &cameFrom);

} // namespace HexPath::PathfindingInternal

#endif // SEARCH_SUPPORT_HPP
