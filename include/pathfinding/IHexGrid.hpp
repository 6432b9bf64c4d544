/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_HEX_GRID_HPP
#define I_HEX_GRID_HPP

#include "pathfinding/HexCoord.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <limits>
#include <string>

namespace HexPath {

// Dense cell index in [0, IHexGrid::getCellCount())
using CellId = uint32_t;

// "No cell" sentinel
inline constexpr CellId INVALID_CELL = std::numeric_limits<CellId>::max();

// Movement cost reported by cells that can never be entered
inline constexpr int IMPASSABLE_COST = std::numeric_limits<int>::max();

// A hex has at most six neighbors; keep them off the heap
using NeighborList = boost::container::small_vector<CellId, 6>;

enum class Occupant : uint8_t { None = 0, Ally = 1, Enemy = 2 };

/**
 * @brief Read/write view of the hex map consumed by the pathfinding layer
 *
 * The grid owns geometry and cell state. Searches only read from it;
 * PathfindingManager writes the path, reachability and reservation flags.
 * Implementations must allow concurrent const access while no writer is
 * active.
 */
class IHexGrid {
public:
  virtual ~IHexGrid() = default;

  virtual size_t getCellCount() const = 0;

  // INVALID_CELL when the coordinate is outside the map
  virtual CellId findCell(int col, int row) const = 0;

  virtual HexCoord getAxialCoord(CellId cell) const = 0;
  virtual OffsetCoord getOffsetCoord(CellId cell) const = 0;

  // Replaces the contents of out with the existing neighbors of cell
  virtual void getNeighbors(CellId cell, NeighborList &out) const = 0;

  virtual bool isWalkable(CellId cell) const = 0;
  virtual int getMovementCost(CellId cell) const = 0;
  virtual bool isExplored(CellId cell) const = 0;
  virtual Occupant getOccupant(CellId cell) const = 0;
  virtual bool isReserved(CellId cell) const = 0;
  virtual const std::string &getTerrainLabel(CellId cell) const = 0;

  virtual void setPathFlag(CellId cell, bool onPath) = 0;
  virtual void setReachableFlag(CellId cell, bool reachable) = 0;
  virtual void setReserved(CellId cell, bool reserved) = 0;

  bool isValidCell(CellId cell) const {
    return cell != INVALID_CELL && cell < getCellCount();
  }

  bool isOccupied(CellId cell) const {
    return getOccupant(cell) != Occupant::None;
  }
};

} // namespace HexPath

#endif // I_HEX_GRID_HPP
