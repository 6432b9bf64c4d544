/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEX_COORD_HPP
#define HEX_COORD_HPP

#include <cstdlib>
#include <ostream>

namespace HexPath {

/**
 * @brief Axial hex coordinate (q, r); the implicit cube component is s = -q - r
 */
struct HexCoord {
  int q{0};
  int r{0};

  constexpr int s() const { return -q - r; }

  constexpr bool operator==(const HexCoord &other) const {
    return q == other.q && r == other.r;
  }
  constexpr bool operator!=(const HexCoord &other) const {
    return !(*this == other);
  }
};

// Offset (column, row) coordinate as used by grid storage and display
struct OffsetCoord {
  int col{0};
  int row{0};

  constexpr bool operator==(const OffsetCoord &other) const {
    return col == other.col && row == other.row;
  }
};

// Minimum number of steps between two hexes (cube distance)
inline int hexDistance(const HexCoord &a, const HexCoord &b) {
  return (std::abs(a.q - b.q) + std::abs(a.r - b.r) +
          std::abs(a.s() - b.s())) /
         2;
}

inline std::ostream &operator<<(std::ostream &os, const HexCoord &coord) {
  return os << "(" << coord.q << ", " << coord.r << ", " << coord.s() << ")";
}

inline std::ostream &operator<<(std::ostream &os, const OffsetCoord &coord) {
  return os << "(" << coord.col << ", " << coord.row << ")";
}

} // namespace HexPath

#endif // HEX_COORD_HPP
