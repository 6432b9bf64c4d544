/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_HEX_GRID_HPP
#define MOCK_HEX_GRID_HPP

#include "pathfinding/IHexGrid.hpp"
#include <string>
#include <vector>

namespace HexPath {

/**
 * Rectangular odd-r offset hex map for tests. Cell ids are row * width + col.
 * Every cell starts walkable, explored, unoccupied, cost 1 and labelled
 * "Grassland".
 */
class MockHexGrid : public IHexGrid {
public:
    MockHexGrid(int width, int height)
        : m_width(width), m_height(height), m_cells(static_cast<size_t>(width * height)) {}

    size_t getCellCount() const override { return m_cells.size(); }

    CellId findCell(int col, int row) const override {
        if (col < 0 || row < 0 || col >= m_width || row >= m_height) {
            return INVALID_CELL;
        }
        return static_cast<CellId>(row * m_width + col);
    }

    HexCoord getAxialCoord(CellId cell) const override {
        const OffsetCoord offset = getOffsetCoord(cell);
        return HexCoord{offset.col - (offset.row - (offset.row & 1)) / 2, offset.row};
    }

    OffsetCoord getOffsetCoord(CellId cell) const override {
        const int index = static_cast<int>(cell);
        return OffsetCoord{index % m_width, index / m_width};
    }

    void getNeighbors(CellId cell, NeighborList& out) const override {
        static constexpr int DIRECTIONS[6][2] = {{1, 0}, {1, -1}, {0, -1},
                                                 {-1, 0}, {-1, 1}, {0, 1}};
        out.clear();
        const HexCoord axial = getAxialCoord(cell);
        for (const auto& direction : DIRECTIONS) {
            const int q = axial.q + direction[0];
            const int r = axial.r + direction[1];
            const CellId neighbor = findCell(q + (r - (r & 1)) / 2, r);
            if (neighbor != INVALID_CELL) {
                out.push_back(neighbor);
            }
        }
    }

    bool isWalkable(CellId cell) const override { return m_cells[cell].walkable; }
    int getMovementCost(CellId cell) const override { return m_cells[cell].cost; }
    bool isExplored(CellId cell) const override { return m_cells[cell].explored; }
    Occupant getOccupant(CellId cell) const override { return m_cells[cell].occupant; }
    bool isReserved(CellId cell) const override { return m_cells[cell].reserved; }
    const std::string& getTerrainLabel(CellId cell) const override { return m_cells[cell].terrain; }

    void setPathFlag(CellId cell, bool onPath) override { m_cells[cell].onPath = onPath; }
    void setReachableFlag(CellId cell, bool reachable) override {
        m_cells[cell].reachable = reachable;
    }
    void setReserved(CellId cell, bool reserved) override { m_cells[cell].reserved = reserved; }

    // Test setup helpers
    CellId at(int col, int row) const { return findCell(col, row); }
    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

    void setWalkable(CellId cell, bool walkable) { m_cells[cell].walkable = walkable; }
    void setMovementCost(CellId cell, int cost) { m_cells[cell].cost = cost; }
    void setExplored(CellId cell, bool explored) { m_cells[cell].explored = explored; }
    void setOccupant(CellId cell, Occupant occupant) { m_cells[cell].occupant = occupant; }
    void setTerrain(CellId cell, const std::string& label) { m_cells[cell].terrain = label; }

    void setAllExplored(bool explored) {
        for (auto& cell : m_cells) {
            cell.explored = explored;
        }
    }

    // Blocks every cell of a column except the listed rows
    void blockColumn(int col, const std::vector<int>& openRows = {}) {
        for (int row = 0; row < m_height; ++row) {
            bool open = false;
            for (int openRow : openRows) {
                open = open || openRow == row;
            }
            setWalkable(at(col, row), open);
        }
    }

    bool isOnPath(CellId cell) const { return m_cells[cell].onPath; }
    bool isMarkedReachable(CellId cell) const { return m_cells[cell].reachable; }

    bool areAdjacent(CellId a, CellId b) const {
        return hexDistance(getAxialCoord(a), getAxialCoord(b)) == 1;
    }

private:
    struct Cell {
        bool walkable{true};
        int cost{1};
        bool explored{true};
        Occupant occupant{Occupant::None};
        bool reserved{false};
        bool onPath{false};
        bool reachable{false};
        std::string terrain{"Grassland"};
    };

    int m_width;
    int m_height;
    std::vector<Cell> m_cells;
};

} // namespace HexPath

#endif // MOCK_HEX_GRID_HPP
