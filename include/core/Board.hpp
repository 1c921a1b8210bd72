#pragma once

#include "Types.hpp"
#include "Shape.hpp"
#include <vector>

namespace blockdrop::core {

class Board {
public:
    Board(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    Cell cell(int row, int col) const;
    void setCell(int row, int col, Cell value);

    bool isOccupied(int row, int col) const { return cell(row, col).has_value(); }

    // True if any occupied cell of `shape` placed at `pos` is left of column 0,
    // right of the last column, below the last row, or on an occupied cell.
    // Cells above row 0 only get the side and floor checks.
    bool collides(const Shape& shape, Position pos) const noexcept;

    // Write `color` into every occupied cell of `shape` at `pos`.
    // Cells above row 0 are dropped.
    void lockShape(const Shape& shape, Position pos, Color color);

    bool isRowFull(int row) const;

    // Remove every full row, pull the rows above down and refill the top
    // with empty rows. Returns the number of rows removed.
    int clearFullLines();

    bool isEmpty() const noexcept;

private:
    int rows_;
    int cols_;
    std::vector<Cell> grid_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }
};

} // namespace blockdrop::core
