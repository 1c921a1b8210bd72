#pragma once

#include "Types.hpp"
#include <initializer_list>
#include <vector>

namespace blockdrop::core {

// Rectangular grid of occupied/empty flags describing a piece.
// Local row 0 is the top row of the shape.
class Shape {
public:
    Shape() = default;

    // Rows top-to-bottom, non-zero = occupied. All rows must have the same width.
    Shape(std::initializer_list<std::initializer_list<int>> rows);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    bool filled(int row, int col) const;

    // Local (x = col, y = row) coordinates of every occupied cell, row-major.
    std::vector<Position> blocks() const;

    // 90 degree clockwise rotation: transpose, then reverse each row.
    // Returns a new shape; this one is left untouched.
    Shape rotatedClockwise() const;

    bool operator==(const Shape& other) const noexcept {
        return rows_ == other.rows_ && cols_ == other.cols_ && cells_ == other.cells_;
    }
    bool operator!=(const Shape& other) const noexcept { return !(*this == other); }

private:
    Shape(int rows, int cols);

    int rows_{0};
    int cols_{0};
    std::vector<bool> cells_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }
};

} // namespace blockdrop::core
