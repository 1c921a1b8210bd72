#include "core/Shape.hpp"
#include <stdexcept>

namespace blockdrop::core {

Shape::Shape(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
    , cells_(static_cast<std::size_t>(rows * cols), false)
{
}

Shape::Shape(std::initializer_list<std::initializer_list<int>> rows)
    : rows_{static_cast<int>(rows.size())}
    , cols_{rows.size() > 0 ? static_cast<int>(rows.begin()->size()) : 0}
{
    if (rows_ == 0 || cols_ == 0) {
        throw std::invalid_argument("Shape must have at least one row and one column");
    }

    cells_.reserve(static_cast<std::size_t>(rows_ * cols_));
    for (const auto& row : rows) {
        if (static_cast<int>(row.size()) != cols_) {
            throw std::invalid_argument("Shape rows must all have the same width");
        }
        for (int v : row) {
            cells_.push_back(v != 0);
        }
    }
}

bool Shape::filled(int row, int col) const {
    if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
        throw std::out_of_range("Shape::filled out of range");
    }
    return cells_[index(row, col)];
}

std::vector<Position> Shape::blocks() const {
    std::vector<Position> out;
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            if (cells_[index(r, c)]) {
                out.push_back(Position{c, r});
            }
        }
    }
    return out;
}

Shape Shape::rotatedClockwise() const {
    // Transposed grid has cols_ rows and rows_ columns.
    // Reversing each transposed row puts old row (rows_ - 1 - c) in column c.
    Shape rotated(cols_, rows_);
    for (int r = 0; r < rotated.rows_; ++r) {
        for (int c = 0; c < rotated.cols_; ++c) {
            rotated.cells_[rotated.index(r, c)] = cells_[index(rows_ - 1 - c, r)];
        }
    }
    return rotated;
}

} // namespace blockdrop::core
