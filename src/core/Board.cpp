#include "core/Board.hpp"
#include <algorithm>
#include <stdexcept>

namespace blockdrop::core {

Board::Board(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    grid_.assign(static_cast<std::size_t>(rows * cols), std::nullopt);
}

Cell Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, Cell value) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    grid_[index(row, col)] = value;
}

bool Board::collides(const Shape& shape, Position pos) const noexcept {
    for (int r = 0; r < shape.rows(); ++r) {
        for (int c = 0; c < shape.cols(); ++c) {
            if (!shape.filled(r, c)) continue;

            const int x = pos.x + c;
            const int y = pos.y + r;

            if (x < 0 || x >= cols_ || y >= rows_) {
                return true; // walls or floor
            }
            if (y >= 0 && grid_[index(y, x)].has_value()) {
                return true; // settled cell
            }
        }
    }
    return false;
}

void Board::lockShape(const Shape& shape, Position pos, Color color) {
    for (const auto& b : shape.blocks()) {
        const int x = pos.x + b.x;
        const int y = pos.y + b.y;
        if (isInside(y, x)) {
            grid_[index(y, x)] = color;
        }
    }
}

bool Board::isRowFull(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Board::isRowFull out of range");
    }
    for (int col = 0; col < cols_; ++col) {
        if (!grid_[index(row, col)].has_value()) {
            return false;
        }
    }
    return true;
}

int Board::clearFullLines() {
    // First pass: find every full row before touching anything.
    std::vector<bool> full(static_cast<std::size_t>(rows_), false);
    int cleared = 0;
    for (int row = 0; row < rows_; ++row) {
        if (isRowFull(row)) {
            full[row] = true;
            ++cleared;
        }
    }

    if (cleared == 0) {
        return 0;
    }

    // Second pass: copy surviving rows bottom-up, then blank the top.
    int dst = rows_ - 1;
    for (int src = rows_ - 1; src >= 0; --src) {
        if (full[src]) continue;
        if (dst != src) {
            std::copy_n(grid_.begin() + index(src, 0), cols_, grid_.begin() + index(dst, 0));
        }
        --dst;
    }
    for (int row = dst; row >= 0; --row) {
        std::fill_n(grid_.begin() + index(row, 0), cols_, std::nullopt);
    }

    return cleared;
}

bool Board::isEmpty() const noexcept {
    return std::none_of(grid_.begin(), grid_.end(),
                        [](const Cell& c) { return c.has_value(); });
}

} // namespace blockdrop::core
