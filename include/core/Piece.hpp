#pragma once // Include guard

#include "Types.hpp" // For PieceKind, Color
#include "Shape.hpp" // For Shape
#include <utility> // For std::move

// Namespace for BlockDrop core types
namespace blockdrop::core {

// Immutable catalogue entry: a named shape and its color
struct PieceTemplate {
    PieceKind kind;
    Color color;
    Shape shape;
};

// The falling piece. Holds its own copy of the shape, so rotating it
// never touches the catalogue. Its board offset is tracked by GameState.
class Piece {
public:
    explicit Piece(const PieceTemplate& tmpl);

    PieceKind kind() const noexcept { return kind_; }
    Color color() const noexcept { return color_; }
    const Shape& shape() const noexcept { return shape_; }

    void setShape(Shape shape) { shape_ = std::move(shape); }

    // Shape this piece would have after one clockwise turn
    Shape rotatedShape() const { return shape_.rotatedClockwise(); }

private:
    PieceKind kind_;
    Color color_;
    Shape shape_;
};

} // namespace blockdrop::core
