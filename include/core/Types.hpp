#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <optional> // For std::optional

// Namespace for BlockDrop core types
namespace blockdrop::core {

// Fixed playfield size
constexpr int kBoardRows = 20;
constexpr int kBoardCols = 10;

// Offset of a piece's top-left cell in board coordinates.
// x grows to the right, y grows downwards (row 0 is the top).
struct Position {
    int x{};
    int y{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Piece kinds, in catalogue order
enum class PieceKind : std::uint8_t {
    I, J, L, O, S, T, Z
};

constexpr int kPieceKindCount = 7;

// Display tag carried by a piece and by the cells it locks into.
// The engine never looks at it.
enum class Color : std::uint8_t {
    Cyan,
    Blue,
    Orange,
    Yellow,
    Green,
    Purple,
    Red
};

// A board cell: empty, or occupied with the color of the piece that filled it
using Cell = std::optional<Color>;

// Letter used by text renderers and tests
inline char pieceLetter(PieceKind kind) noexcept {
    switch (kind) {
    case PieceKind::I: return 'I';
    case PieceKind::J: return 'J';
    case PieceKind::L: return 'L';
    case PieceKind::O: return 'O';
    case PieceKind::S: return 'S';
    case PieceKind::T: return 'T';
    case PieceKind::Z: return 'Z';
    }
    return '?';
}

} // namespace blockdrop::core
