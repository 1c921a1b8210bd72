#pragma once

#include "Types.hpp"
#include "Piece.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace blockdrop::core {

class PieceCatalogue {
public:
    // Seeds from std::random_device
    PieceCatalogue();

    // Reproducible random sequence
    explicit PieceCatalogue(std::uint32_t seed);

    // Fixed order, cycled forever. Throws std::invalid_argument if empty.
    explicit PieceCatalogue(std::vector<PieceKind> sequence);

    // Fresh copy of a uniformly chosen template (or the next scripted one)
    Piece randomPiece();

    static const PieceTemplate& templateFor(PieceKind kind) noexcept;
    static const std::array<PieceTemplate, kPieceKindCount>& templates() noexcept;

private:
    std::mt19937 rng_;
    std::vector<PieceKind> sequence_;
    std::size_t sequenceIndex_{0};
};

} // namespace blockdrop::core
