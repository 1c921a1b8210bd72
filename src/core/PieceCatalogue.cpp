#include "core/PieceCatalogue.hpp"
#include <stdexcept>
#include <utility>

namespace blockdrop::core {

const std::array<PieceTemplate, kPieceKindCount>& PieceCatalogue::templates() noexcept {
    static const std::array<PieceTemplate, kPieceKindCount> kTemplates{{
        // [ ][ ][ ][ ]
        {PieceKind::I, Color::Cyan,   Shape{{1, 1, 1, 1}}},
        // [ ]
        // [ ][ ][ ]
        {PieceKind::J, Color::Blue,   Shape{{1, 0, 0},
                                            {1, 1, 1}}},
        //       [ ]
        // [ ][ ][ ]
        {PieceKind::L, Color::Orange, Shape{{0, 0, 1},
                                            {1, 1, 1}}},
        // [ ][ ]
        // [ ][ ]
        {PieceKind::O, Color::Yellow, Shape{{1, 1},
                                            {1, 1}}},
        //    [ ][ ]
        // [ ][ ]
        {PieceKind::S, Color::Green,  Shape{{0, 1, 1},
                                            {1, 1, 0}}},
        //    [ ]
        // [ ][ ][ ]
        {PieceKind::T, Color::Purple, Shape{{0, 1, 0},
                                            {1, 1, 1}}},
        // [ ][ ]
        //    [ ][ ]
        {PieceKind::Z, Color::Red,    Shape{{1, 1, 0},
                                            {0, 1, 1}}},
    }};
    return kTemplates;
}

const PieceTemplate& PieceCatalogue::templateFor(PieceKind kind) noexcept {
    return templates()[static_cast<std::size_t>(kind)];
}

PieceCatalogue::PieceCatalogue()
    : rng_{std::random_device{}()}
{
}

PieceCatalogue::PieceCatalogue(std::uint32_t seed)
    : rng_{seed}
{
}

PieceCatalogue::PieceCatalogue(std::vector<PieceKind> sequence)
    : rng_{}
    , sequence_{std::move(sequence)}
{
    if (sequence_.empty()) {
        throw std::invalid_argument("PieceCatalogue sequence must not be empty");
    }
}

Piece PieceCatalogue::randomPiece() {
    if (!sequence_.empty()) {
        const PieceKind kind = sequence_[sequenceIndex_];
        sequenceIndex_ = (sequenceIndex_ + 1) % sequence_.size();
        return Piece{templateFor(kind)};
    }

    std::uniform_int_distribution<int> dist(0, kPieceKindCount - 1);
    const auto kind = static_cast<PieceKind>(dist(rng_));
    return Piece{templateFor(kind)};
}

} // namespace blockdrop::core
