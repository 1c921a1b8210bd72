#include "core/Piece.hpp"

namespace blockdrop::core {

Piece::Piece(const PieceTemplate& tmpl)
    : kind_{tmpl.kind}, color_{tmpl.color}, shape_{tmpl.shape}
{
}

} // namespace blockdrop::core
