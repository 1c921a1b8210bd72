#include "core/ScoreManager.hpp"

namespace blockdrop::core {

void ScoreManager::addLinesCleared(int lines) {
    if (lines <= 0) return;

    lines_ += static_cast<std::uint64_t>(lines);
    score_ += static_cast<std::uint64_t>(lines) * kPointsPerLine;
}

} // namespace blockdrop::core
