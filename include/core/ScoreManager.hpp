#pragma once

#include <cstdint>

namespace blockdrop::core {

class ScoreManager {
public:
    static constexpr std::uint64_t kPointsPerLine = 100;

    // Flat bonus per cleared row, no multi-line or level multiplier
    void addLinesCleared(int lines);

    std::uint64_t score() const noexcept { return score_; }
    std::uint64_t linesCleared() const noexcept { return lines_; }

    void reset() noexcept {
        score_ = 0;
        lines_ = 0;
    }

private:
    std::uint64_t score_{0};
    std::uint64_t lines_{0};
};

} // namespace blockdrop::core
