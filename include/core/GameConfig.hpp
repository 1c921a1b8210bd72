#pragma once

#include <cstdint>
#include <optional>

namespace blockdrop::core {

struct GameConfig {
    int gravityIntervalMs{1000};         // time between gravity ticks (<= 0 disables gravity)
    std::optional<std::uint32_t> seed{}; // piece order seed; random device when absent
};

} // namespace blockdrop::core
