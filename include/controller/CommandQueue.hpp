#pragma once

#include "controller/Command.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace blockdrop::controller {

/// FIFO shared by every command producer (gravity timer, input threads).
/// push() may be called from any thread; drain() is called by the single
/// owner of the GameState.
class CommandQueue {
public:
    void push(Command command);

    /// Takes every pending command, oldest first, and leaves the queue empty.
    std::vector<Command> drain();

    std::size_t size() const;
    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::vector<Command> pending_;
};

} // namespace blockdrop::controller
