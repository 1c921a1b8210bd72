#include "controller/CommandQueue.hpp"

#include <utility>

namespace blockdrop::controller {

void CommandQueue::push(Command command)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(command);
}

std::vector<Command> CommandQueue::drain()
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = std::move(pending_);
    pending_.clear();
    return out;
}

std::size_t CommandQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace blockdrop::controller
