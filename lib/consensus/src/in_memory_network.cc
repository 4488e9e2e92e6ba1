#include "consensus/in_memory_network.hpp"

namespace Subnet::Consensus {

void InMemoryNetwork::advance_to(Time now)
{
    std::lock_guard lock(mutex_);
    now_ = now;
}

void InMemoryNetwork::disconnect(NodeId node)
{
    std::lock_guard lock(mutex_);
    disconnected_.insert(node);
}

void InMemoryNetwork::reconnect(NodeId node)
{
    std::lock_guard lock(mutex_);
    disconnected_.erase(node);
}

std::vector<InMemoryNetwork::Envelope> InMemoryNetwork::take_due()
{
    std::lock_guard lock(mutex_);
    std::vector<Envelope> due;
    // Constant delay keeps the queue ordered by delivery time.
    while (!queue_.empty() && queue_.front().deliver_at <= now_) {
        due.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return due;
}

size_t InMemoryNetwork::in_flight() const
{
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void InMemoryNetwork::send(NodeId from, const Artifact& artifact)
{
    std::lock_guard lock(mutex_);
    if (disconnected_.contains(from))
        return;
    queue_.push_back({ .from = from, .artifact = artifact, .deliver_at = now_ + delay_ });
}

} // namespace Subnet::Consensus
