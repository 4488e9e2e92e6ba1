#pragma once

#include "consensus/artifact.hpp"
#include "consensus/common.hpp"
#include "consensus/concept.hpp"
#include <deque>
#include <mutex>
#include <set>
#include <vector>

namespace Subnet::Consensus {

/// Broadcast medium for replicas running in one process, with a fixed delivery delay.
class InMemoryNetwork {
public:
    struct Envelope {
        NodeId from;
        Artifact artifact;
        Time deliver_at;
    };

    /// Transport handle of one replica.
    class Endpoint {
    public:
        void broadcast(const Artifact& artifact) { network_->send(id_, artifact); }
        [[nodiscard]] NodeId id() const { return id_; }

    private:
        friend class InMemoryNetwork;
        Endpoint(InMemoryNetwork& network, NodeId id)
            : network_(&network)
            , id_(id)
        {
        }

        InMemoryNetwork* network_;
        NodeId id_;
    };

    explicit InMemoryNetwork(Duration delay = Duration::zero())
        : delay_(delay)
    {
    }

    Endpoint endpoint(NodeId id) { return Endpoint(*this, id); }

    /// Sets the clock used to stamp new messages.
    void advance_to(Time now);

    /// Messages from a disconnected node are dropped.
    void disconnect(NodeId node);
    void reconnect(NodeId node);

    /// Removes and returns every message due at the current time, in send order.
    std::vector<Envelope> take_due();

    [[nodiscard]] size_t in_flight() const;

private:
    void send(NodeId from, const Artifact& artifact);

    mutable std::mutex mutex_;
    Duration delay_;
    Time now_ {};
    std::set<NodeId> disconnected_;
    std::deque<Envelope> queue_;
};

static_assert(Transceiver<InMemoryNetwork::Endpoint>);

} // namespace Subnet::Consensus
