#pragma once

#include "consensus/artifact.hpp"
#include "consensus/change_action.hpp"
#include <mutex>
#include <set>
#include <variant>
#include <vector>

namespace Subnet::Consensus {

/// A membership version of the subnet became known.
struct SubnetFound {
    SubnetId subnet;
    Height from_height;
    std::set<NodeId> members;
};

/// The trusted genesis package was installed.
struct GenesisInstalled {
    CatchUpPackage cup;
    Time time;
};

/// An artifact arrived from a peer.
struct ArtifactSeen {
    Artifact artifact;
    Time time;
};

/// One action of the change set about to be applied.
struct ChangeActionSeen {
    ChangeAction action;
};

/// The preceding actions were applied at `time`.
struct ApplyChanges {
    Time time;
};

using TraceEvent = std::variant<SubnetFound, GenesisInstalled, ArtifactSeen, ChangeActionSeen, ApplyChanges>;

/// Thread-safe append-only event log of one replica.
class TraceRecorder {
public:
    void record(TraceEvent event)
    {
        std::lock_guard lock(mutex_);
        events_.push_back(std::move(event));
    }

    [[nodiscard]] std::vector<TraceEvent> events() const
    {
        std::lock_guard lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<TraceEvent> events_;
};

} // namespace Subnet::Consensus
