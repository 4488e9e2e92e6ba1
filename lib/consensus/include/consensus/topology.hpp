#pragma once

#include "consensus/common.hpp"
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <system_error>

namespace Subnet::Consensus {

/**
 * In-memory registry view. Each subnet carries a list of membership versions,
 * each applying from its start height until the next one.
 **/
class VersionedTopology {
public:
    /// Registers a membership taking effect at `from_height`. Versions must be added
    /// in increasing height order; the empty set is rejected.
    std::expected<uint64_t, std::error_code> add_version(SubnetId subnet, Height from_height, std::set<NodeId> members);

    [[nodiscard]] std::optional<std::set<NodeId>> members_at(Height height, SubnetId subnet) const;
    [[nodiscard]] std::optional<uint64_t> registry_version(Height height, SubnetId subnet) const;

private:
    struct Version {
        uint64_t registry_version;
        std::set<NodeId> members;
    };

    const Version* version_at(Height height, SubnetId subnet) const;

    std::map<SubnetId, std::map<Height, Version>> subnets_;
    uint64_t latest_version_ = 0;
};

} // namespace Subnet::Consensus
