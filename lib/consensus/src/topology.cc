#include "consensus/topology.hpp"
#include "consensus/error.hpp"

#include <iterator>

namespace Subnet::Consensus {

std::expected<uint64_t, std::error_code> VersionedTopology::add_version(SubnetId subnet, Height from_height, std::set<NodeId> members)
{
    if (members.empty())
        return std::unexpected(Error::InvalidConfig);

    auto& versions = subnets_[subnet];
    if (!versions.empty() && versions.rbegin()->first >= from_height)
        return std::unexpected(Error::InvalidConfig);

    auto version = ++latest_version_;
    versions.emplace(from_height, Version { .registry_version = version, .members = std::move(members) });
    return version;
}

std::optional<std::set<NodeId>> VersionedTopology::members_at(Height height, SubnetId subnet) const
{
    if (const auto* v = version_at(height, subnet))
        return v->members;
    return std::nullopt;
}

std::optional<uint64_t> VersionedTopology::registry_version(Height height, SubnetId subnet) const
{
    if (const auto* v = version_at(height, subnet))
        return v->registry_version;
    return std::nullopt;
}

const VersionedTopology::Version* VersionedTopology::version_at(Height height, SubnetId subnet) const
{
    auto it = subnets_.find(subnet);
    if (it == subnets_.end())
        return nullptr;
    auto& versions = it->second;
    auto v = versions.upper_bound(height);
    if (v == versions.begin())
        return nullptr;
    return &std::prev(v)->second;
}

} // namespace Subnet::Consensus
