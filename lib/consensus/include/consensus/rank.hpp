#pragma once

#include "consensus/common.hpp"
#include "consensus/concept.hpp"
#include "consensus/config.hpp"
#include "consensus/pool/pool_reader.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <vector>

namespace Subnet::Consensus {

/// Members permuted by a shuffle seeded from the previous beacon. Index is rank.
std::vector<NodeId> block_maker_order(const Hash& previous_beacon, Height height, const std::set<NodeId>& members);

/// Rank 0 may propose at the round start; each further rank waits 2 * unit_delay more.
Duration block_maker_timeout(const ConsensusConfig& config, Rank rank);

/// How long a notary waits after the round start before signing a block of `rank`.
Duration notary_delay(const ConsensusConfig& config, Rank rank);

/// Nullopt if `node` is not a member at `height` or the beacon at `height - 1` is missing.
template <MembershipRegistry R>
std::optional<Rank> block_maker_rank(const PoolReader& pool, const R& registry,
    Height height, NodeId node, SubnetId subnet)
{
    if (height == 0)
        return std::nullopt;
    auto members = registry.members_at(height, subnet);
    if (!members || !members->contains(node))
        return std::nullopt;
    auto beacon = pool.random_beacon_hash(height - 1);
    if (!beacon)
        return std::nullopt;

    auto order = block_maker_order(*beacon, height, *members);
    auto it = std::ranges::find(order, node);
    return static_cast<Rank>(it - order.begin());
}

} // namespace Subnet::Consensus
