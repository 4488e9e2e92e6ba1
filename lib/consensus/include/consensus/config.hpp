#pragma once

#include "consensus/common.hpp"
#include <expected>
#include <system_error>

namespace Subnet::Consensus {

struct ConsensusConfig {
    NodeId node_id = 0;
    SubnetId subnet_id = 0;

    /// Base delay between block-maker ranks.
    Duration unit_delay { 1000 };
    /// Notary wait for a rank-0 block.
    Duration initial_notary_delay { 600 };

    /// Distance between catch-up package heights.
    Height catch_up_interval = 100;
    /// How many finalized heights the validated pool keeps.
    Height validated_retention = 200;

    [[nodiscard]] std::expected<void, std::error_code> validate() const;
};

} // namespace Subnet::Consensus
