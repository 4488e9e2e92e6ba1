#pragma once

#include "crypto/common.hpp"
#include <chrono>
#include <cstdint>

namespace Subnet::Consensus {

using NodeId = int;
using SubnetId = int;

/// Round counter. Genesis is height 0.
using Height = uint64_t;

/// Position in the block-maker priority order. 0 is the leader.
using Rank = uint64_t;

/// Logical clock supplied by the caller; milliseconds since the subnet epoch.
using Time = std::chrono::milliseconds;
using Duration = std::chrono::milliseconds;

using Crypto::Byte;
using Crypto::Bytes;
using Crypto::BytesSpan;
using Hash = Crypto::Hash256;

/// Quorum arithmetic for a membership of N nodes tolerating f Byzantine ones.
struct SystemContext {
    int N; ///< Total number of nodes
    int f; ///< Maximum number of Byzantine faults tolerated

    static constexpr SystemContext for_members(int n)
    {
        return { .N = n, .f = n > 0 ? (n - 1) / 3 : 0 };
    }

    /// Random beacon and random tape.
    [[nodiscard]] constexpr int low_threshold() const { return f + 1; }

    /// Notarization, finalization and catch-up package.
    [[nodiscard]] constexpr int high_threshold() const { return N - f; }
};

} // namespace Subnet::Consensus
