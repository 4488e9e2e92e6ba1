#pragma once

#include "consensus/artifact.hpp"
#include "consensus/pool/artifact_pool.hpp"
#include <optional>
#include <vector>

namespace Subnet::Consensus {

/// Non-owning handle on a block stored in the pool. Parent links are followed by hash.
struct BlockRef {
    Hash hash;
    const Block* block;
};

/// Consensus queries over the validated partition.
class PoolReader {
public:
    explicit PoolReader(const PoolSection& validated)
        : validated_(validated)
    {
    }

    [[nodiscard]] const PoolSection& validated() const { return validated_; }

    /// Highest height holding a finalized block; nullopt before the genesis package.
    [[nodiscard]] std::optional<Height> current_round() const;
    [[nodiscard]] Height finalized_height() const { return current_round().value_or(0); }
    [[nodiscard]] Height notarized_height() const;

    [[nodiscard]] const CatchUpPackage* latest_catch_up_package() const;
    [[nodiscard]] Height catch_up_height() const;

    [[nodiscard]] const RandomBeacon* random_beacon(Height height) const;
    [[nodiscard]] std::optional<Hash> random_beacon_hash(Height height) const;
    [[nodiscard]] const RandomTape* random_tape(Height height) const;

    /// Distinct blocks at `height`: proposals, plus the package block at the package height.
    [[nodiscard]] std::vector<BlockRef> blocks_at(Height height) const;
    [[nodiscard]] std::optional<BlockRef> block(Height height, const Hash& hash) const;

    [[nodiscard]] bool is_notarized(Height height, const Hash& hash) const;
    [[nodiscard]] std::vector<BlockRef> notarized_blocks(Height height) const;

    /// Notarized blocks at `height` that can still be finalized. When `height + 1` is
    /// notarized, only parents of notarized blocks there survive.
    [[nodiscard]] std::vector<BlockRef> surviving_notarized_blocks(Height height) const;

    [[nodiscard]] std::optional<BlockRef> finalized_block(Height height) const;

    /// Hashes of the finalized chain over (from, to], ascending. Nullopt on a gap.
    [[nodiscard]] std::optional<std::vector<Hash>> finalized_chain(Height from, Height to) const;

    /// Next height a catch-up package is due at.
    [[nodiscard]] Height next_catch_up_height(Height interval) const { return catch_up_height() + interval; }

    /// Lowest height with work left: the first unfinalized height, or a finalized
    /// height still waiting for its catch-up package.
    [[nodiscard]] Height lowest_unresolved_height(Height catch_up_interval) const;

    /// Package content for finalized `height`. Nullopt if the chain or beacon is missing.
    [[nodiscard]] std::optional<CatchUpContent> catch_up_content(Height height) const;

    /// Later of the first notarization and the beacon at `height - 1` entering the pool.
    [[nodiscard]] std::optional<Time> round_start_time(Height height) const;

private:
    const PoolSection& validated_;
};

} // namespace Subnet::Consensus
