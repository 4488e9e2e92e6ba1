#pragma once

#include "consensus/change_action.hpp"
#include "consensus/concept.hpp"
#include "consensus/config.hpp"
#include "consensus/logger.hpp"
#include "consensus/pool/pool_reader.hpp"
#include "consensus/rank.hpp"
#include <set>

namespace Subnet::Consensus {

/**
 * Decides which unvalidated artifacts enter the validated partition.
 *
 * Accepted artifacts yield MoveToValidated, permanently invalid or redundant
 * ones RemoveFromUnvalidated. Artifacts with missing dependencies stay put and
 * are looked at again on the next call.
 **/
template <CryptoService C, MembershipRegistry R>
class Validator {
public:
    Validator(const ConsensusConfig& config, const C& crypto, const R& registry,
        Logger logger = std_out_logger("validator"))
        : config_(config)
        , crypto_(crypto)
        , registry_(registry)
        , logger_(std::move(logger))
    {
    }

    ChangeSet on_state_change(const PoolSnapshot& snapshot, Time now) const
    {
        PoolReader pool(snapshot.validated());
        const Height lowest = pool.lowest_unresolved_height(config_.catch_up_interval);
        const Height highest = pool.notarized_height() + 1;

        ChangeSet changes;
        for (const auto& entry : snapshot.unvalidated().ordered_entries()) {
            const Height h = height_of(entry->artifact);
            bool in_window = h >= lowest && h <= highest;
            if (!in_window && !std::holds_alternative<CatchUpPackage>(entry->artifact))
                continue;

            switch (std::visit([&](const auto& a) { return check(pool, a, now); }, entry->artifact)) {
            case Verdict::Accept:
                changes.emplace_back(MoveToValidated { .id = entry->id });
                break;
            case Verdict::Reject:
                changes.emplace_back(RemoveFromUnvalidated { .id = entry->id });
                break;
            case Verdict::Defer:
                break;
            }
        }
        return changes;
    }

private:
    enum class Verdict { Accept, Reject, Defer };

    std::optional<SystemContext> context_at(Height h) const
    {
        auto members = registry_.members_at(h, config_.subnet_id);
        if (!members)
            return std::nullopt;
        return SystemContext::for_members(static_cast<int>(members->size()));
    }

    bool is_member(NodeId node, Height h) const
    {
        auto members = registry_.members_at(h, config_.subnet_id);
        return members && members->contains(node);
    }

    template <typename Content>
    Verdict verify_share(const Share<Content>& share, int threshold) const
    {
        if (crypto_.verify_share(share.signer, signed_bytes(share.content), share.signature, threshold))
            return Verdict::Accept;
        logger_->warn("Share verification failed: {}", describe(Artifact { share }));
        return Verdict::Reject;
    }

    template <typename Content>
    Verdict verify_aggregate(const Aggregate<Content>& aggregate, int threshold) const
    {
        if (crypto_.verify_aggregate(signed_bytes(aggregate.content), aggregate.signature, threshold))
            return Verdict::Accept;
        logger_->warn("Aggregate verification failed: {}", describe(Artifact { aggregate }));
        return Verdict::Reject;
    }

    Verdict check(const PoolReader& pool, const RandomBeaconShare& share, Time) const
    {
        const Height h = share.content.height;
        if (h == 0 || pool.random_beacon(h) != nullptr)
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx)
            return Verdict::Defer;
        if (!is_member(share.signer, h))
            return Verdict::Reject;
        auto parent = pool.random_beacon_hash(h - 1);
        if (!parent)
            return Verdict::Defer;
        if (share.content.parent != *parent)
            return Verdict::Reject;
        return verify_share(share, ctx->low_threshold());
    }

    Verdict check(const PoolReader& pool, const RandomBeacon& beacon, Time) const
    {
        const Height h = beacon.content.height;
        if (h == 0 || pool.random_beacon(h) != nullptr)
            return Verdict::Reject;
        auto ctx = context_at(h);
        auto parent = pool.random_beacon_hash(h - 1);
        if (!ctx || !parent)
            return Verdict::Defer;
        if (beacon.content.parent != *parent)
            return Verdict::Reject;
        return verify_aggregate(beacon, ctx->low_threshold());
    }

    Verdict check(const PoolReader& pool, const RandomTapeShare& share, Time) const
    {
        const Height h = share.content.height;
        if (pool.random_tape(h) != nullptr)
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx)
            return Verdict::Defer;
        if (!is_member(share.signer, h))
            return Verdict::Reject;
        return verify_share(share, ctx->low_threshold());
    }

    Verdict check(const PoolReader& pool, const RandomTape& tape, Time) const
    {
        const Height h = tape.content.height;
        if (pool.random_tape(h) != nullptr)
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx)
            return Verdict::Defer;
        return verify_aggregate(tape, ctx->low_threshold());
    }

    Verdict check(const PoolReader& pool, const BlockProposal& proposal, Time now) const
    {
        const Block& block = proposal.block;
        const Height h = block.height;
        if (h == 0 || block_hash(block) != proposal.block_hash || proposal.signer != block.proposer)
            return Verdict::Reject;
        if (!registry_.members_at(h, config_.subnet_id))
            return Verdict::Defer;
        if (!is_member(proposal.signer, h))
            return Verdict::Reject;

        auto parent = pool.block(h - 1, block.parent);
        if (!parent || !pool.is_notarized(h - 1, block.parent))
            return Verdict::Defer;
        if (block.time < parent->block->time)
            return Verdict::Reject;

        auto rank = block_maker_rank(pool, registry_, h, proposal.signer, config_.subnet_id);
        if (!rank)
            return Verdict::Defer;
        if (*rank != block.rank) {
            logger_->warn("Rank mismatch: {} claims rank {}, expected {}", describe(Artifact { proposal }), block.rank, *rank);
            return Verdict::Reject;
        }

        if (!crypto_.verify(proposal.signer, signed_bytes(block), proposal.signature)) {
            logger_->warn("Proposal signature verification failed: {}", describe(Artifact { proposal }));
            return Verdict::Reject;
        }

        auto start = pool.round_start_time(h);
        if (!start || now < *start + block_maker_timeout(config_, *rank))
            return Verdict::Defer;
        return Verdict::Accept;
    }

    Verdict check(const PoolReader& pool, const NotarizationShare& share, Time) const
    {
        const Height h = share.content.height;
        if (pool.is_notarized(h, share.content.block))
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx || !pool.block(h, share.content.block))
            return Verdict::Defer;
        if (!is_member(share.signer, h))
            return Verdict::Reject;
        return verify_share(share, ctx->high_threshold());
    }

    Verdict check(const PoolReader& pool, const Notarization& notarization, Time) const
    {
        const Height h = notarization.content.height;
        if (pool.is_notarized(h, notarization.content.block))
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx || !pool.block(h, notarization.content.block))
            return Verdict::Defer;
        return verify_aggregate(notarization, ctx->high_threshold());
    }

    Verdict check(const PoolReader& pool, const FinalizationShare& share, Time) const
    {
        const Height h = share.content.height;
        if (pool.finalized_height() >= h)
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx || !pool.is_notarized(h, share.content.block) || !pool.block(h, share.content.block))
            return Verdict::Defer;
        if (!is_member(share.signer, h))
            return Verdict::Reject;
        return verify_share(share, ctx->high_threshold());
    }

    Verdict check(const PoolReader& pool, const Finalization& finalization, Time) const
    {
        const Height h = finalization.content.height;
        for (const auto& f : pool.validated().template get<Finalization>(h)) {
            if (f.content.block == finalization.content.block)
                return Verdict::Reject;
        }
        auto ctx = context_at(h);
        if (!ctx || !pool.block(h, finalization.content.block))
            return Verdict::Defer;
        return verify_aggregate(finalization, ctx->high_threshold());
    }

    Verdict check(const PoolReader& pool, const CatchUpPackageShare& share, Time) const
    {
        const Height h = share.content.block.height;
        if (h <= pool.catch_up_height() || h % config_.catch_up_interval != 0)
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx || h > pool.finalized_height())
            return Verdict::Defer;
        if (!is_member(share.signer, h))
            return Verdict::Reject;

        auto expected = pool.catch_up_content(h);
        if (!expected)
            return Verdict::Defer;
        if (!(*expected == share.content)) {
            logger_->warn("Catch-up share disagrees with the local chain: {}", describe(Artifact { share }));
            return Verdict::Reject;
        }
        return verify_share(share, ctx->high_threshold());
    }

    Verdict check(const PoolReader& pool, const CatchUpPackage& cup, Time) const
    {
        const Height h = cup.content.block.height;
        if (h <= pool.catch_up_height() || cup.content.random_beacon.content.height != h)
            return Verdict::Reject;
        auto ctx = context_at(h);
        if (!ctx)
            return Verdict::Defer;
        return verify_aggregate(cup, ctx->high_threshold());
    }

    const ConsensusConfig& config_;
    const C& crypto_;
    const R& registry_;
    Logger logger_;
};

} // namespace Subnet::Consensus
