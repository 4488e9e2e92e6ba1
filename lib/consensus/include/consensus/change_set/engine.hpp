#pragma once

#include "consensus/change_action.hpp"
#include "consensus/concept.hpp"
#include "consensus/config.hpp"
#include "consensus/logger.hpp"
#include "consensus/pool/pool_reader.hpp"
#include "consensus/rank.hpp"
#include <algorithm>
#include <set>
#include <vector>

namespace Subnet::Consensus {

/**
 * Computes the next moves of the local node from a pool snapshot and the
 * current time. Reads only; the result is handed to the ChangeApplier.
 *
 * Heights are visited lowest first, from the lowest unresolved height up to
 * notarized_height + 1. Within a height the order is: random beacon, random
 * tape, block proposal, notarization, finalization, catch-up package. Purge
 * actions come last.
 **/
template <CryptoService C, MembershipRegistry R>
class ChangeSetEngine {
public:
    ChangeSetEngine(const ConsensusConfig& config, C& crypto, const R& registry,
        Logger logger = std_out_logger("engine"))
        : config_(config)
        , crypto_(crypto)
        , registry_(registry)
        , logger_(std::move(logger))
    {
    }

    ChangeSet on_state_change(const PoolSnapshot& snapshot, Time now) const
    {
        PoolReader pool(snapshot.validated());
        ChangeSet changes;
        if (!pool.current_round())
            return changes;

        const Height lowest = pool.lowest_unresolved_height(config_.catch_up_interval);
        const Height notarized = pool.notarized_height();

        for (Height h = std::max<Height>(lowest, 1); h <= notarized + 1; ++h) {
            auto members = registry_.members_at(h, config_.subnet_id);
            if (!members)
                continue;
            Round round {
                .pool = pool,
                .height = h,
                .ctx = SystemContext::for_members(static_cast<int>(members->size())),
                .is_member = members->contains(config_.node_id),
                .now = now,
            };

            random_beacon_step(round, changes);
            random_tape_step(round, changes);
            block_maker_step(round, changes);
            notary_step(round, changes);
            notarization_aggregation_step(round, changes);
            finalizer_step(round, changes);
            finalization_aggregation_step(round, changes);
            catch_up_step(round, changes);
        }

        purge_step(pool, snapshot.unvalidated(), lowest, changes);
        return changes;
    }

private:
    struct Round {
        const PoolReader& pool;
        Height height;
        SystemContext ctx;
        bool is_member;
        Time now;
    };

    template <typename Content>
    bool has_own_share(const PoolReader& pool, Height h) const
    {
        return std::ranges::any_of(pool.validated().template get<Share<Content>>(h),
            [&](const auto& s) { return s.signer == config_.node_id; });
    }

    template <typename Content>
    void emit_share(const Content& content, int threshold, ChangeSet& out) const
    {
        auto sig = crypto_.sign_share(signed_bytes(content), threshold);
        if (!sig) {
            logger_->error("Signing share failed: {}", sig.error().message());
            return;
        }
        out.emplace_back(AddToValidated { Share<Content> {
            .content = content,
            .signer = config_.node_id,
            .signature = std::move(*sig) } });
    }

    // Nullopt while fewer than `threshold` distinct signers agree on `content`.
    template <typename Content>
    std::optional<Aggregate<Content>> aggregate(const PoolReader& pool, Height h, const Content& content, int threshold) const
    {
        std::set<NodeId> signers;
        std::vector<SignatureShare> shares;
        for (const auto& s : pool.validated().template get<Share<Content>>(h)) {
            if (s.content == content && signers.insert(s.signer).second)
                shares.push_back({ .signer = s.signer, .signature = s.signature });
        }
        if (shares.size() < static_cast<size_t>(threshold))
            return std::nullopt;

        auto sig = crypto_.combine(signed_bytes(content), shares, threshold);
        if (!sig) {
            logger_->debug("Combining {} shares at height {} failed: {}", shares.size(), h, sig.error().message());
            return std::nullopt;
        }
        return Aggregate<Content> {
            .content = content,
            .signature = std::move(*sig),
            .signers = { signers.begin(), signers.end() },
        };
    }

    void random_beacon_step(const Round& r, ChangeSet& out) const
    {
        if (r.pool.random_beacon(r.height) != nullptr)
            return;
        auto parent = r.pool.random_beacon_hash(r.height - 1);
        if (!parent)
            return;

        RandomBeaconContent content { .height = r.height, .parent = *parent };
        if (r.is_member && !has_own_share<RandomBeaconContent>(r.pool, r.height))
            emit_share(content, r.ctx.low_threshold(), out);
        if (auto beacon = aggregate(r.pool, r.height, content, r.ctx.low_threshold()))
            out.emplace_back(AddToValidated { std::move(*beacon) });
    }

    void random_tape_step(const Round& r, ChangeSet& out) const
    {
        if (r.height > r.pool.finalized_height() + 1 || r.pool.random_tape(r.height) != nullptr)
            return;

        RandomTapeContent content { .height = r.height };
        if (r.is_member && !has_own_share<RandomTapeContent>(r.pool, r.height))
            emit_share(content, r.ctx.low_threshold(), out);
        if (auto tape = aggregate(r.pool, r.height, content, r.ctx.low_threshold()))
            out.emplace_back(AddToValidated { std::move(*tape) });
    }

    void block_maker_step(const Round& r, ChangeSet& out) const
    {
        const Height h = r.height;
        if (h != r.pool.notarized_height() + 1 || !r.is_member)
            return;

        auto rank = block_maker_rank(r.pool, registry_, h, config_.node_id, config_.subnet_id);
        if (!rank)
            return;
        for (const auto& p : r.pool.validated().template get<BlockProposal>(h)) {
            if (p.signer == config_.node_id || p.block.rank < *rank)
                return;
        }

        auto start = r.pool.round_start_time(h);
        if (!start || r.now < *start + block_maker_timeout(config_, *rank))
            return;

        auto parents = r.pool.notarized_blocks(h - 1);
        if (parents.empty())
            return;
        auto parent = std::ranges::min(parents, [](const BlockRef& a, const BlockRef& b) {
            if (a.block->rank != b.block->rank)
                return a.block->rank < b.block->rank;
            return a.hash < b.hash;
        });

        Block block {
            .parent = parent.hash,
            .height = h,
            .rank = *rank,
            .proposer = config_.node_id,
            .time = std::max(r.now, parent.block->time),
            .payload = {},
        };
        auto sig = crypto_.sign(signed_bytes(block));
        if (!sig) {
            logger_->error("Signing block proposal at height {} failed: {}", h, sig.error().message());
            return;
        }
        logger_->debug("Proposing block at height {} with rank {}", h, *rank);
        auto hash = block_hash(block);
        out.emplace_back(AddToValidated { BlockProposal {
            .block = std::move(block),
            .block_hash = hash,
            .signer = config_.node_id,
            .signature = std::move(*sig) } });
    }

    void notary_step(const Round& r, ChangeSet& out) const
    {
        const Height h = r.height;
        if (h != r.pool.notarized_height() + 1 || !r.is_member)
            return;
        auto start = r.pool.round_start_time(h);
        if (!start)
            return;

        std::vector<BlockRef> candidates;
        for (const auto& ref : r.pool.blocks_at(h)) {
            if (r.pool.is_notarized(h - 1, ref.block->parent)
                && r.now >= *start + notary_delay(config_, ref.block->rank))
                candidates.push_back(ref);
        }
        if (candidates.empty())
            return;
        auto best = std::ranges::min(candidates, {}, [](const BlockRef& ref) { return ref.block->rank; }).block->rank;

        std::vector<Hash> signed_blocks;
        for (const auto& s : r.pool.validated().template get<NotarizationShare>(h)) {
            if (s.signer != config_.node_id)
                continue;
            auto ref = r.pool.block(h, s.content.block);
            if (ref && ref->block->rank < best)
                return;
            signed_blocks.push_back(s.content.block);
        }

        for (const auto& ref : candidates) {
            if (ref.block->rank == best && std::ranges::find(signed_blocks, ref.hash) == signed_blocks.end())
                emit_share(NotarizationContent { .height = h, .block = ref.hash }, r.ctx.high_threshold(), out);
        }
    }

    void notarization_aggregation_step(const Round& r, ChangeSet& out) const
    {
        const Height h = r.height;
        std::vector<Hash> seen;
        for (const auto& s : r.pool.validated().template get<NotarizationShare>(h)) {
            const Hash& hash = s.content.block;
            if (std::ranges::find(seen, hash) != seen.end())
                continue;
            seen.push_back(hash);
            if (r.pool.is_notarized(h, hash) || !r.pool.block(h, hash))
                continue;
            if (auto notarization = aggregate(r.pool, h, s.content, r.ctx.high_threshold()))
                out.emplace_back(AddToValidated { std::move(*notarization) });
        }
    }

    void finalizer_step(const Round& r, ChangeSet& out) const
    {
        const Height h = r.height;
        if (!r.is_member || h <= r.pool.finalized_height() || h > r.pool.notarized_height())
            return;
        auto surviving = r.pool.surviving_notarized_blocks(h);
        if (surviving.size() != 1 || has_own_share<FinalizationContent>(r.pool, h))
            return;

        const Hash& hash = surviving.front().hash;
        for (const auto& s : r.pool.validated().template get<NotarizationShare>(h)) {
            if (s.signer == config_.node_id && s.content.block != hash)
                return;
        }
        emit_share(FinalizationContent { .height = h, .block = hash }, r.ctx.high_threshold(), out);
    }

    void finalization_aggregation_step(const Round& r, ChangeSet& out) const
    {
        const Height h = r.height;
        if (h <= r.pool.finalized_height() || h > r.pool.notarized_height())
            return;
        if (r.pool.validated().count(h, ArtifactKind::Finalization) > 0)
            return;

        auto surviving = r.pool.surviving_notarized_blocks(h);
        if (surviving.size() > 1) {
            logger_->debug("Equivocation at height {}: {} notarized blocks", h, surviving.size());
            return;
        }
        if (surviving.empty())
            return;

        FinalizationContent content { .height = h, .block = surviving.front().hash };
        if (auto finalization = aggregate(r.pool, h, content, r.ctx.high_threshold()))
            out.emplace_back(AddToValidated { std::move(*finalization) });
    }

    void catch_up_step(const Round& r, ChangeSet& out) const
    {
        const Height h = r.height;
        if (h != r.pool.next_catch_up_height(config_.catch_up_interval) || h > r.pool.finalized_height())
            return;
        auto content = r.pool.catch_up_content(h);
        if (!content)
            return;

        if (r.is_member && !has_own_share<CatchUpContent>(r.pool, h))
            emit_share(*content, r.ctx.high_threshold(), out);
        if (auto cup = aggregate(r.pool, h, *content, r.ctx.high_threshold())) {
            logger_->info("Catch-up package at height {}", h);
            out.emplace_back(AddToValidated { std::move(*cup) });
        }
    }

    void purge_step(const PoolReader& pool, const PoolSection& unvalidated, Height lowest, ChangeSet& out) const
    {
        if (auto min = unvalidated.min_height(); min && *min < lowest)
            out.emplace_back(PurgeUnvalidatedBelow { .height = lowest });

        const Height finalized = pool.finalized_height();
        if (finalized <= config_.validated_retention)
            return;
        const Height threshold = std::min(pool.catch_up_height(), finalized - config_.validated_retention);
        if (auto min = pool.validated().min_height(); min && *min < threshold)
            out.emplace_back(PurgeValidatedBelow { .height = threshold });
    }

    const ConsensusConfig& config_;
    C& crypto_;
    const R& registry_;
    Logger logger_;
};

} // namespace Subnet::Consensus
