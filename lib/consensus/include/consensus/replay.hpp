#pragma once

#include "consensus/applier.hpp"
#include "consensus/change_set/engine.hpp"
#include "consensus/concept.hpp"
#include "consensus/config.hpp"
#include "consensus/logger.hpp"
#include "consensus/pool/artifact_pool.hpp"
#include "consensus/rank.hpp"
#include "consensus/topology.hpp"
#include "consensus/trace.hpp"
#include "consensus/validator.hpp"
#include <optional>
#include <span>
#include <vector>

namespace Subnet::Consensus {

/// First point where a recorded replica did something the engine would not.
struct Divergence {
    size_t event_index = 0;
    Time time {};
    Height height = 0; ///< notarized_height + 1 when the round was computed
    std::optional<Rank> rank;
    std::optional<Time> round_start;
    std::optional<Duration> block_maker_timeout;
    std::optional<uint64_t> registry_version;
    std::vector<ChangeAction> unexpected; ///< Observed, not computed
    std::vector<ChangeAction> observed;
    ChangeSet computed;
    std::vector<Artifact> validated_pool; ///< Ordered by height, then kind
    std::vector<Artifact> unvalidated_pool;
};

struct ReplayResult {
    size_t rounds = 0;
    std::optional<Divergence> divergence;

    [[nodiscard]] bool ok() const { return !divergence; }
};

/// Logs the round context, the pool and both change sets at error level.
void report_divergence(const Logger& logger, const Divergence& divergence);

/// Observed actions with no counterpart in `computed`, matched as a multiset by ActionKey.
std::vector<ChangeAction> unmatched_actions(std::span<const ChangeAction> observed, std::span<const ChangeAction> computed);

/**
 * Checks a recorded trace against the engine. Every ApplyChanges must apply a
 * sub-multiset of what the validator and engine compute on the replayed pool;
 * the observed actions are then applied and the fold continues.
 **/
template <CryptoService C>
class Replay {
public:
    Replay(const ConsensusConfig& config, C& crypto, Logger logger = std_out_logger("replay"))
        : config_(config)
        , crypto_(crypto)
        , logger_(std::move(logger))
    {
    }

    ReplayResult run(std::span<const TraceEvent> events)
    {
        VersionedTopology topology;
        ArtifactPool pool(logger_);
        ChangeApplier applier(logger_);
        Validator<C, VersionedTopology> validator(config_, crypto_, topology, logger_);
        ChangeSetEngine<C, VersionedTopology> engine(config_, crypto_, topology, logger_);

        ReplayResult result;
        std::vector<ChangeAction> observed;

        for (size_t i = 0; i < events.size(); ++i) {
            const auto& event = events[i];

            if (const auto* e = std::get_if<SubnetFound>(&event)) {
                if (auto v = topology.add_version(e->subnet, e->from_height, e->members); !v)
                    logger_->warn("Ignoring membership version at height {}: {}", e->from_height, v.error().message());
            } else if (const auto* e = std::get_if<GenesisInstalled>(&event)) {
                if (auto added = pool.add_to_validated(e->cup, e->time); !added)
                    logger_->warn("Genesis package rejected: {}", added.error().message());
            } else if (const auto* e = std::get_if<ArtifactSeen>(&event)) {
                if (auto inserted = pool.insert_unvalidated(e->artifact, e->time); !inserted)
                    logger_->debug("Replayed {} not inserted: {}", describe(e->artifact), inserted.error().message());
            } else if (const auto* e = std::get_if<ChangeActionSeen>(&event)) {
                observed.push_back(e->action);
            } else if (const auto* e = std::get_if<ApplyChanges>(&event)) {
                std::optional<Divergence> divergence;
                {
                    auto snapshot = pool.snapshot();
                    auto computed = validator.on_state_change(snapshot, e->time);
                    auto produced = engine.on_state_change(snapshot, e->time);
                    computed.insert(computed.end(), produced.begin(), produced.end());

                    auto unexpected = unmatched_actions(observed, computed);
                    if (!unexpected.empty())
                        divergence = describe_divergence(snapshot, topology,
                            i, e->time, std::move(unexpected), observed, std::move(computed));
                }
                if (divergence) {
                    logger_->error("Trace diverges at event {} (height {}): {} unexpected actions",
                        divergence->event_index, divergence->height, divergence->unexpected.size());
                    result.divergence = std::move(divergence);
                    return result;
                }

                applier.apply(observed, pool, e->time);
                observed.clear();
                ++result.rounds;
            }
        }
        return result;
    }

private:
    Divergence describe_divergence(const PoolSnapshot& snapshot, const VersionedTopology& topology,
        size_t index, Time time, std::vector<ChangeAction> unexpected, std::vector<ChangeAction> observed, ChangeSet computed) const
    {
        PoolReader pool(snapshot.validated());
        const Height h = pool.notarized_height() + 1;
        Divergence d {
            .event_index = index,
            .time = time,
            .height = h,
            .rank = block_maker_rank(pool, topology, h, config_.node_id, config_.subnet_id),
            .round_start = pool.round_start_time(h),
            .block_maker_timeout = std::nullopt,
            .registry_version = topology.registry_version(h, config_.subnet_id),
            .unexpected = std::move(unexpected),
            .observed = std::move(observed),
            .computed = std::move(computed),
            .validated_pool = {},
            .unvalidated_pool = {},
        };
        if (d.rank)
            d.block_maker_timeout = block_maker_timeout(config_, *d.rank);
        for (const auto& entry : snapshot.validated().ordered_entries())
            d.validated_pool.push_back(entry->artifact);
        for (const auto& entry : snapshot.unvalidated().ordered_entries())
            d.unvalidated_pool.push_back(entry->artifact);
        return d;
    }

    ConsensusConfig config_;
    C& crypto_;
    Logger logger_;
};

} // namespace Subnet::Consensus
