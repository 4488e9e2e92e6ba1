#pragma once

#include "consensus/applier.hpp"
#include "consensus/change_set/engine.hpp"
#include "consensus/concept.hpp"
#include "consensus/config.hpp"
#include "consensus/error.hpp"
#include "consensus/logger.hpp"
#include "consensus/pool/artifact_pool.hpp"
#include "consensus/pool/pool_reader.hpp"
#include "consensus/trace.hpp"
#include "consensus/validator.hpp"
#include <atomic>
#include <expected>
#include <memory>

#include <fmt/format.h>

namespace Subnet::Consensus {

enum class DriverState : uint8_t {
    AwaitingGenesis,
    Running,
    Halted,
};

/**
 * Replica main loop. The caller owns the clock and calls tick() periodically;
 * the transport calls on_artifact_received() from any thread.
 *
 * One tick validates pending artifacts, runs the change-set engine on the same
 * snapshot, applies both change sets, broadcasts locally produced artifacts and
 * reports a new finalized height.
 **/
template <CryptoService C, MembershipRegistry R, Transceiver T, FinalizationListener L>
class Driver {
public:
    /// InvalidConfig if `config` fails validation.
    static std::expected<std::unique_ptr<Driver>, std::error_code> create(
        const ConsensusConfig& config, C& crypto, const R& registry, T& transport, L& listener)
    {
        if (auto valid = config.validate(); !valid) {
            std_out_logger(fmt::format("driver-{}", config.node_id))->error("Rejecting configuration: {}", valid.error().message());
            return std::unexpected(valid.error());
        }
        return std::unique_ptr<Driver>(new Driver(config, crypto, registry, transport, listener));
    }

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    void set_trace_recorder(TraceRecorder* recorder) { trace_ = recorder; }

    /// Installs the registry-provided genesis package. Trusted, not verified.
    std::expected<void, std::error_code> on_genesis(const CatchUpPackage& cup, Time now)
    {
        if (state_ != DriverState::AwaitingGenesis)
            return std::unexpected(Error::DuplicateArtifact);
        if (trace_)
            trace_->record(GenesisInstalled { .cup = cup, .time = now });
        if (auto added = pool_.add_to_validated(cup, now); !added)
            return std::unexpected(added.error());
        update_state();
        return {};
    }

    std::expected<ArtifactId, std::error_code> on_artifact_received(Artifact artifact, Time now)
    {
        if (trace_)
            trace_->record(ArtifactSeen { .artifact = artifact, .time = now });
        return pool_.insert_unvalidated(std::move(artifact), now);
    }

    ApplyReport tick(Time now)
    {
        if (state_ == DriverState::Halted)
            return {};

        ChangeSet changes;
        {
            auto snapshot = pool_.snapshot();
            changes = validator_.on_state_change(snapshot, now);
            auto produced = engine_.on_state_change(snapshot, now);
            changes.insert(changes.end(),
                std::make_move_iterator(produced.begin()), std::make_move_iterator(produced.end()));
        }

        if (trace_) {
            for (const auto& action : changes)
                trace_->record(ChangeActionSeen { .action = action });
            trace_->record(ApplyChanges { .time = now });
        }

        auto report = applier_.apply(changes, pool_, now);
        for (const auto& artifact : report.added)
            transport_.broadcast(artifact);

        update_state();
        return report;
    }

    /// Stops ticking; ingestion keeps buffering.
    void halt()
    {
        state_ = DriverState::Halted;
        logger_->info("Halted at finalized height {}", finalized_height_.load());
    }

    [[nodiscard]] DriverState state() const { return state_; }
    [[nodiscard]] Height finalized_height() const { return finalized_height_; }
    [[nodiscard]] const ArtifactPool& pool() const { return pool_; }

private:
    Driver(const ConsensusConfig& config, C& crypto, const R& registry, T& transport, L& listener)
        : config_(config)
        , transport_(transport)
        , listener_(listener)
        , logger_(std_out_logger(fmt::format("driver-{}", config.node_id)))
        , pool_(std_out_logger(fmt::format("pool-{}", config.node_id)))
        , validator_(config_, crypto, registry, std_out_logger(fmt::format("validator-{}", config.node_id)))
        , engine_(config_, crypto, registry, std_out_logger(fmt::format("engine-{}", config.node_id)))
        , applier_(std_out_logger(fmt::format("applier-{}", config.node_id)))
    {
    }

    void update_state()
    {
        std::optional<Height> round;
        {
            auto snapshot = pool_.snapshot();
            round = PoolReader(snapshot.validated()).current_round();
        }
        if (!round)
            return;

        if (state_ == DriverState::AwaitingGenesis) {
            state_ = DriverState::Running;
            logger_->info("Running from height {}", *round);
        } else if (*round > finalized_height_) {
            logger_->info("Finalized height {}", *round);
        } else {
            return;
        }
        finalized_height_ = *round;
        listener_.on_finalized_height(*round);
    }

    ConsensusConfig config_;
    T& transport_;
    L& listener_;
    Logger logger_;

    ArtifactPool pool_;
    Validator<C, R> validator_;
    ChangeSetEngine<C, R> engine_;
    ChangeApplier applier_;

    std::atomic<DriverState> state_ { DriverState::AwaitingGenesis };
    std::atomic<Height> finalized_height_ { 0 };
    TraceRecorder* trace_ = nullptr;
};

} // namespace Subnet::Consensus
