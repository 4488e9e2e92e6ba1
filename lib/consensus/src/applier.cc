#include "consensus/applier.hpp"
#include "consensus/error.hpp"

namespace Subnet::Consensus {

namespace {

    struct ApplyVisitor {
        ArtifactPool& pool;
        Time now;
        const Logger& logger;
        ApplyReport& report;

        void operator()(const AddToValidated& a) const
        {
            auto added = pool.add_to_validated(a.artifact, now);
            if (!added) {
                record_failure(added.error(), describe(a.artifact));
                return;
            }
            ++report.applied;
            report.added.push_back(a.artifact);
        }

        void operator()(const MoveToValidated& a) const
        {
            auto moved = pool.move_to_validated(a.id, now);
            if (!moved) {
                record_failure(moved.error(), short_hex(a.id));
                return;
            }
            ++report.applied;
        }

        void operator()(const RemoveFromUnvalidated& a) const
        {
            auto removed = pool.remove_unvalidated(a.id);
            if (!removed) {
                record_failure(removed.error(), short_hex(a.id));
                return;
            }
            ++report.applied;
        }

        void operator()(const PurgeUnvalidatedBelow& a) const
        {
            if (pool.purge_unvalidated_below(a.height) > 0)
                ++report.applied;
            else
                ++report.skipped;
        }

        void operator()(const PurgeValidatedBelow& a) const
        {
            if (pool.purge_validated_below(a.height) > 0)
                ++report.applied;
            else
                ++report.skipped;
        }

        // Both outcomes mean the action was already satisfied.
        void record_failure(const std::error_code& ec, const std::string& what) const
        {
            ++report.skipped;
            if (ec == Error::DuplicateArtifact || ec == Error::NotFound)
                logger->debug("Skipped {}: {}", what, ec.message());
            else
                logger->warn("Failed to apply {}: {}", what, ec.message());
        }
    };

} // namespace

ApplyReport ChangeApplier::apply(const ChangeSet& changes, ArtifactPool& pool, Time now) const
{
    ApplyReport report;
    ApplyVisitor visitor { .pool = pool, .now = now, .logger = logger_, .report = report };
    for (const auto& action : changes)
        std::visit(visitor, action);
    return report;
}

} // namespace Subnet::Consensus
