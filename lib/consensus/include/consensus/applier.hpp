#pragma once

#include "consensus/change_action.hpp"
#include "consensus/logger.hpp"
#include "consensus/pool/artifact_pool.hpp"
#include <vector>

namespace Subnet::Consensus {

struct ApplyReport {
    size_t applied = 0; ///< Actions that changed the pool
    size_t skipped = 0; ///< Actions already satisfied
    std::vector<Artifact> added; ///< Newly added local artifacts, in order
};

/**
 * Applies a change set to the pool, strictly in order.
 * Re-applying an action that is already satisfied is a no-op.
 * InvariantViolation from the pool propagates to the caller.
 **/
class ChangeApplier {
public:
    explicit ChangeApplier(Logger logger = std_out_logger("applier"))
        : logger_(std::move(logger))
    {
    }

    ApplyReport apply(const ChangeSet& changes, ArtifactPool& pool, Time now) const;

private:
    Logger logger_;
};

} // namespace Subnet::Consensus
