#include "consensus/applier.hpp"
#include "consensus/change_set/engine.hpp"
#include "consensus/error.hpp"
#include "consensus_test_utils.hpp"
#include <gtest/gtest.h>

namespace Subnet::Consensus {

using namespace Testing;

namespace {

    std::vector<ArtifactId> ids_of(const PoolSection& section)
    {
        std::vector<ArtifactId> ids;
        for (const auto& e : section.ordered_entries())
            ids.push_back(e->id);
        return ids;
    }

} // namespace

class ChangeApplierTest : public ::testing::Test {
protected:
    TestSubnet subnet { 4 };
    ArtifactPool pool;
    ChangeApplier applier;
};

TEST_F(ChangeApplierTest, ApplyingTwiceEqualsApplyingOnce)
{
    auto tip = subnet.build_chain(pool, 2);
    auto stray = pool.insert_unvalidated(subnet.share(1, RandomTapeContent { .height = 1 }, 2), 0ms);
    ASSERT_TRUE(stray.has_value());
    auto proposal = subnet.proposal(tip, 3, 0, 0, 0ms);
    auto pending = pool.insert_unvalidated(proposal, 0ms);
    ASSERT_TRUE(pending.has_value());

    ChangeSet changes {
        MoveToValidated { .id = *pending },
        AddToValidated { subnet.share(2, NotarizationContent { .height = 3, .block = proposal.block_hash }, 3) },
        RemoveFromUnvalidated { .id = *stray },
        PurgeValidatedBelow { .height = 1 },
    };

    auto first = applier.apply(changes, pool, 5ms);
    EXPECT_EQ(first.applied, changes.size());
    EXPECT_EQ(first.added.size(), 1u);

    std::vector<ArtifactId> validated, unvalidated;
    {
        auto snapshot = pool.snapshot();
        validated = ids_of(snapshot.validated());
        unvalidated = ids_of(snapshot.unvalidated());
    }

    auto second = applier.apply(changes, pool, 9ms);
    EXPECT_EQ(second.applied, 0u);
    EXPECT_EQ(second.skipped, changes.size());
    EXPECT_TRUE(second.added.empty());

    auto snapshot = pool.snapshot();
    EXPECT_EQ(ids_of(snapshot.validated()), validated);
    EXPECT_EQ(ids_of(snapshot.unvalidated()), unvalidated);
}

TEST_F(ChangeApplierTest, EngineOutputIsIdempotent)
{
    subnet.build_chain(pool, 3);
    for (NodeId node = 0; node < subnet.ctx.N; ++node) {
        auto config = subnet.config(node);
        ChangeSetEngine<MockCrypto, VersionedTopology> engine(config, subnet.crypto[node], subnet.topology);
        ChangeSet changes;
        {
            auto snapshot = pool.snapshot();
            changes = engine.on_state_change(snapshot, 60s);
        }
        applier.apply(changes, pool, 60s);
        size_t before = pool.snapshot().validated().size();
        EXPECT_EQ(applier.apply(changes, pool, 61s).applied, 0u);
        EXPECT_EQ(pool.snapshot().validated().size(), before);
    }
}

TEST_F(ChangeApplierTest, MissingArtifactIsSkipped)
{
    ChangeSet changes { MoveToValidated { .id = Crypto::Utils::sha256(Crypto::as_span("nothing")) } };
    auto report = applier.apply(changes, pool, 0ms);
    EXPECT_EQ(report.applied, 0u);
    EXPECT_EQ(report.skipped, 1u);
}

TEST_F(ChangeApplierTest, AppliesInOrder)
{
    auto share = subnet.share(1, RandomTapeContent { .height = 4 }, 2);
    auto id = pool.insert_unvalidated(share, 0ms);
    ASSERT_TRUE(id.has_value());

    // The purge runs first, so the move finds nothing.
    ChangeSet changes { PurgeUnvalidatedBelow { .height = 5 }, MoveToValidated { .id = *id } };
    auto report = applier.apply(changes, pool, 0ms);
    EXPECT_EQ(report.applied, 1u);
    EXPECT_FALSE(pool.snapshot().validated().contains(*id));
}

TEST_F(ChangeApplierTest, ConflictingFinalizationIsFatal)
{
    auto tip = subnet.build_chain(pool, 2);
    auto other = subnet.proposal(tip, 2, 1, 1, 0ms);
    ChangeSet changes { AddToValidated { other }, AddToValidated { subnet.finalization(2, other.block_hash) } };

    EXPECT_THROW(applier.apply(changes, pool, 0ms), InvariantViolation);
}

} // namespace Subnet::Consensus
