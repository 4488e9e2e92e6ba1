#include "consensus/change_set/engine.hpp"
#include "consensus_test_utils.hpp"
#include <gtest/gtest.h>

namespace Subnet::Consensus {

using namespace Testing;

class ChangeSetEngineTest : public ::testing::Test {
protected:
    TestSubnet subnet { 4 };
    ArtifactPool pool;

    ChangeSet run(NodeId node, Time now)
    {
        auto config = subnet.config(node);
        MockCrypto crypto { .self = node };
        ChangeSetEngine<MockCrypto, VersionedTopology> engine(config, crypto, subnet.topology);
        auto snapshot = pool.snapshot();
        return engine.on_state_change(snapshot, now);
    }

    void add(Artifact artifact, Time at = Time {})
    {
        ASSERT_TRUE(pool.add_to_validated(std::move(artifact), at).has_value());
    }

    Hash beacon_hash_at(Height h)
    {
        auto snapshot = pool.snapshot();
        return *PoolReader(snapshot.validated()).random_beacon_hash(h);
    }

    NodeId node_with_rank(Rank rank, Height h)
    {
        auto snapshot = pool.snapshot();
        PoolReader reader(snapshot.validated());
        for (NodeId i = 0; i < subnet.ctx.N; ++i) {
            if (block_maker_rank(reader, subnet.topology, h, i, subnet.subnet_id) == rank)
                return i;
        }
        ADD_FAILURE() << "no node with rank " << rank;
        return -1;
    }
};

TEST_F(ChangeSetEngineTest, NothingBeforeGenesis)
{
    EXPECT_TRUE(run(0, 10s).empty());
}

TEST_F(ChangeSetEngineTest, FirstRoundAfterGenesis)
{
    add(genesis_catch_up_package());
    auto leader = node_with_rank(0, 1);

    auto changes = run(leader, 0ms);
    ASSERT_EQ(changes.size(), 3u);
    auto beacon_share = std::get<RandomBeaconShare>(std::get<AddToValidated>(changes[0]).artifact);
    EXPECT_EQ(beacon_share.content.height, 1u);
    EXPECT_EQ(beacon_share.content.parent, beacon_hash_at(0));
    EXPECT_TRUE(std::holds_alternative<RandomTapeShare>(std::get<AddToValidated>(changes[1]).artifact));
    auto proposal = std::get<BlockProposal>(std::get<AddToValidated>(changes[2]).artifact);
    EXPECT_EQ(proposal.block.rank, 0u);
    EXPECT_EQ(proposal.block.parent, block_hash(genesis_catch_up_package().content.block));
    EXPECT_EQ(proposal.block_hash, block_hash(proposal.block));
}

TEST_F(ChangeSetEngineTest, BeaconNeedsLowThreshold)
{
    add(genesis_catch_up_package());
    RandomBeaconContent content { .height = 1, .parent = beacon_hash_at(0) };
    add(subnet.share(0, content, subnet.ctx.low_threshold()));
    EXPECT_EQ(count_added<RandomBeacon>(run(3, 0ms)), 0u);

    add(subnet.share(2, content, subnet.ctx.low_threshold()));
    auto beacons = added<RandomBeacon>(run(3, 0ms));
    ASSERT_EQ(beacons.size(), 1u);
    EXPECT_EQ(beacons[0].content, content);
    EXPECT_EQ(beacons[0].signers, (std::vector<NodeId> { 0, 2 }));
}

TEST_F(ChangeSetEngineTest, NoSecondShareFromSameNode)
{
    add(genesis_catch_up_package());
    RandomBeaconContent content { .height = 1, .parent = beacon_hash_at(0) };
    add(subnet.share(1, content, subnet.ctx.low_threshold()));
    EXPECT_EQ(count_added<RandomBeaconShare>(run(1, 0ms)), 0u);
}

// Rank 0 proposes at the round start; rank 1 exactly one block-maker timeout later.
TEST_F(ChangeSetEngineTest, BackupProposerWaitsForItsTimeout)
{
    add(genesis_catch_up_package(), 0ms);
    auto leader = node_with_rank(0, 1);
    auto backup = node_with_rank(1, 1);
    const auto delta = block_maker_timeout(subnet.config(backup), 1);
    ASSERT_EQ(delta, 2000ms);

    EXPECT_EQ(count_added<BlockProposal>(run(leader, 0ms)), 1u);

    for (Time t : { 0ms, 1000ms, delta - 1ms })
        EXPECT_EQ(count_added<BlockProposal>(run(backup, t)), 0u) << "at " << t.count() << "ms";

    auto proposals = added<BlockProposal>(run(backup, delta));
    ASSERT_EQ(proposals.size(), 1u);
    EXPECT_EQ(proposals[0].block.rank, 1u);
    EXPECT_EQ(proposals[0].signer, backup);
    EXPECT_EQ(proposals[0].block.time, delta);
}

TEST_F(ChangeSetEngineTest, NoProposalWhenBetterRankIsValidated)
{
    add(genesis_catch_up_package(), 0ms);
    auto leader = node_with_rank(0, 1);
    auto backup = node_with_rank(1, 1);
    add(subnet.proposal(block_hash(genesis_catch_up_package().content.block), 1, leader, 0, 0ms));

    EXPECT_EQ(count_added<BlockProposal>(run(backup, 10s)), 0u);
}

TEST_F(ChangeSetEngineTest, ProposesOnlyAboveNotarizedHeight)
{
    auto tip = subnet.build_chain(pool, 3);
    add(subnet.beacon(beacon_hash_at(3), 4));
    add(subnet.proposal(tip, 4, node_with_rank(2, 4), 2, 0ms));

    for (NodeId node = 0; node < subnet.ctx.N; ++node) {
        for (const auto& p : added<BlockProposal>(run(node, 60s)))
            EXPECT_EQ(p.block.height, 4u);
    }
}

TEST_F(ChangeSetEngineTest, NotaryWaitsForNotaryDelay)
{
    auto tip = subnet.build_chain(pool, 3);
    auto leader = node_with_rank(0, 4);
    auto proposal = subnet.proposal(tip, 4, leader, 0, 0ms);
    add(proposal);

    EXPECT_EQ(count_added<NotarizationShare>(run(2, 599ms)), 0u);
    auto shares = added<NotarizationShare>(run(2, 600ms));
    ASSERT_EQ(shares.size(), 1u);
    EXPECT_EQ(shares[0].content.block, proposal.block_hash);
    EXPECT_EQ(shares[0].signer, 2);
}

TEST_F(ChangeSetEngineTest, NotaryIgnoresWorseRankAfterSigningBetter)
{
    auto tip = subnet.build_chain(pool, 3);
    auto best = subnet.proposal(tip, 4, node_with_rank(0, 4), 0, 0ms);
    auto worse = subnet.proposal(tip, 4, node_with_rank(1, 4), 1, 0ms);
    add(best);
    add(subnet.share(2, NotarizationContent { .height = 4, .block = best.block_hash }, subnet.ctx.high_threshold()));
    add(worse);

    EXPECT_EQ(count_added<NotarizationShare>(run(2, 60s)), 0u);
}

TEST_F(ChangeSetEngineTest, NotarizationFromHighThreshold)
{
    auto tip = subnet.build_chain(pool, 3);
    auto proposal = subnet.proposal(tip, 4, node_with_rank(0, 4), 0, 0ms);
    add(proposal);
    NotarizationContent content { .height = 4, .block = proposal.block_hash };
    for (NodeId signer : { 0, 1 })
        add(subnet.share(signer, content, subnet.ctx.high_threshold()));
    EXPECT_EQ(count_added<Notarization>(run(3, 0ms)), 0u);

    add(subnet.share(3, content, subnet.ctx.high_threshold()));
    auto notarizations = added<Notarization>(run(3, 0ms));
    ASSERT_EQ(notarizations.size(), 1u);
    EXPECT_EQ(notarizations[0].content, content);
}

TEST_F(ChangeSetEngineTest, FinalizesSingleNotarizedBlock)
{
    auto tip = subnet.build_chain(pool, 3);
    auto proposal = subnet.proposal(tip, 4, node_with_rank(0, 4), 0, 0ms);
    add(proposal);
    add(subnet.notarization(4, proposal.block_hash));

    auto shares = added<FinalizationShare>(run(1, 0ms));
    ASSERT_EQ(shares.size(), 1u);
    EXPECT_EQ(shares[0].content.block, proposal.block_hash);

    FinalizationContent content { .height = 4, .block = proposal.block_hash };
    for (NodeId signer : { 0, 1, 2 })
        add(subnet.share(signer, content, subnet.ctx.high_threshold()));
    auto finalizations = added<Finalization>(run(3, 0ms));
    ASSERT_EQ(finalizations.size(), 1u);
    EXPECT_EQ(finalizations[0].content, content);
}

TEST_F(ChangeSetEngineTest, EquivocationBlocksFinalizationUntilResolved)
{
    auto tip = subnet.build_chain(pool, 4);
    add(subnet.beacon(beacon_hash_at(4), 5));
    auto a = subnet.proposal(tip, 5, 0, 0, 0ms, { Byte { 0xa } });
    auto b = subnet.proposal(tip, 5, 1, 0, 0ms, { Byte { 0xb } });
    add(a);
    add(b);
    add(subnet.notarization(5, a.block_hash));
    add(subnet.notarization(5, b.block_hash));

    FinalizationContent content { .height = 5, .block = a.block_hash };
    for (NodeId signer : { 0, 1, 2 })
        add(subnet.share(signer, content, subnet.ctx.high_threshold()));

    for (NodeId node = 0; node < subnet.ctx.N; ++node) {
        auto changes = run(node, 60s);
        EXPECT_EQ(count_added<Finalization>(changes), 0u);
        EXPECT_EQ(count_added<FinalizationShare>(changes), 0u);
    }

    // A notarized child of `a` at height 6 prunes `b`.
    auto child = subnet.proposal(a.block_hash, 6, 2, 0, 0ms);
    add(child);
    add(subnet.notarization(6, child.block_hash));

    auto finalizations = added<Finalization>(run(3, 60s));
    ASSERT_EQ(finalizations.size(), 1u);
    EXPECT_EQ(finalizations[0].content, content);
}

TEST_F(ChangeSetEngineTest, CatchUpPackageAtInterval)
{
    subnet.build_chain(pool, 10);

    auto shares = added<CatchUpPackageShare>(run(0, 0ms));
    ASSERT_EQ(shares.size(), 1u);
    EXPECT_EQ(shares[0].content.block.height, 10u);

    for (NodeId signer : { 1, 2, 3 })
        add(subnet.share(signer, shares[0].content, subnet.ctx.high_threshold()));
    auto cups = added<CatchUpPackage>(run(0, 0ms));
    ASSERT_EQ(cups.size(), 1u);
    EXPECT_EQ(cups[0].content, shares[0].content);
}

TEST_F(ChangeSetEngineTest, PurgeActionsComeLast)
{
    subnet.build_chain(pool, 25);
    std::optional<CatchUpContent> content;
    {
        auto snapshot = pool.snapshot();
        content = PoolReader(snapshot.validated()).catch_up_content(20);
    }
    ASSERT_TRUE(content.has_value());
    add(subnet.aggregate(*content, subnet.ctx.high_threshold()));
    ASSERT_TRUE(pool.insert_unvalidated(subnet.share(1, RandomTapeContent { .height = 3 }, 2), 0ms).has_value());

    auto changes = run(0, 0ms);
    ASSERT_GE(changes.size(), 2u);
    // Unvalidated below the lowest unresolved height; validated below min(package, finalized - retention).
    EXPECT_EQ(std::get<PurgeUnvalidatedBelow>(changes[changes.size() - 2]).height, 26u);
    EXPECT_EQ(std::get<PurgeValidatedBelow>(changes.back()).height, 5u);
}

TEST_F(ChangeSetEngineTest, NoPurgeWithinRetention)
{
    subnet.build_chain(pool, 3);
    for (const auto& change : run(0, 0ms)) {
        EXPECT_FALSE(std::holds_alternative<PurgeUnvalidatedBelow>(change));
        EXPECT_FALSE(std::holds_alternative<PurgeValidatedBelow>(change));
    }
}

TEST_F(ChangeSetEngineTest, NonMemberOnlyAggregates)
{
    add(genesis_catch_up_package());
    RandomBeaconContent content { .height = 1, .parent = beacon_hash_at(0) };
    for (NodeId signer : { 0, 1 })
        add(subnet.share(signer, content, subnet.ctx.low_threshold()));

    auto changes = run(9, 60s);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<RandomBeacon>(std::get<AddToValidated>(changes[0]).artifact));
}

} // namespace Subnet::Consensus
