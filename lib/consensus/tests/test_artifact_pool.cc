#include "consensus/error.hpp"
#include "consensus/pool/artifact_pool.hpp"
#include "consensus_test_utils.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <thread>

namespace Subnet::Consensus {

using namespace Testing;

class ArtifactPoolTest : public ::testing::Test {
protected:
    TestSubnet subnet { 4 };
    ArtifactPool pool;

    RandomBeaconShare beacon_share(NodeId signer, Height h)
    {
        return subnet.share(signer, RandomBeaconContent { .height = h, .parent = {} }, subnet.ctx.low_threshold());
    }
};

TEST_F(ArtifactPoolTest, InsertUnvalidatedRejectsDuplicate)
{
    auto first = pool.insert_unvalidated(beacon_share(1, 3), 0ms);
    ASSERT_TRUE(first.has_value());

    auto second = pool.insert_unvalidated(beacon_share(1, 3), 5ms);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), Error::DuplicateArtifact);
    EXPECT_EQ(pool.snapshot().unvalidated().size(), 1u);
}

TEST_F(ArtifactPoolTest, InsertUnvalidatedRejectsAlreadyValidated)
{
    ASSERT_TRUE(pool.add_to_validated(beacon_share(2, 3), 0ms).has_value());

    auto again = pool.insert_unvalidated(beacon_share(2, 3), 1ms);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Error::DuplicateArtifact);
}

TEST_F(ArtifactPoolTest, MoveToValidated)
{
    auto id = pool.insert_unvalidated(beacon_share(1, 3), 0ms);
    ASSERT_TRUE(id.has_value());

    ASSERT_TRUE(pool.move_to_validated(*id, 10ms).has_value());

    auto snapshot = pool.snapshot();
    EXPECT_FALSE(snapshot.unvalidated().contains(*id));
    ASSERT_TRUE(snapshot.validated().contains(*id));
    EXPECT_EQ(snapshot.validated().find(*id)->added_at, 10ms);
}

TEST_F(ArtifactPoolTest, MoveUnknownIsNotFound)
{
    auto moved = pool.move_to_validated(artifact_id(beacon_share(1, 3)), 0ms);
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error(), Error::NotFound);
}

TEST_F(ArtifactPoolTest, AddToValidatedDropsUnvalidatedCopy)
{
    auto id = pool.insert_unvalidated(beacon_share(1, 3), 0ms);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(pool.add_to_validated(beacon_share(1, 3), 1ms).has_value());

    auto snapshot = pool.snapshot();
    EXPECT_TRUE(snapshot.validated().contains(*id));
    EXPECT_FALSE(snapshot.unvalidated().contains(*id));
}

TEST_F(ArtifactPoolTest, SameRandomBeaconTwiceIsNoOp)
{
    auto beacon = subnet.beacon({}, 4);
    ASSERT_TRUE(pool.add_to_validated(beacon, 0ms).has_value());

    auto again = pool.add_to_validated(beacon, 1ms);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Error::DuplicateArtifact);

    // Same beacon combined from another quorum.
    auto other_quorum = beacon;
    other_quorum.signers = { 2, 3 };
    EXPECT_FALSE(pool.add_to_validated(other_quorum, 2ms).has_value());

    EXPECT_EQ(pool.snapshot().validated().count(4, ArtifactKind::RandomBeacon), 1u);
}

TEST_F(ArtifactPoolTest, BucketPreservesInsertionOrderAndRestarts)
{
    for (NodeId signer : { 3, 0, 2, 1 })
        ASSERT_TRUE(pool.add_to_validated(beacon_share(signer, 7), 0ms).has_value());
    ASSERT_TRUE(pool.add_to_validated(beacon_share(0, 8), 0ms).has_value());

    auto snapshot = pool.snapshot();
    auto shares = snapshot.validated().get<RandomBeaconShare>(7);

    std::vector<NodeId> first_pass;
    for (const auto& s : shares)
        first_pass.push_back(s.signer);
    std::vector<NodeId> second_pass;
    for (const auto& s : shares)
        second_pass.push_back(s.signer);

    EXPECT_EQ(first_pass, (std::vector<NodeId> { 3, 0, 2, 1 }));
    EXPECT_EQ(first_pass, second_pass);
    EXPECT_TRUE(std::ranges::empty(snapshot.validated().by_height_and_kind(7, ArtifactKind::RandomBeacon)));
}

TEST_F(ArtifactPoolTest, PurgeUnvalidatedLeavesValidatedAlone)
{
    for (Height h = 1; h <= 6; ++h) {
        ASSERT_TRUE(pool.insert_unvalidated(beacon_share(1, h), 0ms).has_value());
        ASSERT_TRUE(pool.add_to_validated(beacon_share(2, h), 0ms).has_value());
    }

    EXPECT_EQ(pool.purge_unvalidated_below(4), 3u);

    auto snapshot = pool.snapshot();
    EXPECT_EQ(snapshot.unvalidated().min_height(), Height { 4 });
    EXPECT_EQ(snapshot.unvalidated().size(), 3u);
    EXPECT_EQ(snapshot.validated().size(), 6u);
    EXPECT_EQ(snapshot.validated().min_height(), Height { 1 });
}

TEST_F(ArtifactPoolTest, PurgeValidated)
{
    for (Height h = 1; h <= 6; ++h)
        ASSERT_TRUE(pool.add_to_validated(beacon_share(2, h), 0ms).has_value());

    EXPECT_EQ(pool.purge_validated_below(5), 4u);
    EXPECT_EQ(pool.purge_validated_below(5), 0u);
    EXPECT_EQ(pool.snapshot().validated().size(), 2u);
}

TEST_F(ArtifactPoolTest, ConflictingFinalizationThrows)
{
    Hash a = Crypto::Utils::sha256(Crypto::as_span("block a"));
    Hash b = Crypto::Utils::sha256(Crypto::as_span("block b"));
    ASSERT_TRUE(pool.add_to_validated(subnet.finalization(5, a), 0ms).has_value());

    EXPECT_THROW(pool.add_to_validated(subnet.finalization(5, b), 1ms), InvariantViolation);
    EXPECT_EQ(pool.snapshot().validated().count(5, ArtifactKind::Finalization), 1u);
}

TEST_F(ArtifactPoolTest, ConflictingFinalizationThrowsOnMove)
{
    Hash a = Crypto::Utils::sha256(Crypto::as_span("block a"));
    Hash b = Crypto::Utils::sha256(Crypto::as_span("block b"));
    ASSERT_TRUE(pool.add_to_validated(subnet.finalization(5, a), 0ms).has_value());
    auto id = pool.insert_unvalidated(subnet.finalization(5, b), 0ms);
    ASSERT_TRUE(id.has_value());

    EXPECT_THROW(pool.move_to_validated(*id, 1ms), InvariantViolation);
    EXPECT_TRUE(pool.snapshot().unvalidated().contains(*id));
}

TEST_F(ArtifactPoolTest, ConcurrentIngestionWhileWriting)
{
    constexpr int Threads = 4;
    constexpr Height PerThread = 50;
    std::atomic<int> inserted { 0 };

    std::vector<std::thread> producers;
    for (int t = 0; t < Threads; ++t) {
        producers.emplace_back([&, t] {
            for (Height h = 1; h <= PerThread; ++h) {
                if (pool.insert_unvalidated(beacon_share(t, h), 0ms))
                    ++inserted;
            }
        });
    }
    // Single writer moving whatever has arrived, plus readers.
    std::thread writer([&] {
        for (int round = 0; round < 100; ++round) {
            std::vector<ArtifactId> ids;
            {
                auto snapshot = pool.snapshot();
                for (const auto& e : snapshot.unvalidated().ordered_entries())
                    ids.push_back(e->id);
            }
            for (const auto& id : ids)
                EXPECT_TRUE(pool.move_to_validated(id, 1ms).has_value());
        }
    });

    for (auto& p : producers)
        p.join();
    writer.join();

    auto snapshot = pool.snapshot();
    EXPECT_EQ(inserted.load(), Threads * static_cast<int>(PerThread));
    EXPECT_EQ(snapshot.validated().size() + snapshot.unvalidated().size(), static_cast<size_t>(inserted.load()));
}

} // namespace Subnet::Consensus
