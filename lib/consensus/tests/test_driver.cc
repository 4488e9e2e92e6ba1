#include "consensus/driver.hpp"
#include "subnet_simulation.hpp"
#include <gtest/gtest.h>

namespace Subnet::Consensus {

using namespace Testing;

using TestDriver = Driver<MockCrypto, VersionedTopology, RecordingTransport, RecordingListener>;

TEST(DriverTest, RejectsInvalidConfig)
{
    TestSubnet subnet(4);
    MockCrypto crypto { .self = 0 };
    RecordingTransport transport;
    RecordingListener listener;

    auto no_catch_up = subnet.config(0);
    no_catch_up.catch_up_interval = 0;
    auto created = TestDriver::create(no_catch_up, crypto, subnet.topology, transport, listener);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error(), Error::InvalidConfig);

    auto short_retention = subnet.config(0);
    short_retention.validated_retention = short_retention.catch_up_interval - 1;
    EXPECT_FALSE(TestDriver::create(short_retention, crypto, subnet.topology, transport, listener).has_value());

    EXPECT_TRUE(TestDriver::create(subnet.config(0), crypto, subnet.topology, transport, listener).has_value());
}

TEST(DriverTest, GenesisStartsTheReplica)
{
    TestSubnet subnet(4);
    auto config = subnet.config(0);
    MockCrypto crypto { .self = 0 };
    RecordingTransport transport;
    RecordingListener listener;
    auto created = TestDriver::create(config, crypto, subnet.topology, transport, listener);
    ASSERT_TRUE(created.has_value());
    auto& driver = **created;

    EXPECT_EQ(driver.state(), DriverState::AwaitingGenesis);
    EXPECT_EQ(driver.tick(0ms).applied, 0u);
    EXPECT_TRUE(transport.sent.empty());

    ASSERT_TRUE(driver.on_genesis(genesis_catch_up_package(), 0ms).has_value());
    EXPECT_EQ(driver.state(), DriverState::Running);
    EXPECT_EQ(listener.heights, (std::vector<Height> { 0 }));

    auto second = driver.on_genesis(genesis_catch_up_package(), 0ms);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), Error::DuplicateArtifact);
}

TEST(DriverTest, BroadcastsWhatItProduces)
{
    TestSubnet subnet(4);
    auto config = subnet.config(2);
    MockCrypto crypto { .self = 2 };
    RecordingTransport transport;
    RecordingListener listener;
    auto created = TestDriver::create(config, crypto, subnet.topology, transport, listener);
    ASSERT_TRUE(created.has_value());
    auto& driver = **created;
    ASSERT_TRUE(driver.on_genesis(genesis_catch_up_package(), 0ms).has_value());

    auto report = driver.tick(0ms);
    EXPECT_EQ(transport.sent.size(), report.added.size());
    ASSERT_FALSE(transport.sent.empty());
    EXPECT_TRUE(std::holds_alternative<RandomBeaconShare>(transport.sent.front()));

    // Nothing new to say until something arrives or a timeout passes.
    transport.sent.clear();
    driver.tick(10ms);
    EXPECT_TRUE(transport.sent.empty());
}

TEST(DriverTest, AwaitingReplicaJoinsThroughCatchUpPackage)
{
    TestSubnet subnet(4);
    ArtifactPool ahead;
    subnet.build_chain(ahead, 10);
    std::optional<CatchUpContent> content;
    {
        auto snapshot = ahead.snapshot();
        content = PoolReader(snapshot.validated()).catch_up_content(10);
    }
    ASSERT_TRUE(content.has_value());

    auto config = subnet.config(1);
    MockCrypto crypto { .self = 1 };
    RecordingTransport transport;
    RecordingListener listener;
    auto created = TestDriver::create(config, crypto, subnet.topology, transport, listener);
    ASSERT_TRUE(created.has_value());
    auto& driver = **created;

    ASSERT_TRUE(driver.on_artifact_received(subnet.aggregate(*content, subnet.ctx.high_threshold()), 0ms).has_value());
    driver.tick(0ms);
    EXPECT_EQ(driver.state(), DriverState::Running);
    EXPECT_EQ(driver.finalized_height(), 10u);
    EXPECT_EQ(listener.heights, (std::vector<Height> { 10 }));
}

TEST(DriverTest, HaltStopsTicking)
{
    SubnetSimulation sim(4);
    sim.start();
    sim.drivers[0]->halt();
    EXPECT_EQ(sim.drivers[0]->state(), DriverState::Halted);
    EXPECT_EQ(sim.drivers[0]->tick(1s).applied, 0u);
}

TEST(SubnetTest, FourReplicasAgreeOnFinalizedChain)
{
    SubnetSimulation sim(4);
    sim.start();
    ASSERT_TRUE(sim.run_until([&] { return sim.min_finalized_height() >= 12; }, 120s));

    for (Height h = 1; h <= 12; ++h) {
        auto reference = sim.finalized_hash(0, h);
        ASSERT_TRUE(reference.has_value()) << "height " << h;
        for (size_t i = 1; i < sim.drivers.size(); ++i)
            EXPECT_EQ(sim.finalized_hash(i, h), reference) << "replica " << i << " height " << h;
    }
    for (const auto& listener : sim.listeners) {
        EXPECT_TRUE(std::ranges::is_sorted(listener.heights));
        EXPECT_GE(listener.heights.back(), 12u);
    }
}

TEST(SubnetTest, ProgressWithOneSilentReplica)
{
    SubnetSimulation sim(4);
    sim.network.disconnect(0);
    sim.start();
    ASSERT_TRUE(sim.run_until([&] { return sim.drivers[1]->finalized_height() >= 8; }, 240s));

    // The silent replica still follows.
    EXPECT_TRUE(sim.run_until([&] { return sim.drivers[0]->finalized_height() >= 8; }, 10s));
}

TEST(SubnetTest, SilentReplicaRejoinsAfterReconnect)
{
    SubnetSimulation sim(4);
    sim.network.disconnect(3);
    sim.start();
    ASSERT_TRUE(sim.run_until([&] { return sim.min_finalized_height() >= 4; }, 240s));

    sim.network.reconnect(3);
    // With replica 0 cut off instead, progress now needs replica 3's shares.
    sim.network.disconnect(0);
    const Height from = sim.min_finalized_height();
    EXPECT_TRUE(sim.run_until([&] { return sim.drivers[1]->finalized_height() >= from + 4; }, 240s));
}

TEST(SubnetTest, ReplicaJoinsAtMembershipChange)
{
    SubnetSimulation sim(5, 50ms, 4);
    ASSERT_TRUE(sim.subnet.topology.add_version(sim.subnet.subnet_id, 6, { 0, 1, 2, 3, 4 }).has_value());
    sim.start();
    ASSERT_TRUE(sim.run_until([&] { return sim.min_finalized_height() >= 15; }, 300s));

    for (Height h = 1; h <= 15; ++h) {
        auto reference = sim.finalized_hash(0, h);
        ASSERT_TRUE(reference.has_value()) << "height " << h;
        for (size_t i = 1; i < sim.drivers.size(); ++i)
            EXPECT_EQ(sim.finalized_hash(i, h), reference) << "replica " << i << " height " << h;
    }

    // Replica 4 signs only from its first height as a member.
    auto snapshot = sim.drivers[4]->pool().snapshot();
    bool signed_as_member = false;
    for (Height h = 1; h <= 15; ++h) {
        for (const auto& share : snapshot.validated().get<RandomBeaconShare>(h)) {
            if (share.signer != 4)
                continue;
            EXPECT_GE(h, 6u);
            signed_as_member = true;
        }
    }
    EXPECT_TRUE(signed_as_member);
}

TEST(SubnetTest, CatchUpPackagesBoundThePool)
{
    SubnetSimulation sim(4);
    sim.start();
    ASSERT_TRUE(sim.run_until([&] { return sim.min_finalized_height() >= 45; }, 600s));
    sim.step(100ms);

    auto snapshot = sim.drivers[2]->pool().snapshot();
    PoolReader reader(snapshot.validated());
    EXPECT_GE(reader.catch_up_height(), 40u);
    ASSERT_TRUE(snapshot.validated().min_height().has_value());
    EXPECT_GE(*snapshot.validated().min_height(), 25u);
    EXPECT_EQ(reader.random_beacon(0), nullptr);
}

} // namespace Subnet::Consensus
