#include "consensus/config.hpp"
#include "consensus/error.hpp"
#include "consensus/topology.hpp"
#include <gtest/gtest.h>

namespace Subnet::Consensus {

using namespace std::chrono_literals;

TEST(SystemContextTest, Thresholds)
{
    auto four = SystemContext::for_members(4);
    EXPECT_EQ(four.f, 1);
    EXPECT_EQ(four.low_threshold(), 2);
    EXPECT_EQ(four.high_threshold(), 3);

    auto seven = SystemContext::for_members(7);
    EXPECT_EQ(seven.low_threshold(), 3);
    EXPECT_EQ(seven.high_threshold(), 5);

    auto single = SystemContext::for_members(1);
    EXPECT_EQ(single.low_threshold(), 1);
    EXPECT_EQ(single.high_threshold(), 1);
}

TEST(ConsensusConfigTest, DefaultsAreValid)
{
    EXPECT_TRUE(ConsensusConfig {}.validate().has_value());
}

TEST(ConsensusConfigTest, RejectsBadValues)
{
    auto expect_invalid = [](ConsensusConfig c) {
        auto r = c.validate();
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error(), Error::InvalidConfig);
    };

    ConsensusConfig c;
    c.unit_delay = 0ms;
    expect_invalid(c);

    c = {};
    c.initial_notary_delay = -1ms;
    expect_invalid(c);

    c = {};
    c.catch_up_interval = 0;
    expect_invalid(c);

    c = {};
    c.validated_retention = c.catch_up_interval - 1;
    expect_invalid(c);

    c = {};
    c.initial_notary_delay = 0ms;
    EXPECT_TRUE(c.validate().has_value());
}

TEST(ErrorTest, MessagesAndCategory)
{
    std::error_code ec = Error::DuplicateArtifact;
    EXPECT_STREQ(ec.category().name(), "SubnetConsensus");
    EXPECT_FALSE(ec.message().empty());
    EXPECT_NE(std::error_code(Error::NotFound), std::error_code(Error::DuplicateArtifact));
}

TEST(VersionedTopologyTest, VersionsApplyFromTheirHeight)
{
    VersionedTopology topology;
    auto v1 = topology.add_version(1, 0, { 0, 1, 2, 3 });
    auto v2 = topology.add_version(1, 20, { 0, 1, 2, 3, 4, 5, 6 });
    ASSERT_TRUE(v1.has_value());
    ASSERT_TRUE(v2.has_value());
    EXPECT_LT(*v1, *v2);

    EXPECT_EQ(topology.members_at(19, 1)->size(), 4u);
    EXPECT_EQ(topology.members_at(20, 1)->size(), 7u);
    EXPECT_EQ(topology.registry_version(5, 1), v1);
    EXPECT_EQ(topology.registry_version(500, 1), v2);
}

TEST(VersionedTopologyTest, UnknownSubnetOrHeight)
{
    VersionedTopology topology;
    ASSERT_TRUE(topology.add_version(2, 10, { 0 }).has_value());

    EXPECT_FALSE(topology.members_at(10, 1).has_value());
    EXPECT_FALSE(topology.members_at(9, 2).has_value());
    EXPECT_FALSE(topology.registry_version(0, 2).has_value());
}

TEST(VersionedTopologyTest, RejectsEmptyAndOutOfOrderVersions)
{
    VersionedTopology topology;
    auto empty = topology.add_version(1, 0, {});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), Error::InvalidConfig);

    ASSERT_TRUE(topology.add_version(1, 10, { 0, 1 }).has_value());
    EXPECT_FALSE(topology.add_version(1, 10, { 0 }).has_value());
    EXPECT_FALSE(topology.add_version(1, 5, { 0 }).has_value());
    // Another subnet keeps its own history.
    EXPECT_TRUE(topology.add_version(2, 5, { 0 }).has_value());
}

} // namespace Subnet::Consensus
