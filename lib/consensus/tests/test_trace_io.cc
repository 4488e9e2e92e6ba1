#include "consensus/replay.hpp"
#include "consensus/trace_io.hpp"
#include "subnet_simulation.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace Subnet::Consensus {

using namespace Testing;

class TraceIoTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        recorder.record(SubnetFound { .subnet = sim.subnet.subnet_id, .from_height = 0, .members = { 0, 1, 2, 3 } });
        sim.drivers[1]->set_trace_recorder(&recorder);
        sim.start();
        ASSERT_TRUE(sim.run_until([&] { return sim.drivers[1]->finalized_height() >= 3; }, 60s));
        events = recorder.events();
    }

    std::expected<std::vector<TraceEvent>, std::error_code> read(const std::string& text)
    {
        std::istringstream in(text);
        return read_trace(in, logger);
    }

    SubnetSimulation sim { 4 };
    TraceRecorder recorder;
    std::vector<TraceEvent> events;
    Logger logger = std_out_logger("test-trace");
};

TEST_F(TraceIoTest, WrittenTraceReadsBackEventForEvent)
{
    std::stringstream file;
    write_trace(file, events);
    auto read_back = read_trace(file, logger);
    ASSERT_TRUE(read_back.has_value());
    ASSERT_EQ(read_back->size(), events.size());
    for (size_t i = 0; i < events.size(); ++i)
        EXPECT_EQ(to_json((*read_back)[i]), to_json(events[i])) << "event " << i;
}

TEST_F(TraceIoTest, TraceReadFromTextReplays)
{
    std::stringstream file;
    write_trace(file, events);
    auto read_back = read(file.str());
    ASSERT_TRUE(read_back.has_value());

    MockCrypto crypto { .self = 1 };
    Replay<MockCrypto> replay(sim.configs[1], crypto);
    auto result = replay.run(*read_back);
    EXPECT_TRUE(result.ok());
    EXPECT_GT(result.rounds, 0u);
}

TEST_F(TraceIoTest, OneEventPerLine)
{
    std::stringstream file;
    write_trace(file, events);

    std::string line;
    size_t lines = 0;
    while (std::getline(file, line)) {
        ASSERT_FALSE(line.empty());
        ++lines;
    }
    EXPECT_EQ(lines, events.size());
}

TEST_F(TraceIoTest, BlankLinesAreSkipped)
{
    auto text = "\n{\"event\":\"ApplyChanges\",\"time\":40}\n   \n{\"event\":\"ApplyChanges\",\"time\":50}\n";
    auto read_back = read(text);
    ASSERT_TRUE(read_back.has_value());
    ASSERT_EQ(read_back->size(), 2u);
    EXPECT_EQ(std::get<ApplyChanges>((*read_back)[1]).time, 50ms);
}

TEST_F(TraceIoTest, MalformedLinesAreRejected)
{
    for (const char* text : {
             "not json at all",
             "{\"event\":\"ApplyChanges\"}",
             "{\"event\":\"ApplyChanges\",\"time\":\"soon\"}",
             "{\"event\":\"Rebooted\",\"time\":1}",
             "{\"event\":\"ChangeActionSeen\",\"action\":{\"action\":\"MoveToValidated\",\"id\":\"zz\"}}",
             "{\"event\":\"ChangeActionSeen\",\"action\":{\"action\":\"MoveToValidated\",\"id\":\"abcd\"}}",
             "{\"event\":\"ArtifactSeen\",\"time\":1,\"artifact\":{\"kind\":\"Vote\"}}",
             "{\"event\":\"SubnetFound\",\"subnet\":1,\"from_height\":-1,\"members\":[0]}",
         }) {
        auto read_back = read(std::string("{\"event\":\"ApplyChanges\",\"time\":0}\n") + text);
        ASSERT_FALSE(read_back.has_value()) << text;
        EXPECT_EQ(read_back.error(), Error::MalformedTrace) << text;
    }
}

TEST(ArtifactJsonTest, CarriesKindAndHexFields)
{
    TestSubnet subnet(4);
    Hash block {};
    block[0] = Byte { 0xab };
    Artifact notarization = subnet.notarization(7, block);

    auto json = to_json(notarization);
    EXPECT_EQ(json["kind"].asString(), "Notarization");
    EXPECT_EQ(json["content"]["height"].asUInt64(), 7u);
    EXPECT_EQ(json["content"]["block"].asString(), "ab" + std::string(62, '0'));
    EXPECT_EQ(json["signers"].size(), 3u);

    auto parsed = artifact_from_json(json);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(artifact_id(*parsed), artifact_id(notarization));
    EXPECT_EQ(std::get<Notarization>(*parsed).signers, std::get<Notarization>(notarization).signers);
}

TEST(ArtifactJsonTest, EveryKindSurvives)
{
    TestSubnet subnet(4);
    ArtifactPool pool;
    subnet.build_chain(pool, 10);
    std::optional<CatchUpContent> content;
    std::vector<Artifact> artifacts;
    {
        auto snapshot = pool.snapshot();
        for (const auto& entry : snapshot.validated().ordered_entries())
            artifacts.push_back(entry->artifact);
        content = PoolReader(snapshot.validated()).catch_up_content(10);
    }
    ASSERT_TRUE(content.has_value());

    const int high = subnet.ctx.high_threshold();
    const int low = subnet.ctx.low_threshold();
    artifacts.push_back(subnet.share(1, RandomBeaconContent { .height = 11, .parent = {} }, low));
    artifacts.push_back(subnet.share(1, RandomTapeContent { .height = 11 }, low));
    artifacts.push_back(subnet.aggregate(RandomTapeContent { .height = 11 }, low));
    artifacts.push_back(subnet.share(2, NotarizationContent { .height = 11, .block = {} }, high));
    artifacts.push_back(subnet.share(2, FinalizationContent { .height = 11, .block = {} }, high));
    artifacts.push_back(subnet.share(3, *content, high));
    artifacts.push_back(subnet.aggregate(*content, high));

    std::set<ArtifactKind> kinds;
    for (const auto& a : artifacts) {
        kinds.insert(kind_of(a));
        auto parsed = artifact_from_json(to_json(a));
        ASSERT_TRUE(parsed.has_value()) << describe(a);
        EXPECT_EQ(kind_of(*parsed), kind_of(a));
        EXPECT_EQ(artifact_id(*parsed), artifact_id(a)) << describe(a);
    }
    EXPECT_EQ(kinds.size(), ARTIFACT_KIND_COUNT);
}

} // namespace Subnet::Consensus
