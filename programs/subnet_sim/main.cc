#include "consensus/bls_crypto_service.hpp"
#include "consensus/driver.hpp"
#include "consensus/in_memory_network.hpp"
#include "consensus/logger.hpp"
#include "consensus/replay.hpp"
#include "consensus/topology.hpp"
#include "consensus/trace.hpp"
#include "consensus/trace_io.hpp"

#include <deque>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <boost/program_options.hpp>

namespace bpo = boost::program_options;
using namespace Subnet::Consensus;

namespace {

struct HeightTracker {
    Height latest = 0;

    void on_finalized_height(Height h) { latest = h; }
};

using SimDriver = Driver<BlsCryptoService, VersionedTopology, InMemoryNetwork::Endpoint, HeightTracker>;

struct Options {
    int nodes = 4;
    Height heights = 20;
    int64_t unit_delay_ms = 1000;
    int64_t notary_delay_ms = 600;
    int64_t network_delay_ms = 50;
    int64_t tick_ms = 100;
    Height catch_up_interval = 10;
    Height retention = 20;
    NodeId traced = 0;
    std::vector<NodeId> silent;
    std::string trace_out;
    std::string keys_out;
};

int run(const Options& opts)
{
    auto logger = std_out_logger("subnet-sim");

    std::vector<NodeId> ids;
    std::set<NodeId> members;
    for (NodeId i = 0; i < opts.nodes; ++i) {
        ids.push_back(i);
        members.insert(i);
    }

    auto generated = KeyMaterial::generate(ids);
    if (!generated) {
        logger->error("Key generation failed: {}", generated.error().message());
        return 1;
    }
    auto keys = std::make_shared<const KeyMaterial>(std::move(*generated));

    const SubnetId subnet = 1;
    VersionedTopology topology;
    if (auto v = topology.add_version(subnet, 0, members); !v) {
        logger->error("Invalid membership: {}", v.error().message());
        return 1;
    }

    InMemoryNetwork network(Duration(opts.network_delay_ms));
    for (auto id : opts.silent)
        network.disconnect(id);

    TraceRecorder trace;
    trace.record(SubnetFound { .subnet = subnet, .from_height = 0, .members = members });

    std::deque<ConsensusConfig> configs;
    std::deque<BlsCryptoService> crypto;
    std::deque<InMemoryNetwork::Endpoint> endpoints;
    std::deque<HeightTracker> trackers;
    std::vector<std::unique_ptr<SimDriver>> drivers;

    for (auto id : ids) {
        configs.push_back(ConsensusConfig {
            .node_id = id,
            .subnet_id = subnet,
            .unit_delay = Duration(opts.unit_delay_ms),
            .initial_notary_delay = Duration(opts.notary_delay_ms),
            .catch_up_interval = opts.catch_up_interval,
            .validated_retention = opts.retention,
        });
        auto service = BlsCryptoService::create(id, keys);
        if (!service) {
            logger->error("Node {}: {}", id, service.error().message());
            return 1;
        }
        crypto.push_back(std::move(*service));
        endpoints.push_back(network.endpoint(id));
        trackers.emplace_back();
        auto driver = SimDriver::create(configs.back(), crypto.back(), topology, endpoints.back(), trackers.back());
        if (!driver)
            return 1;
        drivers.push_back(std::move(*driver));
    }
    drivers.at(opts.traced)->set_trace_recorder(&trace);

    Time now {};
    for (auto& d : drivers) {
        if (auto started = d->on_genesis(genesis_catch_up_package(), now); !started) {
            logger->error("Genesis rejected: {}", started.error().message());
            return 1;
        }
    }

    // Every round needs at most a full rank timeout per node plus the notary delay.
    const Duration limit = static_cast<int64_t>(opts.heights + 1)
        * (Duration(opts.notary_delay_ms) + 2 * Duration(opts.unit_delay_ms) * opts.nodes);
    auto lowest = [&] {
        Height h = opts.heights;
        for (const auto& t : trackers)
            h = std::min(h, t.latest);
        return h;
    };

    while (lowest() < opts.heights && now < limit) {
        now += Duration(opts.tick_ms);
        network.advance_to(now);
        for (auto& envelope : network.take_due()) {
            for (auto id : ids) {
                if (id == envelope.from)
                    continue;
                if (auto r = drivers[id]->on_artifact_received(envelope.artifact, now); !r && r.error() != Error::DuplicateArtifact)
                    logger->warn("Node {} dropped {}: {}", id, describe(envelope.artifact), r.error().message());
            }
        }
        for (auto& d : drivers)
            d->tick(now);
    }

    for (auto id : ids)
        logger->info("Node {} finalized height {}", id, trackers[id].latest);
    if (lowest() < opts.heights) {
        logger->error("Subnet stalled below height {} after {} ms", opts.heights, now.count());
        return 2;
    }
    logger->info("Reached height {} in {} ms of simulated time", opts.heights, now.count());

    auto events = trace.events();
    if (!opts.trace_out.empty()) {
        std::ofstream out(opts.trace_out);
        write_trace(out, events);
        if (!out) {
            logger->error("Could not write trace to {}", opts.trace_out);
            return 1;
        }
        logger->info("Wrote {} trace events of node {} to {}", events.size(), opts.traced, opts.trace_out);
    }
    if (!opts.keys_out.empty()) {
        std::ofstream out(opts.keys_out);
        write_key_material(out, *keys);
        if (!out) {
            logger->error("Could not write keys to {}", opts.keys_out);
            return 1;
        }
    }

    Replay<BlsCryptoService> replay(configs[opts.traced], crypto[opts.traced]);
    auto result = replay.run(events);
    if (!result.ok()) {
        logger->error("Replay of node {} diverged", opts.traced);
        report_divergence(logger, *result.divergence);
        return 3;
    }
    logger->info("Replayed {} events of node {} in {} rounds", events.size(), opts.traced, result.rounds);
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;

    bpo::options_description cli("subnet_sim command line options");
    cli.add_options()
        ("nodes,n", bpo::value<int>(&opts.nodes)->default_value(4), "number of replicas")
        ("heights", bpo::value<Height>(&opts.heights)->default_value(20), "stop once every replica finalized this height")
        ("unit-delay-ms", bpo::value<int64_t>(&opts.unit_delay_ms)->default_value(1000), "unit delay; block maker timeouts are 2 * unit delay * rank")
        ("notary-delay-ms", bpo::value<int64_t>(&opts.notary_delay_ms)->default_value(600), "initial notary delay")
        ("network-delay-ms", bpo::value<int64_t>(&opts.network_delay_ms)->default_value(50), "delivery delay of every message")
        ("tick-ms", bpo::value<int64_t>(&opts.tick_ms)->default_value(100), "interval between replica ticks")
        ("catch-up-interval", bpo::value<Height>(&opts.catch_up_interval)->default_value(10), "heights between catch-up packages")
        ("retention", bpo::value<Height>(&opts.retention)->default_value(20), "finalized heights kept in the validated pool")
        ("trace-node", bpo::value<NodeId>(&opts.traced)->default_value(0), "replica whose trace is recorded and replayed")
        ("silent", bpo::value<std::vector<NodeId>>(&opts.silent)->multitoken(), "replicas whose messages are dropped")
        ("trace-out", bpo::value<std::string>(&opts.trace_out), "write the recorded trace here, one JSON event per line")
        ("keys-out", bpo::value<std::string>(&opts.keys_out), "write the subnet keys here, for subnet_replay")
        ("help,h", "run a simulated subnet with threshold BLS keys, then replay one replica's trace");

    bpo::variables_map vmap;
    try {
        bpo::store(bpo::parse_command_line(argc, argv, cli), vmap);
        bpo::notify(vmap);
    } catch (const bpo::error& ex) {
        std::cerr << ex.what() << std::endl;
        cli.print(std::cerr);
        return 1;
    }

    if (vmap.count("help") > 0) {
        cli.print(std::cerr);
        return 0;
    }
    if (opts.nodes < 1 || opts.tick_ms <= 0 || opts.network_delay_ms < 0) {
        std::cerr << "nodes and tick-ms must be positive, network-delay-ms non-negative" << std::endl;
        return 1;
    }
    if (opts.traced < 0 || opts.traced >= opts.nodes) {
        std::cerr << "trace-node must name one of the " << opts.nodes << " replicas" << std::endl;
        return 1;
    }

    try {
        return run(opts);
    } catch (const InvariantViolation& ex) {
        std::cerr << "safety violation: " << ex.what() << std::endl;
        return 4;
    }
}
