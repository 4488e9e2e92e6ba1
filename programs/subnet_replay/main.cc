#include "consensus/bls_crypto_service.hpp"
#include "consensus/error.hpp"
#include "consensus/logger.hpp"
#include "consensus/replay.hpp"
#include "consensus/trace_io.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <boost/program_options.hpp>

namespace bpo = boost::program_options;
using namespace Subnet::Consensus;

namespace {

struct Options {
    std::string trace;
    std::string keys;
    NodeId node = 0;
    SubnetId subnet = 1;
    int64_t unit_delay_ms = 1000;
    int64_t notary_delay_ms = 600;
    Height catch_up_interval = 10;
    Height retention = 20;
};

std::expected<std::vector<TraceEvent>, std::error_code> load_trace(const std::string& path, const Logger& logger)
{
    if (path == "-")
        return read_trace(std::cin, logger);
    std::ifstream in(path);
    if (!in) {
        logger->error("Cannot open trace {}", path);
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    return read_trace(in, logger);
}

int run(const Options& opts)
{
    auto logger = std_out_logger("subnet-replay");

    ConsensusConfig config {
        .node_id = opts.node,
        .subnet_id = opts.subnet,
        .unit_delay = Duration(opts.unit_delay_ms),
        .initial_notary_delay = Duration(opts.notary_delay_ms),
        .catch_up_interval = opts.catch_up_interval,
        .validated_retention = opts.retention,
    };
    if (auto valid = config.validate(); !valid) {
        logger->error("Invalid configuration: {}", valid.error().message());
        return 1;
    }

    std::ifstream keys_in(opts.keys);
    if (!keys_in) {
        logger->error("Cannot open key file {}", opts.keys);
        return 1;
    }
    auto keys = read_key_material(keys_in, logger);
    if (!keys)
        return 1;
    auto crypto = BlsCryptoService::create(opts.node, std::make_shared<const KeyMaterial>(std::move(*keys)));
    if (!crypto) {
        logger->error("Node {}: {}", opts.node, crypto.error().message());
        return 1;
    }

    auto events = load_trace(opts.trace, logger);
    if (!events)
        return 1;
    if (events->empty() || !std::holds_alternative<SubnetFound>(events->front())) {
        logger->error("Trace must begin with a SubnetFound event");
        return 1;
    }

    Replay<BlsCryptoService> replay(config, *crypto);
    auto result = replay.run(*events);
    if (!result.ok()) {
        report_divergence(logger, *result.divergence);
        return 3;
    }
    logger->info("Replayed {} events of node {} in {} rounds", events->size(), opts.node, result.rounds);
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;

    bpo::options_description cli("subnet_replay command line options");
    cli.add_options()
        ("trace", bpo::value<std::string>(&opts.trace)->required(), "trace file written by subnet_sim --trace-out, or - for stdin")
        ("keys", bpo::value<std::string>(&opts.keys)->required(), "key file written by subnet_sim --keys-out")
        ("node", bpo::value<NodeId>(&opts.node)->default_value(0), "replica that recorded the trace")
        ("subnet", bpo::value<SubnetId>(&opts.subnet)->default_value(1), "subnet of the replica")
        ("unit-delay-ms", bpo::value<int64_t>(&opts.unit_delay_ms)->default_value(1000), "unit delay the replica ran with")
        ("notary-delay-ms", bpo::value<int64_t>(&opts.notary_delay_ms)->default_value(600), "initial notary delay the replica ran with")
        ("catch-up-interval", bpo::value<Height>(&opts.catch_up_interval)->default_value(10), "heights between catch-up packages")
        ("retention", bpo::value<Height>(&opts.retention)->default_value(20), "finalized heights kept in the validated pool")
        ("help,h", "check a recorded replica trace against the consensus engine");

    bpo::positional_options_description positional;
    positional.add("trace", 1);

    bpo::variables_map vmap;
    try {
        bpo::store(bpo::command_line_parser(argc, argv).options(cli).positional(positional).run(), vmap);
        if (vmap.count("help") > 0) {
            std::cerr << "usage: subnet_replay [options] <LOGFILE|->" << std::endl;
            cli.print(std::cerr);
            return 0;
        }
        bpo::notify(vmap);
    } catch (const bpo::error& ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << "usage: subnet_replay [options] <LOGFILE|->" << std::endl;
        cli.print(std::cerr);
        return 1;
    }

    try {
        return run(opts);
    } catch (const InvariantViolation& ex) {
        std::cerr << "safety violation: " << ex.what() << std::endl;
        return 4;
    }
}
