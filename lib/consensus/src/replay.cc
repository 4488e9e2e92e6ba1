#include "consensus/replay.hpp"

#include <map>
#include <string>

#include <fmt/format.h>

namespace Subnet::Consensus {

std::vector<ChangeAction> unmatched_actions(std::span<const ChangeAction> observed, std::span<const ChangeAction> computed)
{
    std::map<ActionKey, size_t> available;
    for (const auto& action : computed)
        ++available[action_key(action)];

    std::vector<ChangeAction> unmatched;
    for (const auto& action : observed) {
        auto it = available.find(action_key(action));
        if (it == available.end() || it->second == 0) {
            unmatched.push_back(action);
            continue;
        }
        --it->second;
    }
    return unmatched;
}

namespace {

    template <typename T>
    std::string or_none(const std::optional<T>& v)
    {
        return v ? fmt::format("{}", *v) : std::string("none");
    }

} // namespace

void report_divergence(const Logger& logger, const Divergence& d)
{
    logger->error("Diverged at event {} (time {} ms)", d.event_index, d.time.count());
    logger->error("current_round = {}", d.height);
    logger->error("round_start = {}", d.round_start ? fmt::format("{} ms", d.round_start->count()) : std::string("none"));
    logger->error("registry_version = {}", or_none(d.registry_version));
    logger->error("block_maker_rank = {}", or_none(d.rank));
    logger->error("block_maker_timeout = {}", d.block_maker_timeout ? fmt::format("{} ms", d.block_maker_timeout->count()) : std::string("none"));

    logger->error("Validated pool ({} artifacts):", d.validated_pool.size());
    for (const auto& a : d.validated_pool)
        logger->error("  {}", describe(a));
    logger->error("Unvalidated pool ({} artifacts):", d.unvalidated_pool.size());
    for (const auto& a : d.unvalidated_pool)
        logger->error("  {}", describe(a));

    logger->error("Computed ({} actions):", d.computed.size());
    for (const auto& action : d.computed)
        logger->error("  {}", describe(action));
    logger->error("Observed ({} actions):", d.observed.size());
    for (const auto& action : d.observed)
        logger->error("  {}", describe(action));
    for (const auto& action : d.unexpected)
        logger->error("Not computed: {}", describe(action));
}

} // namespace Subnet::Consensus
