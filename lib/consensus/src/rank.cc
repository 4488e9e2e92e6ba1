#include "consensus/rank.hpp"

#include <limits>
#include <utility>

namespace Subnet::Consensus {

namespace {

    // Deterministic SHA-256 counter stream.
    class HashStream {
    public:
        explicit HashStream(const Hash& seed)
            : seed_(seed)
        {
        }

        uint64_t next()
        {
            std::array<Byte, 8> ctr {};
            for (int i = 0; i < 8; ++i)
                ctr[i] = static_cast<Byte>((counter_ >> (8 * i)) & 0xff);
            ++counter_;

            auto digest = Crypto::Utils::sha256({ seed_, ctr });
            uint64_t v = 0;
            for (int i = 0; i < 8; ++i)
                v |= static_cast<uint64_t>(digest[i]) << (8 * i);
            return v;
        }

        // Uniform in [0, bound) by rejection.
        uint64_t uniform(uint64_t bound)
        {
            constexpr auto max = std::numeric_limits<uint64_t>::max();
            const uint64_t limit = max - max % bound;
            for (;;) {
                auto v = next();
                if (v < limit)
                    return v % bound;
            }
        }

    private:
        Hash seed_;
        uint64_t counter_ = 0;
    };

} // namespace

std::vector<NodeId> block_maker_order(const Hash& previous_beacon, Height height, const std::set<NodeId>& members)
{
    std::array<Byte, 8> height_le {};
    for (int i = 0; i < 8; ++i)
        height_le[i] = static_cast<Byte>((height >> (8 * i)) & 0xff);
    auto seed = Crypto::Utils::sha256({ Crypto::as_span("block-maker-rank"), previous_beacon, height_le });

    std::vector<NodeId> order(members.begin(), members.end());
    HashStream stream(seed);
    for (size_t i = order.size(); i > 1; --i) {
        auto j = stream.uniform(i);
        std::swap(order[i - 1], order[j]);
    }
    return order;
}

Duration block_maker_timeout(const ConsensusConfig& config, Rank rank)
{
    return 2 * config.unit_delay * static_cast<int64_t>(rank);
}

Duration notary_delay(const ConsensusConfig& config, Rank rank)
{
    return config.initial_notary_delay + 2 * config.unit_delay * static_cast<int64_t>(rank);
}

} // namespace Subnet::Consensus
