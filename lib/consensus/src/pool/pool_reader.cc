#include "consensus/pool/pool_reader.hpp"

#include "crypto/merkle_tree.hpp"

#include <algorithm>

namespace Subnet::Consensus {

namespace {

    template <typename T>
    const T* first_of(const PoolSection& section, Height height)
    {
        for (const auto& v : section.get<T>(height))
            return &v;
        return nullptr;
    }

    template <typename T>
    std::optional<Time> first_added(const PoolSection& section, Height height)
    {
        std::optional<Time> earliest;
        for (const auto& entry : section.by_height_and_kind(height, kind_of_v<T>)) {
            if (!earliest || entry.added_at < *earliest)
                earliest = entry.added_at;
        }
        return earliest;
    }

    std::optional<Time> earliest(std::optional<Time> a, std::optional<Time> b)
    {
        if (!a)
            return b;
        if (!b)
            return a;
        return std::min(*a, *b);
    }

} // namespace

std::optional<Height> PoolReader::current_round() const
{
    auto finalized = validated_.max_height_with(ArtifactKind::Finalization);
    auto cup = validated_.max_height_with(ArtifactKind::CatchUpPackage);
    if (!finalized)
        return cup;
    if (!cup)
        return finalized;
    return std::max(*finalized, *cup);
}

Height PoolReader::notarized_height() const
{
    auto notarized = validated_.max_height_with(ArtifactKind::Notarization).value_or(0);
    return std::max(notarized, finalized_height());
}

const CatchUpPackage* PoolReader::latest_catch_up_package() const
{
    auto height = validated_.max_height_with(ArtifactKind::CatchUpPackage);
    if (!height)
        return nullptr;
    return first_of<CatchUpPackage>(validated_, *height);
}

Height PoolReader::catch_up_height() const
{
    return validated_.max_height_with(ArtifactKind::CatchUpPackage).value_or(0);
}

const RandomBeacon* PoolReader::random_beacon(Height height) const
{
    if (const auto* beacon = first_of<RandomBeacon>(validated_, height))
        return beacon;
    if (const auto* cup = first_of<CatchUpPackage>(validated_, height))
        return &cup->content.random_beacon;
    return nullptr;
}

std::optional<Hash> PoolReader::random_beacon_hash(Height height) const
{
    if (const auto* beacon = random_beacon(height))
        return beacon_hash(*beacon);
    return std::nullopt;
}

const RandomTape* PoolReader::random_tape(Height height) const
{
    return first_of<RandomTape>(validated_, height);
}

std::vector<BlockRef> PoolReader::blocks_at(Height height) const
{
    std::vector<BlockRef> out;
    auto seen = [&](const Hash& h) {
        return std::ranges::any_of(out, [&](const BlockRef& r) { return r.hash == h; });
    };
    for (const auto& cup : validated_.get<CatchUpPackage>(height)) {
        auto h = block_hash(cup.content.block);
        if (!seen(h))
            out.push_back({ .hash = h, .block = &cup.content.block });
    }
    for (const auto& proposal : validated_.get<BlockProposal>(height)) {
        if (!seen(proposal.block_hash))
            out.push_back({ .hash = proposal.block_hash, .block = &proposal.block });
    }
    return out;
}

std::optional<BlockRef> PoolReader::block(Height height, const Hash& hash) const
{
    for (const auto& ref : blocks_at(height)) {
        if (ref.hash == hash)
            return ref;
    }
    return std::nullopt;
}

bool PoolReader::is_notarized(Height height, const Hash& hash) const
{
    for (const auto& n : validated_.get<Notarization>(height))
        if (n.content.block == hash)
            return true;
    for (const auto& f : validated_.get<Finalization>(height))
        if (f.content.block == hash)
            return true;
    for (const auto& cup : validated_.get<CatchUpPackage>(height))
        if (block_hash(cup.content.block) == hash)
            return true;
    return false;
}

std::vector<BlockRef> PoolReader::notarized_blocks(Height height) const
{
    auto blocks = blocks_at(height);
    std::erase_if(blocks, [&](const BlockRef& r) { return !is_notarized(height, r.hash); });
    return blocks;
}

std::vector<BlockRef> PoolReader::surviving_notarized_blocks(Height height) const
{
    auto blocks = notarized_blocks(height);
    auto children = notarized_blocks(height + 1);
    if (children.empty())
        return blocks;

    std::erase_if(blocks, [&](const BlockRef& r) {
        return std::ranges::none_of(children, [&](const BlockRef& c) { return c.block->parent == r.hash; });
    });
    return blocks;
}

std::optional<BlockRef> PoolReader::finalized_block(Height height) const
{
    auto top = current_round();
    if (!top || height > *top)
        return std::nullopt;

    for (const auto& f : validated_.get<Finalization>(height))
        return block(height, f.content.block);

    // Walk back from the highest finalized block.
    std::optional<BlockRef> current;
    if (const auto* cup = first_of<CatchUpPackage>(validated_, *top))
        current = BlockRef { .hash = block_hash(cup->content.block), .block = &cup->content.block };
    else if (const auto* fin = first_of<Finalization>(validated_, *top))
        current = block(*top, fin->content.block);

    for (Height h = *top; current && h > height; --h)
        current = block(h - 1, current->block->parent);
    return current;
}

std::optional<std::vector<Hash>> PoolReader::finalized_chain(Height from, Height to) const
{
    std::vector<Hash> chain;
    auto current = finalized_block(to);
    for (Height h = to; h > from; --h) {
        if (!current)
            return std::nullopt;
        chain.push_back(current->hash);
        if (h - 1 > from)
            current = block(h - 1, current->block->parent);
    }
    std::ranges::reverse(chain);
    return chain;
}

Height PoolReader::lowest_unresolved_height(Height catch_up_interval) const
{
    auto finalized = finalized_height();
    auto next_cup = next_catch_up_height(catch_up_interval);
    return next_cup <= finalized ? next_cup : finalized + 1;
}

std::optional<CatchUpContent> PoolReader::catch_up_content(Height height) const
{
    const auto* beacon = random_beacon(height);
    auto block = finalized_block(height);
    auto chain = finalized_chain(catch_up_height(), height);
    if (!beacon || !block || !chain)
        return std::nullopt;

    std::vector<Bytes> leaves;
    leaves.reserve(chain->size());
    for (const auto& h : *chain)
        leaves.emplace_back(h.begin(), h.end());
    auto root = Crypto::MerkleTree::build(leaves).root();
    if (!root)
        return std::nullopt;

    return CatchUpContent {
        .block = *block->block,
        .random_beacon = *beacon,
        .state_hash = *root,
    };
}

std::optional<Time> PoolReader::round_start_time(Height height) const
{
    if (height == 0)
        return std::nullopt;
    auto prev = height - 1;

    auto cup_time = first_added<CatchUpPackage>(validated_, prev);
    auto notarized_at = earliest(earliest(first_added<Notarization>(validated_, prev),
                                     first_added<Finalization>(validated_, prev)),
        cup_time);
    auto beacon_at = earliest(first_added<RandomBeacon>(validated_, prev), cup_time);

    if (!notarized_at || !beacon_at)
        return std::nullopt;
    return std::max(*notarized_at, *beacon_at);
}

} // namespace Subnet::Consensus
