#include "crypto/merkle_tree.hpp"
#include <bit>
#include <array>

namespace Subnet::Crypto::MerkleTree {

namespace detail {

    constexpr std::array<Byte, 1> LEAF_PREFIX { Byte { 0x00 } };
    constexpr std::array<Byte, 1> INTERNAL_PREFIX { Byte { 0x01 } };

    Hash hash_leaf(BytesSpan data)
    {
        return Utils::sha256({ LEAF_PREFIX, data });
    }

    Hash hash_internal(const Hash& left, const Hash& right)
    {
        return Utils::sha256({ INTERNAL_PREFIX, left, right });
    }

} // namespace detail

std::optional<Hash> Tree::root() const
{
    if (nodes_.size() < 2)
        return std::nullopt;
    return nodes_[1];
}

Tree build(std::span<const Bytes> leaves)
{
    Tree tree;

    if (leaves.empty()) {
        return tree;
    }

    size_t N = leaves.size();
    tree.leaf_count_ = N;

    size_t P = std::bit_ceil(N);
    tree.nodes_.resize(2 * P);

    for (size_t i = 0; i < N; ++i) {
        tree.nodes_[P + i] = detail::hash_leaf(leaves[i]);
    }

    if (N < P) {
        Hash empty_leaf_hash = detail::hash_leaf({});
        for (size_t i = N; i < P; ++i) {
            tree.nodes_[P + i] = empty_leaf_hash;
        }
    }

    for (size_t i = P - 1; i > 0; --i) {
        tree.nodes_[i] = detail::hash_internal(tree.nodes_[2 * i], tree.nodes_[2 * i + 1]);
    }

    return tree;
}

} // namespace Subnet::Crypto::MerkleTree
