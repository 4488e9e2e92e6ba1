#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "crypto/common.hpp"

namespace Subnet::Crypto::MerkleTree {

using Hash = Hash256;

class Tree {
public:
    Tree() = default;

    [[nodiscard]] std::optional<Hash> root() const;

    [[nodiscard]] size_t leaf_count() const { return leaf_count_; }

private:
    friend Tree build(std::span<const Bytes> leaves);

    size_t leaf_count_ = 0;
    // Heap layout: root at 1, leaves at [P, 2P) where P is the padded leaf count.
    std::vector<Hash> nodes_;
};

/// Leaves are padded with empty leaves up to the next power of two.
[[nodiscard]]
Tree build(std::span<const Bytes> leaves);

namespace detail {
    // Hash(0x00 || data)
    Hash hash_leaf(BytesSpan data);

    // Hash(0x01 || left || right)
    Hash hash_internal(const Hash& left, const Hash& right);
}

} // namespace Subnet::Crypto::MerkleTree
