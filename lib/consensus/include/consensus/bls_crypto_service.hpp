#pragma once

#include "consensus/common.hpp"
#include "consensus/concept.hpp"
#include "crypto/ecdsa.hpp"
#include "crypto/threshold/tbls.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace Subnet::Consensus {

/**
 * Keys of a simulated subnet, dealt by a trusted dealer: a low-threshold
 * (f + 1) and a high-threshold (n - f) BLS key set plus one ECDSA key pair
 * per member. Player ids follow the order of `members`.
 **/
struct KeyMaterial {
    std::vector<NodeId> members;
    Crypto::Tbls::TblsKeySet low;
    Crypto::Tbls::TblsKeySet high;
    std::vector<Crypto::Ecdsa::PrivateKey> private_keys;
    std::vector<Crypto::Ecdsa::PublicKey> public_keys;

    static std::expected<KeyMaterial, std::error_code> generate(std::vector<NodeId> members);
};

/// Crypto capability of one node backed by threshold BLS and ECDSA.
class BlsCryptoService {
public:
    /// NotAMember if `self` holds no keys in `keys`.
    static std::expected<BlsCryptoService, std::error_code> create(NodeId self, std::shared_ptr<const KeyMaterial> keys);

    std::expected<Bytes, std::error_code> sign(BytesSpan msg);
    bool verify(NodeId signer, BytesSpan msg, const Bytes& sig) const;

    std::expected<Bytes, std::error_code> sign_share(BytesSpan msg, int threshold);
    bool verify_share(NodeId signer, BytesSpan msg, const Bytes& sig, int threshold) const;

    std::expected<Bytes, std::error_code> combine(BytesSpan msg, std::span<const SignatureShare> shares, int threshold) const;
    bool verify_aggregate(BytesSpan msg, const Bytes& sig, int threshold) const;

private:
    BlsCryptoService(NodeId self, size_t index, std::shared_ptr<const KeyMaterial> keys)
        : self_(self)
        , index_(index)
        , keys_(std::move(keys))
    {
    }

    [[nodiscard]] const Crypto::Tbls::TblsKeySet* key_set(int threshold) const;
    [[nodiscard]] std::optional<size_t> index_of(NodeId node) const;

    NodeId self_;
    size_t index_;
    std::shared_ptr<const KeyMaterial> keys_;
    Crypto::Ecdsa::Context ctx_;
};

static_assert(CryptoService<BlsCryptoService>);

} // namespace Subnet::Consensus
