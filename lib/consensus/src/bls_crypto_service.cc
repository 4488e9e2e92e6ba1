#include "consensus/bls_crypto_service.hpp"
#include "consensus/error.hpp"
#include "crypto/error.hpp"

#include <algorithm>

namespace Subnet::Consensus {

namespace {

    using Crypto::Tbls::P1;

    template <size_t N>
    Bytes to_bytes(const std::array<Byte, N>& a)
    {
        return { a.begin(), a.end() };
    }

    template <size_t N>
    std::optional<std::array<Byte, N>> to_array(const Bytes& b)
    {
        if (b.size() != N)
            return std::nullopt;
        std::array<Byte, N> out {};
        std::ranges::copy(b, out.begin());
        return out;
    }

} // namespace

std::expected<KeyMaterial, std::error_code> KeyMaterial::generate(std::vector<NodeId> members)
{
    if (members.empty())
        return std::unexpected(Error::InvalidConfig);
    std::ranges::sort(members);

    const auto n = static_cast<int>(members.size());
    const auto ctx = SystemContext::for_members(n);

    auto low = Crypto::Tbls::generate_keys(n, ctx.low_threshold());
    if (!low)
        return std::unexpected(low.error());
    auto high = Crypto::Tbls::generate_keys(n, ctx.high_threshold());
    if (!high)
        return std::unexpected(high.error());

    KeyMaterial keys {
        .members = std::move(members),
        .low = std::move(*low),
        .high = std::move(*high),
        .private_keys = {},
        .public_keys = {},
    };

    Crypto::Ecdsa::Context ecdsa;
    for (int i = 0; i < n; ++i) {
        auto sk = Crypto::Ecdsa::generate_private_key(ecdsa);
        if (!sk)
            return std::unexpected(sk.error());
        auto pk = Crypto::Ecdsa::get_public_key(ecdsa, *sk);
        if (!pk)
            return std::unexpected(pk.error());
        keys.private_keys.push_back(*sk);
        keys.public_keys.push_back(*pk);
    }
    return keys;
}

std::expected<BlsCryptoService, std::error_code> BlsCryptoService::create(NodeId self, std::shared_ptr<const KeyMaterial> keys)
{
    auto it = std::ranges::find(keys->members, self);
    if (it == keys->members.end())
        return std::unexpected(Error::NotAMember);
    auto index = static_cast<size_t>(it - keys->members.begin());
    return BlsCryptoService(self, index, std::move(keys));
}

std::expected<Bytes, std::error_code> BlsCryptoService::sign(BytesSpan msg)
{
    auto sig = Crypto::Ecdsa::sign(ctx_, keys_->private_keys[index_], msg);
    if (!sig)
        return std::unexpected(sig.error());
    return to_bytes(*sig);
}

bool BlsCryptoService::verify(NodeId signer, BytesSpan msg, const Bytes& sig) const
{
    auto index = index_of(signer);
    auto raw = to_array<64>(sig);
    if (!index || !raw)
        return false;
    return Crypto::Ecdsa::verify(ctx_, keys_->public_keys[*index], msg, *raw);
}

std::expected<Bytes, std::error_code> BlsCryptoService::sign_share(BytesSpan msg, int threshold)
{
    const auto* set = key_set(threshold);
    if (set == nullptr)
        return std::unexpected(Crypto::Error::InvalidThreshold);
    auto partial = Crypto::Tbls::sign_share(set->private_shares[index_], msg);
    return to_bytes(partial.value.compress());
}

bool BlsCryptoService::verify_share(NodeId signer, BytesSpan msg, const Bytes& sig, int threshold) const
{
    const auto* set = key_set(threshold);
    auto index = index_of(signer);
    if (set == nullptr || !index)
        return false;
    auto point = P1::from_compressed(sig);
    if (!point)
        return false;
    return Crypto::Tbls::verify_share(set->public_params, *point, msg, static_cast<int>(*index) + 1).has_value();
}

std::expected<Bytes, std::error_code> BlsCryptoService::combine(BytesSpan msg, std::span<const SignatureShare> shares, int threshold) const
{
    const auto* set = key_set(threshold);
    if (set == nullptr)
        return std::unexpected(Crypto::Error::InvalidThreshold);
    if (shares.size() < static_cast<size_t>(threshold))
        return std::unexpected(Error::InsufficientShares);

    std::vector<Crypto::Tbls::PartialSignature> partials;
    partials.reserve(shares.size());
    for (const auto& share : shares) {
        auto index = index_of(share.signer);
        if (!index)
            return std::unexpected(Error::NotAMember);
        auto point = P1::from_compressed(share.signature);
        if (!point)
            return std::unexpected(point.error());
        partials.push_back({ .player_id = static_cast<int>(*index) + 1, .value = *point });
    }

    auto combined = Crypto::Tbls::combine_partial_signatures(set->public_params, partials);
    if (!combined)
        return std::unexpected(combined.error());
    if (auto ok = Crypto::Tbls::verify_signature(set->public_params, msg, *combined); !ok)
        return std::unexpected(ok.error());
    return to_bytes(combined->compress());
}

bool BlsCryptoService::verify_aggregate(BytesSpan msg, const Bytes& sig, int threshold) const
{
    const auto* set = key_set(threshold);
    if (set == nullptr)
        return false;
    auto point = P1::from_compressed(sig);
    if (!point)
        return false;
    return Crypto::Tbls::verify_signature(set->public_params, msg, *point).has_value();
}

const Crypto::Tbls::TblsKeySet* BlsCryptoService::key_set(int threshold) const
{
    if (threshold == keys_->low.public_params.threshold)
        return &keys_->low;
    if (threshold == keys_->high.public_params.threshold)
        return &keys_->high;
    return nullptr;
}

std::optional<size_t> BlsCryptoService::index_of(NodeId node) const
{
    auto it = std::ranges::find(keys_->members, node);
    if (it == keys_->members.end())
        return std::nullopt;
    return static_cast<size_t>(it - keys_->members.begin());
}

} // namespace Subnet::Consensus
