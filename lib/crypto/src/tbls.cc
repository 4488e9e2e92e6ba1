#include "crypto/threshold/tbls.hpp"
#include "crypto/error.hpp"
#include "threshold/math.hpp"
#include <string_view>

namespace Subnet::Crypto::Tbls {

namespace {
    constexpr std::string_view DST_SIG = "BLS_SIG_BLS12381G1_XMD:SHA-256_SSWU_RO_NUL_";
}

PartialSignature sign_share(const TblsPrivateKeyShare& share, BytesSpan message)
{
    auto sig = P1::from_hash(message, as_span(DST_SIG));
    sig.sign_with(share.secret);
    return { .player_id = share.player_id, .value = sig };
}

auto verify_share(const TblsVerificationParameters& params,
    const SignatureShare& partial_sig,
    BytesSpan message,
    int player_id)
    -> std::expected<void, std::error_code>
{
    if (player_id < 1 || player_id > params.total_players) {
        return std::unexpected(make_error_code(Error::InvalidShareID));
    }
    const auto& vk = params.verification_vector[static_cast<size_t>(player_id - 1)];
    if (!partial_sig.core_verify(vk, message, as_span(DST_SIG))) {
        return std::unexpected(make_error_code(Error::ShareVerificationFailed));
    }
    return {};
}

auto combine_partial_signatures(const TblsVerificationParameters& params,
    std::span<const PartialSignature> partial_signatures)
    -> std::expected<Signature, std::error_code>
{
    if (partial_signatures.size() < static_cast<size_t>(params.threshold)) {
        return std::unexpected(make_error_code(Error::NotEnoughShares));
    }
    for (const auto& ps : partial_signatures) {
        if (ps.player_id < 1 || ps.player_id > params.total_players) {
            return std::unexpected(make_error_code(Error::InvalidShareID));
        }
    }
    return Math::interpolate_at_zero(partial_signatures.first(static_cast<size_t>(params.threshold)));
}

auto verify_signature(const TblsVerificationParameters& params,
    BytesSpan message,
    const Signature& signature)
    -> std::expected<void, std::error_code>
{
    if (!signature.core_verify(params.master_public_key, message, as_span(DST_SIG))) {
        return std::unexpected(make_error_code(Error::SignatureVerificationFailed));
    }
    return {};
}

} // namespace Subnet::Crypto::Tbls
