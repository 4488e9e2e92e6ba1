#include <array>
#include <cassert>
#include <openssl/rand.h>

extern "C" {
#include <blst.h>
}
#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include "impl_common.hpp"

namespace Subnet::Crypto::bls {
static_assert(sizeof(Scalar) == sizeof(blst_scalar), "Scalar size mismatch with blst_scalar");

using impl::to_native;

namespace {
    constexpr std::string_view KEYGEN_DST = "SUBNET_CONSENSUS_SCALAR_XMD:SHA-256";
}

Scalar Scalar::from_uint64(uint64_t v)
{
    Scalar ret {};
    const uint64_t words[4] = { v, 0, 0, 0 };
    blst_scalar_from_uint64(to_native<blst_scalar>(&ret), words);
    return ret;
}

Scalar Scalar::from_be_bytes(BytesSpan bytes)
{
    Scalar ret {};
    // Inputs longer than 32 bytes are reduced modulo r.
    blst_scalar_from_be_bytes(to_native<blst_scalar>(&ret), u8ptr(bytes), bytes.size());
    return ret;
}

std::expected<Scalar, std::error_code> Scalar::random()
{
    std::array<Byte, 32> ikm {};
    if (!Utils::random_bytes(ikm)) {
        return std::unexpected(make_error_code(Error::RandomnessFailure));
    }

    // 48 bytes keep the modular bias negligible.
    std::array<Byte, 48> wide {};
    blst_expand_message_xmd(
        u8ptr(wide.data()), wide.size(),
        u8ptr(ikm.data()), ikm.size(),
        u8ptr(as_span(KEYGEN_DST)), KEYGEN_DST.size());

    return from_be_bytes(wide);
}

std::array<Byte, Scalar::BYTE_LENGTH> Scalar::to_be_bytes() const
{
    std::array<Byte, BYTE_LENGTH> out {};
    blst_bendian_from_scalar(u8ptr(out.data()), to_native<blst_scalar>(this));
    return out;
}

Scalar& Scalar::operator+=(const Scalar& other)
{
    [[maybe_unused]] bool ok = blst_sk_add_n_check(
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(&other));
    assert(ok && "blst add failed");
    return *this;
}

Scalar& Scalar::operator-=(const Scalar& other)
{
    [[maybe_unused]] bool ok = blst_sk_sub_n_check(
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(&other));
    assert(ok && "blst sub failed");
    return *this;
}

Scalar& Scalar::operator*=(const Scalar& other)
{
    [[maybe_unused]] bool ok = blst_sk_mul_n_check(
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(this),
        to_native<blst_scalar>(&other));
    assert(ok && "blst mul failed");
    return *this;
}

Scalar Scalar::operator-() const
{
    Scalar ret {};
    blst_scalar zero {};
    blst_sk_sub_n_check(
        to_native<blst_scalar>(&ret),
        &zero,
        to_native<blst_scalar>(this));
    return ret;
}

Scalar Scalar::inverse() const
{
    Scalar r {};
    blst_sk_inverse(to_native<blst_scalar>(&r), to_native<blst_scalar>(this));
    return r;
}

} // namespace Subnet::Crypto::bls
