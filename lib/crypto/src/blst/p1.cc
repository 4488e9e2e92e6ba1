extern "C" {
#include <blst.h>
}

#include "crypto/blst/P1.hpp"
#include "crypto/blst/P2.hpp"
#include "crypto/error.hpp"
#include "impl_common.hpp"

namespace Subnet::Crypto::bls {
using impl::to_native;

static_assert(sizeof(P1) == sizeof(blst_p1), "P1 size mismatch");
static_assert(alignof(P1) >= alignof(blst_p1), "P1 alignment mismatch");

P1 P1::generator()
{
    P1 ret {};
    *to_native<blst_p1>(&ret) = *blst_p1_generator();
    return ret;
}

P1 P1::identity()
{
    // All-zero storage has z == 0, the point at infinity.
    return P1 {};
}

P1 P1::from_hash(BytesSpan msg, BytesSpan dst)
{
    P1 ret {};
    blst_hash_to_g1(
        to_native<blst_p1>(&ret),
        u8ptr(msg), msg.size(),
        u8ptr(dst), dst.size(),
        nullptr, 0);
    return ret;
}

std::expected<P1, std::error_code> P1::from_compressed(BytesSpan in)
{
    if (in.size() != COMPRESSED_SIZE) {
        return std::unexpected(make_error_code(Error::MalformedPoint));
    }
    blst_p1_affine affine;
    if (blst_p1_uncompress(&affine, u8ptr(in)) != BLST_SUCCESS) {
        return std::unexpected(make_error_code(Error::MalformedPoint));
    }
    if (!blst_p1_affine_in_g1(&affine)) {
        return std::unexpected(make_error_code(Error::MalformedPoint));
    }
    P1 ret {};
    blst_p1_from_affine(to_native<blst_p1>(&ret), &affine);
    return ret;
}

P1& P1::add(const P1& other)
{
    blst_p1_add_or_double(
        to_native<blst_p1>(this),
        to_native<blst_p1>(this),
        to_native<blst_p1>(&other));
    return *this;
}

P1& P1::mult(const Scalar& s)
{
    // blst_scalar stores its value little-endian, which matches the limb layout on the
    // little-endian targets blst supports.
    blst_p1_mult(
        to_native<blst_p1>(this),
        to_native<blst_p1>(this),
        reinterpret_cast<const uint8_t*>(s.limbs.data()),
        Scalar::BIT_LENGTH);
    return *this;
}

P1& P1::sign_with(const Scalar& sk)
{
    blst_sign_pk_in_g2(
        to_native<blst_p1>(this),
        to_native<blst_p1>(this),
        to_native<blst_scalar>(&sk));
    return *this;
}

std::array<Byte, P1::COMPRESSED_SIZE> P1::compress() const
{
    std::array<Byte, COMPRESSED_SIZE> buf {};
    blst_p1_compress(u8ptr(buf.data()), to_native<blst_p1>(this));
    return buf;
}

bool P1::core_verify(const P2& pk, BytesSpan msg, BytesSpan dst) const
{
    blst_p1_affine sig_affine;
    blst_p2_affine pk_affine;
    blst_p1_to_affine(&sig_affine, to_native<blst_p1>(this));
    blst_p2_to_affine(&pk_affine, to_native<blst_p2>(&pk));

    return blst_core_verify_pk_in_g2(
               &pk_affine, &sig_affine, true,
               u8ptr(msg), msg.size(),
               u8ptr(dst), dst.size(),
               nullptr, 0)
        == BLST_SUCCESS;
}

bool operator==(const P1& a, const P1& b)
{
    return blst_p1_is_equal(to_native<blst_p1>(&a), to_native<blst_p1>(&b));
}

} // namespace Subnet::Crypto::bls
