extern "C" {
#include <blst.h>
}

#include "crypto/blst/P2.hpp"
#include "crypto/error.hpp"
#include "impl_common.hpp"

namespace Subnet::Crypto::bls {
using impl::to_native;

static_assert(sizeof(P2) == sizeof(blst_p2), "P2 size mismatch");
static_assert(alignof(P2) >= alignof(blst_p2), "P2 alignment mismatch");

P2 P2::generator()
{
    P2 ret {};
    *to_native<blst_p2>(&ret) = *blst_p2_generator();
    return ret;
}

P2 P2::identity()
{
    return P2 {};
}

std::expected<P2, std::error_code> P2::from_compressed(BytesSpan in)
{
    if (in.size() != COMPRESSED_SIZE) {
        return std::unexpected(make_error_code(Error::MalformedPoint));
    }
    blst_p2_affine affine;
    if (blst_p2_uncompress(&affine, u8ptr(in)) != BLST_SUCCESS) {
        return std::unexpected(make_error_code(Error::MalformedPoint));
    }
    if (!blst_p2_affine_in_g2(&affine)) {
        return std::unexpected(make_error_code(Error::MalformedPoint));
    }
    P2 ret {};
    blst_p2_from_affine(to_native<blst_p2>(&ret), &affine);
    return ret;
}

P2& P2::add(const P2& other)
{
    blst_p2_add_or_double(
        to_native<blst_p2>(this),
        to_native<blst_p2>(this),
        to_native<blst_p2>(&other));
    return *this;
}

P2& P2::mult(const Scalar& s)
{
    blst_p2_mult(
        to_native<blst_p2>(this),
        to_native<blst_p2>(this),
        reinterpret_cast<const uint8_t*>(s.limbs.data()),
        Scalar::BIT_LENGTH);
    return *this;
}

std::array<Byte, P2::COMPRESSED_SIZE> P2::compress() const
{
    std::array<Byte, COMPRESSED_SIZE> buf {};
    blst_p2_compress(u8ptr(buf.data()), to_native<blst_p2>(this));
    return buf;
}

bool operator==(const P2& a, const P2& b)
{
    return blst_p2_is_equal(to_native<blst_p2>(&a), to_native<blst_p2>(&b));
}

} // namespace Subnet::Crypto::bls
