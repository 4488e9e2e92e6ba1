#pragma once

#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include <array>
#include <expected>
#include <system_error>

namespace Subnet::Crypto::bls {

class P2;

// Point on G1 in projective coordinates. Signatures and signature shares live here.
class P1 {
public:
    static constexpr size_t COMPRESSED_SIZE = 48;

    static P1 generator();
    static P1 identity();

    // Hash-to-curve (SSWU, random oracle variant).
    static P1 from_hash(BytesSpan msg, BytesSpan dst);

    static std::expected<P1, std::error_code> from_compressed(BytesSpan in);

    P1& add(const P1& other);
    P1& mult(const Scalar& s);

    // this = this * sk, where this is the hashed message.
    P1& sign_with(const Scalar& sk);

    [[nodiscard]] std::array<Byte, COMPRESSED_SIZE> compress() const;

    // Pairing check e(this, g2) == e(H(msg), pk).
    [[nodiscard]] bool core_verify(const P2& pk, BytesSpan msg, BytesSpan dst) const;

    friend bool operator==(const P1& a, const P1& b);

private:
    // x, y, z, each a 384-bit field element.
    alignas(uint64_t) std::array<uint64_t, 18> storage_ {};
};

} // namespace Subnet::Crypto::bls
