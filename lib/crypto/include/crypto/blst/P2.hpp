#pragma once

#include "crypto/blst/Scalar.hpp"
#include "crypto/common.hpp"
#include <array>
#include <expected>
#include <system_error>

namespace Subnet::Crypto::bls {

class P1;

// Point on G2 in projective coordinates. Public keys live here.
class P2 {
public:
    static constexpr size_t COMPRESSED_SIZE = 96;

    static P2 generator();
    static P2 identity();

    static std::expected<P2, std::error_code> from_compressed(BytesSpan in);

    P2& add(const P2& other);
    P2& mult(const Scalar& s);

    [[nodiscard]] std::array<Byte, COMPRESSED_SIZE> compress() const;

    friend bool operator==(const P2& a, const P2& b);

private:
    friend class P1;

    // x, y, z, each an element of Fp2.
    alignas(uint64_t) std::array<uint64_t, 36> storage_ {};
};

} // namespace Subnet::Crypto::bls
