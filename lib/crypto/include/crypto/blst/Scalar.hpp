#pragma once

#include "crypto/common.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <system_error>

namespace Subnet::Crypto::bls {

// Element of the BLS12-381 scalar field. Layout-compatible with blst_scalar.
struct Scalar {
    static constexpr size_t BIT_LENGTH = 255;
    static constexpr size_t BYTE_LENGTH = 32;

    alignas(uint64_t) std::array<uint64_t, 4> limbs {};

    static Scalar from_uint64(uint64_t v);
    static Scalar from_be_bytes(BytesSpan bytes);

    // Uniform scalar from the OpenSSL CSPRNG.
    static std::expected<Scalar, std::error_code> random();

    [[nodiscard]] std::array<Byte, BYTE_LENGTH> to_be_bytes() const;

    Scalar& operator+=(const Scalar& other);
    Scalar& operator-=(const Scalar& other);
    Scalar& operator*=(const Scalar& other);

    friend Scalar operator+(Scalar a, const Scalar& b) { return a += b; }
    friend Scalar operator-(Scalar a, const Scalar& b) { return a -= b; }
    friend Scalar operator*(Scalar a, const Scalar& b) { return a *= b; }

    Scalar operator-() const;

    [[nodiscard]] Scalar inverse() const;

    bool operator==(const Scalar& other) const = default;
};

} // namespace Subnet::Crypto::bls
