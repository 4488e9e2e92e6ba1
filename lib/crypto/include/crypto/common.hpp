#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

namespace Subnet::Crypto {

using Byte = std::byte;
using Bytes = std::vector<Byte>;
using BytesSpan = std::span<const Byte>;
using MutableBytesSpan = std::span<Byte>;

using Hash256 = std::array<Byte, 32>;

inline BytesSpan as_span(std::string_view s)
{
    return { reinterpret_cast<const Byte*>(s.data()), s.size() };
}

// blst and OpenSSL take unsigned char pointers.
inline const uint8_t* u8ptr(const Byte* p) { return reinterpret_cast<const uint8_t*>(p); }
inline uint8_t* u8ptr(Byte* p) { return reinterpret_cast<uint8_t*>(p); }
inline const uint8_t* u8ptr(BytesSpan s) { return u8ptr(s.data()); }

namespace Utils {

    Hash256 sha256(BytesSpan data);

    // SHA-256 over the concatenation of several buffers.
    Hash256 sha256(std::initializer_list<BytesSpan> parts);

    template <size_t N>
    std::array<Byte, N> make_bytes(std::initializer_list<uint8_t> values)
    {
        std::array<Byte, N> out {};
        size_t i = 0;
        for (auto v : values) {
            if (i == N)
                break;
            out[i++] = static_cast<Byte>(v);
        }
        return out;
    }

    // Fills `out` from the OpenSSL CSPRNG. Returns false on RNG failure.
    [[nodiscard]] bool random_bytes(MutableBytesSpan out);

} // namespace Utils

} // namespace Subnet::Crypto
