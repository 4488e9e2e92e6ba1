#pragma once

#include <array>
#include <expected>
#include <system_error>

#include "crypto/common.hpp"

struct secp256k1_context_struct;

namespace Subnet::Crypto::Ecdsa {

using PrivateKey = std::array<Byte, 32>;
using PublicKey = std::array<Byte, 33>;
using Signature = std::array<Byte, 64>;

/// Owns a secp256k1 context, blinded with fresh randomness when the RNG allows.
class Context {
public:
    Context();
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&& other) noexcept;
    Context& operator=(Context&& other) noexcept;

    [[nodiscard]] secp256k1_context_struct* get() const { return ptr_; }
    [[nodiscard]] bool blinded() const { return blinded_; }

private:
    secp256k1_context_struct* ptr_ = nullptr;
    bool blinded_ = false;
};

// Signs SHA-256(msg) with an RFC 6979 nonce, so equal inputs give equal signatures.
// InvalidKey if `priv_key` is zero or not below the group order.
auto sign(const Context& ctx,
    const PrivateKey& priv_key,
    BytesSpan msg)
    -> std::expected<Signature, std::error_code>;

// False on malformed keys or signatures and on non-normalized (high S) signatures.
bool verify(const Context& ctx,
    const PublicKey& pub_key,
    BytesSpan msg,
    const Signature& sig);

auto get_public_key(const Context& ctx,
    const PrivateKey& priv_key)
    -> std::expected<PublicKey, std::error_code>;

// Draws private keys until one is a valid secp256k1 secret.
auto generate_private_key(const Context& ctx)
    -> std::expected<PrivateKey, std::error_code>;

} // namespace Subnet::Crypto::Ecdsa
