#include "crypto/ecdsa.hpp"
#include "crypto/common.hpp"
#include "crypto/error.hpp"
#include <optional>
#include <secp256k1.h>
#include <utility>

namespace Subnet::Crypto::Ecdsa {

namespace {

    constexpr int KeygenAttempts = 16;

    void destroy(secp256k1_context* ctx)
    {
        if (ctx != nullptr)
            secp256k1_context_destroy(ctx);
    }

    std::optional<secp256k1_pubkey> parse_public_key(const secp256k1_context* ctx, const PublicKey& key)
    {
        secp256k1_pubkey parsed;
        if (secp256k1_ec_pubkey_parse(ctx, &parsed, u8ptr(key.data()), key.size()) != 1)
            return std::nullopt;
        return parsed;
    }

    bool valid_secret(const secp256k1_context* ctx, const PrivateKey& key)
    {
        return secp256k1_ec_seckey_verify(ctx, u8ptr(key.data())) == 1;
    }

} // namespace

Context::Context()
    : ptr_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY))
{
    std::array<Byte, 32> seed {};
    blinded_ = ptr_ != nullptr && Utils::random_bytes(seed)
        && secp256k1_context_randomize(ptr_, u8ptr(seed.data())) == 1;
}

Context::~Context()
{
    destroy(ptr_);
}

Context::Context(Context&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , blinded_(std::exchange(other.blinded_, false))
{
}

Context& Context::operator=(Context&& other) noexcept
{
    if (this != &other) {
        destroy(ptr_);
        ptr_ = std::exchange(other.ptr_, nullptr);
        blinded_ = std::exchange(other.blinded_, false);
    }
    return *this;
}

auto sign(const Context& ctx, const PrivateKey& priv_key, BytesSpan msg)
    -> std::expected<Signature, std::error_code>
{
    if (!valid_secret(ctx.get(), priv_key))
        return std::unexpected(make_error_code(Error::InvalidKey));

    const auto digest = Utils::sha256(msg);
    secp256k1_ecdsa_signature raw;
    if (secp256k1_ecdsa_sign(ctx.get(), &raw, u8ptr(digest.data()), u8ptr(priv_key.data()),
            secp256k1_nonce_function_rfc6979, nullptr)
        != 1)
        return std::unexpected(make_error_code(Error::SigningFailed));

    Signature compact {};
    secp256k1_ecdsa_signature_serialize_compact(ctx.get(), u8ptr(compact.data()), &raw);
    return compact;
}

bool verify(const Context& ctx, const PublicKey& pub_key, BytesSpan msg, const Signature& sig)
{
    auto key = parse_public_key(ctx.get(), pub_key);
    if (!key)
        return false;

    secp256k1_ecdsa_signature raw;
    if (secp256k1_ecdsa_signature_parse_compact(ctx.get(), &raw, u8ptr(sig.data())) != 1)
        return false;

    const auto digest = Utils::sha256(msg);
    return secp256k1_ecdsa_verify(ctx.get(), &raw, u8ptr(digest.data()), &*key) == 1;
}

auto get_public_key(const Context& ctx, const PrivateKey& priv_key)
    -> std::expected<PublicKey, std::error_code>
{
    secp256k1_pubkey point;
    if (!valid_secret(ctx.get(), priv_key) || secp256k1_ec_pubkey_create(ctx.get(), &point, u8ptr(priv_key.data())) != 1)
        return std::unexpected(make_error_code(Error::InvalidKey));

    PublicKey compressed {};
    size_t len = compressed.size();
    secp256k1_ec_pubkey_serialize(ctx.get(), u8ptr(compressed.data()), &len, &point, SECP256K1_EC_COMPRESSED);
    return compressed;
}

auto generate_private_key(const Context& ctx) -> std::expected<PrivateKey, std::error_code>
{
    PrivateKey key {};
    for (int attempt = 0; attempt < KeygenAttempts; ++attempt) {
        if (!Utils::random_bytes(key))
            return std::unexpected(make_error_code(Error::RandomnessFailure));
        if (valid_secret(ctx.get(), key))
            return key;
    }
    return std::unexpected(make_error_code(Error::RandomnessFailure));
}

} // namespace Subnet::Crypto::Ecdsa
