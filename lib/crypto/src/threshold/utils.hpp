#pragma once

#include <memory>
#include <openssl/evp.h>

namespace Subnet::Crypto::impl {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
    decltype([](EVP_MD_CTX* ctx) {
        EVP_MD_CTX_free(ctx);
    })>;

} // namespace Subnet::Crypto::impl
