#include "crypto/common.hpp"
#include "threshold/utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace Subnet::Crypto::Utils {
using impl::EvpMdCtxPtr;

Hash256 sha256(BytesSpan data)
{
    return sha256({ data });
}

Hash256 sha256(std::initializer_list<BytesSpan> parts)
{
    Hash256 hash {};
    unsigned int len = 0;

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP SHA-256 initialisation failed");
    }
    for (const auto& part : parts) {
        if (EVP_DigestUpdate(ctx.get(), u8ptr(part), part.size()) != 1) {
            throw std::runtime_error("EVP SHA-256 update failed");
        }
    }
    if (EVP_DigestFinal_ex(ctx.get(), u8ptr(hash.data()), &len) != 1) {
        throw std::runtime_error("EVP SHA-256 finalisation failed");
    }
    return hash;
}

bool random_bytes(MutableBytesSpan out)
{
    return RAND_bytes(u8ptr(out.data()), static_cast<int>(out.size())) == 1;
}

} // namespace Subnet::Crypto::Utils
