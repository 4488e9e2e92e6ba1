#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Subnet::Crypto {

enum class Error : std::uint8_t {
    Success = 0,
    InvalidThreshold,
    InvalidPlayerCount,
    InvalidShareID,
    ShareVerificationFailed,
    SignatureVerificationFailed,
    NotEnoughShares,
    DuplicatePlayerID,
    RandomnessFailure,
    MalformedPoint,
    InvalidKey,
    SigningFailed,
};

class CryptoErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "SubnetCrypto"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::InvalidThreshold:
            return "Threshold k must be between 1 and players";
        case Error::InvalidPlayerCount:
            return "Player count must be positive";
        case Error::InvalidShareID:
            return "Share ID is out of valid range";
        case Error::ShareVerificationFailed:
            return "Share verification failed";
        case Error::SignatureVerificationFailed:
            return "Signature verification failed";
        case Error::NotEnoughShares:
            return "Not enough shares to reconstruct signature";
        case Error::DuplicatePlayerID:
            return "Duplicate player ID among shares";
        case Error::RandomnessFailure:
            return "OpenSSL RNG failure";
        case Error::MalformedPoint:
            return "Malformed curve point encoding";
        case Error::InvalidKey:
            return "Key is not a valid secp256k1 key";
        case Error::SigningFailed:
            return "ECDSA signing failed";
        default:
            return "Unknown crypto error";
        }
    }
};

inline const std::error_category& crypto_category()
{
    static CryptoErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), crypto_category() };
}

} // namespace Subnet::Crypto

namespace std {
template <>
struct is_error_code_enum<Subnet::Crypto::Error> : true_type { };
} // namespace std
