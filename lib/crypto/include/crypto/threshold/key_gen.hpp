#pragma once

#include "crypto/blst/Scalar.hpp"
#include "crypto/error.hpp"
#include <expected>
#include <ranges>
#include <span>
#include <system_error>
#include <vector>

namespace Subnet::Crypto::Threshold {

using Scalar = Subnet::Crypto::bls::Scalar;

template <typename T>
concept IsGroupElement = requires(T a, Scalar s) {
    { T::generator() } -> std::same_as<T>;
    { a.mult(s) } -> std::same_as<T&>;
};

using SecretShare = Scalar;

/**
 * @struct VerificationParameters
 * @brief Holds all public information required to verify the threshold scheme.
 */
template <IsGroupElement MasterKeyT, IsGroupElement ShareKeyT>
struct VerificationParameters {
    using MasterPublicKey = MasterKeyT;
    using SharePublicKey = ShareKeyT;

    int total_players;
    int threshold;

    MasterPublicKey master_public_key;
    std::vector<SharePublicKey> verification_vector;
};

/**
 * @struct PrivateKeyShare
 * @brief A single player's private key share and their 1-based ID.
 */
struct PrivateKeyShare {
    int player_id;
    SecretShare secret;
};

template <IsGroupElement MasterKeyT, IsGroupElement ShareKeyT>
struct DistributedKeySet {
    VerificationParameters<MasterKeyT, ShareKeyT> public_params;
    std::vector<PrivateKeyShare> private_shares;
};

inline auto random_poly(int degree) -> std::expected<std::vector<Scalar>, std::error_code>
{
    std::vector<Scalar> coeffs;
    coeffs.reserve(degree);
    for (int i = 0; i < degree; ++i) {
        auto c = Scalar::random();
        if (!c)
            return std::unexpected(c.error());
        coeffs.push_back(*c);
    }
    return coeffs;
}

inline Scalar polynom_eval(Scalar x, std::span<const Scalar> coeffs)
{
    if (coeffs.empty())
        return Scalar::from_uint64(0);
    Scalar res = coeffs.back();
    for (auto it = coeffs.rbegin() + 1; it != coeffs.rend(); ++it)
        res = res * x + (*it);
    return res;
}

// Trusted dealer for a (k, players) scheme.
template <IsGroupElement MasterKeyT, IsGroupElement ShareKeyT>
auto generate_keys(int players, int k)
    -> std::expected<DistributedKeySet<MasterKeyT, ShareKeyT>, std::error_code>
{
    if (players < 1)
        return std::unexpected(make_error_code(Error::InvalidPlayerCount));
    if (k < 1 || k > players)
        return std::unexpected(make_error_code(Error::InvalidThreshold));

    // A (k, n) scheme requires a polynomial of degree k-1, which has k coefficients.
    auto secret_polynomial = random_poly(k);
    if (!secret_polynomial)
        return std::unexpected(secret_polynomial.error());

    const auto& master_secret = (*secret_polynomial)[0];
    auto master_public_key = MasterKeyT::generator();
    master_public_key.mult(master_secret);

    std::vector<PrivateKeyShare> private_shares;
    std::vector<ShareKeyT> verification_vector;
    private_shares.reserve(players);
    verification_vector.reserve(players);

    for (int player_id : std::views::iota(1, players + 1)) {
        SecretShare player_secret_share = polynom_eval(Scalar::from_uint64(player_id), *secret_polynomial);

        private_shares.push_back({
            .player_id = player_id,
            .secret = player_secret_share,
        });

        auto share_public_key = ShareKeyT::generator();
        share_public_key.mult(player_secret_share);
        verification_vector.push_back(share_public_key);
    }

    return DistributedKeySet<MasterKeyT, ShareKeyT> {
        .public_params = {
            .total_players = players,
            .threshold = k,
            .master_public_key = master_public_key,
            .verification_vector = std::move(verification_vector),
        },
        .private_shares = std::move(private_shares),
    };
}

} // namespace Subnet::Crypto::Threshold
