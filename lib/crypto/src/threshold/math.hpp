#pragma once

#include "crypto/blst/Scalar.hpp"
#include "crypto/error.hpp"
#include <algorithm>
#include <expected>
#include <span>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Subnet::Crypto::Math {

using Scalar = Subnet::Crypto::bls::Scalar;

template <typename T>
concept GroupElement = requires(T a, T b, Scalar s) {
    { T::identity() } -> std::same_as<T>;
    { a.add(b) } -> std::same_as<T&>;
    { a.mult(s) } -> std::same_as<T&>;
};

template <typename T>
concept PlayerShare = requires(const T& a) {
    { a.player_id } -> std::convertible_to<int>;
    requires GroupElement<std::decay_t<decltype(a.value)>>;
};

/**
 * Lagrange basis polynomials of the given evaluation points, evaluated at 0:
 * lambda_i = prod_{j != i} x_j / (x_j - x_i).
 *
 * Ids must be positive and distinct (DuplicatePlayerID, InvalidShareID).
 */
inline auto lagrange_at_zero(std::span<const int> player_ids)
    -> std::expected<std::vector<Scalar>, std::error_code>
{
    if (player_ids.empty())
        return std::unexpected(make_error_code(Error::NotEnoughShares));
    if (std::ranges::any_of(player_ids, [](int id) { return id < 1; }))
        return std::unexpected(make_error_code(Error::InvalidShareID));

    std::vector<int> sorted(player_ids.begin(), player_ids.end());
    std::ranges::sort(sorted);
    if (std::ranges::adjacent_find(sorted) != sorted.end())
        return std::unexpected(make_error_code(Error::DuplicatePlayerID));

    std::vector<Scalar> xs;
    xs.reserve(player_ids.size());
    for (int id : player_ids)
        xs.push_back(Scalar::from_uint64(static_cast<uint64_t>(id)));

    std::vector<Scalar> coefficients;
    coefficients.reserve(xs.size());
    for (size_t i = 0; i < xs.size(); ++i) {
        auto num = Scalar::from_uint64(1);
        auto den = Scalar::from_uint64(1);
        for (size_t j = 0; j < xs.size(); ++j) {
            if (j == i)
                continue;
            num *= xs[j];
            den *= xs[j] - xs[i];
        }
        coefficients.push_back(num * den.inverse());
    }
    return coefficients;
}

/// Recovers f(0) "in the exponent" from shares f(id) * G.
template <PlayerShare ShareT>
auto interpolate_at_zero(std::span<const ShareT> shares)
    -> std::expected<std::decay_t<decltype(shares[0].value)>, std::error_code>
{
    using Element = std::decay_t<decltype(shares[0].value)>;

    std::vector<int> ids;
    ids.reserve(shares.size());
    for (const auto& s : shares)
        ids.push_back(s.player_id);

    auto lambdas = lagrange_at_zero(ids);
    if (!lambdas)
        return std::unexpected(lambdas.error());

    auto acc = Element::identity();
    for (size_t i = 0; i < shares.size(); ++i) {
        Element term = shares[i].value;
        acc.add(term.mult((*lambdas)[i]));
    }
    return acc;
}

} // namespace Subnet::Crypto::Math
