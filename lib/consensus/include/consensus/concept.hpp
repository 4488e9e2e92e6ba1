#pragma once

#include "consensus/artifact.hpp"
#include "consensus/common.hpp"
#include <concepts>
#include <expected>
#include <optional>
#include <set>
#include <span>
#include <system_error>

namespace Subnet::Consensus {

struct SignatureShare {
    NodeId signer;
    Bytes signature;
};

/// Per-height membership view of the registry.
template <typename T>
concept MembershipRegistry = requires(const T& r, Height height, SubnetId subnet) {
    { r.members_at(height, subnet) } -> std::same_as<std::optional<std::set<NodeId>>>;
    { r.registry_version(height, subnet) } -> std::same_as<std::optional<uint64_t>>;
};

/**
 * Signing capability of the local node.
 * Basic signatures authenticate block proposals; threshold signatures back
 * every share and aggregate, keyed by the threshold they are combined at.
 **/
template <typename T>
concept CryptoService = requires(T& c, const T& cc,
    NodeId signer, BytesSpan msg, const Bytes& sig,
    std::span<const SignatureShare> shares, int threshold) {
    { c.sign(msg) } -> std::same_as<std::expected<Bytes, std::error_code>>;
    { cc.verify(signer, msg, sig) } -> std::same_as<bool>;
    { c.sign_share(msg, threshold) } -> std::same_as<std::expected<Bytes, std::error_code>>;
    { cc.verify_share(signer, msg, sig, threshold) } -> std::same_as<bool>;
    { cc.combine(msg, shares, threshold) } -> std::same_as<std::expected<Bytes, std::error_code>>;
    { cc.verify_aggregate(msg, sig, threshold) } -> std::same_as<bool>;
};

/// Outbound side of the transport. Must not block on the network.
template <typename T>
concept Transceiver = requires(T& t, const Artifact& artifact) {
    { t.broadcast(artifact) } -> std::same_as<void>;
};

/// Notified with each new finalized height (state manager hook).
template <typename T>
concept FinalizationListener = requires(T& l, Height height) {
    { l.on_finalized_height(height) } -> std::same_as<void>;
};

} // namespace Subnet::Consensus
