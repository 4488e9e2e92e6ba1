#pragma once

#include "consensus/common.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace Subnet::Consensus {

struct Block {
    Hash parent {};
    Height height = 0;
    Rank rank = 0;
    NodeId proposer = 0;
    Time time {};
    Bytes payload;

    bool operator==(const Block&) const = default;
};

struct RandomBeaconContent {
    Height height = 0;
    Hash parent {}; ///< Hash of the beacon at height - 1

    bool operator==(const RandomBeaconContent&) const = default;
};

struct RandomTapeContent {
    Height height = 0;

    bool operator==(const RandomTapeContent&) const = default;
};

struct NotarizationContent {
    Height height = 0;
    Hash block {};

    bool operator==(const NotarizationContent&) const = default;
};

struct FinalizationContent {
    Height height = 0;
    Hash block {};

    bool operator==(const FinalizationContent&) const = default;
};

/// One replica's threshold signature share over `content`.
template <typename Content>
struct Share {
    Content content;
    NodeId signer = 0;
    Bytes signature;

    bool operator==(const Share&) const = default;
};

/// Threshold signature combined from a quorum of shares.
/// Which quorum signed is informational and not part of equality.
template <typename Content>
struct Aggregate {
    Content content;
    Bytes signature;
    std::vector<NodeId> signers;

    bool operator==(const Aggregate& other) const
    {
        return content == other.content && signature == other.signature;
    }
};

using RandomBeaconShare = Share<RandomBeaconContent>;
using RandomBeacon = Aggregate<RandomBeaconContent>;
using RandomTapeShare = Share<RandomTapeContent>;
using RandomTape = Aggregate<RandomTapeContent>;
using NotarizationShare = Share<NotarizationContent>;
using Notarization = Aggregate<NotarizationContent>;
using FinalizationShare = Share<FinalizationContent>;
using Finalization = Aggregate<FinalizationContent>;

struct CatchUpContent {
    Block block;
    RandomBeacon random_beacon;
    Hash state_hash {}; ///< Merkle root of the finalized block hashes since the previous package

    bool operator==(const CatchUpContent&) const = default;
};

using CatchUpPackageShare = Share<CatchUpContent>;
using CatchUpPackage = Aggregate<CatchUpContent>;

struct BlockProposal {
    Block block;
    Hash block_hash {};
    NodeId signer = 0;
    Bytes signature;

    bool operator==(const BlockProposal&) const = default;
};

// Alternative order defines ArtifactKind.
using Artifact = std::variant<
    RandomBeaconShare,
    RandomBeacon,
    RandomTapeShare,
    RandomTape,
    BlockProposal,
    NotarizationShare,
    Notarization,
    FinalizationShare,
    Finalization,
    CatchUpPackageShare,
    CatchUpPackage>;

enum class ArtifactKind : uint8_t {
    RandomBeaconShare,
    RandomBeacon,
    RandomTapeShare,
    RandomTape,
    BlockProposal,
    NotarizationShare,
    Notarization,
    FinalizationShare,
    Finalization,
    CatchUpPackageShare,
    CatchUpPackage,
};

inline constexpr size_t ARTIFACT_KIND_COUNT = std::variant_size_v<Artifact>;

namespace detail {
    template <typename T, typename... Ts>
    constexpr size_t index_in(const std::variant<Ts...>*)
    {
        size_t i = 0;
        ((std::is_same_v<T, Ts> ? false : (++i, true)) && ...);
        return i;
    }
} // namespace detail

template <typename T>
inline constexpr ArtifactKind kind_of_v = static_cast<ArtifactKind>(detail::index_in<T>(static_cast<const Artifact*>(nullptr)));

using ArtifactId = Hash;

inline ArtifactKind kind_of(const Artifact& a) { return static_cast<ArtifactKind>(a.index()); }

std::string_view kind_name(ArtifactKind kind);

Height height_of(const Artifact& a);

/// Share and proposal signer; nullopt for aggregates.
std::optional<NodeId> producer_of(const Artifact& a);

/// Identity used for deduplication. Aggregate signers are not part of it.
ArtifactId artifact_id(const Artifact& a);

Hash block_hash(const Block& block);
Hash beacon_hash(const RandomBeacon& beacon);

/// Bytes a signer signs: domain tag followed by the encoded content.
Bytes signed_bytes(const RandomBeaconContent& content);
Bytes signed_bytes(const RandomTapeContent& content);
Bytes signed_bytes(const NotarizationContent& content);
Bytes signed_bytes(const FinalizationContent& content);
Bytes signed_bytes(const CatchUpContent& content);
Bytes signed_bytes(const Block& block);

/// Height-0 package the registry hands every replica: empty block, unsigned beacon.
CatchUpPackage genesis_catch_up_package();

/// "NotarizationShare{h=5, signer=2, block=1a2b3c4d}" style, for logs.
std::string describe(const Artifact& a);

std::string short_hex(const Hash& h);

} // namespace Subnet::Consensus
