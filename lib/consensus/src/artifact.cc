#include "consensus/artifact.hpp"

#include <concepts>

#include <fmt/format.h>

namespace Subnet::Consensus {

namespace {

    // Canonical little-endian encoding. Variable-length fields are length-prefixed.
    class Encoder {
    public:
        explicit Encoder(std::string_view domain) { put_bytes(Crypto::as_span(domain)); }

        void put_u8(uint8_t v) { buf_.push_back(static_cast<Byte>(v)); }

        void put_u64(uint64_t v)
        {
            for (int i = 0; i < 8; ++i)
                buf_.push_back(static_cast<Byte>((v >> (8 * i)) & 0xff));
        }

        void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }

        void put_hash(const Hash& h) { buf_.insert(buf_.end(), h.begin(), h.end()); }

        void put_bytes(BytesSpan b)
        {
            put_u64(b.size());
            buf_.insert(buf_.end(), b.begin(), b.end());
        }

        void put(const Block& b)
        {
            put_hash(b.parent);
            put_u64(b.height);
            put_u64(b.rank);
            put_i64(b.proposer);
            put_i64(b.time.count());
            put_bytes(b.payload);
        }

        void put(const RandomBeaconContent& c)
        {
            put_u64(c.height);
            put_hash(c.parent);
        }

        void put(const RandomTapeContent& c) { put_u64(c.height); }

        void put(const NotarizationContent& c)
        {
            put_u64(c.height);
            put_hash(c.block);
        }

        void put(const FinalizationContent& c)
        {
            put_u64(c.height);
            put_hash(c.block);
        }

        void put(const CatchUpContent& c)
        {
            put(c.block);
            put(c.random_beacon);
            put_hash(c.state_hash);
        }

        template <typename Content>
        void put(const Share<Content>& s)
        {
            put(s.content);
            put_i64(s.signer);
            put_bytes(s.signature);
        }

        template <typename Content>
        void put(const Aggregate<Content>& a)
        {
            put(a.content);
            put_bytes(a.signature);
        }

        void put(const BlockProposal& p)
        {
            put(p.block);
            put_hash(p.block_hash);
            put_i64(p.signer);
            put_bytes(p.signature);
        }

        Bytes take() { return std::move(buf_); }
        Hash digest() const { return Crypto::Utils::sha256(buf_); }

    private:
        Bytes buf_;
    };

    template <typename T>
    Bytes encode_signed(std::string_view domain, const T& value)
    {
        Encoder enc(domain);
        enc.put(value);
        return enc.take();
    }

} // namespace

std::string_view kind_name(ArtifactKind kind)
{
    switch (kind) {
    case ArtifactKind::RandomBeaconShare:
        return "RandomBeaconShare";
    case ArtifactKind::RandomBeacon:
        return "RandomBeacon";
    case ArtifactKind::RandomTapeShare:
        return "RandomTapeShare";
    case ArtifactKind::RandomTape:
        return "RandomTape";
    case ArtifactKind::BlockProposal:
        return "BlockProposal";
    case ArtifactKind::NotarizationShare:
        return "NotarizationShare";
    case ArtifactKind::Notarization:
        return "Notarization";
    case ArtifactKind::FinalizationShare:
        return "FinalizationShare";
    case ArtifactKind::Finalization:
        return "Finalization";
    case ArtifactKind::CatchUpPackageShare:
        return "CatchUpPackageShare";
    case ArtifactKind::CatchUpPackage:
        return "CatchUpPackage";
    }
    return "Unknown";
}

namespace {

    Height height_of_content(const CatchUpContent& c) { return c.block.height; }

    template <typename Content>
    Height height_of_content(const Content& c) { return c.height; }

    struct HeightVisitor {
        Height operator()(const BlockProposal& p) const { return p.block.height; }

        template <typename Content>
        Height operator()(const Share<Content>& s) const { return height_of_content(s.content); }

        template <typename Content>
        Height operator()(const Aggregate<Content>& a) const { return height_of_content(a.content); }
    };

} // namespace

Height height_of(const Artifact& a)
{
    return std::visit(HeightVisitor {}, a);
}

std::optional<NodeId> producer_of(const Artifact& a)
{
    return std::visit([]<typename T>(const T& v) -> std::optional<NodeId> {
        if constexpr (requires { v.signer; })
            return v.signer;
        else
            return std::nullopt;
    },
        a);
}

ArtifactId artifact_id(const Artifact& a)
{
    Encoder enc("subnet-artifact");
    enc.put_u8(static_cast<uint8_t>(a.index()));
    std::visit([&](const auto& v) { enc.put(v); }, a);
    return enc.digest();
}

Hash block_hash(const Block& block)
{
    Encoder enc("subnet-block");
    enc.put(block);
    return enc.digest();
}

Hash beacon_hash(const RandomBeacon& beacon)
{
    return artifact_id(Artifact { beacon });
}

Bytes signed_bytes(const RandomBeaconContent& content) { return encode_signed("random-beacon", content); }
Bytes signed_bytes(const RandomTapeContent& content) { return encode_signed("random-tape", content); }
Bytes signed_bytes(const NotarizationContent& content) { return encode_signed("notarization", content); }
Bytes signed_bytes(const FinalizationContent& content) { return encode_signed("finalization", content); }
Bytes signed_bytes(const CatchUpContent& content) { return encode_signed("catch-up-package", content); }

Bytes signed_bytes(const Block& block)
{
    Encoder enc("block-proposal");
    enc.put_hash(block_hash(block));
    return enc.take();
}

CatchUpPackage genesis_catch_up_package()
{
    CatchUpContent content {
        .block = Block {},
        .random_beacon = RandomBeacon { .content = RandomBeaconContent {}, .signature = {}, .signers = {} },
        .state_hash = {},
    };
    content.state_hash = block_hash(content.block);
    return CatchUpPackage { .content = std::move(content), .signature = {}, .signers = {} };
}

std::string short_hex(const Hash& h)
{
    std::string out;
    for (size_t i = 0; i < 4; ++i)
        out += fmt::format("{:02x}", static_cast<unsigned>(h[i]));
    return out;
}

namespace {

    template <typename Content>
    concept NamesBlock = std::same_as<Content, NotarizationContent> || std::same_as<Content, FinalizationContent>;

    struct DescribeVisitor {
        std::string_view name;
        Height h;

        std::string operator()(const BlockProposal& p) const
        {
            return fmt::format("{}{{h={}, rank={}, signer={}, block={}}}", name, h, p.block.rank, p.signer, short_hex(p.block_hash));
        }

        template <typename Content>
        std::string operator()(const Share<Content>& s) const
        {
            if constexpr (NamesBlock<Content>)
                return fmt::format("{}{{h={}, signer={}, block={}}}", name, h, s.signer, short_hex(s.content.block));
            else
                return fmt::format("{}{{h={}, signer={}}}", name, h, s.signer);
        }

        template <typename Content>
        std::string operator()(const Aggregate<Content>& a) const
        {
            if constexpr (NamesBlock<Content>)
                return fmt::format("{}{{h={}, block={}, signers={}}}", name, h, short_hex(a.content.block), a.signers.size());
            else
                return fmt::format("{}{{h={}, signers={}}}", name, h, a.signers.size());
        }
    };

} // namespace

std::string describe(const Artifact& a)
{
    return std::visit(DescribeVisitor { .name = kind_name(kind_of(a)), .h = height_of(a) }, a);
}

} // namespace Subnet::Consensus
