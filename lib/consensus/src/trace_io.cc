#include "consensus/trace_io.hpp"
#include "consensus/error.hpp"

#include <algorithm>
#include <array>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace Subnet::Consensus {

namespace {

    class FormatError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    std::string to_hex(BytesSpan bytes)
    {
        static constexpr std::string_view DIGITS = "0123456789abcdef";
        std::string out;
        out.reserve(2 * bytes.size());
        for (auto b : bytes) {
            auto v = static_cast<unsigned>(b);
            out.push_back(DIGITS[v >> 4]);
            out.push_back(DIGITS[v & 0x0f]);
        }
        return out;
    }

    int hex_digit(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    const Json::Value& field(const Json::Value& v, const char* name)
    {
        if (!v.isObject() || !v.isMember(name))
            throw FormatError(fmt::format("missing field '{}'", name));
        return v[name];
    }

    const Json::Value& array_field(const Json::Value& v, const char* name)
    {
        const auto& f = field(v, name);
        if (!f.isArray())
            throw FormatError(fmt::format("field '{}' is not an array", name));
        return f;
    }

    uint64_t u64_field(const Json::Value& v, const char* name)
    {
        const auto& f = field(v, name);
        if (!f.isUInt64())
            throw FormatError(fmt::format("field '{}' is not an unsigned integer", name));
        return f.asUInt64();
    }

    int as_node_id(const Json::Value& f, const char* name)
    {
        if (!f.isInt())
            throw FormatError(fmt::format("field '{}' is not an integer", name));
        return f.asInt();
    }

    int int_field(const Json::Value& v, const char* name) { return as_node_id(field(v, name), name); }

    Time time_field(const Json::Value& v, const char* name)
    {
        const auto& f = field(v, name);
        if (!f.isInt64())
            throw FormatError(fmt::format("field '{}' is not a time", name));
        return Time(f.asInt64());
    }

    std::string string_field(const Json::Value& v, const char* name)
    {
        const auto& f = field(v, name);
        if (!f.isString())
            throw FormatError(fmt::format("field '{}' is not a string", name));
        return f.asString();
    }

    Bytes from_hex(const std::string& s, const char* name)
    {
        if (s.size() % 2 != 0)
            throw FormatError(fmt::format("field '{}' has odd hex length", name));
        Bytes out;
        out.reserve(s.size() / 2);
        for (size_t i = 0; i < s.size(); i += 2) {
            int hi = hex_digit(s[i]);
            int lo = hex_digit(s[i + 1]);
            if (hi < 0 || lo < 0)
                throw FormatError(fmt::format("field '{}' is not hex", name));
            out.push_back(static_cast<Byte>((hi << 4) | lo));
        }
        return out;
    }

    Bytes bytes_field(const Json::Value& v, const char* name) { return from_hex(string_field(v, name), name); }

    template <size_t N>
    std::array<Byte, N> fixed_field(const Json::Value& v, const char* name)
    {
        auto bytes = bytes_field(v, name);
        if (bytes.size() != N)
            throw FormatError(fmt::format("field '{}' must hold {} bytes, not {}", name, N, bytes.size()));
        std::array<Byte, N> out {};
        std::ranges::copy(bytes, out.begin());
        return out;
    }

    Hash hash_field(const Json::Value& v, const char* name) { return fixed_field<32>(v, name); }

    Json::Value height(Height h) { return Json::Value(Json::UInt64(h)); }
    Json::Value millis(Time t) { return Json::Value(Json::Int64(t.count())); }

    // Artifact fields to JSON.
    struct Encode {
        static Json::Value of(const Block& b)
        {
            Json::Value v(Json::objectValue);
            v["parent"] = to_hex(b.parent);
            v["height"] = height(b.height);
            v["rank"] = Json::UInt64(b.rank);
            v["proposer"] = b.proposer;
            v["time"] = millis(b.time);
            v["payload"] = to_hex(b.payload);
            return v;
        }

        static Json::Value of(const RandomBeaconContent& c)
        {
            Json::Value v(Json::objectValue);
            v["height"] = height(c.height);
            v["parent"] = to_hex(c.parent);
            return v;
        }

        static Json::Value of(const RandomTapeContent& c)
        {
            Json::Value v(Json::objectValue);
            v["height"] = height(c.height);
            return v;
        }

        static Json::Value of(const NotarizationContent& c) { return block_content(c.height, c.block); }
        static Json::Value of(const FinalizationContent& c) { return block_content(c.height, c.block); }

        static Json::Value of(const CatchUpContent& c)
        {
            Json::Value v(Json::objectValue);
            v["block"] = of(c.block);
            v["random_beacon"] = of(c.random_beacon);
            v["state_hash"] = to_hex(c.state_hash);
            return v;
        }

        template <typename Content>
        static Json::Value of(const Share<Content>& s)
        {
            Json::Value v(Json::objectValue);
            v["content"] = of(s.content);
            v["signer"] = s.signer;
            v["signature"] = to_hex(s.signature);
            return v;
        }

        template <typename Content>
        static Json::Value of(const Aggregate<Content>& a)
        {
            Json::Value v(Json::objectValue);
            v["content"] = of(a.content);
            v["signature"] = to_hex(a.signature);
            Json::Value signers(Json::arrayValue);
            for (auto s : a.signers)
                signers.append(s);
            v["signers"] = std::move(signers);
            return v;
        }

        static Json::Value of(const BlockProposal& p)
        {
            Json::Value v(Json::objectValue);
            v["block"] = of(p.block);
            v["block_hash"] = to_hex(p.block_hash);
            v["signer"] = p.signer;
            v["signature"] = to_hex(p.signature);
            return v;
        }

    private:
        static Json::Value block_content(Height h, const Hash& block)
        {
            Json::Value v(Json::objectValue);
            v["height"] = height(h);
            v["block"] = to_hex(block);
            return v;
        }
    };

    // JSON to artifact fields. Throws FormatError.
    struct Decode {
        static void read(const Json::Value& v, Block& b)
        {
            b.parent = hash_field(v, "parent");
            b.height = u64_field(v, "height");
            b.rank = u64_field(v, "rank");
            b.proposer = int_field(v, "proposer");
            b.time = time_field(v, "time");
            b.payload = bytes_field(v, "payload");
        }

        static void read(const Json::Value& v, RandomBeaconContent& c)
        {
            c.height = u64_field(v, "height");
            c.parent = hash_field(v, "parent");
        }

        static void read(const Json::Value& v, RandomTapeContent& c) { c.height = u64_field(v, "height"); }

        static void read(const Json::Value& v, NotarizationContent& c)
        {
            c.height = u64_field(v, "height");
            c.block = hash_field(v, "block");
        }

        static void read(const Json::Value& v, FinalizationContent& c)
        {
            c.height = u64_field(v, "height");
            c.block = hash_field(v, "block");
        }

        static void read(const Json::Value& v, CatchUpContent& c)
        {
            read(field(v, "block"), c.block);
            read(field(v, "random_beacon"), c.random_beacon);
            c.state_hash = hash_field(v, "state_hash");
        }

        template <typename Content>
        static void read(const Json::Value& v, Share<Content>& s)
        {
            read(field(v, "content"), s.content);
            s.signer = int_field(v, "signer");
            s.signature = bytes_field(v, "signature");
        }

        template <typename Content>
        static void read(const Json::Value& v, Aggregate<Content>& a)
        {
            read(field(v, "content"), a.content);
            a.signature = bytes_field(v, "signature");
            for (const auto& s : array_field(v, "signers"))
                a.signers.push_back(as_node_id(s, "signers"));
        }

        static void read(const Json::Value& v, BlockProposal& p)
        {
            read(field(v, "block"), p.block);
            p.block_hash = hash_field(v, "block_hash");
            p.signer = int_field(v, "signer");
            p.signature = bytes_field(v, "signature");
        }
    };

    template <size_t I = 0>
    Artifact artifact_of_kind(std::string_view kind, const Json::Value& v)
    {
        if constexpr (I == ARTIFACT_KIND_COUNT) {
            throw FormatError(fmt::format("unknown artifact kind '{}'", kind));
        } else {
            if (kind == kind_name(static_cast<ArtifactKind>(I))) {
                std::variant_alternative_t<I, Artifact> out;
                Decode::read(v, out);
                return out;
            }
            return artifact_of_kind<I + 1>(kind, v);
        }
    }

    Artifact parse_artifact(const Json::Value& v)
    {
        return artifact_of_kind(string_field(v, "kind"), v);
    }

    struct ActionEncoder {
        Json::Value operator()(const AddToValidated& a) const
        {
            auto v = named("AddToValidated");
            v["artifact"] = to_json(a.artifact);
            return v;
        }

        Json::Value operator()(const MoveToValidated& a) const
        {
            auto v = named("MoveToValidated");
            v["id"] = to_hex(a.id);
            return v;
        }

        Json::Value operator()(const RemoveFromUnvalidated& a) const
        {
            auto v = named("RemoveFromUnvalidated");
            v["id"] = to_hex(a.id);
            return v;
        }

        Json::Value operator()(const PurgeUnvalidatedBelow& a) const
        {
            auto v = named("PurgeUnvalidatedBelow");
            v["height"] = height(a.height);
            return v;
        }

        Json::Value operator()(const PurgeValidatedBelow& a) const
        {
            auto v = named("PurgeValidatedBelow");
            v["height"] = height(a.height);
            return v;
        }

        static Json::Value named(const char* action)
        {
            Json::Value v(Json::objectValue);
            v["action"] = action;
            return v;
        }
    };

    ChangeAction parse_action(const Json::Value& v)
    {
        auto action = string_field(v, "action");
        if (action == "AddToValidated")
            return AddToValidated { .artifact = parse_artifact(field(v, "artifact")) };
        if (action == "MoveToValidated")
            return MoveToValidated { .id = hash_field(v, "id") };
        if (action == "RemoveFromUnvalidated")
            return RemoveFromUnvalidated { .id = hash_field(v, "id") };
        if (action == "PurgeUnvalidatedBelow")
            return PurgeUnvalidatedBelow { .height = u64_field(v, "height") };
        if (action == "PurgeValidatedBelow")
            return PurgeValidatedBelow { .height = u64_field(v, "height") };
        throw FormatError(fmt::format("unknown change action '{}'", action));
    }

    struct EventEncoder {
        Json::Value operator()(const SubnetFound& e) const
        {
            auto v = named("SubnetFound");
            v["subnet"] = e.subnet;
            v["from_height"] = height(e.from_height);
            Json::Value members(Json::arrayValue);
            for (auto m : e.members)
                members.append(m);
            v["members"] = std::move(members);
            return v;
        }

        Json::Value operator()(const GenesisInstalled& e) const
        {
            auto v = named("GenesisInstalled");
            v["cup"] = Encode::of(e.cup);
            v["time"] = millis(e.time);
            return v;
        }

        Json::Value operator()(const ArtifactSeen& e) const
        {
            auto v = named("ArtifactSeen");
            v["artifact"] = to_json(e.artifact);
            v["time"] = millis(e.time);
            return v;
        }

        Json::Value operator()(const ChangeActionSeen& e) const
        {
            auto v = named("ChangeActionSeen");
            v["action"] = to_json(e.action);
            return v;
        }

        Json::Value operator()(const ApplyChanges& e) const
        {
            auto v = named("ApplyChanges");
            v["time"] = millis(e.time);
            return v;
        }

        static Json::Value named(const char* event)
        {
            Json::Value v(Json::objectValue);
            v["event"] = event;
            return v;
        }
    };

    TraceEvent parse_event(const Json::Value& v)
    {
        auto event = string_field(v, "event");
        if (event == "SubnetFound") {
            SubnetFound found { .subnet = int_field(v, "subnet"), .from_height = u64_field(v, "from_height"), .members = {} };
            for (const auto& m : array_field(v, "members"))
                found.members.insert(as_node_id(m, "members"));
            return found;
        }
        if (event == "GenesisInstalled") {
            GenesisInstalled genesis { .cup = {}, .time = time_field(v, "time") };
            Decode::read(field(v, "cup"), genesis.cup);
            return genesis;
        }
        if (event == "ArtifactSeen")
            return ArtifactSeen { .artifact = parse_artifact(field(v, "artifact")), .time = time_field(v, "time") };
        if (event == "ChangeActionSeen")
            return ChangeActionSeen { .action = parse_action(field(v, "action")) };
        if (event == "ApplyChanges")
            return ApplyChanges { .time = time_field(v, "time") };
        throw FormatError(fmt::format("unknown trace event '{}'", event));
    }

    Json::Value key_set_to_json(const Crypto::Tbls::TblsKeySet& keys)
    {
        Json::Value v(Json::objectValue);
        v["total_players"] = keys.public_params.total_players;
        v["threshold"] = keys.public_params.threshold;
        v["master_public_key"] = to_hex(keys.public_params.master_public_key.compress());

        Json::Value verification(Json::arrayValue);
        for (const auto& pk : keys.public_params.verification_vector)
            verification.append(to_hex(pk.compress()));
        v["verification_vector"] = std::move(verification);

        Json::Value shares(Json::arrayValue);
        for (const auto& share : keys.private_shares) {
            Json::Value s(Json::objectValue);
            s["player_id"] = share.player_id;
            s["secret"] = to_hex(share.secret.to_be_bytes());
            shares.append(std::move(s));
        }
        v["private_shares"] = std::move(shares);
        return v;
    }

    Crypto::Tbls::P2 parse_p2(const std::string& hex, const char* name)
    {
        auto point = Crypto::Tbls::P2::from_compressed(from_hex(hex, name));
        if (!point)
            throw FormatError(fmt::format("field '{}' is not a G2 point: {}", name, point.error().message()));
        return *point;
    }

    Crypto::Tbls::TblsKeySet parse_key_set(const Json::Value& v, size_t members)
    {
        Crypto::Tbls::TblsKeySet keys {
            .public_params = {
                .total_players = int_field(v, "total_players"),
                .threshold = int_field(v, "threshold"),
                .master_public_key = parse_p2(string_field(v, "master_public_key"), "master_public_key"),
                .verification_vector = {},
            },
            .private_shares = {},
        };
        for (const auto& pk : array_field(v, "verification_vector")) {
            if (!pk.isString())
                throw FormatError("field 'verification_vector' holds a non-string");
            keys.public_params.verification_vector.push_back(parse_p2(pk.asString(), "verification_vector"));
        }
        for (const auto& share : array_field(v, "private_shares")) {
            keys.private_shares.push_back({
                .player_id = int_field(share, "player_id"),
                .secret = Crypto::bls::Scalar::from_be_bytes(fixed_field<Crypto::bls::Scalar::BYTE_LENGTH>(share, "secret")),
            });
        }

        if (static_cast<size_t>(keys.public_params.total_players) != members
            || keys.public_params.verification_vector.size() != members
            || keys.private_shares.size() != members)
            throw FormatError(fmt::format("key set does not cover the {} members", members));
        return keys;
    }

    KeyMaterial parse_key_material(const Json::Value& v)
    {
        KeyMaterial keys;
        for (const auto& m : array_field(v, "members"))
            keys.members.push_back(as_node_id(m, "members"));
        if (keys.members.empty())
            throw FormatError("key material has no members");

        keys.low = parse_key_set(field(v, "low"), keys.members.size());
        keys.high = parse_key_set(field(v, "high"), keys.members.size());
        for (const auto& pair : array_field(v, "ecdsa")) {
            keys.private_keys.push_back(fixed_field<32>(pair, "private"));
            keys.public_keys.push_back(fixed_field<33>(pair, "public"));
        }
        if (keys.private_keys.size() != keys.members.size())
            throw FormatError("one ECDSA key pair per member expected");
        return keys;
    }

    // Runs `parse`, turning format errors into MalformedTrace. `what` receives the reason.
    template <typename F>
    auto guarded(F&& parse, std::string* what = nullptr) -> std::expected<decltype(parse()), std::error_code>
    {
        try {
            return parse();
        } catch (const FormatError& ex) {
            if (what)
                *what = ex.what();
        } catch (const Json::Exception& ex) {
            if (what)
                *what = ex.what();
        }
        return std::unexpected(make_error_code(Error::MalformedTrace));
    }

} // namespace

Json::Value to_json(const Artifact& artifact)
{
    auto v = std::visit([](const auto& a) { return Encode::of(a); }, artifact);
    v["kind"] = std::string(kind_name(kind_of(artifact)));
    return v;
}

Json::Value to_json(const ChangeAction& action) { return std::visit(ActionEncoder {}, action); }

Json::Value to_json(const TraceEvent& event) { return std::visit(EventEncoder {}, event); }

Json::Value to_json(const KeyMaterial& keys)
{
    Json::Value v(Json::objectValue);
    Json::Value members(Json::arrayValue);
    for (auto m : keys.members)
        members.append(m);
    v["members"] = std::move(members);
    v["low"] = key_set_to_json(keys.low);
    v["high"] = key_set_to_json(keys.high);

    Json::Value ecdsa(Json::arrayValue);
    for (size_t i = 0; i < keys.private_keys.size(); ++i) {
        Json::Value pair(Json::objectValue);
        pair["private"] = to_hex(keys.private_keys[i]);
        pair["public"] = to_hex(keys.public_keys[i]);
        ecdsa.append(std::move(pair));
    }
    v["ecdsa"] = std::move(ecdsa);
    return v;
}

std::expected<Artifact, std::error_code> artifact_from_json(const Json::Value& value)
{
    return guarded([&] { return parse_artifact(value); });
}

std::expected<TraceEvent, std::error_code> trace_event_from_json(const Json::Value& value)
{
    return guarded([&] { return parse_event(value); });
}

std::expected<KeyMaterial, std::error_code> key_material_from_json(const Json::Value& value)
{
    return guarded([&] { return parse_key_material(value); });
}

void write_trace(std::ostream& out, std::span<const TraceEvent> events)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    for (const auto& event : events) {
        writer->write(to_json(event), &out);
        out << '\n';
    }
}

std::expected<std::vector<TraceEvent>, std::error_code> read_trace(std::istream& in, const Logger& logger)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::vector<TraceEvent> events;
    std::string line;
    for (size_t number = 1; std::getline(in, line); ++number) {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        Json::Value value;
        std::string errors;
        if (!reader->parse(line.data(), line.data() + line.size(), &value, &errors)) {
            logger->error("Trace line {} is not JSON: {}", number, errors);
            return std::unexpected(make_error_code(Error::MalformedTrace));
        }

        std::string reason;
        auto event = guarded([&] { return parse_event(value); }, &reason);
        if (!event) {
            logger->error("Trace line {}: {}", number, reason);
            return std::unexpected(event.error());
        }
        events.push_back(std::move(*event));
    }
    logger->debug("Read {} trace events", events.size());
    return events;
}

void write_key_material(std::ostream& out, const KeyMaterial& keys)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(to_json(keys), &out);
    out << '\n';
}

std::expected<KeyMaterial, std::error_code> read_key_material(std::istream& in, const Logger& logger)
{
    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &value, &errors)) {
        logger->error("Key file is not JSON: {}", errors);
        return std::unexpected(make_error_code(Error::MalformedTrace));
    }

    std::string reason;
    auto keys = guarded([&] { return parse_key_material(value); }, &reason);
    if (!keys)
        logger->error("Key file: {}", reason);
    return keys;
}

} // namespace Subnet::Consensus
