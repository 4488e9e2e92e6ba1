#pragma once

#include "consensus/artifact.hpp"
#include "consensus/bls_crypto_service.hpp"
#include "consensus/change_action.hpp"
#include "consensus/logger.hpp"
#include "consensus/trace.hpp"
#include <expected>
#include <iosfwd>
#include <span>
#include <system_error>
#include <vector>

#include <json/json.h>

namespace Subnet::Consensus {

// JSON forms. Hashes, ids, signatures, payloads and keys are lowercase hex;
// times are milliseconds. Artifacts carry their kind name under "kind".
Json::Value to_json(const Artifact& artifact);
Json::Value to_json(const ChangeAction& action);
Json::Value to_json(const TraceEvent& event);
Json::Value to_json(const KeyMaterial& keys);

std::expected<Artifact, std::error_code> artifact_from_json(const Json::Value& value);
std::expected<TraceEvent, std::error_code> trace_event_from_json(const Json::Value& value);
std::expected<KeyMaterial, std::error_code> key_material_from_json(const Json::Value& value);

/// One compact JSON object per line, in recording order.
void write_trace(std::ostream& out, std::span<const TraceEvent> events);

/**
 * Reads a trace written by write_trace. Blank lines are skipped.
 * MalformedTrace on the first line that does not hold a trace event;
 * the line number and the reason are logged.
 **/
std::expected<std::vector<TraceEvent>, std::error_code> read_trace(std::istream& in, const Logger& logger);

/// Every member's BLS shares and ECDSA key pair, secrets included.
void write_key_material(std::ostream& out, const KeyMaterial& keys);
std::expected<KeyMaterial, std::error_code> read_key_material(std::istream& in, const Logger& logger);

} // namespace Subnet::Consensus
