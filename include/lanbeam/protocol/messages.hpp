#pragma once

/**
 * @file messages.hpp
 * @brief Typed control messages exchanged over the data channel
 *
 * Every status string on the wire maps to one enum value. Parsing an
 * unrecognized tag is a TransportFatal error; consumers switch over the
 * enums without a default branch, so -Wswitch flags any value left unhandled.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::protocol {

using json = nlohmann::json;

// ════════════════════════════════════════════════════════
// Handshake
// ════════════════════════════════════════════════════════

struct NonceMessage {
    Bytes nonce;
};

/**
 * @brief Proof of key possession: DER public key plus a ClientToken over the session nonce
 */
struct TokenMessage {
    Bytes public_key_der;
    std::string token;
};

/**
 * @brief Verifier -> prover answer at every step of a gate
 */
enum class GateStatus {
    Ok,
    PinRequired,
    Pair,
    TooManyAttempts,
    InvalidSignature,
    Declined
};

const char* to_wire(GateStatus status) noexcept;
Result<GateStatus> gate_status_from_wire(const std::string& value);

/**
 * @brief Gate status; the responder's first reply also carries its own identity
 */
struct GateMessage {
    GateStatus status = GateStatus::Ok;
    std::optional<TokenMessage> identity;
};

struct PinMessage {
    std::string pin;
};

enum class PairDecision {
    Accepted,
    Declined
};

const char* to_wire(PairDecision decision) noexcept;
Result<PairDecision> pair_decision_from_wire(const std::string& value);

struct PairMessage {
    PairDecision decision = PairDecision::Declined;
};

// ════════════════════════════════════════════════════════
// Transfer
// ════════════════════════════════════════════════════════

struct ManifestMessage {
    std::vector<FileDescriptor> files;
};

/**
 * @brief Receiver's selection: accepted file id -> per-file token; absent ids are skipped
 */
struct SelectionMessage {
    std::map<std::string, std::string> files;
};

struct FileHeader {
    std::string id;
    std::string token;
};

struct FileOutcome {
    std::string id;
    bool success = false;
    std::optional<std::string> error;
};

json to_json(const NonceMessage& message);
json to_json(const TokenMessage& message);
json to_json(const GateMessage& message);
json to_json(const PinMessage& message);
json to_json(const PairMessage& message);
json to_json(const ManifestMessage& message);
json to_json(const SelectionMessage& message);
json to_json(const FileHeader& message);
json to_json(const FileOutcome& message);

Result<NonceMessage> parse_nonce(const json& j);
Result<TokenMessage> parse_token_message(const json& j);
Result<GateMessage> parse_gate(const json& j);
Result<PinMessage> parse_pin(const json& j);
Result<PairMessage> parse_pair(const json& j);
Result<ManifestMessage> parse_manifest(const json& j);
Result<SelectionMessage> parse_selection(const json& j);
Result<FileHeader> parse_file_header(const json& j);
Result<FileOutcome> parse_file_outcome(const json& j);

} // namespace lanbeam::protocol
