#include "lanbeam/protocol/messages.hpp"
#include "lanbeam/codec/base64.hpp"

namespace lanbeam::protocol {
namespace {

Result<std::string> require_string(const json& j, const char* key) {
    if (!j.is_object()) {
        return Err<std::string>(ErrorKind::TransportFatal, "control message is not an object");
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return Err<std::string>(ErrorKind::TransportFatal, std::string("control message lacks string field '") + key + "'");
    }
    return Ok(it->get<std::string>());
}

Result<Bytes> require_base64(const json& j, const char* key) {
    auto text = require_string(j, key);
    if (text.is_error()) {
        return Err<Bytes>(text.error());
    }
    auto bytes = codec::base64url_decode(text.value());
    if (bytes.is_error()) {
        return Err<Bytes>(ErrorKind::TransportFatal, std::string("field '") + key + "' is not base64url");
    }
    return bytes;
}

} // namespace

const char* to_wire(GateStatus status) noexcept {
    switch (status) {
        case GateStatus::Ok: return "OK";
        case GateStatus::PinRequired: return "PIN_REQUIRED";
        case GateStatus::Pair: return "PAIR";
        case GateStatus::TooManyAttempts: return "TOO_MANY_ATTEMPTS";
        case GateStatus::InvalidSignature: return "INVALID_SIGNATURE";
        case GateStatus::Declined: return "DECLINED";
    }
    return "DECLINED";
}

Result<GateStatus> gate_status_from_wire(const std::string& value) {
    if (value == "OK") return Ok(GateStatus::Ok);
    if (value == "PIN_REQUIRED") return Ok(GateStatus::PinRequired);
    if (value == "PAIR") return Ok(GateStatus::Pair);
    if (value == "TOO_MANY_ATTEMPTS") return Ok(GateStatus::TooManyAttempts);
    if (value == "INVALID_SIGNATURE") return Ok(GateStatus::InvalidSignature);
    if (value == "DECLINED") return Ok(GateStatus::Declined);
    return Err<GateStatus>(ErrorKind::TransportFatal, "unrecognized gate status '" + value + "'");
}

const char* to_wire(PairDecision decision) noexcept {
    switch (decision) {
        case PairDecision::Accepted: return "PAIR_ACCEPTED";
        case PairDecision::Declined: return "PAIR_DECLINED";
    }
    return "PAIR_DECLINED";
}

Result<PairDecision> pair_decision_from_wire(const std::string& value) {
    if (value == "PAIR_ACCEPTED") return Ok(PairDecision::Accepted);
    if (value == "PAIR_DECLINED") return Ok(PairDecision::Declined);
    return Err<PairDecision>(ErrorKind::TransportFatal, "unrecognized pairing decision '" + value + "'");
}

// ──────────────────────────────────────────────────────────
// Encoding
// ──────────────────────────────────────────────────────────

json to_json(const NonceMessage& message) {
    return json{{"nonce", codec::base64url_encode(message.nonce)}};
}

json to_json(const TokenMessage& message) {
    return json{
        {"publicKey", codec::base64url_encode(message.public_key_der)},
        {"token", message.token},
    };
}

json to_json(const GateMessage& message) {
    json j{{"status", to_wire(message.status)}};
    if (message.identity) {
        j["publicKey"] = codec::base64url_encode(message.identity->public_key_der);
        j["token"] = message.identity->token;
    }
    return j;
}

json to_json(const PinMessage& message) {
    return json{{"pin", message.pin}};
}

json to_json(const PairMessage& message) {
    return json{{"status", to_wire(message.decision)}};
}

json to_json(const ManifestMessage& message) {
    json files = json::array();
    for (const auto& file : message.files) {
        files.push_back(json(file));
    }
    return json{{"files", std::move(files)}};
}

json to_json(const SelectionMessage& message) {
    json files = json::object();
    for (const auto& [id, token] : message.files) {
        files[id] = token;
    }
    return json{{"files", std::move(files)}};
}

json to_json(const FileHeader& message) {
    return json{{"id", message.id}, {"token", message.token}};
}

json to_json(const FileOutcome& message) {
    json j{{"id", message.id}, {"success", message.success}};
    if (message.error) {
        j["error"] = *message.error;
    }
    return j;
}

// ──────────────────────────────────────────────────────────
// Parsing
// ──────────────────────────────────────────────────────────

Result<NonceMessage> parse_nonce(const json& j) {
    auto nonce = require_base64(j, "nonce");
    if (nonce.is_error()) {
        return Err<NonceMessage>(nonce.error());
    }
    return Ok(NonceMessage{std::move(nonce.value())});
}

Result<TokenMessage> parse_token_message(const json& j) {
    auto key = require_base64(j, "publicKey");
    if (key.is_error()) {
        return Err<TokenMessage>(key.error());
    }
    auto token = require_string(j, "token");
    if (token.is_error()) {
        return Err<TokenMessage>(token.error());
    }
    return Ok(TokenMessage{std::move(key.value()), std::move(token.value())});
}

Result<GateMessage> parse_gate(const json& j) {
    auto status_text = require_string(j, "status");
    if (status_text.is_error()) {
        return Err<GateMessage>(status_text.error());
    }
    auto status = gate_status_from_wire(status_text.value());
    if (status.is_error()) {
        return Err<GateMessage>(status.error());
    }

    GateMessage message;
    message.status = status.value();
    if (j.contains("token")) {
        auto identity = parse_token_message(j);
        if (identity.is_error()) {
            return Err<GateMessage>(identity.error());
        }
        message.identity = std::move(identity.value());
    }
    return Ok(std::move(message));
}

Result<PinMessage> parse_pin(const json& j) {
    auto pin = require_string(j, "pin");
    if (pin.is_error()) {
        return Err<PinMessage>(pin.error());
    }
    return Ok(PinMessage{std::move(pin.value())});
}

Result<PairMessage> parse_pair(const json& j) {
    auto text = require_string(j, "status");
    if (text.is_error()) {
        return Err<PairMessage>(text.error());
    }
    auto decision = pair_decision_from_wire(text.value());
    if (decision.is_error()) {
        return Err<PairMessage>(decision.error());
    }
    return Ok(PairMessage{decision.value()});
}

Result<ManifestMessage> parse_manifest(const json& j) {
    if (!j.is_object() || !j.contains("files") || !j.at("files").is_array()) {
        return Err<ManifestMessage>(ErrorKind::TransportFatal, "manifest lacks a 'files' array");
    }

    ManifestMessage manifest;
    try {
        for (const auto& entry : j.at("files")) {
            // get<uint64_t>() would wrap negative and truncate fractional sizes
            if (!entry.is_object() || !entry.contains("size") || !entry.at("size").is_number_unsigned()) {
                return Err<ManifestMessage>(ErrorKind::TransportFatal,
                                            "manifest entry size must be a non-negative integer");
            }
            manifest.files.push_back(entry.get<FileDescriptor>());
        }
    } catch (const json::exception& e) {
        return Err<ManifestMessage>(ErrorKind::TransportFatal, std::string("malformed manifest entry: ") + e.what());
    }

    std::map<std::string, bool> seen;
    for (const auto& file : manifest.files) {
        if (!seen.emplace(file.id, true).second) {
            return Err<ManifestMessage>(ErrorKind::TransportFatal, "manifest repeats file id " + file.id);
        }
    }
    return Ok(std::move(manifest));
}

Result<SelectionMessage> parse_selection(const json& j) {
    if (!j.is_object() || !j.contains("files") || !j.at("files").is_object()) {
        return Err<SelectionMessage>(ErrorKind::TransportFatal, "selection lacks a 'files' object");
    }

    SelectionMessage selection;
    for (const auto& [id, token] : j.at("files").items()) {
        if (!token.is_string()) {
            return Err<SelectionMessage>(ErrorKind::TransportFatal, "selection token for " + id + " is not a string");
        }
        selection.files.emplace(id, token.get<std::string>());
    }
    return Ok(std::move(selection));
}

Result<FileHeader> parse_file_header(const json& j) {
    auto id = require_string(j, "id");
    if (id.is_error()) {
        return Err<FileHeader>(id.error());
    }
    auto token = require_string(j, "token");
    if (token.is_error()) {
        return Err<FileHeader>(token.error());
    }
    return Ok(FileHeader{std::move(id.value()), std::move(token.value())});
}

Result<FileOutcome> parse_file_outcome(const json& j) {
    auto id = require_string(j, "id");
    if (id.is_error()) {
        return Err<FileOutcome>(id.error());
    }
    auto it = j.find("success");
    if (it == j.end() || !it->is_boolean()) {
        return Err<FileOutcome>(ErrorKind::TransportFatal, "file outcome lacks boolean 'success'");
    }

    FileOutcome outcome;
    outcome.id = std::move(id.value());
    outcome.success = it->get<bool>();
    if (auto err = j.find("error"); err != j.end() && err->is_string()) {
        outcome.error = err->get<std::string>();
    }
    return Ok(std::move(outcome));
}

} // namespace lanbeam::protocol
