#include "lanbeam/session/handshake.hpp"
#include "lanbeam/crypto/token.hpp"
#include "lanbeam/protocol/framing.hpp"
#include "lanbeam/transport/flow_control.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanbeam::session {
namespace {

using protocol::GateStatus;

constexpr std::chrono::milliseconds kFlushPoll{10};

template<typename T>
Result<T> read_typed(transport::DataChannel& channel, Result<T> (*parse)(const protocol::json&)) {
    auto message = protocol::read_message(channel.inbound());
    if (message.is_error()) {
        return Err<T>(message.error());
    }
    return parse(message.value());
}

Result<void> send_gate(transport::DataChannel& channel, GateStatus status,
                       std::optional<protocol::TokenMessage> identity = std::nullopt) {
    protocol::GateMessage gate;
    gate.status = status;
    gate.identity = std::move(identity);
    return protocol::send_message(channel, protocol::to_json(gate));
}

Result<protocol::TokenMessage> make_token_message(const crypto::KeyPair& identity, const Bytes& material) {
    auto token = crypto::create_token(identity, material);
    if (token.is_error()) {
        return Err<protocol::TokenMessage>(token.error());
    }
    return Ok(protocol::TokenMessage{identity.public_key_der(), std::move(token.value())});
}

Result<crypto::PublicKey> verify_identity(const protocol::TokenMessage& message, const Bytes& material) {
    auto key = crypto::PublicKey::from_der(message.public_key_der);
    if (key.is_error()) {
        return Err<crypto::PublicKey>(ErrorKind::TransportFatal, "unusable public key: " + key.error().message);
    }
    auto verified = crypto::verify_nonce_token(message.token, key.value(), material);
    if (verified.is_error()) {
        return Err<crypto::PublicKey>(ErrorKind::TransportFatal, "invalid signature: " + verified.error().message);
    }
    return key;
}

Result<Bytes> read_remote_nonce(transport::DataChannel& channel) {
    auto nonce = read_typed<protocol::NonceMessage>(channel, protocol::parse_nonce);
    if (nonce.is_error()) {
        return Err<Bytes>(nonce.error());
    }
    if (!crypto::validate_nonce(nonce.value().nonce)) {
        return Err<Bytes>(ErrorKind::TransportFatal,
                          "remote nonce length " + std::to_string(nonce.value().nonce.size()) + " out of range");
    }
    return Ok(std::move(nonce.value().nonce));
}

std::string fingerprint(const crypto::PublicKey& key) {
    const auto digest = crypto::sha256(key.der());
    return crypto::to_hex(digest.data(), digest.size());
}

/**
 * Verifier side of one gate, after the initial status has been sent.
 */
Result<void> run_verifier(transport::DataChannel& channel,
                          const HandshakeOptions& options,
                          const crypto::PublicKey& remote,
                          GateStatus initial,
                          TransferSession& session) {
    switch (initial) {
        case GateStatus::Ok:
            return Ok();
        case GateStatus::Pair: {
            auto pair = read_typed<protocol::PairMessage>(channel, protocol::parse_pair);
            if (pair.is_error()) {
                return Err<void>(pair.error());
            }
            switch (pair.value().decision) {
                case protocol::PairDecision::Accepted:
                    if (options.paired_keys) {
                        options.paired_keys->remember(remote.der());
                    }
                    spdlog::info("[Handshake] session={} paired with {}", session.session_id(), fingerprint(remote));
                    return send_gate(channel, GateStatus::Ok);
                case protocol::PairDecision::Declined:
                    break;
            }
            // Exactly one fallback after a declined pairing
            const GateStatus fallback = options.pin ? GateStatus::PinRequired : GateStatus::Declined;
            if (auto sent = send_gate(channel, fallback); sent.is_error()) {
                return sent;
            }
            if (fallback == GateStatus::Declined) {
                return Err<void>(ErrorKind::UserDeclined, "remote peer declined pairing");
            }
            break;
        }
        case GateStatus::PinRequired:
            break;
        case GateStatus::TooManyAttempts:
        case GateStatus::InvalidSignature:
        case GateStatus::Declined:
            return Err<void>(ErrorKind::InvalidArgument,
                             std::string("gate cannot open with status ") + protocol::to_wire(initial));
    }

    if (!options.pin) {
        return Err<void>(ErrorKind::InvalidArgument, "PIN gate requested without a PIN");
    }
    if (auto entered = session.transition_to(SessionState::PinPending); entered.is_error()) {
        return entered;
    }

    const std::uint32_t max_attempts = std::max<std::uint32_t>(1, options.max_pin_attempts);
    for (std::uint32_t failures = 0;;) {
        auto submitted = read_typed<protocol::PinMessage>(channel, protocol::parse_pin);
        if (submitted.is_error()) {
            return Err<void>(submitted.error());
        }
        if (pin_matches(*options.pin, submitted.value().pin)) {
            if (auto sent = send_gate(channel, GateStatus::Ok); sent.is_error()) {
                return sent;
            }
            return session.transition_to(SessionState::Authenticating);
        }

        ++failures;
        spdlog::warn("[Handshake] session={} wrong PIN attempt={}/{}", session.session_id(), failures, max_attempts);
        if (failures >= max_attempts) {
            if (auto sent = send_gate(channel, GateStatus::TooManyAttempts); sent.is_error()) {
                return sent;
            }
            if (auto flushed = transport::drain(channel, kFlushPoll); flushed.is_error()) {
                return flushed;
            }
            return Err<void>(ErrorKind::TransportFatal, "PIN attempts exhausted");
        }
        if (auto sent = send_gate(channel, GateStatus::PinRequired); sent.is_error()) {
            return sent;
        }
    }
}

/**
 * Prover side of one gate, starting from the first status the verifier sent.
 */
Result<void> run_prover(transport::DataChannel& channel,
                        const HandshakeOptions& options,
                        const crypto::PublicKey& remote,
                        GateStatus status,
                        TransferSession& session) {
    std::uint32_t attempt = 0;
    bool pairing_done = false;

    while (true) {
        switch (status) {
            case GateStatus::Ok:
                if (session.state() == SessionState::PinPending) {
                    return session.transition_to(SessionState::Authenticating);
                }
                return Ok();

            case GateStatus::PinRequired: {
                if (auto entered = session.transition_to(SessionState::PinPending); entered.is_error()) {
                    return entered;
                }
                ++attempt;
                std::optional<std::string> pin;
                if (options.pin_prompt) {
                    pin = options.pin_prompt(PinPrompt{attempt, attempt > 1});
                }
                if (!pin) {
                    return Err<void>(ErrorKind::UserDeclined, "PIN entry cancelled");
                }
                if (auto sent = protocol::send_message(channel, protocol::to_json(protocol::PinMessage{*pin}));
                    sent.is_error()) {
                    return sent;
                }
                break;
            }

            case GateStatus::Pair: {
                if (pairing_done) {
                    return Err<void>(ErrorKind::TransportFatal, "remote requested a second pairing round");
                }
                pairing_done = true;
                const bool accept = options.pairing_decision
                    && options.pairing_decision(PairingRequest{fingerprint(remote)});
                protocol::PairMessage reply;
                reply.decision = accept ? protocol::PairDecision::Accepted : protocol::PairDecision::Declined;
                if (auto sent = protocol::send_message(channel, protocol::to_json(reply)); sent.is_error()) {
                    return sent;
                }
                break;
            }

            case GateStatus::TooManyAttempts:
                return Err<void>(ErrorKind::TransportFatal, "remote rejected the PIN too many times");
            case GateStatus::InvalidSignature:
                return Err<void>(ErrorKind::TransportFatal, "remote rejected our token");
            case GateStatus::Declined:
                return Err<void>(ErrorKind::UserDeclined, "remote declined the session");
        }

        auto gate = read_typed<protocol::GateMessage>(channel, protocol::parse_gate);
        if (gate.is_error()) {
            return Err<void>(gate.error());
        }
        status = gate.value().status;
    }
}

} // namespace

bool PairedKeys::contains(const Bytes& public_key_der) const {
    std::lock_guard lock(mutex_);
    return keys_.count(public_key_der) > 0;
}

void PairedKeys::remember(const Bytes& public_key_der) {
    std::lock_guard lock(mutex_);
    keys_.insert(public_key_der);
}

std::size_t PairedKeys::size() const {
    std::lock_guard lock(mutex_);
    return keys_.size();
}

bool pin_matches(const std::string& expected, const std::string& submitted) noexcept {
    return crypto::constant_time_equals(expected, submitted);
}

GateStatus initial_gate_status(const HandshakeOptions& options, const crypto::PublicKey& remote) {
    if (options.require_pairing && !(options.paired_keys && options.paired_keys->contains(remote.der()))) {
        return GateStatus::Pair;
    }
    if (options.pin) {
        return GateStatus::PinRequired;
    }
    return GateStatus::Ok;
}

Result<HandshakeResult> run_initiator(transport::DataChannel& channel,
                                      const crypto::KeyPair& identity,
                                      const HandshakeOptions& options,
                                      TransferSession& session) {
    if (auto entered = session.transition_to(SessionState::Authenticating); entered.is_error()) {
        return Err<HandshakeResult>(entered.error());
    }

    auto local_nonce = crypto::generate_nonce();
    if (local_nonce.is_error()) {
        return Err<HandshakeResult>(local_nonce.error());
    }
    if (auto sent = protocol::send_message(channel, protocol::to_json(protocol::NonceMessage{local_nonce.value()}));
        sent.is_error()) {
        return Err<HandshakeResult>(sent.error());
    }
    auto remote_nonce = read_remote_nonce(channel);
    if (remote_nonce.is_error()) {
        return Err<HandshakeResult>(remote_nonce.error());
    }
    Bytes material = crypto::combine_nonces(local_nonce.value(), remote_nonce.value());

    auto own_token = make_token_message(identity, material);
    if (own_token.is_error()) {
        return Err<HandshakeResult>(own_token.error());
    }
    if (auto sent = protocol::send_message(channel, protocol::to_json(own_token.value())); sent.is_error()) {
        return Err<HandshakeResult>(sent.error());
    }

    auto gate = read_typed<protocol::GateMessage>(channel, protocol::parse_gate);
    if (gate.is_error()) {
        return Err<HandshakeResult>(gate.error());
    }
    if (gate.value().status == GateStatus::InvalidSignature) {
        return Err<HandshakeResult>(ErrorKind::TransportFatal, "responder rejected our token");
    }
    if (!gate.value().identity) {
        return Err<HandshakeResult>(ErrorKind::TransportFatal, "responder did not present its identity");
    }
    auto remote = verify_identity(*gate.value().identity, material);
    if (remote.is_error()) {
        return Err<HandshakeResult>(remote.error());
    }
    spdlog::info("[Handshake] session={} responder verified fingerprint={} gate={}",
                 session.session_id(), fingerprint(remote.value()), protocol::to_wire(gate.value().status));

    if (auto proved = run_prover(channel, options, remote.value(), gate.value().status, session); proved.is_error()) {
        return Err<HandshakeResult>(proved.error());
    }

    const GateStatus own_gate = initial_gate_status(options, remote.value());
    if (auto sent = send_gate(channel, own_gate); sent.is_error()) {
        return Err<HandshakeResult>(sent.error());
    }
    if (auto verified = run_verifier(channel, options, remote.value(), own_gate, session); verified.is_error()) {
        return Err<HandshakeResult>(verified.error());
    }

    spdlog::info("[Handshake] session={} authenticated as initiator", session.session_id());
    return Ok(HandshakeResult{std::move(remote.value()), std::move(material)});
}

Result<HandshakeResult> run_responder(transport::DataChannel& channel,
                                      const crypto::KeyPair& identity,
                                      const HandshakeOptions& options,
                                      TransferSession& session) {
    if (auto entered = session.transition_to(SessionState::Authenticating); entered.is_error()) {
        return Err<HandshakeResult>(entered.error());
    }

    auto remote_nonce = read_remote_nonce(channel);
    if (remote_nonce.is_error()) {
        return Err<HandshakeResult>(remote_nonce.error());
    }
    auto local_nonce = crypto::generate_nonce();
    if (local_nonce.is_error()) {
        return Err<HandshakeResult>(local_nonce.error());
    }
    if (auto sent = protocol::send_message(channel, protocol::to_json(protocol::NonceMessage{local_nonce.value()}));
        sent.is_error()) {
        return Err<HandshakeResult>(sent.error());
    }
    Bytes material = crypto::combine_nonces(remote_nonce.value(), local_nonce.value());

    auto remote_token = read_typed<protocol::TokenMessage>(channel, protocol::parse_token_message);
    if (remote_token.is_error()) {
        return Err<HandshakeResult>(remote_token.error());
    }
    auto remote = verify_identity(remote_token.value(), material);
    if (remote.is_error()) {
        spdlog::warn("[Handshake] session={} rejecting initiator: {}", session.session_id(), remote.error().message);
        if (auto sent = send_gate(channel, GateStatus::InvalidSignature); sent.is_error()) {
            return Err<HandshakeResult>(sent.error());
        }
        if (auto flushed = transport::drain(channel, kFlushPoll); flushed.is_error()) {
            return Err<HandshakeResult>(flushed.error());
        }
        return Err<HandshakeResult>(remote.error());
    }

    auto own_token = make_token_message(identity, material);
    if (own_token.is_error()) {
        return Err<HandshakeResult>(own_token.error());
    }
    const GateStatus own_gate = initial_gate_status(options, remote.value());
    if (auto sent = send_gate(channel, own_gate, std::move(own_token.value())); sent.is_error()) {
        return Err<HandshakeResult>(sent.error());
    }
    if (auto verified = run_verifier(channel, options, remote.value(), own_gate, session); verified.is_error()) {
        return Err<HandshakeResult>(verified.error());
    }

    auto gate = read_typed<protocol::GateMessage>(channel, protocol::parse_gate);
    if (gate.is_error()) {
        return Err<HandshakeResult>(gate.error());
    }
    if (auto proved = run_prover(channel, options, remote.value(), gate.value().status, session); proved.is_error()) {
        return Err<HandshakeResult>(proved.error());
    }

    spdlog::info("[Handshake] session={} authenticated as responder fingerprint={}",
                 session.session_id(), fingerprint(remote.value()));
    return Ok(HandshakeResult{std::move(remote.value()), std::move(material)});
}

} // namespace lanbeam::session
