#pragma once

/**
 * @file handshake.hpp
 * @brief Mutual authentication over a freshly opened data channel
 *
 * WHY THIS FILE EXISTS:
 * There is no central identity authority. Each side proves possession of an
 * ephemeral Ed25519 key by signing the nonce material of this one session,
 * and either side may additionally demand a PIN or an explicit pairing
 * confirmation before it lets the transfer start.
 *
 * MESSAGE FLOW (I = initiator/sender, R = responder/receiver):
 *
 *   I -> R  {nonce}
 *   R -> I  {nonce}                              material = nonce_I || nonce_R
 *   I -> R  {publicKey, token}
 *   R -> I  {status, publicKey, token}           R's gate towards I opens
 *   ...     PIN / PAIR rounds until R sends OK
 *   I -> R  {status}                             I's gate towards R opens
 *   ...     PIN / PAIR rounds until I sends OK
 *
 * Any verification failure or unexpected message ends the handshake with a
 * TransportFatal error; the caller closes the channel.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/crypto/identity.hpp"
#include "lanbeam/protocol/messages.hpp"
#include "lanbeam/session/session.hpp"
#include "lanbeam/transport/data_channel.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace lanbeam::session {

struct PinPrompt {
    std::uint32_t attempt = 1;  ///< 1-based
    bool previous_rejected = false;
};

/**
 * @brief Asks the local user for the remote peer's PIN; nullopt cancels the session
 */
using PinPromptFn = std::function<std::optional<std::string>(const PinPrompt& prompt)>;

struct PairingRequest {
    std::string fingerprint; ///< hex sha256 of the remote public key DER
};

/**
 * @brief Asks the local user whether to pair with the remote key
 */
using PairingDecisionFn = std::function<bool(const PairingRequest& request)>;

/**
 * @brief Remote keys that completed a PAIR round, remembered for the process lifetime
 */
class PairedKeys {
public:
    [[nodiscard]] bool contains(const Bytes& public_key_der) const;
    void remember(const Bytes& public_key_der);
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::set<Bytes> keys_;
};

struct HandshakeOptions {
    // Gate imposed on the remote peer
    std::optional<std::string> pin;
    std::uint32_t max_pin_attempts = 3;
    bool require_pairing = false;
    std::shared_ptr<PairedKeys> paired_keys;

    // Answers for the remote peer's gate; unset callbacks decline
    PinPromptFn pin_prompt;
    PairingDecisionFn pairing_decision;
};

struct HandshakeResult {
    crypto::PublicKey remote_key;
    Bytes nonce_material;
};

/**
 * @brief Run the initiator side (the party that sent the relay offer)
 *
 * BLOCKS: on every inbound message and on the PIN prompt
 */
Result<HandshakeResult> run_initiator(transport::DataChannel& channel,
                                      const crypto::KeyPair& identity,
                                      const HandshakeOptions& options,
                                      TransferSession& session);

/**
 * @brief Run the responder side (the party that answered the relay offer)
 */
Result<HandshakeResult> run_responder(transport::DataChannel& channel,
                                      const crypto::KeyPair& identity,
                                      const HandshakeOptions& options,
                                      TransferSession& session);

/**
 * @brief Constant-time PIN comparison
 */
[[nodiscard]] bool pin_matches(const std::string& expected, const std::string& submitted) noexcept;

/**
 * @brief First status a verifier sends for `remote` under `options`
 */
[[nodiscard]] protocol::GateStatus initial_gate_status(const HandshakeOptions& options, const crypto::PublicKey& remote);

} // namespace lanbeam::session
