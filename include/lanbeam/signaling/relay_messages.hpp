#pragma once

/**
 * @file relay_messages.hpp
 * @brief JSON messages of the relay websocket protocol
 *
 * Server -> client: hello, joined, left, update, offer, answer, error.
 * Client -> server: offer, answer, UPDATE.
 *
 * `sdp` strings are kept in their wire form (deflate + base64url); the relay
 * client decodes them with codec::decode_sdp.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace lanbeam::signaling {

struct HelloMessage {
    PeerIdentity client;
    std::vector<PeerIdentity> peers;
};

struct JoinedMessage {
    PeerIdentity peer;
};

struct LeftMessage {
    std::string peer_id;
};

struct UpdateMessage {
    PeerIdentity peer;
};

struct OfferMessage {
    PeerIdentity peer;
    std::string session_id;
    std::string sdp;
};

struct AnswerMessage {
    PeerIdentity peer;
    std::string session_id;
    std::string sdp;
};

struct ErrorMessage {
    int code = 0;
};

using ServerMessage = std::variant<HelloMessage,
                                   JoinedMessage,
                                   LeftMessage,
                                   UpdateMessage,
                                   OfferMessage,
                                   AnswerMessage,
                                   ErrorMessage>;

/**
 * @brief Parse one relay frame; an unknown `type` is an error
 */
Result<ServerMessage> parse_server_message(const std::string& text);

const char* message_type(const ServerMessage& message) noexcept;

std::string make_offer(const std::string& session_id, const std::string& target, const std::string& sdp);
std::string make_answer(const std::string& session_id, const std::string& target, const std::string& sdp);
std::string make_update(const ClientInfo& info);

/**
 * @brief `<base_url>?d=<base64url(JSON(info))>`
 */
std::string make_connect_url(const std::string& base_url, const ClientInfo& info);

} // namespace lanbeam::signaling
