#include "lanbeam/signaling/relay_messages.hpp"
#include "lanbeam/codec/base64.hpp"

#include <nlohmann/json.hpp>

namespace lanbeam::signaling {
namespace {

using json = nlohmann::json;

std::string make_sdp_message(const char* type,
                             const std::string& session_id,
                             const std::string& target,
                             const std::string& sdp) {
    return json{
        {"type", type},
        {"sessionId", session_id},
        {"target", target},
        {"sdp", sdp},
    }.dump();
}

} // namespace

Result<ServerMessage> parse_server_message(const std::string& text) {
    try {
        const json j = json::parse(text);
        const std::string type = j.at("type").get<std::string>();

        if (type == "hello") {
            HelloMessage hello;
            hello.client = j.at("client").get<PeerIdentity>();
            hello.peers = j.value("peers", std::vector<PeerIdentity>{});
            return Ok(ServerMessage(std::move(hello)));
        }
        if (type == "joined") {
            return Ok(ServerMessage(JoinedMessage{j.at("peer").get<PeerIdentity>()}));
        }
        if (type == "left") {
            return Ok(ServerMessage(LeftMessage{j.at("peerId").get<std::string>()}));
        }
        if (type == "update") {
            return Ok(ServerMessage(UpdateMessage{j.at("peer").get<PeerIdentity>()}));
        }
        if (type == "offer") {
            return Ok(ServerMessage(OfferMessage{
                j.at("peer").get<PeerIdentity>(),
                j.at("sessionId").get<std::string>(),
                j.at("sdp").get<std::string>(),
            }));
        }
        if (type == "answer") {
            return Ok(ServerMessage(AnswerMessage{
                j.at("peer").get<PeerIdentity>(),
                j.at("sessionId").get<std::string>(),
                j.at("sdp").get<std::string>(),
            }));
        }
        if (type == "error") {
            return Ok(ServerMessage(ErrorMessage{j.at("code").get<int>()}));
        }
        return Err<ServerMessage>(ErrorKind::RelayRecoverable, "unrecognized relay message type '" + type + "'");
    } catch (const json::exception& e) {
        return Err<ServerMessage>(ErrorKind::RelayRecoverable, std::string("malformed relay message: ") + e.what());
    }
}

const char* message_type(const ServerMessage& message) noexcept {
    switch (message.index()) {
        case 0: return "hello";
        case 1: return "joined";
        case 2: return "left";
        case 3: return "update";
        case 4: return "offer";
        case 5: return "answer";
        case 6: return "error";
    }
    return "unknown";
}

std::string make_offer(const std::string& session_id, const std::string& target, const std::string& sdp) {
    return make_sdp_message("offer", session_id, target, sdp);
}

std::string make_answer(const std::string& session_id, const std::string& target, const std::string& sdp) {
    return make_sdp_message("answer", session_id, target, sdp);
}

std::string make_update(const ClientInfo& info) {
    return json{{"type", "UPDATE"}, {"info", json(info)}}.dump();
}

std::string make_connect_url(const std::string& base_url, const ClientInfo& info) {
    const std::string separator = base_url.find('?') == std::string::npos ? "?" : "&";
    return base_url + separator + "d=" + codec::base64url_encode(json(info).dump());
}

} // namespace lanbeam::signaling
