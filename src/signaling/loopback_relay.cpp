#include "lanbeam/signaling/loopback_relay.hpp"

#include <spdlog/spdlog.h>

namespace lanbeam::signaling {

std::shared_ptr<LoopbackEndpoint> LoopbackRelay::join(PeerIdentity identity) {
    auto endpoint = std::make_shared<LoopbackEndpoint>(*this, identity);
    std::lock_guard lock(mutex_);
    endpoints_[identity.id] = endpoint;
    return endpoint;
}

void LoopbackRelay::leave(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    endpoints_.erase(peer_id);
}

std::shared_ptr<LoopbackEndpoint> LoopbackRelay::find(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    auto it = endpoints_.find(peer_id);
    if (it == endpoints_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

LoopbackEndpoint::LoopbackEndpoint(LoopbackRelay& relay, PeerIdentity identity)
    : relay_(relay), identity_(std::move(identity)) {}

void LoopbackEndpoint::set_offer_handler(OfferHandler handler) {
    std::lock_guard lock(mutex_);
    offer_handler_ = std::move(handler);
}

Result<void> LoopbackEndpoint::send_offer(const std::string& session_id,
                                          const std::string& target_peer_id,
                                          const std::string& description) {
    auto target = relay_.find(target_peer_id);
    if (!target) {
        return Err<void>(ErrorKind::RelayRecoverable, "unknown peer " + target_peer_id);
    }
    {
        // The answer may come back before send_offer() returns
        std::lock_guard lock(mutex_);
        pending_answers_[session_id] = PendingAnswer{target_peer_id, std::nullopt};
    }
    target->deliver_offer(IncomingOffer{identity_, session_id, description});
    return Ok();
}

Result<void> LoopbackEndpoint::send_answer(const std::string& session_id,
                                           const std::string& target_peer_id,
                                           const std::string& description) {
    auto target = relay_.find(target_peer_id);
    if (!target) {
        return Err<void>(ErrorKind::RelayRecoverable, "unknown peer " + target_peer_id);
    }
    target->deliver_answer(session_id, identity_.id, description);
    return Ok();
}

Result<std::string> LoopbackEndpoint::wait_for_answer(const std::string& session_id,
                                                      std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    auto it = pending_answers_.find(session_id);
    if (it == pending_answers_.end()) {
        return Err<std::string>(ErrorKind::RelayRecoverable, "no offer pending for session " + session_id);
    }
    cv_.wait_for(lock, timeout, [&]() { return it->second.description.has_value(); });

    std::optional<std::string> description = std::move(it->second.description);
    pending_answers_.erase(it);
    if (!description) {
        return Err<std::string>(ErrorKind::TransportFatal, "no answer for session " + session_id);
    }
    return Ok(std::move(*description));
}

void LoopbackEndpoint::deliver_offer(const IncomingOffer& offer) {
    OfferHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = offer_handler_;
    }
    if (!handler) {
        spdlog::warn("[LoopbackRelay] peer={} has no offer handler, dropping session={}", identity_.id, offer.session_id);
        return;
    }
    handler(offer);
}

void LoopbackEndpoint::deliver_answer(const std::string& session_id,
                                      const std::string& from_peer_id,
                                      const std::string& description) {
    {
        std::lock_guard lock(mutex_);
        auto it = pending_answers_.find(session_id);
        if (it == pending_answers_.end() || it->second.target_peer_id != from_peer_id) {
            spdlog::warn("[LoopbackRelay] peer={} dropping unexpected answer session={} from={}",
                         identity_.id, session_id, from_peer_id);
            return;
        }
        it->second.description = description;
    }
    cv_.notify_all();
}

} // namespace lanbeam::signaling
