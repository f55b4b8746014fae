#include "lanbeam/signaling/relay_client.hpp"
#include "lanbeam/codec/sdp.hpp"
#include "lanbeam/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanbeam::signaling {

RelayClient::RelayClient(std::shared_ptr<RelayTransport> transport,
                         RelayClientOptions options,
                         ClientInfo info,
                         events::EventBus* bus)
    : transport_(std::move(transport)),
      options_(std::move(options)),
      bus_(bus),
      info_(std::move(info)) {}

RelayClient::~RelayClient() {
    close();
}

void RelayClient::connect() {
    if (running_.exchange(true)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::thread([this]() { run_loop(); });
}

void RelayClient::close() {
    std::shared_ptr<RelayConnection> connection;
    {
        std::lock_guard lock(mutex_);
        running_ = false;
        connection = connection_;
    }
    cv_.notify_all();
    if (connection) {
        connection->close();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool RelayClient::connected() const {
    std::lock_guard lock(mutex_);
    return connection_ != nullptr && self_.has_value();
}

std::vector<PeerIdentity> RelayClient::current_roster() const {
    std::lock_guard lock(mutex_);
    return roster_;
}

std::optional<PeerIdentity> RelayClient::find_peer(const std::string& peer_id) const {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(roster_.begin(), roster_.end(),
                           [&](const PeerIdentity& peer) { return peer.id == peer_id; });
    if (it == roster_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<PeerIdentity> RelayClient::self() const {
    std::lock_guard lock(mutex_);
    return self_;
}

void RelayClient::set_offer_handler(OfferHandler handler) {
    std::lock_guard lock(mutex_);
    offer_handler_ = std::move(handler);
}

// ──────────────────────────────────────────────────────────
// Connection loop
// ──────────────────────────────────────────────────────────

void RelayClient::run_loop() {
    spdlog::info("[Relay] connection loop started url={}", options_.url);

    while (running_) {
        ClientInfo info;
        {
            std::lock_guard lock(mutex_);
            info = info_;
        }
        if (options_.token_provider) {
            auto token = options_.token_provider();
            if (token.is_ok()) {
                info.auth_token = std::move(token.value());
            } else {
                spdlog::warn("[Relay] could not refresh registration token: {}", token.error().message);
            }
        }

        attempts_++;
        auto opened = transport_->open(make_connect_url(options_.url, info));
        if (opened.is_error()) {
            spdlog::warn("[Relay] connect failed: {}", opened.error().message);
            if (bus_) {
                bus_->emit(events::RelayErrorEvent{0, opened.error().message});
            }
        } else {
            std::shared_ptr<RelayConnection> connection(std::move(opened.value()));
            {
                std::lock_guard lock(mutex_);
                connection_ = connection;
            }
            if (running_) {
                serve(*connection);
            }
            connection->close();

            {
                std::lock_guard lock(mutex_);
                connection_.reset();
                self_.reset();
                pending_answers_.clear();
                generation_++;
            }
            cv_.notify_all();
            reset_roster({}, "disconnected");
        }

        if (!running_) {
            break;
        }
        spdlog::info("[Relay] retrying in {}ms", options_.reconnect_backoff.count());
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, options_.reconnect_backoff, [this]() { return !running_; });
    }

    spdlog::info("[Relay] connection loop stopped");
}

void RelayClient::serve(RelayConnection& connection) {
    using Clock = std::chrono::steady_clock;
    auto next_keepalive = Clock::now() + options_.keepalive_interval;

    while (running_) {
        // Checked every pass so a steady stream of inbound frames cannot starve it
        if (Clock::now() >= next_keepalive) {
            if (auto sent = connection.write(""); sent.is_error()) {
                spdlog::warn("[Relay] keepalive failed: {}", sent.error().message);
                return;
            }
            next_keepalive = Clock::now() + options_.keepalive_interval;
        }

        const auto wait = std::max(std::chrono::milliseconds(0),
            std::chrono::duration_cast<std::chrono::milliseconds>(next_keepalive - Clock::now()));
        auto frame = connection.read(wait);
        if (frame.is_error()) {
            spdlog::warn("[Relay] disconnected: {}", frame.error().message);
            return;
        }
        if (!frame.value()) {
            continue;
        }

        const std::string& text = *frame.value();
        if (text.empty()) {
            continue;
        }
        auto message = parse_server_message(text);
        if (message.is_error()) {
            // Unknown or broken frames mean we no longer speak the relay's protocol
            spdlog::error("[Relay] {}", message.error().message);
            if (bus_) {
                bus_->emit(events::RelayErrorEvent{0, message.error().message});
            }
            return;
        }
        spdlog::debug("[Relay] received type={}", message_type(message.value()));
        std::visit([this](auto& m) { on_message(m); }, message.value());
    }
}

void RelayClient::reset_roster(std::vector<PeerIdentity> peers, const char* reason) {
    {
        std::lock_guard lock(mutex_);
        roster_ = peers;
    }
    if (bus_) {
        bus_->emit(events::RosterResetEvent{std::move(peers), reason});
    }
}

// ──────────────────────────────────────────────────────────
// Server messages
// ──────────────────────────────────────────────────────────

void RelayClient::on_message(HelloMessage& message) {
    const std::string self_id = message.client.id;
    {
        std::lock_guard lock(mutex_);
        self_ = message.client;
    }
    message.peers.erase(std::remove_if(message.peers.begin(), message.peers.end(),
                                       [&](const PeerIdentity& peer) { return peer.id == self_id; }),
                        message.peers.end());

    spdlog::info("[Relay] registered id={} peers={}", self_id, message.peers.size());
    if (bus_) {
        bus_->emit(events::RelayConnectedEvent{message.client});
    }
    reset_roster(std::move(message.peers), "hello");
}

void RelayClient::on_message(JoinedMessage& message) {
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(roster_.begin(), roster_.end(),
                               [&](const PeerIdentity& peer) { return peer.id == message.peer.id; });
        if (it != roster_.end()) {
            *it = message.peer;
        } else {
            roster_.push_back(message.peer);
        }
    }
    if (bus_) {
        bus_->emit(events::PeerJoinedEvent{message.peer});
    }
}

void RelayClient::on_message(LeftMessage& message) {
    {
        std::lock_guard lock(mutex_);
        roster_.erase(std::remove_if(roster_.begin(), roster_.end(),
                                     [&](const PeerIdentity& peer) { return peer.id == message.peer_id; }),
                      roster_.end());
    }
    if (bus_) {
        bus_->emit(events::PeerLeftEvent{message.peer_id});
    }
}

void RelayClient::on_message(UpdateMessage& message) {
    {
        std::lock_guard lock(mutex_);
        if (self_ && self_->id == message.peer.id) {
            self_ = message.peer;
        } else {
            auto it = std::find_if(roster_.begin(), roster_.end(),
                                   [&](const PeerIdentity& peer) { return peer.id == message.peer.id; });
            if (it != roster_.end()) {
                *it = message.peer;
            } else {
                roster_.push_back(message.peer);
            }
        }
    }
    if (bus_) {
        bus_->emit(events::PeerUpdatedEvent{message.peer});
    }
}

void RelayClient::on_message(OfferMessage& message) {
    auto description = codec::decode_sdp(message.sdp);
    if (description.is_error()) {
        spdlog::warn("[Relay] dropping offer session={} from={}: {}",
                     message.session_id, message.peer.id, description.error().message);
        return;
    }

    OfferHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = offer_handler_;
    }
    if (!handler) {
        spdlog::warn("[Relay] no offer handler, ignoring session={} from={}", message.session_id, message.peer.id);
        return;
    }
    spdlog::info("[Relay] offer session={} from={} alias={}", message.session_id, message.peer.id, message.peer.info.alias);
    handler(IncomingOffer{message.peer, message.session_id, std::move(description.value())});
}

void RelayClient::on_message(AnswerMessage& message) {
    std::lock_guard lock(mutex_);
    auto it = pending_answers_.find(message.session_id);
    if (it == pending_answers_.end()) {
        spdlog::warn("[Relay] dropping answer for unknown session={} from={}", message.session_id, message.peer.id);
        return;
    }
    if (it->second.target_peer_id != message.peer.id) {
        spdlog::warn("[Relay] dropping answer session={} from={}, offer went to {}",
                     message.session_id, message.peer.id, it->second.target_peer_id);
        return;
    }
    auto description = codec::decode_sdp(message.sdp);
    if (description.is_error()) {
        spdlog::warn("[Relay] dropping answer session={}: {}", message.session_id, description.error().message);
        return;
    }
    it->second.description = std::move(description.value());
    cv_.notify_all();
}

void RelayClient::on_message(ErrorMessage& message) {
    spdlog::warn("[Relay] server error code={}", message.code);
    if (bus_) {
        bus_->emit(events::RelayErrorEvent{message.code, "relay reported error " + std::to_string(message.code)});
    }
}

// ──────────────────────────────────────────────────────────
// Outbound
// ──────────────────────────────────────────────────────────

Result<void> RelayClient::send_text(const std::string& text) {
    std::shared_ptr<RelayConnection> connection;
    {
        std::lock_guard lock(mutex_);
        connection = connection_;
    }
    if (!connection) {
        return Err<void>(ErrorKind::RelayRecoverable, "relay is not connected");
    }
    return connection->write(text);
}

Result<void> RelayClient::update_info(ClientInfo info) {
    {
        std::lock_guard lock(mutex_);
        info_ = info;
    }
    return send_text(make_update(info));
}

Result<void> RelayClient::send_offer(const std::string& session_id,
                                     const std::string& target_peer_id,
                                     const std::string& description) {
    auto encoded = codec::encode_sdp(description);
    if (encoded.is_error()) {
        return Err<void>(encoded.error());
    }
    {
        // Registered before sending so an early answer is not dropped
        std::lock_guard lock(mutex_);
        pending_answers_[session_id] = PendingAnswer{target_peer_id, std::nullopt};
    }
    auto sent = send_text(make_offer(session_id, target_peer_id, encoded.value()));
    if (sent.is_error()) {
        std::lock_guard lock(mutex_);
        pending_answers_.erase(session_id);
    }
    return sent;
}

Result<void> RelayClient::send_answer(const std::string& session_id,
                                      const std::string& target_peer_id,
                                      const std::string& description) {
    auto encoded = codec::encode_sdp(description);
    if (encoded.is_error()) {
        return Err<void>(encoded.error());
    }
    return send_text(make_answer(session_id, target_peer_id, encoded.value()));
}

Result<std::string> RelayClient::wait_for_answer(const std::string& session_id, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (pending_answers_.count(session_id) == 0) {
        return Err<std::string>(ErrorKind::RelayRecoverable, "no offer pending for session " + session_id);
    }
    const std::uint64_t generation = generation_;
    const bool done = cv_.wait_for(lock, timeout, [&]() {
        auto it = pending_answers_.find(session_id);
        return it == pending_answers_.end() || it->second.description.has_value()
            || generation_ != generation || !running_;
    });

    std::optional<std::string> description;
    if (auto it = pending_answers_.find(session_id); it != pending_answers_.end()) {
        description = std::move(it->second.description);
        pending_answers_.erase(it);
    }
    if (description) {
        return Ok(std::move(*description));
    }
    if (!done) {
        return Err<std::string>(ErrorKind::TransportFatal,
                                "no answer for session " + session_id + " within " + std::to_string(timeout.count()) + "ms");
    }
    return Err<std::string>(ErrorKind::RelayRecoverable, "relay disconnected while waiting for an answer");
}

} // namespace lanbeam::signaling
