#pragma once

/**
 * @file relay_client.hpp
 * @brief Long-lived relay connection: registration, roster, offer/answer relay
 *
 * WHY THIS FILE EXISTS:
 * Peers find each other through a relay that assigns ids and forwards
 * session descriptions. The client keeps that connection alive forever
 * (fixed backoff, no give-up) and mirrors the relay's roster locally so
 * front-ends can render it.
 *
 * THREADING:
 * connect() starts one background thread that owns the connection loop.
 * Roster queries, sends and wait_for_answer() may be called from any thread.
 * Events and the offer handler run on the relay thread.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"
#include "lanbeam/events/event_bus.hpp"
#include "lanbeam/signaling/relay_messages.hpp"
#include "lanbeam/signaling/relay_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanbeam::signaling {

/**
 * @brief What the session orchestrator needs from the relay
 *
 * Session descriptions are passed in their plain form; encoding for the
 * wire is the implementation's business.
 */
class SignalingChannel {
public:
    virtual ~SignalingChannel() = default;

    virtual Result<void> send_offer(const std::string& session_id,
                                    const std::string& target_peer_id,
                                    const std::string& description) = 0;

    virtual Result<void> send_answer(const std::string& session_id,
                                     const std::string& target_peer_id,
                                     const std::string& description) = 0;

    /**
     * @brief Block until the answer for `session_id` arrives
     *
     * Only valid after send_offer() for the same session. The pending entry is
     * dropped whichever way the wait ends.
     */
    virtual Result<std::string> wait_for_answer(const std::string& session_id, std::chrono::milliseconds timeout) = 0;
};

struct IncomingOffer {
    PeerIdentity peer;
    std::string session_id;
    std::string description; ///< decoded
};

using OfferHandler = std::function<void(const IncomingOffer& offer)>;

/**
 * @brief Produces a fresh registration token before every connection attempt
 */
using TokenProvider = std::function<Result<std::string>()>;

struct RelayClientOptions {
    std::string url;
    std::chrono::milliseconds reconnect_backoff{5000};
    std::chrono::milliseconds keepalive_interval{120000};
    TokenProvider token_provider;
};

class RelayClient : public SignalingChannel {
public:
    RelayClient(std::shared_ptr<RelayTransport> transport,
                RelayClientOptions options,
                ClientInfo info,
                events::EventBus* bus = nullptr);
    ~RelayClient() override;

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    /**
     * @brief Start the reconnect loop; no-op when already running
     */
    void connect();

    /**
     * @brief Stop the loop and drop the connection; blocks until the thread exits
     */
    void close();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] bool connected() const;

    /**
     * @brief Peers currently known, excluding ourselves; empty while disconnected
     */
    [[nodiscard]] std::vector<PeerIdentity> current_roster() const;
    [[nodiscard]] std::optional<PeerIdentity> find_peer(const std::string& peer_id) const;

    /**
     * @brief Our own entry as assigned by the last `hello`
     */
    [[nodiscard]] std::optional<PeerIdentity> self() const;

    [[nodiscard]] std::uint64_t connection_attempts() const noexcept { return attempts_.load(); }

    /**
     * @brief Replace the registration info (alias, device...) and announce it
     *
     * The new info is also used for every later reconnect.
     */
    Result<void> update_info(ClientInfo info);

    void set_offer_handler(OfferHandler handler);

    Result<void> send_offer(const std::string& session_id,
                            const std::string& target_peer_id,
                            const std::string& description) override;

    Result<void> send_answer(const std::string& session_id,
                             const std::string& target_peer_id,
                             const std::string& description) override;

    Result<std::string> wait_for_answer(const std::string& session_id, std::chrono::milliseconds timeout) override;

private:
    void run_loop();
    void serve(RelayConnection& connection);
    void reset_roster(std::vector<PeerIdentity> peers, const char* reason);
    Result<void> send_text(const std::string& text);

    void on_message(HelloMessage& message);
    void on_message(JoinedMessage& message);
    void on_message(LeftMessage& message);
    void on_message(UpdateMessage& message);
    void on_message(OfferMessage& message);
    void on_message(AnswerMessage& message);
    void on_message(ErrorMessage& message);

    std::shared_ptr<RelayTransport> transport_;
    RelayClientOptions options_;
    events::EventBus* bus_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ClientInfo info_;
    std::shared_ptr<RelayConnection> connection_;
    std::optional<PeerIdentity> self_;
    std::vector<PeerIdentity> roster_;
    struct PendingAnswer {
        std::string target_peer_id;
        std::optional<std::string> description; ///< decoded, once it arrived
    };
    // Only sessions we sent an offer for, answered by the peer we offered to
    std::map<std::string, PendingAnswer> pending_answers_;
    std::uint64_t generation_ = 0;   ///< bumped on every disconnect
    OfferHandler offer_handler_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> attempts_{0};
    std::thread thread_;
};

} // namespace lanbeam::signaling
