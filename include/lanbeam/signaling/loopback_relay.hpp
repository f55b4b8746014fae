#pragma once

#include "lanbeam/signaling/relay_client.hpp"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lanbeam::signaling {

class LoopbackRelay;

/**
 * @brief One peer's view of a LoopbackRelay
 */
class LoopbackEndpoint : public SignalingChannel {
public:
    LoopbackEndpoint(LoopbackRelay& relay, PeerIdentity identity);

    [[nodiscard]] const PeerIdentity& identity() const noexcept { return identity_; }

    void set_offer_handler(OfferHandler handler);

    Result<void> send_offer(const std::string& session_id,
                            const std::string& target_peer_id,
                            const std::string& description) override;

    Result<void> send_answer(const std::string& session_id,
                             const std::string& target_peer_id,
                             const std::string& description) override;

    Result<std::string> wait_for_answer(const std::string& session_id, std::chrono::milliseconds timeout) override;

private:
    friend class LoopbackRelay;

    void deliver_offer(const IncomingOffer& offer);
    void deliver_answer(const std::string& session_id, const std::string& from_peer_id, const std::string& description);

    LoopbackRelay& relay_;
    PeerIdentity identity_;

    std::mutex mutex_;
    std::condition_variable cv_;
    OfferHandler offer_handler_;
    struct PendingAnswer {
        std::string target_peer_id;
        std::optional<std::string> description;
    };
    std::map<std::string, PendingAnswer> pending_answers_;
};

/**
 * @brief In-process stand-in for the relay server
 *
 * Forwards offers and answers between endpoints that joined it, by peer id.
 * Offer handlers run on the sender's thread.
 */
class LoopbackRelay {
public:
    std::shared_ptr<LoopbackEndpoint> join(PeerIdentity identity);
    void leave(const std::string& peer_id);

private:
    friend class LoopbackEndpoint;

    std::shared_ptr<LoopbackEndpoint> find(const std::string& peer_id);

    std::mutex mutex_;
    std::map<std::string, std::weak_ptr<LoopbackEndpoint>> endpoints_;
};

} // namespace lanbeam::signaling
