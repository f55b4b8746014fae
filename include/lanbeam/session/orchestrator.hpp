#pragma once

/**
 * @file orchestrator.hpp
 * @brief Owns direct-transport sessions for both roles
 *
 * SENDER (blocking, caller's thread):
 *   create offer -> relay offer -> wait for answer -> open channel
 *   -> handshake as initiator -> send files -> drain -> close
 *
 * RECEIVER (handle_offer returns immediately, work happens on a worker thread):
 *   create answer -> relay answer -> wait for open
 *   -> handshake as responder -> receive files -> drain -> close
 *
 * Exactly one session is active at a time. A second offer while busy is
 * rejected with an OfferRejectedEvent and never answered; a second
 * send_files() call fails with ErrorKind::Busy.
 */

#include "lanbeam/core/config.hpp"
#include "lanbeam/core/result.hpp"
#include "lanbeam/crypto/identity.hpp"
#include "lanbeam/events/event_bus.hpp"
#include "lanbeam/session/handshake.hpp"
#include "lanbeam/session/session.hpp"
#include "lanbeam/signaling/relay_client.hpp"
#include "lanbeam/transfer/file_sink.hpp"
#include "lanbeam/transfer/file_source.hpp"
#include "lanbeam/transfer/progress.hpp"
#include "lanbeam/transfer/receiver.hpp"
#include "lanbeam/transport/data_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanbeam::session {

struct OrchestratorOptions {
    TransferLimits limits;
    HandshakeOptions handshake;
    std::chrono::milliseconds answer_timeout{60000};
    std::chrono::milliseconds open_timeout{30000};

    // Receiver collaborators; without a sink every offer is rejected
    std::shared_ptr<transfer::FileSink> sink;
    transfer::SelectFilesFn select_files;
};

/**
 * @brief Orchestrator options derived from the client configuration
 */
OrchestratorOptions make_orchestrator_options(const ClientConfig& config);

class SessionOrchestrator {
public:
    SessionOrchestrator(const crypto::KeyPair& identity,
                        transport::DirectTransport& transport,
                        signaling::SignalingChannel& signaling,
                        OrchestratorOptions options,
                        events::EventBus& bus);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /**
     * @brief Offer `files` to `target_peer_id` and run the whole sender session
     *
     * BLOCKS: until the session completes or aborts
     */
    Result<transfer::ProgressTotals> send_files(const std::string& target_peer_id,
                                                std::vector<std::unique_ptr<transfer::FileSource>> files);

    /**
     * @brief Accept an offer relayed by the signaling channel
     *
     * RETURNS: Busy (and emits OfferRejectedEvent) while another session runs
     */
    Result<void> handle_offer(const signaling::IncomingOffer& offer);

    [[nodiscard]] bool busy() const;

    /**
     * @brief Block until no session is active
     */
    void wait_idle();

    /**
     * @brief Close the live data channel, if any; the running session aborts
     */
    void cancel();

private:
    bool try_acquire();
    void release();

    void run_receiver(signaling::IncomingOffer offer);

    /**
     * Drain and close the channel, then publish the completed/aborted event.
     */
    Result<transfer::ProgressTotals> conclude(TransferSession& session,
                                              transport::DataChannel* channel,
                                              Result<transfer::ProgressTotals> outcome);

    Result<void> await_open(transport::DataChannel& channel);

    const crypto::KeyPair& identity_;
    transport::DirectTransport& transport_;
    signaling::SignalingChannel& signaling_;
    OrchestratorOptions options_;
    events::EventBus& bus_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool active_ = false;
    std::shared_ptr<transport::DataChannel> live_channel_;
    std::thread worker_;
};

/**
 * @brief Random base36 session id
 */
Result<std::string> generate_session_id();

} // namespace lanbeam::session
