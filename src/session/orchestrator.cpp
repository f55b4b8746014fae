#include "lanbeam/session/orchestrator.hpp"
#include "lanbeam/events/events.hpp"
#include "lanbeam/transfer/sender.hpp"
#include "lanbeam/transport/flow_control.hpp"

#include <spdlog/spdlog.h>

namespace lanbeam::session {

OrchestratorOptions make_orchestrator_options(const ClientConfig& config) {
    OrchestratorOptions options;
    options.limits = config.limits;
    options.handshake.pin = config.pin;
    options.handshake.max_pin_attempts = config.max_pin_attempts;
    options.handshake.require_pairing = config.require_pairing;
    options.handshake.paired_keys = std::make_shared<PairedKeys>();
    options.answer_timeout = config.answer_timeout;
    options.open_timeout = config.open_timeout;
    return options;
}

Result<std::string> generate_session_id() {
    auto bytes = crypto::random_bytes(8);
    if (bytes.is_error()) {
        return Err<std::string>(bytes.error());
    }
    std::uint64_t value = 0;
    for (std::uint8_t byte : bytes.value()) {
        value = (value << 8) | byte;
    }

    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string id;
    do {
        id.insert(id.begin(), kDigits[value % 36]);
        value /= 36;
    } while (value != 0);
    return Ok(std::move(id));
}

SessionOrchestrator::SessionOrchestrator(const crypto::KeyPair& identity,
                                         transport::DirectTransport& transport,
                                         signaling::SignalingChannel& signaling,
                                         OrchestratorOptions options,
                                         events::EventBus& bus)
    : identity_(identity),
      transport_(transport),
      signaling_(signaling),
      options_(std::move(options)),
      bus_(bus) {}

SessionOrchestrator::~SessionOrchestrator() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SessionOrchestrator::busy() const {
    std::lock_guard lock(mutex_);
    return active_;
}

void SessionOrchestrator::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return !active_; });
}

void SessionOrchestrator::cancel() {
    std::shared_ptr<transport::DataChannel> channel;
    {
        std::lock_guard lock(mutex_);
        channel = live_channel_;
    }
    if (channel) {
        spdlog::info("[Orchestrator] cancelling active session");
        channel->close();
    }
}

bool SessionOrchestrator::try_acquire() {
    std::lock_guard lock(mutex_);
    if (active_) {
        return false;
    }
    active_ = true;
    return true;
}

void SessionOrchestrator::release() {
    {
        std::lock_guard lock(mutex_);
        active_ = false;
        live_channel_.reset();
    }
    idle_cv_.notify_all();
}

Result<void> SessionOrchestrator::await_open(transport::DataChannel& channel) {
    if (!channel.wait_open(options_.open_timeout)) {
        return Err<void>(ErrorKind::TransportFatal,
                         "data channel did not open within " + std::to_string(options_.open_timeout.count()) + "ms");
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Sender
// ──────────────────────────────────────────────────────────

Result<transfer::ProgressTotals> SessionOrchestrator::send_files(
    const std::string& target_peer_id,
    std::vector<std::unique_ptr<transfer::FileSource>> files) {
    using Totals = transfer::ProgressTotals;

    if (files.empty()) {
        return Err<Totals>(ErrorKind::InvalidArgument, "nothing to send");
    }
    auto session_id = generate_session_id();
    if (session_id.is_error()) {
        return Err<Totals>(session_id.error());
    }
    if (!try_acquire()) {
        return Err<Totals>(ErrorKind::Busy, "another transfer session is active");
    }

    TransferSession session(session_id.value(), SessionRole::Sender, &bus_);
    std::shared_ptr<transport::DataChannel> channel;
    spdlog::info("[Orchestrator] sending session={} to={} files={}", session.session_id(), target_peer_id, files.size());

    auto outcome = [&]() -> Result<Totals> {
        auto offer = transport_.create_offer();
        if (offer.is_error()) {
            return Err<Totals>(offer.error());
        }
        if (auto sent = signaling_.send_offer(session.session_id(), target_peer_id, offer.value()->local_description());
            sent.is_error()) {
            return Err<Totals>(sent.error());
        }
        auto answer = signaling_.wait_for_answer(session.session_id(), options_.answer_timeout);
        if (answer.is_error()) {
            return Err<Totals>(answer.error());
        }
        auto accepted = offer.value()->accept_answer(answer.value());
        if (accepted.is_error()) {
            return Err<Totals>(accepted.error());
        }
        channel = accepted.value();
        {
            std::lock_guard lock(mutex_);
            live_channel_ = channel;
        }
        if (auto opened = await_open(*channel); opened.is_error()) {
            return Err<Totals>(opened.error());
        }

        auto handshake = run_initiator(*channel, identity_, options_.handshake, session);
        if (handshake.is_error()) {
            return Err<Totals>(handshake.error());
        }

        transfer::TransferProgress progress(session.session_id(), &bus_);
        return transfer::send_files(*channel, files, options_.limits, session, progress);
    }();

    auto result = conclude(session, channel.get(), std::move(outcome));
    release();
    return result;
}

// ──────────────────────────────────────────────────────────
// Receiver
// ──────────────────────────────────────────────────────────

Result<void> SessionOrchestrator::handle_offer(const signaling::IncomingOffer& offer) {
    if (!options_.sink) {
        bus_.emit(events::OfferRejectedEvent{offer.session_id, offer.peer.id, "no file sink configured"});
        return Err<void>(ErrorKind::InvalidArgument, "no file sink configured");
    }
    if (!try_acquire()) {
        bus_.emit(events::OfferRejectedEvent{offer.session_id, offer.peer.id, "busy"});
        return Err<void>(ErrorKind::Busy, "another transfer session is active");
    }

    // The previous worker has released the slot and is about to return
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread(&SessionOrchestrator::run_receiver, this, offer);
    return Ok();
}

void SessionOrchestrator::run_receiver(signaling::IncomingOffer offer) {
    using Totals = transfer::ProgressTotals;

    TransferSession session(offer.session_id, SessionRole::Receiver, &bus_);
    std::shared_ptr<transport::DataChannel> channel;
    spdlog::info("[Orchestrator] receiving session={} from={}", offer.session_id, offer.peer.id);

    auto outcome = [&]() -> Result<Totals> {
        auto answered = transport_.create_answer(offer.description);
        if (answered.is_error()) {
            return Err<Totals>(answered.error());
        }
        channel = answered.value().channel;
        {
            std::lock_guard lock(mutex_);
            live_channel_ = channel;
        }
        if (auto sent = signaling_.send_answer(offer.session_id, offer.peer.id, answered.value().local_description);
            sent.is_error()) {
            return Err<Totals>(sent.error());
        }
        if (auto opened = await_open(*channel); opened.is_error()) {
            return Err<Totals>(opened.error());
        }

        auto handshake = run_responder(*channel, identity_, options_.handshake, session);
        if (handshake.is_error()) {
            return Err<Totals>(handshake.error());
        }

        transfer::TransferProgress progress(session.session_id(), &bus_);
        return transfer::receive_files(*channel, *options_.sink, options_.select_files, options_.limits,
                                       session, progress);
    }();

    auto result = conclude(session, channel.get(), std::move(outcome));
    if (result.is_ok()) {
        spdlog::info("[Orchestrator] session={} received {} file(s)", offer.session_id, result.value().finished);
    }
    release();
}

// ──────────────────────────────────────────────────────────
// Teardown
// ──────────────────────────────────────────────────────────

Result<transfer::ProgressTotals> SessionOrchestrator::conclude(TransferSession& session,
                                                               transport::DataChannel* channel,
                                                               Result<transfer::ProgressTotals> outcome) {
    if (outcome.is_ok()) {
        if (auto moved = session.transition_to(SessionState::Completed); moved.is_error()) {
            outcome = Result<transfer::ProgressTotals>(ErrValue<Error>(moved.error()));
        }
    }

    if (outcome.is_error()) {
        // Fatal errors close at once; declined or local failures flush what is queued first
        if (channel && !outcome.error().is_fatal()) {
            if (auto drained = transport::drain(*channel, options_.limits.poll_interval); drained.is_error()) {
                spdlog::debug("[Orchestrator] drain before close failed: {}", drained.error().message);
            }
        }
        if (channel) {
            channel->close();
        }
        session.abort(outcome.error());

        events::SessionAbortedEvent event;
        event.session_id = session.session_id();
        event.role = session.role();
        event.error = outcome.error();
        bus_.emit(event);
        return outcome;
    }

    if (channel) {
        channel->close();
    }
    const auto& totals = outcome.value();
    events::SessionCompletedEvent event;
    event.session_id = session.session_id();
    event.role = session.role();
    event.files_finished = totals.finished;
    event.files_failed = totals.failed;
    event.files_skipped = totals.skipped;
    event.bytes_transferred = totals.curr;
    event.duration = session.elapsed();
    bus_.emit(event);
    return outcome;
}

} // namespace lanbeam::session
