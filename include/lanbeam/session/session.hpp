#pragma once

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"
#include "lanbeam/events/event_bus.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace lanbeam::session {

/**
 * @brief Lifecycle of one direct-transport connection
 *
 * Transitions are monotonic. The only loop allowed is the PIN sub-loop
 * (Authenticating <-> PinPending) used while either gate asks for a PIN.
 * Aborted is reachable from every non-terminal state; Completed and
 * Aborted are final.
 *
 * Every accepted transition is published as a SessionStateChangedEvent
 * when a bus is attached.
 */
class TransferSession {
public:
    TransferSession(std::string session_id, SessionRole role, events::EventBus* bus = nullptr);

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] SessionRole role() const noexcept { return role_; }
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool is_terminal() const;
    [[nodiscard]] std::optional<Error> last_error() const;

    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept { return started_at_; }
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

    Result<void> transition_to(SessionState next_state);

    /**
     * @brief Move to Aborted and remember why; no-op once terminal
     */
    void abort(Error error);

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;
    void publish(SessionState previous, SessionState current) const;

    std::string session_id_;
    SessionRole role_;
    events::EventBus* bus_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Negotiating;
    std::optional<Error> last_error_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace lanbeam::session
