#include "lanbeam/session/session.hpp"
#include "lanbeam/events/events.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace lanbeam::session {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Negotiating, {SessionState::Authenticating}},
        {SessionState::Authenticating, {SessionState::PinPending, SessionState::ManifestSent, SessionState::ManifestReceived}},
        {SessionState::PinPending, {SessionState::Authenticating, SessionState::ManifestSent, SessionState::ManifestReceived}},
        {SessionState::ManifestSent, {SessionState::Transferring}},
        {SessionState::ManifestReceived, {SessionState::Transferring}},
        {SessionState::Transferring, {SessionState::Completed}},
    };

    if (target == SessionState::Aborted) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

bool is_final(SessionState state) {
    return state == SessionState::Completed || state == SessionState::Aborted;
}

} // namespace

TransferSession::TransferSession(std::string session_id, SessionRole role, events::EventBus* bus)
    : session_id_(std::move(session_id)),
      role_(role),
      bus_(bus),
      started_at_(std::chrono::steady_clock::now()) {}

SessionState TransferSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool TransferSession::is_terminal() const {
    std::lock_guard lock(mutex_);
    return is_final(state_);
}

std::optional<Error> TransferSession::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

std::chrono::milliseconds TransferSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
}

Result<void> TransferSession::transition_to(SessionState next_state) {
    SessionState previous;
    {
        std::lock_guard lock(mutex_);
        if (state_ == next_state) {
            return Ok();
        }
        if (!can_transition(next_state)) {
            return Err<void>(ErrorKind::TransportFatal,
                             std::string("illegal session transition ") + to_string(state_) + " -> " + to_string(next_state));
        }
        previous = state_;
        state_ = next_state;
    }

    publish(previous, next_state);
    return Ok();
}

void TransferSession::abort(Error error) {
    SessionState previous;
    {
        std::lock_guard lock(mutex_);
        if (is_final(state_)) {
            return;
        }
        previous = state_;
        state_ = SessionState::Aborted;
        last_error_ = std::move(error);
    }

    publish(previous, SessionState::Aborted);
}

void TransferSession::publish(SessionState previous, SessionState current) const {
    if (!bus_) {
        return;
    }
    events::SessionStateChangedEvent event;
    event.session_id = session_id_;
    event.role = role_;
    event.previous = previous;
    event.current = current;
    bus_->emit(event);
}

bool TransferSession::can_transition(SessionState target) const noexcept {
    if (is_final(state_)) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace lanbeam::session
