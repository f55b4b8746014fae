/**
 * @file events.hpp
 * @brief Event type definitions emitted by the lanbeam protocol stack
 *
 * NAMING CONVENTION:
 * - Events are past-tense: PeerJoinedEvent, FileFinishedEvent
 * - Every event carries the time it was created
 */

#pragma once

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lanbeam::events {

using Clock = std::chrono::system_clock;

// ════════════════════════════════════════════════════════
// Relay Events
// ════════════════════════════════════════════════════════

/**
 * @brief Roster replaced wholesale: emitted with an empty list on disconnect
 *        and with the full list when a `hello` arrives
 */
struct RosterResetEvent {
    std::vector<PeerIdentity> peers;
    std::string reason; // "hello", "disconnected"
    Clock::time_point timestamp{Clock::now()};
};

struct RelayConnectedEvent {
    PeerIdentity self;
    Clock::time_point timestamp{Clock::now()};
};

struct PeerJoinedEvent {
    PeerIdentity peer;
    Clock::time_point timestamp{Clock::now()};
};

struct PeerLeftEvent {
    std::string peer_id;
    Clock::time_point timestamp{Clock::now()};
};

struct PeerUpdatedEvent {
    PeerIdentity peer;
    Clock::time_point timestamp{Clock::now()};
};

/**
 * @brief Connection failure or `error{code}` from the relay
 *
 * code is 0 for local connection failures.
 */
struct RelayErrorEvent {
    int code = 0;
    std::string message;
    Clock::time_point timestamp{Clock::now()};
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

struct OfferRejectedEvent {
    std::string session_id;
    std::string peer_id;
    std::string reason;
    Clock::time_point timestamp{Clock::now()};
};

struct SessionStateChangedEvent {
    std::string session_id;
    SessionRole role = SessionRole::Sender;
    SessionState previous = SessionState::Negotiating;
    SessionState current = SessionState::Negotiating;
    Clock::time_point timestamp{Clock::now()};
};

/**
 * @brief Session ended without completing; user-declined ends are reported here too
 */
struct SessionAbortedEvent {
    std::string session_id;
    SessionRole role = SessionRole::Sender;
    Error error;
    Clock::time_point timestamp{Clock::now()};
};

struct SessionCompletedEvent {
    std::string session_id;
    SessionRole role = SessionRole::Sender;
    std::size_t files_finished = 0;
    std::size_t files_failed = 0;
    std::size_t files_skipped = 0;
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    Clock::time_point timestamp{Clock::now()};
};

// ════════════════════════════════════════════════════════
// File Transfer Events
// ════════════════════════════════════════════════════════

struct FilesSkippedEvent {
    std::string session_id;
    std::vector<std::string> file_ids;
    Clock::time_point timestamp{Clock::now()};
};

/**
 * @brief Running byte count of one file; emitted per block, not only at the end
 */
struct FileProgressEvent {
    std::string session_id;
    std::string file_id;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total = 0;
    Clock::time_point timestamp{Clock::now()};
};

struct FileFinishedEvent {
    std::string session_id;
    std::string file_id;
    std::string file_name;
    std::uint64_t total = 0;
    Clock::time_point timestamp{Clock::now()};
};

struct FileFailedEvent {
    std::string session_id;
    std::string file_id;
    std::string error;
    Clock::time_point timestamp{Clock::now()};
};

} // namespace lanbeam::events
