/**
 * @file components.hpp
 * @brief Ready-made subscribers: logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "lanbeam/events/event_bus.hpp"
#include "lanbeam/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace lanbeam::events {

/**
 * @brief Logs every relay, session and file event through spdlog
 *
 * Per-block progress goes to debug level, everything else to info/warn.
 * Unsubscribes on destruction so it may be shorter-lived than the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<RosterResetEvent>([](const RosterResetEvent& e) {
            spdlog::info("[Roster] reset reason={} peers={}", e.reason, e.peers.size());
        });
        track<RelayConnectedEvent>([](const RelayConnectedEvent& e) {
            spdlog::info("[Relay] registered id={} alias={}", e.self.id, e.self.info.alias);
        });
        track<PeerJoinedEvent>([](const PeerJoinedEvent& e) {
            spdlog::info("[PeerJoined] id={} alias={}", e.peer.id, e.peer.info.alias);
        });
        track<PeerLeftEvent>([](const PeerLeftEvent& e) {
            spdlog::info("[PeerLeft] id={}", e.peer_id);
        });
        track<PeerUpdatedEvent>([](const PeerUpdatedEvent& e) {
            spdlog::info("[PeerUpdated] id={} alias={}", e.peer.id, e.peer.info.alias);
        });
        track<RelayErrorEvent>([](const RelayErrorEvent& e) {
            spdlog::warn("[RelayError] code={} message={}", e.code, e.message);
        });
        track<OfferRejectedEvent>([](const OfferRejectedEvent& e) {
            spdlog::warn("[OfferRejected] session={} peer={} reason={}", e.session_id, e.peer_id, e.reason);
        });
        track<SessionStateChangedEvent>([](const SessionStateChangedEvent& e) {
            spdlog::info("[Session] id={} role={} {} -> {}",
                         e.session_id, to_string(e.role), to_string(e.previous), to_string(e.current));
        });
        track<SessionAbortedEvent>([](const SessionAbortedEvent& e) {
            if (e.error.kind == ErrorKind::UserDeclined) {
                spdlog::info("[SessionDeclined] id={} role={} reason={}",
                             e.session_id, to_string(e.role), e.error.message);
            } else {
                spdlog::error("[SessionAborted] id={} role={} error={}",
                              e.session_id, to_string(e.role), e.error.describe());
            }
        });
        track<SessionCompletedEvent>([](const SessionCompletedEvent& e) {
            spdlog::info("[SessionCompleted] id={} role={} finished={} failed={} skipped={} bytes={} duration={}ms",
                         e.session_id, to_string(e.role), e.files_finished, e.files_failed,
                         e.files_skipped, e.bytes_transferred, e.duration.count());
        });
        track<FilesSkippedEvent>([](const FilesSkippedEvent& e) {
            spdlog::info("[FilesSkipped] session={} count={}", e.session_id, e.file_ids.size());
        });
        track<FileProgressEvent>([](const FileProgressEvent& e) {
            spdlog::debug("[FileProgress] session={} file={} {}/{}",
                          e.session_id, e.file_id, e.bytes_transferred, e.total);
        });
        track<FileFinishedEvent>([](const FileFinishedEvent& e) {
            spdlog::info("[FileFinished] session={} file={} name={} bytes={}",
                         e.session_id, e.file_id, e.file_name, e.total);
        });
        track<FileFailedEvent>([](const FileFailedEvent& e) {
            spdlog::warn("[FileFailed] session={} file={} error={}", e.session_id, e.file_id, e.error);
        });
    }

    ~LoggerComponent() {
        for (auto& release : releases_) {
            release();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType, typename Handler>
    void track(Handler handler) {
        const std::size_t id = bus_.subscribe<EventType>(std::move(handler));
        releases_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

/**
 * @brief Counts sessions, files and bytes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> sessions_completed{0};
        std::atomic<std::uint64_t> sessions_aborted{0};
        std::atomic<std::uint64_t> offers_rejected{0};
        std::atomic<std::uint64_t> files_finished{0};
        std::atomic<std::uint64_t> files_failed{0};
        std::atomic<std::uint64_t> files_skipped{0};
        std::atomic<std::uint64_t> bytes_finished{0};
        std::atomic<std::uint64_t> relay_errors{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<SessionCompletedEvent>([this](const SessionCompletedEvent&) {
            stats_.sessions_completed++;
        }));
        ids_.push_back(bus_.subscribe<SessionAbortedEvent>([this](const SessionAbortedEvent&) {
            stats_.sessions_aborted++;
        }));
        ids_.push_back(bus_.subscribe<OfferRejectedEvent>([this](const OfferRejectedEvent&) {
            stats_.offers_rejected++;
        }));
        ids_.push_back(bus_.subscribe<FileFinishedEvent>([this](const FileFinishedEvent& e) {
            stats_.files_finished++;
            stats_.bytes_finished += e.total;
        }));
        ids_.push_back(bus_.subscribe<FileFailedEvent>([this](const FileFailedEvent&) {
            stats_.files_failed++;
        }));
        ids_.push_back(bus_.subscribe<FilesSkippedEvent>([this](const FilesSkippedEvent& e) {
            stats_.files_skipped += e.file_ids.size();
        }));
        ids_.push_back(bus_.subscribe<RelayErrorEvent>([this](const RelayErrorEvent&) {
            stats_.relay_errors++;
        }));
    }

    ~MetricsComponent() {
        bus_.unsubscribe<SessionCompletedEvent>(ids_[0]);
        bus_.unsubscribe<SessionAbortedEvent>(ids_[1]);
        bus_.unsubscribe<OfferRejectedEvent>(ids_[2]);
        bus_.unsubscribe<FileFinishedEvent>(ids_[3]);
        bus_.unsubscribe<FileFailedEvent>(ids_[4]);
        bus_.unsubscribe<FilesSkippedEvent>(ids_[5]);
        bus_.unsubscribe<RelayErrorEvent>(ids_[6]);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Sessions completed: {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions aborted:   {}", stats_.sessions_aborted.load());
        spdlog::info("  Offers rejected:    {}", stats_.offers_rejected.load());
        spdlog::info("  Files finished:     {}", stats_.files_finished.load());
        spdlog::info("  Files failed:       {}", stats_.files_failed.load());
        spdlog::info("  Files skipped:      {}", stats_.files_skipped.load());
        spdlog::info("  Bytes finished:     {}", stats_.bytes_finished.load());
        spdlog::info("  Relay errors:       {}", stats_.relay_errors.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    std::vector<std::size_t> ids_;
};

} // namespace lanbeam::events
