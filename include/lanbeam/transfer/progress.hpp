#pragma once

/**
 * @file progress.hpp
 * @brief Per-file FileTransferState map plus session totals
 *
 * The transfer protocol is the only writer. Every mutation is mirrored on
 * the event bus (FileProgressEvent per block, FileFinished/FileFailed at
 * the end of a file, one FilesSkippedEvent for the unselected set).
 *
 * bytes_transferred never exceeds total: advance() clamps and reports the
 * overflow as an error.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"
#include "lanbeam/events/event_bus.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::transfer {

struct ProgressTotals {
    std::uint64_t curr = 0;   ///< bytes moved so far across all selected files
    std::uint64_t total = 0;  ///< declared bytes of all selected files
    std::size_t finished = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

class TransferProgress {
public:
    TransferProgress(std::string session_id, events::EventBus* bus = nullptr);

    void add_file(const FileDescriptor& file);
    void mark_skipped(const std::vector<std::string>& file_ids);
    Result<void> start(const std::string& file_id, FileStatus status);

    /**
     * @brief Count `bytes` more for a started file
     *
     * Fails (SessionRecoverable) when the file would pass its declared size.
     */
    Result<void> advance(const std::string& file_id, std::uint64_t bytes);

    void finish(const std::string& file_id);
    void fail(const std::string& file_id, const std::string& error);

    [[nodiscard]] std::optional<FileTransferState> file(const std::string& file_id) const;
    [[nodiscard]] std::vector<FileTransferState> snapshot() const;
    [[nodiscard]] ProgressTotals totals() const;

private:
    std::string session_id_;
    events::EventBus* bus_;

    mutable std::mutex mutex_;
    std::map<std::string, FileTransferState> files_;
    std::vector<std::string> order_;
};

} // namespace lanbeam::transfer
