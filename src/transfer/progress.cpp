#include "lanbeam/transfer/progress.hpp"
#include "lanbeam/events/events.hpp"

namespace lanbeam::transfer {

TransferProgress::TransferProgress(std::string session_id, events::EventBus* bus)
    : session_id_(std::move(session_id)), bus_(bus) {}

void TransferProgress::add_file(const FileDescriptor& file) {
    std::lock_guard lock(mutex_);
    FileTransferState state;
    state.id = file.id;
    state.file_name = file.file_name;
    state.total = file.size;
    if (files_.emplace(file.id, std::move(state)).second) {
        order_.push_back(file.id);
    }
}

void TransferProgress::mark_skipped(const std::vector<std::string>& file_ids) {
    if (file_ids.empty()) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        for (const auto& id : file_ids) {
            if (auto it = files_.find(id); it != files_.end()) {
                it->second.status = FileStatus::Skipped;
            }
        }
    }
    if (bus_) {
        bus_->emit(events::FilesSkippedEvent{session_id_, file_ids});
    }
}

Result<void> TransferProgress::start(const std::string& file_id, FileStatus status) {
    std::lock_guard lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return Err<void>(ErrorKind::TransportFatal, "unknown file id " + file_id);
    }
    if (it->second.status != FileStatus::Pending) {
        return Err<void>(ErrorKind::TransportFatal,
                         "file " + file_id + " already " + to_string(it->second.status));
    }
    it->second.status = status;
    return Ok();
}

Result<void> TransferProgress::advance(const std::string& file_id, std::uint64_t bytes) {
    events::FileProgressEvent event;
    std::optional<std::string> overflow;
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(file_id);
        if (it == files_.end()) {
            return Err<void>(ErrorKind::TransportFatal, "unknown file id " + file_id);
        }
        auto& state = it->second;
        if (bytes > state.total - state.bytes_transferred) {
            overflow = "file " + file_id + " exceeds its declared size of " + std::to_string(state.total) + " bytes";
            state.bytes_transferred = state.total;
        } else {
            state.bytes_transferred += bytes;
        }
        event.session_id = session_id_;
        event.file_id = file_id;
        event.bytes_transferred = state.bytes_transferred;
        event.total = state.total;
    }

    if (bus_) {
        bus_->emit(event);
    }
    if (overflow) {
        return Err<void>(ErrorKind::SessionRecoverable, *overflow);
    }
    return Ok();
}

void TransferProgress::finish(const std::string& file_id) {
    events::FileFinishedEvent event;
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(file_id);
        if (it == files_.end()) {
            return;
        }
        it->second.status = FileStatus::Finished;
        it->second.error.reset();
        event.session_id = session_id_;
        event.file_id = file_id;
        event.file_name = it->second.file_name;
        event.total = it->second.total;
    }
    if (bus_) {
        bus_->emit(event);
    }
}

void TransferProgress::fail(const std::string& file_id, const std::string& error) {
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(file_id);
        if (it == files_.end()) {
            return;
        }
        it->second.status = FileStatus::Error;
        it->second.error = error;
    }
    if (bus_) {
        bus_->emit(events::FileFailedEvent{session_id_, file_id, error});
    }
}

std::optional<FileTransferState> TransferProgress::file(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileTransferState> TransferProgress::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<FileTransferState> states;
    states.reserve(order_.size());
    for (const auto& id : order_) {
        states.push_back(files_.at(id));
    }
    return states;
}

ProgressTotals TransferProgress::totals() const {
    std::lock_guard lock(mutex_);
    ProgressTotals totals;
    for (const auto& [id, state] : files_) {
        switch (state.status) {
            case FileStatus::Skipped:
                totals.skipped++;
                continue;
            case FileStatus::Finished:
                totals.finished++;
                break;
            case FileStatus::Error:
                totals.failed++;
                break;
            case FileStatus::Pending:
            case FileStatus::Sending:
            case FileStatus::Receiving:
                break;
        }
        totals.curr += state.bytes_transferred;
        totals.total += state.total;
    }
    return totals;
}

} // namespace lanbeam::transfer
