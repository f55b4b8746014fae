#include "lanbeam/transfer/file_sink.hpp"

#include <spdlog/spdlog.h>

namespace lanbeam::transfer {

Result<void> MemoryFileSink::begin(const FileDescriptor& file) {
    std::lock_guard lock(mutex_);
    if (open_.count(file.id) > 0 || completed_.count(file.id) > 0) {
        return Err<void>(ErrorKind::SessionRecoverable, "file " + file.id + " was already started");
    }
    Bytes buffer;
    buffer.reserve(static_cast<std::size_t>(file.size));
    open_.emplace(file.id, std::move(buffer));
    return Ok();
}

Result<void> MemoryFileSink::write(const std::string& file_id, const std::uint8_t* data, std::size_t size) {
    std::lock_guard lock(mutex_);
    auto it = open_.find(file_id);
    if (it == open_.end()) {
        return Err<void>(ErrorKind::SessionRecoverable, "file " + file_id + " is not open");
    }
    it->second.insert(it->second.end(), data, data + size);
    return Ok();
}

Result<void> MemoryFileSink::finish(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    auto it = open_.find(file_id);
    if (it == open_.end()) {
        return Err<void>(ErrorKind::SessionRecoverable, "file " + file_id + " is not open");
    }
    completed_[file_id] = std::move(it->second);
    open_.erase(it);
    return Ok();
}

void MemoryFileSink::abort(const std::string& file_id, const std::string& reason) {
    std::lock_guard lock(mutex_);
    open_.erase(file_id);
    aborted_.push_back(file_id);
    spdlog::debug("[MemoryFileSink] dropped file={} reason={}", file_id, reason);
}

std::optional<Bytes> MemoryFileSink::completed(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    auto it = completed_.find(file_id);
    if (it == completed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryFileSink::completed_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, content] : completed_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> MemoryFileSink::aborted_ids() const {
    std::lock_guard lock(mutex_);
    return aborted_;
}

} // namespace lanbeam::transfer
