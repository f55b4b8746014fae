#include "lanbeam/transfer/sender.hpp"
#include "lanbeam/protocol/framing.hpp"
#include "lanbeam/protocol/messages.hpp"
#include "lanbeam/transport/flow_control.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace lanbeam::transfer {
namespace {

constexpr std::size_t kReadSize = 64 * 1024;

struct SelectedFile {
    FileSource* source = nullptr;
    std::string token;
};

Result<void> send_header(transport::DataChannel& channel, const SelectedFile& file) {
    protocol::FileHeader header{file.source->descriptor().id, file.token};
    return protocol::send_message(channel, protocol::to_json(header));
}

/**
 * Stream one file as blocks. Read errors fail this file only; whatever was
 * sent so far is rejected by the receiver's size check.
 */
Result<void> stream_file(transport::DataChannel& channel,
                         FileSource& source,
                         const TransferLimits& limits,
                         TransferProgress& progress,
                         std::optional<std::string>& local_error) {
    const std::string& id = source.descriptor().id;
    BlockAccumulator accumulator(limits.block_size);
    const BlockAccumulator::Emit emit = [&](const std::uint8_t* data, std::size_t size) -> Result<void> {
        if (auto ready = transport::wait_for_capacity(channel, limits.high_water_mark, limits.poll_interval);
            ready.is_error()) {
            return ready;
        }
        if (auto sent = channel.send_binary(data, size); sent.is_error()) {
            return sent;
        }
        if (auto counted = progress.advance(id, size); counted.is_error()) {
            local_error = counted.error().message;
        }
        return Ok();
    };

    Bytes buffer(kReadSize);
    while (true) {
        auto count = source.read(buffer.data(), buffer.size());
        if (count.is_error()) {
            local_error = count.error().message;
            break;
        }
        if (count.value() == 0) {
            break;
        }
        if (auto pushed = accumulator.push(buffer.data(), count.value(), emit); pushed.is_error()) {
            return pushed;
        }
    }
    return accumulator.flush(emit);
}

Result<void> await_outcome(transport::DataChannel& channel,
                           const std::string& expected_id,
                           const std::optional<std::string>& local_error,
                           TransferProgress& progress) {
    auto message = protocol::read_message(channel.inbound());
    if (message.is_error()) {
        return Err<void>(message.error());
    }
    auto outcome = protocol::parse_file_outcome(message.value());
    if (outcome.is_error()) {
        return Err<void>(outcome.error());
    }
    if (outcome.value().id != expected_id) {
        return Err<void>(ErrorKind::TransportFatal,
                         "outcome for " + outcome.value().id + " while waiting for " + expected_id);
    }

    if (outcome.value().success && !local_error) {
        progress.finish(expected_id);
    } else {
        progress.fail(expected_id, local_error ? *local_error : outcome.value().error.value_or("receiver reported failure"));
    }
    return Ok();
}

} // namespace

BlockAccumulator::BlockAccumulator(std::size_t block_size)
    : block_size_(block_size == 0 ? kDefaultBlockSize : block_size) {
    buffer_.reserve(block_size_);
}

Result<void> BlockAccumulator::push(const std::uint8_t* data, std::size_t size, const Emit& emit) {
    while (size > 0) {
        // Whole blocks straight from the input when nothing is pending
        if (buffer_.empty() && size >= block_size_) {
            if (auto sent = emit(data, block_size_); sent.is_error()) {
                return sent;
            }
            data += block_size_;
            size -= block_size_;
            continue;
        }

        const std::size_t take = std::min(size, block_size_ - buffer_.size());
        buffer_.insert(buffer_.end(), data, data + take);
        data += take;
        size -= take;
        if (buffer_.size() == block_size_) {
            if (auto sent = emit(buffer_.data(), buffer_.size()); sent.is_error()) {
                return sent;
            }
            buffer_.clear();
        }
    }
    return Ok();
}

Result<void> BlockAccumulator::flush(const Emit& emit) {
    if (buffer_.empty()) {
        return Ok();
    }
    auto sent = emit(buffer_.data(), buffer_.size());
    buffer_.clear();
    return sent;
}

Result<ProgressTotals> send_files(transport::DataChannel& channel,
                                  std::vector<std::unique_ptr<FileSource>>& files,
                                  const TransferLimits& limits,
                                  session::TransferSession& session,
                                  TransferProgress& progress) {
    protocol::ManifestMessage manifest;
    std::set<std::string> ids;
    for (const auto& file : files) {
        const auto& descriptor = file->descriptor();
        if (!ids.insert(descriptor.id).second) {
            return Err<ProgressTotals>(ErrorKind::InvalidArgument, "duplicate file id " + descriptor.id);
        }
        manifest.files.push_back(descriptor);
        progress.add_file(descriptor);
    }

    if (auto sent = protocol::send_block(channel, protocol::to_json(manifest), limits.block_size); sent.is_error()) {
        return Err<ProgressTotals>(sent.error());
    }
    if (auto moved = session.transition_to(SessionState::ManifestSent); moved.is_error()) {
        return Err<ProgressTotals>(moved.error());
    }
    spdlog::info("[Sender] session={} manifest sent files={}", session.session_id(), manifest.files.size());

    auto reply = protocol::read_message(channel.inbound());
    if (reply.is_error()) {
        return Err<ProgressTotals>(reply.error());
    }
    auto selection = protocol::parse_selection(reply.value());
    if (selection.is_error()) {
        return Err<ProgressTotals>(selection.error());
    }

    std::vector<SelectedFile> selected;
    std::vector<std::string> skipped;
    for (const auto& file : files) {
        const std::string& id = file->descriptor().id;
        auto it = selection.value().files.find(id);
        if (it == selection.value().files.end()) {
            skipped.push_back(id);
        } else {
            selected.push_back(SelectedFile{file.get(), it->second});
        }
    }
    if (selected.size() != selection.value().files.size()) {
        return Err<ProgressTotals>(ErrorKind::TransportFatal, "selection names files that are not in the manifest");
    }
    progress.mark_skipped(skipped);

    if (auto moved = session.transition_to(SessionState::Transferring); moved.is_error()) {
        return Err<ProgressTotals>(moved.error());
    }
    spdlog::info("[Sender] session={} selected={} skipped={}", session.session_id(), selected.size(), skipped.size());

    if (selected.empty()) {
        if (auto sent = protocol::send_delimiter(channel); sent.is_error()) {
            return Err<ProgressTotals>(sent.error());
        }
    } else {
        if (auto sent = send_header(channel, selected.front()); sent.is_error()) {
            return Err<ProgressTotals>(sent.error());
        }
    }

    for (std::size_t i = 0; i < selected.size(); ++i) {
        FileSource& source = *selected[i].source;
        const std::string& id = source.descriptor().id;
        if (auto started = progress.start(id, FileStatus::Sending); started.is_error()) {
            return Err<ProgressTotals>(started.error());
        }

        std::optional<std::string> local_error;
        if (auto streamed = stream_file(channel, source, limits, progress, local_error); streamed.is_error()) {
            return Err<ProgressTotals>(streamed.error());
        }

        const auto next = (i + 1 < selected.size())
            ? send_header(channel, selected[i + 1])
            : protocol::send_delimiter(channel);
        if (next.is_error()) {
            return Err<ProgressTotals>(next.error());
        }

        if (auto awaited = await_outcome(channel, id, local_error, progress); awaited.is_error()) {
            return Err<ProgressTotals>(awaited.error());
        }
    }

    if (auto drained = transport::drain(channel, limits.poll_interval); drained.is_error()) {
        return Err<ProgressTotals>(drained.error());
    }
    return Ok(progress.totals());
}

} // namespace lanbeam::transfer
