#include "lanbeam/transfer/receiver.hpp"
#include "lanbeam/crypto/identity.hpp"
#include "lanbeam/crypto/token.hpp"
#include "lanbeam/protocol/framing.hpp"
#include "lanbeam/protocol/messages.hpp"
#include "lanbeam/transport/flow_control.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <set>

namespace lanbeam::transfer {
namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

struct IncomingFile {
    const FileDescriptor* descriptor = nullptr;
    std::uint64_t received = 0;
    std::unique_ptr<crypto::Sha256Hasher> hasher;
    std::optional<std::string> error;
};

class ReceiveLoop {
public:
    ReceiveLoop(transport::DataChannel& channel,
                FileSink& sink,
                TransferProgress& progress,
                std::map<std::string, FileDescriptor> selected,
                std::map<std::string, std::string> tokens)
        : channel_(channel),
          sink_(sink),
          progress_(progress),
          selected_(std::move(selected)),
          tokens_(std::move(tokens)) {}

    Result<void> run() {
        auto handle = channel_.inbound().consume();
        while (auto item = handle.next()) {
            if (!transport::is_text(*item)) {
                append(std::get<1>(*item));
                continue;
            }

            const std::string& text = std::get<0>(*item);
            if (auto closed = close_current(); closed.is_error()) {
                return closed;
            }
            if (protocol::is_delimiter(text)) {
                return finish_missing();
            }
            if (auto opened = open_next(text); opened.is_error()) {
                return opened;
            }
        }
        return Err<void>(ErrorKind::TransportFatal, "data channel closed before the end of the transfer");
    }

private:
    Result<void> open_next(const std::string& text) {
        auto frame = protocol::parse_text_frame(text);
        if (frame.is_error()) {
            return Err<void>(frame.error());
        }
        auto header = protocol::parse_file_header(frame.value().message);
        if (header.is_error()) {
            return Err<void>(header.error());
        }

        const std::string& id = header.value().id;
        auto descriptor = selected_.find(id);
        auto token = tokens_.find(id);
        if (descriptor == selected_.end() || token == tokens_.end()) {
            return Err<void>(ErrorKind::TransportFatal, "header for unselected file " + id);
        }
        if (!crypto::constant_time_equals(token->second, header.value().token)) {
            return Err<void>(ErrorKind::TransportFatal, "wrong transfer token for file " + id);
        }
        if (!seen_.insert(id).second) {
            return Err<void>(ErrorKind::TransportFatal, "file " + id + " sent twice");
        }
        if (auto started = progress_.start(id, FileStatus::Receiving); started.is_error()) {
            return started;
        }

        current_ = IncomingFile{};
        current_->descriptor = &descriptor->second;
        if (descriptor->second.sha256) {
            current_->hasher = std::make_unique<crypto::Sha256Hasher>();
        }
        if (auto begun = sink_.begin(descriptor->second); begun.is_error()) {
            current_->error = begun.error().message;
        }
        spdlog::debug("[Receiver] opened file={} size={}", id, descriptor->second.size);
        return Ok();
    }

    void append(const Bytes& block) {
        if (!current_) {
            // Bytes outside a file cannot be attributed; treat as a broken stream
            stray_bytes_ += block.size();
            return;
        }
        if (current_->error) {
            return;
        }

        const std::string& id = current_->descriptor->id;
        current_->received += block.size();
        if (auto counted = progress_.advance(id, block.size()); counted.is_error()) {
            current_->error = counted.error().message;
            return;
        }
        if (auto written = sink_.write(id, block.data(), block.size()); written.is_error()) {
            current_->error = written.error().message;
            return;
        }
        if (current_->hasher) {
            current_->hasher->update(block.data(), block.size());
        }
    }

    Result<void> close_current() {
        if (stray_bytes_ > 0) {
            return Err<void>(ErrorKind::TransportFatal,
                             std::to_string(stray_bytes_) + " bytes arrived outside of any file");
        }
        if (!current_) {
            return Ok();
        }

        IncomingFile file = std::move(*current_);
        current_.reset();
        const FileDescriptor& descriptor = *file.descriptor;

        if (!file.error && file.received != descriptor.size) {
            file.error = "received " + std::to_string(file.received) + " of " + std::to_string(descriptor.size) + " bytes";
        }
        if (!file.error && file.hasher) {
            const std::string actual = file.hasher->finish_hex();
            if (actual != lowercase(*descriptor.sha256)) {
                file.error = "sha256 mismatch";
            }
        }
        if (!file.error) {
            if (auto finished = sink_.finish(descriptor.id); finished.is_error()) {
                file.error = finished.error().message;
            }
        }

        protocol::FileOutcome outcome;
        outcome.id = descriptor.id;
        outcome.success = !file.error;
        if (file.error) {
            sink_.abort(descriptor.id, *file.error);
            progress_.fail(descriptor.id, *file.error);
            outcome.error = file.error;
        } else {
            progress_.finish(descriptor.id);
        }
        return protocol::send_message(channel_, protocol::to_json(outcome));
    }

    // Selected files the sender never delivered
    Result<void> finish_missing() {
        for (const auto& [id, descriptor] : selected_) {
            if (seen_.count(id) == 0) {
                progress_.fail(id, "not delivered by the sender");
            }
        }
        return Ok();
    }

    transport::DataChannel& channel_;
    FileSink& sink_;
    TransferProgress& progress_;
    std::map<std::string, FileDescriptor> selected_;
    std::map<std::string, std::string> tokens_;
    std::set<std::string> seen_;
    std::optional<IncomingFile> current_;
    std::uint64_t stray_bytes_ = 0;
};

} // namespace

std::vector<std::string> accept_all(const std::vector<FileDescriptor>& manifest) {
    std::vector<std::string> ids;
    ids.reserve(manifest.size());
    for (const auto& file : manifest) {
        ids.push_back(file.id);
    }
    return ids;
}

Result<ProgressTotals> receive_files(transport::DataChannel& channel,
                                     FileSink& sink,
                                     const SelectFilesFn& select,
                                     const TransferLimits& limits,
                                     session::TransferSession& session,
                                     TransferProgress& progress) {
    auto message = protocol::read_message(channel.inbound());
    if (message.is_error()) {
        return Err<ProgressTotals>(message.error());
    }
    auto manifest = protocol::parse_manifest(message.value());
    if (manifest.is_error()) {
        return Err<ProgressTotals>(manifest.error());
    }
    if (auto moved = session.transition_to(SessionState::ManifestReceived); moved.is_error()) {
        return Err<ProgressTotals>(moved.error());
    }
    const auto& files = manifest.value().files;
    spdlog::info("[Receiver] session={} manifest received files={}", session.session_id(), files.size());

    const std::vector<std::string> wanted = select ? select(files) : accept_all(files);
    const std::set<std::string> wanted_set(wanted.begin(), wanted.end());

    protocol::SelectionMessage selection;
    std::map<std::string, FileDescriptor> selected;
    std::vector<std::string> skipped;
    for (const auto& file : files) {
        progress.add_file(file);
        if (wanted_set.count(file.id) == 0) {
            skipped.push_back(file.id);
            continue;
        }
        auto token = crypto::generate_file_token();
        if (token.is_error()) {
            return Err<ProgressTotals>(token.error());
        }
        selection.files.emplace(file.id, std::move(token.value()));
        selected.emplace(file.id, file);
    }
    progress.mark_skipped(skipped);

    if (auto sent = protocol::send_block(channel, protocol::to_json(selection), limits.block_size); sent.is_error()) {
        return Err<ProgressTotals>(sent.error());
    }
    if (auto moved = session.transition_to(SessionState::Transferring); moved.is_error()) {
        return Err<ProgressTotals>(moved.error());
    }
    spdlog::info("[Receiver] session={} selected={} skipped={}", session.session_id(), selected.size(), skipped.size());

    ReceiveLoop loop(channel, sink, progress, std::move(selected), selection.files);
    if (auto received = loop.run(); received.is_error()) {
        return Err<ProgressTotals>(received.error());
    }

    if (auto drained = transport::drain(channel, limits.poll_interval); drained.is_error()) {
        return Err<ProgressTotals>(drained.error());
    }
    return Ok(progress.totals());
}

} // namespace lanbeam::transfer
