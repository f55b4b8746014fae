#include "lanbeam/protocol/framing.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanbeam::protocol {

bool is_delimiter(const std::string& text) noexcept {
    return text == kDelimiter;
}

std::vector<Bytes> fragment_payload(const std::string& payload, std::size_t max_fragment) {
    std::vector<Bytes> fragments;
    if (max_fragment == 0) {
        max_fragment = kDefaultBlockSize;
    }
    const auto* data = reinterpret_cast<const std::uint8_t*>(payload.data());
    for (std::size_t offset = 0; offset < payload.size(); offset += max_fragment) {
        const std::size_t length = std::min(max_fragment, payload.size() - offset);
        fragments.emplace_back(data + offset, data + offset + length);
    }
    return fragments;
}

Result<ControlFrame> parse_text_frame(const std::string& text) {
    if (is_delimiter(text)) {
        return Ok(ControlFrame::delimiter());
    }
    try {
        return Ok(ControlFrame::of(json::parse(text)));
    } catch (const json::parse_error& e) {
        return Err<ControlFrame>(ErrorKind::TransportFatal, std::string("malformed control message: ") + e.what());
    }
}

void ControlAssembler::push_fragment(const Bytes& fragment) {
    buffer_.append(reinterpret_cast<const char*>(fragment.data()), fragment.size());
}

Result<ControlFrame> ControlAssembler::finish(const std::string& text) {
    if (buffer_.empty()) {
        return parse_text_frame(text);
    }
    if (!is_delimiter(text)) {
        buffer_.clear();
        return Err<ControlFrame>(ErrorKind::TransportFatal, "text frame interleaved with a fragmented control message");
    }

    std::string payload;
    payload.swap(buffer_);
    try {
        return Ok(ControlFrame::of(json::parse(payload)));
    } catch (const json::parse_error& e) {
        return Err<ControlFrame>(ErrorKind::TransportFatal, std::string("malformed fragmented message: ") + e.what());
    }
}

Result<void> send_message(transport::DataChannel& channel, const json& message) {
    return channel.send_text(message.dump());
}

Result<void> send_block(transport::DataChannel& channel, const json& message, std::size_t max_fragment) {
    const std::string payload = message.dump();
    for (const auto& fragment : fragment_payload(payload, max_fragment)) {
        if (auto sent = channel.send_binary(fragment.data(), fragment.size()); sent.is_error()) {
            return sent;
        }
    }
    spdlog::debug("[Framing] sent block of {} bytes", payload.size());
    return send_delimiter(channel);
}

Result<void> send_delimiter(transport::DataChannel& channel) {
    return channel.send_text(kDelimiter);
}

Result<ControlFrame> read_control(ChannelReader& reader) {
    ControlAssembler assembler;
    auto handle = reader.consume();
    while (auto item = handle.next()) {
        if (transport::is_text(*item)) {
            return assembler.finish(std::get<0>(*item));
        }
        assembler.push_fragment(std::get<1>(*item));
    }
    return Err<ControlFrame>(ErrorKind::TransportFatal, "data channel closed while waiting for a control message");
}

Result<json> read_message(ChannelReader& reader) {
    auto frame = read_control(reader);
    if (frame.is_error()) {
        return Err<json>(frame.error());
    }
    if (frame.value().is_delimiter()) {
        return Err<json>(ErrorKind::TransportFatal, "expected a control message, got a bare delimiter");
    }
    return Ok(std::move(frame.value().message));
}

} // namespace lanbeam::protocol
