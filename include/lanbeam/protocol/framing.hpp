#pragma once

/**
 * @file framing.hpp
 * @brief Control/binary multiplexing over one ordered data channel
 *
 * WIRE RULES:
 * - Short control messages travel as one text frame holding JSON.
 * - Long control messages (manifest, selection) travel as binary fragments of
 *   at most one block, terminated by the delimiter text frame "0".
 * - File content travels as binary frames; headers between files are text.
 * - "0" is checked before any JSON parsing; it is never parsed as JSON.
 */

#include "lanbeam/core/config.hpp"
#include "lanbeam/core/result.hpp"
#include "lanbeam/transport/data_channel.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lanbeam::protocol {

using json = nlohmann::json;
using ChannelReader = transport::AsyncChannelReader<transport::ChannelMessage>;

inline constexpr const char* kDelimiter = "0";

[[nodiscard]] bool is_delimiter(const std::string& text) noexcept;

/**
 * @brief UTF-8 payload cut into fragments of at most `max_fragment` bytes
 */
std::vector<Bytes> fragment_payload(const std::string& payload, std::size_t max_fragment = kDefaultBlockSize);

/**
 * @brief A text frame is either the delimiter or a JSON control message
 */
struct ControlFrame {
    enum class Kind {
        Message,
        Delimiter
    };

    Kind kind = Kind::Delimiter;
    json message;

    static ControlFrame delimiter() { return ControlFrame{}; }
    static ControlFrame of(json value) { return ControlFrame{Kind::Message, std::move(value)}; }

    [[nodiscard]] bool is_delimiter() const noexcept { return kind == Kind::Delimiter; }
};

Result<ControlFrame> parse_text_frame(const std::string& text);

/**
 * @brief Collects binary fragments until the closing delimiter
 */
class ControlAssembler {
public:
    void push_fragment(const Bytes& fragment);

    /**
     * @brief Close the block on a text frame
     *
     * With fragments buffered, the text must be the delimiter and the fragments
     * form the message. Without fragments, the text frame itself is parsed.
     */
    Result<ControlFrame> finish(const std::string& text);

    [[nodiscard]] std::size_t buffered_bytes() const noexcept { return buffer_.size(); }

private:
    std::string buffer_;
};

Result<void> send_message(transport::DataChannel& channel, const json& message);

/**
 * @brief Send a long control message as fragments followed by the delimiter
 */
Result<void> send_block(transport::DataChannel& channel,
                        const json& message,
                        std::size_t max_fragment = kDefaultBlockSize);

Result<void> send_delimiter(transport::DataChannel& channel);

/**
 * @brief Pull one logical control frame (short or fragmented)
 *
 * Fails with TransportFatal if the channel closes first or the framing is broken.
 */
Result<ControlFrame> read_control(ChannelReader& reader);

/**
 * @brief read_control() that insists on a JSON message (no bare delimiter)
 */
Result<json> read_message(ChannelReader& reader);

} // namespace lanbeam::protocol
