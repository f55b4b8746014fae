#pragma once

/**
 * @file data_channel.hpp
 * @brief Direct-transport capability consumed by the session stack
 *
 * ICE/DTLS negotiation is not implemented here. An implementation only has to
 * turn an exchanged pair of session descriptions into an ordered, lossless
 * message channel that carries text and binary messages.
 */

#include "lanbeam/core/result.hpp"
#include "lanbeam/core/types.hpp"
#include "lanbeam/transport/channel_reader.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace lanbeam::transport {

/**
 * @brief One inbound or outbound message: text (index 0) or binary (index 1)
 */
using ChannelMessage = std::variant<std::string, Bytes>;

inline bool is_text(const ChannelMessage& message) noexcept {
    return message.index() == 0;
}

class DataChannel {
public:
    virtual ~DataChannel() = default;

    virtual Result<void> send_text(const std::string& text) = 0;
    virtual Result<void> send_binary(const std::uint8_t* data, std::size_t size) = 0;

    /**
     * @brief Bytes queued locally but not yet handed to the network
     */
    [[nodiscard]] virtual std::size_t buffered_amount() const = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /**
     * @brief Block until the channel opens; false on timeout or if it closed first
     */
    virtual bool wait_open(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Close both directions; suspended readers observe end-of-stream
     */
    virtual void close() = 0;

    /**
     * @brief Everything the remote sent, in order
     */
    virtual AsyncChannelReader<ChannelMessage>& inbound() = 0;
};

/**
 * @brief Offer created locally, waiting for the remote answer
 */
class PendingOffer {
public:
    virtual ~PendingOffer() = default;

    [[nodiscard]] virtual const std::string& local_description() const = 0;

    virtual Result<std::shared_ptr<DataChannel>> accept_answer(const std::string& answer_description) = 0;
};

struct AnsweredSession {
    std::string local_description;
    std::shared_ptr<DataChannel> channel;
};

class DirectTransport {
public:
    virtual ~DirectTransport() = default;

    virtual Result<std::unique_ptr<PendingOffer>> create_offer() = 0;

    virtual Result<AnsweredSession> create_answer(const std::string& offer_description) = 0;
};

} // namespace lanbeam::transport
