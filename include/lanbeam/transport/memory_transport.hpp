#pragma once

#include "lanbeam/transport/data_channel.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace lanbeam::transport {

/**
 * @brief In-process data channel endpoint
 *
 * Sends land directly in the peer's inbound reader, so buffered_amount()
 * is always zero. Closing either end closes both.
 */
class MemoryChannel : public DataChannel {
public:
    /**
     * @brief Two connected endpoints, not yet open
     */
    static std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>> make_pair();

    /**
     * @brief Open both endpoints of the pair this one belongs to
     */
    void open_link();

    Result<void> send_text(const std::string& text) override;
    Result<void> send_binary(const std::uint8_t* data, std::size_t size) override;

    [[nodiscard]] std::size_t buffered_amount() const override { return 0; }
    [[nodiscard]] bool is_open() const override;
    bool wait_open(std::chrono::milliseconds timeout) override;
    void close() override;

    AsyncChannelReader<ChannelMessage>& inbound() override { return inbound_; }

    [[nodiscard]] std::uint64_t messages_sent() const noexcept { return messages_sent_.load(); }

private:
    struct Link {
        std::mutex mutex;
        std::condition_variable cv;
        bool open = false;
        bool closed = false;
    };

    explicit MemoryChannel(std::shared_ptr<Link> link);

    Result<void> deliver(ChannelMessage message);

    std::shared_ptr<Link> link_;
    std::weak_ptr<MemoryChannel> peer_;
    AsyncChannelReader<ChannelMessage> inbound_;
    std::atomic<std::uint64_t> messages_sent_{0};
};

/**
 * @brief DirectTransport backed by MemoryChannel pairs
 *
 * Both peers must share one hub. Descriptions are opaque handles
 * ("lanbeam-memory-offer:<n>" / "lanbeam-memory-answer:<n>").
 */
class MemoryTransportHub : public DirectTransport {
public:
    Result<std::unique_ptr<PendingOffer>> create_offer() override;
    Result<AnsweredSession> create_answer(const std::string& offer_description) override;

private:
    class MemoryPendingOffer;

    struct Slot {
        std::shared_ptr<MemoryChannel> offerer;
        std::shared_ptr<MemoryChannel> answerer;
        bool answered = false;
    };

    Result<std::shared_ptr<MemoryChannel>> complete(std::uint64_t id, const std::string& answer_description);

    std::mutex mutex_;
    std::uint64_t next_id_ = 1;
    std::unordered_map<std::uint64_t, Slot> slots_;
};

} // namespace lanbeam::transport
