#include "lanbeam/protocol/framing.hpp"
#include "lanbeam/protocol/messages.hpp"
#include "lanbeam/session/session.hpp"
#include "lanbeam/transfer/file_source.hpp"
#include "lanbeam/transfer/progress.hpp"
#include "lanbeam/transfer/sender.hpp"
#include "lanbeam/transport/data_channel.hpp"
#include "lanbeam/transport/flow_control.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <vector>

using namespace lanbeam;
using namespace lanbeam::transfer;

namespace {

/**
 * Channel whose send queue empties by a fixed amount each time it is polled.
 * Replies from the "receiver" are queued up front.
 */
class BackloggedChannel : public transport::DataChannel {
public:
    explicit BackloggedChannel(std::size_t drained_per_poll) : drained_per_poll_(drained_per_poll) {}

    Result<void> send_text(const std::string& text) override {
        std::lock_guard lock(mutex_);
        if (!open_) {
            return Err<void>(ErrorKind::TransportFatal, "closed");
        }
        texts.push_back(text);
        return Ok();
    }

    Result<void> send_binary(const std::uint8_t*, std::size_t size) override {
        std::lock_guard lock(mutex_);
        if (!open_) {
            return Err<void>(ErrorKind::TransportFatal, "closed");
        }
        max_backlog_at_send = std::max(max_backlog_at_send, backlog_);
        backlog_ += size;
        binary_sizes.push_back(size);
        return Ok();
    }

    std::size_t buffered_amount() const override {
        std::lock_guard lock(mutex_);
        polls++;
        const std::size_t current = backlog_;
        backlog_ -= std::min(backlog_, drained_per_poll_);
        return current;
    }

    bool is_open() const override {
        std::lock_guard lock(mutex_);
        return open_;
    }

    bool wait_open(std::chrono::milliseconds) override { return is_open(); }

    void close() override {
        {
            std::lock_guard lock(mutex_);
            open_ = false;
        }
        inbound_.close();
    }

    transport::AsyncChannelReader<transport::ChannelMessage>& inbound() override { return inbound_; }

    void reply(const protocol::json& message) {
        inbound_.append(transport::ChannelMessage(std::in_place_index<0>, message.dump()));
    }

    void set_backlog(std::size_t bytes) {
        std::lock_guard lock(mutex_);
        backlog_ = bytes;
    }

    std::vector<std::string> texts;
    std::vector<std::size_t> binary_sizes;
    std::size_t max_backlog_at_send = 0;
    mutable std::size_t polls = 0;

private:
    std::size_t drained_per_poll_;
    mutable std::mutex mutex_;
    mutable std::size_t backlog_ = 0;
    bool open_ = true;
    transport::AsyncChannelReader<transport::ChannelMessage> inbound_;
};

Bytes filled(std::size_t size) {
    return Bytes(size, 0xab);
}

void authenticate(session::TransferSession& session) {
    ASSERT_TRUE(session.transition_to(SessionState::Authenticating).is_ok());
}

} // namespace

TEST(BlockAccumulatorTest, RegroupsReadsIntoFixedBlocks) {
    BlockAccumulator accumulator(1024);
    std::vector<std::size_t> emitted;
    const BlockAccumulator::Emit emit = [&](const std::uint8_t*, std::size_t size) -> Result<void> {
        emitted.push_back(size);
        return Ok();
    };

    const Bytes chunk(700, 1);
    ASSERT_TRUE(accumulator.push(chunk.data(), chunk.size(), emit).is_ok());
    EXPECT_TRUE(emitted.empty());
    ASSERT_TRUE(accumulator.push(chunk.data(), chunk.size(), emit).is_ok());
    ASSERT_TRUE(accumulator.push(chunk.data(), chunk.size(), emit).is_ok());
    EXPECT_EQ(emitted, (std::vector<std::size_t>{1024, 1024}));
    EXPECT_EQ(accumulator.pending(), 2100u - 2048u);

    ASSERT_TRUE(accumulator.flush(emit).is_ok());
    EXPECT_EQ(emitted.back(), 52u);
    EXPECT_EQ(accumulator.pending(), 0u);
}

TEST(BlockAccumulatorTest, LargeReadsEmitWholeBlocksDirectly) {
    BlockAccumulator accumulator(1000);
    std::vector<std::size_t> emitted;
    const BlockAccumulator::Emit emit = [&](const std::uint8_t*, std::size_t size) -> Result<void> {
        emitted.push_back(size);
        return Ok();
    };

    const Bytes big(3500, 2);
    ASSERT_TRUE(accumulator.push(big.data(), big.size(), emit).is_ok());
    EXPECT_EQ(emitted, (std::vector<std::size_t>{1000, 1000, 1000}));
    EXPECT_EQ(accumulator.pending(), 500u);
}

TEST(BlockAccumulatorTest, EmitErrorStopsPush) {
    BlockAccumulator accumulator(10);
    int calls = 0;
    const BlockAccumulator::Emit emit = [&](const std::uint8_t*, std::size_t) -> Result<void> {
        ++calls;
        return Err<void>(ErrorKind::TransportFatal, "closed");
    };
    const Bytes data(50, 0);
    EXPECT_TRUE(accumulator.push(data.data(), data.size(), emit).is_error());
    EXPECT_EQ(calls, 1);
}

TEST(SenderTest, PausesWhileAboveHighWaterMark) {
    BackloggedChannel channel(/*drained_per_poll=*/2048);

    TransferLimits limits;
    limits.block_size = 4096;
    limits.high_water_mark = 8192;
    limits.poll_interval = std::chrono::milliseconds(0);

    std::vector<std::unique_ptr<FileSource>> files;
    files.push_back(MemoryFileSource::from_bytes("big", "big.bin", filled(64 * 1024)));

    channel.reply(protocol::to_json(protocol::SelectionMessage{{{"big", "tok"}}}));
    channel.reply(protocol::to_json(protocol::FileOutcome{"big", true, std::nullopt}));

    session::TransferSession session("send-test", SessionRole::Sender);
    authenticate(session);
    TransferProgress progress(session.session_id());
    auto result = send_files(channel, files, limits, session, progress);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().finished, 1u);
    EXPECT_EQ(result.value().curr, 64u * 1024u);
    EXPECT_LE(channel.max_backlog_at_send, limits.high_water_mark);
    EXPECT_GT(channel.max_backlog_at_send, limits.block_size);
    EXPECT_GT(channel.polls, 16u);

    // The file content itself goes out in whole blocks
    const auto content_blocks = static_cast<std::size_t>(
        std::count(channel.binary_sizes.begin(), channel.binary_sizes.end(), std::size_t{4096}));
    EXPECT_GE(content_blocks, 16u);
    EXPECT_EQ(session.state(), SessionState::Transferring);
}

TEST(SenderTest, WritesHeadersBetweenFilesAndDelimiterAtEnd) {
    BackloggedChannel channel(1 << 20);
    TransferLimits limits;
    limits.block_size = 512;
    limits.poll_interval = std::chrono::milliseconds(0);

    std::vector<std::unique_ptr<FileSource>> files;
    files.push_back(MemoryFileSource::from_bytes("a", "a.txt", filled(600)));
    files.push_back(MemoryFileSource::from_bytes("b", "b.txt", filled(10)));
    files.push_back(MemoryFileSource::from_bytes("c", "c.txt", filled(20)));

    channel.reply(protocol::to_json(protocol::SelectionMessage{{{"a", "ta"}, {"c", "tc"}}}));
    channel.reply(protocol::to_json(protocol::FileOutcome{"a", true, std::nullopt}));
    channel.reply(protocol::to_json(protocol::FileOutcome{"c", false, std::string("sha256 mismatch")}));

    session::TransferSession session("send-test", SessionRole::Sender);
    authenticate(session);
    TransferProgress progress(session.session_id());
    auto result = send_files(channel, files, limits, session, progress);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().finished, 1u);
    EXPECT_EQ(result.value().failed, 1u);
    EXPECT_EQ(result.value().skipped, 1u);
    EXPECT_EQ(result.value().total, 620u);

    // manifest delimiter, header a, header c, transfer delimiter
    ASSERT_EQ(channel.texts.size(), 4u);
    EXPECT_EQ(channel.texts[0], "0");
    EXPECT_EQ(protocol::json::parse(channel.texts[1])["id"], "a");
    EXPECT_EQ(protocol::json::parse(channel.texts[1])["token"], "ta");
    EXPECT_EQ(protocol::json::parse(channel.texts[2])["id"], "c");
    EXPECT_EQ(channel.texts[3], "0");

    auto c = progress.file("c");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->status, FileStatus::Error);
    EXPECT_EQ(c->error.value_or(""), "sha256 mismatch");
    EXPECT_EQ(progress.file("b")->status, FileStatus::Skipped);
}

TEST(SenderTest, EmptySelectionSendsOnlyDelimiter) {
    BackloggedChannel channel(1 << 20);
    TransferLimits limits;

    std::vector<std::unique_ptr<FileSource>> files;
    files.push_back(MemoryFileSource::from_bytes("a", "a.txt", filled(5)));
    channel.reply(protocol::to_json(protocol::SelectionMessage{}));

    session::TransferSession session("send-test", SessionRole::Sender);
    authenticate(session);
    TransferProgress progress(session.session_id());
    auto result = send_files(channel, files, limits, session, progress);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().skipped, 1u);
    EXPECT_EQ(result.value().total, 0u);
    ASSERT_EQ(channel.texts.size(), 2u);
    EXPECT_EQ(channel.texts[1], "0");
}

TEST(SenderTest, SelectionOutsideManifestIsFatal) {
    BackloggedChannel channel(1 << 20);
    std::vector<std::unique_ptr<FileSource>> files;
    files.push_back(MemoryFileSource::from_bytes("a", "a.txt", filled(5)));
    channel.reply(protocol::to_json(protocol::SelectionMessage{{{"a", "t"}, {"zzz", "t"}}}));

    session::TransferSession session("send-test", SessionRole::Sender);
    authenticate(session);
    TransferProgress progress(session.session_id());
    auto result = send_files(channel, files, TransferLimits{}, session, progress);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFatal);
}

TEST(SenderTest, OutcomeForWrongFileIsFatal) {
    BackloggedChannel channel(1 << 20);
    std::vector<std::unique_ptr<FileSource>> files;
    files.push_back(MemoryFileSource::from_bytes("a", "a.txt", filled(5)));
    channel.reply(protocol::to_json(protocol::SelectionMessage{{{"a", "t"}}}));
    channel.reply(protocol::to_json(protocol::FileOutcome{"other", true, std::nullopt}));

    session::TransferSession session("send-test", SessionRole::Sender);
    authenticate(session);
    TransferProgress progress(session.session_id());
    auto result = send_files(channel, files, TransferLimits{}, session, progress);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFatal);
}

TEST(SenderTest, DuplicateIdsAreRejectedBeforeSending) {
    BackloggedChannel channel(1 << 20);
    std::vector<std::unique_ptr<FileSource>> files;
    files.push_back(MemoryFileSource::from_bytes("a", "a.txt", filled(5)));
    files.push_back(MemoryFileSource::from_bytes("a", "b.txt", filled(5)));

    session::TransferSession session("send-test", SessionRole::Sender);
    authenticate(session);
    TransferProgress progress(session.session_id());
    auto result = send_files(channel, files, TransferLimits{}, session, progress);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(channel.texts.empty());
}

TEST(FlowControlTest, ClosedChannelWithBacklogFailsDrain) {
    BackloggedChannel channel(0);
    channel.set_backlog(100);
    channel.close();

    auto result = transport::drain(channel, std::chrono::milliseconds(0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFatal);
}
