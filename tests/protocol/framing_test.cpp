#include "lanbeam/protocol/framing.hpp"
#include "lanbeam/transport/memory_transport.hpp"

#include <gtest/gtest.h>

using namespace lanbeam;
using namespace lanbeam::protocol;
using lanbeam::transport::MemoryChannel;

namespace {

struct OpenPair {
    std::shared_ptr<MemoryChannel> a;
    std::shared_ptr<MemoryChannel> b;
};

OpenPair open_pair() {
    auto [a, b] = MemoryChannel::make_pair();
    a->open_link();
    return {a, b};
}

} // namespace

TEST(FramingTest, FragmentsNeverExceedBlockSize) {
    const std::string payload(40000, 'x');
    auto fragments = fragment_payload(payload, 16384);
    ASSERT_EQ(fragments.size(), 3u);
    EXPECT_EQ(fragments[0].size(), 16384u);
    EXPECT_EQ(fragments[1].size(), 16384u);
    EXPECT_EQ(fragments[2].size(), 40000u - 2 * 16384u);

    EXPECT_TRUE(fragment_payload("", 16384).empty());
}

TEST(FramingTest, DelimiterIsNeverParsedAsJson) {
    auto frame = parse_text_frame("0");
    ASSERT_TRUE(frame.is_ok());
    EXPECT_TRUE(frame.value().is_delimiter());

    auto number = parse_text_frame("00");
    ASSERT_TRUE(number.is_error());

    auto message = parse_text_frame(R"({"id":"a"})");
    ASSERT_TRUE(message.is_ok());
    EXPECT_FALSE(message.value().is_delimiter());
    EXPECT_EQ(message.value().message["id"], "a");
}

TEST(FramingTest, ShortAndFragmentedMessagesReadBack) {
    auto pair = open_pair();

    json big;
    big["files"] = json::array();
    for (int i = 0; i < 200; ++i) {
        big["files"].push_back({{"id", std::to_string(i)}, {"fileName", std::string(100, 'n')}, {"size", i}});
    }

    ASSERT_TRUE(send_message(*pair.a, json{{"nonce", "abc"}}).is_ok());
    ASSERT_TRUE(send_block(*pair.a, big, 1024).is_ok());

    auto first = read_message(pair.b->inbound());
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value()["nonce"], "abc");

    // 200 entries of >100 bytes each cannot fit in one 1 KiB fragment
    EXPECT_GT(pair.b->inbound().buffered(), 2u);

    auto second = read_message(pair.b->inbound());
    ASSERT_TRUE(second.is_ok()) << second.error().message;
    EXPECT_EQ(second.value(), big);
    EXPECT_EQ(pair.b->inbound().buffered(), 0u);
}

TEST(FramingTest, MultiByteCharactersSurviveFragmentBoundaries) {
    // Three-byte UTF-8 sequences; every fragment size below splits at least one of them
    const std::string name = "\xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e-\xe2\x82\xac.txt";
    const json message{{"id", "u"}, {"fileName", name}};

    for (std::size_t fragment = 1; fragment <= 12; ++fragment) {
        auto pair = open_pair();
        ASSERT_TRUE(send_block(*pair.a, message, fragment).is_ok());

        auto read = read_message(pair.b->inbound());
        ASSERT_TRUE(read.is_ok()) << "fragment=" << fragment << ": " << read.error().message;
        EXPECT_EQ(read.value()["fileName"].get<std::string>(), name) << "fragment=" << fragment;
    }
}

TEST(FramingTest, TextInsideFragmentedBlockIsFatal) {
    ControlAssembler assembler;
    assembler.push_fragment(Bytes{'{', '"', 'a'});
    auto frame = assembler.finish(R"({"id":"x"})");
    ASSERT_TRUE(frame.is_error());
    EXPECT_EQ(frame.error().kind, ErrorKind::TransportFatal);
    EXPECT_EQ(assembler.buffered_bytes(), 0u);
}

TEST(FramingTest, BareDelimiterIsNotAMessage) {
    auto pair = open_pair();
    ASSERT_TRUE(send_delimiter(*pair.a).is_ok());

    auto result = read_message(pair.b->inbound());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFatal);
}

TEST(FramingTest, ClosedChannelFailsRead) {
    auto pair = open_pair();
    const Bytes partial{'{'};
    ASSERT_TRUE(pair.a->send_binary(partial.data(), partial.size()).is_ok());
    pair.a->close();

    auto result = read_control(pair.b->inbound());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportFatal);
}
