#include "lanbeam/transport/channel_reader.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

using lanbeam::transport::AsyncChannelReader;

TEST(AsyncChannelReaderTest, ReleasedHandleKeepsRemainingItems) {
    AsyncChannelReader<int> reader;
    reader.append(1);
    reader.append(2);
    reader.append(3);

    {
        auto handle = reader.consume();
        auto first = handle.next();
        auto second = handle.next();
        ASSERT_TRUE(first && second);
        EXPECT_EQ(*first, 1);
        EXPECT_EQ(*second, 2);
    }

    auto rest = reader.read_next();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(*rest, 3);
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(AsyncChannelReaderTest, SecondActiveHandleIsAProgrammingError) {
    AsyncChannelReader<int> reader;
    auto handle = reader.consume();
    EXPECT_THROW(reader.consume(), std::logic_error);

    handle.release();
    EXPECT_FALSE(handle.active());
    EXPECT_NO_THROW(reader.consume());
}

TEST(AsyncChannelReaderTest, MovedHandleStaysTheOnlyConsumer) {
    AsyncChannelReader<int> reader;
    reader.append(7);

    auto original = reader.consume();
    auto moved = std::move(original);
    EXPECT_FALSE(original.active());
    EXPECT_THROW(reader.consume(), std::logic_error);

    auto value = moved.next();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 7);
}

TEST(AsyncChannelReaderTest, CloseWakesBlockedReader) {
    AsyncChannelReader<int> reader;
    std::optional<int> result = 42;

    std::thread consumer([&]() {
        result = reader.read_next();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    reader.close();
    consumer.join();

    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(reader.closed());
}

TEST(AsyncChannelReaderTest, BufferedItemsSurviveClose) {
    AsyncChannelReader<int> reader;
    reader.append(5);
    reader.close();
    reader.append(6);

    auto handle = reader.consume();
    auto first = handle.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 5);
    EXPECT_FALSE(handle.next().has_value());
}

TEST(AsyncChannelReaderTest, AppendFromAnotherThreadWakesReader) {
    AsyncChannelReader<std::string> reader;

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        reader.append("hello");
    });

    auto value = reader.read_next();
    producer.join();

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "hello");
}

TEST(AsyncChannelReaderTest, NextForTimesOut) {
    AsyncChannelReader<int> reader;
    auto value = reader.read_next_for(std::chrono::milliseconds(5));
    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(reader.closed());
}
