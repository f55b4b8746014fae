#include <gtest/gtest.h>
#include "lanbeam/events/components.hpp"
#include "lanbeam/events/event_bus.hpp"
#include "lanbeam/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lanbeam::events;

TEST(EventBus, DeliversProgressToSubscriber) {
    EventBus bus;

    std::uint64_t seen_bytes = 0;
    std::string seen_file;

    bus.subscribe<FileProgressEvent>([&](const FileProgressEvent& e) {
        seen_bytes = e.bytes_transferred;
        seen_file = e.file_id;
    });

    bus.emit(FileProgressEvent{"s1", "f1", 16384, 40000});

    EXPECT_EQ(seen_bytes, 16384u);
    EXPECT_EQ(seen_file, "f1");
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int joined = 0;
    int left = 0;

    bus.subscribe<PeerJoinedEvent>([&](const PeerJoinedEvent&) { joined++; });
    bus.subscribe<PeerLeftEvent>([&](const PeerLeftEvent&) { left++; });

    bus.emit(PeerJoinedEvent{});
    bus.emit(PeerLeftEvent{"p1"});
    bus.emit(PeerJoinedEvent{});

    EXPECT_EQ(joined, 2);
    EXPECT_EQ(left, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<PeerLeftEvent>([&](const PeerLeftEvent&) { count++; });

    bus.emit(PeerLeftEvent{"p1"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<PeerLeftEvent>(id);

    bus.emit(PeerLeftEvent{"p2"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;

    int count = 0;
    std::size_t id = 0;
    id = bus.subscribe<PeerLeftEvent>([&](const PeerLeftEvent&) {
        count++;
        bus.unsubscribe<PeerLeftEvent>(id);
    });

    bus.emit(PeerLeftEvent{"p1"});
    bus.emit(PeerLeftEvent{"p2"});
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<PeerLeftEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<FileFailedEvent>([](const FileFailedEvent&) {
        throw std::runtime_error("renderer crashed");
    });
    bus.subscribe<FileFailedEvent>([&](const FileFailedEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(FileFailedEvent{"s1", "f1", "size mismatch"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ConcurrentEmitFromSessionThreads) {
    EventBus bus;
    std::atomic<std::uint64_t> total{0};

    bus.subscribe<FileProgressEvent>([&total](const FileProgressEvent& e) {
        total += e.bytes_transferred;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(FileProgressEvent{"s", "f", 2, 2});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total.load(), 100u);
}

TEST(EventBus, LoggerComponentUnsubscribesOnDestruction) {
    EventBus bus;

    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<SessionAbortedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<RosterResetEvent>(), 1u);
        bus.emit(SessionAbortedEvent{"s1", lanbeam::SessionRole::Sender,
                                     lanbeam::Error{lanbeam::ErrorKind::UserDeclined, "pin cancelled"}});
    }

    EXPECT_EQ(bus.subscriber_count<SessionAbortedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<RosterResetEvent>(), 0u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<PeerLeftEvent>([](const PeerLeftEvent&) {});
    bus.subscribe<RelayErrorEvent>([](const RelayErrorEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<PeerLeftEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<RelayErrorEvent>(), 0u);
}
