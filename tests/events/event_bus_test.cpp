#include <gtest/gtest.h>
#include "rus/events/event_bus.hpp"
#include "rus/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rus::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::uint64_t received_offset = 0;

    bus.subscribe<ChunkAppendedEvent>([&](const ChunkAppendedEvent& e) {
        handler_called = true;
        received_offset = e.new_offset;
    });

    bus.emit(ChunkAppendedEvent{"abc", 0, 42, 42});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_offset, 42u);
}

TEST(EventBus, DeliversOnlyMatchingEventType) {
    EventBus bus;

    int created = 0;
    int terminated = 0;

    bus.subscribe<UploadCreatedEvent>([&](const UploadCreatedEvent&) { created++; });
    bus.subscribe<UploadTerminatedEvent>([&](const UploadTerminatedEvent&) { terminated++; });

    bus.emit(UploadCreatedEvent{"a", 10, false});
    bus.emit(UploadTerminatedEvent{"a"});
    bus.emit(UploadCreatedEvent{"b", std::nullopt, true});

    EXPECT_EQ(created, 2);
    EXPECT_EQ(terminated, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadExpiredEvent>([&](const UploadExpiredEvent&) { count++; });

    bus.emit(UploadExpiredEvent{"x"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<UploadExpiredEvent>(id);

    bus.emit(UploadExpiredEvent{"y"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(UploadCompletedEvent{"id", 100, std::chrono::milliseconds{5}}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int reached = 0;

    bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent&) {
        throw std::runtime_error("subscriber failure");
    });
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(UploadCompletedEvent{"id", 1, std::chrono::milliseconds{0}}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<ChunkAppendedEvent>([&bytes](const ChunkAppendedEvent& e) {
        bytes += e.bytes_written;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(ChunkAppendedEvent{"id", 0, 2, 2});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 100u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 0u);

    auto first = bus.subscribe<UploadCreatedEvent>([](const UploadCreatedEvent&) {});
    bus.subscribe<UploadCreatedEvent>([](const UploadCreatedEvent&) {});
    bus.subscribe<UploadTerminatedEvent>([](const UploadTerminatedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 2u);

    bus.unsubscribe<UploadCreatedEvent>(first);
    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<UploadCreatedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadTerminatedEvent>(), 0u);
}
