#include <gtest/gtest.h>
#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include <utility>

using namespace vidup::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::uint64_t received_offset = 0;

    bus.subscribe<UploadProgressEvent>([&](const UploadProgressEvent& e) {
        handler_called = true;
        received_offset = e.offset;
    });

    UploadProgressEvent event;
    event.session_id = "abc";
    event.offset = 42;
    event.total_size = 100;
    bus.emit(event);

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_offset, 42u);
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { count++; });
    bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { count++; });
    bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { count++; });

    bus.emit(UploadStartedEvent{"abc", "clip.mp4", 10});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int progress_count = 0;
    int completed_count = 0;

    bus.subscribe<UploadProgressEvent>([&](const UploadProgressEvent&) { progress_count++; });
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { completed_count++; });

    bus.emit(UploadProgressEvent{});
    bus.emit(UploadCompletedEvent{});
    bus.emit(UploadProgressEvent{});

    EXPECT_EQ(progress_count, 2);
    EXPECT_EQ(completed_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadProgressEvent>([&](const UploadProgressEvent&) { count++; });

    bus.emit(UploadProgressEvent{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<UploadProgressEvent>(id);

    bus.emit(UploadProgressEvent{});
    EXPECT_EQ(count, 1);  // Still 1, handler was removed
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(UploadFailedEvent{}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<UploadProgressEvent>([](const UploadProgressEvent&) {
        throw std::runtime_error("progress bar crashed");
    });
    bus.subscribe<UploadProgressEvent>([&](const UploadProgressEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(UploadProgressEvent{}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMaySubscribeWhileEmitting) {
    EventBus bus;

    int late_count = 0;
    bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) {
        bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { late_count++; });
    });

    bus.emit(UploadStartedEvent{"abc", "clip.mp4", 10});
    bus.emit(UploadCompletedEvent{});

    EXPECT_EQ(late_count, 1);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<ChunkAcknowledgedEvent>([&count](const ChunkAcknowledgedEvent&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    bus.emit(ChunkAcknowledgedEvent{});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<ChunkAcknowledgedEvent>([&bytes](const ChunkAcknowledgedEvent& e) {
        bytes += e.length;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            ChunkAcknowledgedEvent event;
            event.length = 1;
            bus.emit(event);
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 100u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 0u);

    auto id1 = bus.subscribe<UploadProgressEvent>([](const UploadProgressEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 1u);

    bus.subscribe<UploadProgressEvent>([](const UploadProgressEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 2u);

    bus.unsubscribe<UploadProgressEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<UploadProgressEvent>([](const UploadProgressEvent&) {});
    bus.subscribe<UploadFailedEvent>([](const UploadFailedEvent&) {});

    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 1u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 0u);
}

TEST(EventBus, ScopedSubscriptionEndsWithHandle) {
    EventBus bus;
    int count = 0;

    {
        auto subscription = bus.subscribe_scoped<UploadProgressEvent>(
            [&](const UploadProgressEvent&) { count++; });
        EXPECT_TRUE(subscription.active());
        bus.emit(UploadProgressEvent{});

        Subscription moved = std::move(subscription);
        EXPECT_FALSE(subscription.active());
        EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 1u);
        bus.emit(UploadProgressEvent{});
    }

    bus.emit(UploadProgressEvent{});
    EXPECT_EQ(count, 2);
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 0u);
}

TEST(EventBus, ScopedSubscriptionResetIsIdempotent) {
    EventBus bus;
    auto subscription = bus.subscribe_scoped<UploadFailedEvent>([](const UploadFailedEvent&) {});

    subscription.reset();
    subscription.reset();

    EXPECT_FALSE(subscription.active());
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 0u);
}
