#include "lanshare/events/components.hpp"
#include "lanshare/events/event_bus.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lanshare::events;

namespace {

EndpointAttemptEvent attempt(const std::string& host, bool success) {
    EndpointAttemptEvent e;
    e.host = host;
    e.port = 8000;
    e.success = success;
    return e;
}

} // namespace

TEST(EventBus, HistoryRecorderSeesEndpointAttempts) {
    EventBus bus;
    std::vector<std::string> history;

    bus.subscribe<EndpointAttemptEvent>([&](const EndpointAttemptEvent& e) {
        history.push_back(e.host + (e.success ? " ok" : " down"));
    });

    bus.emit(attempt("192.168.1.20", true));
    bus.emit(attempt("192.168.1.21", false));

    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0], "192.168.1.20 ok");
    EXPECT_EQ(history[1], "192.168.1.21 down");
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;
    int retries = 0;
    int rebuilds = 0;

    bus.subscribe<DownloadRetryEvent>([&](const DownloadRetryEvent&) { retries++; });
    bus.subscribe<IndexRebuiltEvent>([&](const IndexRebuiltEvent&) { rebuilds++; });

    bus.emit(DownloadRetryEvent{"docs/a.txt", 1, std::chrono::milliseconds(500), "timeout"});
    bus.emit(IndexRebuiltEvent{"/srv/share", 12, 0, false, std::chrono::milliseconds(3)});
    bus.emit(DownloadRetryEvent{"docs/a.txt", 2, std::chrono::milliseconds(1000), "timeout"});

    EXPECT_EQ(retries, 2);
    EXPECT_EQ(rebuilds, 1);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;
    int count = 0;
    auto id = bus.subscribe<BatchCompletedEvent>([&](const BatchCompletedEvent&) { count++; });

    bus.emit(BatchCompletedEvent{3, 0, std::chrono::milliseconds(10)});
    bus.unsubscribe<BatchCompletedEvent>(id);
    bus.emit(BatchCompletedEvent{3, 0, std::chrono::milliseconds(10)});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<BatchCompletedEvent>(), 0u);
}

TEST(EventBus, EmitWithoutListenersIsHarmless) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(ServerShuttingDownEvent{}));
}

TEST(EventBus, DownloadWorkersEmitConcurrently) {
    EventBus bus;
    std::atomic<uint64_t> bytes{0};

    bus.subscribe<FileDownloadCompletedEvent>([&](const FileDownloadCompletedEvent& e) {
        bytes += e.transferred_bytes;
    });

    std::vector<std::thread> workers;
    for (int i = 0; i < 16; ++i) {
        workers.emplace_back([&bus, i] {
            FileDownloadCompletedEvent e;
            e.remote_path = "file" + std::to_string(i);
            e.transferred_bytes = 100;
            bus.emit(e);
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 1600u);
}

TEST(EventBus, SubscribeFromManyThreads) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            bus.subscribe<ListingFetchedEvent>([&](const ListingFetchedEvent&) { count++; });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bus.emit(ListingFetchedEvent{"10.0.0.5:8000", 3, false, 120});
    EXPECT_EQ(count, 8);
}

TEST(EventBus, Clear) {
    EventBus bus;
    bus.subscribe<DownloadStartedEvent>([](const DownloadStartedEvent&) {});
    bus.subscribe<FileDownloadFailedEvent>([](const FileDownloadFailedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<DownloadStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<FileDownloadFailedEvent>(), 0u);
}

TEST(EventBus, ThrowingListenerDoesNotFailTheTransfer) {
    EventBus bus;
    int count = 0;

    bus.subscribe<FileDownloadFailedEvent>([](const FileDownloadFailedEvent&) {
        throw std::runtime_error("history store unavailable");
    });
    bus.subscribe<FileDownloadFailedEvent>([&](const FileDownloadFailedEvent&) { count++; });

    FileDownloadFailedEvent e;
    e.remote_path = "docs/a.txt";
    e.code = lanshare::ErrorCode::NotFound;
    EXPECT_NO_THROW(bus.emit(e));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, EmitIfIgnoresMissingBus) {
    int count = 0;
    EXPECT_NO_THROW(emit_if(static_cast<EventBus*>(nullptr), attempt("h", true)));

    EventBus bus;
    bus.subscribe<EndpointAttemptEvent>([&](const EndpointAttemptEvent&) { count++; });
    emit_if(&bus, attempt("h", true));
    EXPECT_EQ(count, 1);
}

TEST(Subscriptions, ReleasedOnDestruction) {
    EventBus bus;
    int count = 0;
    {
        Subscriptions subscriptions(bus);
        subscriptions.add<EndpointAttemptEvent>([&](const EndpointAttemptEvent&) { count++; });
        subscriptions.add<BatchCompletedEvent>([&](const BatchCompletedEvent&) { count++; });
        EXPECT_EQ(bus.subscriber_count<EndpointAttemptEvent>(), 1u);

        bus.emit(attempt("h", true));
    }

    EXPECT_EQ(bus.subscriber_count<EndpointAttemptEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<BatchCompletedEvent>(), 0u);
    bus.emit(attempt("h", false));
    EXPECT_EQ(count, 1);
}
