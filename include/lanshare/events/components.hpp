/**
 * @file components.hpp
 * @brief Event-driven logging and metrics for the share server and client
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * ShareClient client(options, &bus);
 * // Transfers are now logged and counted
 */

#pragma once

#include "lanshare/events/event_bus.hpp"
#include "lanshare/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <functional>
#include <vector>

namespace lanshare::events {

/**
 * @brief Keeps a component's subscriptions and drops them on destruction
 */
class Subscriptions {
public:
    explicit Subscriptions(EventBus& bus) : bus_(bus) {}

    ~Subscriptions() {
        for (auto& release : releases_) {
            release();
        }
    }

    Subscriptions(const Subscriptions&) = delete;
    Subscriptions& operator=(const Subscriptions&) = delete;

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        size_t id = bus_.subscribe<EventType>(std::move(handler));
        EventBus* bus = &bus_;
        releases_.push_back([bus, id]() { bus->unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

/**
 * @brief Logger component - logs server and transfer events
 *
 * Per-chunk activity is never logged; retries are warnings, failures errors.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Sharing {} on {}:{}", e.root, e.address, e.port);
            spdlog::info("════════════════════════════════════════════");
        });
        subscriptions_.add<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("Server shutting down: {}", e.reason);
        });
        subscriptions_.add<IndexRebuiltEvent>([](const IndexRebuiltEvent& e) {
            spdlog::info("[IndexRebuilt] root={} entries={} skipped={} fallback={} duration={}ms",
                         e.root, e.entry_count, e.skipped, e.used_fallback_walk, e.duration.count());
        });
        subscriptions_.add<ListingFetchedEvent>([](const ListingFetchedEvent& e) {
            spdlog::info("[ListingFetched] endpoint={} entries={} gzip={} bytes={}",
                         e.endpoint, e.entry_count, e.compressed, e.body_bytes);
        });
        subscriptions_.add<EndpointAttemptEvent>([](const EndpointAttemptEvent& e) {
            if (!e.success) {
                spdlog::warn("[EndpointFailed] {}:{} {}", e.host, e.port, e.error);
            }
        });
        subscriptions_.add<DownloadStartedEvent>([](const DownloadStartedEvent& e) {
            spdlog::debug("[DownloadStarted] path={} dest={} resume_from={}",
                          e.remote_path, e.local_path, e.resume_offset);
        });
        subscriptions_.add<DownloadRetryEvent>([](const DownloadRetryEvent& e) {
            spdlog::warn("[DownloadRetry] path={} attempt={} delay={}ms reason={}",
                         e.remote_path, e.attempt, e.delay.count(), e.reason);
        });
        subscriptions_.add<FileDownloadCompletedEvent>([](const FileDownloadCompletedEvent& e) {
            spdlog::info("[DownloadCompleted] path={} bytes={} transferred={} up_to_date={} duration={}ms",
                         e.remote_path, e.total_bytes, e.transferred_bytes,
                         e.already_up_to_date, e.duration.count());
        });
        subscriptions_.add<FileDownloadFailedEvent>([](const FileDownloadFailedEvent& e) {
            spdlog::error("[DownloadFailed] path={} code={} message={}",
                          e.remote_path, error_code_name(e.code), e.message);
        });
        subscriptions_.add<BatchCompletedEvent>([](const BatchCompletedEvent& e) {
            spdlog::info("[BatchCompleted] succeeded={} failed={} duration={}ms",
                         e.succeeded, e.failed, e.duration.count());
        });
    }

private:
    Subscriptions subscriptions_;
};

/**
 * @brief Metrics component - counts transfers and index work
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("Downloaded {} files", stats.files_downloaded.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> index_rebuilds{0};
        std::atomic<uint64_t> entries_skipped{0};
        std::atomic<uint64_t> listings_fetched{0};
        std::atomic<uint64_t> endpoint_failures{0};
        std::atomic<uint64_t> files_downloaded{0};
        std::atomic<uint64_t> files_up_to_date{0};
        std::atomic<uint64_t> bytes_downloaded{0};
        std::atomic<uint64_t> download_retries{0};
        std::atomic<uint64_t> download_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<IndexRebuiltEvent>([this](const IndexRebuiltEvent& e) {
            stats_.index_rebuilds++;
            stats_.entries_skipped += e.skipped;
        });
        subscriptions_.add<ListingFetchedEvent>([this](const ListingFetchedEvent&) {
            stats_.listings_fetched++;
        });
        subscriptions_.add<EndpointAttemptEvent>([this](const EndpointAttemptEvent& e) {
            if (!e.success) {
                stats_.endpoint_failures++;
            }
        });
        subscriptions_.add<FileDownloadCompletedEvent>([this](const FileDownloadCompletedEvent& e) {
            stats_.files_downloaded++;
            stats_.bytes_downloaded += e.transferred_bytes;
            if (e.already_up_to_date) {
                stats_.files_up_to_date++;
            }
        });
        subscriptions_.add<DownloadRetryEvent>([this](const DownloadRetryEvent&) {
            stats_.download_retries++;
        });
        subscriptions_.add<FileDownloadFailedEvent>([this](const FileDownloadFailedEvent&) {
            stats_.download_failures++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Index rebuilds:    {}", stats_.index_rebuilds.load());
        spdlog::info("  Entries skipped:   {}", stats_.entries_skipped.load());
        spdlog::info("  Listings fetched:  {}", stats_.listings_fetched.load());
        spdlog::info("  Endpoint failures: {}", stats_.endpoint_failures.load());
        spdlog::info("  Files downloaded:  {}", stats_.files_downloaded.load());
        spdlog::info("  Already current:   {}", stats_.files_up_to_date.load());
        spdlog::info("  Bytes downloaded:  {}", stats_.bytes_downloaded.load());
        spdlog::info("  Retries:           {}", stats_.download_retries.load());
        spdlog::info("  Failures:          {}", stats_.download_failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    Subscriptions subscriptions_;   // Declared last: released before stats_
};

} // namespace lanshare::events
