/**
 * @file components.hpp
 * @brief Ready-made subscribers for transfer events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * TransferOrchestrator orchestrator(executor, config, scripts, packager, &bus);
 */

#pragma once

#include "rft/events/event_bus.hpp"
#include "rft/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace rft::events {

/**
 * @brief Logger component - logs transfer events with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        });

        bus_.subscribe<ItemSkippedEvent>([this](const ItemSkippedEvent& e) {
            on_item_skipped(e);
        });

        bus_.subscribe<ItemUploadedEvent>([this](const ItemUploadedEvent& e) {
            on_item_uploaded(e);
        });

        bus_.subscribe<PhaseCompletedEvent>([this](const PhaseCompletedEvent& e) {
            on_phase_completed(e);
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });
    }

private:
    void on_transfer_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] items={} destination={}", e.item_count, e.destination);
    }

    void on_item_skipped(const ItemSkippedEvent& e) {
        spdlog::debug("[ItemSkipped] hash={} src={} dst={}", e.content_hash, e.source, e.destination);
    }

    void on_item_uploaded(const ItemUploadedEvent& e) {
        spdlog::info("[ItemUploaded] hash={} src={} tmpfile={} chunks={} bytes={}",
                     e.content_hash, e.source, e.remote_temp_path, e.chunk_count, e.bytes_transferred);
    }

    void on_phase_completed(const PhaseCompletedEvent& e) {
        spdlog::debug("[PhaseCompleted] phase={} duration={}ms", e.phase, e.duration.count());
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] items={} uploaded={} bytes={} duration={}ms",
                     e.item_count, e.items_uploaded, e.total_bytes, e.duration.count());
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        spdlog::error("[TransferFailed] kind={} message={}", error_kind_name(e.kind), e.message);
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - tracks transfer statistics
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Items uploaded: {}", stats.items_uploaded.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> items_skipped{0};
        std::atomic<uint64_t> items_uploaded{0};
        std::atomic<uint64_t> chunks_written{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent&) {
            stats_.transfers_completed++;
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        });

        bus_.subscribe<ItemSkippedEvent>([this](const ItemSkippedEvent&) {
            stats_.items_skipped++;
        });

        bus_.subscribe<ChunkWrittenEvent>([this](const ChunkWrittenEvent&) {
            stats_.chunks_written++;
        });

        bus_.subscribe<ItemUploadedEvent>([this](const ItemUploadedEvent& e) {
            on_item_uploaded(e);
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Transfers started:   {}", stats_.transfers_started.load());
        spdlog::info("  Transfers completed: {}", stats_.transfers_completed.load());
        spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
        spdlog::info("  Items skipped:       {}", stats_.items_skipped.load());
        spdlog::info("  Items uploaded:      {}", stats_.items_uploaded.load());
        spdlog::info("  Chunks written:      {}", stats_.chunks_written.load());
        spdlog::info("  Bytes uploaded:      {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_item_uploaded(const ItemUploadedEvent& e) {
        stats_.items_uploaded++;
        stats_.bytes_uploaded += e.bytes_transferred;
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace rft::events
