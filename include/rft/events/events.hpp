/**
 * @file events.hpp
 * @brief Event types published by TransferOrchestrator
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ItemUploadedEvent, TransferFailedEvent
 *
 * All events are emitted synchronously on the thread running upload().
 */

#pragma once

#include "rft/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace rft::events {

// ════════════════════════════════════════════════════════
// Transfer lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the manifest is built, before the session opens
 */
struct TransferStartedEvent {
    std::size_t item_count = 0;
    std::string destination;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when upload() returns successfully
 */
struct TransferCompletedEvent {
    std::size_t item_count = 0;
    std::size_t items_uploaded = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when upload() fails, after cleanup has been scheduled
 */
struct TransferFailedEvent {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after each of dirty_check, stream_files and decode
 */
struct PhaseCompletedEvent {
    std::string phase;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Per-item events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted for items the remote side already holds
 */
struct ItemSkippedEvent {
    std::string content_hash;
    std::string source;
    std::string destination;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkWrittenEvent {
    std::string content_hash;
    std::string source;
    std::uint64_t bytes_so_far = 0;  ///< Encoded bytes of this item sent so far
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ItemUploadedEvent {
    std::string content_hash;
    std::string source;
    std::string remote_temp_path;
    std::uint64_t chunk_count = 0;
    std::uint64_t bytes_transferred = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace rft::events
