/**
 * @file events.hpp
 * @brief Upload lifecycle and server events
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadStartedEvent, SessionEvictedEvent
 */

#pragma once

#include "guestdrop/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace guestdrop::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief A guest opened an upload session
 *
 * WHO EMITS: UploadService::start
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct UploadStartedEvent {
    std::string upload_id;
    std::string owner;
    std::string filename;
    uint32_t total_chunks = 0;
};

/**
 * @brief A chunk was persisted to the chunk store
 */
struct ChunkStoredEvent {
    std::string upload_id;
    uint32_t chunk_index = 0;
    uint32_t received = 0;
    uint32_t total_chunks = 0;
    uint64_t bytes = 0;
};

/**
 * @brief The final file was assembled and is ready for the gallery
 */
struct UploadCompletedEvent {
    std::string upload_id;
    std::string owner;
    std::string relative_path;
    uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief A session ended in a terminal failure and was purged
 *
 * Only terminal outcomes are reported; IncompleteUpload keeps the session
 * open and is not an event.
 */
struct UploadFailedEvent {
    std::string upload_id;
    ErrorKind kind = ErrorKind::StorageIO;
    std::string reason;
};

/**
 * @brief The reaper dropped an idle session and its chunks
 */
struct SessionEvictedEvent {
    std::string upload_id;
    std::string owner;
    std::string filename;
    uint32_t received = 0;
    uint32_t total_chunks = 0;
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::string address;
    uint16_t port = 0;
    std::string upload_root;
};

struct ServerShuttingDownEvent {
    std::string reason;
};

} // namespace guestdrop::events
