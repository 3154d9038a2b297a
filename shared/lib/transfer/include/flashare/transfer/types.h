/**
 * @file types.h
 * @brief Common types for the Flashare transfer library
 *
 * Configuration, per-item outcomes and batch summaries shared by
 * PathResolver, CompressionStream and TransferService.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace flashare::transfer {

/// @brief Default bound on bytes read per streamed I/O step (64 KiB)
constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

/// @brief Default zstd compression level
constexpr int DEFAULT_COMPRESSION_LEVEL = 3;

/// @brief Default number of worker threads used to fan out a batch
constexpr int DEFAULT_BATCH_WORKERS = 4;

/**
 * @brief Transfer engine configuration
 *
 * Built once at startup and passed by const reference to the components.
 */
struct TransferConfig {
    std::filesystem::path storageRoot;            ///< Directory holding all managed files
    std::size_t chunkSize = DEFAULT_CHUNK_SIZE;   ///< Bytes per streamed I/O step
    int compressionLevel = DEFAULT_COMPRESSION_LEVEL;
    int batchWorkers = DEFAULT_BATCH_WORKERS;     ///< Max concurrent items per batch
};

/// @brief File category inferred from the extension
enum class FileCategory {
    IMAGE,
    VIDEO,
    AUDIO,
    DOCUMENT,
    FILE  ///< Fallback for unknown or missing extensions
};

/// @brief A file stored directly under the storage root
struct StoredFile {
    std::string name;
    std::uint64_t size = 0;
    double modified = 0.0;  ///< Seconds since the Unix epoch, sub-second precision
    FileCategory category = FileCategory::FILE;
};

/// @brief Result of a single upload attempt
struct UploadOutcome {
    bool success = false;
    std::string filename;   ///< Final stored name on success, sanitized request name otherwise
    std::uint64_t size = 0;
    FileCategory category = FileCategory::FILE;
    std::string error;      ///< Empty on success
};

/// @brief Aggregate over a batch of uploads or deletes
struct BatchSummary {
    std::size_t total = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::uint64_t totalSize = 0;  ///< Bytes of successful items only

    [[nodiscard]] bool allSucceeded() const noexcept { return failed == 0; }
};

/// @brief Terminal state of a delete request
enum class DeleteStatus {
    DELETED,
    NOT_FOUND,
    DENIED,
    BAD_REQUEST,  ///< Empty name, or the target is not a regular file
    FAILED        ///< Resolved and present, but the unlink itself failed
};

/// @brief Result of a single delete request
struct DeleteOutcome {
    std::string filename;  ///< Name as requested
    DeleteStatus status = DeleteStatus::FAILED;
    std::string error;     ///< Empty when deleted

    [[nodiscard]] bool success() const noexcept { return status == DeleteStatus::DELETED; }
};

/// @brief Per-file outcomes plus their summary
struct UploadBatchResult {
    bool success = false;
    std::vector<UploadOutcome> files;
    BatchSummary summary;
};

/// @brief Per-name outcomes plus their summary
struct DeleteBatchResult {
    bool success = false;
    std::vector<DeleteOutcome> results;
    BatchSummary summary;
};

/// @brief Storage root statistics for the status endpoint
struct StorageStatus {
    std::size_t fileCount = 0;
    std::uint64_t totalSize = 0;
};

/// @brief Convert DeleteStatus to string
inline std::string deleteStatusToString(DeleteStatus s) {
    switch (s) {
        case DeleteStatus::DELETED:     return "DELETED";
        case DeleteStatus::NOT_FOUND:   return "NOT_FOUND";
        case DeleteStatus::DENIED:      return "DENIED";
        case DeleteStatus::BAD_REQUEST: return "BAD_REQUEST";
        case DeleteStatus::FAILED:      return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace flashare::transfer
