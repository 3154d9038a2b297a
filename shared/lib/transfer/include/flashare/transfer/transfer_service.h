/**
 * @file transfer_service.h
 * @brief Transfer Service - upload, download, delete and listing orchestration
 *
 * The only component aware of batch semantics and failure aggregation.
 *
 * Responsibilities:
 * - Single and batch uploads with collision-free naming
 * - Raw and zstd compressed downloads
 * - Single and batch deletes
 * - Storage root listing and statistics
 *
 * Does NOT handle:
 * - HTTP request/response (Handler's job)
 * - Path containment rules (PathResolver's job)
 *
 * The storage root directory is the single source of truth; nothing is
 * cached between calls.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "compression_stream.h"
#include "content_source.h"
#include "path_resolver.h"
#include "types.h"

namespace flashare::transfer {

/**
 * @brief Ready-to-send download
 */
struct DownloadStream {
    std::string filename;                        ///< Name used for Content-Disposition
    bool compressed = false;
    std::optional<std::uint64_t> contentLength;  ///< Set for raw downloads only
    std::unique_ptr<ChunkStream> stream;
};

/**
 * @brief Transfer Service Class
 */
class TransferService {
public:
    /**
     * @brief Constructor
     * @param config Transfer configuration (must outlive the service)
     * @throws common::ConfigException if the storage root is unset
     * @throws common::IoFailureException if the storage root cannot be created
     */
    explicit TransferService(const TransferConfig& config);

    ~TransferService() = default;

    /**
     * @brief List regular, non-hidden files directly under the storage root
     *
     * Metadata is fetched concurrently. Ordered by modification time,
     * most recent first.
     */
    std::vector<StoredFile> listFiles() const;

    /**
     * @brief Store one upload
     *
     * Received -> Validated -> (Stored | Rejected). Never throws for
     * per-item failures; a Rejected outcome carries the reason and no
     * partial file is left behind.
     *
     * @param name Client-supplied filename (may contain directories)
     * @param content Upload body
     */
    UploadOutcome uploadOne(const std::string& name, ContentSource& content) const;

    /**
     * @brief Store every item concurrently and summarize
     *
     * Outcomes keep the order of items. success is true only if every item
     * was stored.
     */
    UploadBatchResult uploadBatch(std::vector<UploadItem>& items) const;

    /**
     * @brief Open a file for download
     *
     * @param name Requested filename
     * @param compressed zstd stream when true, raw bytes otherwise
     * @throws common::InvalidInputException for an empty name
     * @throws common::AccessDeniedException if the path escapes the root
     * @throws common::NotFoundException if the file does not exist
     * @throws common::BadRequestException if the target is not a regular file
     */
    DownloadStream download(const std::string& name, bool compressed) const;

    /**
     * @brief Delete one file
     *
     * Requested -> (Deleted | NotFound | Denied). Safe to repeat: a
     * missing file is reported as NOT_FOUND with no side effects. Empty
     * names and non-regular targets are BAD_REQUEST; I/O errors are FAILED.
     */
    DeleteOutcome deleteOne(const std::string& name) const;

    /**
     * @brief Delete every name concurrently and summarize
     */
    DeleteBatchResult deleteBatch(const std::vector<std::string>& names) const;

    /**
     * @brief File count and total size of the listable files
     */
    StorageStatus status() const;

    /// @brief Storage root as configured
    const std::filesystem::path& storageRoot() const { return config_.storageRoot; }

private:
    std::vector<std::filesystem::path> listCandidates() const;
    std::optional<StoredFile> statFile(const std::filesystem::path& path) const;

    const TransferConfig& config_;
    PathResolver resolver_;
};

/**
 * @brief Summarize upload outcomes
 */
BatchSummary summarize(const std::vector<UploadOutcome>& outcomes);

/**
 * @brief Summarize delete outcomes (totalSize stays 0)
 */
BatchSummary summarize(const std::vector<DeleteOutcome>& outcomes);

} // namespace flashare::transfer
