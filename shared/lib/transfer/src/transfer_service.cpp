/**
 * @file transfer_service.cpp
 * @brief TransferService implementation
 */

#include "flashare/transfer/transfer_service.h"
#include "flashare/transfer/file_category.h"
#include "flashare/transfer/parallel.h"
#include "exceptions.h"

#include <algorithm>
#include <system_error>

#include <sys/stat.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace flashare::transfer {

TransferService::TransferService(const TransferConfig& config)
    : config_(config), resolver_(config)
{
    std::error_code ec;
    fs::create_directories(config_.storageRoot, ec);
    if (ec) {
        throw common::IoFailureException("cannot create storage root " +
                                         config_.storageRoot.string() + ": " + ec.message());
    }

    spdlog::info("[TransferService] Initialized (root: {}, chunk: {} bytes, zstd level: {}, workers: {})",
                 config_.storageRoot.string(), config_.chunkSize,
                 config_.compressionLevel, config_.batchWorkers);
}

// =============================================================================
// Listing
// =============================================================================

std::vector<fs::path> TransferService::listCandidates() const {
    std::vector<fs::path> paths;

    std::error_code ec;
    fs::directory_iterator it(config_.storageRoot, ec);
    if (ec) {
        spdlog::warn("[TransferService] Cannot read storage root {}: {}",
                     config_.storageRoot.string(), ec.message());
        return paths;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;  // hidden
        }
        paths.push_back(entry.path());
    }
    return paths;
}

std::optional<StoredFile> TransferService::statFile(const fs::path& path) const {
    std::error_code ec;
    fs::file_status linkStatus = fs::symlink_status(path, ec);
    if (ec) {
        return std::nullopt;
    }

    // Symlinks are only listed when they point back inside the storage root
    if (fs::is_symlink(linkStatus)) {
        fs::path target = fs::canonical(path, ec);
        if (ec || !resolver_.isContained(target)) {
            return std::nullopt;
        }
    }

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return std::nullopt;
    }

    StoredFile file;
    file.name = path.filename().string();
    file.size = static_cast<std::uint64_t>(st.st_size);
    file.modified = static_cast<double>(st.st_mtim.tv_sec) +
                    static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    file.category = categorize(file.name);
    return file;
}

std::vector<StoredFile> TransferService::listFiles() const {
    std::vector<fs::path> paths = listCandidates();
    std::vector<std::optional<StoredFile>> slots(paths.size());

    parallelFor(paths.size(), config_.batchWorkers, [&](std::size_t i) {
        try {
            slots[i] = statFile(paths[i]);
        } catch (const common::FlashareException& e) {
            spdlog::warn("[TransferService] Skipping {}: {}", paths[i].filename().string(), e.what());
        }
    });

    std::vector<StoredFile> files;
    files.reserve(slots.size());
    for (auto& slot : slots) {
        if (slot) files.push_back(std::move(*slot));
    }

    std::sort(files.begin(), files.end(), [](const StoredFile& a, const StoredFile& b) {
        return a.modified > b.modified;
    });
    return files;
}

StorageStatus TransferService::status() const {
    StorageStatus result;
    for (const auto& file : listFiles()) {
        ++result.fileCount;
        result.totalSize += file.size;
    }
    return result;
}

// =============================================================================
// Upload
// =============================================================================

UploadOutcome TransferService::uploadOne(const std::string& name, ContentSource& content) const {
    UploadOutcome outcome;
    outcome.filename = name;

    std::string baseName;
    try {
        baseName = PathResolver::sanitize(name);
    } catch (const common::InvalidInputException& e) {
        outcome.error = e.what();
        spdlog::warn("[TransferService] Upload rejected: {}", outcome.error);
        return outcome;
    }
    outcome.filename = baseName;

    try {
        WriteReservation target = resolver_.resolveForWrite(baseName);

        std::vector<char> buffer(config_.chunkSize);
        std::uint64_t written = 0;
        for (;;) {
            std::size_t n = content.read(buffer.data(), buffer.size());
            if (n == 0) break;
            target.write(buffer.data(), n);
            written += n;
        }
        target.commit();

        outcome.success = true;
        outcome.filename = target.filename();
        outcome.size = written;
        outcome.category = categorize(outcome.filename);

        spdlog::info("[TransferService] Stored {} ({} bytes){}", outcome.filename, written,
                     outcome.filename != baseName ? " renamed from " + baseName : std::string());

    } catch (const std::exception& e) {
        // WriteReservation has already removed the partial file
        outcome.success = false;
        outcome.error = e.what();
        spdlog::warn("[TransferService] Upload of {} failed: {}", baseName, outcome.error);
    }

    return outcome;
}

UploadBatchResult TransferService::uploadBatch(std::vector<UploadItem>& items) const {
    UploadBatchResult result;
    result.files.resize(items.size());

    parallelFor(items.size(), config_.batchWorkers, [&](std::size_t i) {
        UploadItem& item = items[i];
        if (!item.content) {
            result.files[i].filename = item.name;
            result.files[i].error = "No content provided";
            return;
        }
        result.files[i] = uploadOne(item.name, *item.content);
    });

    result.summary = summarize(result.files);
    result.success = result.summary.allSucceeded();

    spdlog::info("[TransferService] Batch upload: {}/{} stored, {} bytes",
                 result.summary.successful, result.summary.total, result.summary.totalSize);
    return result;
}

// =============================================================================
// Download
// =============================================================================

DownloadStream TransferService::download(const std::string& name, bool compressed) const {
    fs::path path = resolver_.resolveForRead(name);

    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        throw common::NotFoundException("File not found");
    }
    if (ec) {
        throw common::IoFailureException("cannot stat " + name + ": " + ec.message());
    }
    if (!fs::is_regular_file(st)) {
        throw common::BadRequestException("Not a file");
    }

    DownloadStream result;
    result.filename = fs::path(name).filename().string();
    result.compressed = compressed;
    result.stream = compressed
        ? openCompressedStream(path, config_.chunkSize, config_.compressionLevel)
        : openRawStream(path, config_.chunkSize);
    result.contentLength = result.stream->contentLength();

    spdlog::info("[TransferService] Download {} ({})", result.filename, compressed ? "zstd" : "raw");
    return result;
}

// =============================================================================
// Delete
// =============================================================================

DeleteOutcome TransferService::deleteOne(const std::string& name) const {
    DeleteOutcome outcome;
    outcome.filename = name;

    try {
        fs::path target = resolver_.resolveForRead(name);
        fs::path lexical = config_.storageRoot / name;
        fs::path victim = target;

        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(lexical, ec))) {
            // Remove the link itself, which must also live inside the root
            fs::path parent = fs::weakly_canonical(lexical.parent_path(), ec);
            if (ec) {
                throw common::IoFailureException("cannot resolve " + name + ": " + ec.message());
            }
            victim = parent / lexical.filename();
            if (!resolver_.isContained(victim)) {
                throw common::AccessDeniedException("Access denied");
            }
        } else {
            fs::file_status st = fs::status(target, ec);
            if (st.type() == fs::file_type::not_found) {
                outcome.status = DeleteStatus::NOT_FOUND;
                outcome.error = "File not found";
                return outcome;
            }
            if (!fs::is_regular_file(st)) {
                outcome.status = DeleteStatus::BAD_REQUEST;
                outcome.error = "Not a file";
                return outcome;
            }
        }

        if (!fs::remove(victim, ec)) {
            if (ec) {
                throw common::IoFailureException("cannot delete " + name + ": " + ec.message());
            }
            outcome.status = DeleteStatus::NOT_FOUND;
            outcome.error = "File not found";
            return outcome;
        }

        outcome.status = DeleteStatus::DELETED;
        spdlog::info("[TransferService] Deleted {}", name);

    } catch (const common::FlashareException& e) {
        switch (e.kind()) {
            case common::ErrorKind::ACCESS_DENIED: outcome.status = DeleteStatus::DENIED; break;
            case common::ErrorKind::NOT_FOUND:     outcome.status = DeleteStatus::NOT_FOUND; break;
            case common::ErrorKind::INVALID_INPUT:
            case common::ErrorKind::BAD_REQUEST:   outcome.status = DeleteStatus::BAD_REQUEST; break;
            default:                               outcome.status = DeleteStatus::FAILED; break;
        }
        outcome.error = e.what();
        spdlog::warn("[TransferService] Delete of {} rejected ({}): {}",
                     name, deleteStatusToString(outcome.status), outcome.error);
    }

    return outcome;
}

DeleteBatchResult TransferService::deleteBatch(const std::vector<std::string>& names) const {
    DeleteBatchResult result;
    result.results.resize(names.size());

    parallelFor(names.size(), config_.batchWorkers, [&](std::size_t i) {
        result.results[i] = deleteOne(names[i]);
    });

    result.summary = summarize(result.results);
    result.success = result.summary.allSucceeded();

    spdlog::info("[TransferService] Batch delete: {}/{} deleted",
                 result.summary.successful, result.summary.total);
    return result;
}

// =============================================================================
// Summaries
// =============================================================================

BatchSummary summarize(const std::vector<UploadOutcome>& outcomes) {
    BatchSummary summary;
    summary.total = outcomes.size();
    for (const auto& o : outcomes) {
        if (o.success) {
            ++summary.successful;
            summary.totalSize += o.size;
        } else {
            ++summary.failed;
        }
    }
    return summary;
}

BatchSummary summarize(const std::vector<DeleteOutcome>& outcomes) {
    BatchSummary summary;
    summary.total = outcomes.size();
    for (const auto& o : outcomes) {
        if (o.success()) {
            ++summary.successful;
        } else {
            ++summary.failed;
        }
    }
    return summary;
}

} // namespace flashare::transfer
