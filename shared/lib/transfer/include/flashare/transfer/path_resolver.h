/**
 * @file path_resolver.h
 * @brief Storage root path containment and collision-free naming
 *
 * Every path the transfer engine opens goes through this class:
 *   - sanitize():        client name -> bare final segment
 *   - resolveForWrite(): bare name -> exclusively created, unused path
 *   - resolveForRead():  name -> canonical path inside the storage root
 */

#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include "types.h"

namespace flashare::transfer {

/**
 * @brief Exclusively created upload target
 *
 * Owns the open FILE* of a freshly created file. Unless commit() is called,
 * the destructor closes and removes the file, so an aborted copy never
 * leaves a partial file behind. Move-only.
 */
class WriteReservation {
public:
    WriteReservation(std::filesystem::path path, std::FILE* file);
    ~WriteReservation();

    WriteReservation(WriteReservation&& other) noexcept;
    WriteReservation& operator=(WriteReservation&& other) noexcept;
    WriteReservation(const WriteReservation&) = delete;
    WriteReservation& operator=(const WriteReservation&) = delete;

    /// @brief Final on-disk path
    const std::filesystem::path& path() const { return path_; }

    /// @brief Final filename (last path segment)
    std::string filename() const { return path_.filename().string(); }

    /**
     * @brief Append bytes to the reserved file
     * @throws common::IoFailureException on short write
     */
    void write(const char* data, std::size_t length);

    /**
     * @brief Flush, close and keep the file
     * @throws common::IoFailureException if flushing or closing fails
     */
    void commit();

private:
    struct FileCloser { void operator()(std::FILE* f) const { std::fclose(f); } };

    void discard() noexcept;

    std::filesystem::path path_;
    std::unique_ptr<std::FILE, FileCloser> file_;
    bool committed_ = false;
};

/**
 * @brief Path resolver bound to one storage root
 *
 * Holds no cached filesystem state: containment is re-verified on every call.
 */
class PathResolver {
public:
    /**
     * @brief Constructor
     * @param config Transfer configuration; storageRoot must be set
     * @throws common::ConfigException if storageRoot is empty
     */
    explicit PathResolver(const TransferConfig& config);

    /**
     * @brief Strip directory components from a client-supplied name
     *
     * Both '/' and '\\' count as separators. "report.pdf", "a/b/report.pdf"
     * and "C:\\docs\\report.pdf" all yield "report.pdf".
     *
     * @throws common::InvalidInputException for empty names, "." or "..",
     *         trailing separators, or embedded NUL bytes
     */
    static std::string sanitize(const std::string& rawName);

    /**
     * @brief Claim an unused path for a new upload
     *
     * Tries storageRoot/baseName, then name_1.ext, name_2.ext, ... Each
     * candidate is created with an exclusive create, so two concurrent
     * callers never receive the same path.
     *
     * @param baseName Output of sanitize()
     * @throws common::InvalidInputException if baseName is not a bare name
     * @throws common::IoFailureException on any error other than "exists"
     */
    WriteReservation resolveForWrite(const std::string& baseName) const;

    /**
     * @brief Canonical path of a name under the storage root
     *
     * Resolves symlinks and dot segments. The target need not exist.
     *
     * @throws common::InvalidInputException for an empty name
     * @throws common::AccessDeniedException if the canonical path is not a
     *         strict descendant of the canonical storage root
     */
    std::filesystem::path resolveForRead(const std::string& baseName) const;

    /// @brief Whether a canonical path lies strictly below the canonical root
    bool isContained(const std::filesystem::path& canonicalPath) const;

    /// @brief Storage root as configured
    const std::filesystem::path& storageRoot() const { return config_.storageRoot; }

private:
    std::filesystem::path canonicalRoot() const;

    const TransferConfig& config_;
};

/**
 * @brief Candidate name for the given collision counter
 *
 * candidateName("x.txt", 0) == "x.txt", candidateName("x.txt", 2) == "x_2.txt",
 * candidateName("archive.tar.gz", 1) == "archive.tar_1.gz".
 */
std::string candidateName(const std::string& baseName, unsigned counter);

} // namespace flashare::transfer
