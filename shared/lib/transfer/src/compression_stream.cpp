/**
 * @file compression_stream.cpp
 * @brief Raw and zstd ChunkStream implementations, StreamPump
 */

#include "flashare/transfer/compression_stream.h"
#include "exceptions.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <sys/stat.h>
#include <zstd.h>

namespace fs = std::filesystem;

namespace flashare::transfer {

namespace {

struct FileCloser { void operator()(std::FILE* f) const { std::fclose(f); } };
using UniqueFile = std::unique_ptr<std::FILE, FileCloser>;

struct CCtxDeleter { void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); } };
using UniqueCCtx = std::unique_ptr<ZSTD_CCtx, CCtxDeleter>;

UniqueFile openForRead(const fs::path& path) {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
        if (errno == ENOENT) {
            throw common::NotFoundException("File not found");
        }
        throw common::IoFailureException("cannot open " + path.filename().string() + ": " + std::strerror(errno));
    }
    return UniqueFile(f);
}

void requirePositive(std::size_t chunkSize) {
    if (chunkSize == 0) {
        throw common::InvalidInputException("chunk size must be positive");
    }
}

/**
 * @brief Uncompressed stream bounded by the size seen at open time
 */
class RawFileStream : public ChunkStream {
public:
    RawFileStream(UniqueFile file, std::uint64_t size, std::size_t chunkSize)
        : file_(std::move(file)), size_(size), remaining_(size), chunkSize_(chunkSize) {}

    bool next(std::string& chunk) override {
        chunk.clear();
        if (!file_) return false;
        if (remaining_ == 0) {
            close();
            return false;
        }

        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize_, remaining_));
        chunk.resize(want);
        std::size_t n = std::fread(chunk.data(), 1, want, file_.get());
        if (n < want) {
            bool readError = std::ferror(file_.get()) != 0;
            close();
            chunk.clear();
            throw common::IoFailureException(readError ? "read failed during transfer"
                                                       : "file truncated during transfer");
        }

        remaining_ -= n;
        if (remaining_ == 0) {
            close();
        }
        return true;
    }

    void close() noexcept override {
        file_.reset();
    }

    bool isOpen() const noexcept override { return static_cast<bool>(file_); }

    std::optional<std::uint64_t> contentLength() const override { return size_; }

private:
    UniqueFile file_;
    std::uint64_t size_;
    std::uint64_t remaining_;
    std::size_t chunkSize_;
};

/**
 * @brief zstd stream: one frame, flushed after every input chunk
 */
class ZstdFileStream : public ChunkStream {
public:
    ZstdFileStream(UniqueFile file, std::size_t chunkSize, int level)
        : file_(std::move(file)), cctx_(ZSTD_createCCtx()), input_(chunkSize)
    {
        if (!cctx_) {
            throw common::IoFailureException("cannot allocate zstd context");
        }
        std::size_t rc = ZSTD_CCtx_setParameter(cctx_.get(), ZSTD_c_compressionLevel, level);
        if (ZSTD_isError(rc)) {
            throw common::IoFailureException(std::string("zstd level ") + std::to_string(level) +
                                             ": " + ZSTD_getErrorName(rc));
        }
    }

    bool next(std::string& chunk) override {
        chunk.clear();
        if (!file_) return false;

        std::size_t n = std::fread(input_.data(), 1, input_.size(), file_.get());
        if (n < input_.size() && std::ferror(file_.get())) {
            close();
            throw common::IoFailureException("read failed during transfer");
        }

        // A short read means end of input: finish the frame in this step
        bool last = n < input_.size();
        ZSTD_EndDirective mode = last ? ZSTD_e_end : ZSTD_e_flush;
        ZSTD_inBuffer in{input_.data(), n, 0};
        const std::size_t outStep = ZSTD_CStreamOutSize();

        for (;;) {
            std::size_t used = chunk.size();
            chunk.resize(used + outStep);
            ZSTD_outBuffer out{chunk.data() + used, outStep, 0};

            std::size_t remaining = ZSTD_compressStream2(cctx_.get(), &out, &in, mode);
            chunk.resize(used + out.pos);
            if (ZSTD_isError(remaining)) {
                close();
                chunk.clear();
                throw common::IoFailureException(std::string("zstd: ") + ZSTD_getErrorName(remaining));
            }
            if (remaining == 0) break;  // flushed and all input consumed
        }

        if (last) {
            close();
        }
        return true;
    }

    void close() noexcept override {
        file_.reset();
        cctx_.reset();
        std::vector<char>().swap(input_);
    }

    bool isOpen() const noexcept override { return static_cast<bool>(file_); }

private:
    UniqueFile file_;
    UniqueCCtx cctx_;
    std::vector<char> input_;
};

} // anonymous namespace

std::unique_ptr<ChunkStream> openCompressedStream(
    const fs::path& path, std::size_t chunkSize, int level) {
    requirePositive(chunkSize);
    return std::make_unique<ZstdFileStream>(openForRead(path), chunkSize, level);
}

std::unique_ptr<ChunkStream> openRawStream(const fs::path& path, std::size_t chunkSize) {
    requirePositive(chunkSize);
    UniqueFile file = openForRead(path);

    struct stat st{};
    if (::fstat(::fileno(file.get()), &st) != 0) {
        throw common::IoFailureException("cannot stat " + path.filename().string() + ": " + std::strerror(errno));
    }
    return std::make_unique<RawFileStream>(std::move(file), static_cast<std::uint64_t>(st.st_size), chunkSize);
}

// =============================================================================
// StreamPump
// =============================================================================

StreamPump::StreamPump(std::unique_ptr<ChunkStream> stream)
    : stream_(std::move(stream))
{
    if (!stream_) {
        throw std::invalid_argument("StreamPump: stream cannot be nullptr");
    }
}

std::size_t StreamPump::fill(char* buffer, std::size_t capacity) {
    if (!buffer) {
        abort();
        return 0;
    }
    if (capacity == 0) {
        return 0;
    }

    while (pendingOffset_ >= pending_.size()) {
        if (finished_) return 0;
        pending_.clear();
        pendingOffset_ = 0;
        if (!stream_->next(pending_)) {
            finished_ = true;
            stream_->close();
            return 0;
        }
    }

    std::size_t n = std::min(capacity, pending_.size() - pendingOffset_);
    std::memcpy(buffer, pending_.data() + pendingOffset_, n);
    pendingOffset_ += n;
    bytesSent_ += n;
    return n;
}

void StreamPump::abort() noexcept {
    finished_ = true;
    pending_.clear();
    pendingOffset_ = 0;
    stream_->close();
}

bool StreamPump::isOpen() const noexcept {
    return stream_->isOpen();
}

} // namespace flashare::transfer
