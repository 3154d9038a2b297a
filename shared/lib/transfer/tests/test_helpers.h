/**
 * @file test_helpers.h
 * @brief Shared test helpers for flashare::transfer unit tests
 *
 * Scratch storage roots, file fixtures, failing upload sources and a zstd
 * decoder for checking compressed downloads.
 */

#pragma once

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <zstd.h>

#include <flashare/transfer/compression_stream.h>
#include <flashare/transfer/content_source.h>
#include <flashare/transfer/types.h>
#include "exceptions.h"

namespace test_helpers {

/// RAII scratch directory under the system temp dir
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "flashare-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Deterministic, poorly compressible bytes
inline std::string pseudoRandomBytes(std::size_t size, unsigned seed = 1) {
    std::string data(size, '\0');
    unsigned state = seed;
    for (auto& c : data) {
        state = state * 1103515245u + 12345u;
        c = static_cast<char>((state >> 16) & 0xff);
    }
    return data;
}

/// Drain a ChunkStream, checking each step against a bound
inline std::string drain(flashare::transfer::ChunkStream& stream, std::size_t* chunkCount = nullptr) {
    std::string all;
    std::string chunk;
    std::size_t count = 0;
    while (stream.next(chunk)) {
        all += chunk;
        ++count;
    }
    if (chunkCount) *chunkCount = count;
    return all;
}

/// Decode one or more concatenated zstd frames
inline std::string zstdDecompress(const std::string& compressed) {
    struct DCtxDeleter { void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); } };
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());

    std::string result;
    std::vector<char> out(ZSTD_DStreamOutSize());
    ZSTD_inBuffer in{compressed.data(), compressed.size(), 0};
    while (in.pos < in.size) {
        ZSTD_outBuffer o{out.data(), out.size(), 0};
        std::size_t rc = ZSTD_decompressStream(dctx.get(), &o, &in);
        if (ZSTD_isError(rc)) {
            throw std::runtime_error(ZSTD_getErrorName(rc));
        }
        result.append(out.data(), o.pos);
    }
    return result;
}

/// Whether the data ends with a complete zstd frame
inline bool isCompleteFrame(const std::string& compressed) {
    return ZSTD_findFrameCompressedSize(compressed.data(), compressed.size()) == compressed.size();
}

/**
 * @brief Upload source that fails after delivering some bytes
 */
class FailingContentSource : public flashare::transfer::ContentSource {
public:
    explicit FailingContentSource(std::string prefix) : prefix_(std::move(prefix)) {}

    std::size_t read(char* buffer, std::size_t capacity) override {
        if (offset_ < prefix_.size()) {
            std::size_t n = std::min(capacity, prefix_.size() - offset_);
            std::copy(prefix_.data() + offset_, prefix_.data() + offset_ + n, buffer);
            offset_ += n;
            return n;
        }
        throw flashare::common::IoFailureException("client disconnected");
    }

private:
    std::string prefix_;
    std::size_t offset_ = 0;
};

/**
 * @brief Upload source owning its bytes
 */
class StringContentSource : public flashare::transfer::ContentSource {
public:
    explicit StringContentSource(std::string data) : data_(std::move(data)), view_(data_) {}

    std::size_t read(char* buffer, std::size_t capacity) override {
        return view_.read(buffer, capacity);
    }

private:
    std::string data_;
    flashare::transfer::MemoryContentSource view_;
};

inline flashare::transfer::TransferConfig makeConfig(const std::filesystem::path& root,
                                                     std::size_t chunkSize = 64 * 1024) {
    flashare::transfer::TransferConfig config;
    config.storageRoot = root;
    config.chunkSize = chunkSize;
    config.compressionLevel = 3;
    config.batchWorkers = 4;
    return config;
}

} // namespace test_helpers
