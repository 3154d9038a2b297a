/**
 * @file compression_stream.h
 * @brief Bounded-memory chunk streams over a file
 *
 * A ChunkStream is a finite, single-pass, pull-based sequence of byte chunks.
 *
 * Cleanup contract: the file handle (and compressor context, if any) is
 * released as soon as the sequence is exhausted, when close() is called, or
 * when the stream is destroyed, whichever comes first. Abandoning a stream
 * half way (client disconnect) therefore never leaks a descriptor.
 *
 * Usage:
 * @code
 *   auto stream = openCompressedStream(path, 64 * 1024, 3);
 *   std::string chunk;
 *   while (stream->next(chunk)) {
 *       send(chunk);
 *   }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace flashare::transfer {

/**
 * @brief Pull-based chunk sequence
 */
class ChunkStream {
public:
    virtual ~ChunkStream() = default;

    /**
     * @brief Produce the next chunk
     *
     * Each step reads at most chunkSize bytes of file input. A compressed
     * chunk may be empty only if the compressor had nothing to emit; the
     * sequence itself ends exactly when the input is exhausted.
     *
     * @param chunk Replaced with the produced bytes
     * @return false once the sequence is finished (chunk is then empty)
     * @throws common::IoFailureException on read or compression failure
     */
    virtual bool next(std::string& chunk) = 0;

    /// @brief Release the file handle now; further next() calls return false
    virtual void close() noexcept = 0;

    /// @brief Whether the underlying file handle is still held
    virtual bool isOpen() const noexcept = 0;

    /// @brief Total output length when known in advance (raw streams only)
    virtual std::optional<std::uint64_t> contentLength() const { return std::nullopt; }
};

/**
 * @brief Open a zstd compressed stream over a file
 *
 * Every step flushes the compressor so each chunk is decodable as soon as it
 * arrives; the last step ends the frame. The output is a single
 * self-delimiting zstd frame.
 *
 * @param path File to read
 * @param chunkSize Max input bytes per step (must be > 0)
 * @param level zstd compression level
 * @throws common::NotFoundException if the file does not exist
 * @throws common::IoFailureException if the file cannot be opened or the
 *         compressor cannot be set up
 */
std::unique_ptr<ChunkStream> openCompressedStream(
    const std::filesystem::path& path, std::size_t chunkSize, int level);

/**
 * @brief Open an uncompressed stream over a file
 *
 * Produces exactly the file size observed at open time. Bytes appended
 * later are not sent; truncation during the transfer is an I/O failure.
 *
 * @throws common::NotFoundException if the file does not exist
 * @throws common::IoFailureException if the file cannot be opened
 */
std::unique_ptr<ChunkStream> openRawStream(
    const std::filesystem::path& path, std::size_t chunkSize);

/**
 * @brief Adapts a ChunkStream to a fill-this-buffer pull interface
 *
 * Drogon stream responses ask for "up to N bytes into this buffer" and treat
 * a 0 return as end of body. The pump keeps the remainder of a chunk larger
 * than the caller's buffer, skips empty compressor steps, and closes the
 * stream on exhaustion or when called with a null buffer (connection gone).
 */
class StreamPump {
public:
    explicit StreamPump(std::unique_ptr<ChunkStream> stream);

    /**
     * @brief Copy the next bytes into buffer
     * @return Bytes written; 0 at end of stream or after abort
     */
    std::size_t fill(char* buffer, std::size_t capacity);

    /// @brief Abandon the transfer and release the file
    void abort() noexcept;

    /// @brief Whether the underlying stream still holds its file
    bool isOpen() const noexcept;

    /// @brief Bytes handed out so far
    std::uint64_t bytesSent() const noexcept { return bytesSent_; }

private:
    std::unique_ptr<ChunkStream> stream_;
    std::string pending_;
    std::size_t pendingOffset_ = 0;
    std::uint64_t bytesSent_ = 0;
    bool finished_ = false;
};

} // namespace flashare::transfer
