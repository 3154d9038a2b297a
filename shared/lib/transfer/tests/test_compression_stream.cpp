/**
 * @file test_compression_stream.cpp
 * @brief Unit tests for raw and zstd chunk streams and StreamPump
 */

#include <gtest/gtest.h>
#include <flashare/transfer/compression_stream.h>
#include "test_helpers.h"

#include <vector>

using namespace flashare::transfer;
using namespace test_helpers;
namespace fs = std::filesystem;

class CompressionStreamTest : public ::testing::Test {
protected:
    TempDir dir_;

    fs::path makeFile(const std::string& name, const std::string& content) {
        fs::path p = dir_.path() / name;
        writeFile(p, content);
        return p;
    }
};

// ============================================================================
// Raw stream
// ============================================================================

TEST_F(CompressionStreamTest, Raw_ReproducesFileExactly) {
    std::string data = pseudoRandomBytes(200 * 1024 + 17);
    auto stream = openRawStream(makeFile("a.bin", data), 64 * 1024);

    ASSERT_TRUE(stream->contentLength().has_value());
    EXPECT_EQ(*stream->contentLength(), data.size());

    std::size_t chunks = 0;
    EXPECT_EQ(drain(*stream, &chunks), data);
    EXPECT_EQ(chunks, 4u);
    EXPECT_FALSE(stream->isOpen());
}

TEST_F(CompressionStreamTest, Raw_ChunksNeverExceedChunkSize) {
    std::string data = pseudoRandomBytes(10000);
    auto stream = openRawStream(makeFile("a.bin", data), 4096);

    std::string chunk;
    std::vector<std::size_t> sizes;
    while (stream->next(chunk)) {
        sizes.push_back(chunk.size());
    }
    ASSERT_EQ(sizes.size(), 3u);
    EXPECT_EQ(sizes[0], 4096u);
    EXPECT_EQ(sizes[1], 4096u);
    EXPECT_EQ(sizes[2], 10000u - 8192u);
}

TEST_F(CompressionStreamTest, Raw_EmptyFileProducesNoChunks) {
    auto stream = openRawStream(makeFile("empty.bin", ""), 4096);
    EXPECT_EQ(*stream->contentLength(), 0u);

    std::string chunk;
    EXPECT_FALSE(stream->next(chunk));
    EXPECT_TRUE(chunk.empty());
    EXPECT_FALSE(stream->isOpen());
}

TEST_F(CompressionStreamTest, Raw_TruncationDuringTransferIsIoFailure) {
    fs::path p = makeFile("shrink.bin", pseudoRandomBytes(16384));
    auto stream = openRawStream(p, 4096);

    std::string chunk;
    ASSERT_TRUE(stream->next(chunk));
    fs::resize_file(p, 5000);

    EXPECT_THROW({
        while (stream->next(chunk)) {}
    }, flashare::common::IoFailureException);
    EXPECT_FALSE(stream->isOpen());
}

TEST_F(CompressionStreamTest, Raw_MissingFileIsNotFound) {
    EXPECT_THROW(openRawStream(dir_.path() / "nope.bin", 4096), flashare::common::NotFoundException);
}

TEST_F(CompressionStreamTest, Raw_ZeroChunkSizeInvalid) {
    fs::path p = makeFile("a.bin", "abc");
    EXPECT_THROW(openRawStream(p, 0), flashare::common::InvalidInputException);
}

// ============================================================================
// zstd stream
// ============================================================================

TEST_F(CompressionStreamTest, Zstd_DecodesToFileBytes) {
    std::string data = pseudoRandomBytes(150 * 1024, 7);
    auto stream = openCompressedStream(makeFile("a.bin", data), 64 * 1024, 3);

    EXPECT_FALSE(stream->contentLength().has_value());

    std::string compressed = drain(*stream);
    EXPECT_TRUE(isCompleteFrame(compressed));
    EXPECT_EQ(zstdDecompress(compressed), data);
    EXPECT_FALSE(stream->isOpen());
}

TEST_F(CompressionStreamTest, Zstd_CompressibleInputShrinks) {
    std::string data(512 * 1024, 'a');
    auto stream = openCompressedStream(makeFile("a.txt", data), 64 * 1024, 3);

    std::string compressed = drain(*stream);
    EXPECT_LT(compressed.size(), data.size() / 10);
    EXPECT_EQ(zstdDecompress(compressed), data);
}

TEST_F(CompressionStreamTest, Zstd_EachChunkDecodableOnArrival) {
    std::string data = pseudoRandomBytes(3 * 4096 + 100, 3);
    auto stream = openCompressedStream(makeFile("a.bin", data), 4096, 3);

    struct DCtxDeleter { void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); } };
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());

    std::string decoded;
    std::string chunk;
    std::vector<char> out(ZSTD_DStreamOutSize());
    std::size_t steps = 0;
    while (stream->next(chunk)) {
        ++steps;
        ZSTD_inBuffer in{chunk.data(), chunk.size(), 0};
        while (in.pos < in.size) {
            ZSTD_outBuffer o{out.data(), out.size(), 0};
            std::size_t rc = ZSTD_decompressStream(dctx.get(), &o, &in);
            ASSERT_FALSE(ZSTD_isError(rc));
            decoded.append(out.data(), o.pos);
        }
        // Flushed output covers every input byte consumed so far
        EXPECT_EQ(decoded.size(), std::min(steps * 4096, data.size()));
    }
    EXPECT_EQ(decoded, data);
}

TEST_F(CompressionStreamTest, Zstd_EmptyFileIsValidEmptyFrame) {
    auto stream = openCompressedStream(makeFile("empty.bin", ""), 4096, 3);
    std::string compressed = drain(*stream);
    EXPECT_FALSE(compressed.empty());
    EXPECT_TRUE(isCompleteFrame(compressed));
    EXPECT_EQ(zstdDecompress(compressed), "");
}

TEST_F(CompressionStreamTest, Zstd_ExactMultipleOfChunkSize) {
    std::string data = pseudoRandomBytes(2 * 4096, 9);
    auto stream = openCompressedStream(makeFile("a.bin", data), 4096, 1);
    std::string compressed = drain(*stream);
    EXPECT_TRUE(isCompleteFrame(compressed));
    EXPECT_EQ(zstdDecompress(compressed), data);
}

TEST_F(CompressionStreamTest, Zstd_MissingFileIsNotFound) {
    EXPECT_THROW(openCompressedStream(dir_.path() / "nope.bin", 4096, 3),
                 flashare::common::NotFoundException);
}

TEST_F(CompressionStreamTest, Zstd_CloseReleasesEarly) {
    auto stream = openCompressedStream(makeFile("a.bin", pseudoRandomBytes(64 * 1024)), 4096, 3);

    std::string chunk;
    ASSERT_TRUE(stream->next(chunk));
    EXPECT_TRUE(stream->isOpen());

    stream->close();
    EXPECT_FALSE(stream->isOpen());
    EXPECT_FALSE(stream->next(chunk));
    EXPECT_TRUE(chunk.empty());
}

// ============================================================================
// StreamPump
// ============================================================================

TEST_F(CompressionStreamTest, Pump_NullStreamThrows) {
    EXPECT_THROW(StreamPump(nullptr), std::invalid_argument);
}

TEST_F(CompressionStreamTest, Pump_SmallBufferKeepsRemainder) {
    std::string data = pseudoRandomBytes(10000, 5);
    StreamPump pump(openRawStream(makeFile("a.bin", data), 4096));

    std::string received;
    char buf[1000];
    for (;;) {
        std::size_t n = pump.fill(buf, sizeof(buf));
        if (n == 0) break;
        EXPECT_LE(n, sizeof(buf));
        received.append(buf, n);
    }
    EXPECT_EQ(received, data);
    EXPECT_EQ(pump.bytesSent(), data.size());
    EXPECT_FALSE(pump.isOpen());

    // Stays finished
    EXPECT_EQ(pump.fill(buf, sizeof(buf)), 0u);
}

TEST_F(CompressionStreamTest, Pump_CompressedOutputDecodes) {
    std::string data = pseudoRandomBytes(70000, 11);
    StreamPump pump(openCompressedStream(makeFile("a.bin", data), 8192, 3));

    std::string received;
    std::vector<char> buf(16384);
    std::size_t n;
    while ((n = pump.fill(buf.data(), buf.size())) > 0) {
        received.append(buf.data(), n);
    }
    EXPECT_EQ(zstdDecompress(received), data);
}

TEST_F(CompressionStreamTest, Pump_AbandonedMidwayReleasesFile) {
    StreamPump pump(openCompressedStream(makeFile("a.bin", pseudoRandomBytes(100000)), 4096, 3));

    char buf[512];
    ASSERT_GT(pump.fill(buf, sizeof(buf)), 0u);
    EXPECT_TRUE(pump.isOpen());

    // Connection closed
    EXPECT_EQ(pump.fill(nullptr, 0), 0u);
    EXPECT_FALSE(pump.isOpen());
    EXPECT_EQ(pump.fill(buf, sizeof(buf)), 0u);
}

TEST_F(CompressionStreamTest, Pump_AbortIsIdempotent) {
    StreamPump pump(openRawStream(makeFile("a.bin", "hello"), 4096));
    pump.abort();
    pump.abort();
    EXPECT_FALSE(pump.isOpen());

    char buf[16];
    EXPECT_EQ(pump.fill(buf, sizeof(buf)), 0u);
}
