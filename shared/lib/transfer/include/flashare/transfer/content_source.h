/**
 * @file content_source.h
 * @brief Pull-based readers for upload content
 *
 * TransferService::uploadOne copies from a ContentSource in bounded chunks,
 * so the upload path never needs the whole body as one buffer of its own.
 * The HTTP boundary wraps Drogon's parsed multipart data in a
 * MemoryContentSource; tests inject failing sources.
 */

#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace flashare::transfer {

/**
 * @brief Upload content reader interface
 */
class ContentSource {
public:
    virtual ~ContentSource() = default;

    /**
     * @brief Read up to capacity bytes
     * @param buffer Destination
     * @param capacity Destination size in bytes
     * @return Bytes read, 0 once the content is exhausted
     * @throws common::IoFailureException when the underlying read fails
     */
    virtual std::size_t read(char* buffer, std::size_t capacity) = 0;
};

/**
 * @brief ContentSource over bytes owned elsewhere
 *
 * The viewed memory must outlive the source.
 */
class MemoryContentSource : public ContentSource {
public:
    explicit MemoryContentSource(std::string_view data) : data_(data) {}

    std::size_t read(char* buffer, std::size_t capacity) override;

private:
    std::string_view data_;
    std::size_t offset_ = 0;
};

/**
 * @brief ContentSource over a std::istream
 *
 * A stream entering the bad state is reported as an I/O failure.
 */
class StreamContentSource : public ContentSource {
public:
    explicit StreamContentSource(std::istream& in) : in_(in) {}

    std::size_t read(char* buffer, std::size_t capacity) override;

private:
    std::istream& in_;
};

/// @brief One named item of an upload batch
struct UploadItem {
    std::string name;
    std::unique_ptr<ContentSource> content;
};

} // namespace flashare::transfer
