/**
 * @file content_source.cpp
 * @brief ContentSource implementations
 */

#include "flashare/transfer/content_source.h"
#include "exceptions.h"

#include <algorithm>
#include <cstring>

namespace flashare::transfer {

std::size_t MemoryContentSource::read(char* buffer, std::size_t capacity) {
    std::size_t n = std::min(capacity, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

std::size_t StreamContentSource::read(char* buffer, std::size_t capacity) {
    if (in_.eof()) {
        return 0;
    }
    in_.read(buffer, static_cast<std::streamsize>(capacity));
    if (in_.bad()) {
        throw common::IoFailureException("upload stream read failed");
    }
    return static_cast<std::size_t>(in_.gcount());
}

} // namespace flashare::transfer
