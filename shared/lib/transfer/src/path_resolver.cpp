/**
 * @file path_resolver.cpp
 * @brief PathResolver and WriteReservation implementation
 */

#include "flashare/transfer/path_resolver.h"
#include "exceptions.h"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace flashare::transfer {

namespace {

bool isDescendant(const fs::path& candidate, const fs::path& root) {
    auto pit = candidate.begin();
    for (auto rit = root.begin(); rit != root.end(); ++rit, ++pit) {
        if (pit == candidate.end() || *pit != *rit) {
            return false;
        }
    }
    // Strictly below the root: at least one more non-empty component
    for (; pit != candidate.end(); ++pit) {
        if (!pit->empty()) return true;
    }
    return false;
}

} // anonymous namespace

// =============================================================================
// WriteReservation
// =============================================================================

WriteReservation::WriteReservation(fs::path path, std::FILE* file)
    : path_(std::move(path)), file_(file) {}

WriteReservation::~WriteReservation() {
    discard();
}

WriteReservation::WriteReservation(WriteReservation&& other) noexcept
    : path_(std::move(other.path_)),
      file_(std::move(other.file_)),
      committed_(other.committed_) {
    other.path_.clear();
    other.committed_ = true;
}

WriteReservation& WriteReservation::operator=(WriteReservation&& other) noexcept {
    if (this != &other) {
        discard();
        path_ = std::move(other.path_);
        file_ = std::move(other.file_);
        committed_ = other.committed_;
        other.path_.clear();
        other.committed_ = true;
    }
    return *this;
}

void WriteReservation::write(const char* data, std::size_t length) {
    if (!file_) {
        throw common::IoFailureException("write to closed file " + filename());
    }
    if (length == 0) return;

    if (std::fwrite(data, 1, length, file_.get()) != length) {
        throw common::IoFailureException("write failed for " + filename() + ": " + std::strerror(errno));
    }
}

void WriteReservation::commit() {
    if (!file_) {
        throw common::IoFailureException("commit of closed file " + filename());
    }
    if (std::fflush(file_.get()) != 0) {
        throw common::IoFailureException("flush failed for " + filename() + ": " + std::strerror(errno));
    }
    std::FILE* f = file_.release();
    if (std::fclose(f) != 0) {
        throw common::IoFailureException("close failed for " + filename() + ": " + std::strerror(errno));
    }
    committed_ = true;
}

void WriteReservation::discard() noexcept {
    if (committed_ || path_.empty()) return;

    file_.reset();
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("[PathResolver] Failed to remove partial file {}: {}", path_.string(), ec.message());
    } else {
        spdlog::debug("[PathResolver] Removed partial file {}", path_.string());
    }
    path_.clear();
}

// =============================================================================
// PathResolver
// =============================================================================

PathResolver::PathResolver(const TransferConfig& config)
    : config_(config)
{
    if (config_.storageRoot.empty()) {
        throw common::ConfigException("PathResolver: storage root cannot be empty");
    }
}

std::string PathResolver::sanitize(const std::string& rawName) {
    if (rawName.empty()) {
        throw common::InvalidInputException("No filename provided");
    }
    if (rawName.find('\0') != std::string::npos) {
        throw common::InvalidInputException("Filename contains a NUL byte");
    }

    auto sep = rawName.find_last_of("/\\");
    std::string baseName = (sep == std::string::npos) ? rawName : rawName.substr(sep + 1);

    if (baseName.empty() || baseName == "." || baseName == "..") {
        throw common::InvalidInputException("Invalid filename: " + rawName);
    }
    return baseName;
}

WriteReservation PathResolver::resolveForWrite(const std::string& baseName) const {
    if (sanitize(baseName) != baseName) {
        throw common::InvalidInputException("Not a bare filename: " + baseName);
    }

    for (unsigned counter = 0;; ++counter) {
        fs::path candidate = config_.storageRoot / candidateName(baseName, counter);

        // "x" = O_EXCL: fails with EEXIST for any existing entry, symlinks included
        std::FILE* f = std::fopen(candidate.c_str(), "wbx");
        if (f) {
            if (counter > 0) {
                spdlog::debug("[PathResolver] {} exists, using {}", baseName, candidate.filename().string());
            }
            return WriteReservation(candidate, f);
        }

        if (errno != EEXIST) {
            throw common::IoFailureException("cannot create " + candidate.filename().string() +
                                             ": " + std::strerror(errno));
        }
    }
}

fs::path PathResolver::resolveForRead(const std::string& baseName) const {
    if (baseName.empty()) {
        throw common::InvalidInputException("No filename provided");
    }
    if (baseName.find('\0') != std::string::npos) {
        throw common::InvalidInputException("Filename contains a NUL byte");
    }

    fs::path root = canonicalRoot();

    std::error_code ec;
    fs::path candidate = fs::weakly_canonical(config_.storageRoot / baseName, ec);
    if (ec) {
        throw common::IoFailureException("cannot resolve " + baseName + ": " + ec.message());
    }

    if (!isDescendant(candidate, root)) {
        spdlog::warn("[PathResolver] Access denied: '{}' resolves to {}", baseName, candidate.string());
        throw common::AccessDeniedException("Access denied");
    }
    return candidate;
}

bool PathResolver::isContained(const fs::path& canonicalPath) const {
    return isDescendant(canonicalPath, canonicalRoot());
}

fs::path PathResolver::canonicalRoot() const {
    std::error_code ec;
    fs::path root = fs::canonical(config_.storageRoot, ec);
    if (ec) {
        throw common::IoFailureException("storage root unavailable: " + ec.message());
    }
    return root;
}

std::string candidateName(const std::string& baseName, unsigned counter) {
    if (counter == 0) {
        return baseName;
    }
    fs::path p(baseName);
    return p.stem().string() + "_" + std::to_string(counter) + p.extension().string();
}

} // namespace flashare::transfer
