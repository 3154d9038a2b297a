/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Provides consistent exception types for the transfer core and the server.
 * Every exception carries an ErrorKind so the HTTP boundary can map it to a
 * fixed status code without inspecting message text.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace flashare::common {

/// @brief Failure classes reported by the transfer core
enum class ErrorKind {
    INVALID_INPUT,  ///< Missing or empty filename
    ACCESS_DENIED,  ///< Path escapes the storage root
    NOT_FOUND,      ///< Target file does not exist
    BAD_REQUEST,    ///< Target exists but is not a regular file
    IO_FAILURE,     ///< Underlying read/write/delete error
    CONFIG          ///< Invalid configuration value
};

/// @brief Convert ErrorKind to its wire name
inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorKind::ACCESS_DENIED: return "ACCESS_DENIED";
        case ErrorKind::NOT_FOUND:     return "NOT_FOUND";
        case ErrorKind::BAD_REQUEST:   return "BAD_REQUEST";
        case ErrorKind::IO_FAILURE:    return "IO_FAILURE";
        case ErrorKind::CONFIG:        return "CONFIG";
    }
    return "UNKNOWN";
}

/**
 * @brief Base exception for all Flashare exceptions
 */
class FlashareException : public std::runtime_error {
public:
    FlashareException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Filename missing, empty or otherwise unusable
 */
class InvalidInputException : public FlashareException {
public:
    explicit InvalidInputException(const std::string& message)
        : FlashareException(ErrorKind::INVALID_INPUT, message) {}
};

/**
 * @brief Resolved path lies outside the storage root
 */
class AccessDeniedException : public FlashareException {
public:
    explicit AccessDeniedException(const std::string& message)
        : FlashareException(ErrorKind::ACCESS_DENIED, message) {}
};

/**
 * @brief File not found
 */
class NotFoundException : public FlashareException {
public:
    explicit NotFoundException(const std::string& message)
        : FlashareException(ErrorKind::NOT_FOUND, message) {}
};

/**
 * @brief Target is not a regular file
 */
class BadRequestException : public FlashareException {
public:
    explicit BadRequestException(const std::string& message)
        : FlashareException(ErrorKind::BAD_REQUEST, message) {}
};

/**
 * @brief Filesystem operation failed
 */
class IoFailureException : public FlashareException {
public:
    explicit IoFailureException(const std::string& message)
        : FlashareException(ErrorKind::IO_FAILURE, "I/O error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public FlashareException {
public:
    explicit ConfigException(const std::string& message)
        : FlashareException(ErrorKind::CONFIG, "Configuration error: " + message) {}
};

} // namespace flashare::common
