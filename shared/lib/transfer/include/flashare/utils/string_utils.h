/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used across Flashare components.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flashare {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Human-readable byte count
 *
 * Below 1024 the exact count is shown ("512 B"); above, one decimal in
 * 1024-based units ("1.5 KB", "10.0 MB", "2.3 GB", "1.0 TB").
 *
 * @param bytes Byte count
 * @return Formatted size
 */
std::string formatSize(std::uint64_t bytes);

/**
 * @brief Parse a boolean query or environment value
 *
 * Accepts true/false, 1/0, yes/no, on/off (case-insensitive, trimmed).
 *
 * @param value Input string
 * @return Parsed value, std::nullopt if unrecognized
 */
std::optional<bool> parseBool(const std::string& value);

} // namespace utils
} // namespace flashare
