/**
 * @file file_category.h
 * @brief Extension to FileCategory lookup
 */

#pragma once

#include <string>
#include "types.h"

namespace flashare::transfer {

/**
 * @brief Normalized extension of a filename
 *
 * Lowercase, without the leading dot. Empty when the name has no extension
 * or is a dotfile such as ".bashrc".
 */
std::string fileExtension(const std::string& filename);

/**
 * @brief Categorize a filename by extension (case-insensitive)
 * @return Matching category, FileCategory::FILE when the extension is unknown
 */
FileCategory categorize(const std::string& filename);

/// @brief Wire name of a category ("image", "video", "audio", "document", "file")
std::string categoryToString(FileCategory category);

} // namespace flashare::transfer
