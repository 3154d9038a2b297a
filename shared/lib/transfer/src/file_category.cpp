/**
 * @file file_category.cpp
 * @brief Extension lookup table
 */

#include "flashare/transfer/file_category.h"
#include "flashare/utils/string_utils.h"

#include <filesystem>
#include <unordered_map>

namespace flashare::transfer {

namespace {

const std::unordered_map<std::string, FileCategory>& extensionTable() {
    static const std::unordered_map<std::string, FileCategory> table = {
        // Images
        {"jpg", FileCategory::IMAGE}, {"jpeg", FileCategory::IMAGE},
        {"png", FileCategory::IMAGE}, {"gif", FileCategory::IMAGE},
        {"webp", FileCategory::IMAGE}, {"svg", FileCategory::IMAGE},
        {"heic", FileCategory::IMAGE}, {"bmp", FileCategory::IMAGE},
        // Video
        {"mp4", FileCategory::VIDEO}, {"mov", FileCategory::VIDEO},
        {"avi", FileCategory::VIDEO}, {"mkv", FileCategory::VIDEO},
        {"webm", FileCategory::VIDEO}, {"m4v", FileCategory::VIDEO},
        // Audio
        {"mp3", FileCategory::AUDIO}, {"wav", FileCategory::AUDIO},
        {"flac", FileCategory::AUDIO}, {"aac", FileCategory::AUDIO},
        {"ogg", FileCategory::AUDIO}, {"m4a", FileCategory::AUDIO},
        // Documents
        {"pdf", FileCategory::DOCUMENT}, {"doc", FileCategory::DOCUMENT},
        {"docx", FileCategory::DOCUMENT}, {"txt", FileCategory::DOCUMENT},
        {"rtf", FileCategory::DOCUMENT}, {"md", FileCategory::DOCUMENT},
        {"xls", FileCategory::DOCUMENT}, {"xlsx", FileCategory::DOCUMENT},
        {"csv", FileCategory::DOCUMENT},
    };
    return table;
}

} // anonymous namespace

std::string fileExtension(const std::string& filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    if (ext.size() <= 1) {
        return "";
    }
    return utils::toLower(ext.substr(1));
}

FileCategory categorize(const std::string& filename) {
    const auto& table = extensionTable();
    auto it = table.find(fileExtension(filename));
    return it != table.end() ? it->second : FileCategory::FILE;
}

std::string categoryToString(FileCategory category) {
    switch (category) {
        case FileCategory::IMAGE:    return "image";
        case FileCategory::VIDEO:    return "video";
        case FileCategory::AUDIO:    return "audio";
        case FileCategory::DOCUMENT: return "document";
        case FileCategory::FILE:     return "file";
    }
    return "file";
}

} // namespace flashare::transfer
