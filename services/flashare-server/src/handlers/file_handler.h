#pragma once

/**
 * @file file_handler.h
 * @brief Stored file endpoints handler
 *
 * Provides:
 * - GET    /api/files                - List stored files
 * - GET    /api/download/{filename}  - Download (zstd by default, ?compressed=false for raw)
 * - DELETE /api/files/{filename}     - Delete one file
 * - DELETE /api/files                - Delete a batch of files
 */

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>
#include <vector>

namespace flashare::common {
    class BackgroundTasks;
}

namespace flashare::transfer {
    class TransferService;
}

namespace handlers {

/**
 * @brief Names from a batch delete body
 *
 * Accepts a bare array or {"filenames": [...]}. An empty list is valid.
 *
 * @throws flashare::common::BadRequestException on any other shape or a non-string entry
 */
std::vector<std::string> parseFilenameList(const Json::Value& body);

class FileHandler {
public:
    /**
     * @brief Construct FileHandler
     * @param transferService Transfer service (non-owning pointer)
     * @param tasks Worker threads for batch deletes (non-owning pointer)
     * @throws std::invalid_argument if either pointer is nullptr
     */
    FileHandler(flashare::transfer::TransferService* transferService,
                flashare::common::BackgroundTasks* tasks);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    flashare::transfer::TransferService* transferService_;
    flashare::common::BackgroundTasks* tasks_;

    void handleListFiles(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief GET /api/download/{filename}
     *
     * Streams the file in bounded chunks. Compressed responses carry
     * "Content-Encoding: zstd" and no Content-Length; raw responses carry
     * the exact Content-Length.
     */
    void handleDownload(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& filename);

    void handleDelete(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& filename);

    /**
     * @brief DELETE /api/files
     *
     * Body: {"filenames": ["a.txt", "b.txt"]} or a bare JSON array.
     * Runs on a worker thread; the response arrives once every name was tried.
     */
    void handleDeleteMultiple(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
