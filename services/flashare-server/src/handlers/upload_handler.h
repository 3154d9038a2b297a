#pragma once

/**
 * @file upload_handler.h
 * @brief Upload endpoints handler
 *
 * Provides:
 * - POST /api/upload           - Store one file (multipart field "file")
 * - POST /api/upload-multiple  - Store every file of the request (field "files")
 *
 * Copying runs on a worker thread so large bodies never block an I/O loop.
 */

#include <drogon/HttpAppFramework.h>
#include <functional>

namespace flashare::common {
    class BackgroundTasks;
}

namespace flashare::transfer {
    class TransferService;
}

namespace handlers {

class UploadHandler {
public:
    /**
     * @brief Construct UploadHandler
     * @param transferService Transfer service (non-owning pointer)
     * @param tasks Worker threads for copies (non-owning pointer)
     * @throws std::invalid_argument if either pointer is nullptr
     */
    UploadHandler(flashare::transfer::TransferService* transferService,
                  flashare::common::BackgroundTasks* tasks);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    flashare::transfer::TransferService* transferService_;
    flashare::common::BackgroundTasks* tasks_;

    /**
     * @brief Run work on a counted worker thread, answering 500 if none can start
     */
    void dispatch(std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                  std::function<void(const std::function<void(const drogon::HttpResponsePtr&)>&)> work,
                  const char* logContext);

    /**
     * @brief POST /api/upload
     *
     * Response:
     * {
     *   "success": true,
     *   "filename": "report_1.pdf",
     *   "size": 1024,
     *   "size_human": "1.0 KB",
     *   "type": "document"
     * }
     */
    void handleUpload(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief POST /api/upload-multiple
     *
     * Response: {success, files: [...], summary: {total, successful, failed,
     * total_size, total_size_human}}. success is false if any item failed.
     */
    void handleUploadMultiple(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
