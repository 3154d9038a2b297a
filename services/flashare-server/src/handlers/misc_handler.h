#pragma once

/**
 * @file misc_handler.h
 * @brief Service information endpoints
 *
 * Provides:
 * - GET /api/status  - Server URL, storage root and storage statistics
 * - GET /api/health  - Liveness probe
 * - GET /            - Bundled web UI, or a JSON banner when none is installed
 */

#include <drogon/HttpAppFramework.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace flashare::transfer {
    class TransferService;
}

namespace handlers {

class MiscHandler {
public:
    /**
     * @brief Construct MiscHandler
     * @param transferService Transfer service (non-owning pointer)
     * @param serverUrl URL reported to clients
     * @param staticDir Directory holding index.html
     * @throws std::invalid_argument if transferService is nullptr
     */
    MiscHandler(flashare::transfer::TransferService* transferService,
                std::string serverUrl,
                std::filesystem::path staticDir);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    flashare::transfer::TransferService* transferService_;
    std::string serverUrl_;
    std::filesystem::path staticDir_;
    std::chrono::steady_clock::time_point startTime_;

    /**
     * @brief GET /api/status
     *
     * Response:
     * {
     *   "status": "online",
     *   "url": "http://192.168.0.10:8000",
     *   "uploads_dir": "/srv/uploads",
     *   "file_count": 3,
     *   "total_size": 4096,
     *   "total_size_human": "4.0 KB",
     *   "uptime_seconds": 120,
     *   "version": "1.0.0"
     * }
     */
    void handleStatus(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleRoot(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
