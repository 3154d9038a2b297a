/** @file misc_handler.cpp
 *  @brief MiscHandler implementation
 */

#include "misc_handler.h"
#include "../common/handler_utils.h"

#include <flashare/transfer/transfer_service.h>
#include <flashare/utils/string_utils.h>

#include <json/json.h>
#include <spdlog/spdlog.h>
#include <trantor/utils/Date.h>
#include <stdexcept>
#include <system_error>

#ifndef FLASHARE_VERSION
#define FLASHARE_VERSION "1.0.0"
#endif

namespace handlers {

MiscHandler::MiscHandler(flashare::transfer::TransferService* transferService,
                         std::string serverUrl,
                         std::filesystem::path staticDir)
    : transferService_(transferService),
      serverUrl_(std::move(serverUrl)),
      staticDir_(std::move(staticDir)),
      startTime_(std::chrono::steady_clock::now()) {
    if (!transferService_) {
        throw std::invalid_argument("MiscHandler: transferService cannot be nullptr");
    }
    spdlog::info("[MiscHandler] Initialized");
}

void MiscHandler::registerRoutes(drogon::HttpAppFramework& app) {
    app.registerHandler(
        "/api/status",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleStatus(req, std::move(callback));
        },
        {drogon::Get}
    );

    app.registerHandler(
        "/api/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    app.registerHandler(
        "/",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleRoot(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[MiscHandler] Routes registered");
}

void MiscHandler::handleStatus(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        auto storage = transferService_->status();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_).count();

        Json::Value result;
        result["status"] = "online";
        result["url"] = serverUrl_;
        result["uploads_dir"] = transferService_->storageRoot().string();
        result["file_count"] = static_cast<Json::UInt64>(storage.fileCount);
        result["total_size"] = static_cast<Json::UInt64>(storage.totalSize);
        result["total_size_human"] = flashare::utils::formatSize(storage.totalSize);
        result["uptime_seconds"] = static_cast<Json::Int64>(uptime);
        result["version"] = FLASHARE_VERSION;

        callback(drogon::HttpResponse::newHttpJsonResponse(result));
    } catch (const std::exception& e) {
        callback(flashare::common::handler::internalError("MiscHandler::status", e));
    }
}

void MiscHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value result;
    result["service"] = "flashare";
    result["status"] = "UP";
    result["version"] = FLASHARE_VERSION;
    result["timestamp"] = trantor::Date::now().toFormattedString(false);

    callback(drogon::HttpResponse::newHttpJsonResponse(result));
}

void MiscHandler::handleRoot(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    std::error_code ec;
    auto index = staticDir_ / "index.html";
    if (std::filesystem::is_regular_file(index, ec)) {
        callback(drogon::HttpResponse::newFileResponse(index.string()));
        return;
    }

    Json::Value result;
    result["app"] = "Flashare";
    result["version"] = FLASHARE_VERSION;
    result["message"] = "Web UI not installed; the API is available under /api";
    callback(drogon::HttpResponse::newHttpJsonResponse(result));
}

} // namespace handlers
