/**
 * @file file_handler.cpp
 * @brief FileHandler implementation
 */

#include "file_handler.h"
#include "../common/background_tasks.h"
#include "../common/handler_utils.h"

#include <flashare/transfer/transfer_service.h>
#include <flashare/transfer/transfer_json.h>
#include <flashare/utils/string_utils.h>

#include <json/json.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace handlers {

using flashare::common::handler::badRequest;
using flashare::common::handler::errorResponse;
using flashare::common::handler::internalError;
using flashare::common::handler::jsonError;
using flashare::common::handler::statusFor;

std::vector<std::string> parseFilenameList(const Json::Value& body) {
    const Json::Value* list = &body;
    if (body.isObject()) {
        list = &body["filenames"];
    }
    if (!list->isArray()) {
        throw flashare::common::BadRequestException("Expected a list of filenames");
    }

    std::vector<std::string> names;
    names.reserve(list->size());
    for (const auto& item : *list) {
        if (!item.isString()) {
            throw flashare::common::BadRequestException("Filenames must be strings");
        }
        names.push_back(item.asString());
    }
    return names;
}

FileHandler::FileHandler(flashare::transfer::TransferService* transferService,
                         flashare::common::BackgroundTasks* tasks)
    : transferService_(transferService), tasks_(tasks) {
    if (!transferService_) {
        throw std::invalid_argument("FileHandler: transferService cannot be nullptr");
    }
    if (!tasks_) {
        throw std::invalid_argument("FileHandler: tasks cannot be nullptr");
    }
    spdlog::info("[FileHandler] Initialized");
}

void FileHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /api/files
    app.registerHandler(
        "/api/files",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleListFiles(req, std::move(callback));
        },
        {drogon::Get}
    );

    // DELETE /api/files
    app.registerHandler(
        "/api/files",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleDeleteMultiple(req, std::move(callback));
        },
        {drogon::Delete}
    );

    // GET /api/download/{filename}
    app.registerHandler(
        "/api/download/{filename}",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& filename) {
            handleDownload(req, std::move(callback), filename);
        },
        {drogon::Get}
    );

    // DELETE /api/files/{filename}
    app.registerHandler(
        "/api/files/{filename}",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& filename) {
            handleDelete(req, std::move(callback), filename);
        },
        {drogon::Delete}
    );

    spdlog::info("[FileHandler] Routes registered");
}

void FileHandler::handleListFiles(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        auto files = transferService_->listFiles();
        callback(drogon::HttpResponse::newHttpJsonResponse(flashare::transfer::toJson(files)));
    } catch (const flashare::common::FlashareException& e) {
        callback(errorResponse("FileHandler", e));
    } catch (const std::exception& e) {
        callback(internalError("FileHandler::listFiles", e));
    }
}

void FileHandler::handleDownload(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& filename) {

    spdlog::debug("GET /api/download/{}", filename);

    bool compressed = true;
    const std::string& param = req->getParameter("compressed");
    if (!param.empty()) {
        auto parsed = flashare::utils::parseBool(param);
        if (!parsed) {
            callback(badRequest("Invalid value for compressed: " + param));
            return;
        }
        compressed = *parsed;
    }

    try {
        auto download = transferService_->download(filename, compressed);
        auto pump = std::make_shared<flashare::transfer::StreamPump>(std::move(download.stream));
        std::string name = download.filename;

        auto resp = drogon::HttpResponse::newStreamResponse(
            [pump, name](char* buffer, std::size_t len) -> std::size_t {
                if (!buffer) {
                    // Connection closed or response finished
                    pump->abort();
                    return 0;
                }
                try {
                    return pump->fill(buffer, len);
                } catch (const std::exception& e) {
                    spdlog::error("[FileHandler] Download of {} aborted after {} bytes: {}",
                                  name, pump->bytesSent(), e.what());
                    pump->abort();
                    return 0;
                }
            },
            download.filename,
            drogon::CT_APPLICATION_OCTET_STREAM);

        if (download.compressed) {
            resp->addHeader("Content-Encoding", "zstd");
        } else if (download.contentLength) {
            resp->addHeader("Content-Length", std::to_string(*download.contentLength));
        }
        callback(resp);

    } catch (const flashare::common::FlashareException& e) {
        callback(errorResponse("FileHandler", e));
    } catch (const std::exception& e) {
        callback(internalError("FileHandler::download", e));
    }
}

void FileHandler::handleDelete(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& filename) {

    auto outcome = transferService_->deleteOne(filename);

    if (outcome.status != flashare::transfer::DeleteStatus::DELETED) {
        callback(jsonError(statusFor(outcome.status), outcome.error));
        return;
    }

    Json::Value body;
    body["success"] = true;
    body["deleted"] = outcome.filename;
    callback(drogon::HttpResponse::newHttpJsonResponse(body));
}

void FileHandler::handleDeleteMultiple(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto json = req->getJsonObject();
    if (!json) {
        callback(badRequest("Request body must be JSON"));
        return;
    }

    std::vector<std::string> names;
    try {
        names = parseFilenameList(*json);
    } catch (const flashare::common::FlashareException& e) {
        callback(errorResponse("FileHandler", e));
        return;
    }

    spdlog::info("[FileHandler] Batch delete of {} files", names.size());

    auto respond = std::make_shared<std::function<void(const drogon::HttpResponsePtr&)>>(std::move(callback));
    try {
        tasks_->launch([this, names = std::move(names), respond]() {
            try {
                auto result = transferService_->deleteBatch(names);
                (*respond)(drogon::HttpResponse::newHttpJsonResponse(flashare::transfer::toJson(result)));
            } catch (const std::exception& e) {
                (*respond)(internalError("FileHandler::deleteMultiple", e));
            }
        });
    } catch (const std::system_error& e) {
        (*respond)(internalError("FileHandler::deleteMultiple", e));
    }
}

} // namespace handlers
