/**
 * @file upload_handler.cpp
 * @brief UploadHandler implementation
 */

#include "upload_handler.h"
#include "../common/background_tasks.h"
#include "../common/handler_utils.h"

#include <flashare/transfer/transfer_service.h>
#include <flashare/transfer/transfer_json.h>

#include <drogon/MultiPart.h>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

namespace handlers {

using flashare::common::handler::badRequest;
using flashare::common::handler::internalError;

namespace {

/**
 * @brief Parse a multipart body, keeping the parser alive with the request
 * @return nullptr if the body is not multipart
 */
std::shared_ptr<drogon::MultiPartParser> parseMultipart(const drogon::HttpRequestPtr& req) {
    auto parser = std::make_shared<drogon::MultiPartParser>();
    if (parser->parse(req) != 0) {
        return nullptr;
    }
    return parser;
}

} // anonymous namespace

UploadHandler::UploadHandler(flashare::transfer::TransferService* transferService,
                             flashare::common::BackgroundTasks* tasks)
    : transferService_(transferService), tasks_(tasks) {
    if (!transferService_) {
        throw std::invalid_argument("UploadHandler: transferService cannot be nullptr");
    }
    if (!tasks_) {
        throw std::invalid_argument("UploadHandler: tasks cannot be nullptr");
    }
    spdlog::info("[UploadHandler] Initialized");
}

void UploadHandler::dispatch(
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    std::function<void(const std::function<void(const drogon::HttpResponsePtr&)>&)> work,
    const char* logContext) {

    auto respond = std::make_shared<std::function<void(const drogon::HttpResponsePtr&)>>(std::move(callback));
    try {
        tasks_->launch([respond, work = std::move(work), logContext]() {
            try {
                work(*respond);
            } catch (const std::exception& e) {
                (*respond)(internalError(logContext, e));
            }
        });
    } catch (const std::system_error& e) {
        (*respond)(internalError(logContext, e));
    }
}

void UploadHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // POST /api/upload
    app.registerHandler(
        "/api/upload",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleUpload(req, std::move(callback));
        },
        {drogon::Post}
    );

    // POST /api/upload-multiple
    app.registerHandler(
        "/api/upload-multiple",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleUploadMultiple(req, std::move(callback));
        },
        {drogon::Post}
    );

    spdlog::info("[UploadHandler] Routes registered");
}

void UploadHandler::handleUpload(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto parser = parseMultipart(req);
    if (!parser) {
        callback(badRequest("Expected multipart/form-data"));
        return;
    }
    if (parser->getFiles().empty()) {
        callback(badRequest("No file provided"));
        return;
    }

    // The parsed file views point into the request body; keep req alive
    dispatch(std::move(callback),
        [this, req, parser](const std::function<void(const drogon::HttpResponsePtr&)>& respond) {
            const auto& file = parser->getFiles().front();
            flashare::transfer::MemoryContentSource content(
                std::string_view(file.fileData(), file.fileLength()));

            auto outcome = transferService_->uploadOne(file.getFileName(), content);
            auto resp = drogon::HttpResponse::newHttpJsonResponse(flashare::transfer::toJson(outcome));
            if (!outcome.success) {
                resp->setStatusCode(drogon::k400BadRequest);
            }
            respond(resp);
        },
        "UploadHandler::upload");
}

void UploadHandler::handleUploadMultiple(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto parser = parseMultipart(req);
    if (!parser) {
        callback(badRequest("Expected multipart/form-data"));
        return;
    }
    if (parser->getFiles().empty()) {
        callback(badRequest("No files provided"));
        return;
    }

    spdlog::info("[UploadHandler] Batch upload of {} files", parser->getFiles().size());

    dispatch(std::move(callback),
        [this, req, parser](const std::function<void(const drogon::HttpResponsePtr&)>& respond) {
            std::vector<flashare::transfer::UploadItem> items;
            items.reserve(parser->getFiles().size());
            for (const auto& file : parser->getFiles()) {
                flashare::transfer::UploadItem item;
                item.name = file.getFileName();
                item.content = std::make_unique<flashare::transfer::MemoryContentSource>(
                    std::string_view(file.fileData(), file.fileLength()));
                items.push_back(std::move(item));
            }

            auto result = transferService_->uploadBatch(items);
            respond(drogon::HttpResponse::newHttpJsonResponse(flashare::transfer::toJson(result)));
        },
        "UploadHandler::uploadMultiple");
}

} // namespace handlers
