#pragma once

#include <string>
#include <json/json.h>
#include <drogon/HttpResponse.h>
#include <spdlog/spdlog.h>

#include "exceptions.h"
#include <flashare/transfer/types.h>

/**
 * @file handler_utils.h
 * @brief Handler-level error responses
 *
 * Provides:
 *   - statusFor():     ErrorKind / DeleteStatus -> HTTP status
 *   - errorResponse(): {success:false, error} with the mapped status
 *   - internalError(): sanitized 500 response (logs real error, returns generic message)
 *   - badRequest():    sanitized 400 response
 *
 * Core exception messages are short, client-safe diagnostics; anything
 * else is logged and replaced by a generic message.
 */

namespace flashare::common::handler {

/**
 * Fixed status for each error kind.
 */
inline drogon::HttpStatusCode statusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT: return drogon::k400BadRequest;
        case ErrorKind::ACCESS_DENIED: return drogon::k403Forbidden;
        case ErrorKind::NOT_FOUND:     return drogon::k404NotFound;
        case ErrorKind::BAD_REQUEST:   return drogon::k400BadRequest;
        case ErrorKind::IO_FAILURE:    return drogon::k500InternalServerError;
        case ErrorKind::CONFIG:        return drogon::k500InternalServerError;
    }
    return drogon::k500InternalServerError;
}

/**
 * Status for a single-file delete outcome.
 */
inline drogon::HttpStatusCode statusFor(flashare::transfer::DeleteStatus status) {
    switch (status) {
        case flashare::transfer::DeleteStatus::DELETED:     return drogon::k200OK;
        case flashare::transfer::DeleteStatus::NOT_FOUND:   return drogon::k404NotFound;
        case flashare::transfer::DeleteStatus::DENIED:      return drogon::k403Forbidden;
        case flashare::transfer::DeleteStatus::BAD_REQUEST: return drogon::k400BadRequest;
        case flashare::transfer::DeleteStatus::FAILED:      return drogon::k500InternalServerError;
    }
    return drogon::k500InternalServerError;
}

/**
 * JSON error body with an explicit status.
 */
inline drogon::HttpResponsePtr jsonError(drogon::HttpStatusCode status, const std::string& publicMessage) {
    Json::Value body;
    body["success"] = false;
    body["error"] = publicMessage;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(status);
    return resp;
}

/**
 * Response for a classified core failure.
 */
inline drogon::HttpResponsePtr errorResponse(const std::string& logContext, const FlashareException& e) {
    if (e.kind() == ErrorKind::IO_FAILURE || e.kind() == ErrorKind::CONFIG) {
        spdlog::error("[{}] {} ({})", logContext, e.what(), errorKindToString(e.kind()));
    } else {
        spdlog::warn("[{}] {} ({})", logContext, e.what(), errorKindToString(e.kind()));
    }
    return jsonError(statusFor(e.kind()), e.what());
}

/**
 * Create sanitized 500 Internal Server Error response.
 * Logs real exception details server-side; returns generic message to client.
 */
inline drogon::HttpResponsePtr internalError(
    const std::string& logContext, const std::exception& e) {
    spdlog::error("[{}] {}", logContext, e.what());
    return jsonError(drogon::k500InternalServerError, "Internal server error");
}

/**
 * Create sanitized 400 Bad Request response.
 */
inline drogon::HttpResponsePtr badRequest(const std::string& publicMessage) {
    return jsonError(drogon::k400BadRequest, publicMessage);
}

} // namespace flashare::common::handler
