/**
 * @file transfer_json.cpp
 * @brief jsoncpp mapping of transfer results
 */

#include "flashare/transfer/transfer_json.h"
#include "flashare/transfer/file_category.h"
#include "flashare/utils/string_utils.h"

namespace flashare::transfer {

Json::Value toJson(const StoredFile& file) {
    Json::Value item;
    item["name"] = file.name;
    item["size"] = static_cast<Json::UInt64>(file.size);
    item["size_human"] = utils::formatSize(file.size);
    item["modified"] = file.modified;
    item["type"] = categoryToString(file.category);
    return item;
}

Json::Value toJson(const UploadOutcome& outcome) {
    Json::Value item;
    item["success"] = outcome.success;
    item["filename"] = outcome.filename;
    if (outcome.success) {
        item["size"] = static_cast<Json::UInt64>(outcome.size);
        item["size_human"] = utils::formatSize(outcome.size);
        item["type"] = categoryToString(outcome.category);
    } else {
        item["error"] = outcome.error;
    }
    return item;
}

Json::Value toJson(const DeleteOutcome& outcome) {
    Json::Value item;
    item["filename"] = outcome.filename;
    item["success"] = outcome.success();
    if (!outcome.success()) {
        item["error"] = outcome.error;
    }
    return item;
}

Json::Value toJson(const BatchSummary& summary, bool includeSize) {
    Json::Value s;
    s["total"] = static_cast<Json::UInt64>(summary.total);
    s["successful"] = static_cast<Json::UInt64>(summary.successful);
    s["failed"] = static_cast<Json::UInt64>(summary.failed);
    if (includeSize) {
        s["total_size"] = static_cast<Json::UInt64>(summary.totalSize);
        s["total_size_human"] = utils::formatSize(summary.totalSize);
    }
    return s;
}

Json::Value toJson(const UploadBatchResult& result) {
    Json::Value body;
    body["success"] = result.success;
    body["files"] = Json::Value(Json::arrayValue);
    for (const auto& outcome : result.files) {
        body["files"].append(toJson(outcome));
    }
    body["summary"] = toJson(result.summary, true);
    return body;
}

Json::Value toJson(const DeleteBatchResult& result) {
    Json::Value body;
    body["success"] = result.success;
    body["results"] = Json::Value(Json::arrayValue);
    for (const auto& outcome : result.results) {
        body["results"].append(toJson(outcome));
    }
    body["summary"] = toJson(result.summary, false);
    return body;
}

Json::Value toJson(const std::vector<StoredFile>& files) {
    Json::Value list(Json::arrayValue);
    for (const auto& file : files) {
        list.append(toJson(file));
    }
    return list;
}

} // namespace flashare::transfer
