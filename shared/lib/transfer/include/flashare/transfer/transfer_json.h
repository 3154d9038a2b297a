/**
 * @file transfer_json.h
 * @brief JSON mapping of transfer results (jsoncpp)
 *
 * Field names follow the HTTP API: snake_case, with size_human next to
 * every byte count.
 */

#pragma once

#include <json/json.h>
#include "types.h"

namespace flashare::transfer {

/// @brief {name, size, size_human, modified, type}
Json::Value toJson(const StoredFile& file);

/// @brief {success, filename, size, size_human, type} or {success, filename, error}
Json::Value toJson(const UploadOutcome& outcome);

/// @brief {filename, success} plus error when failed
Json::Value toJson(const DeleteOutcome& outcome);

/**
 * @brief {total, successful, failed}
 * @param includeSize Add total_size and total_size_human (upload batches)
 */
Json::Value toJson(const BatchSummary& summary, bool includeSize);

/// @brief {success, files: [...], summary: {...}}
Json::Value toJson(const UploadBatchResult& result);

/// @brief {success, results: [...], summary: {...}}
Json::Value toJson(const DeleteBatchResult& result);

/// @brief Array of toJson(StoredFile)
Json::Value toJson(const std::vector<StoredFile>& files);

} // namespace flashare::transfer
