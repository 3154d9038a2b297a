#pragma once

/**
 * @file app_config.h
 * @brief Application configuration loaded from environment variables and flags
 *
 * Built once in main() and handed to ServiceContainer; nothing reads the
 * environment after startup.
 */

#include <string>
#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include <flashare/transfer/types.h>
#include "exceptions.h"

struct AppConfig {
    std::string host = "0.0.0.0";
    int serverPort = 8000;
    int threadNum = 4;
    int maxBodySizeMB = 10240;  // HTTP upload body size limit (MB)

    // Storage
    std::string uploadsDir = "./uploads";
    std::string staticDir = "./static";

    // Transfer engine
    int chunkSize = 64 * 1024;
    int zstdLevel = 3;
    int batchWorkers = 4;

    // URL reported by /api/status; derived from host:port when empty
    std::string publicUrl;

    // Logging
    std::string logLevel = "info";
    std::string logFile;  // Empty: console only

    bool helpRequested = false;

    // Safe environment variable integer parser with range clamping
    static int envStoi(const char* val, int defaultVal, int minVal, int maxVal) {
        try {
            int v = std::stoi(val);
            return std::clamp(v, minVal, maxVal);
        } catch (const std::exception&) {
            spdlog::warn("Invalid integer env value '{}', using default {}", val, defaultVal);
            return defaultVal;
        }
    }

    // Strict flag integer parser: out-of-range or malformed values are errors
    static int flagStoi(const std::string& flag, const std::string& val, int minVal, int maxVal) {
        int v = 0;
        try {
            size_t pos = 0;
            v = std::stoi(val, &pos);
            if (pos != val.size()) throw std::invalid_argument(val);
        } catch (const std::exception&) {
            throw flashare::common::ConfigException(flag + " expects an integer, got '" + val + "'");
        }
        if (v < minVal || v > maxVal) {
            throw flashare::common::ConfigException(flag + " must be between " + std::to_string(minVal) +
                                                    " and " + std::to_string(maxVal));
        }
        return v;
    }

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("FLASHARE_HOST")) config.host = val;
        if (auto val = std::getenv("FLASHARE_PORT")) config.serverPort = envStoi(val, 8000, 1, 65535);
        if (auto val = std::getenv("FLASHARE_THREAD_NUM")) config.threadNum = envStoi(val, 4, 1, 128);
        if (auto val = std::getenv("FLASHARE_MAX_BODY_SIZE_MB")) config.maxBodySizeMB = envStoi(val, 10240, 1, 102400);

        if (auto val = std::getenv("FLASHARE_UPLOADS_DIR")) config.uploadsDir = val;
        if (auto val = std::getenv("FLASHARE_STATIC_DIR")) config.staticDir = val;

        if (auto val = std::getenv("FLASHARE_CHUNK_SIZE")) config.chunkSize = envStoi(val, 64 * 1024, 4096, 16 * 1024 * 1024);
        if (auto val = std::getenv("FLASHARE_ZSTD_LEVEL")) config.zstdLevel = envStoi(val, 3, 1, 22);
        if (auto val = std::getenv("FLASHARE_BATCH_WORKERS")) config.batchWorkers = envStoi(val, 4, 1, 64);

        if (auto val = std::getenv("FLASHARE_PUBLIC_URL")) config.publicUrl = val;

        if (auto val = std::getenv("FLASHARE_LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("FLASHARE_LOG_FILE")) config.logFile = val;

        return config;
    }

    /**
     * @brief Override values from command-line flags
     *
     * Flags take precedence over the environment. Accepts "--flag value"
     * and "--flag=value".
     *
     * @throws flashare::common::ConfigException on unknown flags or bad values
     */
    void applyArguments(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;
            bool hasValue = false;

            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                hasValue = true;
            }

            if (arg == "--help" || arg == "-h") {
                helpRequested = true;
                continue;
            }

            if (!hasValue) {
                if (i + 1 >= argc) {
                    throw flashare::common::ConfigException("missing value for " + arg);
                }
                value = argv[++i];
            }

            if (arg == "--host") host = value;
            else if (arg == "--port" || arg == "-p") serverPort = flagStoi(arg, value, 1, 65535);
            else if (arg == "--threads") threadNum = flagStoi(arg, value, 1, 128);
            else if (arg == "--max-body-mb") maxBodySizeMB = flagStoi(arg, value, 1, 102400);
            else if (arg == "--dir" || arg == "-d") uploadsDir = value;
            else if (arg == "--static") staticDir = value;
            else if (arg == "--chunk-size") chunkSize = flagStoi(arg, value, 4096, 16 * 1024 * 1024);
            else if (arg == "--level") zstdLevel = flagStoi(arg, value, 1, 22);
            else if (arg == "--workers") batchWorkers = flagStoi(arg, value, 1, 64);
            else if (arg == "--url") publicUrl = value;
            else if (arg == "--log-level") logLevel = value;
            else if (arg == "--log-file") logFile = value;
            else throw flashare::common::ConfigException("unknown option " + arg);
        }
    }

    // Validate values that cannot be clamped
    void validate() const {
        if (uploadsDir.empty()) {
            throw flashare::common::ConfigException("uploads directory cannot be empty");
        }
        if (host.empty()) {
            throw flashare::common::ConfigException("listen host cannot be empty");
        }
    }

    flashare::transfer::TransferConfig toTransferConfig() const {
        flashare::transfer::TransferConfig tc;
        tc.storageRoot = uploadsDir;
        tc.chunkSize = static_cast<std::size_t>(chunkSize);
        tc.compressionLevel = zstdLevel;
        tc.batchWorkers = batchWorkers;
        return tc;
    }

    std::string serverUrl() const {
        if (!publicUrl.empty()) return publicUrl;
        return "http://" + host + ":" + std::to_string(serverPort);
    }

    static std::string usage() {
        std::ostringstream os;
        os << "Usage: flashare-server [options]\n"
           << "  --host <addr>        Listen address (FLASHARE_HOST, default 0.0.0.0)\n"
           << "  -p, --port <n>       Listen port (FLASHARE_PORT, default 8000)\n"
           << "  -d, --dir <path>     Storage root (FLASHARE_UPLOADS_DIR, default ./uploads)\n"
           << "  --static <path>      Document root (FLASHARE_STATIC_DIR, default ./static)\n"
           << "  --chunk-size <n>     Streamed I/O chunk bytes (FLASHARE_CHUNK_SIZE, default 65536)\n"
           << "  --level <n>          zstd level 1-22 (FLASHARE_ZSTD_LEVEL, default 3)\n"
           << "  --workers <n>        Batch worker threads (FLASHARE_BATCH_WORKERS, default 4)\n"
           << "  --threads <n>        HTTP I/O threads (FLASHARE_THREAD_NUM, default 4)\n"
           << "  --max-body-mb <n>    Request body limit (FLASHARE_MAX_BODY_SIZE_MB, default 10240)\n"
           << "  --url <url>          URL shown by /api/status (FLASHARE_PUBLIC_URL)\n"
           << "  --log-level <lvl>    trace|debug|info|warn|error|critical (FLASHARE_LOG_LEVEL)\n"
           << "  --log-file <path>    Rotating log file (FLASHARE_LOG_FILE)\n"
           << "  -h, --help           Show this help\n";
        return os.str();
    }
};
