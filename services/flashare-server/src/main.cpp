/**
 * @file main.cpp
 * @brief Flashare - local network file transfer server
 *
 * Drogon REST API for uploading, listing, downloading (raw or zstd
 * compressed) and deleting files in a single storage directory.
 *
 * @version 1.0.0
 */

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

#include "logger.h"
#include "exceptions.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "handlers/file_handler.h"
#include "handlers/upload_handler.h"
#include "handlers/misc_handler.h"

#ifndef FLASHARE_VERSION
#define FLASHARE_VERSION "1.0.0"
#endif

namespace {

/**
 * @brief Print application banner
 */
void printBanner() {
    std::cout << R"(
  _____ _           _
 |  ___| | __ _ ___| |__   __ _ _ __ ___
 | |_  | |/ _` / __| '_ \ / _` | '__/ _ \
 |  _| | | (_| \__ \ | | | (_| | | |  __/
 |_|   |_|\__,_|___/_| |_|\__,_|_|  \___|

)" << std::endl;
    std::cout << "  Flashare - Local Network File Transfer" << std::endl;
    std::cout << "  Version: " << FLASHARE_VERSION << std::endl;
    std::cout << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Load configuration: environment first, flags override
    AppConfig config = AppConfig::fromEnvironment();
    try {
        config.applyArguments(argc, argv);
    } catch (const flashare::common::ConfigException& e) {
        std::cerr << e.what() << "\n\n" << AppConfig::usage();
        return 1;
    }

    if (config.helpRequested) {
        std::cout << AppConfig::usage();
        return 0;
    }

    printBanner();

    // Initialize logging
    flashare::common::Logger::initialize("flashare", config.logLevel, config.logFile);

    spdlog::info("Starting Flashare...");
    spdlog::info("Storage root: {}", config.uploadsDir);
    spdlog::info("Transfer: chunk {} bytes, zstd level {}, {} batch workers",
                 config.chunkSize, config.zstdLevel, config.batchWorkers);

    infrastructure::ServiceContainer services;
    if (!services.initialize(config)) {
        spdlog::critical("Startup aborted");
        flashare::common::Logger::flush();
        return 1;
    }

    try {
        auto& app = drogon::app();

        // Server settings
        app.setLogLevel(trantor::Logger::kInfo)
           .addListener(config.host, static_cast<uint16_t>(config.serverPort))
           .setThreadNum(config.threadNum)
           .enableGzip(true)
           .setClientMaxBodySize(static_cast<size_t>(config.maxBodySizeMB) * 1024 * 1024)
           .setDocumentRoot(config.staticDir);

        // Enable CORS
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                         const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            resp->addHeader("Access-Control-Expose-Headers", "Content-Disposition, Content-Encoding");
        });

        // Handle OPTIONS requests for CORS preflight
        app.registerHandler(
            "/{path}",
            [](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& /* path */) {
                auto resp = drogon::HttpResponse::newHttpResponse();
                resp->setStatusCode(drogon::k204NoContent);
                callback(resp);
            },
            {drogon::Options}
        );

        // Register routes
        services.fileHandler()->registerRoutes(app);
        services.uploadHandler()->registerRoutes(app);
        services.miscHandler()->registerRoutes(app);

        spdlog::info("Server starting on {}", config.serverUrl());
        spdlog::info("Press Ctrl+C to stop the server");

        // Run the server
        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        flashare::common::Logger::flush();
        return 1;
    }

    services.shutdown();
    spdlog::info("Server stopped");
    flashare::common::Logger::flush();
    return 0;
}
