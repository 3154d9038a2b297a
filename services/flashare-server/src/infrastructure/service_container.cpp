/**
 * @file service_container.cpp
 * @brief Flashare ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"
#include "../common/background_tasks.h"

#include <spdlog/spdlog.h>

#include <flashare/transfer/transfer_service.h>

// Handlers
#include "../handlers/file_handler.h"
#include "../handlers/upload_handler.h"
#include "../handlers/misc_handler.h"

namespace infrastructure {

struct ServiceContainer::Impl {
    // Worker threads use the service and handlers; destroyed last
    std::unique_ptr<flashare::common::BackgroundTasks> tasks =
        std::make_unique<flashare::common::BackgroundTasks>();

    // Referenced by TransferService and PathResolver; must outlive both
    std::unique_ptr<flashare::transfer::TransferConfig> transferConfig;

    // Services
    std::unique_ptr<flashare::transfer::TransferService> transferService;

    // Handlers
    std::unique_ptr<handlers::FileHandler> fileHandler;
    std::unique_ptr<handlers::UploadHandler> uploadHandler;
    std::unique_ptr<handlers::MiscHandler> miscHandler;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing Flashare dependencies...");

    try {
        config.validate();

        // Step 1: Transfer configuration
        impl_->transferConfig = std::make_unique<flashare::transfer::TransferConfig>(
            config.toTransferConfig());

        // Step 2: Transfer service (creates the storage root)
        impl_->transferService = std::make_unique<flashare::transfer::TransferService>(
            *impl_->transferConfig);

        // Step 3: Handlers
        impl_->fileHandler = std::make_unique<handlers::FileHandler>(
            impl_->transferService.get(), impl_->tasks.get());
        impl_->uploadHandler = std::make_unique<handlers::UploadHandler>(
            impl_->transferService.get(), impl_->tasks.get());
        impl_->miscHandler = std::make_unique<handlers::MiscHandler>(
            impl_->transferService.get(), config.serverUrl(), config.staticDir);

        spdlog::info("All Flashare dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize Flashare: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    spdlog::info("Shutting down Flashare dependencies...");

    impl_->tasks->drain();

    // Delete in reverse order of initialization
    impl_->miscHandler.reset();
    impl_->uploadHandler.reset();
    impl_->fileHandler.reset();
    impl_->transferService.reset();
    impl_->transferConfig.reset();
}

flashare::transfer::TransferService* ServiceContainer::transferService() const {
    return impl_->transferService.get();
}

handlers::FileHandler* ServiceContainer::fileHandler() const {
    return impl_->fileHandler.get();
}

handlers::UploadHandler* ServiceContainer::uploadHandler() const {
    return impl_->uploadHandler.get();
}

handlers::MiscHandler* ServiceContainer::miscHandler() const {
    return impl_->miscHandler.get();
}

} // namespace infrastructure
