#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for Flashare dependency management
 *
 * Owns the transfer configuration, the transfer service, the handlers and
 * the worker threads they start. Provides non-owning pointer accessors for
 * route registration.
 */

#include <memory>

struct AppConfig;

namespace flashare::transfer {
    class TransferService;
}

namespace handlers {
    class FileHandler;
    class UploadHandler;
    class MiscHandler;
}

namespace infrastructure {

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Wait for in-flight uploads and deletes, then release all resources
     *
     * Called automatically by destructor.
     */
    void shutdown();

    // --- Service Accessors ---
    flashare::transfer::TransferService* transferService() const;

    // --- Handler Accessors ---
    handlers::FileHandler* fileHandler() const;
    handlers::UploadHandler* uploadHandler() const;
    handlers::MiscHandler* miscHandler() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
