#pragma once

/**
 * @file background_tasks.h
 * @brief Counted detached worker threads
 *
 * Handlers hand long copies and batch fan-outs to a detached thread and
 * answer the Drogon callback from there. The counter lets shutdown wait for
 * those threads before the services they use are destroyed.
 */

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

namespace flashare::common {

class BackgroundTasks {
public:
    BackgroundTasks() = default;

    ~BackgroundTasks() {
        drain();
    }

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    /**
     * @brief Run task on a detached thread, counted until it returns
     * @throws std::system_error if the thread cannot be started
     */
    void launch(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++inFlight_;
        }

        try {
            std::thread([this, task = std::move(task)]() {
                try {
                    task();
                } catch (const std::exception& e) {
                    spdlog::error("[BackgroundTasks] Task failed: {}", e.what());
                }
                finish();
            }).detach();
        } catch (const std::system_error&) {
            finish();
            throw;
        }
    }

    /**
     * @brief Block until every launched task has returned
     */
    void drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (inFlight_ > 0) {
            spdlog::info("[BackgroundTasks] Waiting for {} task(s)", inFlight_);
        }
        cv_.wait(lock, [this] { return inFlight_ == 0; });
    }

    std::size_t inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inFlight_;
    }

private:
    void finish() {
        // Notify under the lock: a drained owner may be destroyed right after
        std::lock_guard<std::mutex> lock(mutex_);
        --inFlight_;
        cv_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t inFlight_ = 0;
};

} // namespace flashare::common
