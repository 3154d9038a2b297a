/**
 * @file background_tasks_test.cpp
 * @brief Unit tests for counted worker threads
 */

#include <gtest/gtest.h>
#include "../src/common/background_tasks.h"

#include <atomic>
#include <future>
#include <stdexcept>

using flashare::common::BackgroundTasks;

TEST(BackgroundTasksTest, DrainWithNothingPendingReturns) {
    BackgroundTasks tasks;
    tasks.drain();
    EXPECT_EQ(tasks.inFlight(), 0u);
}

TEST(BackgroundTasksTest, DrainWaitsForRunningTasks) {
    BackgroundTasks tasks;
    std::promise<void> gate;
    std::shared_future<void> released = gate.get_future().share();
    std::atomic<int> finished{0};

    for (int i = 0; i < 3; ++i) {
        tasks.launch([released, &finished]() {
            released.wait();
            ++finished;
        });
    }
    EXPECT_EQ(tasks.inFlight(), 3u);
    EXPECT_EQ(finished.load(), 0);

    gate.set_value();
    tasks.drain();

    EXPECT_EQ(finished.load(), 3);
    EXPECT_EQ(tasks.inFlight(), 0u);
}

TEST(BackgroundTasksTest, ThrowingTaskIsCountedDown) {
    BackgroundTasks tasks;
    tasks.launch([]() { throw std::runtime_error("boom"); });
    tasks.drain();
    EXPECT_EQ(tasks.inFlight(), 0u);
}

TEST(BackgroundTasksTest, DestructorWaitsForTasks) {
    std::atomic<bool> done{false};
    std::promise<void> gate;
    std::shared_future<void> released = gate.get_future().share();
    {
        BackgroundTasks tasks;
        tasks.launch([released, &done]() {
            released.wait();
            done = true;
        });
        gate.set_value();
    }
    EXPECT_TRUE(done.load());
}
