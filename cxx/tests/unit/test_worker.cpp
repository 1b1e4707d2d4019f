#include <gtest/gtest.h>
#include "Worker.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <vector>

using namespace megaphone;

TEST(WorkerTest, SubmitReturnsResult) {
    Worker worker("test");
    auto future = worker.submit([]() { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerTest, TasksRunInPostingOrder) {
    Worker worker("test");
    std::vector<int> order;
    for (int i = 0; i < 20; ++i) {
        worker.post([&order, i]() { order.push_back(i); });
    }
    worker.wait_idle();

    ASSERT_EQ(order.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST(WorkerTest, RunsOnItsOwnThread) {
    Worker worker("test");
    EXPECT_FALSE(worker.on_worker_thread());
    auto future = worker.submit([&worker]() { return worker.on_worker_thread(); });
    EXPECT_TRUE(future.get());
}

TEST(WorkerTest, FailingTaskDoesNotStopTheWorker) {
    Worker worker("test");
    worker.post([]() { throw std::runtime_error("boom"); });

    auto failing = worker.submit([]() -> int { throw std::runtime_error("reported"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    auto next = worker.submit([]() { return 1; });
    EXPECT_EQ(next.get(), 1);
}

TEST(WorkerTest, DestructorDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        Worker worker("test");
        for (int i = 0; i < 10; ++i) {
            worker.post([&ran]() { ++ran; });
        }
    }
    EXPECT_EQ(ran.load(), 10);
}

TEST(WorkerTest, IdleTaskRunsWhileQueueIsEmpty) {
    Worker worker("test");
    std::atomic<int> runs{0};
    worker.set_idle_task([&runs]() { ++runs; }, std::chrono::milliseconds(5));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_GE(runs.load(), 3);

    auto future = worker.submit([]() { return 1; });
    EXPECT_EQ(future.get(), 1);
}

TEST(WorkerTest, ClearedIdleTaskNeverRunsAgain) {
    Worker worker("test");
    std::atomic<int> runs{0};
    worker.set_idle_task([&runs]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        ++runs;
    }, std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    worker.set_idle_task(nullptr, std::chrono::milliseconds(1));
    const int after_clear = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(runs.load(), after_clear);
}
