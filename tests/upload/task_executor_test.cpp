#include "rup/upload/task_executor.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using rup::upload::TaskExecutor;

TEST(TaskExecutor, RunsEverySubmittedTask) {
    std::atomic<int> done{0};
    {
        TaskExecutor executor(3);
        EXPECT_EQ(executor.worker_count(), 3u);
        for (int i = 0; i < 50; ++i) {
            ASSERT_TRUE(executor.submit([&done]() { ++done; }));
        }
    }
    EXPECT_EQ(done.load(), 50);
}

TEST(TaskExecutor, NeverRunsMoreThanWorkerCount) {
    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    TaskExecutor executor(2);

    for (int i = 0; i < 20; ++i) {
        executor.submit([&]() {
            const int now = ++current;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --current;
        });
    }
    executor.shutdown();
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST(TaskExecutor, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> done{0};
    TaskExecutor executor(1);
    executor.submit([]() { throw std::runtime_error("broken task"); });
    executor.submit([&done]() { ++done; });

    EXPECT_TRUE(rup::testing::eventually([&]() { return done.load() == 1; }));
}

TEST(TaskExecutor, RejectsTasksAfterShutdown) {
    TaskExecutor executor(1);
    executor.shutdown();
    EXPECT_FALSE(executor.submit([]() {}));
}
