#include "gtest/gtest.h"
#include "hwenc/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace HWENC {

class WorkerPoolTest : public ::testing::Test { };

TEST_F(WorkerPoolTest, RunsTasksAndReturnsResults) {
    worker_pool pool{2, 8};
    EXPECT_EQ(pool.size(), 2u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i] {
            return i * i;
        }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST_F(WorkerPoolTest, ExceptionsReachTheFuture) {
    worker_pool pool;
    auto        future = pool.submit([]() -> int {
        throw std::runtime_error{"task failed"};
    });
    EXPECT_THROW(future.get(), std::runtime_error);

    // the worker survives
    EXPECT_EQ(pool.submit([] {
                      return 7;
                  })
                  .get(),
              7);
}

TEST_F(WorkerPoolTest, WaitIdle) {
    worker_pool      pool{3};
    std::atomic<int> done{0};
    for (int i = 0; i < 12; ++i) {
        pool.submit([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
            ++done;
        });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 12);
}

TEST_F(WorkerPoolTest, StopDrainsTheQueueAndRejectsNewWork) {
    std::atomic<int> done{0};
    worker_pool      pool{1};
    for (int i = 0; i < 5; ++i) {
        pool.submit([&done] {
            ++done;
        });
    }
    pool.stop();
    EXPECT_EQ(done.load(), 5);
    EXPECT_EQ(pool.get_state(), worker_pool::state::stopped);
    EXPECT_THROW(pool.submit([] { }), std::logic_error);
}

} // namespace HWENC
