#include <gtest/gtest.h>
#include "thread_pool.hpp"
#include <chrono>

TEST(ThreadPool, ReturnsTaskResults) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);
    auto sum = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(sum.get(), 5);
}

TEST(ThreadPool, ZeroWorkersMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ThreadPool, CountsActiveAndQueuedTasks) {
    ThreadPool pool(1);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    auto first = pool.enqueue([&started, gate] {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();
    auto second = pool.enqueue([gate] { gate.wait(); });

    EXPECT_EQ(pool.active(), 1u);
    EXPECT_EQ(pool.pending(), 1u);

    release.set_value();
    first.get();
    second.get();
    pool.shutdown();
    EXPECT_EQ(pool.active(), 0u);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPool, ShutdownDrainsQueueAndRefusesNewWork) {
    ThreadPool pool(1);
    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i) {
        pool.enqueue([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++done;
        });
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 4);
    pool.shutdown();
    EXPECT_THROW(pool.enqueue([] {}), std::runtime_error);
}
