#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include "infra/thread_pool/thread_pool.hpp"

using namespace std::chrono_literals;
using extsort::infra::ThreadPool;

TEST(ThreadPoolTest, RunsEveryTask)
{
    std::atomic<int> done{0};
    ThreadPool pool{4};
    for (int i = 0; i < 200; ++i) {
        pool.enqueue([&] { done.fetch_add(1); });
    }
    pool.wait();
    EXPECT_EQ(done.load(), 200);
}

TEST(ThreadPoolTest, NeverExceedsThreadCount)
{
    constexpr std::size_t kThreads = 3;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    ThreadPool pool{kThreads};
    for (int i = 0; i < 30; ++i) {
        pool.enqueue([&] {
            const int now = running.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(2ms);
            running.fetch_sub(1);
        });
    }
    pool.wait();

    EXPECT_LE(peak.load(), static_cast<int>(kThreads));
    EXPECT_GE(peak.load(), 1);
}

TEST(ThreadPoolTest, DefaultCapacityIsTwicePerThread)
{
    ThreadPool pool{3};
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_EQ(pool.capacity(), 6u);

    ThreadPool zero{0, 0};
    EXPECT_EQ(zero.size(), 1u);
}

TEST(ThreadPoolTest, EnqueueBlocksWhenQueueIsFull)
{
    std::atomic<bool> release{false};
    std::atomic<int> enqueued{0};

    ThreadPool pool{1, 2};
    std::jthread producer([&] {
        for (int i = 0; i < 6; ++i) {
            pool.enqueue([&] {
                while (!release.load()) std::this_thread::sleep_for(1ms);
            });
            enqueued.fetch_add(1);
        }
    });

    // 1 задача выполняется, 2 в очереди: производитель должен застрять на четвёртой
    std::this_thread::sleep_for(100ms);
    EXPECT_LE(enqueued.load(), 3);

    release.store(true);
    producer.join();
    pool.wait();
    EXPECT_EQ(enqueued.load(), 6);
}

TEST(ThreadPoolTest, DestructorDrainsQueuedTasks)
{
    std::atomic<int> done{0};
    {
        ThreadPool pool{2};
        for (int i = 0; i < 4; ++i) {
            pool.enqueue([&] {
                std::this_thread::sleep_for(1ms);
                done.fetch_add(1);
            });
        }
    }
    EXPECT_EQ(done.load(), 4);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker)
{
    std::atomic<int> done{0};
    ThreadPool pool{1};
    pool.enqueue([] { throw std::runtime_error("boom"); });
    pool.enqueue([&] { done.fetch_add(1); });
    pool.wait();
    EXPECT_EQ(done.load(), 1);
}
