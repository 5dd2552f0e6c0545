#include <gtest/gtest.h>
#include "concurrency/TaskQueue.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace rh::concurrency;
using namespace std::chrono_literals;

TEST(TaskQueueTest, RunsTasksOneAtATimeInOrder) {
    TaskQueue q("test-serial");

    std::atomic<int> active{0}, maxActive{0};
    std::mutex orderMutex;
    std::vector<int> order;

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(q.enqueue([&, i] {
            const int now = ++active;
            int prev = maxActive.load();
            while (now > prev && !maxActive.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(5ms);
            {
                std::scoped_lock lock(orderMutex);
                order.push_back(i);
            }
            --active;
        }, "task " + std::to_string(i)));
    }

    q.waitIdle();

    EXPECT_EQ(maxActive.load(), 1);
    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(order[i], i);
    EXPECT_FALSE(q.isDraining());
}

TEST(TaskQueueTest, ConcurrentProducersNeverOverlap) {
    TaskQueue q("test-producers");
    std::atomic<int> active{0}, overlaps{0}, done{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                q.enqueue([&] {
                    if (++active > 1) ++overlaps;
                    std::this_thread::sleep_for(1ms);
                    --active;
                    ++done;
                });
            }
        });
    }
    for (auto& t : producers) t.join();

    q.waitIdle();
    EXPECT_EQ(overlaps.load(), 0);
    EXPECT_EQ(done.load(), 20);
}

TEST(TaskQueueTest, FailingTaskDoesNotStopQueue) {
    TaskQueue q("test-failure");
    std::atomic<bool> ranAfter{false};

    q.enqueue([] { throw std::runtime_error("boom"); }, "failing");
    q.enqueue([&] { ranAfter = true; }, "after");
    q.waitIdle();

    EXPECT_TRUE(ranAfter.load());
}

TEST(TaskQueueTest, WaitIdleFromInsideTaskIsRejected) {
    TaskQueue q("test-reentrant");
    std::atomic<bool> rejected{false};

    q.enqueue([&] {
        try {
            q.waitIdle();
        } catch (const std::logic_error&) {
            rejected = true;
        }
    });
    q.waitIdle();

    EXPECT_TRUE(rejected.load());
}

TEST(TaskQueueTest, ShutdownDrainsThenRejects) {
    TaskQueue q("test-shutdown");
    std::atomic<int> ran{0};

    for (int i = 0; i < 3; ++i) q.enqueue([&] {
        std::this_thread::sleep_for(2ms);
        ++ran;
    });
    q.shutdown();

    EXPECT_EQ(ran.load(), 3);
    EXPECT_FALSE(q.enqueue([&] { ++ran; }));
    EXPECT_EQ(q.size(), 0u);
}

TEST(TaskQueueTest, IdleQueuePicksUpNewWork) {
    TaskQueue q("test-resume");
    std::atomic<int> ran{0};

    q.enqueue([&] { ++ran; });
    q.waitIdle();
    std::this_thread::sleep_for(10ms);
    q.enqueue([&] { ++ran; });
    q.waitIdle();

    EXPECT_EQ(ran.load(), 2);
}
