#include "dash/thread_pool.hpp"
#include <atomic>
#include <functional>
#include <gtest/gtest.h>
#include <stdexcept>

TEST(ThreadPoolTest, BaseTest)
{
    int ok = false;
    std::mutex mutex;
    std::condition_variable cv;
    dash::thread_pool_t pool(4);
    pool.commit([&ok, &mutex, &cv]() {
        std::unique_lock<std::mutex> lock(mutex);
        ok = true;
        cv.notify_one();
    });
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&ok]() { return ok; });
    GTEST_ASSERT_EQ(ok, true);
}

void calc(std::mutex &mutex, std::condition_variable &cv, std::atomic_int &c)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    std::unique_lock<std::mutex> lock(mutex);
    c--;
    cv.notify_one();
}

TEST(ThreadPoolTest, MultiThread)
{
    int x = 10;
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic_int c = x;

    dash::thread_pool_t pool(4);

    for (int i = 0; i < x; i++)
    {
        pool.commit(std::bind(calc, std::ref(mutex), std::ref(cv), std::ref(c)));
    }
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&c]() { return c == 0; });
}

TEST(ThreadPoolTest, CommitAfter)
{
    dash::thread_pool_t pool(2);
    std::atomic<dash::microsecond_t> fired_at(0);
    auto point = dash::get_current_time();
    pool.commit_after(dash::make_timespan(0, 100), [&fired_at]() { fired_at = dash::get_current_time(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    GTEST_ASSERT_EQ(fired_at.load(), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    pool.wait_idle();
    GTEST_ASSERT_GE(fired_at.load() - point, dash::make_timespan(0, 100));
}

TEST(ThreadPoolTest, CancelDelayed)
{
    dash::thread_pool_t pool(2);
    std::atomic_bool fired(false);
    auto reg = pool.commit_after(dash::make_timespan(0, 50), [&fired]() { fired = true; });
    pool.cancel(reg);
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    pool.wait_idle();
    GTEST_ASSERT_EQ(fired.load(), false);
}

TEST(ThreadPoolTest, ExceptionKeepsWorker)
{
    dash::thread_pool_t pool(1);
    std::atomic_bool second(false);
    pool.commit([]() { throw std::runtime_error("task failure"); });
    pool.commit([&second]() { second = true; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pool.wait_idle();
    GTEST_ASSERT_EQ(second.load(), true);
    GTEST_ASSERT_EQ(pool.empty(), true);
}
