#include "artcache/util/thread-pool.hh"
#include <gtest/gtest.h>

#include <atomic>

namespace artcache {

using namespace std;

TEST(threadpool, correctValue)
{
    ThreadPool pool(3);
    int sum = 0;
    std::mutex mtx;
    for (int i = 0; i < 20; i++) {
        pool.enqueue([&] {
            std::lock_guard<std::mutex> lock(mtx);
            sum += 1;
        });
    }
    pool.process();
    ASSERT_EQ(sum, 20);
}

TEST(threadpool, properlyHandlesDirectExceptions)
{
    struct TestExn
    {};

    ThreadPool pool(3);
    pool.enqueue([&] { throw TestExn(); });
    EXPECT_THROW(pool.process(), TestExn);
}

TEST(threadpool, exceptionIsOnlyRethrownOnce)
{
    ThreadPool pool(1);
    pool.enqueue([&] { throw Error("boom"); });
    EXPECT_THROW(pool.process(), Error);
    EXPECT_NO_THROW(pool.process());
}

TEST(threadpool, waitsForNestedWork)
{
    ThreadPool pool(2);
    std::atomic<int> count{0};
    pool.enqueue([&] {
        for (int i = 0; i < 5; i++)
            pool.enqueue([&] { count++; });
        count++;
    });
    pool.process();
    ASSERT_EQ(count, 6);
}

TEST(threadpool, shutdownFinishesQueuedWork)
{
    ThreadPool pool(1);
    std::atomic<int> count{0};
    for (int i = 0; i < 10; i++)
        pool.enqueue([&] { count++; });
    pool.shutdown();
    ASSERT_EQ(count, 10);
}

TEST(threadpool, rejectsWorkAfterShutdown)
{
    ThreadPool pool(1);
    pool.shutdown();
    ASSERT_THROW(pool.enqueue([] {}), ThreadPoolShutDown);
}

TEST(threadpool, shutdownIsIdempotent)
{
    ThreadPool pool(2);
    pool.shutdown();
    ASSERT_NO_THROW(pool.shutdown());
}

TEST(threadpool, processWithoutWorkReturns)
{
    ThreadPool pool(2);
    ASSERT_NO_THROW(pool.process());
}

} // namespace artcache
