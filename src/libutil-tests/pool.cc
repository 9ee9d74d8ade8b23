#include "artcache/util/error.hh"
#include "artcache/util/pool.hh"
#include <gtest/gtest.h>

namespace artcache {

struct TestResource
{

    TestResource()
    {
        static int counter = 0;
        num = counter++;
    }

    int dummyValue = 1;
    int num;
};

/* ----------------------------------------------------------------------------
 * Pool
 * --------------------------------------------------------------------------*/

TEST(Pool, freshPoolHasZeroCount)
{
    Pool<TestResource> pool;

    ASSERT_EQ(pool.count(), 0);
}

TEST(Pool, freshPoolCanGetAResource)
{
    Pool<TestResource> pool;

    {
        auto r = pool.get();
        ASSERT_EQ(pool.count(), 1);
        ASSERT_EQ(r->dummyValue, 1);
    }

    ASSERT_EQ(pool.count(), 1);
}

TEST(Pool, reusesReturnedResources)
{
    Pool<TestResource> pool;

    int first;
    {
        auto r = pool.get();
        first = r->num;
    }

    auto r = pool.get();
    ASSERT_EQ(r->num, first);
}

TEST(Pool, badResourcesAreDropped)
{
    Pool<TestResource> pool;

    int first;
    {
        auto r = pool.get();
        first = r->num;
        r.markBad();
    }
    ASSERT_EQ(pool.count(), 0);

    auto r = pool.get();
    ASSERT_NE(r->num, first);
}

TEST(Pool, keepsAtMostMaxIdle)
{
    Pool<TestResource> pool(1);

    {
        auto r1 = pool.get();
        auto r2 = pool.get();
        ASSERT_EQ(pool.count(), 2);
    }

    ASSERT_EQ(pool.count(), 1);
}

TEST(Pool, factoryFailureDoesNotLeakCount)
{
    Pool<TestResource> pool(1, []() -> ref<TestResource> { throw Error("cannot connect"); });

    ASSERT_THROW(pool.get(), Error);
    ASSERT_EQ(pool.count(), 0);
}

} // namespace artcache
