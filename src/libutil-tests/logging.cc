#include "artcache/util/logging.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace artcache {

using ::testing::_;
using ::testing::InSequence;
using ::testing::SaveArg;

class MockLogger : public Logger
{
public:
    MOCK_METHOD(void, log, (Verbosity lvl, std::string_view s), (override));
    MOCK_METHOD(void, logEI, (const ErrorInfo & ei), (override));
    MOCK_METHOD(
        void,
        startActivity,
        (ActivityId act,
         Verbosity lvl,
         ActivityType type,
         const std::string & s,
         const Fields & fields,
         ActivityId parent),
        (override));
    MOCK_METHOD(void, stopActivity, (ActivityId act), (override));
    MOCK_METHOD(void, result, (ActivityId act, ResultType type, const Fields & fields), (override));
    MOCK_METHOD(void, writeToStdout, (std::string_view s), (override));
};

/* ----------------------------------------------------------------------------
 * Activity
 * --------------------------------------------------------------------------*/

TEST(Activity, startsAndStops)
{
    MockLogger logger;
    ActivityId started = 0, stopped = 0;

    {
        InSequence seq;
        EXPECT_CALL(logger, startActivity(_, lvlDebug, ActivityType::CacheFetch, "fetching 'abcd'", _, 0))
            .WillOnce(SaveArg<0>(&started));
        EXPECT_CALL(logger, stopActivity(_)).WillOnce(SaveArg<0>(&stopped));
    }

    {
        Activity act(logger, lvlDebug, ActivityType::CacheFetch, "fetching 'abcd'", {}, 0);
        ASSERT_EQ(act.id, started);
    }

    ASSERT_NE(started, 0u);
    ASSERT_EQ(started, stopped);
}

TEST(Activity, idsAreUnique)
{
    MockLogger logger;
    EXPECT_CALL(logger, startActivity).Times(2);
    EXPECT_CALL(logger, stopActivity).Times(2);

    Activity act1(logger, lvlDebug, ActivityType::CacheStore);
    Activity act2(logger, lvlDebug, ActivityType::CacheStore);
    ASSERT_NE(act1.id, act2.id);
}

TEST(Activity, pushedActivityIsTheDefaultParent)
{
    MockLogger logger;
    ActivityId innerParent = 0, afterParent = 1;

    EXPECT_CALL(logger, startActivity(_, _, ActivityType::CacheFetch, _, _, _));
    EXPECT_CALL(logger, startActivity(_, _, ActivityType::CacheStore, _, _, _)).WillOnce(SaveArg<5>(&innerParent));
    EXPECT_CALL(logger, startActivity(_, _, ActivityType::Unknown, _, _, _)).WillOnce(SaveArg<5>(&afterParent));
    EXPECT_CALL(logger, stopActivity).Times(3);

    auto before = getCurActivity();

    Activity outer(logger, lvlDebug, ActivityType::CacheFetch);
    {
        PushActivity pact(outer.id);
        ASSERT_EQ(getCurActivity(), outer.id);
        Activity inner(logger, lvlDebug, ActivityType::CacheStore);
    }
    ASSERT_EQ(getCurActivity(), before);

    Activity after(logger, lvlDebug, ActivityType::Unknown);

    ASSERT_EQ(innerParent, outer.id);
    ASSERT_EQ(afterParent, before);
}

TEST(Activity, resultFields)
{
    MockLogger logger;
    Logger::Fields fields;

    EXPECT_CALL(logger, startActivity);
    EXPECT_CALL(logger, result(_, ResultType::CacheFetchResult, _)).WillOnce(SaveArg<2>(&fields));
    EXPECT_CALL(logger, stopActivity);

    Activity act(logger, lvlDebug, ActivityType::CacheFetch);
    act.result(ResultType::CacheFetchResult, "hit", (uint64_t) 42);

    ASSERT_EQ(fields.size(), 2u);
    ASSERT_EQ(fields[0].type, Logger::Field::Type::String);
    ASSERT_EQ(fields[0].s, "hit");
    ASSERT_EQ(fields[1].type, Logger::Field::Type::Int);
    ASSERT_EQ(fields[1].i, 42u);
}

/* ----------------------------------------------------------------------------
 * Logger::cout
 * --------------------------------------------------------------------------*/

TEST(Logger, coutGoesThroughWriteToStdout)
{
    MockLogger logger;
    EXPECT_CALL(logger, writeToStdout(std::string_view("artcache 1.0")));

    logger.cout("%s %s", "artcache", "1.0");
}

} // namespace artcache
