#include <gtest/gtest.h>

#include "artcache/cache/lazy-path.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

TEST(LazyPath, materialisesOnce)
{
    int calls = 0;
    LazyPath path([&]() {
        calls++;
        return std::filesystem::path("/some/where");
    });
    ASSERT_FALSE(path.isMaterialised());
    ASSERT_EQ(calls, 0);
    ASSERT_EQ(path.get(), "/some/where");
    ASSERT_EQ(path.get(), "/some/where");
    ASSERT_TRUE(path.isMaterialised());
    ASSERT_EQ(calls, 1);
}

TEST(LazyPath, ofPathCreatesParentsOnFirstUse)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    auto dest = tmpDir / "a" / "b" / "out";
    auto path = LazyPath::ofPath(dest);
    ASSERT_FALSE(pathExists(tmpDir / "a"));
    ASSERT_EQ(path.get(), dest);
    ASSERT_TRUE(std::filesystem::is_directory(tmpDir / "a" / "b"));
    ASSERT_FALSE(pathExists(dest));
}

TEST(LazyPath, failureIsOutputPathError)
{
    LazyPath path([]() -> std::filesystem::path { throw Error("disk on fire"); });
    ASSERT_THROW(path.get(), OutputPathError);
    ASSERT_FALSE(path.isMaterialised());
}

TEST(LazyPath, failureIsNotRemembered)
{
    int calls = 0;
    LazyPath path([&]() {
        if (++calls == 1)
            throw Error("not yet");
        return std::filesystem::path("/some/where");
    });

    ASSERT_THROW(path.get(), OutputPathError);
    ASSERT_FALSE(path.isMaterialised());

    ASSERT_EQ(path.get(), "/some/where");
    ASSERT_EQ(calls, 2);
}

} // namespace artcache
