#include "artcache/util/file-system.hh"
#include "artcache/util/file-descriptor.hh"
#include "artcache/util/serialise.hh"

#include <gtest/gtest.h>

#include <sys/stat.h>

namespace artcache {

using namespace std::string_literals;

class FileSystemTest : public ::testing::Test
{
protected:
    std::filesystem::path tmpDir;
    std::unique_ptr<AutoDelete> delTmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir, true);
    }

    void TearDown() override
    {
        delTmpDir.reset();
    }
};

/* ----------------------------------------------------------------------------
 * readFile / writeFile
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, writeFileThenReadFile)
{
    auto p = tmpDir / "foo";
    writeFile(p, "hello\0world"s);
    ASSERT_EQ(readFile(p), "hello\0world"s);
}

TEST_F(FileSystemTest, writeFileFromSource)
{
    auto p = tmpDir / "foo";
    StringSource source(std::string_view("streamed"));
    writeFile(p, source);
    ASSERT_EQ(readFile(p), "streamed");
}

TEST_F(FileSystemTest, readFileIntoSink)
{
    auto p = tmpDir / "foo";
    writeFile(p, "data");
    StringSink sink;
    readFile(p, sink);
    ASSERT_EQ(sink.s, "data");
}

TEST_F(FileSystemTest, readFileOfMissingPathThrows)
{
    ASSERT_THROW(readFile(tmpDir / "missing"), SysError);
}

/* ----------------------------------------------------------------------------
 * pathExists, maybeLstat, maybeStat
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, pathExists)
{
    ASSERT_TRUE(pathExists(tmpDir));
    ASSERT_FALSE(pathExists(tmpDir / "missing"));
}

TEST_F(FileSystemTest, maybeLstatOfMissingPathIsEmpty)
{
    ASSERT_FALSE(maybeLstat((tmpDir / "missing").string()));
}

TEST_F(FileSystemTest, maybeLstatReportsSize)
{
    writeFile(tmpDir / "foo", "12345");
    auto st = maybeLstat((tmpDir / "foo").string());
    ASSERT_TRUE(st);
    ASSERT_EQ(st->st_size, 5);
}

TEST_F(FileSystemTest, maybeStatFollowsSymlinks)
{
    writeFile(tmpDir / "target", std::string(1000, 'x'));
    std::filesystem::create_symlink(tmpDir / "target", tmpDir / "link");

    auto lst = maybeLstat((tmpDir / "link").string());
    ASSERT_TRUE(lst);
    ASSERT_TRUE(S_ISLNK(lst->st_mode));

    auto st = maybeStat((tmpDir / "link").string());
    ASSERT_TRUE(st);
    ASSERT_TRUE(S_ISREG(st->st_mode));
    ASSERT_EQ(st->st_size, 1000);
}

TEST_F(FileSystemTest, maybeStatOfDanglingSymlinkIsEmpty)
{
    std::filesystem::create_symlink(tmpDir / "nowhere", tmpDir / "dangling");
    ASSERT_TRUE(maybeLstat((tmpDir / "dangling").string()));
    ASSERT_FALSE(maybeStat((tmpDir / "dangling").string()));
}

/* ----------------------------------------------------------------------------
 * createDirs, deletePath
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, createDirsCreatesParents)
{
    auto p = tmpDir / "a" / "b" / "c";
    createDirs(p);
    ASSERT_TRUE(std::filesystem::is_directory(p));
    ASSERT_NO_THROW(createDirs(p));
}

TEST_F(FileSystemTest, deletePathIsRecursive)
{
    createDirs(tmpDir / "a" / "b");
    writeFile(tmpDir / "a" / "b" / "f", "x");
    deletePath(tmpDir / "a");
    ASSERT_FALSE(pathExists(tmpDir / "a"));
}

TEST_F(FileSystemTest, deletePathOfMissingPathIsFine)
{
    ASSERT_NO_THROW(deletePath(tmpDir / "missing"));
}

/* ----------------------------------------------------------------------------
 * copyFile, moveFile
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, copyFileKeepsSource)
{
    writeFile(tmpDir / "from", "contents");
    copyFile(tmpDir / "from", tmpDir / "to");
    ASSERT_EQ(readFile(tmpDir / "to"), "contents");
    ASSERT_TRUE(pathExists(tmpDir / "from"));
}

TEST_F(FileSystemTest, moveFileReplacesDestination)
{
    writeFile(tmpDir / "from", "new");
    writeFile(tmpDir / "to", "old");
    moveFile(tmpDir / "from", tmpDir / "to");
    ASSERT_EQ(readFile(tmpDir / "to"), "new");
    ASSERT_FALSE(pathExists(tmpDir / "from"));
}

TEST_F(FileSystemTest, moveFileOfMissingSourceThrows)
{
    ASSERT_ANY_THROW(moveFile(tmpDir / "missing", tmpDir / "to"));
}

/* ----------------------------------------------------------------------------
 * createTempFile, makeTempPath
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, createTempFileInDirectory)
{
    auto [fd, path] = createTempFile(tmpDir, ".out");
    ASSERT_TRUE(fd);
    ASSERT_EQ(path.parent_path(), tmpDir);
    ASSERT_TRUE(path.filename().string().starts_with(".out."));
    writeFull(fd.get(), "abc");
    fd.close();
    ASSERT_EQ(readFile(path), "abc");
}

TEST_F(FileSystemTest, createTempFileInMissingDirectoryThrows)
{
    ASSERT_THROW(createTempFile(tmpDir / "missing", "x"), SysError);
}

TEST_F(FileSystemTest, makeTempPathIsUnique)
{
    ASSERT_NE(makeTempPath(tmpDir), makeTempPath(tmpDir));
}

/* ----------------------------------------------------------------------------
 * AutoDelete
 * --------------------------------------------------------------------------*/

TEST_F(FileSystemTest, autoDeleteRemovesPath)
{
    auto p = tmpDir / "doomed";
    writeFile(p, "x");
    {
        AutoDelete del(p, false);
    }
    ASSERT_FALSE(pathExists(p));
}

TEST_F(FileSystemTest, cancelledAutoDeleteKeepsPath)
{
    auto p = tmpDir / "kept";
    writeFile(p, "x");
    {
        AutoDelete del(p, false);
        del.cancel();
    }
    ASSERT_TRUE(pathExists(p));
}

} // namespace artcache
