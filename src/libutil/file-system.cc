#include "artcache/util/file-system.hh"
#include "artcache/util/logging.hh"
#include "artcache/util/serialise.hh"

#include <atomic>
#include <cstdlib>
#include <fcntl.h>
#include <random>
#include <unistd.h>

namespace artcache {

bool pathExists(const std::filesystem::path & path)
{
    return maybeLstat(path.string()).has_value();
}

std::optional<struct stat> maybeLstat(const Path & path)
{
    std::optional<struct stat> st{std::in_place};
    if (lstat(path.c_str(), &*st)) {
        if (errno == ENOENT || errno == ENOTDIR)
            st.reset();
        else
            throw SysError("getting status of '%s'", path);
    }
    return st;
}

std::optional<struct stat> maybeStat(const Path & path)
{
    std::optional<struct stat> st{std::in_place};
    if (stat(path.c_str(), &*st)) {
        if (errno == ENOENT || errno == ENOTDIR)
            st.reset();
        else
            throw SysError("getting status of '%s'", path);
    }
    return st;
}

std::string readFile(const std::filesystem::path & path)
{
    StringSink sink;
    readFile(path, sink);
    return std::move(sink.s);
}

void readFile(const std::filesystem::path & path, Sink & sink)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%s'", path.string());
    FdSource source(fd.get());
    source.drainInto(sink);
}

void writeFile(const std::filesystem::path & path, std::string_view s, mode_t mode)
{
    StringSource source(s);
    writeFile(path, source, mode);
}

void writeFile(const std::filesystem::path & path, Source & source, mode_t mode)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%s'", path.string());

    try {
        FdSink sink(fd.get());
        source.drainInto(sink);
        sink.flush();
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path.string());
        throw;
    }
    fd.close();
}

void createDirs(const std::filesystem::path & path)
{
    try {
        std::filesystem::create_directories(path);
    } catch (std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "creating directory '%1%'", path.string());
    }
}

void deletePath(const std::filesystem::path & path)
{
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw SysError(ec.value(), "deleting path '%1%'", path.string());
}

void copyFile(const std::filesystem::path & from, const std::filesystem::path & to)
{
    try {
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
    } catch (std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "copying '%1%' to '%2%'", from.string(), to.string());
    }
}

void moveFile(const std::filesystem::path & from, const std::filesystem::path & to)
{
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec)
        return;
    if (ec.value() != EXDEV)
        throw SysError(ec.value(), "renaming '%1%' to '%2%'", from.string(), to.string());

    /* For the move to be as atomic as possible, copy to a temporary
       file beside the target first. */
    debug("can't rename '%s' as '%s', copying instead", from.string(), to.string());
    auto temp = makeTempPath(to.parent_path(), ".rename-tmp");
    AutoDelete removeTemp(temp, false);
    copyFile(from, temp);
    std::filesystem::rename(temp, to, ec);
    if (ec)
        throw SysError(ec.value(), "renaming '%1%' to '%2%'", temp.string(), to.string());
    removeTemp.cancel();
    std::filesystem::remove(from, ec);
    if (ec)
        throw SysError(ec.value(), "deleting '%1%'", from.string());
}

std::string defaultTempDir()
{
    auto tmpDir = getenv("TMPDIR");
    return tmpDir && *tmpDir ? tmpDir : "/tmp";
}

std::filesystem::path makeTempPath(const std::filesystem::path & root, std::string_view suffix)
{
    // start the counter at a random value to minimize issues with preexisting temp paths
    static std::atomic<uint32_t> counter(std::random_device{}());
    auto tmpRoot = root.empty() ? std::filesystem::path(defaultTempDir()) : root;
    return tmpRoot / fmt("%1%-%2%-%3%", suffix, getpid(), counter.fetch_add(1, std::memory_order_relaxed));
}

std::filesystem::path createTempDir(const std::filesystem::path & tmpRoot, std::string_view prefix)
{
    while (1) {
        auto tmpDir = makeTempPath(tmpRoot, prefix);
        if (mkdir(tmpDir.c_str(), 0755) == 0)
            return tmpDir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", tmpDir.string());
    }
}

std::pair<AutoCloseFD, std::filesystem::path> createTempFile(const std::filesystem::path & dir, std::string_view prefix)
{
    auto tmpl = (dir.empty() ? std::filesystem::path(defaultTempDir()) : dir) / fmt("%s.XXXXXX", prefix);
    std::string s = tmpl.string();
    AutoCloseFD fd = mkostemp(s.data(), O_CLOEXEC);
    if (!fd)
        throw SysError("creating temporary file '%s'", s);
    return {std::move(fd), std::filesystem::path(s)};
}

AutoDelete::AutoDelete()
    : del{false}
    , recursive{false}
{
}

AutoDelete::AutoDelete(const std::filesystem::path & p, bool recursive)
    : _path(p)
{
    del = true;
    this->recursive = recursive;
}

AutoDelete::AutoDelete(AutoDelete && x) noexcept
    : _path(std::move(x._path))
    , del(x.del)
    , recursive(x.recursive)
{
    x.del = false;
}

AutoDelete::~AutoDelete()
{
    try {
        if (del) {
            if (recursive)
                deletePath(_path);
            else
                std::filesystem::remove(_path);
        }
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::cancel()
{
    del = false;
}

void AutoDelete::reset(const std::filesystem::path & p, bool recursive)
{
    _path = p;
    this->recursive = recursive;
    del = true;
}

} // namespace artcache
