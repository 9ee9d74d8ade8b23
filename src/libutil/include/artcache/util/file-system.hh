#pragma once
/**
 * @file
 *
 * Utilities for working with the file system and file paths.
 */

#include "artcache/util/file-descriptor.hh"
#include "artcache/util/types.hh"

#include <sys/stat.h>

#include <cstdint>
#include <filesystem>
#include <optional>

namespace artcache {

struct Sink;
struct Source;

/**
 * Return true iff the given path exists.
 */
bool pathExists(const std::filesystem::path & path);

/**
 * Get status of `path`, or `std::nullopt` if it does not exist.
 */
std::optional<struct stat> maybeLstat(const Path & path);

/**
 * Like `maybeLstat`, but follows symlinks.
 */
std::optional<struct stat> maybeStat(const Path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const std::filesystem::path & path);

/**
 * Stream the contents of a file into a sink.
 */
void readFile(const std::filesystem::path & path, Sink & sink);

/**
 * Write a string to a file.
 */
void writeFile(const std::filesystem::path & path, std::string_view s, mode_t mode = 0666);

/**
 * Write the contents of a source to a file.
 */
void writeFile(const std::filesystem::path & path, Source & source, mode_t mode = 0666);

/**
 * Create a directory and all its parents, if necessary.
 */
void createDirs(const std::filesystem::path & path);

/**
 * Delete a path; i.e., in the case of a directory, it is deleted
 * recursively. It's not an error if the path does not exist.
 */
void deletePath(const std::filesystem::path & path);

/**
 * Copy a regular file, replacing `to` if it exists.
 */
void copyFile(const std::filesystem::path & from, const std::filesystem::path & to);

/**
 * Move a file, falling back to copy-and-delete across file systems.
 */
void moveFile(const std::filesystem::path & from, const std::filesystem::path & to);

/**
 * Return a path in `root` that is not likely to exist yet, ending in
 * `suffix`.
 */
std::filesystem::path makeTempPath(const std::filesystem::path & root, std::string_view suffix = "tmp");

/**
 * Create a temporary directory.
 */
std::filesystem::path createTempDir(const std::filesystem::path & tmpRoot = "", std::string_view prefix = "artcache");

/**
 * Create an exclusively-owned temporary file in `dir` and return an
 * open descriptor to it.
 */
std::pair<AutoCloseFD, std::filesystem::path> createTempFile(const std::filesystem::path & dir, std::string_view prefix);

std::string defaultTempDir();

/**
 * Automatic cleanup of a file or directory at the end of a scope,
 * unless cancelled.
 */
class AutoDelete
{
    std::filesystem::path _path;
    bool del;
    bool recursive;
public:
    AutoDelete();
    AutoDelete(const std::filesystem::path & p, bool recursive = true);
    AutoDelete(AutoDelete && x) noexcept;
    AutoDelete(const AutoDelete &) = delete;
    AutoDelete & operator=(const AutoDelete &) = delete;
    ~AutoDelete();

    void cancel();

    void reset(const std::filesystem::path & p, bool recursive = true);

    const std::filesystem::path & path() const
    {
        return _path;
    }
};

} // namespace artcache
