#pragma once
///@file

#include "artcache/util/error.hh"

#include <filesystem>
#include <functional>
#include <optional>

namespace artcache {

/**
 * The destination could not be prepared. Unlike protocol failures this
 * is not turned into an error result by the caches: it propagates out
 * of `fetch()`.
 */
MakeError(OutputPathError, Error);

/**
 * A fetch destination that is only created once a hit is confirmed,
 * so that misses and errors leave no trace in the output tree.
 *
 * Not thread-safe: a LazyPath belongs to a single fetch.
 */
class LazyPath
{
public:
    typedef std::function<std::filesystem::path()> Materialiser;

private:
    Materialiser materialiser;
    std::optional<std::filesystem::path> path;

public:

    explicit LazyPath(Materialiser materialiser)
        : materialiser(std::move(materialiser))
    {
    }

    /**
     * A destination whose parent directories are created on first use.
     */
    static LazyPath ofPath(std::filesystem::path path);

    /**
     * Materialise the destination, once.
     *
     * @throws OutputPathError if that fails.
     */
    const std::filesystem::path & get();

    bool isMaterialised() const
    {
        return path.has_value();
    }
};

} // namespace artcache
