#pragma once
///@file

#include <filesystem>

namespace artcache {

/**
 * A file handed to a cache for storing, with a flag saying whether the
 * cache may take ownership of it (move or delete it) instead of only
 * reading it.
 */
struct BorrowablePath
{
    std::filesystem::path path;
    bool canBorrow = false;

    static BorrowablePath borrowable(std::filesystem::path path)
    {
        return {std::move(path), true};
    }

    static BorrowablePath notBorrowable(std::filesystem::path path)
    {
        return {std::move(path), false};
    }
};

} // namespace artcache
