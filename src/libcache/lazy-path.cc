#include "artcache/cache/lazy-path.hh"
#include "artcache/util/file-system.hh"

namespace artcache {

LazyPath LazyPath::ofPath(std::filesystem::path path)
{
    return LazyPath([path]() {
        if (path.has_parent_path())
            createDirs(path.parent_path());
        return path;
    });
}

const std::filesystem::path & LazyPath::get()
{
    if (!path) {
        try {
            path = materialiser();
        } catch (OutputPathError &) {
            throw;
        } catch (Error & e) {
            throw OutputPathError("cannot create the fetch destination: %s", e.message());
        }
    }
    return *path;
}

} // namespace artcache
