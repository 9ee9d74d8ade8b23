#include "artcache/cache/dir-artifact-cache.hh"
#include "artcache/cache/http-binary-protocol.hh"
#include "artcache/util/file-system.hh"
#include "artcache/util/logging.hh"

namespace artcache {

DirArtifactCache::DirArtifactCache(
    std::string name, std::filesystem::path root, CacheReadMode readMode, std::string errorMessageFormat)
    : name(std::move(name))
    , root(std::move(root))
    , readMode(readMode)
    , errorMessageFormat(std::move(errorMessageFormat))
{
}

std::filesystem::path DirArtifactCache::artifactPath(const RuleKey & key) const
{
    auto & hex = key.to_string();
    return root / hex.substr(0, 2) / hex;
}

std::filesystem::path DirArtifactCache::metadataPath(const RuleKey & key) const
{
    auto path = artifactPath(key);
    path += ".metadata";
    return path;
}

/**
 * Write `contents` to `path` so that readers never see a partial file.
 */
static void writeFileAtomically(const std::filesystem::path & path, std::string_view contents)
{
    auto tmp = makeTempPath(path.parent_path(), "." + path.filename().string());
    AutoDelete removeTemp(tmp, false);
    writeFile(tmp, contents);
    moveFile(tmp, path);
    removeTemp.cancel();
}

CacheResult DirArtifactCache::fetch(const RuleKey & key, LazyPath & output)
{
    Activity act(
        *logger,
        lvlDebug,
        ActivityType::CacheFetch,
        fmt("fetching '%s' from cache '%s'", key, name),
        cacheActivityFields(name, "dir", {key}));

    auto result = fetchImpl(key, output);

    act.result(
        ResultType::CacheFetchResult,
        std::string(showCacheResultType(result.type)),
        result.artifactSizeBytes.value_or(0));

    return result;
}

CacheResult DirArtifactCache::fetchImpl(const RuleKey & key, LazyPath & output)
{
    auto artifact = artifactPath(key);
    if (!pathExists(artifact)) {
        debug("cache '%s' does not have '%s'", name, key);
        return CacheResult::miss();
    }

    StringMap metadata;
    try {
        auto metaFile = metadataPath(key);
        if (!pathExists(metaFile)) {
            debug("cache '%s' has '%s' but not its metadata", name, key);
            return CacheResult::miss();
        }
        auto contents = readFile(metaFile);
        StringSource source(contents);
        metadata = ArtifactMetadataHeader::parse(source).metadata;
    } catch (Error & e) {
        auto msg = fmt("fetch(%s): reading metadata: %s", key, e.message());
        warnCacheFailure(errorMessageFormat, name, msg);
        return CacheResult::error(name, ArtifactCacheMode::Dir, msg);
    }

    auto & destination = output.get();

    try {
        auto tmp = makeTempPath(destination.parent_path(), "." + destination.filename().string());
        AutoDelete removeTemp(tmp, false);
        copyFile(artifact, tmp);
        auto size = std::filesystem::file_size(tmp);
        moveFile(tmp, destination);
        removeTemp.cancel();
        return CacheResult::hit(name, ArtifactCacheMode::Dir, std::move(metadata), size);
    } catch (std::filesystem::filesystem_error & e) {
        auto msg = fmt("fetch(%s): %s", key, e.what());
        warnCacheFailure(errorMessageFormat, name, msg);
        return CacheResult::error(name, ArtifactCacheMode::Dir, msg);
    } catch (Error & e) {
        auto msg = fmt("fetch(%s): %s", key, e.message());
        warnCacheFailure(errorMessageFormat, name, msg);
        return CacheResult::error(name, ArtifactCacheMode::Dir, msg);
    }
}

void DirArtifactCache::store(
    const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept
{
    try {
        Activity act(
            *logger,
            lvlDebug,
            ActivityType::CacheStore,
            fmt("storing '%s' in cache '%s'", info.ruleKeys().front(), name),
            cacheActivityFields(name, "dir", info.ruleKeys(), info.metadata()));

        if (closed)
            throw CacheClosed("cannot store to cache '%s' because it is closed", name);

        StoreResult result;
        try {
            result = storeImpl(info, output);
        } catch (Error & e) {
            warnCacheFailure(errorMessageFormat, name, fmt("store(%s): %s", info.ruleKeys().front(), e.message()));
            act.result(ResultType::CacheStoreResult, (uint64_t) 0, (uint64_t) 0);
            throw;
        }

        act.result(ResultType::CacheStoreResult, (uint64_t) 1, result.artifactSizeBytes);
        callback(std::move(result));
    } catch (...) {
        callback.rethrow();
    }
}

StoreResult DirArtifactCache::storeImpl(const ArtifactInfo & info, const BorrowablePath & output)
{
    /* Follow symlinks: what is stored is the file the path points to. */
    auto st = maybeStat(output.path.string());
    if (!st)
        throw Error("artifact '%s' does not exist", output.path.string());
    uint64_t size = st->st_size;

    /* Moving a symlink would put the link itself in the cache. */
    bool borrow = output.canBorrow && !std::filesystem::is_symlink(output.path);

    auto metadata = ArtifactMetadataHeader{info.ruleKeys(), info.metadata()}.serialise();

    /* The first key takes the file itself if we may borrow it; the
       other keys get copies of what ended up there. Each key's
       metadata is in place before its artifact appears. */
    auto source = output.path;
    bool first = true;
    for (auto & key : info.ruleKeys()) {
        auto target = artifactPath(key);
        createDirs(target.parent_path());

        writeFileAtomically(metadataPath(key), metadata);

        auto tmp = makeTempPath(target.parent_path(), "." + target.filename().string());
        AutoDelete removeTemp(tmp, false);
        if (first && borrow)
            moveFile(source, tmp);
        else
            copyFile(source, tmp);
        moveFile(tmp, target);
        removeTemp.cancel();

        if (first && borrow)
            source = target;
        first = false;
    }

    debug("stored '%s' in cache '%s' (%d bytes)", info.ruleKeys().front(), name, size);

    return StoreResult{size};
}

} // namespace artcache
