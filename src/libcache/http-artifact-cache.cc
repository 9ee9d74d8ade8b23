#include "artcache/cache/http-artifact-cache.hh"
#include "artcache/cache/http-binary-protocol.hh"
#include "artcache/util/file-system.hh"
#include "artcache/util/logging.hh"

#include <cstring>
#include <sys/stat.h>

namespace artcache {

static std::string artifactPath(const RuleKey & key)
{
    return "/artifacts/key/" + key.to_string();
}

/**
 * The mode of a file created with 0666 under the process umask. The
 * umask can only be read by setting it, so this is done once.
 */
static mode_t newFileMode()
{
    static const mode_t mode = []() -> mode_t {
        auto mask = umask(0);
        umask(mask);
        return 0666 & ~mask;
    }();
    return mode;
}

HttpArtifactCache::HttpArtifactCache(HttpArtifactCacheParams params, ref<HttpService> service)
    : params(std::move(params))
    , service(service)
    , storePool(this->params.storeThreads, fmt("store pool of '%s'", this->params.name))
{
}

HttpArtifactCache::~HttpArtifactCache()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void HttpArtifactCache::reportFailure(std::string_view errorMessage)
{
    warnCacheFailure(params.errorMessageFormat, params.name, errorMessage);
}

CacheResult HttpArtifactCache::fetch(const RuleKey & key, LazyPath & output)
{
    Activity act(
        *logger,
        lvlDebug,
        ActivityType::CacheFetch,
        fmt("fetching '%s' from cache '%s'", key, params.name),
        cacheActivityFields(params.name, "http", {key}));

    auto result = [&]() {
        try {
            return fetchImpl(key, output);
        } catch (OutputPathError &) {
            throw;
        } catch (Error & e) {
            auto msg = fmt("fetch(%s): %s", key, e.message());
            reportFailure(msg);
            return CacheResult::error(params.name, ArtifactCacheMode::Http, msg);
        }
    }();

    act.result(
        ResultType::CacheFetchResult,
        std::string(showCacheResultType(result.type)),
        result.artifactSizeBytes.value_or(0));

    return result;
}

CacheResult HttpArtifactCache::fetchImpl(const RuleKey & key, LazyPath & output)
{
    HttpRequest request{.path = artifactPath(key)};
    auto response = service->makeRequest(request);
    auto & body = response->body();

    NullSink discard;

    auto status = response->statusCode();

    if (status == 404) {
        debug("cache '%s' does not have '%s'", params.name, key);
        body.drainInto(discard);
        return CacheResult::miss();
    }

    if (status != 200) {
        body.drainInto(discard);
        throw HttpStatusError(status, "unexpected server response %d '%s'", status, response->statusMessage());
    }

    auto block = readMetadataBlock(body);

    if (!block.header.hasRuleKey(key)) {
        body.drainInto(discard);
        throw ProtocolError("incorrect key name: the response is for other keys");
    }

    std::optional<uint64_t> expectedSize;
    if (auto contentLength = response->contentLength()) {
        auto headerSize = 4 + block.rawFields.size() + 4;
        if (*contentLength < headerSize)
            throw ProtocolError("content length %d is shorter than the metadata block", *contentLength);
        expectedSize = *contentLength - headerSize;
    }

    auto & destination = output.get();

    /* Write to a temporary file next to the destination, so the
       destination only appears once the payload is verified. */
    AutoCloseFD fd;
    std::filesystem::path tmpPath;
    try {
        std::tie(fd, tmpPath) = createTempFile(destination.parent_path(), "." + destination.filename().string());
    } catch (SysError & e) {
        throw OutputPathError("cannot create a file beside '%s': %s", destination.string(), e.message());
    }
    AutoDelete removeTemp(tmpPath, false);

    /* Temporary files are private, but the fetched artifact gets the
       permissions of any newly created file. */
    if (fchmod(fd.get(), newFileMode()) == -1)
        throw OutputPathError("cannot set the permissions of '%s': %s", tmpPath.string(), strerror(errno));

    Crc32Sink hasher;
    hasher(block.rawFields);
    uint64_t payloadSize;
    {
        FdSink fileSink(fd.get());
        TeeSink tee(fileSink, hasher);
        payloadSize = body.drainInto(tee);
        fileSink.flush();
    }
    fd.close();

    if (expectedSize && payloadSize != *expectedSize)
        throw ProtocolError("incorrect file size: received %d bytes, expected %d", payloadSize, *expectedSize);

    auto actualChecksum = hasher.currentHash().first;
    if (actualChecksum != block.expectedChecksum)
        throw ChecksumMismatch(
            "incorrect checksum: expected %s, got %s", block.expectedChecksum.to_string(), actualChecksum.to_string());

    moveFile(tmpPath, destination);
    removeTemp.cancel();

    debug("fetched '%s' from cache '%s' (%d bytes)", key, params.name, payloadSize);

    return CacheResult::hit(params.name, ArtifactCacheMode::Http, std::move(block.header.metadata), payloadSize);
}

void HttpArtifactCache::store(
    const ArtifactInfo & info, const BorrowablePath & output, Callback<StoreResult> callback) noexcept
{
    auto callbackPtr = std::make_shared<decltype(callback)>(std::move(callback));

    try {
        /* Covers the store from submission until the upload finishes,
           so it is owned by the queued job. */
        auto act = std::make_shared<Activity>(
            *logger,
            lvlDebug,
            ActivityType::CacheStore,
            fmt("storing '%s' in cache '%s'", info.ruleKeys().front(), params.name),
            cacheActivityFields(params.name, "http", info.ruleKeys(), info.metadata()));

        if (closed)
            throw CacheClosed("cannot store to cache '%s' because it is closed", params.name);

        storePool.enqueue([this, info, output, callbackPtr, act]() mutable {
            std::optional<StoreResult> result;
            try {
                result = storeImpl(info, output);
                act->result(ResultType::CacheStoreResult, (uint64_t) 1, result->artifactSizeBytes);
            } catch (Error & e) {
                reportFailure(fmt("store(%s): %s", info.ruleKeys().front(), e.message()));
                act->result(ResultType::CacheStoreResult, (uint64_t) 0, (uint64_t) 0);
                act.reset();
                callbackPtr->rethrow();
                return;
            } catch (...) {
                act.reset();
                callbackPtr->rethrow();
                return;
            }
            act.reset();
            (*callbackPtr)(std::move(*result));
        });
    } catch (ThreadPoolShutDown &) {
        callbackPtr->rethrow(std::make_exception_ptr(
            CacheClosed("cannot store to cache '%s' because it is closed", params.name)));
    } catch (...) {
        callbackPtr->rethrow();
    }
}

StoreResult HttpArtifactCache::storeImpl(const ArtifactInfo & info, const BorrowablePath & output)
{
    /* Follow symlinks: the limit applies to what would be uploaded. */
    auto st = maybeStat(output.path.string());
    if (!st)
        throw Error("artifact '%s' does not exist", output.path.string());

    if (params.maxStoreSize && uint64_t(st->st_size) > params.maxStoreSize) {
        debug(
            "not storing '%s' in cache '%s': %d bytes exceeds the limit of %d",
            output.path.string(),
            params.name,
            st->st_size,
            params.maxStoreSize);
        return StoreResult{};
    }

    StoreRequest storeRequest(info, output.path);
    auto body = storeRequest.openBody();

    HttpRequest request{
        .method = HttpRequest::Method::Post,
        .path = artifactPath(info.ruleKeys().front()),
        .body = body.get(),
        .contentLength = storeRequest.getContentLength(),
        .contentType = "application/octet-stream",
    };

    auto response = service->makeRequest(request);
    NullSink discard;
    response->body().drainInto(discard);

    auto status = response->statusCode();
    if (status < 200 || status >= 300)
        throw HttpStatusError(
            status,
            "failed to store '%s': server answered %d '%s'",
            info.ruleKeys().front(),
            status,
            response->statusMessage());

    debug("stored '%s' in cache '%s' (%d bytes)", info.ruleKeys().front(), params.name, storeRequest.getPayloadSize());

    return StoreResult{storeRequest.getPayloadSize()};
}

void HttpArtifactCache::close()
{
    if (closed.exchange(true))
        return;
    storePool.shutdown();
    service->close();
}

} // namespace artcache
