#pragma once
///@file

#include "artcache/cache/http-binary-protocol.hh"
#include "artcache/cache/http-service.hh"
#include "artcache/util/sync.hh"

#include <map>

namespace artcache {

/**
 * A request as seen by a FakeHttpService, with its body read out.
 */
struct RecordedRequest
{
    HttpRequest::Method method;
    std::string path;
    Headers headers;
    std::optional<uint64_t> contentLength;
    std::string contentType;
    std::string body;
};

struct FakeHttpResponse
{
    unsigned int status = 200;

    std::string statusMessage = "OK";

    std::string body;

    /**
     * Defaults to the size of `body`.
     */
    std::optional<uint64_t> contentLength;

    bool sendContentLength = true;
};

/**
 * An HttpService that answers from a handler function instead of the
 * network, and records what it was asked.
 *
 * A handler that throws HttpServiceError simulates a transport
 * failure.
 */
class FakeHttpService : public HttpService
{
public:

    typedef std::function<FakeHttpResponse(const RecordedRequest &)> Handler;

    struct State
    {
        std::vector<RecordedRequest> requests;

        /**
         * Responses destroyed before their body was read to the end.
         */
        size_t undrainedResponses = 0;

        bool closed = false;
    };

private:

    Handler handler;

    std::string baseUri;

    std::shared_ptr<Sync<State>> state;

public:

    FakeHttpService(Handler handler, std::string baseUri = "http://localhost:8080")
        : handler(std::move(handler))
        , baseUri(std::move(baseUri))
        , state(std::make_shared<Sync<State>>())
    {
    }

    std::string getBaseUri() const override
    {
        return baseUri;
    }

    std::unique_ptr<HttpResponse> makeRequest(const HttpRequest & request) override;

    void close() override
    {
        state->lock()->closed = true;
    }

    std::vector<RecordedRequest> getRequests()
    {
        return state->lock()->requests;
    }

    size_t undrainedResponses()
    {
        return state->lock()->undrainedResponses;
    }

    bool isClosed()
    {
        return state->lock()->closed;
    }
};

/**
 * A remote cache server kept in memory, speaking the binary protocol
 * through a FakeHttpService.
 */
class InMemoryHttpServer
{
public:

    struct Entry
    {
        ArtifactMetadataHeader header;
        std::string payload;
    };

private:

    Sync<std::map<RuleKey, Entry>> entries;

public:

    FakeHttpResponse handle(const RecordedRequest & request);

    FakeHttpService::Handler handler()
    {
        return [this](const RecordedRequest & request) { return handle(request); };
    }

    void put(const RuleKey & key, Entry entry);

    std::optional<Entry> get(const RuleKey & key);

    size_t size();
};

} // namespace artcache
