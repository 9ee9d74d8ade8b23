#include "artcache/cache/tests/fake-http-service.hh"
#include "artcache/util/strings.hh"

namespace artcache {

namespace {

struct FakeResponse : HttpResponse
{
    std::shared_ptr<Sync<FakeHttpService::State>> state;
    FakeHttpResponse response;
    StringSource source;

    FakeResponse(std::shared_ptr<Sync<FakeHttpService::State>> state, FakeHttpResponse && response)
        : state(std::move(state))
        , response(std::move(response))
        , source(this->response.body)
    {
    }

    ~FakeResponse()
    {
        if (!source.exhausted())
            state->lock()->undrainedResponses++;
    }

    unsigned int statusCode() override
    {
        return response.status;
    }

    std::string statusMessage() override
    {
        return response.statusMessage;
    }

    std::optional<uint64_t> contentLength() override
    {
        if (!response.sendContentLength)
            return std::nullopt;
        return response.contentLength ? *response.contentLength : response.body.size();
    }

    Source & body() override
    {
        return source;
    }
};

} // namespace

std::unique_ptr<HttpResponse> FakeHttpService::makeRequest(const HttpRequest & request)
{
    if (state->lock()->closed)
        throw HttpServiceError("service '%s' is closed", baseUri);

    RecordedRequest recorded{
        .method = request.method,
        .path = request.path,
        .headers = request.headers,
        .contentLength = request.contentLength,
        .contentType = request.contentType,
    };

    if (request.body) {
        StringSink sink;
        request.body->drainInto(sink);
        recorded.body = std::move(sink.s);
    }

    state->lock()->requests.push_back(recorded);

    return std::make_unique<FakeResponse>(state, handler(recorded));
}

static const std::string artifactsPrefix = "/artifacts/key/";

static FakeHttpResponse badRequest(const std::string & msg)
{
    return {.status = 400, .statusMessage = "Bad Request", .body = msg};
}

FakeHttpResponse InMemoryHttpServer::handle(const RecordedRequest & request)
{
    if (!hasPrefix(request.path, artifactsPrefix))
        return {.status = 404, .statusMessage = "Not Found"};

    std::optional<RuleKey> key;
    try {
        key = RuleKey::parse(request.path.substr(artifactsPrefix.size()));
    } catch (BadRuleKey & e) {
        return badRequest(e.message());
    }

    if (request.method == HttpRequest::Method::Get) {
        auto entry = get(*key);
        if (!entry)
            return {.status = 404, .statusMessage = "Not Found"};
        StringSink sink;
        FetchResponse(entry->header, entry->payload).write(sink);
        return {.body = std::move(sink.s)};
    }

    StringSource source(request.body);
    StringSink payload;
    std::optional<StoreRequestReadResult> stored;
    try {
        stored = readStoreRequest(source, payload);
    } catch (Error & e) {
        return badRequest(e.message());
    }

    auto & block = stored->metadataAndPayload.block;
    if (block.expectedChecksum != stored->metadataAndPayload.actualChecksum)
        return badRequest("checksum mismatch");

    for (auto & k : stored->ruleKeys)
        put(k, Entry{block.header, payload.s});

    return {.status = 202, .statusMessage = "Accepted"};
}

void InMemoryHttpServer::put(const RuleKey & key, Entry entry)
{
    entries.lock()->insert_or_assign(key, std::move(entry));
}

std::optional<InMemoryHttpServer::Entry> InMemoryHttpServer::get(const RuleKey & key)
{
    auto entries_(entries.lock());
    auto i = entries_->find(key);
    if (i == entries_->end())
        return std::nullopt;
    return i->second;
}

size_t InMemoryHttpServer::size()
{
    return entries.lock()->size();
}

} // namespace artcache
