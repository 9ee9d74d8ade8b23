#include "artcache/cache/http-service.hh"
#include "artcache/util/logging.hh"
#include "artcache/util/pool.hh"
#include "artcache/util/strings.hh"
#include "artcache/util/sync.hh"

#include <curl/curl.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <regex>
#include <thread>

namespace artcache {

struct CurlHandle
{
    CURL * req;

    CurlHandle()
        : req(curl_easy_init())
    {
        if (!req)
            throw HttpServiceError("unable to create a curl handle");
    }

    CurlHandle(const CurlHandle &) = delete;

    ~CurlHandle()
    {
        curl_easy_cleanup(req);
    }
};

struct CurlHttpService : HttpService
{
    std::string baseUri;
    CurlHttpServiceSettings settings;
    Pool<CurlHandle> handles;
    std::atomic_bool closed{false};

    CurlHttpService(const std::string & baseUri, const CurlHttpServiceSettings & settings)
        : baseUri(chomp(baseUri))
        , settings(settings)
        , handles(settings.maxConnections)
    {
        static std::once_flag globalInit;
        std::call_once(globalInit, []() { curl_global_init(CURL_GLOBAL_ALL); });

        while (hasSuffix(this->baseUri, "/"))
            this->baseUri.pop_back();
    }

    std::string getBaseUri() const override
    {
        return baseUri;
    }

    std::unique_ptr<HttpResponse> makeRequest(const HttpRequest & request) override;

    void close() override
    {
        closed = true;
    }
};

/**
 * A transfer runs `curl_easy_perform()` on its own thread. Since the
 * response body is consumed on the caller's thread, a buffer is used
 * to communicate data between them; the transfer thread blocks while
 * the buffer is full.
 */
struct CurlTransfer
{
    CurlHttpService & service;
    HttpRequest request;
    std::string uri;
    Pool<CurlHandle>::Handle handle;
    struct curl_slist * requestHeaders = nullptr;

    /**
     * Set on the transfer thread when reading the request body fails.
     */
    std::exception_ptr readException;

    struct State
    {
        bool headersDone = false;
        unsigned int status = 0;
        std::string statusMsg;
        std::optional<uint64_t> contentLength;

        std::string data;
        size_t dataPos = 0;

        bool finished = false;
        CURLcode code = CURLE_OK;

        /**
         * Whether the consumer has read to the end of the body.
         */
        bool drained = false;

        /**
         * Set when the consumer is gone, to abort the transfer.
         */
        bool quit = false;
    };

    Sync<State> state_;

    /**
     * Signalled when headers or data arrive, or the transfer finishes.
     */
    std::condition_variable avail;

    /**
     * Signalled when the consumer has taken data out of the buffer.
     */
    std::condition_variable request_;

    std::thread thread;

    CurlTransfer(CurlHttpService & service, const HttpRequest & request, Pool<CurlHandle>::Handle && handle)
        : service(service)
        , request(request)
        , uri(service.baseUri + request.path)
        , handle(std::move(handle))
    {
    }

    ~CurlTransfer()
    {
        state_.lock()->quit = true;
        avail.notify_all();
        request_.notify_all();
        if (thread.joinable())
            thread.join();

        /* A connection in the middle of a response can't be reused. */
        {
            auto state(state_.lock());
            if (!(state->finished && state->code == CURLE_OK && state->drained))
                handle.markBad();
        }

        if (requestHeaders)
            curl_slist_free_all(requestHeaders);
    }

    size_t headerCallback(void * contents, size_t size, size_t nmemb)
    {
        size_t realSize = size * nmemb;
        std::string line((char *) contents, realSize);
        printMsg(lvlVomit, "got header for '%s': %s", uri, trim(line));
        static std::regex statusLine("HTTP/[^ ]+ +([0-9]+)(.*)", std::regex::extended | std::regex::icase);
        std::smatch match;
        auto state(state_.lock());
        if (std::regex_match(line, match, statusLine)) {
            state->status = string2Int<unsigned int>(match[1].str()).value_or(0);
            state->statusMsg = trim(match[2].str());
            state->contentLength.reset();
        } else if (trim(line).empty()) {
            /* End of a header block. Informational responses are
               followed by another one. */
            if (state->status >= 200) {
                state->headersDone = true;
                avail.notify_all();
            }
        } else {
            auto i = line.find(':');
            if (i != std::string::npos) {
                std::string name = toLower(trim(std::string(line, 0, i)));
                if (name == "content-length")
                    state->contentLength = string2Int<uint64_t>(trim(std::string(line, i + 1)));
            }
        }
        return realSize;
    }

    static size_t headerCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
    {
        return ((CurlTransfer *) userp)->headerCallback(contents, size, nmemb);
    }

    size_t writeCallback(void * contents, size_t size, size_t nmemb)
    {
        size_t realSize = size * nmemb;
        auto state(state_.lock());

        /* If the buffer is full, then go to sleep until the calling
           thread wakes us up (i.e. when it has removed data from the
           buffer). */
        while (state->data.size() - state->dataPos > 1024 * 1024 && !state->quit)
            state.wait(request_);

        if (state->quit)
            return 0;

        if (state->dataPos == state->data.size()) {
            state->data.clear();
            state->dataPos = 0;
        }
        state->data.append((char *) contents, realSize);
        state->headersDone = true;
        avail.notify_all();
        return realSize;
    }

    static size_t writeCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
    {
        return ((CurlTransfer *) userp)->writeCallback(contents, size, nmemb);
    }

    size_t readCallback(char * buffer, size_t size, size_t nitems)
    {
        try {
            return request.body->read(buffer, size * nitems);
        } catch (EndOfFile &) {
            return 0;
        } catch (...) {
            readException = std::current_exception();
            return CURL_READFUNC_ABORT;
        }
    }

    static size_t readCallbackWrapper(char * buffer, size_t size, size_t nitems, void * userp)
    {
        return ((CurlTransfer *) userp)->readCallback(buffer, size, nitems);
    }

    static int debugCallback(CURL * handle, curl_infotype type, char * data, size_t size, void * userptr)
    {
        if (type == CURLINFO_TEXT)
            vomit("curl: %s", chomp(std::string(data, size)));
        return 0;
    }

    void init()
    {
        auto req = handle->req;

        curl_easy_reset(req);

        if (verbosity >= lvlVomit) {
            curl_easy_setopt(req, CURLOPT_VERBOSE, 1);
            curl_easy_setopt(req, CURLOPT_DEBUGFUNCTION, CurlTransfer::debugCallback);
        }

        curl_easy_setopt(req, CURLOPT_URL, uri.c_str());
        curl_easy_setopt(req, CURLOPT_NOSIGNAL, 1);
        curl_easy_setopt(req, CURLOPT_USERAGENT, "curl/" LIBCURL_VERSION " artcache/" ARTCACHE_VERSION);
        curl_easy_setopt(req, CURLOPT_WRITEFUNCTION, CurlTransfer::writeCallbackWrapper);
        curl_easy_setopt(req, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(req, CURLOPT_HEADERFUNCTION, CurlTransfer::headerCallbackWrapper);
        curl_easy_setopt(req, CURLOPT_HEADERDATA, this);

        for (auto & [name, value] : request.headers)
            requestHeaders = curl_slist_append(requestHeaders, (name + ": " + value).c_str());

        if (request.method == HttpRequest::Method::Post) {
            curl_easy_setopt(req, CURLOPT_POST, 1L);
            /* Don't wait for "100 Continue" before sending the body. */
            requestHeaders = curl_slist_append(requestHeaders, "Expect:");
            if (!request.contentType.empty())
                requestHeaders = curl_slist_append(requestHeaders, ("Content-Type: " + request.contentType).c_str());
            if (request.body) {
                curl_easy_setopt(req, CURLOPT_READFUNCTION, readCallbackWrapper);
                curl_easy_setopt(req, CURLOPT_READDATA, this);
                if (request.contentLength)
                    curl_easy_setopt(req, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t) *request.contentLength);
                else
                    requestHeaders = curl_slist_append(requestHeaders, "Transfer-Encoding: chunked");
            } else
                curl_easy_setopt(req, CURLOPT_POSTFIELDSIZE, 0L);
        } else
            curl_easy_setopt(req, CURLOPT_HTTPGET, 1L);

        curl_easy_setopt(req, CURLOPT_HTTPHEADER, requestHeaders);

        curl_easy_setopt(req, CURLOPT_CONNECTTIMEOUT, service.settings.timeout);

        curl_easy_setopt(req, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(req, CURLOPT_LOW_SPEED_TIME, service.settings.timeout);
    }

    void run()
    {
        auto code = curl_easy_perform(handle->req);

        debug("finished %s of '%s'; curl status = %d", request.methodName(), uri, code);

        {
            auto state(state_.lock());
            state->finished = true;
            state->code = code;
        }
        avail.notify_all();
    }

    void start()
    {
        init();
        thread = std::thread([this]() { run(); });
    }

    /**
     * Describe why the transfer failed.
     */
    std::string failure(CURLcode code)
    {
        if (readException) {
            try {
                std::rethrow_exception(readException);
            } catch (std::exception & e) {
                return fmt("reading request body: %s", e.what());
            }
        }
        return fmt("%s (curl error %d)", curl_easy_strerror(code), code);
    }
};

struct CurlBodySource : Source
{
    CurlTransfer & transfer;

    CurlBodySource(CurlTransfer & transfer)
        : transfer(transfer)
    {
    }

    size_t read(char * data, size_t len) override
    {
        size_t n;
        {
            auto state(transfer.state_.lock());

            while (state->dataPos == state->data.size() && !state->finished)
                state.wait(transfer.avail);

            if (state->dataPos == state->data.size()) {
                if (state->code != CURLE_OK)
                    throw HttpServiceError(
                        "%s of '%s' failed: %s",
                        transfer.request.methodName(),
                        transfer.uri,
                        transfer.failure(state->code));
                state->drained = true;
                throw EndOfFile("end of HTTP response body");
            }

            n = std::min(len, state->data.size() - state->dataPos);
            memcpy(data, state->data.data() + state->dataPos, n);
            state->dataPos += n;
        }
        transfer.request_.notify_one();
        return n;
    }
};

struct CurlHttpResponse : HttpResponse
{
    std::unique_ptr<CurlTransfer> transfer;
    CurlBodySource source;

    CurlHttpResponse(std::unique_ptr<CurlTransfer> && transfer)
        : transfer(std::move(transfer))
        , source(*this->transfer)
    {
    }

    unsigned int statusCode() override
    {
        return transfer->state_.lock()->status;
    }

    std::string statusMessage() override
    {
        return transfer->state_.lock()->statusMsg;
    }

    std::optional<uint64_t> contentLength() override
    {
        return transfer->state_.lock()->contentLength;
    }

    Source & body() override
    {
        return source;
    }
};

std::unique_ptr<HttpResponse> CurlHttpService::makeRequest(const HttpRequest & request)
{
    if (closed)
        throw HttpServiceError("cannot send a request to '%s' after the client was closed", baseUri);

    auto transfer = std::make_unique<CurlTransfer>(*this, request, handles.get());

    debug("sending %s request to '%s'", request.methodName(), transfer->uri);

    transfer->start();

    {
        auto state(transfer->state_.lock());
        while (!state->headersDone && !state->finished)
            state.wait(transfer->avail);

        if (!state->headersDone && (state->code != CURLE_OK || !state->status))
            throw HttpServiceError(
                "%s of '%s' failed: %s", request.methodName(), transfer->uri, transfer->failure(state->code));
    }

    return std::make_unique<CurlHttpResponse>(std::move(transfer));
}

ref<HttpService> makeCurlHttpService(const std::string & baseUri, const CurlHttpServiceSettings & settings)
{
    return make_ref<CurlHttpService>(baseUri, settings);
}

} // namespace artcache
