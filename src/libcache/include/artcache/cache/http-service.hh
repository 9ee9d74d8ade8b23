#pragma once
///@file

#include "artcache/util/error.hh"
#include "artcache/util/ref.hh"
#include "artcache/util/serialise.hh"
#include "artcache/util/types.hh"

#include <memory>
#include <optional>

namespace artcache {

/**
 * The transport failed: the connection could not be made, was reset
 * or timed out.
 */
MakeError(HttpServiceError, Error);

/**
 * The server answered with a status the caller cannot use.
 */
class HttpStatusError : public Error
{
public:
    unsigned int status;

    template<typename... Args>
    HttpStatusError(unsigned int status, const Args &... args)
        : Error(args...)
        , status(status)
    {
    }
};

struct HttpRequest
{
    enum class Method { Get, Post };

    Method method = Method::Get;

    /**
     * Path relative to the service's base URI, starting with '/'.
     */
    std::string path;

    Headers headers;

    /**
     * Request body, for POST. It must stay alive until the response
     * has been destroyed.
     */
    Source * body = nullptr;

    std::optional<uint64_t> contentLength;

    std::string contentType;

    std::string methodName() const
    {
        return method == Method::Get ? "GET" : "POST";
    }
};

/**
 * A response whose headers have arrived. The body is streamed from
 * the connection as it is read.
 *
 * A connection is only reused if the body was read to its end before
 * the response is destroyed.
 */
struct HttpResponse
{
    virtual ~HttpResponse() {}

    virtual unsigned int statusCode() = 0;

    virtual std::string statusMessage() = 0;

    /**
     * The Content-Length announced by the server, if any.
     */
    virtual std::optional<uint64_t> contentLength() = 0;

    /**
     * @throws HttpServiceError if the transfer fails mid-body.
     */
    virtual Source & body() = 0;
};

/**
 * A client for one HTTP endpoint.
 */
struct HttpService
{
    virtual ~HttpService() {}

    virtual std::string getBaseUri() const = 0;

    /**
     * Send `request` and wait for the response headers.
     *
     * @throws HttpServiceError on transport failures. Error statuses
     * are returned, not thrown.
     */
    virtual std::unique_ptr<HttpResponse> makeRequest(const HttpRequest & request) = 0;

    virtual void close() = 0;
};

struct CurlHttpServiceSettings
{
    /**
     * Connect timeout, and the time after which a stalled transfer is
     * abandoned, in seconds.
     */
    unsigned long timeout = 3;

    /**
     * The maximum number of idle connections kept for reuse.
     */
    size_t maxConnections = 25;
};

/**
 * An HttpService backed by libcurl.
 */
ref<HttpService> makeCurlHttpService(const std::string & baseUri, const CurlHttpServiceSettings & settings = {});

} // namespace artcache
