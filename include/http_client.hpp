#pragma once

#include "error_kind.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * A single GET request.
 * When rangeStart is set the request carries "Range: bytes=<rangeStart>-".
 */
struct HttpRequest
{
    std::string url;
    std::optional<std::uint64_t> rangeStart;
};

/**
 * What the transport saw for one request.
 */
struct HttpResult
{
    // True when the exchange ran to the end, or was stopped on purpose by a
    // handler. False means a transport failure (see errorKind and error).
    bool completed = false;

    // A handler returned false and the rest of the body was not read.
    bool stoppedByHandler = false;

    long status = 0;
    std::optional<std::uint64_t> contentLength;

    ErrorKind errorKind = ErrorKind::None;
    std::string error;
};

/**
 * Streaming HTTP GET interface.
 *
 * The core never talks to libcurl directly: listing fetches and file transfers
 * go through this interface so that a worker can own its own connection and
 * tests can serve pages from memory.
 *
 * Implementations are NOT required to be thread-safe. Use one instance per
 * thread.
 */
class HttpClient
{
public:
    /**
     * Called once per request, after the response headers and before the
     * first body byte (or after the exchange when the body is empty).
     *
     * @param status HTTP status of the final response (after redirects)
     * @param contentLength Declared Content-Length, if the server sent one
     * @return false to stop the transfer without reading the body
     */
    using ResponseHandler = std::function<bool(long status, std::optional<std::uint64_t> contentLength)>;

    /**
     * Called for each block of body data.
     * @return false to abort the transfer
     */
    using DataHandler = std::function<bool(const char *data, std::size_t size)>;

    virtual ~HttpClient() = default;

    /**
     * Perform a GET request and stream the response body through the handlers.
     * Never throws for network or HTTP errors; they are reported in the result.
     */
    virtual HttpResult stream(const HttpRequest &request,
                              const ResponseHandler &onResponse,
                              const DataHandler &onData) = 0;

    /**
     * GET a (small) page into memory.
     *
     * @param url Page to fetch
     * @param body Receives the response body
     * @return true on a 2xx response; false on transport failure or any other
     *         status, with the cause available from getLastError()
     */
    bool fetchText(const std::string &url, std::string &body);

    std::string getLastError() const { return lastError_; }

protected:
    std::string lastError_;
};

/**
 * Human-readable HTTP status text for a status code (e.g. 404 -> "Not Found").
 */
std::string httpStatusText(long code);

/**
 * Error category of a non-success HTTP status: 5xx is transient, everything
 * else the transfer cannot use is a server rejection.
 */
ErrorKind classifyHttpStatus(long code);
