#pragma once

#include "http_client.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <curl/curl.h>

/**
 * Connection settings shared by every CurlHttpClient of a run.
 */
struct HttpClientOptions
{
    long timeoutSeconds = 300;       // Whole request, including the body
    long connectTimeoutSeconds = 30; // Establishing the connection only
    long bufferSize = 8192;          // libcurl receive buffer (bytes)
    std::string userAgent = "WikiLogDownloader/1.0";

    // When set and true, a running transfer is aborted at the next progress tick.
    const std::atomic<bool> *stopFlag = nullptr;
};

/**
 * Initialize libcurl once per process (thread-safe).
 * @throws std::runtime_error if curl_global_init fails
 */
void ensureCurlInitialized();

/**
 * HttpClient backed by one libcurl easy handle.
 * Uses RAII to manage the CURL handle lifecycle; the handle is reset and
 * reused for every request made through this instance.
 */
class CurlHttpClient final : public HttpClient
{
public:
    /**
     * @throws std::runtime_error if the CURL handle cannot be created
     */
    explicit CurlHttpClient(HttpClientOptions options = {});
    ~CurlHttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    CurlHttpClient(const CurlHttpClient &) = delete;
    CurlHttpClient &operator=(const CurlHttpClient &) = delete;

    HttpResult stream(const HttpRequest &request,
                      const ResponseHandler &onResponse,
                      const DataHandler &onData) override;

    /**
     * Map a libcurl failure to an error category.
     * CURLE_WRITE_ERROR is LocalIO: only our own write path can cause it.
     */
    static ErrorKind classifyError(CURLcode code);

private:
    struct StreamContext;

    /**
     * Static callback for libcurl to deliver body data.
     * libcurl is a C library, so callbacks must be static or free functions.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Transfer-info callback, used only to honour the stop flag.
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    // Hands status and Content-Length to the response handler exactly once.
    static bool dispatchResponse(StreamContext &ctx);

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
    HttpClientOptions options_;
};
