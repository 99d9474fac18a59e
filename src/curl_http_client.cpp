#include "curl_http_client.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

struct CurlHttpClient::StreamContext
{
    CURL *curl = nullptr;
    const ResponseHandler *onResponse = nullptr;
    const DataHandler *onData = nullptr;
    const std::atomic<bool> *stopFlag = nullptr;

    bool responseDispatched = false;
    bool stoppedByHandler = false;
    long status = 0;
    std::optional<std::uint64_t> contentLength;
};

void ensureCurlInitialized()
{
    static std::once_flag flag;
    std::call_once(flag, []()
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

static CURL *createCurlHandle()
{
    ensureCurlInitialized();
    return curl_easy_init();
}

CurlHttpClient::CurlHttpClient(HttpClientOptions options)
    : curl_(createCurlHandle(), curl_easy_cleanup), options_(std::move(options))
{
    if (!curl_)
    {
        lastError_ = "Failed to initialize CURL (out of memory or library error)";
        throw std::runtime_error(lastError_);
    }
}

// Destructor: unique_ptr handles cleanup automatically
CurlHttpClient::~CurlHttpClient() = default;

bool CurlHttpClient::dispatchResponse(StreamContext &ctx)
{
    if (ctx.responseDispatched)
    {
        return !ctx.stoppedByHandler;
    }
    ctx.responseDispatched = true;

    // Both values are known once libcurl has parsed the final response headers
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &ctx.status);

    curl_off_t length = -1;
    curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0)
    {
        ctx.contentLength = static_cast<std::uint64_t>(length);
    }

    if (!(*ctx.onResponse)(ctx.status, ctx.contentLength))
    {
        ctx.stoppedByHandler = true;
        return false;
    }
    return true;
}

size_t CurlHttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *ctx = static_cast<StreamContext *>(userdata);
    const size_t totalSize = size * nmemb;

    if (!dispatchResponse(*ctx))
    {
        return 0; // libcurl aborts with CURLE_WRITE_ERROR
    }

    if (!(*ctx->onData)(ptr, totalSize))
    {
        ctx->stoppedByHandler = true;
        return 0;
    }

    return totalSize;
}

int CurlHttpClient::progressCallback(void *clientp,
                                     curl_off_t dltotal,
                                     curl_off_t dlnow,
                                     curl_off_t ultotal,
                                     curl_off_t ulnow)
{
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *ctx = static_cast<StreamContext *>(clientp);
    if (ctx->stopFlag && ctx->stopFlag->load())
    {
        return 1;
    }
    return 0;
}

HttpResult CurlHttpClient::stream(const HttpRequest &request,
                                  const ResponseHandler &onResponse,
                                  const DataHandler &onData)
{
    CURL *curl = curl_.get();
    curl_easy_reset(curl);
    lastError_.clear();

    StreamContext ctx;
    ctx.curl = curl;
    ctx.onResponse = &onResponse;
    ctx.onData = &onData;
    ctx.stopFlag = options_.stopFlag;

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, options_.bufferSize);

    // HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // Worker threads: timeouts must not rely on SIGALRM
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    // CURLOPT_RANGE only adds the header. CURLOPT_RESUME_FROM_LARGE would make
    // libcurl itself reject a 200 reply, and the caller wants to see it.
    std::string range;
    if (request.rangeStart)
    {
        range = fmt::format("{}-", *request.rangeStart);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    const CURLcode res = curl_easy_perform(curl);

    HttpResult result;
    if (res == CURLE_OK)
    {
        // Empty bodies never reach writeCallback
        dispatchResponse(ctx);
        result.completed = true;
    }
    else if (res == CURLE_WRITE_ERROR && ctx.stoppedByHandler)
    {
        result.completed = true;
    }
    else
    {
        result.errorKind = classifyError(res);
        if (errorBuffer[0] != '\0')
        {
            result.error = fmt::format("{} ({})", curl_easy_strerror(res), errorBuffer);
        }
        else
        {
            result.error = curl_easy_strerror(res);
        }
        lastError_ = result.error;
    }

    result.stoppedByHandler = ctx.stoppedByHandler;
    if (ctx.responseDispatched)
    {
        result.status = ctx.status;
        result.contentLength = ctx.contentLength;
    }
    else
    {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
    }

    // The handle must not keep pointers to errorBuffer and ctx past this frame
    curl_easy_reset(curl);

    return result;
}

ErrorKind CurlHttpClient::classifyError(CURLcode code)
{
    switch (code)
    {
    case CURLE_OK:
        return ErrorKind::None;

    case CURLE_ABORTED_BY_CALLBACK: // Stop flag raised
        return ErrorKind::Interrupted;

    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        return ErrorKind::MalformedInput;

    case CURLE_WRITE_ERROR:
    case CURLE_OUT_OF_MEMORY:
        return ErrorKind::LocalIO;

    // TLS problems will not go away by retrying blindly
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
        return ErrorKind::ServerRejection;

    // Timeouts, DNS, refused/reset connections, truncated bodies, ...
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_PARTIAL_FILE:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_GOT_NOTHING:
    default:
        return ErrorKind::TransientNetwork;
    }
}
