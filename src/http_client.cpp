#include "http_client.hpp"

#include <fmt/core.h>

bool HttpClient::fetchText(const std::string &url, std::string &body)
{
    body.clear();
    lastError_.clear();

    HttpResult result = stream(
        HttpRequest{url, std::nullopt},
        [](long, std::optional<std::uint64_t>) { return true; },
        [&body](const char *data, std::size_t size)
        {
            body.append(data, size);
            return true;
        });

    if (!result.completed)
    {
        lastError_ = fmt::format("Request to {} failed: {}", url, result.error);
        return false;
    }

    if (result.status < 200 || result.status >= 300)
    {
        lastError_ = fmt::format("HTTP error {} ({}) for {}",
                                 result.status, httpStatusText(result.status), url);
        return false;
    }

    return true;
}

std::string errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::MalformedInput:
        return "malformed-input";
    case ErrorKind::TransientNetwork:
        return "transient-network";
    case ErrorKind::ServerRejection:
        return "server-rejection";
    case ErrorKind::LocalIO:
        return "local-io";
    case ErrorKind::Interrupted:
        return "interrupted";
    case ErrorKind::Internal:
        return "internal";
    }
    return "unknown";
}

std::string httpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 416:
        return "Range Not Satisfiable";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}

ErrorKind classifyHttpStatus(long code)
{
    if (code >= 200 && code < 300)
    {
        return ErrorKind::None;
    }

    // 5xx Server Errors - usually transient (overload, restarts)
    if (code >= 500 && code < 600)
    {
        return ErrorKind::TransientNetwork;
    }

    // 4xx and anything unexpected (1xx/3xx that survived redirects)
    return ErrorKind::ServerRejection;
}
