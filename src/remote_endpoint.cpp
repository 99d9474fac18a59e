#include "remote_endpoint.hpp"

std::string collectionName(DataType type)
{
    switch (type)
    {
    case DataType::Pageviews:
        return "pageviews";
    case DataType::PagecountsEz:
        return "pagecounts-ez";
    }
    return "pageviews";
}

bool parseDataType(const std::string &name, DataType &out)
{
    if (name == "pageviews")
    {
        out = DataType::Pageviews;
        return true;
    }
    if (name == "ez" || name == "pagecounts-ez")
    {
        out = DataType::PagecountsEz;
        return true;
    }
    return false;
}

RemoteEndpoint makeEndpoint(DataType type, const std::string &dumpsRoot)
{
    RemoteEndpoint endpoint;
    endpoint.type = type;
    endpoint.collection = collectionName(type);
    endpoint.baseUrl = joinUrl(dumpsRoot, endpoint.collection + "/");
    return endpoint;
}

std::string joinUrl(const std::string &base, const std::string &segment)
{
    if (base.empty())
    {
        return segment;
    }

    std::string url = base;
    if (url.back() != '/')
    {
        url += '/';
    }

    std::size_t skip = 0;
    while (skip < segment.size() && segment[skip] == '/')
    {
        ++skip;
    }
    url.append(segment, skip, std::string::npos);
    return url;
}

bool isHttpUrl(const std::string &url)
{
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}
