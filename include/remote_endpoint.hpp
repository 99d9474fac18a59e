#pragma once

#include <string>

/**
 * The two dump collections this tool knows how to fetch.
 */
enum class DataType
{
    Pageviews,   // Hourly files: pageviews-YYYYMMDDHH.gz
    PagecountsEz // Daily files: pagecounts-YYYYMMDD.bz2
};

/**
 * Default root of the public dump server. Collections live directly below it.
 */
inline constexpr const char *DEFAULT_DUMPS_ROOT = "https://dumps.wikimedia.org/other/";

/**
 * Location of one collection on the dump server.
 */
struct RemoteEndpoint
{
    DataType type = DataType::Pageviews;
    std::string collection; // "pageviews" or "pagecounts-ez"
    std::string baseUrl;    // Always ends with '/'
};

/**
 * Remote directory (and local directory) name of a collection.
 */
std::string collectionName(DataType type);

/**
 * Parse a data type as given on the command line.
 * Accepts "pageviews", "ez" and "pagecounts-ez".
 *
 * @return false if the name is not recognized (out is left untouched)
 */
bool parseDataType(const std::string &name, DataType &out);

/**
 * Build the endpoint of a collection below a dump-server root.
 * A missing trailing slash on the root is tolerated.
 */
RemoteEndpoint makeEndpoint(DataType type, const std::string &dumpsRoot = DEFAULT_DUMPS_ROOT);

/**
 * Append a relative segment to a directory URL, inserting '/' if needed.
 */
std::string joinUrl(const std::string &base, const std::string &segment);

/**
 * True if the URL uses http:// or https://.
 */
bool isHttpUrl(const std::string &url);
