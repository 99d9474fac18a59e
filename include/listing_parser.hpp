#pragma once

#include "remote_endpoint.hpp"

#include <regex>
#include <string>
#include <vector>

/**
 * What to pull out of a directory index page.
 */
enum class ListingPattern
{
    YearDirectory,   // <a href="2024/">
    PeriodDirectory, // <a href="2024-01/">
    PageviewsFile,   // <a href="pageviews-2024010100.gz">
    PagecountsFile   // <a href="pagecounts-20240101.bz2">
};

/**
 * Targeted extraction of names from a server-generated directory index.
 *
 * This is not an HTML parser: it scans for anchors whose href has the
 * requested shape and ignores all other markup. The dump server's index
 * format is fixed and simple, which is what makes this sufficient.
 */
class ListingParser
{
public:
    /**
     * Extract all matching names in document order (duplicates kept).
     * Directory names are returned without the trailing slash.
     *
     * @param html Raw page text (may be empty or unrelated)
     * @param pattern Kind of entry to extract
     * @return Matching names; empty when nothing matches
     */
    static std::vector<std::string> extract(const std::string &html, ListingPattern pattern);

    /**
     * File pattern used for a collection's period listings.
     */
    static ListingPattern filePatternFor(DataType type);

private:
    static const std::regex &regexFor(ListingPattern pattern);
};
