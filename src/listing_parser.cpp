#include "listing_parser.hpp"

// Anchors may carry other attributes before href; only the href value matters
const std::regex &ListingParser::regexFor(ListingPattern pattern)
{
    static const std::regex year(R"re(<a\s[^>]*?href="(\d{4})/")re");
    static const std::regex period(R"re(<a\s[^>]*?href="(\d{4}-\d{2})/")re");
    static const std::regex pageviews(R"re(<a\s[^>]*?href="(pageviews-\d{10}\.gz)")re");
    static const std::regex pagecounts(R"re(<a\s[^>]*?href="(pagecounts-\d{8}\.bz2)")re");

    switch (pattern)
    {
    case ListingPattern::YearDirectory:
        return year;
    case ListingPattern::PeriodDirectory:
        return period;
    case ListingPattern::PageviewsFile:
        return pageviews;
    case ListingPattern::PagecountsFile:
        return pagecounts;
    }
    return pageviews;
}

std::vector<std::string> ListingParser::extract(const std::string &html, ListingPattern pattern)
{
    std::vector<std::string> names;
    const std::regex &re = regexFor(pattern);

    for (std::sregex_iterator it(html.begin(), html.end(), re), end; it != end; ++it)
    {
        names.push_back((*it)[1].str());
    }
    return names;
}

ListingPattern ListingParser::filePatternFor(DataType type)
{
    return type == DataType::PagecountsEz ? ListingPattern::PagecountsFile
                                          : ListingPattern::PageviewsFile;
}
