#include "period.hpp"

#include <regex>

bool validatePeriodFormat(const std::string &period)
{
    static const std::regex pattern(R"(\d{4}-\d{2})");
    return std::regex_match(period, pattern);
}

std::string periodYear(const std::string &period)
{
    return period.substr(0, 4);
}

std::string periodPath(const std::string &period)
{
    return periodYear(period) + "/" + period + "/";
}
