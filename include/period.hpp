#pragma once

#include <string>

/**
 * Check that a period is exactly four digits, a hyphen and two digits
 * ("2024-01"). Pure; no range check on the month.
 */
bool validatePeriodFormat(const std::string &period);

/**
 * Year part of a valid period ("2024-01" -> "2024").
 */
std::string periodYear(const std::string &period);

/**
 * Relative path of a period below a collection URL ("2024-01" -> "2024/2024-01/").
 */
std::string periodPath(const std::string &period);
