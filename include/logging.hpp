#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * Level names accepted by setupLogging (spdlog's names).
 */
const std::vector<std::string> &logLevelNames();

/**
 * Install the process-wide "wikilog" logger as spdlog's default logger:
 * colored stderr sink, plus a file sink when logFile is given.
 *
 * @param level One of logLevelNames()
 * @param logFile Optional file that receives the same records
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 * @throws std::invalid_argument on an unknown level name
 */
void setupLogging(const std::string &level, const std::optional<std::string> &logFile);
