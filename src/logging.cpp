#include "logging.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

const std::vector<std::string> &logLevelNames()
{
    static const std::vector<std::string> names = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    return names;
}

void setupLogging(const std::string &level, const std::optional<std::string> &logFile)
{
    const auto &names = logLevelNames();
    if (std::find(names.begin(), names.end(), level) == names.end())
    {
        throw std::invalid_argument("Unknown log level: " + level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (logFile)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*logFile));
    }

    auto logger = std::make_shared<spdlog::logger>("wikilog", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}
