#pragma once

#include "remote_endpoint.hpp"

#include <string>
#include <optional> // C++17 feature for optional values

/**
 * Configuration for the log downloader.
 * Populated by CLI11 from command-line arguments (and an optional INI file).
 */
struct DownloadConfig
{
    // What to do
    bool listOnly = false;
    std::optional<std::string> period; // YYYY-MM, required unless listOnly
    std::string type = "pageviews";    // "pageviews" or "ez"

    // Where to put it
    std::string outputDir = "./wiki_logs";
    std::string baseUrl = DEFAULT_DUMPS_ROOT;

    // How to fetch it
    int workers = 4;                  // Parallel downloads
    std::optional<int> maxFiles;      // Only the first N files of the listing
    bool noResume = false;            // Existing targets are skipped when set
    int chunkSize = 8192;             // Bytes per write+flush
    int timeoutSeconds = 300;         // Per request, 5 minutes
    int connectTimeoutSeconds = 30;

    // Logging
    std::string logLevel = "info";
    std::optional<std::string> logFile;

    // Flags
    bool showVersion = false; // Display version and exit
};
