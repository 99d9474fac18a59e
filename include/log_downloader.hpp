#pragma once

#include "download_scheduler.hpp"
#include "http_client.hpp"
#include "remote_endpoint.hpp"
#include "run_stats.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Files available for one period, plus the directory URL they live in.
 */
struct FileListing
{
    std::vector<std::string> files; // Document order
    std::string baseUrl;            // Period directory URL, ends with '/'
};

/**
 * Entry point of the core: discovers periods, enumerates files and
 * downloads a whole period with bounded parallelism.
 *
 * Listing pages are fetched on the calling thread with one HttpClient;
 * transfers get one client per worker from the same factory.
 */
class LogDownloader
{
public:
    /**
     * @param dumpsRoot Dump-server root (collections live below it)
     * @param outputDir Local root; files land in <outputDir>/<collection>/<period>/
     * @param clientFactory Creates HTTP clients (listing + one per worker)
     * @param schedulerOptions Chunk size, progress sink and stop flag for transfers
     * @param maxWorkers Worker cap for downloadPeriod()
     */
    LogDownloader(const std::string &dumpsRoot,
                  std::filesystem::path outputDir,
                  HttpClientFactory clientFactory,
                  SchedulerOptions schedulerOptions = {},
                  std::size_t maxWorkers = DownloadScheduler::DEFAULT_WORKERS);

    /**
     * All periods available for a collection, sorted and unique.
     *
     * A year whose listing cannot be fetched is skipped with a warning.
     * If the collection listing itself cannot be fetched the result is empty
     * and getLastError() explains why.
     */
    std::vector<std::string> discoverPeriods(DataType type);

    /**
     * Files of one period matching the collection's file name shape.
     * Never throws; on failure the list is empty and the cause is logged.
     */
    FileListing listFiles(const std::string &period, DataType type);

    /**
     * Download every file of a period (optionally only the first maxFiles).
     *
     * Files whose URL is not http(s), and existing targets when resume is
     * off, are skipped without being scheduled.
     */
    RunStats downloadPeriod(const std::string &period,
                            DataType type,
                            bool resume = true,
                            std::optional<std::size_t> maxFiles = std::nullopt);

    /**
     * Local directory of a period: <outputDir>/<collection>/<period>.
     */
    std::filesystem::path periodDirectory(const std::string &period, DataType type) const;

    const RemoteEndpoint &endpoint(DataType type) const;

    std::string getLastError() const { return lastError_; }

private:
    HttpClient *listingClient();

    /**
     * Ensure the directory exists, creating it if needed.
     * @return false (with lastError_ set) if it cannot be created
     */
    bool ensureDirectoryExists(const std::filesystem::path &directory);

    const RemoteEndpoint pageviews_;
    const RemoteEndpoint pagecountsEz_;
    std::filesystem::path outputDir_;
    HttpClientFactory clientFactory_;
    SchedulerOptions schedulerOptions_;
    std::size_t maxWorkers_;

    std::unique_ptr<HttpClient> listingClient_;
    std::string lastError_;
};
