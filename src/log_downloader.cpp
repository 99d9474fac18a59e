#include "log_downloader.hpp"

#include "listing_parser.hpp"
#include "period.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

LogDownloader::LogDownloader(const std::string &dumpsRoot,
                             fs::path outputDir,
                             HttpClientFactory clientFactory,
                             SchedulerOptions schedulerOptions,
                             std::size_t maxWorkers)
    : pageviews_(makeEndpoint(DataType::Pageviews, dumpsRoot)),
      pagecountsEz_(makeEndpoint(DataType::PagecountsEz, dumpsRoot)),
      outputDir_(std::move(outputDir)),
      clientFactory_(std::move(clientFactory)),
      schedulerOptions_(std::move(schedulerOptions)),
      maxWorkers_(std::max<std::size_t>(1, maxWorkers))
{
}

const RemoteEndpoint &LogDownloader::endpoint(DataType type) const
{
    return type == DataType::PagecountsEz ? pagecountsEz_ : pageviews_;
}

fs::path LogDownloader::periodDirectory(const std::string &period, DataType type) const
{
    return outputDir_ / endpoint(type).collection / period;
}

HttpClient *LogDownloader::listingClient()
{
    if (!listingClient_)
    {
        try
        {
            listingClient_ = clientFactory_();
        }
        catch (const std::exception &e)
        {
            lastError_ = fmt::format("Cannot create HTTP client: {}", e.what());
            return nullptr;
        }
        if (!listingClient_)
        {
            lastError_ = "Cannot create HTTP client";
        }
    }
    return listingClient_.get();
}

std::vector<std::string> LogDownloader::discoverPeriods(DataType type)
{
    lastError_.clear();
    const RemoteEndpoint &remote = endpoint(type);

    HttpClient *client = listingClient();
    if (!client)
    {
        spdlog::error("Error fetching available periods: {}", lastError_);
        return {};
    }

    std::string page;
    if (!client->fetchText(remote.baseUrl, page))
    {
        lastError_ = client->getLastError();
        spdlog::error("Error fetching available periods: {}", lastError_);
        return {};
    }

    std::set<std::string> periods;
    for (const std::string &year : ListingParser::extract(page, ListingPattern::YearDirectory))
    {
        const std::string yearUrl = joinUrl(remote.baseUrl, year + "/");

        std::string yearPage;
        if (!client->fetchText(yearUrl, yearPage))
        {
            // One bad year must not hide all the others
            spdlog::warn("Could not fetch months for year {}: {}", year, client->getLastError());
            continue;
        }

        for (std::string &period : ListingParser::extract(yearPage, ListingPattern::PeriodDirectory))
        {
            periods.insert(std::move(period));
        }
    }

    return std::vector<std::string>(periods.begin(), periods.end());
}

FileListing LogDownloader::listFiles(const std::string &period, DataType type)
{
    lastError_.clear();
    FileListing listing;
    if (!validatePeriodFormat(period))
    {
        lastError_ = fmt::format("Invalid period '{}': expected YYYY-MM", period);
        spdlog::error(lastError_);
        return listing;
    }

    listing.baseUrl = joinUrl(endpoint(type).baseUrl, periodPath(period));

    HttpClient *client = listingClient();
    if (!client)
    {
        spdlog::error("Error fetching files for period {}: {}", period, lastError_);
        return listing;
    }

    std::string page;
    if (!client->fetchText(listing.baseUrl, page))
    {
        lastError_ = client->getLastError();
        spdlog::error("Error fetching files for period {}: {}", period, lastError_);
        return listing;
    }

    listing.files = ListingParser::extract(page, ListingParser::filePatternFor(type));
    return listing;
}

RunStats LogDownloader::downloadPeriod(const std::string &period,
                                       DataType type,
                                       bool resume,
                                       std::optional<std::size_t> maxFiles)
{
    RunAggregator aggregator;

    spdlog::info("Fetching file list for {}...", period);
    FileListing listing = listFiles(period, type);
    if (listing.files.empty())
    {
        spdlog::warn("No files found for period {}", period);
        return aggregator.stats();
    }

    if (maxFiles && listing.files.size() > *maxFiles)
    {
        listing.files.resize(*maxFiles);
    }
    spdlog::info("Found {} files for {}", listing.files.size(), period);

    aggregator.reset(listing.files.size());

    const fs::path directory = periodDirectory(period, type);
    if (!ensureDirectoryExists(directory))
    {
        spdlog::error(lastError_);
        for (std::size_t i = 0; i < listing.files.size(); ++i)
        {
            aggregator.record(TransferOutcome::failed(ErrorKind::LocalIO, lastError_));
        }
        return aggregator.stats();
    }

    // Pre-scheduling decisions: these never reach the scheduler
    std::vector<TransferTask> tasks;
    tasks.reserve(listing.files.size());
    for (const std::string &fileName : listing.files)
    {
        TransferTask task;
        task.url = joinUrl(listing.baseUrl, fileName);
        task.localPath = directory / fileName;
        task.resume = resume;

        if (!isHttpUrl(task.url))
        {
            aggregator.recordSkipped(fileName, fmt::format("invalid URL {}", task.url));
            continue;
        }

        std::error_code ec;
        if (!resume && fs::exists(task.localPath, ec))
        {
            aggregator.recordSkipped(fileName, "already exists and resume is disabled");
            continue;
        }

        tasks.push_back(std::move(task));
    }

    DownloadScheduler scheduler(clientFactory_, schedulerOptions_);
    scheduler.run(tasks, maxWorkers_, [&aggregator](const TaskResult &result)
    {
        aggregator.record(result.outcome);
    });

    const RunStats &stats = aggregator.stats();
    spdlog::info("Period {} completed: {} successful, {} failed, {} skipped",
                 period, stats.success, stats.failed, stats.skipped);
    return stats;
}

bool LogDownloader::ensureDirectoryExists(const fs::path &directory)
{
    std::error_code ec;
    if (fs::is_directory(directory, ec))
    {
        return true;
    }

    // Create all parent directories (like mkdir -p)
    fs::create_directories(directory, ec);
    if (ec)
    {
        lastError_ = fmt::format("Failed to create directory {}: {}", directory.string(), ec.message());
        return false;
    }
    return true;
}
