#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header

#include "config.hpp"
#include "curl_http_client.hpp"
#include "log_downloader.hpp"
#include "logging.hpp"
#include "period.hpp"
#include "progress_reporter.hpp"

namespace
{
std::atomic<bool> gStopRequested{false};

void handleSignal(int)
{
    gStopRequested.store(true);
}

int listPeriods(LogDownloader &downloader, DataType type)
{
    fmt::print("Fetching available periods for {}...\n", collectionName(type));
    const auto periods = downloader.discoverPeriods(type);

    if (periods.empty())
    {
        fmt::print("No periods found or error occurred\n");
        return downloader.getLastError().empty() ? 0 : 1;
    }

    fmt::print("\nAvailable periods ({} total):\n", periods.size());
    for (std::size_t i = 0; i < periods.size(); ++i)
    {
        fmt::print("{:3d}. {}\n", i + 1, periods[i]);
    }
    return 0;
}
} // namespace

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("Wiki Log Downloader v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS support\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            fmt::print("  - spdlog: Logging\n");
            return 0;
        }
    }

    CLI::App app{"Wiki Log Downloader v1.0 - Download Wikipedia pageview logs from Wikimedia dumps"};
    app.set_config("--config", "", "Read options from an INI file");

    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_flag("-l,--list", config.listOnly, "List available periods and exit");

    app.add_option("-p,--period", config.period, "Period to download (format: YYYY-MM)");

    app.add_option("-t,--type", config.type, "Data type: pageviews or ez (compressed)")
        ->check(CLI::IsMember({"pageviews", "ez"}))
        ->default_val("pageviews");

    app.add_option("-o,--output-dir", config.outputDir, "Output directory")
        ->default_val("./wiki_logs");

    app.add_option("-w,--workers", config.workers, "Number of parallel downloads")
        ->check(CLI::Range(1, 64))
        ->default_val(4);

    app.add_option("-m,--max-files", config.maxFiles, "Maximum number of files to download per period")
        ->check(CLI::PositiveNumber);

    app.add_flag("--no-resume", config.noResume, "Disable resume (existing files are skipped)");

    app.add_option("--chunk-size", config.chunkSize, "Chunk size for downloads in bytes")
        ->check(CLI::Range(1024, 1024 * 1024))
        ->default_val(8192);

    app.add_option("--timeout", config.timeoutSeconds, "Timeout in seconds for each request")
        ->check(CLI::PositiveNumber)
        ->default_val(300);

    app.add_option("--connect-timeout", config.connectTimeoutSeconds, "Connection timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->default_val(30);

    app.add_option("--base-url", config.baseUrl, "Root URL of the dump server")
        ->check([](const std::string &url) -> std::string {
            // Custom validator: check if URL starts with http:// or https://
            if (isHttpUrl(url)) {
                return "";  // Empty string = valid
            }
            return "URL must start with http:// or https://";
        })
        ->default_val(DEFAULT_DUMPS_ROOT);

    app.add_option("--log-level", config.logLevel, "Log level")
        ->check(CLI::IsMember(logLevelNames()))
        ->default_val("info");

    app.add_option("--log-file", config.logFile, "Also write the log to this file");

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    if (!config.listOnly)
    {
        if (!config.period)
        {
            fmt::print(stderr, "Error: --period is required (or use --list to see available periods)\n");
            return 1;
        }
        if (!validatePeriodFormat(*config.period))
        {
            fmt::print(stderr, "Error: Period must be in YYYY-MM format (e.g., 2024-01)\n");
            return 1;
        }
    }

    // ====================================================================
    // RUN
    // ====================================================================

    try
    {
        setupLogging(config.logLevel, config.logFile);
        ensureCurlInitialized();

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        DataType type = DataType::Pageviews;
        if (!parseDataType(config.type, type))
        {
            fmt::print(stderr, "Error: unknown data type '{}'\n", config.type);
            return 1;
        }

        std::filesystem::create_directories(config.outputDir);

        HttpClientOptions httpOptions;
        httpOptions.timeoutSeconds = config.timeoutSeconds;
        httpOptions.connectTimeoutSeconds = config.connectTimeoutSeconds;
        httpOptions.bufferSize = config.chunkSize;
        httpOptions.stopFlag = &gStopRequested;

        auto clientFactory = [httpOptions]() -> std::unique_ptr<HttpClient>
        {
            return std::make_unique<CurlHttpClient>(httpOptions);
        };

        ProgressReporter progress;
        SchedulerOptions schedulerOptions;
        schedulerOptions.chunkSize = static_cast<std::size_t>(config.chunkSize);
        schedulerOptions.onProgress = [&progress](const TransferProgress &p) { progress.report(p); };
        schedulerOptions.stopFlag = &gStopRequested;

        LogDownloader downloader(config.baseUrl,
                                 config.outputDir,
                                 clientFactory,
                                 schedulerOptions,
                                 static_cast<std::size_t>(config.workers));

        if (config.listOnly)
        {
            return listPeriods(downloader, type);
        }

        fmt::print("Wiki Log Downloader\n");
        fmt::print("====================================\n");
        fmt::print("  Period:  {}\n", *config.period);
        fmt::print("  Type:    {}\n", collectionName(type));
        fmt::print("  Output:  {}\n", config.outputDir);
        fmt::print("  Workers: {}\n", config.workers);
        fmt::print("  Resume:  {}\n", config.noResume ? "No" : "Yes");
        if (config.maxFiles)
        {
            fmt::print("  Limit:   {} files\n", *config.maxFiles);
        }
        fmt::print("\n");

        const auto startTime = std::chrono::steady_clock::now();

        std::optional<std::size_t> maxFiles;
        if (config.maxFiles)
        {
            maxFiles = static_cast<std::size_t>(*config.maxFiles);
        }
        const RunStats stats = downloader.downloadPeriod(*config.period, type, !config.noResume, maxFiles);

        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::steady_clock::now() - startTime)
                                 .count();

        fmt::print("\nDownload finished in {}\n", ProgressReporter::formatDuration(static_cast<long>(elapsed)));
        fmt::print("Total: {} files, {} successful, {} failed, {} skipped ({} transferred)\n",
                   stats.total, stats.success, stats.failed, stats.skipped,
                   ProgressReporter::formatBytes(stats.bytesDownloaded));

        if (stats.total == 0 && !downloader.getLastError().empty())
        {
            fmt::print(stderr, "✗ {}\n", downloader.getLastError());
            return 1;
        }

        if (gStopRequested.load())
        {
            fmt::print(stderr, "Interrupted: partial files were kept and will resume on the next run\n");
        }

        if (!stats.allSucceeded())
        {
            fmt::print(stderr, "✗ {} file(s) failed\n", stats.failed);
            return 1;
        }

        fmt::print("✓ Done\n");
        return 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
