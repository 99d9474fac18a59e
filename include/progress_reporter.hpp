#pragma once

#include "resumable_transfer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * Turns progress callbacks from many workers into throttled log lines
 * (debug level), at most one per file per interval.
 * Thread-safe.
 */
class ProgressReporter
{
public:
    explicit ProgressReporter(std::chrono::milliseconds interval = std::chrono::milliseconds(1000));

    /**
     * Progress sink for SchedulerOptions::onProgress.
     */
    void report(const TransferProgress &progress);

    // Files with a transfer still in progress
    std::size_t trackedFiles() const;

    /**
     * One progress line, e.g.
     * "pageviews-2024010100.gz: 42.0% (21.00 MB / 50.00 MB) | 2.10 MB/s | ETA: 13s"
     *
     * @param elapsedSeconds Time since this file's first report (for speed/ETA)
     * @param sessionBytes Bytes received since the first report
     */
    static std::string formatLine(const TransferProgress &progress,
                                  double elapsedSeconds,
                                  std::uint64_t sessionBytes);

    /**
     * Format bytes into human-readable string (e.g., "52.30 MB")
     */
    static std::string formatBytes(std::uint64_t bytes);

    /**
     * Format duration into human-readable string (e.g., "2m 30s")
     */
    static std::string formatDuration(long seconds);

private:
    struct FileState
    {
        std::chrono::steady_clock::time_point started;
        std::chrono::steady_clock::time_point lastPrinted;
        std::uint64_t startBytes = 0;
    };

    std::chrono::milliseconds interval_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, FileState> files_;
};
