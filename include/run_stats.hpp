#pragma once

#include "resumable_transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Counters for one period download.
 * At the end of a run: success + failed + skipped == total.
 */
struct RunStats
{
    std::size_t total = 0;
    std::size_t success = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::uint64_t bytesDownloaded = 0;

    bool allSucceeded() const { return failed == 0; }
};

/**
 * Folds transfer outcomes into RunStats.
 *
 * Not thread-safe: feed it from a single thread (the scheduler's outcome
 * observer runs on the thread that called DownloadScheduler::run).
 */
class RunAggregator
{
public:
    /**
     * Start a new run of `total` selected files. Clears all counters.
     */
    void reset(std::size_t total);

    /**
     * A file omitted before scheduling (bad URL, existing target without resume).
     */
    void recordSkipped(const std::string &fileName, const std::string &why);

    void record(const TransferOutcome &outcome);

    const RunStats &stats() const { return stats_; }

private:
    RunStats stats_;
};
