#include "run_stats.hpp"

#include <spdlog/spdlog.h>

void RunAggregator::reset(std::size_t total)
{
    stats_ = RunStats{};
    stats_.total = total;
}

void RunAggregator::recordSkipped(const std::string &fileName, const std::string &why)
{
    spdlog::info("Skipping {}: {}", fileName, why);
    ++stats_.skipped;
}

void RunAggregator::record(const TransferOutcome &outcome)
{
    stats_.bytesDownloaded += outcome.bytesWritten;

    switch (outcome.kind)
    {
    case TransferOutcome::Kind::Completed:
    case TransferOutcome::Kind::ResumedAndCompleted:
    case TransferOutcome::Kind::AlreadyComplete:
        ++stats_.success;
        break;
    case TransferOutcome::Kind::Failed:
        ++stats_.failed;
        break;
    }
}
