#include "progress_reporter.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

ProgressReporter::ProgressReporter(std::chrono::milliseconds interval)
    : interval_(interval)
{
}

void ProgressReporter::report(const TransferProgress &progress)
{
    const auto now = std::chrono::steady_clock::now();
    // The closing report of a failed or unsized transfer also ends its entry
    const bool isComplete =
        progress.done || (progress.totalBytes && progress.bytesSoFar >= *progress.totalBytes);

    std::string line;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = files_.find(progress.fileName);
        if (it == files_.end())
        {
            // First report: remember where this session started, print nothing yet
            FileState state;
            state.started = now;
            state.lastPrinted = now;
            state.startBytes = progress.bytesSoFar;
            if (!isComplete)
            {
                files_.emplace(progress.fileName, state);
            }
            return;
        }

        FileState &state = it->second;
        if (!isComplete && now - state.lastPrinted < interval_)
        {
            return;
        }
        state.lastPrinted = now;

        const double elapsed = std::chrono::duration<double>(now - state.started).count();
        const std::uint64_t sessionBytes =
            progress.bytesSoFar > state.startBytes ? progress.bytesSoFar - state.startBytes : 0;
        line = formatLine(progress, elapsed, sessionBytes);

        if (isComplete)
        {
            files_.erase(it);
        }
    }

    spdlog::debug(line);
}

std::size_t ProgressReporter::trackedFiles() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

std::string ProgressReporter::formatLine(const TransferProgress &progress,
                                         double elapsedSeconds,
                                         std::uint64_t sessionBytes)
{
    const double speed = elapsedSeconds > 0.0 ? static_cast<double>(sessionBytes) / elapsedSeconds : 0.0;

    // If we don't know the total size, show a running byte count only
    const auto percent = progress.percent();
    if (!percent)
    {
        return fmt::format("{}: {} downloaded", progress.fileName, formatBytes(progress.bytesSoFar));
    }

    const std::uint64_t remaining =
        *progress.totalBytes > progress.bytesSoFar ? *progress.totalBytes - progress.bytesSoFar : 0;
    const long eta = speed > 0.0 ? static_cast<long>(static_cast<double>(remaining) / speed) : -1;

    return fmt::format("{}: {:.1f}% ({} / {}) | {}/s | ETA: {}",
                       progress.fileName,
                       *percent,
                       formatBytes(progress.bytesSoFar),
                       formatBytes(*progress.totalBytes),
                       formatBytes(static_cast<std::uint64_t>(speed)),
                       formatDuration(eta));
}

std::string ProgressReporter::formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

std::string ProgressReporter::formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}
