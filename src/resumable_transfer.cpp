#include "resumable_transfer.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

TransferOutcome TransferOutcome::failed(ErrorKind errorKind, std::string reason, long httpStatus)
{
    TransferOutcome outcome;
    outcome.kind = Kind::Failed;
    outcome.errorKind = errorKind;
    outcome.reason = std::move(reason);
    outcome.httpStatus = httpStatus;
    return outcome;
}

std::string outcomeKindName(TransferOutcome::Kind kind)
{
    switch (kind)
    {
    case TransferOutcome::Kind::Completed:
        return "completed";
    case TransferOutcome::Kind::ResumedAndCompleted:
        return "resumed";
    case TransferOutcome::Kind::AlreadyComplete:
        return "already-complete";
    case TransferOutcome::Kind::Failed:
        return "failed";
    }
    return "failed";
}

std::optional<double> TransferProgress::percent() const
{
    if (!totalBytes || *totalBytes == 0)
    {
        return std::nullopt;
    }
    return static_cast<double>(bytesSoFar) / static_cast<double>(*totalBytes) * 100.0;
}

ResumableTransfer::ResumableTransfer(HttpClient &client, std::size_t chunkSize, ProgressCallback onProgress)
    : client_(client),
      chunkSize_(std::max<std::size_t>(1, chunkSize)),
      onProgress_(std::move(onProgress))
{
}

TransferOutcome ResumableTransfer::run(const TransferTask &task)
{
    Attempt attempt;
    attempt.path = task.localPath;
    attempt.name = task.localPath.filename().string();
    attempt.buffer.reserve(chunkSize_);

    TransferOutcome outcome = perform(task, attempt);

    // Closing report, so sinks can drop per-file state on every outcome
    if (attempt.progressReported)
    {
        reportProgress(attempt, true);
    }
    return outcome;
}

TransferOutcome ResumableTransfer::perform(const TransferTask &task, Attempt &attempt)
{
    // 1. The size of an existing local file is the resume offset
    if (task.resume)
    {
        std::error_code ec;
        if (fs::exists(attempt.path, ec))
        {
            const auto size = fs::file_size(attempt.path, ec);
            if (ec)
            {
                return TransferOutcome::failed(
                    ErrorKind::LocalIO,
                    fmt::format("Cannot read size of {}: {}", attempt.path.string(), ec.message()));
            }
            attempt.resumeOffset = static_cast<std::uint64_t>(size);
        }
    }

    HttpRequest request{task.url, std::nullopt};
    if (attempt.resumeOffset > 0)
    {
        request.rangeStart = attempt.resumeOffset;
    }

    // 2. Stream; the file is opened only once the status is known
    HttpResult result = client_.stream(
        request,
        [this, &attempt](long status, std::optional<std::uint64_t> contentLength)
        {
            return beginBody(attempt, status, contentLength);
        },
        [this, &attempt](const char *data, std::size_t size)
        {
            return appendBody(attempt, data, size);
        });

    if (attempt.decided)
    {
        attempt.decided->bytesWritten = attempt.bytesWritten;
        return *attempt.decided;
    }

    // Keep every byte that did arrive: it is a valid prefix for the next resume
    if (attempt.out.is_open() && !flushBuffer(attempt))
    {
        return *attempt.decided;
    }

    if (!result.completed && result.errorKind == ErrorKind::Interrupted)
    {
        spdlog::warn("Download of {} interrupted after {} bytes", attempt.name, attempt.bytesWritten);
        TransferOutcome outcome = TransferOutcome::failed(ErrorKind::Interrupted, "interrupted", result.status);
        outcome.bytesWritten = attempt.bytesWritten;
        return outcome;
    }

    if (!result.completed)
    {
        spdlog::error("Error downloading {}: {}", attempt.name, result.error);
        TransferOutcome outcome = TransferOutcome::failed(result.errorKind, result.error, result.status);
        outcome.bytesWritten = attempt.bytesWritten;
        return outcome;
    }

    if (!attempt.out.is_open())
    {
        return TransferOutcome::failed(ErrorKind::ServerRejection,
                                       fmt::format("No usable response for {}", task.url),
                                       result.status);
    }

    attempt.out.close();
    if (attempt.out.fail())
    {
        TransferOutcome outcome = TransferOutcome::failed(
            ErrorKind::LocalIO, fmt::format("Error closing {}", attempt.path.string()), attempt.status);
        outcome.bytesWritten = attempt.bytesWritten;
        return outcome;
    }

    // 3. A body shorter (or longer) than declared is not a finished file
    if (attempt.expectedBody && attempt.bytesWritten != *attempt.expectedBody)
    {
        const std::string reason = fmt::format("Size mismatch for {}: expected {} bytes but got {}",
                                               attempt.name, *attempt.expectedBody, attempt.bytesWritten);
        spdlog::error(reason);
        TransferOutcome outcome = TransferOutcome::failed(ErrorKind::TransientNetwork, reason, attempt.status);
        outcome.bytesWritten = attempt.bytesWritten;
        return outcome;
    }

    TransferOutcome outcome;
    outcome.kind = attempt.appending ? TransferOutcome::Kind::ResumedAndCompleted
                                     : TransferOutcome::Kind::Completed;
    outcome.httpStatus = attempt.status;
    outcome.bytesWritten = attempt.bytesWritten;

    spdlog::info("Completed: {} ({} bytes)", attempt.name, attempt.bytesSoFar);
    return outcome;
}

bool ResumableTransfer::beginBody(Attempt &attempt, long status, std::optional<std::uint64_t> contentLength)
{
    attempt.status = status;

    if (status == 416 && attempt.resumeOffset > 0)
    {
        spdlog::info("File {} already complete", attempt.name);
        TransferOutcome outcome;
        outcome.kind = TransferOutcome::Kind::AlreadyComplete;
        outcome.httpStatus = status;
        attempt.decided = outcome;
        return false;
    }

    if (status == 206 && attempt.resumeOffset > 0)
    {
        spdlog::info("Resuming download of {} from byte {}", attempt.name, attempt.resumeOffset);
        attempt.appending = true;
    }
    else if (status >= 200 && status < 300)
    {
        // The server ignored the range: the partial bytes cannot be trusted
        if (attempt.resumeOffset > 0)
        {
            spdlog::info("Server doesn't support resume, restarting {}", attempt.name);
        }
        else
        {
            spdlog::info("Starting download of {}", attempt.name);
        }
        attempt.appending = false;
    }
    else
    {
        const std::string reason = fmt::format("HTTP error {}: {}", status, httpStatusText(status));
        spdlog::error("Error downloading {}: {}", attempt.name, reason);
        attempt.decided = TransferOutcome::failed(classifyHttpStatus(status), reason, status);
        return false;
    }

    attempt.bytesSoFar = attempt.appending ? attempt.resumeOffset : 0;
    attempt.expectedBody = contentLength;
    if (contentLength)
    {
        attempt.totalBytes = attempt.bytesSoFar + *contentLength;

        std::string spaceError;
        if (!checkDiskSpace(attempt.path, *contentLength, spaceError))
        {
            spdlog::error("Error downloading {}: {}", attempt.name, spaceError);
            attempt.decided = TransferOutcome::failed(ErrorKind::LocalIO, spaceError, status);
            return false;
        }
    }

    const std::ios::openmode mode = std::ios::binary | (attempt.appending ? std::ios::app : std::ios::trunc);
    attempt.out.open(attempt.path, mode);
    if (!attempt.out)
    {
        const std::string reason = fmt::format("Cannot open file for writing: {}", attempt.path.string());
        spdlog::error(reason);
        attempt.decided = TransferOutcome::failed(ErrorKind::LocalIO, reason, status);
        return false;
    }

    return true;
}

bool ResumableTransfer::appendBody(Attempt &attempt, const char *data, std::size_t size)
{
    while (size > 0)
    {
        const std::size_t take = std::min(size, chunkSize_ - attempt.buffer.size());
        attempt.buffer.insert(attempt.buffer.end(), data, data + take);
        data += take;
        size -= take;

        if (attempt.buffer.size() == chunkSize_ && !flushBuffer(attempt))
        {
            return false;
        }
    }
    return true;
}

bool ResumableTransfer::flushBuffer(Attempt &attempt)
{
    if (attempt.buffer.empty())
    {
        return true;
    }

    attempt.out.write(attempt.buffer.data(), static_cast<std::streamsize>(attempt.buffer.size()));
    attempt.out.flush();
    if (!attempt.out.good())
    {
        const std::string reason = fmt::format("Error writing {}", attempt.path.string());
        spdlog::error(reason);
        attempt.decided = TransferOutcome::failed(ErrorKind::LocalIO, reason, attempt.status);
        attempt.decided->bytesWritten = attempt.bytesWritten;
        return false;
    }

    attempt.bytesWritten += attempt.buffer.size();
    attempt.bytesSoFar += attempt.buffer.size();
    attempt.buffer.clear();

    reportProgress(attempt);
    return true;
}

void ResumableTransfer::reportProgress(Attempt &attempt, bool done) const
{
    if (!onProgress_)
    {
        return;
    }

    TransferProgress progress;
    progress.fileName = attempt.name;
    progress.bytesSoFar = attempt.bytesSoFar;
    progress.totalBytes = attempt.totalBytes;
    progress.done = done;
    attempt.progressReported = true;
    onProgress_(progress);
}

bool ResumableTransfer::checkDiskSpace(const fs::path &filePath, std::uint64_t requiredBytes, std::string &error)
{
    if (requiredBytes == 0)
    {
        return true;
    }

    fs::path directory = filePath.parent_path();
    if (directory.empty())
    {
        directory = ".";
    }

    std::error_code ec;
    const fs::space_info spaceInfo = fs::space(directory, ec);
    if (ec)
    {
        // Some filesystems don't support space queries
        spdlog::warn("Unable to check disk space for {}: {}", directory.string(), ec.message());
        return true;
    }

    const std::uint64_t requiredWithBuffer = requiredBytes + requiredBytes / 10;
    if (spaceInfo.available < requiredWithBuffer)
    {
        error = fmt::format("Insufficient disk space: need {} bytes (+ 10% buffer) but only {} available",
                            requiredBytes, spaceInfo.available);
        return false;
    }
    return true;
}
