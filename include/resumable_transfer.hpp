#pragma once

#include "error_kind.hpp"
#include "http_client.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * One file to fetch. Stateless: can be rebuilt at any time from the remote
 * file name and the output directory.
 */
struct TransferTask
{
    std::string url;
    std::filesystem::path localPath;
    bool resume = true;
};

/**
 * Terminal result of one transfer. Produced exactly once per task.
 */
struct TransferOutcome
{
    enum class Kind
    {
        Completed,           // Full body written from offset 0
        ResumedAndCompleted, // Server honoured the range, body appended
        AlreadyComplete,     // Server answered 416 to our range, nothing written
        Failed
    };

    Kind kind = Kind::Failed;
    std::string reason; // Empty unless Failed
    ErrorKind errorKind = ErrorKind::None;
    long httpStatus = 0;
    std::uint64_t bytesWritten = 0; // By this attempt only

    bool succeeded() const { return kind != Kind::Failed; }

    static TransferOutcome failed(ErrorKind errorKind, std::string reason, long httpStatus = 0);
};

std::string outcomeKindName(TransferOutcome::Kind kind);

/**
 * Progress snapshot of a running transfer.
 */
struct TransferProgress
{
    std::string fileName;
    std::uint64_t bytesSoFar = 0;            // Including a resumed prefix
    std::optional<std::uint64_t> totalBytes; // Known only with a Content-Length
    bool done = false;                       // Last report for this attempt, whatever its outcome

    /**
     * Percent complete (0-100), when the total is known and non-zero.
     */
    std::optional<double> percent() const;
};

/**
 * Progress sink. May be called from several worker threads at once.
 */
using ProgressCallback = std::function<void(const TransferProgress &)>;

/**
 * Downloads one remote file to one local path, resuming from the local file
 * size when asked to.
 *
 * The local file's size is the only checkpoint. Failed transfers leave
 * whatever was written in place so that a later run can resume from it.
 */
class ResumableTransfer
{
public:
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;

    /**
     * @param client Connection to use; must outlive the transfer
     * @param chunkSize Bytes buffered before each write+flush to disk
     * @param onProgress Optional progress sink, called after every flush
     */
    explicit ResumableTransfer(HttpClient &client,
                               std::size_t chunkSize = DEFAULT_CHUNK_SIZE,
                               ProgressCallback onProgress = nullptr);

    /**
     * Run the transfer. Never throws for network, HTTP or disk errors:
     * they come back as a Failed outcome.
     */
    TransferOutcome run(const TransferTask &task);

    /**
     * Check that the filesystem holding filePath has room for requiredBytes
     * plus a 10% margin. A filesystem that cannot report free space passes.
     *
     * @param error Receives the reason when the check fails
     */
    static bool checkDiskSpace(const std::filesystem::path &filePath,
                               std::uint64_t requiredBytes,
                               std::string &error);

private:
    struct Attempt
    {
        std::filesystem::path path;
        std::string name;
        std::uint64_t resumeOffset = 0;

        std::ofstream out;
        std::vector<char> buffer;
        bool appending = false;

        long status = 0;
        std::optional<std::uint64_t> expectedBody; // Content-Length of this response
        std::optional<std::uint64_t> totalBytes;
        std::uint64_t bytesWritten = 0;
        std::uint64_t bytesSoFar = 0;
        bool progressReported = false;

        // Set when a handler already knows the result (416, bad status, I/O)
        std::optional<TransferOutcome> decided;
    };

    bool beginBody(Attempt &attempt, long status, std::optional<std::uint64_t> contentLength);
    bool appendBody(Attempt &attempt, const char *data, std::size_t size);
    bool flushBuffer(Attempt &attempt);
    TransferOutcome perform(const TransferTask &task, Attempt &attempt);
    void reportProgress(Attempt &attempt, bool done = false) const;

    HttpClient &client_;
    std::size_t chunkSize_;
    ProgressCallback onProgress_;
};
