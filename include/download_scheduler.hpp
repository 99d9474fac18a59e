#pragma once

#include "http_client.hpp"
#include "resumable_transfer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * A task together with the outcome it produced.
 */
struct TaskResult
{
    TransferTask task;
    TransferOutcome outcome;
};

/**
 * Builds one HttpClient per worker thread.
 */
using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

struct SchedulerOptions
{
    std::size_t chunkSize = ResumableTransfer::DEFAULT_CHUNK_SIZE;
    ProgressCallback onProgress;

    // Once true, no further task is started.
    const std::atomic<bool> *stopFlag = nullptr;
};

/**
 * Runs transfers on a bounded set of worker threads.
 *
 * Workers pull tasks in submission order from a shared queue and push
 * outcomes onto a single results queue. The calling thread drains that queue,
 * so the observer passed to run() is never invoked concurrently and sees
 * outcomes in completion order.
 */
class DownloadScheduler
{
public:
    using OutcomeObserver = std::function<void(const TaskResult &)>;

    static constexpr std::size_t DEFAULT_WORKERS = 4;

    explicit DownloadScheduler(HttpClientFactory clientFactory, SchedulerOptions options = {});

    /**
     * Transfer every task with at most maxWorkers in flight.
     *
     * Every task yields exactly one result, even when its transfer throws or
     * the stop flag is raised (not-yet-started tasks then fail as Interrupted).
     *
     * @param tasks Tasks in submission order
     * @param maxWorkers Worker cap (0 is treated as 1)
     * @param onOutcome Called on the calling thread for each result as it arrives
     * @return All results, in completion order
     */
    std::vector<TaskResult> run(const std::vector<TransferTask> &tasks,
                                std::size_t maxWorkers,
                                const OutcomeObserver &onOutcome = nullptr);

private:
    struct RunQueue
    {
        std::mutex mutex;
        std::condition_variable resultReady;
        std::size_t nextTask = 0;
        std::deque<TaskResult> results;
    };

    void workerLoop(const std::vector<TransferTask> &tasks, RunQueue &queue);
    TransferOutcome transferOne(HttpClient &client, const TransferTask &task);
    bool stopRequested() const;

    HttpClientFactory clientFactory_;
    SchedulerOptions options_;
};
