#include "download_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{
// Joins the workers on every exit path of run()
struct WorkerJoiner
{
    std::vector<std::thread> &threads;

    ~WorkerJoiner()
    {
        for (auto &thread : threads)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }
    }
};
} // namespace

DownloadScheduler::DownloadScheduler(HttpClientFactory clientFactory, SchedulerOptions options)
    : clientFactory_(std::move(clientFactory)), options_(std::move(options))
{
}

std::vector<TaskResult> DownloadScheduler::run(const std::vector<TransferTask> &tasks,
                                               std::size_t maxWorkers,
                                               const OutcomeObserver &onOutcome)
{
    std::vector<TaskResult> reported;
    reported.reserve(tasks.size());
    if (tasks.empty())
    {
        return reported;
    }

    const std::size_t workerCount = std::min(std::max<std::size_t>(1, maxWorkers), tasks.size());
    spdlog::debug("Starting {} workers for {} tasks", workerCount, tasks.size());

    RunQueue queue;
    std::vector<std::thread> workers;
    WorkerJoiner joiner{workers};

    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        workers.emplace_back([this, &tasks, &queue]() { workerLoop(tasks, queue); });
    }

    // Fan-in: this thread is the only consumer of the results queue
    while (reported.size() < tasks.size())
    {
        std::unique_lock<std::mutex> lock(queue.mutex);
        queue.resultReady.wait(lock, [&queue]() { return !queue.results.empty(); });

        TaskResult result = std::move(queue.results.front());
        queue.results.pop_front();
        lock.unlock();

        if (onOutcome)
        {
            onOutcome(result);
        }
        reported.push_back(std::move(result));
    }

    return reported;
}

void DownloadScheduler::workerLoop(const std::vector<TransferTask> &tasks, RunQueue &queue)
{
    std::unique_ptr<HttpClient> client;
    std::string clientError = "factory returned no client";
    try
    {
        client = clientFactory_();
    }
    catch (const std::exception &e)
    {
        clientError = e.what();
        spdlog::error("Cannot create HTTP client: {}", clientError);
    }

    for (;;)
    {
        std::size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(queue.mutex);
            if (queue.nextTask >= tasks.size())
            {
                return;
            }
            index = queue.nextTask++;
        }

        const TransferTask &task = tasks[index];
        TransferOutcome outcome;
        if (stopRequested())
        {
            outcome = TransferOutcome::failed(ErrorKind::Interrupted, "cancelled before start");
        }
        else if (!client)
        {
            outcome = TransferOutcome::failed(ErrorKind::LocalIO,
                                              fmt::format("HTTP client unavailable: {}", clientError));
        }
        else
        {
            outcome = transferOne(*client, task);
        }

        {
            std::lock_guard<std::mutex> lock(queue.mutex);
            queue.results.push_back(TaskResult{task, std::move(outcome)});
        }
        queue.resultReady.notify_one();
    }
}

TransferOutcome DownloadScheduler::transferOne(HttpClient &client, const TransferTask &task)
{
    // Nothing thrown by one transfer may reach its siblings or the scheduler
    try
    {
        ResumableTransfer transfer(client, options_.chunkSize, options_.onProgress);
        return transfer.run(task);
    }
    catch (const std::exception &e)
    {
        spdlog::error("Exception during download of {}: {}", task.localPath.filename().string(), e.what());
        return TransferOutcome::failed(ErrorKind::Internal, e.what());
    }
    catch (...)
    {
        spdlog::error("Unknown exception during download of {}", task.localPath.filename().string());
        return TransferOutcome::failed(ErrorKind::Internal, "unknown exception");
    }
}

bool DownloadScheduler::stopRequested() const
{
    return options_.stopFlag && options_.stopFlag->load();
}
