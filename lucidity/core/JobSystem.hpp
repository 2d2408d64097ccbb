#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace lucidity::core
{

using JobId = std::uint64_t;
constexpr JobId kInvalidJobId = 0;

enum class JobPriority : std::uint8_t
{
    High = 0,
    Normal = 1,
    Low = 2,
    Count = 3
};

struct JobStats
{
    std::size_t activeWorkers = 0;
    std::size_t totalWorkers = 0;
    std::size_t pendingJobs = 0;
    std::size_t completedJobs = 0;
    std::size_t failedJobs = 0;
};

class JobCounter
{
public:
    explicit JobCounter(std::size_t initial = 0) : m_count(static_cast<std::ptrdiff_t>(initial)) {}

    void Increment()
    {
        m_count.fetch_add(1, std::memory_order_relaxed);
    }

    void Decrement()
    {
        const auto previous = m_count.fetch_sub(1, std::memory_order_acq_rel);
        if (previous <= 1)
        {
            m_count.store(0, std::memory_order_release);
            m_count.notify_all();
        }
    }

    [[nodiscard]] bool IsZero() const
    {
        return m_count.load(std::memory_order_acquire) <= 0;
    }

    void Wait()
    {
        while (true)
        {
            const auto value = m_count.load(std::memory_order_acquire);
            if (value <= 0)
            {
                return;
            }
            m_count.wait(value, std::memory_order_relaxed);
        }
    }

private:
    std::atomic<std::ptrdiff_t> m_count;
};

/// Worker pool for lucidity background work: parallel passive-flux application
/// and fire-and-forget failover dispatch. Owned by the host; not a singleton.
class JobSystem
{
public:
    using JobFunction = std::function<void()>;

    /// Completion hook for a job that failed. Receives the job name and the
    /// error text. Runs on the worker thread.
    using FailureHook = std::function<void(const std::string& jobName, const std::string& error)>;

    JobSystem() = default;
    ~JobSystem() { Shutdown(); }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    bool Initialize(std::size_t workerCount = 0);

    /// Stops accepting new jobs, runs what is already queued, joins workers.
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }

    JobId Schedule(JobFunction job, JobPriority priority = JobPriority::Normal, std::string_view name = "",
        JobCounter* counter = nullptr, FailureHook onFailure = {});

    template <typename Func>
    void ParallelFor(std::size_t count, std::size_t batchSize, Func&& func, JobCounter& counter,
        JobPriority priority = JobPriority::Normal)
    {
        if (count == 0)
        {
            return;
        }

        if (batchSize == 0)
        {
            batchSize = 1;
        }

        using FuncType = std::decay_t<Func>;
        auto sharedFunc = std::make_shared<FuncType>(std::forward<Func>(func));

        if (!m_initialized || m_workers.size() <= 1 || count <= batchSize)
        {
            for (std::size_t i = 0; i < count; ++i)
            {
                (*sharedFunc)(i);
            }
            return;
        }

        const std::size_t batches = (count + batchSize - 1) / batchSize;
        for (std::size_t batch = 0; batch < batches; ++batch)
        {
            const std::size_t start = batch * batchSize;
            const std::size_t end = std::min(start + batchSize, count);
            const JobId id = Schedule([start, end, sharedFunc]() {
                for (std::size_t i = start; i < end; ++i)
                {
                    (*sharedFunc)(i);
                }
            }, priority, "parallel_for", &counter);

            if (id == kInvalidJobId)
            {
                for (std::size_t i = start; i < end; ++i)
                {
                    (*sharedFunc)(i);
                }
            }
        }
    }

    void WaitForAll();
    void WaitForCounter(JobCounter& counter);

    [[nodiscard]] JobStats GetStats() const;

    [[nodiscard]] std::size_t WorkerCount() const { return m_workers.size(); }

private:
    void WorkerThread(std::size_t index);
    [[nodiscard]] bool QueuesEmpty() const;

    struct Job
    {
        JobFunction function;
        std::string name;
        JobPriority priority = JobPriority::Normal;
        JobCounter* counter = nullptr;
        FailureHook onFailure;
    };

    struct PriorityQueue
    {
        std::queue<Job> jobs;
    };

    std::vector<std::thread> m_workers;
    std::array<PriorityQueue, static_cast<std::size_t>(JobPriority::Count)> m_queues;
    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_completeCondition;

    std::atomic<bool> m_initialized{false};
    std::atomic<bool> m_shutdown{false};
    std::atomic<std::size_t> m_activeJobs{0};
    std::atomic<std::size_t> m_completedJobs{0};
    std::atomic<std::size_t> m_failedJobs{0};
    std::atomic<JobId> m_nextJobId{1};
};

}
