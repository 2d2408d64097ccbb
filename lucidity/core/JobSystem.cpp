#include "lucidity/core/JobSystem.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace lucidity::core
{

bool JobSystem::Initialize(std::size_t workerCount)
{
    if (m_initialized)
    {
        return true;
    }

    if (workerCount == 0)
    {
        const auto hardware = std::thread::hardware_concurrency();
        workerCount = hardware > 1 ? hardware - 1 : 1;
    }

    workerCount = std::max<std::size_t>(1, workerCount);

    m_shutdown = false;
    m_activeJobs = 0;
    m_completedJobs = 0;
    m_failedJobs = 0;
    m_nextJobId = 1;

    m_workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        m_workers.emplace_back(&JobSystem::WorkerThread, this, i);
    }

    m_initialized = true;
    std::cout << "[JobSystem] Initialized with " << workerCount << " workers\n";
    return true;
}

void JobSystem::Shutdown()
{
    if (!m_initialized)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_shutdown = true;
    }
    m_condition.notify_all();

    for (std::thread& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    m_workers.clear();

    m_initialized = false;
    m_completeCondition.notify_all();
    std::cout << "[JobSystem] Shutdown complete (" << m_completedJobs.load() << " jobs, " << m_failedJobs.load()
              << " failed)\n";
}

JobId JobSystem::Schedule(JobFunction job, JobPriority priority, std::string_view name, JobCounter* counter,
    FailureHook onFailure)
{
    if (!m_initialized || !job)
    {
        return kInvalidJobId;
    }

    const JobId id = m_nextJobId.fetch_add(1);

    Job j;
    j.function = std::move(job);
    j.name = std::string(name);
    j.priority = priority;
    j.counter = counter;
    j.onFailure = std::move(onFailure);

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_shutdown)
        {
            return kInvalidJobId;
        }
        if (j.counter != nullptr)
        {
            j.counter->Increment();
        }
        m_queues[static_cast<std::size_t>(priority)].jobs.push(std::move(j));
    }

    m_condition.notify_one();
    return id;
}

bool JobSystem::QueuesEmpty() const
{
    for (const auto& queue : m_queues)
    {
        if (!queue.jobs.empty())
        {
            return false;
        }
    }
    return true;
}

void JobSystem::WaitForAll()
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_completeCondition.wait(lock, [this]() {
        return !m_initialized || (QueuesEmpty() && m_activeJobs.load() == 0);
    });
}

void JobSystem::WaitForCounter(JobCounter& counter)
{
    counter.Wait();
}

JobStats JobSystem::GetStats() const
{
    JobStats stats;
    stats.totalWorkers = m_workers.size();
    stats.completedJobs = m_completedJobs.load();
    stats.failedJobs = m_failedJobs.load();
    stats.activeWorkers = std::min(m_activeJobs.load(), stats.totalWorkers);

    std::lock_guard<std::mutex> lock(m_queueMutex);
    for (const auto& queue : m_queues)
    {
        stats.pendingJobs += queue.jobs.size();
    }
    return stats;
}

void JobSystem::WorkerThread(std::size_t index)
{
    while (true)
    {
        Job job;

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            m_condition.wait(lock, [this]() { return m_shutdown || !QueuesEmpty(); });

            for (std::size_t p = 0; p < static_cast<std::size_t>(JobPriority::Count); ++p)
            {
                if (!m_queues[p].jobs.empty())
                {
                    job = std::move(m_queues[p].jobs.front());
                    m_queues[p].jobs.pop();
                    break;
                }
            }

            if (!job.function)
            {
                // Only reachable once shut down with nothing left to drain.
                return;
            }
            ++m_activeJobs;
        }

        std::string error;
        try
        {
            job.function();
        }
        catch (const std::exception& e)
        {
            error = e.what();
        }
        catch (...)
        {
            error = "unknown exception";
        }

        if (!error.empty())
        {
            ++m_failedJobs;
            std::cerr << "[JobSystem] Worker " << index << " job '" << job.name << "' failed: " << error << "\n";
            if (job.onFailure)
            {
                try
                {
                    job.onFailure(job.name, error);
                }
                catch (const std::exception& e)
                {
                    std::cerr << "[JobSystem] Failure hook for '" << job.name << "' threw: " << e.what() << "\n";
                }
            }
        }

        if (job.counter != nullptr)
        {
            job.counter->Decrement();
        }
        ++m_completedJobs;

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            --m_activeJobs;
        }
        m_completeCondition.notify_all();
    }
}

}
