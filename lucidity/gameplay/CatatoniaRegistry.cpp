#include "lucidity/gameplay/CatatoniaRegistry.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <system_error>
#include <utility>

namespace lucidity::gameplay
{
CatatoniaRegistry::CatatoniaRegistry(core::JobSystem* jobs, FailoverCallback failover)
    : m_jobs(jobs)
    , m_failover(std::move(failover))
{
}

CatatoniaRegistry::~CatatoniaRegistry()
{
    WaitForFailovers();
}

void CatatoniaRegistry::SetFailoverCallback(FailoverCallback failover)
{
    std::unique_lock lock(m_mutex);
    m_failover = std::move(failover);
}

void CatatoniaRegistry::OnCatatoniaEntered(const ledger::ActorId& actorId, ledger::TimePoint enteredAt,
    int currentScore)
{
    {
        std::unique_lock lock(m_mutex);
        m_members[actorId] = enteredAt;
    }
    std::cout << "[CatatoniaRegistry] '" << actorId << "' is catatonic at " << currentScore << "\n";
}

void CatatoniaRegistry::OnCatatoniaCleared(const ledger::ActorId& actorId, ledger::TimePoint resolvedAt)
{
    (void)resolvedAt;
    bool removed = false;
    {
        std::unique_lock lock(m_mutex);
        removed = m_members.erase(actorId) > 0;
    }
    if (removed)
    {
        std::cout << "[CatatoniaRegistry] '" << actorId << "' left catatonia\n";
    }
}

void CatatoniaRegistry::OnFloorReached(const ledger::ActorId& actorId, int currentScore)
{
    FailoverCallback failover;
    {
        std::shared_lock lock(m_mutex);
        failover = m_failover;
    }

    if (!failover)
    {
        std::cout << "CatatoniaRegistry: WARNING - No failover configured for '" << actorId << "'\n";
        return;
    }

    if (m_jobs != nullptr && m_jobs->IsInitialized())
    {
        const core::JobId id = m_jobs->Schedule(
            [failover, actorId, currentScore]() { failover(actorId, currentScore); },
            core::JobPriority::Normal, "catatonia_failover", nullptr,
            [this, actorId](const std::string& jobName, const std::string& error) {
                m_failoverFailures.fetch_add(1);
                std::cerr << "CatatoniaRegistry: ERROR - Job '" << jobName << "' failed for '" << actorId
                          << "': " << error << "\n";
            });
        if (id != core::kInvalidJobId)
        {
            return;
        }
        std::cout << "CatatoniaRegistry: WARNING - Worker pool rejected failover for '" << actorId
                  << "', starting a dedicated thread\n";
    }

    StartFallbackFailover(failover, actorId, currentScore);
}

void CatatoniaRegistry::StartFallbackFailover(const FailoverCallback& failover, const ledger::ActorId& actorId,
    int currentScore)
{
    std::lock_guard<std::mutex> lock(m_fallbackMutex);
    for (auto it = m_fallbackFailovers.begin(); it != m_fallbackFailovers.end();)
    {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        {
            it = m_fallbackFailovers.erase(it);
        }
        else
        {
            ++it;
        }
    }

    try
    {
        m_fallbackFailovers.push_back(std::async(std::launch::async,
            [this, failover, actorId, currentScore]() { RunFailover(failover, actorId, currentScore); }));
    }
    catch (const std::system_error& e)
    {
        m_failoverFailures.fetch_add(1);
        std::cerr << "CatatoniaRegistry: ERROR - Could not start failover for '" << actorId << "': " << e.what()
                  << "\n";
    }
}

void CatatoniaRegistry::WaitForFailovers()
{
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(m_fallbackMutex);
        pending.swap(m_fallbackFailovers);
    }
    for (std::future<void>& failover : pending)
    {
        failover.wait();
    }
}

void CatatoniaRegistry::RunFailover(const FailoverCallback& failover, const ledger::ActorId& actorId,
    int currentScore)
{
    try
    {
        failover(actorId, currentScore);
    }
    catch (const std::exception& e)
    {
        m_failoverFailures.fetch_add(1);
        std::cerr << "CatatoniaRegistry: ERROR - Failover failed for '" << actorId << "': " << e.what() << "\n";
    }
    catch (...)
    {
        m_failoverFailures.fetch_add(1);
        std::cerr << "CatatoniaRegistry: ERROR - Failover failed for '" << actorId << "': unknown exception\n";
    }
}

bool CatatoniaRegistry::IsCatatonic(const ledger::ActorId& actorId) const
{
    std::shared_lock lock(m_mutex);
    return m_members.count(actorId) > 0;
}

std::optional<ledger::TimePoint> CatatoniaRegistry::EnteredAt(const ledger::ActorId& actorId) const
{
    std::shared_lock lock(m_mutex);
    const auto it = m_members.find(actorId);
    if (it == m_members.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ledger::ActorId> CatatoniaRegistry::Members() const
{
    std::shared_lock lock(m_mutex);
    std::vector<ledger::ActorId> members;
    members.reserve(m_members.size());
    for (const auto& [actorId, enteredAt] : m_members)
    {
        members.push_back(actorId);
    }
    return members;
}

std::size_t CatatoniaRegistry::Count() const
{
    std::shared_lock lock(m_mutex);
    return m_members.size();
}

void CatatoniaRegistry::Clear()
{
    std::unique_lock lock(m_mutex);
    m_members.clear();
}
} // namespace lucidity::gameplay
