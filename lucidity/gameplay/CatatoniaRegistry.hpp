#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "lucidity/core/JobSystem.hpp"
#include "lucidity/gameplay/TransitionObserver.hpp"

namespace lucidity::gameplay
{
/// Relocation hook run when an actor hits the absolute floor.
using FailoverCallback = std::function<void(const ledger::ActorId& actorId, int currentScore)>;

/// In-memory set of actors currently in the terminal tier.
/// Readers share the lock; membership changes take it exclusively.
class CatatoniaRegistry final : public TransitionObserver
{
public:
    /// @param jobs Pool used for failover dispatch. With no running pool each
    ///             failover gets its own thread, joined by WaitForFailovers.
    explicit CatatoniaRegistry(core::JobSystem* jobs = nullptr, FailoverCallback failover = {});
    ~CatatoniaRegistry() override;

    CatatoniaRegistry(const CatatoniaRegistry&) = delete;
    CatatoniaRegistry& operator=(const CatatoniaRegistry&) = delete;

    void SetFailoverCallback(FailoverCallback failover);

    void OnCatatoniaEntered(const ledger::ActorId& actorId, ledger::TimePoint enteredAt, int currentScore) override;
    void OnCatatoniaCleared(const ledger::ActorId& actorId, ledger::TimePoint resolvedAt) override;
    /// Never runs the failover on the calling thread.
    void OnFloorReached(const ledger::ActorId& actorId, int currentScore) override;

    /// Blocks until every failover started without the pool has finished.
    void WaitForFailovers();

    [[nodiscard]] bool IsCatatonic(const ledger::ActorId& actorId) const;
    [[nodiscard]] std::optional<ledger::TimePoint> EnteredAt(const ledger::ActorId& actorId) const;
    [[nodiscard]] std::vector<ledger::ActorId> Members() const;
    [[nodiscard]] std::size_t Count() const;
    void Clear();

    [[nodiscard]] std::size_t FailoverFailures() const { return m_failoverFailures.load(); }

private:
    void RunFailover(const FailoverCallback& failover, const ledger::ActorId& actorId, int currentScore);
    void StartFallbackFailover(const FailoverCallback& failover, const ledger::ActorId& actorId, int currentScore);

    core::JobSystem* m_jobs = nullptr;
    FailoverCallback m_failover;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<ledger::ActorId, ledger::TimePoint> m_members;
    std::atomic<std::size_t> m_failoverFailures{0};

    std::mutex m_fallbackMutex;
    std::vector<std::future<void>> m_fallbackFailovers;
};
} // namespace lucidity::gameplay
