#pragma once

#include "lucidity/ledger/LucidityTypes.hpp"

namespace lucidity::gameplay
{
/// Subscriber for terminal-tier transitions and the absolute-floor crossing.
/// Called after the adjustment has been committed, while the actor's row lock
/// is still held, so calls arrive in commit order. Implementations must not
/// block and must not touch the ledger or the AdjustmentEngine.
class TransitionObserver
{
public:
    virtual ~TransitionObserver() = default;

    virtual void OnCatatoniaEntered(const ledger::ActorId& actorId, ledger::TimePoint enteredAt, int currentScore) = 0;
    virtual void OnCatatoniaCleared(const ledger::ActorId& actorId, ledger::TimePoint resolvedAt) = 0;
    virtual void OnFloorReached(const ledger::ActorId& actorId, int currentScore) = 0;
};
} // namespace lucidity::gameplay
