#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "lucidity/core/Clock.hpp"
#include "lucidity/gameplay/AdjustmentEngine.hpp"
#include "lucidity/gameplay/EffectCatalog.hpp"
#include "lucidity/gameplay/LucidityOutcome.hpp"
#include "lucidity/ledger/LedgerStore.hpp"

namespace lucidity::gameplay
{
inline constexpr const char* kEncounterReasonPrefix = "encounter_";
inline constexpr const char* kRecoveryReasonPrefix = "recovery_";

/// Front door for triggered lucidity effects: hostile encounters and recovery
/// rituals. Validates the request, applies acclimation and cooldown rules,
/// then hands the delta to the AdjustmentEngine.
class ActiveEffectsGateway
{
public:
    ActiveEffectsGateway(ledger::LedgerStore& store, AdjustmentEngine& engine, const EffectCatalog& catalog,
        const core::Clock& clock);

    /// Counts the exposure and applies the category's loss.
    /// @param archetype Monster or phenomenon family the actor met.
    /// @param category Encounter profile key (disturbing, horrific, cosmic, ...).
    LucidityOutcome ApplyEncounter(const ledger::ActorId& actorId, const std::string& archetype,
        const std::string& category, const std::optional<std::string>& locationId = std::nullopt);

    /// Applies a recovery action unless it is still on cooldown.
    /// On OnCooldown the outcome carries the remaining time.
    LucidityOutcome PerformRecovery(const ledger::ActorId& actorId, const std::string& actionCode,
        const std::optional<std::string>& locationId = std::nullopt);

    /// Outcome's cooldownRemaining is zero when the action is free to use.
    [[nodiscard]] LucidityOutcome GetCooldownRemaining(const ledger::ActorId& actorId,
        const std::string& actionCode) const;

    /// Delta for the Nth exposure to a category.
    /// Past the acclimation threshold the repeat loss halves (toward zero), but
    /// a negative repeat never rounds away to nothing.
    [[nodiscard]] static int AcclimatedDelta(const EncounterProfile& profile, int encounterCount,
        int acclimationThreshold);

private:
    [[nodiscard]] static std::chrono::seconds RemainingSeconds(ledger::TimePoint expiresAt, ledger::TimePoint now);

    ledger::LedgerStore& m_store;
    AdjustmentEngine& m_engine;
    const EffectCatalog& m_catalog;
    const core::Clock& m_clock;
};
} // namespace lucidity::gameplay
