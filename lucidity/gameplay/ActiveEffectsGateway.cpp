#include "lucidity/gameplay/ActiveEffectsGateway.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace lucidity::gameplay
{
ActiveEffectsGateway::ActiveEffectsGateway(ledger::LedgerStore& store, AdjustmentEngine& engine,
    const EffectCatalog& catalog, const core::Clock& clock)
    : m_store(store)
    , m_engine(engine)
    , m_catalog(catalog)
    , m_clock(clock)
{
}

int ActiveEffectsGateway::AcclimatedDelta(const EncounterProfile& profile, int encounterCount,
    int acclimationThreshold)
{
    if (encounterCount <= 1)
    {
        return profile.firstTime;
    }

    if (encounterCount >= acclimationThreshold)
    {
        const int halved = profile.repeat / 2;
        if (halved == 0 && profile.repeat < 0)
        {
            return -1;
        }
        return halved;
    }

    return profile.repeat;
}

LucidityOutcome ActiveEffectsGateway::ApplyEncounter(const ledger::ActorId& actorId, const std::string& archetype,
    const std::string& category, const std::optional<std::string>& locationId)
{
    const EncounterProfile* profile = m_catalog.FindEncounter(category);
    if (profile == nullptr)
    {
        std::cout << "ActiveEffectsGateway: WARNING - Unknown encounter category '" << category << "'\n";
        return LucidityOutcome::Failure(LucidityError::UnknownEncounterCategory,
            "unknown encounter category: " + category);
    }

    ledger::ExposureState exposure;
    const ledger::StorageStatus status = m_store.IncrementExposure(actorId, archetype, m_clock.Now(), exposure);
    if (status == ledger::StorageStatus::NotFound)
    {
        return LucidityOutcome::Failure(LucidityError::ActorNotFound, "actor not found: " + actorId);
    }
    if (status != ledger::StorageStatus::Ok)
    {
        std::cerr << "ActiveEffectsGateway: ERROR - Exposure update " << ledger::StorageStatusToText(status)
                  << " for '" << actorId << "'\n";
        return LucidityOutcome::Failure(LucidityError::StorageError,
            std::string("storage ") + ledger::StorageStatusToText(status) + " during exposure update");
    }

    const int delta = AcclimatedDelta(*profile, exposure.encounterCount, m_catalog.AcclimationThreshold());
    const nlohmann::json metadata = {
        {"encounter_category", profile->category},
        {"archetype", archetype},
        {"encounter_count", exposure.encounterCount},
        {"acclimated", exposure.encounterCount >= m_catalog.AcclimationThreshold()},
    };

    return m_engine.Apply(actorId, delta, kEncounterReasonPrefix + profile->category, metadata, locationId);
}

LucidityOutcome ActiveEffectsGateway::PerformRecovery(const ledger::ActorId& actorId, const std::string& actionCode,
    const std::optional<std::string>& locationId)
{
    const RecoveryProfile* profile = m_catalog.FindRecovery(actionCode);
    if (profile == nullptr)
    {
        std::cout << "ActiveEffectsGateway: WARNING - Unknown recovery action '" << actionCode << "'\n";
        return LucidityOutcome::Failure(LucidityError::UnknownActionCode, "unknown action code: " + actionCode);
    }

    LucidityOutcome cooldown = GetCooldownRemaining(actorId, profile->actionCode);
    if (!cooldown.Ok())
    {
        return cooldown;
    }
    if (cooldown.cooldownRemaining.count() > 0)
    {
        LucidityOutcome outcome = LucidityOutcome::Failure(LucidityError::OnCooldown,
            profile->actionCode + " is on cooldown");
        outcome.cooldownRemaining = cooldown.cooldownRemaining;
        return outcome;
    }

    const nlohmann::json metadata = {{"action_code", profile->actionCode}, {"source", profile->actionCode}};
    LucidityOutcome outcome =
        m_engine.Apply(actorId, profile->delta, kRecoveryReasonPrefix + profile->actionCode, metadata, locationId);
    if (!outcome.Ok())
    {
        return outcome;
    }

    if (profile->cooldown.count() > 0)
    {
        const ledger::StorageStatus status =
            m_store.SetCooldown(actorId, profile->actionCode, m_clock.Now() + profile->cooldown);
        if (status != ledger::StorageStatus::Ok)
        {
            std::cerr << "ActiveEffectsGateway: ERROR - Cooldown for '" << profile->actionCode << "' not recorded ("
                      << ledger::StorageStatusToText(status) << ") for '" << actorId << "'\n";
        }
        outcome.cooldownRemaining = profile->cooldown;
    }
    return outcome;
}

LucidityOutcome ActiveEffectsGateway::GetCooldownRemaining(const ledger::ActorId& actorId,
    const std::string& actionCode) const
{
    ledger::CooldownRecord record;
    const ledger::StorageStatus status = m_store.GetCooldown(actorId, actionCode, record);
    if (status == ledger::StorageStatus::NotFound)
    {
        return LucidityOutcome{};
    }
    if (status != ledger::StorageStatus::Ok)
    {
        std::cerr << "ActiveEffectsGateway: ERROR - Cooldown lookup " << ledger::StorageStatusToText(status)
                  << " for '" << actorId << "'\n";
        return LucidityOutcome::Failure(LucidityError::StorageError,
            std::string("storage ") + ledger::StorageStatusToText(status) + " during cooldown lookup");
    }

    LucidityOutcome outcome;
    outcome.cooldownRemaining = RemainingSeconds(record.expiresAt, m_clock.Now());
    return outcome;
}

std::chrono::seconds ActiveEffectsGateway::RemainingSeconds(ledger::TimePoint expiresAt, ledger::TimePoint now)
{
    if (expiresAt <= now)
    {
        return std::chrono::seconds(0);
    }
    return std::chrono::ceil<std::chrono::seconds>(expiresAt - now);
}
} // namespace lucidity::gameplay
