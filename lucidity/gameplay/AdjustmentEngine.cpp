#include "lucidity/gameplay/AdjustmentEngine.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#include "lucidity/ledger/LiabilityCodec.hpp"
#include "lucidity/ledger/TierResolver.hpp"

namespace lucidity::gameplay
{
namespace
{
constexpr int kStorageErrorEscalation = 2;
constexpr int kStorageCriticalEscalation = 5;

const char* CatatoniaEnteredMessage = "Your senses collapse into static; only allies can reach you now.";
const char* CatatoniaClearedMessage = "Consciousness steadies; the grounding ritual completes.";
const char* DeliriumMessage = "Your mind fractures completely. The sanitarium calls you back from the edge of madness...";
const char* FloorReachedMessage = "Orderlies whisk you away to the sanitarium for observation.";
}

std::vector<std::string> DefaultLiabilityCatalog()
{
    return {
        "night_frayed_reflexes",
        "murmuring_chorus",
        "ritual_compulsion",
        "ethereal_chill",
        "bleak_outlook",
    };
}

AdjustmentEngine::AdjustmentEngine(ledger::LedgerStore& store, const core::Clock& clock,
    TransitionObserver* observer, LucidityNotifier* notifier, AdjustmentEngineSettings settings)
    : m_store(store)
    , m_clock(clock)
    , m_observer(observer)
    , m_notifier(notifier)
    , m_settings(std::move(settings))
{
}

void AdjustmentEngine::SetLiabilityPicker(LiabilityPicker picker)
{
    m_liabilityPicker = std::move(picker);
}

std::optional<std::string> AdjustmentEngine::PickDefaultLiability(const ledger::LucidityRecord& record) const
{
    for (const std::string& code : m_settings.liabilityCatalog)
    {
        if (!record.HasLiability(code))
        {
            return code;
        }
    }
    if (m_settings.liabilityCatalog.empty())
    {
        return std::nullopt;
    }
    return m_settings.liabilityCatalog.front();
}

LucidityOutcome AdjustmentEngine::Apply(const ledger::ActorId& actorId, int delta, const std::string& reasonCode,
    const nlohmann::json& metadata, const std::optional<std::string>& locationId)
{
    std::unique_ptr<ledger::ActorTransaction> transaction;
    ledger::StorageStatus status = m_store.BeginTransaction(actorId, m_settings.storageTimeout, transaction);
    if (status != ledger::StorageStatus::Ok)
    {
        return StorageFailure(actorId, status, "begin");
    }

    ledger::LucidityRecord record;
    status = transaction->GetOrCreate(record);
    if (status != ledger::StorageStatus::Ok)
    {
        return StorageFailure(actorId, status, "load");
    }

    const ledger::TimePoint now = m_clock.Now();
    const int previousScore = record.score;
    const ledger::Tier previousTier = record.tier;
    const int newScore = ledger::ClampScore(static_cast<long long>(previousScore) + delta);
    const ledger::Tier newTier = ledger::ResolveTier(newScore);

    record.score = newScore;
    record.tier = newTier;
    record.updatedAt = now;

    Crossings crossings;
    if (newTier == ledger::Tier::Terminal)
    {
        if (!record.catatoniaEnteredAt.has_value())
        {
            record.catatoniaEnteredAt = now;
            crossings.catatoniaEntered = true;
        }
    }
    else if (record.catatoniaEnteredAt.has_value())
    {
        record.catatoniaEnteredAt.reset();
        crossings.catatoniaCleared = true;
    }

    crossings.delirium = newScore <= kDeliriumThreshold && previousScore > kDeliriumThreshold;
    crossings.floorReached = newScore <= kFloorThreshold && previousScore > kFloorThreshold;

    AdjustmentResult result;
    result.actorId = actorId;
    result.previousScore = previousScore;
    result.newScore = newScore;
    result.previousTier = previousTier;
    result.newTier = newTier;
    result.delta = delta;

    const bool severeLoss = delta < 0 && delta <= -m_settings.liabilityLossThreshold;
    if (severeLoss || ledger::IsWorse(newTier, previousTier))
    {
        const std::optional<std::string> code = m_liabilityPicker
            ? m_liabilityPicker(record, previousScore, newScore, reasonCode)
            : PickDefaultLiability(record);
        if (code.has_value() && !code->empty())
        {
            ledger::StackLiability(record.liabilities, *code);
            result.liabilitiesAdded.push_back(*code);
        }
    }

    ledger::AdjustmentLogEntry logEntry;
    logEntry.actorId = actorId;
    logEntry.delta = delta;
    logEntry.reasonCode = reasonCode;
    logEntry.metadata = ledger::NormalizeMetadata(metadata);
    logEntry.locationId = locationId;
    logEntry.createdAt = now;

    status = transaction->SaveAdjustment(record, logEntry);
    if (status != ledger::StorageStatus::Ok)
    {
        return StorageFailure(actorId, status, "save");
    }
    m_consecutiveStorageFailures.store(0);

    // Observer order must follow commit order, so it runs before the row lock is released.
    NotifyObserver(record, crossings, now);
    transaction.reset();

    PublishCrises(record, crossings);

    if (delta != 0 || previousTier != newTier)
    {
        if (m_notifier != nullptr)
        {
            StateChangeNotice notice;
            notice.actorId = actorId;
            notice.score = newScore;
            notice.maxScore = ResolveMaxScore(actorId);
            notice.delta = delta;
            notice.tier = newTier;
            notice.liabilities = record.liabilities;
            notice.reason = reasonCode;
            notice.source = LucidityNotifier::ResolveSource(logEntry.metadata, locationId);
            notice.metadata = logEntry.metadata;
            m_notifier->PublishStateChange(notice);
        }
    }

    std::cout << "[AdjustmentEngine] Applied " << delta << " to '" << actorId << "' (" << reasonCode << "): "
              << previousScore << " -> " << newScore << ", " << ledger::TierToId(previousTier) << " -> "
              << ledger::TierToId(newTier);
    if (!result.liabilitiesAdded.empty())
    {
        std::cout << ", liability " << result.liabilitiesAdded.front();
    }
    std::cout << "\n";

    return LucidityOutcome::Success(std::move(result));
}

LucidityOutcome AdjustmentEngine::ClearLiability(const ledger::ActorId& actorId, const std::string& liabilityCode,
    bool removeAll)
{
    std::unique_ptr<ledger::ActorTransaction> transaction;
    ledger::StorageStatus status = m_store.BeginTransaction(actorId, m_settings.storageTimeout, transaction);
    if (status != ledger::StorageStatus::Ok)
    {
        return StorageFailure(actorId, status, "begin");
    }

    ledger::LucidityRecord record;
    status = transaction->GetOrCreate(record);
    if (status != ledger::StorageStatus::Ok)
    {
        return StorageFailure(actorId, status, "load");
    }

    if (!ledger::ReduceLiability(record.liabilities, liabilityCode, removeAll))
    {
        return LucidityOutcome{};
    }

    const ledger::TimePoint now = m_clock.Now();
    record.updatedAt = now;

    ledger::AdjustmentLogEntry logEntry;
    logEntry.actorId = actorId;
    logEntry.delta = 0;
    logEntry.reasonCode = "liability_cleared";
    logEntry.metadata = {{"liability_code", liabilityCode}, {"remove_all", removeAll}};
    logEntry.createdAt = now;

    status = transaction->SaveAdjustment(record, logEntry);
    if (status != ledger::StorageStatus::Ok)
    {
        return StorageFailure(actorId, status, "save");
    }
    transaction.reset();
    m_consecutiveStorageFailures.store(0);

    if (m_notifier != nullptr)
    {
        StateChangeNotice notice;
        notice.actorId = actorId;
        notice.score = record.score;
        notice.maxScore = ResolveMaxScore(actorId);
        notice.tier = record.tier;
        notice.liabilities = record.liabilities;
        notice.reason = logEntry.reasonCode;
        notice.metadata = logEntry.metadata;
        m_notifier->PublishStateChange(notice);
    }

    std::cout << "[AdjustmentEngine] Liability '" << liabilityCode << "' reduced on '" << actorId
              << "' (remove_all=" << removeAll << ")\n";

    AdjustmentResult result;
    result.actorId = actorId;
    result.previousScore = record.score;
    result.newScore = record.score;
    result.previousTier = record.tier;
    result.newTier = record.tier;
    return LucidityOutcome::Success(std::move(result));
}

LucidityOutcome AdjustmentEngine::StorageFailure(const ledger::ActorId& actorId, ledger::StorageStatus status,
    const char* stage)
{
    if (status == ledger::StorageStatus::NotFound)
    {
        std::cout << "AdjustmentEngine: WARNING - Actor '" << actorId << "' not found\n";
        return LucidityOutcome::Failure(LucidityError::ActorNotFound, "actor not found: " + actorId);
    }

    const int failures = m_consecutiveStorageFailures.fetch_add(1) + 1;
    const char* severity = "WARNING";
    if (failures >= kStorageCriticalEscalation)
    {
        severity = "CRITICAL";
    }
    else if (failures >= kStorageErrorEscalation)
    {
        severity = "ERROR";
    }

    std::cerr << "AdjustmentEngine: " << severity << " - Storage " << ledger::StorageStatusToText(status)
              << " during " << stage << " for '" << actorId << "' (" << failures << " consecutive)\n";

    return LucidityOutcome::Failure(LucidityError::StorageError,
        std::string("storage ") + ledger::StorageStatusToText(status) + " during " + stage);
}

void AdjustmentEngine::NotifyObserver(const ledger::LucidityRecord& record, const Crossings& crossings,
    ledger::TimePoint now)
{
    if (m_observer == nullptr)
    {
        return;
    }

    const ledger::ActorId& actorId = record.actorId;
    try
    {
        if (crossings.catatoniaEntered)
        {
            m_observer->OnCatatoniaEntered(actorId, now, record.score);
        }
        if (crossings.catatoniaCleared)
        {
            m_observer->OnCatatoniaCleared(actorId, now);
        }
        if (crossings.floorReached)
        {
            m_observer->OnFloorReached(actorId, record.score);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "AdjustmentEngine: ERROR - Transition observer failed for '" << actorId << "': " << e.what()
                  << "\n";
    }
}

void AdjustmentEngine::PublishCrises(const ledger::LucidityRecord& record, const Crossings& crossings)
{
    const ledger::ActorId& actorId = record.actorId;

    if (crossings.catatoniaEntered)
    {
        std::cout << "AdjustmentEngine: WARNING - '" << actorId << "' entered catatonia at " << record.score << "\n";
        if (m_notifier != nullptr)
        {
            m_notifier->PublishCrisis(actorId, record.score, kStatusCatatonic, CatatoniaEnteredMessage);
        }
    }

    if (crossings.catatoniaCleared)
    {
        std::cout << "[AdjustmentEngine] Catatonia resolved for '" << actorId << "' ("
                  << ledger::TierToId(record.tier) << ")\n";
        if (m_notifier != nullptr)
        {
            m_notifier->PublishCrisis(actorId, record.score, kStatusRecovered, CatatoniaClearedMessage);
        }
    }

    if (crossings.delirium)
    {
        std::cout << "AdjustmentEngine: WARNING - Delirium threshold reached for '" << actorId << "' at "
                  << record.score << "\n";
        if (m_notifier != nullptr)
        {
            m_notifier->PublishCrisis(actorId, record.score, kStatusDelirium, DeliriumMessage);
        }
    }

    if (crossings.floorReached)
    {
        std::cerr << "AdjustmentEngine: ERROR - Absolute floor reached for '" << actorId << "'\n";
        if (m_notifier != nullptr)
        {
            m_notifier->PublishCrisis(actorId, record.score, kStatusFloorReached, FloorReachedMessage);
        }
    }
}

int AdjustmentEngine::ResolveMaxScore(const ledger::ActorId& actorId)
{
    ledger::ActorPresence presence;
    const ledger::StorageStatus status = m_store.GetActorPresence(actorId, presence);
    if (status != ledger::StorageStatus::Ok || presence.maxScore <= 0)
    {
        std::cout << "AdjustmentEngine: WARNING - Using default max score for '" << actorId << "' ("
                  << ledger::StorageStatusToText(status) << ")\n";
        return ledger::kMaxScore;
    }
    return presence.maxScore;
}
} // namespace lucidity::gameplay
