#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "lucidity/core/Clock.hpp"
#include "lucidity/gameplay/LucidityNotifier.hpp"
#include "lucidity/gameplay/LucidityOutcome.hpp"
#include "lucidity/gameplay/TransitionObserver.hpp"
#include "lucidity/ledger/LedgerStore.hpp"

namespace lucidity::gameplay
{
/// Independent threshold crossings, evaluated on every adjustment.
constexpr int kDeliriumThreshold = -10;
constexpr int kFloorThreshold = ledger::kMinScore;

[[nodiscard]] std::vector<std::string> DefaultLiabilityCatalog();

struct AdjustmentEngineSettings
{
    /// A single loss at least this large rolls a liability even without a tier change.
    int liabilityLossThreshold = 15;
    std::vector<std::string> liabilityCatalog = DefaultLiabilityCatalog();
    std::chrono::milliseconds storageTimeout{2000};
};

/// Chooses which liability to stack. Returning nullopt skips the roll.
using LiabilityPicker = std::function<std::optional<std::string>(
    const ledger::LucidityRecord& record, int previousScore, int newScore, const std::string& reasonCode)>;

/// The only writer of lucidity records. Every score change goes through Apply,
/// which clamps, re-tiers, rolls liabilities and commits record + log entry
/// together. The transition observer hears about a commit before the actor's
/// row lock is released; bus notifications follow after.
class AdjustmentEngine
{
public:
    AdjustmentEngine(ledger::LedgerStore& store, const core::Clock& clock, TransitionObserver* observer,
        LucidityNotifier* notifier, AdjustmentEngineSettings settings = {});

    void SetLiabilityPicker(LiabilityPicker picker);

    /// Applies `delta` to the actor's score.
    /// @param metadata JSON object (or a string holding one) stored with the log entry.
    /// @return Outcome with the adjustment on success; ActorNotFound or StorageError otherwise.
    LucidityOutcome Apply(const ledger::ActorId& actorId, int delta, const std::string& reasonCode,
        const nlohmann::json& metadata = nlohmann::json::object(),
        const std::optional<std::string>& locationId = std::nullopt);

    /// Removes one stack of a liability (or the whole entry with removeAll).
    /// On success `adjustment` is set only when the liability list changed.
    LucidityOutcome ClearLiability(const ledger::ActorId& actorId, const std::string& liabilityCode,
        bool removeAll = false);

    [[nodiscard]] std::optional<std::string> PickDefaultLiability(const ledger::LucidityRecord& record) const;

    [[nodiscard]] const AdjustmentEngineSettings& Settings() const { return m_settings; }
    [[nodiscard]] int ConsecutiveStorageFailures() const { return m_consecutiveStorageFailures.load(); }

private:
    struct Crossings
    {
        bool catatoniaEntered = false;
        bool catatoniaCleared = false;
        bool delirium = false;
        bool floorReached = false;
    };

    LucidityOutcome StorageFailure(const ledger::ActorId& actorId, ledger::StorageStatus status, const char* stage);
    /// Runs under the actor's row lock; observers must not block or touch the ledger.
    void NotifyObserver(const ledger::LucidityRecord& record, const Crossings& crossings, ledger::TimePoint now);
    void PublishCrises(const ledger::LucidityRecord& record, const Crossings& crossings);
    [[nodiscard]] int ResolveMaxScore(const ledger::ActorId& actorId);

    ledger::LedgerStore& m_store;
    const core::Clock& m_clock;
    TransitionObserver* m_observer = nullptr;
    LucidityNotifier* m_notifier = nullptr;
    AdjustmentEngineSettings m_settings;
    LiabilityPicker m_liabilityPicker;
    std::atomic<int> m_consecutiveStorageFailures{0};
};
} // namespace lucidity::gameplay
