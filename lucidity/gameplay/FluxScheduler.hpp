#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lucidity/core/Clock.hpp"
#include "lucidity/core/JobSystem.hpp"
#include "lucidity/gameplay/AdjustmentEngine.hpp"
#include "lucidity/gameplay/FluxEnvironment.hpp"
#include "lucidity/gameplay/LucidityNotifier.hpp"
#include "lucidity/ledger/LedgerStore.hpp"

namespace lucidity::gameplay
{
inline constexpr const char* kPassiveFluxReason = "passive_flux";
inline constexpr const char* kHallucinationTimerCode = "hallucination_timer";

constexpr double kCompanionBonus = 0.1;
constexpr double kCompanionBonusCap = 0.3;
constexpr double kImpairedCompanionPenalty = -0.2;
constexpr double kResidualEpsilon = 1e-6;
constexpr double kLargeFluxWarning = 5.0;
/// Residual magnitude cap: one cadence can never move a score further than this.
constexpr double kMaxResidual = static_cast<double>(ledger::kMaxScore - ledger::kMinScore);

struct FluxSchedulerSettings
{
    std::uint32_t ticksPerCadence = 6;
    /// Cadences spent in one room before each resistance step.
    int resistanceWindow = 10;
    std::chrono::seconds activeWindow{5 * 60};
    std::chrono::seconds newActorWindow{60 * 60};
    std::chrono::seconds hallucinationInterval{5 * 60};
    std::size_t batchSize = 16;
};

/// Scheduler-private drift state for one actor.
struct FluxTracker
{
    double residual = 0.0;
    std::string roomId;
    int minutesInRoom = 0;
};

struct FluxTickReport
{
    std::uint64_t tickCount = 0;
    bool fired = false;
    bool skipped = false;
    std::size_t evaluated = 0;
    std::size_t adjustments = 0;
    std::size_t failures = 0;
    std::size_t hallucinations = 0;
    double durationMs = 0.0;
};

/// Passive lucidity drift. Called every world tick; does work once per cadence.
///
/// A firing runs in three phases: flux is resolved and accumulated serially,
/// whole-unit deltas are applied in parallel on the worker pool, and deltas
/// the ledger rejected are folded back into the residuals. Firings never overlap.
class FluxScheduler
{
public:
    FluxScheduler(ledger::LedgerStore& store, const ledger::RoomDirectory& rooms, AdjustmentEngine& engine,
        const FluxEnvironment& environment, const core::Clock& clock, LucidityNotifier* notifier,
        core::JobSystem* jobs, FluxSchedulerSettings settings = {});

    FluxTickReport ProcessTick(std::uint64_t tickCount);

    /// Bonus for calm company, penalty if anyone present is impaired.
    [[nodiscard]] static double CompanionModifier(int steadyCompanions, bool impairedCompanionPresent);

    /// Tracks time in the current room and damps negative flux after long stays.
    [[nodiscard]] double ApplyAdaptiveResistance(FluxTracker& tracker, const std::string& roomId, double flux) const;

    /// Removes and returns the whole units accumulated in `residual`, after
    /// clamping it to kMaxResidual. A non-finite residual is reset to zero.
    [[nodiscard]] static int ExtractWholeUnits(double& residual);

    [[nodiscard]] std::size_t TrackerCount() const;
    [[nodiscard]] std::optional<FluxTracker> GetTracker(const ledger::ActorId& actorId) const;

    [[nodiscard]] const FluxSchedulerSettings& Settings() const { return m_settings; }

private:
    struct PendingDelta
    {
        ledger::ActorId actorId;
        int delta = 0;
        std::string locationId;
        nlohmann::json metadata;
    };

    void ApplyPending(const std::vector<PendingDelta>& pending, std::vector<LucidityError>& results,
        std::vector<ledger::Tier>& tiers);
    /// Uses the tier left by this firing's adjustment where there was one.
    std::size_t RunHallucinationTimers(const std::vector<ledger::ActorPresence>& actors,
        const std::unordered_map<ledger::ActorId, ledger::Tier>& currentTiers, core::TimePoint now);

    ledger::LedgerStore& m_store;
    const ledger::RoomDirectory& m_rooms;
    AdjustmentEngine& m_engine;
    const FluxEnvironment& m_environment;
    const core::Clock& m_clock;
    LucidityNotifier* m_notifier = nullptr;
    core::JobSystem* m_jobs = nullptr;
    FluxSchedulerSettings m_settings;
    core::CadenceCounter m_cadence;

    std::atomic<bool> m_firing{false};
    mutable std::mutex m_trackerMutex;
    std::unordered_map<ledger::ActorId, FluxTracker> m_trackers;
};
} // namespace lucidity::gameplay
