#include "lucidity/gameplay/FluxScheduler.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_set>
#include <utility>

namespace lucidity::gameplay
{
namespace
{
constexpr int kMaxResistanceSteps = 2;
constexpr double kResistanceStep = 0.25;
constexpr double kMinResistanceMultiplier = 0.5;

struct RoomCensus
{
    int steady = 0;
    int impaired = 0;
};

/// Clears the in-progress flag however the firing ends.
class FiringGuard
{
public:
    explicit FiringGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~FiringGuard() { m_flag.store(false); }

    FiringGuard(const FiringGuard&) = delete;
    FiringGuard& operator=(const FiringGuard&) = delete;

private:
    std::atomic<bool>& m_flag;
};
}

FluxScheduler::FluxScheduler(ledger::LedgerStore& store, const ledger::RoomDirectory& rooms, AdjustmentEngine& engine,
    const FluxEnvironment& environment, const core::Clock& clock, LucidityNotifier* notifier, core::JobSystem* jobs,
    FluxSchedulerSettings settings)
    : m_store(store)
    , m_rooms(rooms)
    , m_engine(engine)
    , m_environment(environment)
    , m_clock(clock)
    , m_notifier(notifier)
    , m_jobs(jobs)
    , m_settings(std::move(settings))
    , m_cadence(m_settings.ticksPerCadence)
{
    m_settings.resistanceWindow = std::max(1, m_settings.resistanceWindow);
}

double FluxScheduler::CompanionModifier(int steadyCompanions, bool impairedCompanionPresent)
{
    double modifier = std::min(steadyCompanions * kCompanionBonus, kCompanionBonusCap);
    if (impairedCompanionPresent)
    {
        modifier += kImpairedCompanionPenalty;
    }
    return modifier;
}

double FluxScheduler::ApplyAdaptiveResistance(FluxTracker& tracker, const std::string& roomId, double flux) const
{
    if (tracker.minutesInRoom <= 0 || tracker.roomId != roomId)
    {
        tracker.roomId = roomId;
        tracker.minutesInRoom = 1;
        return flux;
    }

    ++tracker.minutesInRoom;
    if (flux >= 0.0)
    {
        return flux;
    }

    const int steps = std::min((tracker.minutesInRoom - 1) / m_settings.resistanceWindow, kMaxResistanceSteps);
    const double multiplier = std::max(kMinResistanceMultiplier, 1.0 - kResistanceStep * steps);
    return flux * multiplier;
}

int FluxScheduler::ExtractWholeUnits(double& residual)
{
    if (!std::isfinite(residual))
    {
        residual = 0.0;
        return 0;
    }
    residual = std::clamp(residual, -kMaxResidual, kMaxResidual);

    int delta = 0;
    if (residual >= 1.0 - kResidualEpsilon)
    {
        delta = static_cast<int>(std::floor(residual + kResidualEpsilon));
    }
    else if (residual <= -1.0 + kResidualEpsilon)
    {
        delta = static_cast<int>(std::ceil(residual - kResidualEpsilon));
    }
    residual -= delta;
    return delta;
}

FluxTickReport FluxScheduler::ProcessTick(std::uint64_t tickCount)
{
    FluxTickReport report;
    report.tickCount = tickCount;

    if (!m_cadence.ShouldFire(tickCount))
    {
        return report;
    }

    if (m_firing.exchange(true))
    {
        std::cout << "FluxScheduler: WARNING - Previous firing still running, skipping tick " << tickCount << "\n";
        report.skipped = true;
        return report;
    }
    FiringGuard guard(m_firing);
    report.fired = true;

    const auto started = std::chrono::steady_clock::now();
    const core::TimePoint now = m_clock.Now();

    std::vector<ledger::ActorPresence> actors;
    const ledger::StorageStatus status =
        m_store.ListActiveActors(now - m_settings.activeWindow, now - m_settings.newActorWindow, actors);
    if (status != ledger::StorageStatus::Ok)
    {
        std::cerr << "FluxScheduler: ERROR - Could not list active actors (" << ledger::StorageStatusToText(status)
                  << "), skipping tick " << tickCount << "\n";
        ++report.failures;
        return report;
    }

    std::unordered_map<std::string, RoomCensus> census;
    for (const ledger::ActorPresence& actor : actors)
    {
        RoomCensus& room = census[actor.locationId];
        if (ledger::IsImpaired(actor.tier))
        {
            ++room.impaired;
        }
        else
        {
            ++room.steady;
        }
    }

    const bool daytime = FluxEnvironment::IsDaytime(now);
    std::vector<PendingDelta> pending;
    {
        std::lock_guard<std::mutex> lock(m_trackerMutex);
        for (const ledger::ActorPresence& actor : actors)
        {
            const std::optional<ledger::RoomDescriptor> room = m_rooms.FindRoom(actor.locationId);
            const BaseFluxResolution base = m_environment.ResolveBaseFlux(room, now);

            const RoomCensus& present = census[actor.locationId];
            const bool selfImpaired = ledger::IsImpaired(actor.tier);
            const int steadyCompanions = present.steady - (selfImpaired ? 0 : 1);
            const int impairedCompanions = present.impaired - (selfImpaired ? 1 : 0);
            const double companionFlux = CompanionModifier(steadyCompanions, impairedCompanions > 0);

            FluxTracker& tracker = m_trackers[actor.actorId];
            const double flux = ApplyAdaptiveResistance(tracker, actor.locationId, base.baseFlux + companionFlux);
            tracker.residual += flux;
            const int delta = ExtractWholeUnits(tracker.residual);
            ++report.evaluated;

            if (std::abs(delta) > kLargeFluxWarning || std::abs(flux) > kLargeFluxWarning)
            {
                std::cout << "FluxScheduler: WARNING - Large flux for '" << actor.actorId << "': flux " << flux
                          << ", delta " << delta << ", source " << base.source << "\n";
            }

            if (delta == 0)
            {
                continue;
            }

            PendingDelta entry;
            entry.actorId = actor.actorId;
            entry.delta = delta;
            entry.locationId = actor.locationId;
            entry.metadata = {
                {"source", base.source},
                {"base_flux", base.baseFlux},
                {"companion_flux", companionFlux},
                {"total_flux", flux},
                {"tick", tickCount},
                {"period", daytime ? "day" : "night"},
                {"room_id", actor.locationId},
                {"zone", room.has_value() ? nlohmann::json(room->zone) : nlohmann::json(nullptr)},
                {"sub_zone", room.has_value() ? nlohmann::json(room->subZone) : nlohmann::json(nullptr)},
                {"lucidity_rate_override", base.worldOverride},
            };
            pending.push_back(std::move(entry));
        }
    }

    std::vector<LucidityError> results(pending.size(), LucidityError::StorageError);
    std::vector<ledger::Tier> appliedTiers(pending.size(), ledger::Tier::Stable);
    ApplyPending(pending, results, appliedTiers);

    std::unordered_map<ledger::ActorId, ledger::Tier> currentTiers;

    {
        std::lock_guard<std::mutex> lock(m_trackerMutex);
        for (std::size_t i = 0; i < pending.size(); ++i)
        {
            if (results[i] == LucidityError::None)
            {
                ++report.adjustments;
                currentTiers[pending[i].actorId] = appliedTiers[i];
                continue;
            }

            ++report.failures;
            if (results[i] == LucidityError::StorageError)
            {
                const auto it = m_trackers.find(pending[i].actorId);
                if (it != m_trackers.end())
                {
                    it->second.residual += pending[i].delta;
                }
                std::cout << "FluxScheduler: WARNING - Passive delta " << pending[i].delta << " for '"
                          << pending[i].actorId << "' deferred to next cadence\n";
            }
        }

        std::unordered_set<ledger::ActorId> eligible;
        eligible.reserve(actors.size());
        for (const ledger::ActorPresence& actor : actors)
        {
            eligible.insert(actor.actorId);
        }
        for (auto it = m_trackers.begin(); it != m_trackers.end();)
        {
            if (eligible.count(it->first) == 0)
            {
                it = m_trackers.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    report.hallucinations = RunHallucinationTimers(actors, currentTiers, now);

    report.durationMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    std::cout << "[FluxScheduler] Tick " << tickCount << ": evaluated " << report.evaluated << ", adjusted "
              << report.adjustments << ", failed " << report.failures << ", hallucinations " << report.hallucinations
              << " (" << report.durationMs << " ms)\n";
    return report;
}

void FluxScheduler::ApplyPending(const std::vector<PendingDelta>& pending, std::vector<LucidityError>& results,
    std::vector<ledger::Tier>& tiers)
{
    const auto apply = [this, &pending, &results, &tiers](std::size_t index) {
        const PendingDelta& entry = pending[index];
        const LucidityOutcome outcome =
            m_engine.Apply(entry.actorId, entry.delta, kPassiveFluxReason, entry.metadata, entry.locationId);
        results[index] = outcome.error;
        if (outcome.adjustment.has_value())
        {
            tiers[index] = outcome.adjustment->newTier;
        }
    };

    if (m_jobs == nullptr)
    {
        for (std::size_t i = 0; i < pending.size(); ++i)
        {
            apply(i);
        }
        return;
    }

    core::JobCounter counter;
    m_jobs->ParallelFor(pending.size(), m_settings.batchSize, apply, counter, core::JobPriority::High);
    m_jobs->WaitForCounter(counter);
}

std::size_t FluxScheduler::RunHallucinationTimers(const std::vector<ledger::ActorPresence>& actors,
    const std::unordered_map<ledger::ActorId, ledger::Tier>& currentTiers, core::TimePoint now)
{
    std::size_t fired = 0;
    for (const ledger::ActorPresence& actor : actors)
    {
        const auto updated = currentTiers.find(actor.actorId);
        const ledger::Tier tier = updated != currentTiers.end() ? updated->second : actor.tier;
        if (tier != ledger::Tier::Fractured && tier != ledger::Tier::Deranged)
        {
            continue;
        }

        ledger::CooldownRecord timer;
        const ledger::StorageStatus status = m_store.GetCooldown(actor.actorId, kHallucinationTimerCode, timer);
        if (status == ledger::StorageStatus::Ok && timer.expiresAt > now)
        {
            continue;
        }
        if (status != ledger::StorageStatus::Ok && status != ledger::StorageStatus::NotFound)
        {
            std::cerr << "FluxScheduler: ERROR - Hallucination timer lookup " << ledger::StorageStatusToText(status)
                      << " for '" << actor.actorId << "'\n";
            continue;
        }

        const ledger::StorageStatus saved =
            m_store.SetCooldown(actor.actorId, kHallucinationTimerCode, now + m_settings.hallucinationInterval);
        if (saved != ledger::StorageStatus::Ok)
        {
            std::cerr << "FluxScheduler: ERROR - Hallucination timer not saved ("
                      << ledger::StorageStatusToText(saved) << ") for '" << actor.actorId << "'\n";
            continue;
        }

        if (m_notifier != nullptr)
        {
            m_notifier->PublishHallucination(actor.actorId, tier, actor.locationId);
        }
        ++fired;
    }
    return fired;
}

std::size_t FluxScheduler::TrackerCount() const
{
    std::lock_guard<std::mutex> lock(m_trackerMutex);
    return m_trackers.size();
}

std::optional<FluxTracker> FluxScheduler::GetTracker(const ledger::ActorId& actorId) const
{
    std::lock_guard<std::mutex> lock(m_trackerMutex);
    const auto it = m_trackers.find(actorId);
    if (it == m_trackers.end())
    {
        return std::nullopt;
    }
    return it->second;
}
} // namespace lucidity::gameplay
