#include "app/LucidityHost.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace lucidity::app
{
using json = nlohmann::json;

namespace
{
constexpr const char* kHallucinationCooldownPrefix = "hallucination_";
}

bool LoadHostSettings(const std::filesystem::path& path, HostSettings& settings)
{
    if (!std::filesystem::exists(path))
    {
        std::cout << "LucidityHost: WARNING - No host config at '" << path.string() << "', using defaults\n";
        return false;
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cout << "LucidityHost: WARNING - Failed to open host config '" << path.string() << "'\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& e)
    {
        std::cout << "LucidityHost: WARNING - Invalid host config JSON (" << e.what() << "). Using defaults.\n";
        return false;
    }

    auto readInt = [&](const char* key, int& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<int>();
        }
    };

    readInt("asset_version", settings.assetVersion);
    readInt("ticks_per_cadence", settings.ticksPerCadence);
    readInt("resistance_window", settings.resistanceWindow);
    readInt("storage_timeout_ms", settings.storageTimeoutMs);
    readInt("hallucination_interval_seconds", settings.hallucinationIntervalSeconds);
    readInt("active_window_seconds", settings.activeWindowSeconds);
    readInt("new_actor_window_seconds", settings.newActorWindowSeconds);
    readInt("failover_delay_ms", settings.failoverDelayMs);
    readInt("worker_count", settings.workerCount);
    readInt("batch_size", settings.batchSize);
    readInt("tick_interval_ms", settings.tickIntervalMs);
    if (root.contains("sanitarium_room_id") && root["sanitarium_room_id"].is_string())
    {
        settings.sanitariumRoomId = root["sanitarium_room_id"].get<std::string>();
    }

    settings.ticksPerCadence = std::max(1, settings.ticksPerCadence);
    settings.resistanceWindow = std::max(1, settings.resistanceWindow);
    settings.storageTimeoutMs = std::clamp(settings.storageTimeoutMs, 10, 60000);
    settings.hallucinationIntervalSeconds = std::max(1, settings.hallucinationIntervalSeconds);
    settings.failoverDelayMs = std::max(0, settings.failoverDelayMs);
    settings.workerCount = std::max(0, settings.workerCount);
    settings.batchSize = std::max(1, settings.batchSize);
    settings.tickIntervalMs = std::max(1, settings.tickIntervalMs);
    return true;
}

LucidityHost::LucidityHost(ledger::LedgerStore& store, const ledger::RoomDirectory& rooms, const core::Clock& clock)
    : m_store(store)
    , m_rooms(rooms)
    , m_clock(clock)
{
}

LucidityHost::~LucidityHost()
{
    Shutdown();
}

bool LucidityHost::Initialize(const std::filesystem::path& configDir)
{
    if (m_running)
    {
        return true;
    }

    m_settings = HostSettings{};
    (void)LoadHostSettings(configDir / "lucidity_host.json", m_settings);

    m_catalog.InitializeDefaults();
    if (!m_catalog.LoadFromJson((configDir / "lucidity_effects.json").string()))
    {
        std::cout << "LucidityHost: WARNING - Using built-in effect catalog\n";
    }

    m_environment.SetConfig(gameplay::FluxEnvironment::DefaultConfig());
    m_environment.ClearWorldOverrides();
    if (!m_environment.LoadFromJson((configDir / "flux_environment.json").string()))
    {
        std::cout << "LucidityHost: WARNING - Using built-in flux environment\n";
    }
    (void)m_environment.LoadWorldOverridesFromJson((configDir / "world_overrides.json").string());

    if (!m_jobs.Initialize(static_cast<std::size_t>(m_settings.workerCount)))
    {
        std::cerr << "LucidityHost: ERROR - Failed to start worker pool\n";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_relocationMutex);
        m_relocations.clear();
    }
    m_relocationFailures = 0;

    m_notifier = std::make_unique<gameplay::LucidityNotifier>(&m_events);
    m_registry = std::make_unique<gameplay::CatatoniaRegistry>(&m_jobs,
        [this](const ledger::ActorId& actorId, int currentScore) { QueueRelocation(actorId, currentScore); });

    gameplay::AdjustmentEngineSettings engineSettings;
    engineSettings.liabilityLossThreshold = m_catalog.LiabilityLossThreshold();
    engineSettings.liabilityCatalog = m_catalog.LiabilityCatalog();
    engineSettings.storageTimeout = std::chrono::milliseconds(m_settings.storageTimeoutMs);
    m_engine = std::make_unique<gameplay::AdjustmentEngine>(m_store, m_clock, m_registry.get(), m_notifier.get(),
        engineSettings);

    m_effects = std::make_unique<gameplay::ActiveEffectsGateway>(m_store, *m_engine, m_catalog, m_clock);

    gameplay::FluxSchedulerSettings schedulerSettings;
    schedulerSettings.ticksPerCadence = static_cast<std::uint32_t>(m_settings.ticksPerCadence);
    schedulerSettings.resistanceWindow = m_settings.resistanceWindow;
    schedulerSettings.activeWindow = std::chrono::seconds(m_settings.activeWindowSeconds);
    schedulerSettings.newActorWindow = std::chrono::seconds(m_settings.newActorWindowSeconds);
    schedulerSettings.hallucinationInterval = std::chrono::seconds(m_settings.hallucinationIntervalSeconds);
    schedulerSettings.batchSize = static_cast<std::size_t>(m_settings.batchSize);
    m_scheduler = std::make_unique<gameplay::FluxScheduler>(m_store, m_rooms, *m_engine, m_environment, m_clock,
        m_notifier.get(), &m_jobs, schedulerSettings);

    m_tickCount = 0;
    m_running = true;
    std::cout << "[LucidityHost] Initialized (" << m_jobs.WorkerCount() << " workers, cadence "
              << m_settings.ticksPerCadence << " ticks, sanitarium '" << m_settings.sanitariumRoomId << "')\n";
    return true;
}

gameplay::FluxTickReport LucidityHost::Tick()
{
    if (!m_running)
    {
        return gameplay::FluxTickReport{};
    }

    const gameplay::FluxTickReport report = m_scheduler->ProcessTick(m_tickCount++);
    DispatchRelocations(false);
    m_events.DispatchQueued();
    return report;
}

void LucidityHost::Shutdown()
{
    if (!m_running.exchange(false))
    {
        return;
    }

    m_jobs.WaitForAll();
    m_registry->WaitForFailovers();
    DispatchRelocations(true);

    m_jobs.Shutdown();
    m_events.DispatchQueued();

    const std::size_t members = m_registry->Count();
    m_registry->Clear();

    m_scheduler.reset();
    m_effects.reset();
    m_engine.reset();
    m_registry.reset();
    m_notifier.reset();

    std::cout << "[LucidityHost] Shutdown complete (" << m_tickCount << " ticks, " << members
              << " catatonic actors released)\n";
}

std::size_t LucidityHost::PendingRelocations() const
{
    std::lock_guard<std::mutex> lock(m_relocationMutex);
    return m_relocations.size();
}

void LucidityHost::QueueRelocation(const ledger::ActorId& actorId, int currentScore)
{
    PendingRelocation relocation;
    relocation.actorId = actorId;
    relocation.score = currentScore;
    relocation.dueAt = m_clock.Now() + std::chrono::milliseconds(m_settings.failoverDelayMs);

    std::lock_guard<std::mutex> lock(m_relocationMutex);
    m_relocations.push_back(std::move(relocation));
    std::cout << "[LucidityHost] Sanitarium failover for '" << actorId << "' at " << currentScore << " queued ("
              << m_settings.failoverDelayMs << " ms)\n";
}

void LucidityHost::DispatchRelocations(bool ignoreDelay)
{
    const core::TimePoint now = m_clock.Now();
    std::vector<PendingRelocation> due;
    {
        std::lock_guard<std::mutex> lock(m_relocationMutex);
        for (auto it = m_relocations.begin(); it != m_relocations.end();)
        {
            if (ignoreDelay || it->dueAt <= now)
            {
                due.push_back(std::move(*it));
                it = m_relocations.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (const PendingRelocation& relocation : due)
    {
        const ledger::ActorId actorId = relocation.actorId;
        const int score = relocation.score;
        const core::JobId id = m_jobs.Schedule(
            [this, actorId, score]() { RelocateToSanitarium(actorId, score); },
            core::JobPriority::Low, "sanitarium_relocation", nullptr,
            [this, actorId](const std::string& jobName, const std::string& error) {
                m_relocationFailures.fetch_add(1);
                std::cerr << "LucidityHost: ERROR - Job '" << jobName << "' failed for '" << actorId << "': "
                          << error << "\n";
            });
        if (id != core::kInvalidJobId)
        {
            continue;
        }

        try
        {
            RelocateToSanitarium(actorId, score);
        }
        catch (const std::exception& e)
        {
            m_relocationFailures.fetch_add(1);
            std::cerr << "LucidityHost: ERROR - Relocation failed for '" << actorId << "': " << e.what() << "\n";
        }
    }
}

void LucidityHost::RelocateToSanitarium(const ledger::ActorId& actorId, int currentScore)
{
    std::size_t cleared = 0;
    const ledger::StorageStatus clearStatus = m_store.ClearCooldowns(actorId, kHallucinationCooldownPrefix, cleared);
    if (clearStatus != ledger::StorageStatus::Ok)
    {
        std::cout << "LucidityHost: WARNING - Hallucination timers not cleared for '" << actorId << "' ("
                  << ledger::StorageStatusToText(clearStatus) << ")\n";
    }

    const ledger::StorageStatus moveStatus = m_store.SetActorLocation(actorId, m_settings.sanitariumRoomId);
    if (moveStatus != ledger::StorageStatus::Ok)
    {
        throw std::runtime_error(std::string("relocation to sanitarium failed: ") +
            ledger::StorageStatusToText(moveStatus));
    }

    std::cout << "[LucidityHost] '" << actorId << "' relocated to '" << m_settings.sanitariumRoomId << "' at "
              << currentScore << " (" << cleared << " timers cleared)\n";
}
} // namespace lucidity::app
