#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lucidity/core/Clock.hpp"
#include "lucidity/core/EventBus.hpp"
#include "lucidity/core/JobSystem.hpp"
#include "lucidity/gameplay/ActiveEffectsGateway.hpp"
#include "lucidity/gameplay/AdjustmentEngine.hpp"
#include "lucidity/gameplay/CatatoniaRegistry.hpp"
#include "lucidity/gameplay/EffectCatalog.hpp"
#include "lucidity/gameplay/FluxEnvironment.hpp"
#include "lucidity/gameplay/FluxScheduler.hpp"
#include "lucidity/gameplay/LucidityNotifier.hpp"
#include "lucidity/ledger/LedgerStore.hpp"

namespace lucidity::app
{
struct HostSettings
{
    int assetVersion = 1;
    int ticksPerCadence = 6;
    int resistanceWindow = 10;
    int storageTimeoutMs = 2000;
    int hallucinationIntervalSeconds = 300;
    int activeWindowSeconds = 300;
    int newActorWindowSeconds = 3600;
    int failoverDelayMs = 10000;
    std::string sanitariumRoomId = "earth_arkhamcity_sanitarium_room_foyer_001";
    int workerCount = 0;
    int batchSize = 16;
    int tickIntervalMs = 10000;
};

/// Reads lucidity_host.json. Missing or mistyped keys keep their defaults.
bool LoadHostSettings(const std::filesystem::path& path, HostSettings& settings);

/// Owns the lucidity services and wires them together.
///
/// Startup order: settings and catalogs, worker pool, notifier, registry,
/// engine, gateway, scheduler. Shutdown reverses it: queued relocations are
/// released regardless of their delay, the pool drains, queued events are
/// flushed, then the registry is cleared.
///
/// Sanitarium relocation never sleeps on a worker. A floor crossing queues a
/// relocation due `failover_delay_ms` later; Tick hands due ones to the pool.
class LucidityHost
{
public:
    LucidityHost(ledger::LedgerStore& store, const ledger::RoomDirectory& rooms, const core::Clock& clock);
    ~LucidityHost();

    LucidityHost(const LucidityHost&) = delete;
    LucidityHost& operator=(const LucidityHost&) = delete;

    bool Initialize(const std::filesystem::path& configDir);

    /// One world tick: runs the flux scheduler, dispatches due relocations and
    /// pumps the event bus.
    gameplay::FluxTickReport Tick();

    void Shutdown();

    [[nodiscard]] bool IsRunning() const { return m_running; }
    [[nodiscard]] std::uint64_t TickCount() const { return m_tickCount; }
    [[nodiscard]] const HostSettings& Settings() const { return m_settings; }
    [[nodiscard]] std::size_t PendingRelocations() const;
    [[nodiscard]] std::size_t RelocationFailures() const { return m_relocationFailures.load(); }

    core::EventBus& Events() { return m_events; }
    core::JobSystem& Jobs() { return m_jobs; }
    gameplay::AdjustmentEngine& Engine() { return *m_engine; }
    gameplay::ActiveEffectsGateway& Effects() { return *m_effects; }
    gameplay::FluxScheduler& Scheduler() { return *m_scheduler; }
    gameplay::CatatoniaRegistry& Registry() { return *m_registry; }
    const gameplay::EffectCatalog& Catalog() const { return m_catalog; }

private:
    struct PendingRelocation
    {
        ledger::ActorId actorId;
        int score = 0;
        core::TimePoint dueAt{};
    };

    void QueueRelocation(const ledger::ActorId& actorId, int currentScore);
    void DispatchRelocations(bool ignoreDelay);
    void RelocateToSanitarium(const ledger::ActorId& actorId, int currentScore);

    ledger::LedgerStore& m_store;
    const ledger::RoomDirectory& m_rooms;
    const core::Clock& m_clock;

    HostSettings m_settings;
    gameplay::EffectCatalog m_catalog;
    gameplay::FluxEnvironment m_environment;
    core::EventBus m_events;
    core::JobSystem m_jobs;

    std::unique_ptr<gameplay::LucidityNotifier> m_notifier;
    std::unique_ptr<gameplay::CatatoniaRegistry> m_registry;
    std::unique_ptr<gameplay::AdjustmentEngine> m_engine;
    std::unique_ptr<gameplay::ActiveEffectsGateway> m_effects;
    std::unique_ptr<gameplay::FluxScheduler> m_scheduler;

    std::atomic<bool> m_running{false};
    std::uint64_t m_tickCount = 0;

    mutable std::mutex m_relocationMutex;
    std::vector<PendingRelocation> m_relocations;
    std::atomic<std::size_t> m_relocationFailures{0};
};
} // namespace lucidity::app
