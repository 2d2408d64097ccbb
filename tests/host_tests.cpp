/*
Host wiring: settings loading, ticking, sanitarium failover and shutdown.
*/
#include "app/LucidityHost.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "lucidity/ledger/MemoryLedgerStore.hpp"
#include "tests/LucidityTestSupport.hpp"

using lucidity::app::HostSettings;
using lucidity::app::LucidityHost;

namespace
{
constexpr const char* kSanitarium = "earth_arkhamcity_sanitarium_room_foyer_001";

std::filesystem::path MakeConfigDir(const std::string& name, const std::string& hostJson)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "lucidity_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::ofstream out(dir / "lucidity_host.json", std::ios::trunc);
    out << hostJson;
    return dir;
}

struct World
{
    World()
        : clock(lucidity::test::AtUtcHour(12))
    {
        rooms.AddRoom({"nave", "earth", "arkhamcity", "french_hill", "temple"});
        rooms.AddRoom({kSanitarium, "earth", "arkhamcity", "sanitarium", "indoors"});
        rooms.AddRoom({"reef", "earth", "innsmouth", "devil_reef", "eldritch"});
        store.RegisterActor("ames", "nave", clock.Now());
    }

    std::string Location(const std::string& actorId)
    {
        lucidity::ledger::ActorPresence presence;
        if (store.GetActorPresence(actorId, presence) != lucidity::ledger::StorageStatus::Ok)
        {
            return "";
        }
        return presence.locationId;
    }

    lucidity::ledger::MemoryLedgerStore store;
    lucidity::ledger::MemoryRoomDirectory rooms;
    lucidity::core::ManualClock clock;
};
}

static int test_load_host_settings(void)
{
    HostSettings settings;
    EXPECT(!lucidity::app::LoadHostSettings("/nonexistent/lucidity_host.json", settings), "missing file reported");
    EXPECT(settings.ticksPerCadence == 6, "defaults kept");

    const auto broken = lucidity::test::WriteTempFile("host_broken.json", "{ \"ticks_per_cadence\": ");
    EXPECT(!lucidity::app::LoadHostSettings(broken, settings), "invalid json reported");

    const auto path = lucidity::test::WriteTempFile("host_settings.json",
        R"({"asset_version": 1, "ticks_per_cadence": 0, "storage_timeout_ms": 5, "batch_size": "many",
            "failover_delay_ms": 250, "sanitarium_room_id": "asylum_ward"})");
    EXPECT(lucidity::app::LoadHostSettings(path, settings), "settings loaded");
    EXPECT(settings.ticksPerCadence == 1, "cadence clamped to one");
    EXPECT(settings.storageTimeoutMs == 10, "timeout clamped");
    EXPECT(settings.batchSize == 16, "mistyped key ignored");
    EXPECT(settings.failoverDelayMs == 250, "delay read");
    EXPECT(settings.sanitariumRoomId == "asylum_ward", "sanitarium read");
    return 0;
}

static int test_tick_and_events(void)
{
    World world;
    LucidityHost host(world.store, world.rooms, world.clock);
    EXPECT(host.Initialize(MakeConfigDir("host_tick", R"({"ticks_per_cadence": 2, "worker_count": 2})")),
        "host started");
    EXPECT(host.Settings().ticksPerCadence == 2, "config dir honoured");
    EXPECT(host.Catalog().FindEncounter("horrific") != nullptr, "built-in catalog in use");

    lucidity::test::EventRecorder recorder(host.Events(), {lucidity::gameplay::kStateChangedEvent});
    const auto outcome = host.Effects().ApplyEncounter("ames", "ghoul", "horrific", std::string("nave"));
    EXPECT(outcome.Ok(), "encounter applied");
    EXPECT(recorder.events.empty(), "events wait for the tick");

    const auto first = host.Tick();
    const auto second = host.Tick();
    EXPECT(first.fired && !second.fired, "host cadence applied");
    EXPECT(host.TickCount() == 2, "ticks counted");
    EXPECT(recorder.Count(lucidity::gameplay::kStateChangedEvent) >= 1, "events pumped on tick");

    host.Shutdown();
    EXPECT(!host.IsRunning(), "stopped");
    EXPECT(!host.Tick().fired, "ticks ignored after shutdown");
    return 0;
}

static int test_floor_relocates_to_sanitarium(void)
{
    World world;
    LucidityHost host(world.store, world.rooms, world.clock);
    EXPECT(host.Initialize(MakeConfigDir("host_failover", R"({"failover_delay_ms": 0, "worker_count": 2})")),
        "host started");

    EXPECT(world.store.SetCooldown("ames", lucidity::gameplay::kHallucinationTimerCode,
               world.clock.Now() + std::chrono::minutes(5)) == lucidity::ledger::StorageStatus::Ok,
        "timer armed");
    EXPECT(world.store.SetCooldown("ames", "pray", world.clock.Now() + std::chrono::minutes(5)) ==
            lucidity::ledger::StorageStatus::Ok, "recovery cooldown armed");

    EXPECT(host.Engine().Apply("ames", -250, "encounter_cosmic").Ok(), "plunge applied");
    EXPECT(host.Registry().IsCatatonic("ames"), "registered as catatonic");
    host.Jobs().WaitForAll();
    EXPECT(host.PendingRelocations() == 1, "relocation queued");
    EXPECT(world.Location("ames") == "nave", "nothing moves before a tick");

    (void)host.Tick();
    host.Jobs().WaitForAll();
    EXPECT(host.PendingRelocations() == 0, "relocation dispatched");
    EXPECT(world.Location("ames") == kSanitarium, "moved to sanitarium");
    lucidity::ledger::CooldownRecord cooldown;
    EXPECT(world.store.GetCooldown("ames", lucidity::gameplay::kHallucinationTimerCode, cooldown) ==
            lucidity::ledger::StorageStatus::NotFound, "hallucination timer cleared");
    EXPECT(world.store.GetCooldown("ames", "pray", cooldown) == lucidity::ledger::StorageStatus::Ok,
        "other cooldowns untouched");
    EXPECT(host.Registry().FailoverFailures() == 0, "no failover errors");
    EXPECT(host.RelocationFailures() == 0, "no relocation errors");
    host.Shutdown();
    return 0;
}

static int test_shutdown_cuts_failover_delay(void)
{
    World world;
    LucidityHost host(world.store, world.rooms, world.clock);
    EXPECT(host.Initialize(MakeConfigDir("host_shutdown", R"({"failover_delay_ms": 600000, "worker_count": 1})")),
        "host started");

    EXPECT(host.Engine().Apply("ames", -250, "encounter_cosmic").Ok(), "plunge applied");
    const auto started = std::chrono::steady_clock::now();
    host.Shutdown();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT(elapsed < std::chrono::seconds(30), "shutdown did not wait out the delay");
    EXPECT(world.Location("ames") == kSanitarium, "pending failover still completed");
    return 0;
}

static int test_failed_relocation_counted(void)
{
    World world;
    LucidityHost host(world.store, world.rooms, world.clock);
    EXPECT(host.Initialize(MakeConfigDir("host_unknown", R"({"failover_delay_ms": 0, "worker_count": 1})")),
        "host started");

    world.store.RegisterActor("bell", "nave", world.clock.Now());
    EXPECT(host.Engine().Apply("bell", -250, "encounter_cosmic").Ok(), "plunge applied");
    host.Jobs().WaitForAll();
    (void)host.Tick();
    host.Jobs().WaitForAll();
    EXPECT(world.Location("bell") == kSanitarium, "registered actor relocated");

    host.Registry().OnFloorReached("ghost", -100);
    host.Jobs().WaitForAll();
    (void)host.Tick();
    host.Jobs().WaitForAll();
    EXPECT(host.RelocationFailures() == 1, "unknown actor relocation counted");
    EXPECT(host.PendingRelocations() == 0, "failed relocation not retried");
    host.Shutdown();
    return 0;
}

static int test_pending_relocation_does_not_stall(void)
{
    World world;
    LucidityHost host(world.store, world.rooms, world.clock);
    EXPECT(host.Initialize(MakeConfigDir("host_stall",
               R"({"failover_delay_ms": 1500, "worker_count": 2, "batch_size": 1, "ticks_per_cadence": 1})")),
        "host started");
    for (int i = 0; i < 8; ++i)
    {
        world.store.RegisterActor("diver_" + std::to_string(i), "reef", world.clock.Now());
    }

    EXPECT(host.Engine().Apply("diver_0", -250, "encounter_cosmic").Ok(), "first plunge");
    EXPECT(host.Engine().Apply("diver_1", -250, "encounter_cosmic").Ok(), "second plunge");
    host.Jobs().WaitForAll();
    EXPECT(host.PendingRelocations() == 2, "both relocations waiting out the delay");

    auto started = std::chrono::steady_clock::now();
    const auto report = host.Tick();
    EXPECT(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500), "tick not held up");
    EXPECT(report.fired && report.evaluated >= 8, "flux applied to the reef");

    started = std::chrono::steady_clock::now();
    EXPECT(host.Engine().Apply("diver_2", -5, "encounter_disturbing").Ok(), "other actor adjusted");
    EXPECT(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500), "apply not held up");
    EXPECT(world.Location("diver_0") == "reef", "delay still running");

    world.clock.Advance(std::chrono::seconds(2));
    (void)host.Tick();
    host.Jobs().WaitForAll();
    EXPECT(host.PendingRelocations() == 0, "due relocations dispatched");
    EXPECT(world.Location("diver_0") == kSanitarium && world.Location("diver_1") == kSanitarium, "both relocated");
    EXPECT(world.Location("diver_2") == "reef", "others stay");
    host.Shutdown();
    return 0;
}

int main(void)
{
    if (test_load_host_settings() != 0) return 1;
    if (test_tick_and_events() != 0) return 1;
    if (test_floor_relocates_to_sanitarium() != 0) return 1;
    if (test_shutdown_cuts_failover_delay() != 0) return 1;
    if (test_failed_relocation_counted() != 0) return 1;
    if (test_pending_relocation_does_not_stall() != 0) return 1;
    return 0;
}
