#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "app/LucidityHost.hpp"
#include "lucidity/core/Clock.hpp"
#include "lucidity/ledger/MemoryLedgerStore.hpp"

namespace
{
struct CommandLine
{
    std::string configDir = "assets/config";
    int ticks = 36;
    bool realtime = false;
};

bool ParseCommandLine(int argc, char** argv, CommandLine& out)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            out.configDir = argv[++i];
        }
        else if (arg == "--ticks" && i + 1 < argc)
        {
            out.ticks = std::max(1, std::atoi(argv[++i]));
        }
        else if (arg == "--realtime")
        {
            out.realtime = true;
        }
        else
        {
            std::cerr << "Usage: lucidity_host [--config <dir>] [--ticks <n>] [--realtime]\n";
            return false;
        }
    }
    return true;
}

void SeedWorld(lucidity::ledger::MemoryLedgerStore& store, lucidity::ledger::MemoryRoomDirectory& rooms,
    lucidity::core::TimePoint now)
{
    using lucidity::ledger::RoomDescriptor;
    rooms.AddRoom(RoomDescriptor{"arkham_chapel_nave", "earth", "arkhamcity", "french_hill", "temple"});
    rooms.AddRoom(RoomDescriptor{"arkham_cemetery_gate", "earth", "arkhamcity", "cemetery", "graveyard"});
    rooms.AddRoom(RoomDescriptor{"innsmouth_reef_edge", "earth", "innsmouth", "devil_reef", "eldritch"});
    rooms.AddRoom(RoomDescriptor{"earth_arkhamcity_sanitarium_room_foyer_001", "earth", "arkhamcity", "sanitarium",
        "indoors"});

    store.RegisterActor("investigator_ames", "arkham_chapel_nave", now, now);
    store.RegisterActor("investigator_bell", "arkham_cemetery_gate", now, now);
    store.RegisterActor("investigator_crane", "arkham_cemetery_gate", now, now);
    store.RegisterActor("investigator_doyle", "innsmouth_reef_edge", now, now);
}
}

int main(int argc, char** argv)
{
    CommandLine commandLine;
    if (!ParseCommandLine(argc, argv, commandLine))
    {
        return EXIT_FAILURE;
    }

    lucidity::ledger::MemoryLedgerStore store;
    lucidity::ledger::MemoryRoomDirectory rooms;
    lucidity::core::SystemClock clock;
    SeedWorld(store, rooms, clock.Now());

    lucidity::app::LucidityHost host(store, rooms, clock);
    if (!host.Initialize(commandLine.configDir))
    {
        std::cerr << "Failed to initialize lucidity host.\n";
        return EXIT_FAILURE;
    }

    for (const char* eventName : {lucidity::gameplay::kStateChangedEvent, lucidity::gameplay::kCrisisEvent,
             lucidity::gameplay::kHallucinationEvent})
    {
        host.Events().Subscribe(eventName, [](const lucidity::core::Event& event) {
            std::cout << "[event] " << event.name << " " << event.payload.dump() << "\n";
        });
    }

    const auto encounter = host.Effects().ApplyEncounter("investigator_doyle", "deep_one", "horrific",
        std::string("innsmouth_reef_edge"));
    if (!encounter.Ok())
    {
        std::cerr << "Encounter failed: " << encounter.message << "\n";
    }
    const auto recovery = host.Effects().PerformRecovery("investigator_doyle", "pray");
    if (!recovery.Ok())
    {
        std::cerr << "Recovery failed: " << recovery.message << "\n";
    }

    const auto interval = std::chrono::milliseconds(host.Settings().tickIntervalMs);
    for (int tick = 0; tick < commandLine.ticks; ++tick)
    {
        for (const char* actorId : {"investigator_ames", "investigator_bell", "investigator_crane",
                 "investigator_doyle"})
        {
            store.TouchActivity(actorId, clock.Now());
        }

        (void)host.Tick();
        if (commandLine.realtime)
        {
            std::this_thread::sleep_for(interval);
        }
    }

    host.Shutdown();
    return EXIT_SUCCESS;
}
