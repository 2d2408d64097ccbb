/*
Core services: event bus dispatch, worker pool, clocks and cadence.
*/
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "lucidity/core/Clock.hpp"
#include "lucidity/core/EventBus.hpp"
#include "lucidity/core/JobSystem.hpp"
#include "tests/LucidityTestSupport.hpp"

static int test_event_bus_queues_until_dispatch(void)
{
    lucidity::core::EventBus bus;
    std::vector<std::string> seen;
    bus.Subscribe("lucidity.changed", [&seen](const lucidity::core::Event& event) { seen.push_back(event.actorId); });

    bus.Publish({"lucidity.changed", "ames", {{"score", 90}}});
    bus.Publish({"lucidity.crisis", "bell", {}});
    EXPECT(seen.empty(), "nothing runs on publish");
    EXPECT(bus.PendingCount() == 2, "both queued");

    EXPECT(bus.DispatchQueued() == 2, "both dispatched");
    EXPECT(seen == std::vector<std::string>{"ames"}, "only subscribed name delivered");
    EXPECT(bus.PendingCount() == 0, "queue drained");
    return 0;
}

static int test_event_bus_contains_handler_errors(void)
{
    lucidity::core::EventBus bus;
    int delivered = 0;
    bus.Subscribe("lucidity.crisis", [](const lucidity::core::Event&) { throw std::runtime_error("session gone"); });
    bus.Subscribe("lucidity.crisis", [&delivered](const lucidity::core::Event&) { ++delivered; });

    bus.Publish({"lucidity.crisis", "ames", {}});
    bus.Publish({"lucidity.crisis", "bell", {}});
    EXPECT(bus.DispatchQueued() == 2, "dispatch completes");
    EXPECT(delivered == 2, "later handlers still run");
    EXPECT(bus.FailedHandlerCount() == 2, "failures counted");
    return 0;
}

static int test_parallel_for(void)
{
    lucidity::core::JobSystem jobs;
    EXPECT(jobs.Initialize(3), "pool started");

    std::vector<int> values(100, 0);
    lucidity::core::JobCounter counter;
    jobs.ParallelFor(values.size(), 8, [&values](std::size_t i) { values[i] = static_cast<int>(i) * 2; }, counter);
    jobs.WaitForCounter(counter);

    for (std::size_t i = 0; i < values.size(); ++i)
    {
        EXPECT(values[i] == static_cast<int>(i) * 2, "every index visited");
    }
    jobs.Shutdown();
    EXPECT(!jobs.IsInitialized(), "pool stopped");
    return 0;
}

static int test_failure_hook(void)
{
    lucidity::core::JobSystem jobs;
    EXPECT(jobs.Initialize(1), "pool started");

    std::atomic<int> hookCalls{0};
    std::string failedName;
    const auto id = jobs.Schedule([]() { throw std::runtime_error("lock timeout"); },
        lucidity::core::JobPriority::Normal, "relocate",
        nullptr, [&hookCalls, &failedName](const std::string& jobName, const std::string& error) {
            failedName = jobName + ":" + error;
            ++hookCalls;
        });
    EXPECT(id != lucidity::core::kInvalidJobId, "job accepted");
    jobs.WaitForAll();

    EXPECT(hookCalls == 1, "hook ran once");
    EXPECT(failedName == "relocate:lock timeout", "hook received name and error");
    EXPECT(jobs.GetStats().failedJobs == 1, "failure counted");

    jobs.Shutdown();
    EXPECT(jobs.Schedule([]() {}) == lucidity::core::kInvalidJobId, "stopped pool rejects work");
    return 0;
}

static int test_cadence_and_clock(void)
{
    lucidity::core::CadenceCounter cadence(6);
    EXPECT(cadence.ShouldFire(0) && cadence.ShouldFire(12), "multiples fire");
    EXPECT(!cadence.ShouldFire(7), "others do not");
    cadence.SetTicksPerCadence(0);
    EXPECT(cadence.TicksPerCadence() == 1 && cadence.ShouldFire(7), "zero treated as every tick");

    lucidity::core::ManualClock clock(lucidity::test::AtUtcHour(5));
    EXPECT(lucidity::core::UtcHourOfDay(clock.Now()) == 5, "hour read back");
    clock.Advance(std::chrono::minutes(90));
    EXPECT(lucidity::core::UtcHourOfDay(clock.Now()) == 6, "advanced past the hour");
    clock.Set(lucidity::test::AtUtcHour(23) + std::chrono::hours(2));
    EXPECT(lucidity::core::UtcHourOfDay(clock.Now()) == 1, "wraps at midnight");
    return 0;
}

int main(void)
{
    if (test_event_bus_queues_until_dispatch() != 0) return 1;
    if (test_event_bus_contains_handler_errors() != 0) return 1;
    if (test_parallel_for() != 0) return 1;
    if (test_failure_hook() != 0) return 1;
    if (test_cadence_and_clock() != 0) return 1;
    return 0;
}
