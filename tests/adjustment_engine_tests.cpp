/*
Adjustment engine: clamping, tier transitions, crisis thresholds, liabilities
and storage failure handling.
*/
#include "lucidity/gameplay/AdjustmentEngine.hpp"

#include <chrono>
#include <future>
#include <limits>
#include <thread>
#include <vector>

#include "lucidity/gameplay/CatatoniaRegistry.hpp"
#include "lucidity/ledger/MemoryLedgerStore.hpp"
#include "lucidity/ledger/TierResolver.hpp"
#include "tests/LucidityTestSupport.hpp"

using lucidity::gameplay::AdjustmentEngine;
using lucidity::gameplay::LucidityError;
using lucidity::ledger::Tier;

namespace
{
struct Fixture
{
    Fixture()
        : clock(lucidity::test::AtUtcHour(12))
        , notifier(&bus)
        , recorder(bus, {lucidity::gameplay::kStateChangedEvent, lucidity::gameplay::kCrisisEvent})
        , engine(store, clock, &observer, &notifier)
    {
        store.RegisterActor("ames", "chapel", clock.Now());
    }

    /// Moves the actor to `score` through the engine itself.
    int SetScore(const std::string& actorId, int score)
    {
        const auto record = store.GetRecord(actorId);
        const int current = record.has_value() ? record->score : 100;
        const auto outcome = engine.Apply(actorId, score - current, "setup");
        bus.DispatchQueued();
        recorder.events.clear();
        observer.entered.clear();
        observer.cleared.clear();
        observer.floors.clear();
        return outcome.Ok() ? outcome.adjustment->newScore : -1000;
    }

    lucidity::ledger::MemoryLedgerStore store;
    lucidity::core::ManualClock clock;
    lucidity::core::EventBus bus;
    lucidity::gameplay::LucidityNotifier notifier;
    lucidity::test::EventRecorder recorder;
    lucidity::test::RecordingObserver observer;
    AdjustmentEngine engine;
};

/// Forwards to a registry, stalling inside the first catatonia entry.
class StallingObserver final : public lucidity::gameplay::TransitionObserver
{
public:
    explicit StallingObserver(lucidity::gameplay::CatatoniaRegistry& registry) : m_registry(registry) {}

    void OnCatatoniaEntered(const lucidity::ledger::ActorId& actorId, lucidity::ledger::TimePoint enteredAt,
        int currentScore) override
    {
        if (!m_stalled)
        {
            m_stalled = true;
            m_entered.set_value();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        m_registry.OnCatatoniaEntered(actorId, enteredAt, currentScore);
    }

    void OnCatatoniaCleared(const lucidity::ledger::ActorId& actorId, lucidity::ledger::TimePoint resolvedAt) override
    {
        m_registry.OnCatatoniaCleared(actorId, resolvedAt);
    }

    void OnFloorReached(const lucidity::ledger::ActorId& actorId, int currentScore) override
    {
        m_registry.OnFloorReached(actorId, currentScore);
    }

    void WaitEntered() { m_entered.get_future().wait(); }

private:
    lucidity::gameplay::CatatoniaRegistry& m_registry;
    bool m_stalled = false;
    std::promise<void> m_entered;
};
}

static int test_clamp_and_tier_invariant(void)
{
    Fixture f;
    const int deltas[] = {-7, -33, 250, -180, 12, -1, -99, 64, 3, -500, 41};
    for (const int delta : deltas)
    {
        const auto outcome = f.engine.Apply("ames", delta, "test_drift");
        EXPECT(outcome.Ok(), "apply succeeds");
        const auto& result = *outcome.adjustment;
        EXPECT(result.newScore >= -100 && result.newScore <= 100, "score stays in range");
        EXPECT(result.newTier == lucidity::ledger::ResolveTier(result.newScore), "tier matches score");

        const auto record = f.store.GetRecord("ames");
        EXPECT(record.has_value() && record->score == result.newScore, "record persisted");
        EXPECT(record->catatoniaEnteredAt.has_value() == (record->tier == Tier::Terminal),
            "catatonia stamp iff terminal");
    }
    return 0;
}

static int test_saturation(void)
{
    Fixture f;
    auto up = f.engine.Apply("ames", 10, "test_drift");
    EXPECT(up.Ok() && up.adjustment->newScore == 100, "saturates at 100");
    auto down = f.engine.Apply("ames", -10, "test_drift");
    EXPECT(down.Ok() && down.adjustment->newScore == 90, "gain above max is lost");

    EXPECT(f.SetScore("ames", -100) == -100, "reach floor");
    auto lower = f.engine.Apply("ames", -10, "test_drift");
    EXPECT(lower.Ok() && lower.adjustment->newScore == -100, "saturates at -100");
    auto back = f.engine.Apply("ames", 10, "test_drift");
    EXPECT(back.Ok() && back.adjustment->newScore == -90, "loss below min is lost");
    return 0;
}

static int test_delirium_fires_once(void)
{
    Fixture f;
    EXPECT(f.SetScore("ames", 5) == 5, "setup");
    const auto outcome = f.engine.Apply("ames", -20, "test_drift");
    EXPECT(outcome.Ok() && outcome.adjustment->newScore == -15, "5 to -15");
    f.bus.DispatchQueued();
    EXPECT(f.recorder.CountStatus(lucidity::gameplay::kStatusDelirium) == 1, "one delirium notification");
    EXPECT(f.recorder.CountStatus(lucidity::gameplay::kStatusCatatonic) == 1, "catatonia entered too");

    f.recorder.events.clear();
    EXPECT(f.engine.Apply("ames", -5, "test_drift").Ok(), "further loss");
    f.bus.DispatchQueued();
    EXPECT(f.recorder.CountStatus(lucidity::gameplay::kStatusDelirium) == 0, "no repeat below threshold");

    EXPECT(f.SetScore("ames", -9) == -9, "rise above threshold");
    EXPECT(f.engine.Apply("ames", -1, "test_drift").Ok(), "cross again");
    f.bus.DispatchQueued();
    EXPECT(f.recorder.CountStatus(lucidity::gameplay::kStatusDelirium) == 1, "fires again on new crossing");
    return 0;
}

static int test_floor_crossing(void)
{
    Fixture f;
    EXPECT(f.SetScore("ames", -95) == -95, "setup");
    EXPECT(f.engine.Apply("ames", -10, "test_drift").Ok(), "hit floor");
    EXPECT(f.observer.floors.size() == 1, "floor notified");
    EXPECT(f.engine.Apply("ames", -10, "test_drift").Ok(), "already at floor");
    EXPECT(f.observer.floors.size() == 1, "no repeat at floor");

    EXPECT(f.engine.Apply("ames", 5, "test_drift").Ok(), "rise");
    EXPECT(f.engine.Apply("ames", -5, "test_drift").Ok(), "drop again");
    EXPECT(f.observer.floors.size() == 2, "fires again after rising");
    f.bus.DispatchQueued();
    EXPECT(f.recorder.CountStatus(lucidity::gameplay::kStatusFloorReached) == 2, "floor events published");
    return 0;
}

static int test_catatonia_transitions(void)
{
    Fixture f;
    lucidity::gameplay::CatatoniaRegistry registry;
    AdjustmentEngine engine(f.store, f.clock, &registry, &f.notifier);

    EXPECT(engine.Apply("ames", -100, "test_drift").Ok(), "drop to 0");
    EXPECT(registry.IsCatatonic("ames"), "registry tracks catatonic actor");
    const auto record = f.store.GetRecord("ames");
    EXPECT(record.has_value() && record->catatoniaEnteredAt == f.clock.Now(), "stamp recorded");

    f.clock.Advance(std::chrono::minutes(1));
    EXPECT(engine.Apply("ames", -5, "test_drift").Ok(), "stay terminal");
    EXPECT(f.store.GetRecord("ames")->catatoniaEnteredAt == record->catatoniaEnteredAt, "stamp not refreshed");

    EXPECT(engine.Apply("ames", 30, "test_drift").Ok(), "recover");
    EXPECT(!registry.IsCatatonic("ames"), "registry cleared");
    EXPECT(!f.store.GetRecord("ames")->catatoniaEnteredAt.has_value(), "stamp cleared");
    f.bus.DispatchQueued();
    EXPECT(f.recorder.CountStatus(lucidity::gameplay::kStatusRecovered) == 1, "recovered event");
    return 0;
}

static int test_liability_on_severe_loss(void)
{
    Fixture f;
    EXPECT(f.SetScore("ames", 45) == 45, "setup");
    const auto outcome = f.engine.Apply("ames", -30, "encounter_horrific");
    EXPECT(outcome.Ok(), "apply");
    EXPECT(outcome.adjustment->newScore == 15, "45 - 30 = 15");
    EXPECT(outcome.adjustment->newTier == Tier::Deranged, "deranged");
    EXPECT(outcome.adjustment->liabilitiesAdded.size() == 1, "one liability");

    const auto record = f.store.GetRecord("ames");
    EXPECT(record->liabilities.size() == 2, "appended after the one from setup");
    EXPECT(record->liabilities.back().code == outcome.adjustment->liabilitiesAdded.front(), "same code stored");
    EXPECT(record->liabilities.back().code == "murmuring_chorus", "first code not already held");

    const auto log = f.store.AdjustmentLog("ames");
    EXPECT(!log.empty() && log.back().reasonCode == "encounter_horrific" && log.back().delta == -30, "log entry");
    return 0;
}

static int test_liability_rules(void)
{
    Fixture f;
    auto small = f.engine.Apply("ames", -5, "test_drift");
    EXPECT(small.Ok() && small.adjustment->liabilitiesAdded.empty(), "small loss in same tier adds nothing");

    auto worsened = f.engine.Apply("ames", -26, "test_drift");
    EXPECT(worsened.Ok() && worsened.adjustment->newTier == Tier::Uneasy, "69 is uneasy");
    EXPECT(worsened.adjustment->liabilitiesAdded.size() == 1, "tier worsening rolls a liability");
    EXPECT(worsened.adjustment->liabilitiesAdded.front() == "night_frayed_reflexes", "first unused code");

    auto severe = f.engine.Apply("ames", -15, "test_drift");
    EXPECT(severe.Ok() && severe.adjustment->liabilitiesAdded.front() == "murmuring_chorus", "next unused code");

    auto gain = f.engine.Apply("ames", 20, "test_drift");
    EXPECT(gain.Ok() && gain.adjustment->liabilitiesAdded.empty(), "gains add nothing");

    f.engine.SetLiabilityPicker([](const lucidity::ledger::LucidityRecord&, int, int, const std::string&) {
        return std::optional<std::string>("bleak_outlook");
    });
    EXPECT(f.engine.Apply("ames", -20, "test_drift").Ok(), "picked");
    EXPECT(f.engine.Apply("ames", -20, "test_drift").Ok(), "picked again");
    const auto record = f.store.GetRecord("ames");
    EXPECT(record->liabilities.back().code == "bleak_outlook" && record->liabilities.back().stacks == 2,
        "same liability stacks");
    return 0;
}

static int test_default_pick_falls_back(void)
{
    Fixture f;
    lucidity::ledger::LucidityRecord record;
    for (const std::string& code : lucidity::gameplay::DefaultLiabilityCatalog())
    {
        record.liabilities.push_back({code, 1});
    }
    const auto picked = f.engine.PickDefaultLiability(record);
    EXPECT(picked.has_value() && *picked == "night_frayed_reflexes", "falls back to first catalog entry");
    return 0;
}

static int test_storage_failure_is_atomic(void)
{
    Fixture f;
    lucidity::test::FailingLedgerStore failing(f.store);
    lucidity::test::RecordingObserver observer;
    AdjustmentEngine engine(failing, f.clock, &observer, &f.notifier);

    EXPECT(engine.Apply("ames", -50, "test_drift").Ok(), "baseline");
    const auto before = f.store.GetRecord("ames");
    const std::size_t logBefore = f.store.AdjustmentLogSize();
    f.bus.DispatchQueued();
    f.recorder.events.clear();

    failing.saveStatus = lucidity::ledger::StorageStatus::Failed;
    const auto outcome = engine.Apply("ames", -60, "test_drift");
    EXPECT(outcome.error == LucidityError::StorageError, "storage error surfaced");
    EXPECT(!outcome.adjustment.has_value(), "no result on failure");
    EXPECT(f.store.GetRecord("ames")->score == before->score, "score unchanged");
    EXPECT(f.store.GetRecord("ames")->liabilities == before->liabilities, "liabilities unchanged");
    EXPECT(f.store.AdjustmentLogSize() == logBefore, "no log entry");
    EXPECT(observer.entered.empty(), "no observer call");
    f.bus.DispatchQueued();
    EXPECT(f.recorder.events.empty(), "no notification");

    failing.saveStatus = lucidity::ledger::StorageStatus::Ok;
    failing.beginStatus = lucidity::ledger::StorageStatus::Timeout;
    EXPECT(engine.Apply("ames", -1, "test_drift").error == LucidityError::StorageError, "timeout is a storage error");
    EXPECT(engine.ConsecutiveStorageFailures() == 2, "failures counted");
    failing.beginStatus = lucidity::ledger::StorageStatus::Ok;
    EXPECT(engine.Apply("ames", -1, "test_drift").Ok(), "recovers");
    EXPECT(engine.ConsecutiveStorageFailures() == 0, "counter reset");
    return 0;
}

static int test_unknown_actor(void)
{
    Fixture f;
    const auto outcome = f.engine.Apply("nobody", -5, "test_drift");
    EXPECT(outcome.error == LucidityError::ActorNotFound, "actor not found");
    return 0;
}

static int test_state_change_payload(void)
{
    Fixture f;
    f.store.RegisterActor("bell", "cemetery", f.clock.Now(), std::nullopt, 80);
    const nlohmann::json metadata = {{"encounter_category", "cosmic"}};
    EXPECT(f.engine.Apply("bell", -5, "encounter_cosmic", metadata, std::string("cemetery")).Ok(), "apply");
    EXPECT(f.engine.Apply("bell", 0, "noop").Ok(), "zero delta");
    f.bus.DispatchQueued();

    EXPECT(f.recorder.Count(lucidity::gameplay::kStateChangedEvent) == 1, "zero delta without tier change is silent");
    const auto& payload = f.recorder.events.front().payload;
    EXPECT(payload["current_lcd"] == 80, "score capped to max score");
    EXPECT(payload["max_lcd"] == 80, "max score reported");
    EXPECT(payload["delta"] == -5, "delta reported");
    EXPECT(payload["tier"] == "stable", "tier reported");
    EXPECT(payload["source"] == "cosmic", "source from metadata");
    EXPECT(payload["reason"] == "encounter_cosmic", "reason reported");

    const auto log = f.store.AdjustmentLog("bell");
    EXPECT(log.front().locationId == std::optional<std::string>("cemetery"), "location logged");
    EXPECT(log.front().metadata["encounter_category"] == "cosmic", "metadata logged");
    return 0;
}

static int test_clear_liability(void)
{
    Fixture f;
    f.engine.SetLiabilityPicker([](const lucidity::ledger::LucidityRecord&, int, int, const std::string&) {
        return std::optional<std::string>("ethereal_chill");
    });
    EXPECT(f.engine.Apply("ames", -20, "test_drift").Ok(), "first stack");
    EXPECT(f.engine.Apply("ames", -20, "test_drift").Ok(), "second stack");
    f.bus.DispatchQueued();
    f.recorder.events.clear();
    const std::size_t logBefore = f.store.AdjustmentLogSize();

    const auto once = f.engine.ClearLiability("ames", "ethereal_chill");
    EXPECT(once.Ok() && once.adjustment.has_value(), "one stack cleared");
    EXPECT(f.store.GetRecord("ames")->liabilities.front().stacks == 1, "stack decremented");
    EXPECT(f.store.AdjustmentLogSize() == logBefore + 1, "clear is logged");
    EXPECT(f.store.AdjustmentLog("ames").back().reasonCode == "liability_cleared", "clear reason");
    EXPECT(f.store.AdjustmentLog("ames").back().delta == 0, "clear has zero delta");

    const auto all = f.engine.ClearLiability("ames", "ethereal_chill", true);
    EXPECT(all.Ok() && all.adjustment.has_value(), "entry removed");
    EXPECT(f.store.GetRecord("ames")->liabilities.empty(), "no liabilities left");

    const auto none = f.engine.ClearLiability("ames", "ethereal_chill");
    EXPECT(none.Ok() && !none.adjustment.has_value(), "nothing to clear");
    f.bus.DispatchQueued();
    EXPECT(f.recorder.Count(lucidity::gameplay::kStateChangedEvent) == 2, "one notification per change");
    return 0;
}

static int test_extreme_deltas(void)
{
    Fixture f;
    const auto down = f.engine.Apply("ames", std::numeric_limits<int>::min(), "encounter_cosmic");
    EXPECT(down.Ok() && down.adjustment->newScore == -100, "minimum int clamps to floor");
    EXPECT(down.adjustment->liabilitiesAdded.size() == 1, "counts as a severe loss");
    EXPECT(f.observer.floors.size() == 1, "floor reached");

    const auto up = f.engine.Apply("ames", std::numeric_limits<int>::max(), "recovery_therapy");
    EXPECT(up.Ok() && up.adjustment->newScore == 100, "maximum int clamps to ceiling");
    EXPECT(up.adjustment->liabilitiesAdded.empty(), "gains roll nothing");
    return 0;
}

static int test_concurrent_transitions_follow_commit_order(void)
{
    lucidity::ledger::MemoryLedgerStore store;
    lucidity::core::ManualClock clock(lucidity::test::AtUtcHour(12));
    lucidity::gameplay::CatatoniaRegistry registry;
    StallingObserver observer(registry);
    AdjustmentEngine engine(store, clock, &observer, nullptr);
    store.RegisterActor("ames", "chapel", clock.Now());

    std::thread collapse([&engine]() { (void)engine.Apply("ames", -100, "encounter_cosmic"); });
    observer.WaitEntered();
    const auto recovery = engine.Apply("ames", 50, "recovery_therapy");
    collapse.join();

    EXPECT(recovery.Ok(), "recovery waited for the row lock");
    const auto record = store.GetRecord("ames");
    EXPECT(record.has_value() && record->score == 50 && record->tier == Tier::Uneasy, "recovery committed last");
    EXPECT(!record->catatoniaEnteredAt.has_value(), "stamp cleared");
    EXPECT(!registry.IsCatatonic("ames"), "registry agrees with the ledger");
    return 0;
}

static int test_concurrent_applies_serialize(void)
{
    lucidity::ledger::MemoryLedgerStore store;
    lucidity::core::ManualClock clock(lucidity::test::AtUtcHour(12));
    lucidity::gameplay::CatatoniaRegistry registry;
    AdjustmentEngine engine(store, clock, &registry, nullptr);
    store.RegisterActor("ames", "chapel", clock.Now());
    EXPECT(engine.Apply("ames", -200, "setup").Ok(), "start at the floor");

    constexpr int kThreads = 8;
    constexpr int kSteps = 25;
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i)
    {
        workers.emplace_back([&engine]() {
            for (int step = 0; step < kSteps; ++step)
            {
                (void)engine.Apply("ames", 1, "recovery_meditate");
            }
        });
    }
    for (std::thread& worker : workers)
    {
        worker.join();
    }

    EXPECT(store.GetRecord("ames")->score == 100, "no increment lost");
    const std::size_t expectedEntries = 1 + kThreads * kSteps;
    EXPECT(store.AdjustmentLog("ames").size() == expectedEntries, "every call logged");
    EXPECT(!registry.IsCatatonic("ames"), "left catatonia once");

    workers.clear();
    for (int i = 0; i < kThreads; ++i)
    {
        workers.emplace_back([&engine, i]() {
            for (int step = 0; step < kSteps; ++step)
            {
                (void)engine.Apply("ames", (step + i) % 2 == 0 ? -100 : 100, "flux_swing");
            }
        });
    }
    for (std::thread& worker : workers)
    {
        worker.join();
    }

    const auto record = store.GetRecord("ames");
    EXPECT(record.has_value(), "record exists");
    EXPECT(registry.IsCatatonic("ames") == (record->tier == Tier::Terminal), "registry matches committed tier");
    EXPECT(record->catatoniaEnteredAt.has_value() == (record->tier == Tier::Terminal), "stamp matches tier");
    return 0;
}

int main(void)
{
    if (test_clamp_and_tier_invariant() != 0) return 1;
    if (test_saturation() != 0) return 1;
    if (test_delirium_fires_once() != 0) return 1;
    if (test_floor_crossing() != 0) return 1;
    if (test_catatonia_transitions() != 0) return 1;
    if (test_liability_on_severe_loss() != 0) return 1;
    if (test_liability_rules() != 0) return 1;
    if (test_default_pick_falls_back() != 0) return 1;
    if (test_storage_failure_is_atomic() != 0) return 1;
    if (test_unknown_actor() != 0) return 1;
    if (test_state_change_payload() != 0) return 1;
    if (test_clear_liability() != 0) return 1;
    if (test_extreme_deltas() != 0) return 1;
    if (test_concurrent_transitions_follow_commit_order() != 0) return 1;
    if (test_concurrent_applies_serialize() != 0) return 1;
    return 0;
}
