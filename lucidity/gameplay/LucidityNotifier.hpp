#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lucidity/core/EventBus.hpp"
#include "lucidity/ledger/LucidityTypes.hpp"

namespace lucidity::gameplay
{
inline constexpr const char* kStateChangedEvent = "lucidity.changed";
inline constexpr const char* kCrisisEvent = "lucidity.crisis";
inline constexpr const char* kHallucinationEvent = "lucidity.hallucination";

inline constexpr const char* kStatusCatatonic = "catatonic";
inline constexpr const char* kStatusRecovered = "recovered";
inline constexpr const char* kStatusDelirium = "delirium";
inline constexpr const char* kStatusFloorReached = "floor_reached";

struct StateChangeNotice
{
    ledger::ActorId actorId;
    int score = 0;
    int maxScore = ledger::kMaxScore;
    int delta = 0;
    ledger::Tier tier = ledger::Tier::Stable;
    std::vector<ledger::Liability> liabilities;
    std::string reason;
    std::optional<std::string> source;
    nlohmann::json metadata = nlohmann::json::object();
};

/// Formats lucidity notifications and hands them to the session transport.
/// Publishing never fails the caller; transport errors are logged.
class LucidityNotifier
{
public:
    explicit LucidityNotifier(core::EventBus* bus);

    void PublishStateChange(const StateChangeNotice& notice);
    void PublishCrisis(const ledger::ActorId& actorId, int score, const char* status, const std::string& message);
    void PublishHallucination(const ledger::ActorId& actorId, ledger::Tier tier, const std::string& locationId);

    /// Picks the most descriptive source label from adjustment metadata.
    [[nodiscard]] static std::optional<std::string> ResolveSource(const nlohmann::json& metadata,
        const std::optional<std::string>& locationId);

private:
    void Publish(core::Event event);

    core::EventBus* m_bus = nullptr;
};
} // namespace lucidity::gameplay
