#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lucidity/core/Clock.hpp"

namespace lucidity::ledger
{
using ActorId = std::string;
using core::TimePoint;

constexpr int kMinScore = -100;
constexpr int kMaxScore = 100;
constexpr int kStartingScore = 100;

/// Stability bands, ordered from healthiest to most severe.
enum class Tier : std::uint8_t
{
    Stable = 0,   ///< score >= 70
    Uneasy,       ///< score >= 40
    Fractured,    ///< score >= 20
    Deranged,     ///< score >= 1
    Terminal,     ///< score <= 0, catatonic
    Count
};

[[nodiscard]] const char* TierToId(Tier tier);
[[nodiscard]] std::optional<Tier> ParseTier(const std::string& id);

/// Deranged and terminal actors destabilize the people around them.
[[nodiscard]] inline bool IsImpaired(Tier tier)
{
    return tier == Tier::Deranged || tier == Tier::Terminal;
}

[[nodiscard]] inline bool IsWorse(Tier candidate, Tier reference)
{
    return static_cast<int>(candidate) > static_cast<int>(reference);
}

struct Liability
{
    std::string code;
    int stacks = 1;

    bool operator==(const Liability& other) const = default;
};

struct LucidityRecord
{
    ActorId actorId;
    int score = kStartingScore;
    Tier tier = Tier::Stable;
    std::vector<Liability> liabilities;
    std::optional<TimePoint> catatoniaEnteredAt;
    TimePoint updatedAt{};

    [[nodiscard]] bool HasLiability(const std::string& code) const
    {
        for (const Liability& liability : liabilities)
        {
            if (liability.code == code)
            {
                return true;
            }
        }
        return false;
    }
};

struct AdjustmentLogEntry
{
    ActorId actorId;
    int delta = 0;
    std::string reasonCode;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> locationId;
    TimePoint createdAt{};
};

struct ExposureState
{
    ActorId actorId;
    std::string archetype;
    int encounterCount = 0;
    TimePoint lastEncounterAt{};
};

struct CooldownRecord
{
    ActorId actorId;
    std::string actionCode;
    TimePoint expiresAt{};
};

/// Scheduling view of a character, joined with its current tier.
struct ActorPresence
{
    ActorId actorId;
    std::string locationId;
    std::optional<TimePoint> lastActiveAt;
    TimePoint createdAt{};
    Tier tier = Tier::Stable;
    int maxScore = kMaxScore;
};
} // namespace lucidity::ledger
