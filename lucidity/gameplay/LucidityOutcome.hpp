#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lucidity/ledger/LucidityTypes.hpp"

namespace lucidity::gameplay
{
enum class LucidityError : std::uint8_t
{
    None = 0,
    UnknownActionCode,
    UnknownEncounterCategory,
    OnCooldown,
    ActorNotFound,
    StorageError
};

[[nodiscard]] inline const char* LucidityErrorToText(LucidityError error)
{
    switch (error)
    {
        case LucidityError::None: return "none";
        case LucidityError::UnknownActionCode: return "unknown_action_code";
        case LucidityError::UnknownEncounterCategory: return "unknown_encounter_category";
        case LucidityError::OnCooldown: return "on_cooldown";
        case LucidityError::ActorNotFound: return "actor_not_found";
        case LucidityError::StorageError: return "storage_error";
        default: return "unknown";
    }
}

struct AdjustmentResult
{
    ledger::ActorId actorId;
    int previousScore = ledger::kStartingScore;
    int newScore = ledger::kStartingScore;
    ledger::Tier previousTier = ledger::Tier::Stable;
    ledger::Tier newTier = ledger::Tier::Stable;
    int delta = 0;
    std::vector<std::string> liabilitiesAdded;
};

/// Result of any lucidity operation. `adjustment` is set only on success.
struct LucidityOutcome
{
    LucidityError error = LucidityError::None;
    std::string message;
    std::optional<AdjustmentResult> adjustment;
    std::chrono::seconds cooldownRemaining{0};

    [[nodiscard]] bool Ok() const { return error == LucidityError::None; }

    [[nodiscard]] static LucidityOutcome Success(AdjustmentResult result)
    {
        LucidityOutcome outcome;
        outcome.adjustment = std::move(result);
        return outcome;
    }

    [[nodiscard]] static LucidityOutcome Failure(LucidityError error, std::string message)
    {
        LucidityOutcome outcome;
        outcome.error = error;
        outcome.message = std::move(message);
        return outcome;
    }
};
} // namespace lucidity::gameplay
