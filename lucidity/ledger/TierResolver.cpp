#include "lucidity/ledger/TierResolver.hpp"

#include <algorithm>

namespace lucidity::ledger
{
Tier ResolveTier(int score)
{
    if (score >= kStableFloor)
    {
        return Tier::Stable;
    }
    if (score >= kUneasyFloor)
    {
        return Tier::Uneasy;
    }
    if (score >= kFracturedFloor)
    {
        return Tier::Fractured;
    }
    if (score >= kDerangedFloor)
    {
        return Tier::Deranged;
    }
    return Tier::Terminal;
}

int ClampScore(long long score)
{
    return static_cast<int>(std::clamp<long long>(score, kMinScore, kMaxScore));
}

const char* TierToId(Tier tier)
{
    switch (tier)
    {
        case Tier::Stable: return "stable";
        case Tier::Uneasy: return "uneasy";
        case Tier::Fractured: return "fractured";
        case Tier::Deranged: return "deranged";
        case Tier::Terminal: return "terminal";
        default: return "unknown";
    }
}

std::optional<Tier> ParseTier(const std::string& id)
{
    if (id == "stable") return Tier::Stable;
    if (id == "uneasy") return Tier::Uneasy;
    if (id == "fractured") return Tier::Fractured;
    if (id == "deranged") return Tier::Deranged;
    if (id == "terminal") return Tier::Terminal;
    return std::nullopt;
}
} // namespace lucidity::ledger
