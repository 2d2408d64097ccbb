#pragma once

#include "lucidity/ledger/LucidityTypes.hpp"

namespace lucidity::ledger
{
constexpr int kStableFloor = 70;
constexpr int kUneasyFloor = 40;
constexpr int kFracturedFloor = 20;
constexpr int kDerangedFloor = 1;

[[nodiscard]] Tier ResolveTier(int score);

[[nodiscard]] int ClampScore(long long score);
} // namespace lucidity::ledger
