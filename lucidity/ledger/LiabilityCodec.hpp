#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lucidity/ledger/LucidityTypes.hpp"

namespace lucidity::ledger
{
/// Liabilities as a JSON array of {"code", "stacks"} objects.
[[nodiscard]] nlohmann::json EncodeLiabilities(const std::vector<Liability>& liabilities);

/// Accepts anything; entries without a code are dropped and stacks below 1
/// (or non-numeric) become 1.
[[nodiscard]] std::vector<Liability> DecodeLiabilities(const nlohmann::json& payload);
[[nodiscard]] std::vector<Liability> DecodeLiabilities(const std::string& payload);

/// Increments an existing stack or appends a new entry with one stack.
/// @return Stack count after the change.
int StackLiability(std::vector<Liability>& liabilities, const std::string& code);

/// Removes one stack, or the whole entry when removeAll is set or one stack is left.
/// @return True if the list changed.
bool ReduceLiability(std::vector<Liability>& liabilities, const std::string& code, bool removeAll);

/// Metadata is always stored as an object. Strings are parsed as JSON;
/// anything that is not an object ends up as {}.
[[nodiscard]] nlohmann::json NormalizeMetadata(const nlohmann::json& metadata);
} // namespace lucidity::ledger
