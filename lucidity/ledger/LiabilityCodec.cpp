#include "lucidity/ledger/LiabilityCodec.hpp"

#include <algorithm>
#include <utility>

namespace lucidity::ledger
{
nlohmann::json EncodeLiabilities(const std::vector<Liability>& liabilities)
{
    nlohmann::json array = nlohmann::json::array();
    for (const Liability& liability : liabilities)
    {
        if (liability.code.empty())
        {
            continue;
        }
        array.push_back({{"code", liability.code}, {"stacks", std::max(1, liability.stacks)}});
    }
    return array;
}

std::vector<Liability> DecodeLiabilities(const nlohmann::json& payload)
{
    std::vector<Liability> result;
    if (!payload.is_array())
    {
        return result;
    }

    for (const auto& entry : payload)
    {
        if (!entry.is_object() || !entry.contains("code"))
        {
            continue;
        }

        Liability liability;
        const auto& code = entry["code"];
        liability.code = code.is_string() ? code.get<std::string>() : code.dump();
        if (liability.code.empty())
        {
            continue;
        }

        liability.stacks = 1;
        if (entry.contains("stacks") && entry["stacks"].is_number())
        {
            liability.stacks = std::max(1, entry["stacks"].get<int>());
        }
        result.push_back(std::move(liability));
    }
    return result;
}

std::vector<Liability> DecodeLiabilities(const std::string& payload)
{
    if (payload.empty())
    {
        return {};
    }
    const nlohmann::json parsed = nlohmann::json::parse(payload, nullptr, false);
    if (parsed.is_discarded())
    {
        return {};
    }
    return DecodeLiabilities(parsed);
}

int StackLiability(std::vector<Liability>& liabilities, const std::string& code)
{
    for (Liability& liability : liabilities)
    {
        if (liability.code == code)
        {
            ++liability.stacks;
            return liability.stacks;
        }
    }
    liabilities.push_back(Liability{code, 1});
    return 1;
}

bool ReduceLiability(std::vector<Liability>& liabilities, const std::string& code, bool removeAll)
{
    auto it = std::find_if(liabilities.begin(), liabilities.end(),
        [&code](const Liability& liability) { return liability.code == code; });
    if (it == liabilities.end())
    {
        return false;
    }

    if (removeAll || it->stacks <= 1)
    {
        liabilities.erase(it);
    }
    else
    {
        --it->stacks;
    }
    return true;
}

nlohmann::json NormalizeMetadata(const nlohmann::json& metadata)
{
    if (metadata.is_object())
    {
        return metadata;
    }
    if (metadata.is_string())
    {
        const nlohmann::json parsed = nlohmann::json::parse(metadata.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object())
        {
            return parsed;
        }
    }
    return nlohmann::json::object();
}
} // namespace lucidity::ledger
