#include "lucidity/gameplay/EffectCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "lucidity/gameplay/AdjustmentEngine.hpp"

namespace lucidity::gameplay
{
namespace
{
std::string NormalizeCode(const std::string& value)
{
    std::string result;
    result.reserve(value.size());
    for (const char c : value)
    {
        if (std::isspace(static_cast<unsigned char>(c)) == 0)
        {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return result;
}

template <typename Map>
std::vector<std::string> SortedKeys(const Map& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map)
    {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}
}

EffectCatalog::EffectCatalog()
{
    InitializeDefaults();
}

void EffectCatalog::InitializeDefaults()
{
    m_encounters.clear();
    m_recoveries.clear();

    RegisterEncounter({"disturbing", -6, -2});
    RegisterEncounter({"horrific", -12, -5});
    RegisterEncounter({"cosmic", -20, -10});

    using std::chrono::minutes;
    RegisterRecovery({"pray", 8, minutes(15)});
    RegisterRecovery({"meditate", 6, minutes(10)});
    RegisterRecovery({"group_solace", 4, minutes(5)});
    RegisterRecovery({"therapy", 15, minutes(120)});
    RegisterRecovery({"folk_tonic", 3, minutes(30)});

    m_liabilityCatalog = DefaultLiabilityCatalog();
    m_acclimationThreshold = 6;
    m_liabilityLossThreshold = 15;
}

void EffectCatalog::RegisterEncounter(const EncounterProfile& profile)
{
    const std::string key = NormalizeCode(profile.category);
    if (key.empty())
    {
        std::cout << "EffectCatalog: WARNING - Ignoring encounter profile without a category\n";
        return;
    }
    EncounterProfile stored = profile;
    stored.category = key;
    m_encounters[key] = stored;
}

void EffectCatalog::RegisterRecovery(const RecoveryProfile& profile)
{
    const std::string key = NormalizeCode(profile.actionCode);
    if (key.empty())
    {
        std::cout << "EffectCatalog: WARNING - Ignoring recovery profile without an action code\n";
        return;
    }
    RecoveryProfile stored = profile;
    stored.actionCode = key;
    if (stored.cooldown.count() < 0)
    {
        stored.cooldown = std::chrono::seconds(0);
    }
    m_recoveries[key] = stored;
}

const EncounterProfile* EffectCatalog::FindEncounter(const std::string& category) const
{
    const auto it = m_encounters.find(NormalizeCode(category));
    return it != m_encounters.end() ? &it->second : nullptr;
}

const RecoveryProfile* EffectCatalog::FindRecovery(const std::string& actionCode) const
{
    const auto it = m_recoveries.find(NormalizeCode(actionCode));
    return it != m_recoveries.end() ? &it->second : nullptr;
}

std::vector<std::string> EffectCatalog::EncounterCategories() const
{
    return SortedKeys(m_encounters);
}

std::vector<std::string> EffectCatalog::RecoveryCodes() const
{
    return SortedKeys(m_recoveries);
}

bool EffectCatalog::LoadFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "EffectCatalog: WARNING - Could not open lucidity_effects.json at '" << jsonPath << "'\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "EffectCatalog: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        int encounters = 0;
        if (root.contains("encounters") && root["encounters"].is_object())
        {
            for (const auto& [category, profileJson] : root["encounters"].items())
            {
                if (!profileJson.is_object())
                {
                    continue;
                }
                const EncounterProfile* existing = FindEncounter(category);
                EncounterProfile profile = existing != nullptr ? *existing : EncounterProfile{};
                profile.category = category;
                profile.firstTime = profileJson.value("first_time", profile.firstTime);
                profile.repeat = profileJson.value("repeat", profile.repeat);
                RegisterEncounter(profile);
                ++encounters;
            }
        }

        int recoveries = 0;
        if (root.contains("recovery") && root["recovery"].is_object())
        {
            for (const auto& [actionCode, profileJson] : root["recovery"].items())
            {
                if (!profileJson.is_object())
                {
                    continue;
                }
                const RecoveryProfile* existing = FindRecovery(actionCode);
                RecoveryProfile profile = existing != nullptr ? *existing : RecoveryProfile{};
                profile.actionCode = actionCode;
                profile.delta = profileJson.value("delta", profile.delta);
                profile.cooldown = std::chrono::seconds(
                    profileJson.value("cooldown_seconds", static_cast<long long>(profile.cooldown.count())));
                RegisterRecovery(profile);
                ++recoveries;
            }
        }

        if (root.contains("liabilities") && root["liabilities"].is_array())
        {
            std::vector<std::string> catalog;
            for (const auto& entry : root["liabilities"])
            {
                if (entry.is_string() && !entry.get<std::string>().empty())
                {
                    catalog.push_back(entry.get<std::string>());
                }
            }
            if (!catalog.empty())
            {
                m_liabilityCatalog = std::move(catalog);
            }
            else
            {
                std::cout << "EffectCatalog: WARNING - Empty liability catalog ignored\n";
            }
        }

        m_acclimationThreshold = std::max(2, root.value("acclimation_threshold", m_acclimationThreshold));
        m_liabilityLossThreshold = std::max(1, root.value("liability_loss_threshold", m_liabilityLossThreshold));

        std::cout << "EffectCatalog: Loaded " << encounters << " encounter profiles and " << recoveries
                  << " recovery actions from " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "EffectCatalog: ERROR - Failed to load lucidity_effects.json: " << e.what() << "\n";
        return false;
    }
}
} // namespace lucidity::gameplay
