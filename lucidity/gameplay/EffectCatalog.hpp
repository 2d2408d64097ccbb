#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace lucidity::gameplay
{
/// Loss profile for one hostile-encounter category.
struct EncounterProfile
{
    std::string category;
    int firstTime = 0;
    int repeat = 0;
};

/// Recovery ritual: fixed gain plus the cooldown it puts on the action.
struct RecoveryProfile
{
    std::string actionCode;
    int delta = 0;
    std::chrono::seconds cooldown{0};
};

/// Encounter and recovery tables plus the liability economy knobs.
/// Populated once at startup and read-only afterwards.
class EffectCatalog
{
public:
    EffectCatalog();

    void InitializeDefaults();

    void RegisterEncounter(const EncounterProfile& profile);
    void RegisterRecovery(const RecoveryProfile& profile);

    /// Lookups are case-insensitive. Returns nullptr for unknown codes.
    [[nodiscard]] const EncounterProfile* FindEncounter(const std::string& category) const;
    [[nodiscard]] const RecoveryProfile* FindRecovery(const std::string& actionCode) const;

    [[nodiscard]] std::vector<std::string> EncounterCategories() const;
    [[nodiscard]] std::vector<std::string> RecoveryCodes() const;

    [[nodiscard]] const std::vector<std::string>& LiabilityCatalog() const { return m_liabilityCatalog; }
    [[nodiscard]] int AcclimationThreshold() const { return m_acclimationThreshold; }
    [[nodiscard]] int LiabilityLossThreshold() const { return m_liabilityLossThreshold; }

    /// Merges lucidity_effects.json over the current tables.
    /// @return False if the file is missing or malformed; defaults stay in place.
    bool LoadFromJson(const std::string& jsonPath);

private:
    std::unordered_map<std::string, EncounterProfile> m_encounters;
    std::unordered_map<std::string, RecoveryProfile> m_recoveries;
    std::vector<std::string> m_liabilityCatalog;
    int m_acclimationThreshold = 6;
    int m_liabilityLossThreshold = 15;
};
} // namespace lucidity::gameplay
