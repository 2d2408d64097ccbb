#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "lucidity/core/Clock.hpp"
#include "lucidity/ledger/LedgerStore.hpp"

namespace lucidity::gameplay
{
/// Drain rates above this are treated as configuration mistakes and clamped.
constexpr double kMaxDrainRate = 10.0;

/// Per-minute flux for a location, optionally split by time of day.
/// Lookup order: the current period, then "all", then the global default.
struct FluxProfile
{
    std::optional<double> day;
    std::optional<double> night;
    std::optional<double> all;

    [[nodiscard]] double Resolve(bool isDay, double fallback) const;

    [[nodiscard]] static FluxProfile DayNight(double dayFlux, double nightFlux);
    [[nodiscard]] static FluxProfile Always(double flux);
};

struct FluxEnvironmentConfig
{
    double globalDefault = 0.0;
    std::unordered_map<std::string, FluxProfile> environmentDefaults;
    std::unordered_map<std::string, FluxProfile> subZoneOverrides;
    std::unordered_map<std::string, FluxProfile> zoneOverrides;
    std::unordered_map<std::string, FluxProfile> roomOverrides;
};

/// Converted world rule: a positive drain rate becomes negative flux.
struct WorldOverride
{
    std::string key;
    double drainRate = 0.0;
    double flux = 0.0;
};

struct BaseFluxResolution
{
    double baseFlux = 0.0;
    std::string source = "default";
    bool worldOverride = false;
    bool daytime = true;
};

/// Resolves the environmental base flux for a room at a given time.
class FluxEnvironment
{
public:
    FluxEnvironment();

    [[nodiscard]] static FluxEnvironmentConfig DefaultConfig();

    void SetConfig(FluxEnvironmentConfig config) { m_config = std::move(config); }
    [[nodiscard]] const FluxEnvironmentConfig& GetConfig() const { return m_config; }

    /// Replaces the tables with flux_environment.json merged over the defaults.
    /// @return False if the file is missing or malformed; current tables stay.
    bool LoadFromJson(const std::string& jsonPath);

    /// Reads world_overrides.json. A missing file is not an error; a malformed
    /// one returns false and leaves the current rules untouched.
    bool LoadWorldOverridesFromJson(const std::string& jsonPath);

    /// Registers a drain rate for a plane/zone/sub-zone path. Empty parts are wildcards.
    void SetWorldOverride(const std::string& plane, const std::string& zone, const std::string& subZone,
        double drainRate);
    void ClearWorldOverrides() { m_worldOverrides.clear(); }
    [[nodiscard]] std::size_t WorldOverrideCount() const { return m_worldOverrides.size(); }

    /// Most specific world rule for the room: exact, then plane|zone|*, then plane|*|*.
    [[nodiscard]] std::optional<WorldOverride> FindWorldOverride(const ledger::RoomDescriptor& room) const;

    /// Unknown rooms resolve to the global default.
    [[nodiscard]] BaseFluxResolution ResolveBaseFlux(const std::optional<ledger::RoomDescriptor>& room,
        core::TimePoint now) const;

    /// Day runs 06:00 to 17:59 UTC.
    [[nodiscard]] static bool IsDaytime(core::TimePoint now);

    [[nodiscard]] static std::string MakeOverrideKey(const std::string& plane, const std::string& zone,
        const std::string& subZone);

    /// Clamps the rate to kMaxDrainRate (logging the clamp) and negates it.
    [[nodiscard]] static double DrainRateToFlux(double drainRate);

private:
    [[nodiscard]] static WorldOverride MakeWorldOverride(const std::string& plane, const std::string& zone,
        const std::string& subZone, double drainRate);

    FluxEnvironmentConfig m_config;
    std::unordered_map<std::string, WorldOverride> m_worldOverrides;
};
} // namespace lucidity::gameplay
