#include "lucidity/gameplay/FluxEnvironment.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

namespace lucidity::gameplay
{
namespace
{
constexpr int kDayStartHour = 6;
constexpr int kDayEndHour = 18;

std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::optional<double> ReadNumber(const nlohmann::json& object, const char* key)
{
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number())
    {
        return std::nullopt;
    }
    return it->get<double>();
}

std::optional<FluxProfile> ParseProfile(const nlohmann::json& value)
{
    if (value.is_number())
    {
        return FluxProfile::Always(value.get<double>());
    }
    if (!value.is_object())
    {
        return std::nullopt;
    }

    FluxProfile profile;
    profile.day = ReadNumber(value, "day");
    profile.night = ReadNumber(value, "night");
    profile.all = ReadNumber(value, "all");
    if (!profile.day && !profile.night && !profile.all)
    {
        return std::nullopt;
    }
    return profile;
}

int MergeTable(const nlohmann::json& root, const char* key, bool lowerKeys,
    std::unordered_map<std::string, FluxProfile>& table)
{
    if (!root.contains(key) || !root[key].is_object())
    {
        return 0;
    }

    int merged = 0;
    for (const auto& [name, value] : root[key].items())
    {
        const std::optional<FluxProfile> profile = ParseProfile(value);
        if (!profile.has_value())
        {
            std::cout << "FluxEnvironment: WARNING - Ignoring malformed profile '" << name << "' in " << key << "\n";
            continue;
        }
        table[lowerKeys ? ToLower(name) : name] = *profile;
        ++merged;
    }
    return merged;
}

std::optional<double> ExtractDrainRate(const nlohmann::json& entry)
{
    if (const std::optional<double> rate = ReadNumber(entry, "lucidity_drain_rate"))
    {
        return rate;
    }
    const auto rules = entry.find("special_rules");
    if (rules != entry.end() && rules->is_object())
    {
        return ReadNumber(*rules, "lucidity_drain_rate");
    }
    return std::nullopt;
}
}

double FluxProfile::Resolve(bool isDay, double fallback) const
{
    const std::optional<double>& period = isDay ? day : night;
    if (period.has_value())
    {
        return *period;
    }
    if (all.has_value())
    {
        return *all;
    }
    return fallback;
}

FluxProfile FluxProfile::DayNight(double dayFlux, double nightFlux)
{
    FluxProfile profile;
    profile.day = dayFlux;
    profile.night = nightFlux;
    return profile;
}

FluxProfile FluxProfile::Always(double flux)
{
    FluxProfile profile;
    profile.all = flux;
    return profile;
}

FluxEnvironment::FluxEnvironment()
    : m_config(DefaultConfig())
{
}

FluxEnvironmentConfig FluxEnvironment::DefaultConfig()
{
    FluxEnvironmentConfig config;
    config.globalDefault = 0.0;

    auto& env = config.environmentDefaults;
    env["sun_sanctuary"] = FluxProfile::DayNight(0.6, 0.3);
    env["sanctuary"] = FluxProfile::DayNight(0.6, 0.3);
    env["temple"] = FluxProfile::DayNight(0.6, 0.3);
    env["safehouse"] = FluxProfile::DayNight(0.6, 0.3);
    env["street_paved"] = FluxProfile::DayNight(0.2, 0.0);
    env["camp"] = FluxProfile::DayNight(0.2, 0.2);
    env["graveyard"] = FluxProfile::DayNight(-0.4, -0.8);
    env["haunted"] = FluxProfile::DayNight(-0.4, -0.8);
    env["eldritch"] = FluxProfile::DayNight(-1.2, -1.5);
    env["storm"] = FluxProfile::DayNight(-0.3, -0.3);
    env["forsaken"] = FluxProfile::DayNight(-0.5, -0.2);
    env["indoors"] = FluxProfile::DayNight(0.0, 0.0);
    env["outdoors"] = FluxProfile::DayNight(0.0, 0.0);

    config.subZoneOverrides["sanitarium"] = FluxProfile::Always(-0.5);
    return config;
}

bool FluxEnvironment::LoadFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "FluxEnvironment: WARNING - Could not open flux_environment.json at '" << jsonPath << "'\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "FluxEnvironment: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        FluxEnvironmentConfig config = m_config;
        if (const std::optional<double> fallback = ReadNumber(root, "default"))
        {
            config.globalDefault = *fallback;
        }

        int profiles = 0;
        profiles += MergeTable(root, "environment_defaults", true, config.environmentDefaults);
        profiles += MergeTable(root, "sub_zone_overrides", true, config.subZoneOverrides);
        profiles += MergeTable(root, "zone_overrides", true, config.zoneOverrides);
        profiles += MergeTable(root, "room_overrides", false, config.roomOverrides);

        m_config = std::move(config);
        std::cout << "FluxEnvironment: Loaded " << profiles << " flux profiles from " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "FluxEnvironment: ERROR - Failed to load flux_environment.json: " << e.what() << "\n";
        return false;
    }
}

bool FluxEnvironment::LoadWorldOverridesFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "[FluxEnvironment] No world overrides at '" << jsonPath << "'\n";
        return true;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "FluxEnvironment: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        if (!root.contains("overrides") || !root["overrides"].is_array())
        {
            std::cout << "FluxEnvironment: WARNING - No 'overrides' array found in JSON\n";
            return false;
        }

        std::unordered_map<std::string, WorldOverride> overrides = m_worldOverrides;
        int loaded = 0;
        for (const auto& entry : root["overrides"])
        {
            if (!entry.is_object())
            {
                continue;
            }

            const std::string path = entry.value("path", "");
            const std::optional<double> rate = ExtractDrainRate(entry);
            if (path.empty() || !rate.has_value())
            {
                continue;
            }

            std::string parts[3];
            std::size_t part = 0;
            std::size_t begin = 0;
            while (part < 3)
            {
                const std::size_t slash = path.find('/', begin);
                parts[part++] = path.substr(begin, slash == std::string::npos ? std::string::npos : slash - begin);
                if (slash == std::string::npos)
                {
                    break;
                }
                begin = slash + 1;
            }

            WorldOverride rule = MakeWorldOverride(parts[0], parts[1], parts[2], *rate);
            overrides[rule.key] = std::move(rule);
            ++loaded;
        }

        m_worldOverrides = std::move(overrides);

        std::cout << "FluxEnvironment: Loaded " << loaded << " world overrides from " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "FluxEnvironment: ERROR - Failed to load world_overrides.json: " << e.what() << "\n";
        return false;
    }
}

void FluxEnvironment::SetWorldOverride(const std::string& plane, const std::string& zone, const std::string& subZone,
    double drainRate)
{
    WorldOverride rule = MakeWorldOverride(plane, zone, subZone, drainRate);
    m_worldOverrides[rule.key] = std::move(rule);
}

WorldOverride FluxEnvironment::MakeWorldOverride(const std::string& plane, const std::string& zone,
    const std::string& subZone, double drainRate)
{
    WorldOverride rule;
    rule.key = MakeOverrideKey(plane, zone, subZone);
    rule.drainRate = drainRate;
    rule.flux = DrainRateToFlux(drainRate);
    return rule;
}

std::optional<WorldOverride> FluxEnvironment::FindWorldOverride(const ledger::RoomDescriptor& room) const
{
    if (m_worldOverrides.empty())
    {
        return std::nullopt;
    }

    const std::string keys[] = {
        MakeOverrideKey(room.plane, room.zone, room.subZone),
        MakeOverrideKey(room.plane, room.zone, ""),
        MakeOverrideKey(room.plane, "", ""),
    };
    for (const std::string& key : keys)
    {
        const auto it = m_worldOverrides.find(key);
        if (it != m_worldOverrides.end())
        {
            return it->second;
        }
    }
    return std::nullopt;
}

BaseFluxResolution FluxEnvironment::ResolveBaseFlux(const std::optional<ledger::RoomDescriptor>& room,
    core::TimePoint now) const
{
    BaseFluxResolution resolution;
    resolution.daytime = IsDaytime(now);
    resolution.baseFlux = m_config.globalDefault;
    resolution.source = "default";

    if (!room.has_value())
    {
        return resolution;
    }

    const bool day = resolution.daytime;
    const double fallback = m_config.globalDefault;
    const std::string subZone = ToLower(room->subZone);
    const std::string zone = ToLower(room->zone);
    const std::string environment = ToLower(room->environment);

    if (const auto roomIt = m_config.roomOverrides.find(room->roomId); roomIt != m_config.roomOverrides.end())
    {
        resolution.baseFlux = roomIt->second.Resolve(day, fallback);
        resolution.source = "room:" + room->roomId;
    }
    else if (const auto subZoneIt = m_config.subZoneOverrides.find(subZone);
        !subZone.empty() && subZoneIt != m_config.subZoneOverrides.end())
    {
        resolution.baseFlux = subZoneIt->second.Resolve(day, fallback);
        resolution.source = "sub_zone:" + room->subZone;
    }
    else if (const auto zoneIt = m_config.zoneOverrides.find(zone); !zone.empty() && zoneIt != m_config.zoneOverrides.end())
    {
        resolution.baseFlux = zoneIt->second.Resolve(day, fallback);
        resolution.source = "zone:" + room->zone;
    }
    else if (const auto envIt = m_config.environmentDefaults.find(environment);
        !environment.empty() && envIt != m_config.environmentDefaults.end())
    {
        resolution.baseFlux = envIt->second.Resolve(day, fallback);
        resolution.source = "environment:" + room->environment;
    }

    if (const std::optional<WorldOverride> rule = FindWorldOverride(*room))
    {
        resolution.baseFlux = rule->flux;
        resolution.source = "lucidity_rule:" + rule->key;
        resolution.worldOverride = true;
    }
    return resolution;
}

bool FluxEnvironment::IsDaytime(core::TimePoint now)
{
    const int hour = core::UtcHourOfDay(now);
    return hour >= kDayStartHour && hour < kDayEndHour;
}

std::string FluxEnvironment::MakeOverrideKey(const std::string& plane, const std::string& zone,
    const std::string& subZone)
{
    const auto part = [](const std::string& value) { return value.empty() ? std::string("*") : ToLower(value); };
    return part(plane) + "|" + part(zone) + "|" + part(subZone);
}

double FluxEnvironment::DrainRateToFlux(double drainRate)
{
    double rate = drainRate;
    if (rate > kMaxDrainRate)
    {
        std::cerr << "FluxEnvironment: ERROR - Drain rate " << rate << " exceeds " << kMaxDrainRate
                  << ", clamping (likely a configuration error)\n";
        rate = kMaxDrainRate;
    }
    return -rate;
}
} // namespace lucidity::gameplay
