#include "lucidity/gameplay/LucidityNotifier.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

#include "lucidity/ledger/LiabilityCodec.hpp"

namespace lucidity::gameplay
{
namespace
{
std::string Trimmed(const std::string& text)
{
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}
}

LucidityNotifier::LucidityNotifier(core::EventBus* bus)
    : m_bus(bus)
{
}

void LucidityNotifier::PublishStateChange(const StateChangeNotice& notice)
{
    core::Event event;
    event.name = kStateChangedEvent;
    event.actorId = notice.actorId;
    event.payload = {
        {"actor_id", notice.actorId},
        {"current_lcd", std::min(notice.score, notice.maxScore)},
        {"max_lcd", notice.maxScore},
        {"delta", notice.delta},
        {"tier", ledger::TierToId(notice.tier)},
        {"liabilities", ledger::EncodeLiabilities(notice.liabilities)},
        {"reason", notice.reason},
        {"source", notice.source.has_value() ? nlohmann::json(*notice.source) : nlohmann::json(nullptr)},
        {"metadata", notice.metadata.empty() ? nlohmann::json(nullptr) : notice.metadata},
    };
    Publish(std::move(event));
}

void LucidityNotifier::PublishCrisis(const ledger::ActorId& actorId, int score, const char* status,
    const std::string& message)
{
    core::Event event;
    event.name = kCrisisEvent;
    event.actorId = actorId;
    event.payload = {
        {"actor_id", actorId},
        {"current_lcd", score},
        {"status", status},
        {"message", message},
    };
    Publish(std::move(event));
}

void LucidityNotifier::PublishHallucination(const ledger::ActorId& actorId, ledger::Tier tier,
    const std::string& locationId)
{
    core::Event event;
    event.name = kHallucinationEvent;
    event.actorId = actorId;
    event.payload = {
        {"actor_id", actorId},
        {"tier", ledger::TierToId(tier)},
        {"room_id", locationId},
    };
    Publish(std::move(event));
}

std::optional<std::string> LucidityNotifier::ResolveSource(const nlohmann::json& metadata,
    const std::optional<std::string>& locationId)
{
    if (metadata.is_object())
    {
        for (const char* key : {"source", "encounter_category", "environment"})
        {
            const auto it = metadata.find(key);
            if (it != metadata.end() && it->is_string())
            {
                const std::string value = Trimmed(it->get<std::string>());
                if (!value.empty())
                {
                    return value;
                }
            }
        }
    }

    if (locationId.has_value())
    {
        const std::string value = Trimmed(*locationId);
        if (!value.empty())
        {
            return value;
        }
    }
    return std::nullopt;
}

void LucidityNotifier::Publish(core::Event event)
{
    if (m_bus == nullptr)
    {
        return;
    }

    try
    {
        m_bus->Publish(std::move(event));
    }
    catch (const std::exception& e)
    {
        std::cerr << "LucidityNotifier: ERROR - Failed to publish event: " << e.what() << "\n";
    }
}
} // namespace lucidity::gameplay
