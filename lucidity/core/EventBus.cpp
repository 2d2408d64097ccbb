#include "lucidity/core/EventBus.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace lucidity::core
{
void EventBus::Subscribe(const std::string& eventName, Handler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers[eventName].push_back(std::move(handler));
}

void EventBus::Publish(Event event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.push(std::move(event));
}

std::size_t EventBus::DispatchQueued()
{
    std::queue<Event> pending;
    std::unordered_map<std::string, std::vector<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::swap(pending, m_queue);
        handlers = m_handlers;
    }

    std::size_t dispatched = 0;
    std::size_t failed = 0;
    while (!pending.empty())
    {
        Event event = std::move(pending.front());
        pending.pop();
        ++dispatched;

        const auto it = handlers.find(event.name);
        if (it == handlers.end())
        {
            continue;
        }

        for (const Handler& handler : it->second)
        {
            try
            {
                handler(event);
            }
            catch (const std::exception& e)
            {
                ++failed;
                std::cerr << "[EventBus] Handler for '" << event.name << "' (actor " << event.actorId
                          << ") threw exception: " << e.what() << "\n";
            }
        }
    }

    if (failed > 0)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failedHandlers += failed;
    }
    return dispatched;
}

std::size_t EventBus::PendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::size_t EventBus::FailedHandlerCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failedHandlers;
}
} // namespace lucidity::core
