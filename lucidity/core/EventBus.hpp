#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace lucidity::core
{
struct Event
{
    std::string name;
    std::string actorId;
    nlohmann::json payload = nlohmann::json::object();
};

/// Queued publish/subscribe transport used to push lucidity state to sessions.
/// Publish is safe from any thread; handlers only run inside DispatchQueued.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;

    void Subscribe(const std::string& eventName, Handler handler);
    void Publish(Event event);

    /// Runs handlers for everything queued so far. A throwing handler is logged
    /// and skipped; the remaining handlers still run.
    /// @return Number of events dispatched.
    std::size_t DispatchQueued();

    [[nodiscard]] std::size_t PendingCount() const;
    [[nodiscard]] std::size_t FailedHandlerCount() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<Handler>> m_handlers;
    std::queue<Event> m_queue;
    std::size_t m_failedHandlers = 0;
};
} // namespace lucidity::core
