#include "lucidity/core/Clock.hpp"

#include <algorithm>

namespace lucidity::core
{
ManualClock::ManualClock(TimePoint start)
    : m_now(start)
{
}

TimePoint ManualClock::Now() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

void ManualClock::Set(TimePoint now)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now = now;
}

void ManualClock::Advance(std::chrono::system_clock::duration amount)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now += amount;
}

CadenceCounter::CadenceCounter(std::uint32_t ticksPerCadence)
    : m_ticksPerCadence(std::max<std::uint32_t>(1, ticksPerCadence))
{
}

void CadenceCounter::SetTicksPerCadence(std::uint32_t ticksPerCadence)
{
    m_ticksPerCadence = std::max<std::uint32_t>(1, ticksPerCadence);
}

bool CadenceCounter::ShouldFire(std::uint64_t tickCount) const
{
    return m_ticksPerCadence <= 1 || tickCount % m_ticksPerCadence == 0;
}

int UtcHourOfDay(TimePoint time)
{
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    constexpr long long kSecondsPerDay = 24LL * 60LL * 60LL;
    long long secondsOfDay = sinceEpoch % kSecondsPerDay;
    if (secondsOfDay < 0)
    {
        secondsOfDay += kSecondsPerDay;
    }
    return static_cast<int>(secondsOfDay / 3600LL);
}

double ToUnixSeconds(TimePoint time)
{
    return std::chrono::duration<double>(time.time_since_epoch()).count();
}
} // namespace lucidity::core
