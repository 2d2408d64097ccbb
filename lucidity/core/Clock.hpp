#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace lucidity::core
{
using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;

/// Wall-clock source shared by every lucidity service.
/// Injected so tests can drive cadences and cooldowns deterministically.
class Clock
{
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock
{
public:
    [[nodiscard]] TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

/// Clock that only moves when told to.
class ManualClock final : public Clock
{
public:
    explicit ManualClock(TimePoint start = TimePoint{});

    [[nodiscard]] TimePoint Now() const override;

    void Set(TimePoint now);
    void Advance(std::chrono::system_clock::duration amount);

private:
    mutable std::mutex m_mutex;
    TimePoint m_now;
};

/// Counts world ticks and reports when a cadence boundary is reached.
class CadenceCounter
{
public:
    explicit CadenceCounter(std::uint32_t ticksPerCadence = 6);

    void SetTicksPerCadence(std::uint32_t ticksPerCadence);

    [[nodiscard]] bool ShouldFire(std::uint64_t tickCount) const;

    [[nodiscard]] std::uint32_t TicksPerCadence() const { return m_ticksPerCadence; }

private:
    std::uint32_t m_ticksPerCadence;
};

/// UTC hour of day (0-23) for the given time point.
[[nodiscard]] int UtcHourOfDay(TimePoint time);

[[nodiscard]] double ToUnixSeconds(TimePoint time);
} // namespace lucidity::core
