#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lucidity/ledger/LedgerStore.hpp"

namespace lucidity::ledger
{
/// Process-local ledger. Each actor has its own timed row lock; a single
/// table mutex guards the maps themselves and is never held while waiting
/// on a row lock.
class MemoryLedgerStore final : public LedgerStore
{
public:
    MemoryLedgerStore() = default;

    /// Adds a character to the world. Lucidity rows are created lazily.
    void RegisterActor(const ActorId& actorId, const std::string& locationId, TimePoint createdAt,
        std::optional<TimePoint> lastActiveAt = std::nullopt, int maxScore = kMaxScore);
    void TouchActivity(const ActorId& actorId, TimePoint when);

    [[nodiscard]] std::optional<LucidityRecord> GetRecord(const ActorId& actorId) const;
    [[nodiscard]] std::vector<AdjustmentLogEntry> AdjustmentLog(const ActorId& actorId) const;
    [[nodiscard]] std::size_t AdjustmentLogSize() const;

    StorageStatus BeginTransaction(const ActorId& actorId, std::chrono::milliseconds timeout,
        std::unique_ptr<ActorTransaction>& out) override;

    StorageStatus GetExposure(const ActorId& actorId, const std::string& archetype, ExposureState& out) override;
    StorageStatus IncrementExposure(const ActorId& actorId, const std::string& archetype, TimePoint now,
        ExposureState& out) override;

    StorageStatus GetCooldown(const ActorId& actorId, const std::string& actionCode, CooldownRecord& out) override;
    StorageStatus SetCooldown(const ActorId& actorId, const std::string& actionCode, TimePoint expiresAt) override;
    StorageStatus ClearCooldowns(const ActorId& actorId, const std::string& prefix, std::size_t& cleared) override;

    StorageStatus GetActorPresence(const ActorId& actorId, ActorPresence& out) override;
    StorageStatus ListActiveActors(TimePoint activeSince, TimePoint createdSince,
        std::vector<ActorPresence>& out) override;

    StorageStatus SetActorLocation(const ActorId& actorId, const std::string& locationId) override;

private:
    class Transaction;

    struct ActorRow
    {
        std::string locationId;
        TimePoint createdAt{};
        std::optional<TimePoint> lastActiveAt;
        int maxScore = kMaxScore;
        std::shared_ptr<std::timed_mutex> rowLock = std::make_shared<std::timed_mutex>();
    };

    [[nodiscard]] static std::string CompositeKey(const ActorId& actorId, const std::string& secondary);
    [[nodiscard]] ActorPresence MakePresence(const ActorId& actorId, const ActorRow& row) const;

    mutable std::mutex m_mutex;
    std::unordered_map<ActorId, ActorRow> m_actors;
    std::unordered_map<ActorId, LucidityRecord> m_records;
    std::vector<AdjustmentLogEntry> m_log;
    std::unordered_map<std::string, ExposureState> m_exposures;
    std::unordered_map<std::string, CooldownRecord> m_cooldowns;
};

/// Fixed room table, filled at startup.
class MemoryRoomDirectory final : public RoomDirectory
{
public:
    void AddRoom(const RoomDescriptor& room);

    [[nodiscard]] std::optional<RoomDescriptor> FindRoom(const std::string& roomId) const override;

    [[nodiscard]] std::size_t RoomCount() const { return m_rooms.size(); }

private:
    std::unordered_map<std::string, RoomDescriptor> m_rooms;
};
} // namespace lucidity::ledger
