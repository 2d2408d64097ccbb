#include "lucidity/ledger/MemoryLedgerStore.hpp"

#include <utility>

#include "lucidity/ledger/TierResolver.hpp"

namespace lucidity::ledger
{
class MemoryLedgerStore::Transaction final : public ActorTransaction
{
public:
    Transaction(MemoryLedgerStore& store, ActorId actorId, std::shared_ptr<std::timed_mutex> rowLock)
        : m_store(store)
        , m_actorId(std::move(actorId))
        , m_rowLock(std::move(rowLock))
        , m_guard(*m_rowLock, std::adopt_lock)
    {
    }

    StorageStatus GetOrCreate(LucidityRecord& out) override
    {
        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        if (!m_store.m_actors.contains(m_actorId))
        {
            return StorageStatus::NotFound;
        }

        const auto it = m_store.m_records.find(m_actorId);
        if (it != m_store.m_records.end())
        {
            out = it->second;
            return StorageStatus::Ok;
        }

        out = LucidityRecord{};
        out.actorId = m_actorId;
        out.score = kStartingScore;
        out.tier = ResolveTier(kStartingScore);
        return StorageStatus::Ok;
    }

    StorageStatus SaveAdjustment(const LucidityRecord& record, const AdjustmentLogEntry& logEntry) override
    {
        if (record.actorId != m_actorId || logEntry.actorId != m_actorId)
        {
            return StorageStatus::Failed;
        }

        std::lock_guard<std::mutex> lock(m_store.m_mutex);
        if (!m_store.m_actors.contains(m_actorId))
        {
            return StorageStatus::NotFound;
        }
        m_store.m_log.reserve(m_store.m_log.size() + 1);
        m_store.m_records[m_actorId] = record;
        m_store.m_log.push_back(logEntry);
        return StorageStatus::Ok;
    }

private:
    MemoryLedgerStore& m_store;
    ActorId m_actorId;
    std::shared_ptr<std::timed_mutex> m_rowLock;
    std::unique_lock<std::timed_mutex> m_guard;
};

void MemoryLedgerStore::RegisterActor(const ActorId& actorId, const std::string& locationId, TimePoint createdAt,
    std::optional<TimePoint> lastActiveAt, int maxScore)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ActorRow& row = m_actors[actorId];
    row.locationId = locationId;
    row.createdAt = createdAt;
    row.lastActiveAt = lastActiveAt;
    row.maxScore = maxScore;
}

void MemoryLedgerStore::TouchActivity(const ActorId& actorId, TimePoint when)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_actors.find(actorId);
    if (it != m_actors.end())
    {
        it->second.lastActiveAt = when;
    }
}

std::optional<LucidityRecord> MemoryLedgerStore::GetRecord(const ActorId& actorId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_records.find(actorId);
    if (it == m_records.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AdjustmentLogEntry> MemoryLedgerStore::AdjustmentLog(const ActorId& actorId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AdjustmentLogEntry> entries;
    for (const AdjustmentLogEntry& entry : m_log)
    {
        if (entry.actorId == actorId)
        {
            entries.push_back(entry);
        }
    }
    return entries;
}

std::size_t MemoryLedgerStore::AdjustmentLogSize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_log.size();
}

StorageStatus MemoryLedgerStore::BeginTransaction(const ActorId& actorId, std::chrono::milliseconds timeout,
    std::unique_ptr<ActorTransaction>& out)
{
    std::shared_ptr<std::timed_mutex> rowLock;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_actors.find(actorId);
        if (it == m_actors.end())
        {
            return StorageStatus::NotFound;
        }
        rowLock = it->second.rowLock;
    }

    if (!rowLock->try_lock_for(timeout))
    {
        return StorageStatus::Timeout;
    }

    out = std::make_unique<Transaction>(*this, actorId, std::move(rowLock));
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::GetExposure(const ActorId& actorId, const std::string& archetype, ExposureState& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_exposures.find(CompositeKey(actorId, archetype));
    if (it == m_exposures.end())
    {
        return StorageStatus::NotFound;
    }
    out = it->second;
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::IncrementExposure(const ActorId& actorId, const std::string& archetype,
    TimePoint now, ExposureState& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_actors.contains(actorId))
    {
        return StorageStatus::NotFound;
    }

    ExposureState& exposure = m_exposures[CompositeKey(actorId, archetype)];
    if (exposure.encounterCount == 0)
    {
        exposure.actorId = actorId;
        exposure.archetype = archetype;
    }
    ++exposure.encounterCount;
    exposure.lastEncounterAt = now;
    out = exposure;
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::GetCooldown(const ActorId& actorId, const std::string& actionCode,
    CooldownRecord& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_cooldowns.find(CompositeKey(actorId, actionCode));
    if (it == m_cooldowns.end())
    {
        return StorageStatus::NotFound;
    }
    out = it->second;
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::SetCooldown(const ActorId& actorId, const std::string& actionCode,
    TimePoint expiresAt)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_actors.contains(actorId))
    {
        return StorageStatus::NotFound;
    }
    m_cooldowns[CompositeKey(actorId, actionCode)] = CooldownRecord{actorId, actionCode, expiresAt};
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::ClearCooldowns(const ActorId& actorId, const std::string& prefix,
    std::size_t& cleared)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    cleared = 0;
    for (auto it = m_cooldowns.begin(); it != m_cooldowns.end();)
    {
        const CooldownRecord& cooldown = it->second;
        if (cooldown.actorId == actorId && cooldown.actionCode.starts_with(prefix))
        {
            it = m_cooldowns.erase(it);
            ++cleared;
        }
        else
        {
            ++it;
        }
    }
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::GetActorPresence(const ActorId& actorId, ActorPresence& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_actors.find(actorId);
    if (it == m_actors.end())
    {
        return StorageStatus::NotFound;
    }
    out = MakePresence(actorId, it->second);
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::ListActiveActors(TimePoint activeSince, TimePoint createdSince,
    std::vector<ActorPresence>& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    out.clear();
    for (const auto& [actorId, row] : m_actors)
    {
        const bool neverActive = !row.lastActiveAt.has_value();
        const bool recentlyActive = row.lastActiveAt.has_value() && *row.lastActiveAt >= activeSince;
        const bool recentlyCreated = row.createdAt >= createdSince;
        if (neverActive || recentlyActive || recentlyCreated)
        {
            out.push_back(MakePresence(actorId, row));
        }
    }
    return StorageStatus::Ok;
}

StorageStatus MemoryLedgerStore::SetActorLocation(const ActorId& actorId, const std::string& locationId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_actors.find(actorId);
    if (it == m_actors.end())
    {
        return StorageStatus::NotFound;
    }
    it->second.locationId = locationId;
    return StorageStatus::Ok;
}

std::string MemoryLedgerStore::CompositeKey(const ActorId& actorId, const std::string& secondary)
{
    std::string key;
    key.reserve(actorId.size() + secondary.size() + 1);
    key.append(actorId);
    key.push_back('\x1f');
    key.append(secondary);
    return key;
}

ActorPresence MemoryLedgerStore::MakePresence(const ActorId& actorId, const ActorRow& row) const
{
    ActorPresence presence;
    presence.actorId = actorId;
    presence.locationId = row.locationId;
    presence.lastActiveAt = row.lastActiveAt;
    presence.createdAt = row.createdAt;
    presence.maxScore = row.maxScore;

    const auto record = m_records.find(actorId);
    presence.tier = record != m_records.end() ? record->second.tier : Tier::Stable;
    return presence;
}

void MemoryRoomDirectory::AddRoom(const RoomDescriptor& room)
{
    m_rooms[room.roomId] = room;
}

std::optional<RoomDescriptor> MemoryRoomDirectory::FindRoom(const std::string& roomId) const
{
    const auto it = m_rooms.find(roomId);
    if (it == m_rooms.end())
    {
        return std::nullopt;
    }
    return it->second;
}
} // namespace lucidity::ledger
