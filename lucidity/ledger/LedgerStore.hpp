#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lucidity/ledger/LucidityTypes.hpp"

namespace lucidity::ledger
{
enum class StorageStatus : std::uint8_t
{
    Ok = 0,
    NotFound,   ///< Unknown actor, or no row for the requested key.
    Timeout,    ///< Lock or backend call exceeded its bound.
    Failed      ///< Backend rejected the operation.
};

[[nodiscard]] inline const char* StorageStatusToText(StorageStatus status)
{
    switch (status)
    {
        case StorageStatus::Ok: return "ok";
        case StorageStatus::NotFound: return "not_found";
        case StorageStatus::Timeout: return "timeout";
        case StorageStatus::Failed: return "failed";
        default: return "unknown";
    }
}

/// Exclusive read-modify-write scope over one actor's lucidity record.
/// Holds the actor's row lock for its lifetime; destroying it without a
/// successful SaveAdjustment leaves storage untouched.
class ActorTransaction
{
public:
    virtual ~ActorTransaction() = default;

    /// Loads the record, creating it at the starting score if the actor has none yet.
    virtual StorageStatus GetOrCreate(LucidityRecord& out) = 0;

    /// Writes the record and appends the log entry as one atomic unit.
    virtual StorageStatus SaveAdjustment(const LucidityRecord& record, const AdjustmentLogEntry& logEntry) = 0;
};

/// Persistence boundary for the lucidity ledger. Implementations own all
/// cross-caller mutual exclusion; callers hold no locks of their own.
class LedgerStore
{
public:
    virtual ~LedgerStore() = default;

    /// Opens a transaction on one actor, waiting at most `timeout` for the row lock.
    virtual StorageStatus BeginTransaction(const ActorId& actorId, std::chrono::milliseconds timeout,
        std::unique_ptr<ActorTransaction>& out) = 0;

    virtual StorageStatus GetExposure(const ActorId& actorId, const std::string& archetype, ExposureState& out) = 0;
    virtual StorageStatus IncrementExposure(const ActorId& actorId, const std::string& archetype, TimePoint now,
        ExposureState& out) = 0;

    /// NotFound means the action is not on cooldown.
    virtual StorageStatus GetCooldown(const ActorId& actorId, const std::string& actionCode, CooldownRecord& out) = 0;
    virtual StorageStatus SetCooldown(const ActorId& actorId, const std::string& actionCode, TimePoint expiresAt) = 0;

    /// Removes every cooldown whose action code starts with `prefix`.
    virtual StorageStatus ClearCooldowns(const ActorId& actorId, const std::string& prefix, std::size_t& cleared) = 0;

    virtual StorageStatus GetActorPresence(const ActorId& actorId, ActorPresence& out) = 0;

    /// Actors with activity at or after `activeSince`, created at or after
    /// `createdSince`, or never stamped active.
    virtual StorageStatus ListActiveActors(TimePoint activeSince, TimePoint createdSince,
        std::vector<ActorPresence>& out) = 0;

    virtual StorageStatus SetActorLocation(const ActorId& actorId, const std::string& locationId) = 0;
};

struct RoomDescriptor
{
    std::string roomId;
    std::string plane;
    std::string zone;
    std::string subZone;
    std::string environment;
};

/// Read-only view of world geography.
class RoomDirectory
{
public:
    virtual ~RoomDirectory() = default;

    [[nodiscard]] virtual std::optional<RoomDescriptor> FindRoom(const std::string& roomId) const = 0;
};
} // namespace lucidity::ledger
