// VOTELOCK - Decay Checkpoint Engine
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Tracks linearly decaying voting weight per lock and per pool.
//
// Each lock contributes a point (bias, slope) whose value falls to zero at
// the lock's unlock time. The pool aggregate is a single point kept equal to
// the sum of its locks' values by scheduling, at every unlock epoch, the
// slope that stops decaying there. Advancing the aggregate therefore costs
// one step per elapsed week rather than one step per lock.

#ifndef VOTELOCK_VOTING_CHECKPOINT_H
#define VOTELOCK_VOTING_CHECKPOINT_H

#include <votelock/core/serialize.h>
#include <votelock/core/types.h>
#include <votelock/voting/params.h>
#include <votelock/voting/pool_registry.h>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace votelock {
namespace voting {

// ============================================================================
// Point
// ============================================================================

/// A linearly decaying quantity
struct Point {
    /// Value at lastUpdate
    FixedPoint bias{0};

    /// Decrease per second
    FixedPoint slope{0};

    /// Duration of the lock that first produced this slope
    Timestamp period{0};

    Timestamp lastUpdate{0};

    /// max(0, bias - slope * (t - lastUpdate)) for t >= lastUpdate
    FixedPoint ValueAt(Timestamp t) const;

    bool operator==(const Point& other) const {
        return bias == other.bias && slope == other.slope &&
               period == other.period && lastUpdate == other.lastUpdate;
    }
    bool operator!=(const Point& other) const { return !(*this == other); }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Point& point) {
    using votelock::Serialize;
    Serialize(s, point.bias);
    Serialize(s, point.slope);
    Serialize(s, point.period);
    Serialize(s, point.lastUpdate);
}

template<typename Stream>
void Unserialize(Stream& s, Point& point) {
    using votelock::Unserialize;
    Unserialize(s, point.bias);
    Unserialize(s, point.slope);
    Unserialize(s, point.period);
    Unserialize(s, point.lastUpdate);
    if (point.bias < 0 || point.slope < 0) {
        throw std::ios_base::failure("Unserialize(Point): negative bias or slope");
    }
}

/// Balance committed until end (supplied by the caller, never stored)
struct LockedBalance {
    FixedPoint amount{0};
    Timestamp end{0};
};

/// (owner, lock id)
using LockKey = std::pair<Address, LockId>;

/// Result of lock creation
struct LockCreationResult {
    VotingError error{VotingError::OK};
    LockId lockId{0};

    bool IsSuccess() const { return error == VotingError::OK; }

    static LockCreationResult Success(LockId id) {
        return {VotingError::OK, id};
    }

    static LockCreationResult Failure(VotingError err) {
        return {err, 0};
    }
};

// ============================================================================
// Decay Checkpoint Engine
// ============================================================================

/**
 * Owns the pool registry, global and user points, slope-change schedules
 * and point histories.
 *
 * Every mutator takes the current time explicitly and validates all of its
 * inputs before touching state. Not internally synchronized.
 */
class DecayCheckpointEngine {
public:
    DecayCheckpointEngine();

    // ========================================================================
    // Pools
    // ========================================================================

    PoolRegistry& GetPoolRegistry() { return registry_; }
    const PoolRegistry& GetPoolRegistry() const { return registry_; }

    // ========================================================================
    // Mutations
    // ========================================================================

    /// Roll the pool's global point forward to now without a lock change.
    /// now may not precede the pool's last checkpoint (STALE_TIMESTAMP).
    VotingError Checkpoint(PoolId poolId, Timestamp now);

    /// Allocate a lock id and add the lock's weight to the pool
    LockCreationResult NoteLockCreation(const Address& user, PoolId poolId,
                                        const FixedPoint& balance,
                                        Timestamp unlockTime, Timestamp now);

    /// Replace a live lock's balance, keeping its unlock time
    VotingError NoteLockBalanceChange(const Address& user, PoolId poolId, LockId lockId,
                                      const FixedPoint& oldBalance,
                                      const FixedPoint& newBalance,
                                      Timestamp unlockTime, Timestamp now);

    /// Move a lock's unlock time later
    VotingError NoteLockExtension(const Address& user, PoolId poolId, LockId lockId,
                                  const FixedPoint& balance,
                                  Timestamp oldUnlockTime, Timestamp newUnlockTime,
                                  Timestamp now);

    // ========================================================================
    // State Access
    // ========================================================================

    std::optional<Point> GetGlobalPoint(PoolId poolId) const;

    std::optional<Point> GetUserPoint(const Address& user, LockId lockId) const;

    /// Scheduled slope delta at an epoch (zero if none)
    FixedPoint GetSlopeChange(PoolId poolId, Timestamp epoch) const;

    /// Latest recorded global point with lastUpdate <= t
    std::optional<Point> FindGlobalPointAt(PoolId poolId, Timestamp t) const;

    /// Latest recorded user point with lastUpdate <= t
    std::optional<Point> FindUserPointAt(const Address& user, LockId lockId,
                                         Timestamp t) const;

    size_t GetGlobalHistorySize(PoolId poolId) const;

    LockId GetNextLockId() const { return nextLockId_; }

    /// Number of lock ids handed out so far
    uint64_t GetTotalLockCount() const { return nextLockId_ - FIRST_LOCK_ID; }

    // ========================================================================
    // Persistence
    // ========================================================================

    void Serialize(DataStream& s) const;

    /// Throws std::ios_base::failure on malformed input, including point
    /// histories that are not in increasing time order
    void Unserialize(DataStream& s);

private:
    /// Weight a lock contributes at now, or a zero point if it has ended
    static Point ComputeLockPoint(const PoolConfig& config, const LockedBalance& locked,
                                  Timestamp lockPeriod, Timestamp now);

    /**
     * The shared rolling + apply routine. key is null for a bare checkpoint.
     * Every new value is computed before anything is stored, so a
     * STALE_TIMESTAMP or ARITHMETIC_OVERFLOW result leaves state untouched.
     */
    VotingError CheckpointInternal(PoolId poolId, const PoolConfig& config,
                                   const LockKey* key,
                                   const LockedBalance& oldLocked,
                                   const LockedBalance& newLocked,
                                   Timestamp now);

    /// Advance a global point to now through the weekly schedule. The
    /// intermediate weekly points are appended to weekly.
    Point RollGlobalPoint(PoolId poolId, Timestamp now, std::vector<Point>& weekly) const;

    static void AppendHistory(std::vector<Point>& history, const Point& point);

    static std::optional<Point> FindAt(const std::vector<Point>& history, Timestamp t);

    PoolRegistry registry_;

    std::map<PoolId, Point> globalPoints_;
    std::map<PoolId, std::map<Timestamp, FixedPoint>> slopeChanges_;
    std::map<LockKey, Point> userPoints_;

    std::map<PoolId, std::vector<Point>> globalHistory_;
    std::map<LockKey, std::vector<Point>> userHistory_;

    LockId nextLockId_{FIRST_LOCK_ID};
};

} // namespace voting
} // namespace votelock

#endif // VOTELOCK_VOTING_CHECKPOINT_H
