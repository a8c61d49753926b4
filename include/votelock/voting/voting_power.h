// VOTELOCK - Voting Power Queries
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Read-only views over the checkpoint engine. Stored points are decayed to
// the requested time on the fly; nothing here mutates state.

#ifndef VOTELOCK_VOTING_VOTING_POWER_H
#define VOTELOCK_VOTING_VOTING_POWER_H

#include <votelock/core/types.h>
#include <votelock/voting/checkpoint.h>
#include <votelock/voting/params.h>

#include <optional>
#include <vector>

namespace votelock {
namespace voting {

/**
 * Query layer.
 *
 * Global power is the last persisted global point decayed linearly. Slope
 * changes scheduled since the last checkpoint are not applied, so the value
 * is exact only until the next scheduled epoch; Checkpoint() makes it exact.
 */
class VotingPowerQuery {
public:
    explicit VotingPowerQuery(const DecayCheckpointEngine& engine);

    // ========================================================================
    // Current Power
    // ========================================================================

    /// Lock's power at now; nullopt if the lock was never noted
    std::optional<FixedPoint> GetVotingPower(const Address& user, LockId lockId,
                                             Timestamp now) const;

    /// Pool's power at now; zero for a pool with no checkpoint yet
    FixedPoint GetGlobalVotingPower(PoolId poolId, Timestamp now) const;

    /// votingPower / globalVotingPower (SCALE-fixed), zero if the pool has no power
    std::optional<FixedPoint> GetVotingPowerShare(const Address& user, PoolId poolId,
                                                  LockId lockId, Timestamp now) const;

    /// Shares for several locks of one user; nullopt if any lock is unknown
    std::optional<std::vector<FixedPoint>> GetVotingPowerShareBatch(
        const Address& user, PoolId poolId,
        const std::vector<LockId>& lockIds, Timestamp now) const;

    // ========================================================================
    // Historical Power
    // ========================================================================

    /// Lock's power at t; nullopt if unknown lock or t > now
    std::optional<FixedPoint> GetVotingPowerAt(const Address& user, LockId lockId,
                                               Timestamp t, Timestamp now) const;

    /// Pool's power at t; nullopt if t > now
    std::optional<FixedPoint> GetGlobalVotingPowerAt(PoolId poolId, Timestamp t,
                                                     Timestamp now) const;

    // ========================================================================
    // Accessors
    // ========================================================================

    bool IsOpenPool(PoolId poolId) const;

    bool IsOnceNotedPoint(const Address& user, LockId lockId) const;

    /// Zero for an unconfigured pool
    Timestamp GetMaximumLockTime(PoolId poolId) const;

    /// Zero for an unconfigured pool
    FixedPoint GetMultiplier(PoolId poolId) const;

    /// Stored global point without decay (zero point if none)
    Point GetGlobalPoint(PoolId poolId) const;

    /// Stored user point without decay (zero point if none)
    Point GetUserPoint(const Address& user, LockId lockId) const;

private:
    const DecayCheckpointEngine& engine_;
};

/// share = power * SCALE / total, or zero when total is zero
FixedPoint ComputeShare(const FixedPoint& power, const FixedPoint& total);

} // namespace voting
} // namespace votelock

#endif // VOTELOCK_VOTING_VOTING_POWER_H
