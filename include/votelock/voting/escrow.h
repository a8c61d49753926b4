// VOTELOCK - Voting Escrow
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Thread-safe entry point to the voting power engine.
//
// Key features:
// - Pool configuration (directly or from [pool.<id>] config sections)
// - Lock creation, balance change and extension notes
// - Current and historical voting power queries
// - Snapshot serialization of the whole engine state
// - Pluggable clock and caller authorization

#ifndef VOTELOCK_VOTING_ESCROW_H
#define VOTELOCK_VOTING_ESCROW_H

#include <votelock/core/types.h>
#include <votelock/voting/checkpoint.h>
#include <votelock/voting/params.h>
#include <votelock/voting/pool_registry.h>
#include <votelock/voting/voting_power.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace votelock {
namespace voting {

/// Snapshot header
constexpr uint8_t SNAPSHOT_MAGIC[4] = {'V', 'L', 'C', 'K'};
constexpr uint8_t SNAPSHOT_VERSION = 1;

/**
 * Voting escrow.
 *
 * Every call holds one mutex, so mutations to a pool never interleave and
 * readers only see states between complete mutations. Mutations other than
 * Checkpoint require the caller to pass the installed authorizer; with no
 * authorizer they all fail with UNAUTHORIZED.
 */
class VotingEscrow {
public:
    using Clock = std::function<Timestamp()>;
    using Authorizer = std::function<bool(const Address&)>;

    /// Uses util::GetTime as the clock
    VotingEscrow();

    explicit VotingEscrow(Clock clock);

    VotingEscrow(const VotingEscrow&) = delete;
    VotingEscrow& operator=(const VotingEscrow&) = delete;

    void SetClock(Clock clock);
    void SetAuthorizer(Authorizer authorizer);

    /// Current time according to the installed clock
    Timestamp Now() const;

    // ========================================================================
    // Pool Configuration
    // ========================================================================

    VotingError Configure(const Address& caller, PoolId poolId,
                          const FixedPoint& multiplier, Timestamp maxLockDuration);

    /// Configure pools in order, stopping at the first failure
    VotingError ConfigurePools(const Address& caller,
                               const std::vector<PoolDefinition>& definitions);

    // ========================================================================
    // Mutations
    // ========================================================================

    /// Roll the pool's aggregate to now. Not gated.
    VotingError Checkpoint(PoolId poolId);

    LockCreationResult NoteLockCreation(const Address& caller, const Address& user,
                                        PoolId poolId, const FixedPoint& balance,
                                        Timestamp unlockTime);

    VotingError NoteLockBalanceChange(const Address& caller, const Address& user,
                                      PoolId poolId, LockId lockId,
                                      const FixedPoint& oldBalance,
                                      const FixedPoint& newBalance,
                                      Timestamp unlockTime);

    VotingError NoteLockExtension(const Address& caller, const Address& user,
                                  PoolId poolId, LockId lockId,
                                  const FixedPoint& balance,
                                  Timestamp oldUnlockTime, Timestamp newUnlockTime);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<FixedPoint> GetVotingPower(const Address& user, LockId lockId) const;

    FixedPoint GetGlobalVotingPower(PoolId poolId) const;

    std::optional<FixedPoint> GetVotingPowerShare(const Address& user, PoolId poolId,
                                                  LockId lockId) const;

    std::optional<std::vector<FixedPoint>> GetVotingPowerShareBatch(
        const Address& user, PoolId poolId, const std::vector<LockId>& lockIds) const;

    std::optional<FixedPoint> GetVotingPowerAt(const Address& user, LockId lockId,
                                               Timestamp t) const;

    std::optional<FixedPoint> GetGlobalVotingPowerAt(PoolId poolId, Timestamp t) const;

    bool IsOpenPool(PoolId poolId) const;
    bool IsOnceNotedPoint(const Address& user, LockId lockId) const;
    Timestamp GetMaximumLockTime(PoolId poolId) const;
    FixedPoint GetMultiplier(PoolId poolId) const;
    std::optional<PoolConfig> GetPoolConfig(PoolId poolId) const;
    Point GetGlobalPoint(PoolId poolId) const;
    Point GetUserPoint(const Address& user, LockId lockId) const;

    /// Start of the epoch containing timestamp
    Timestamp GetEpochTime(Timestamp timestamp) const;

    uint64_t GetTotalLockCount() const;

    // ========================================================================
    // Snapshots
    // ========================================================================

    std::vector<uint8_t> Serialize() const;

    /// Replace all state from a snapshot. On failure state is unchanged.
    bool Deserialize(const std::vector<uint8_t>& data);

private:
    // The helpers below expect mutex_ to be held
    bool IsAuthorized(const Address& caller) const;
    Timestamp CurrentTime() const;
    VotingError ConfigureLocked(PoolId poolId, const FixedPoint& multiplier,
                                Timestamp maxLockDuration);

    mutable std::mutex mutex_;

    Clock clock_;
    Authorizer authorizer_;

    DecayCheckpointEngine engine_;
    VotingPowerQuery query_;
};

} // namespace voting
} // namespace votelock

#endif // VOTELOCK_VOTING_ESCROW_H
