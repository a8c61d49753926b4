// VOTELOCK - Voting Escrow Implementation
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <votelock/voting/escrow.h>
#include <votelock/core/fixed_point.h>
#include <votelock/core/serialize.h>
#include <votelock/util/logging.h>
#include <votelock/util/time.h>

#include <algorithm>
#include <ios>

namespace votelock {
namespace voting {

VotingEscrow::VotingEscrow()
    : VotingEscrow(Clock(&util::GetTime)) {}

VotingEscrow::VotingEscrow(Clock clock)
    : clock_(std::move(clock))
    , query_(engine_) {}

void VotingEscrow::SetClock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

void VotingEscrow::SetAuthorizer(Authorizer authorizer) {
    std::lock_guard<std::mutex> lock(mutex_);
    authorizer_ = std::move(authorizer);
}

Timestamp VotingEscrow::Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CurrentTime();
}

Timestamp VotingEscrow::CurrentTime() const {
    return clock_ ? clock_() : util::GetTime();
}

bool VotingEscrow::IsAuthorized(const Address& caller) const {
    if (authorizer_ && authorizer_(caller)) {
        return true;
    }
    LOG_DEBUG(util::LogCategory::DEFAULT) << "Rejected caller " << caller.ToHex() << ": "
                                          << VotingErrorToString(VotingError::UNAUTHORIZED);
    return false;
}

// ============================================================================
// Pool Configuration
// ============================================================================

VotingError VotingEscrow::ConfigureLocked(PoolId poolId, const FixedPoint& multiplier,
                                          Timestamp maxLockDuration) {
    VotingError err = engine_.GetPoolRegistry().Configure(poolId, multiplier, maxLockDuration);
    if (err != VotingError::OK) {
        LOG_DEBUG(util::LogCategory::POOL) << "Configure pool " << poolId << " rejected: "
                                           << VotingErrorToString(err);
    }
    return err;
}

VotingError VotingEscrow::Configure(const Address& caller, PoolId poolId,
                                    const FixedPoint& multiplier, Timestamp maxLockDuration) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsAuthorized(caller)) {
        return VotingError::UNAUTHORIZED;
    }
    return ConfigureLocked(poolId, multiplier, maxLockDuration);
}

VotingError VotingEscrow::ConfigurePools(const Address& caller,
                                         const std::vector<PoolDefinition>& definitions) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsAuthorized(caller)) {
        return VotingError::UNAUTHORIZED;
    }

    for (const auto& def : definitions) {
        VotingError err = ConfigureLocked(def.poolId, def.multiplier, def.maxLockDuration);
        if (err != VotingError::OK) {
            return err;
        }
    }

    LogInfoF(util::LogCategory::CONFIG, "Configured %zu pools from definitions",
             definitions.size());
    return VotingError::OK;
}

// ============================================================================
// Mutations
// ============================================================================

VotingError VotingEscrow::Checkpoint(PoolId poolId) {
    std::lock_guard<std::mutex> lock(mutex_);
    VotingError err = engine_.Checkpoint(poolId, CurrentTime());
    if (err != VotingError::OK) {
        LOG_DEBUG(util::LogCategory::CHECKPOINT) << "Checkpoint of pool " << poolId
                                                 << " rejected: " << VotingErrorToString(err);
    }
    return err;
}

LockCreationResult VotingEscrow::NoteLockCreation(const Address& caller, const Address& user,
                                                  PoolId poolId, const FixedPoint& balance,
                                                  Timestamp unlockTime) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsAuthorized(caller)) {
        return LockCreationResult::Failure(VotingError::UNAUTHORIZED);
    }

    LockCreationResult result =
        engine_.NoteLockCreation(user, poolId, balance, unlockTime, CurrentTime());

    if (result.IsSuccess()) {
        LOG_INFO(util::LogCategory::LOCK)
            << "Created lock " << result.lockId << " for " << user.ToHex()
            << " in pool " << poolId << ": " << FormatFixedPoint(balance)
            << " until " << util::FormatTimestamp(unlockTime);
    } else {
        LOG_DEBUG(util::LogCategory::LOCK) << "Lock creation in pool " << poolId
                                           << " rejected: " << VotingErrorToString(result.error);
    }
    return result;
}

VotingError VotingEscrow::NoteLockBalanceChange(const Address& caller, const Address& user,
                                                PoolId poolId, LockId lockId,
                                                const FixedPoint& oldBalance,
                                                const FixedPoint& newBalance,
                                                Timestamp unlockTime) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsAuthorized(caller)) {
        return VotingError::UNAUTHORIZED;
    }

    VotingError err = engine_.NoteLockBalanceChange(user, poolId, lockId, oldBalance,
                                                    newBalance, unlockTime, CurrentTime());
    if (err == VotingError::OK) {
        LOG_INFO(util::LogCategory::LOCK)
            << "Lock " << lockId << " balance " << FormatFixedPoint(oldBalance)
            << " -> " << FormatFixedPoint(newBalance);
    } else {
        LOG_DEBUG(util::LogCategory::LOCK) << "Balance change of lock " << lockId
                                           << " rejected: " << VotingErrorToString(err);
    }
    return err;
}

VotingError VotingEscrow::NoteLockExtension(const Address& caller, const Address& user,
                                            PoolId poolId, LockId lockId,
                                            const FixedPoint& balance,
                                            Timestamp oldUnlockTime, Timestamp newUnlockTime) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsAuthorized(caller)) {
        return VotingError::UNAUTHORIZED;
    }

    VotingError err = engine_.NoteLockExtension(user, poolId, lockId, balance,
                                                oldUnlockTime, newUnlockTime, CurrentTime());
    if (err == VotingError::OK) {
        LOG_INFO(util::LogCategory::LOCK)
            << "Lock " << lockId << " extended to " << util::FormatTimestamp(newUnlockTime);
    } else {
        LOG_DEBUG(util::LogCategory::LOCK) << "Extension of lock " << lockId
                                           << " rejected: " << VotingErrorToString(err);
    }
    return err;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<FixedPoint> VotingEscrow::GetVotingPower(const Address& user,
                                                       LockId lockId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetVotingPower(user, lockId, CurrentTime());
}

FixedPoint VotingEscrow::GetGlobalVotingPower(PoolId poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetGlobalVotingPower(poolId, CurrentTime());
}

std::optional<FixedPoint> VotingEscrow::GetVotingPowerShare(const Address& user,
                                                            PoolId poolId,
                                                            LockId lockId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetVotingPowerShare(user, poolId, lockId, CurrentTime());
}

std::optional<std::vector<FixedPoint>> VotingEscrow::GetVotingPowerShareBatch(
    const Address& user, PoolId poolId, const std::vector<LockId>& lockIds) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetVotingPowerShareBatch(user, poolId, lockIds, CurrentTime());
}

std::optional<FixedPoint> VotingEscrow::GetVotingPowerAt(const Address& user,
                                                         LockId lockId,
                                                         Timestamp t) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetVotingPowerAt(user, lockId, t, CurrentTime());
}

std::optional<FixedPoint> VotingEscrow::GetGlobalVotingPowerAt(PoolId poolId,
                                                               Timestamp t) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetGlobalVotingPowerAt(poolId, t, CurrentTime());
}

bool VotingEscrow::IsOpenPool(PoolId poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.IsOpenPool(poolId);
}

bool VotingEscrow::IsOnceNotedPoint(const Address& user, LockId lockId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.IsOnceNotedPoint(user, lockId);
}

Timestamp VotingEscrow::GetMaximumLockTime(PoolId poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetMaximumLockTime(poolId);
}

FixedPoint VotingEscrow::GetMultiplier(PoolId poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetMultiplier(poolId);
}

std::optional<PoolConfig> VotingEscrow::GetPoolConfig(PoolId poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.GetPoolRegistry().Get(poolId);
}

Point VotingEscrow::GetGlobalPoint(PoolId poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetGlobalPoint(poolId);
}

Point VotingEscrow::GetUserPoint(const Address& user, LockId lockId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_.GetUserPoint(user, lockId);
}

Timestamp VotingEscrow::GetEpochTime(Timestamp timestamp) const {
    return EpochAlign(timestamp);
}

uint64_t VotingEscrow::GetTotalLockCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.GetTotalLockCount();
}

// ============================================================================
// Snapshots
// ============================================================================

std::vector<uint8_t> VotingEscrow::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataStream s;
    s.Write(SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC));
    s << SNAPSHOT_VERSION;
    engine_.Serialize(s);

    LogDebugF(util::LogCategory::SNAPSHOT, "Serialized snapshot (%zu bytes)", s.size());
    return s.Data();
}

bool VotingEscrow::Deserialize(const std::vector<uint8_t>& data) {
    DataStream s(data);
    DecayCheckpointEngine restored;

    try {
        uint8_t magic[sizeof(SNAPSHOT_MAGIC)];
        s.Read(magic, sizeof(magic));
        if (!std::equal(magic, magic + sizeof(magic), SNAPSHOT_MAGIC)) {
            LOG_ERROR(util::LogCategory::SNAPSHOT) << "Snapshot rejected: bad magic";
            return false;
        }

        uint8_t version = 0;
        s >> version;
        if (version != SNAPSHOT_VERSION) {
            LOG_ERROR(util::LogCategory::SNAPSHOT) << "Snapshot rejected: unsupported version "
                                                   << static_cast<int>(version);
            return false;
        }

        restored.Unserialize(s);
    } catch (const std::ios_base::failure& e) {
        LOG_ERROR(util::LogCategory::SNAPSHOT) << "Snapshot rejected: " << e.what();
        return false;
    }

    if (!s.empty()) {
        LOG_ERROR(util::LogCategory::SNAPSHOT) << "Snapshot rejected: " << s.size()
                                               << " trailing bytes";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    engine_ = std::move(restored);

    LogInfoF(util::LogCategory::SNAPSHOT, "Restored snapshot: %zu pools, %llu locks",
             engine_.GetPoolRegistry().Size(),
             static_cast<unsigned long long>(engine_.GetTotalLockCount()));
    return true;
}

} // namespace voting
} // namespace votelock
