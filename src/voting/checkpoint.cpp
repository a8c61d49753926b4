// VOTELOCK - Decay Checkpoint Engine Implementation
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <votelock/voting/checkpoint.h>
#include <votelock/core/fixed_point.h>
#include <votelock/util/logging.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace votelock {
namespace voting {

// ============================================================================
// Point
// ============================================================================

FixedPoint Point::ValueAt(Timestamp t) const {
    FixedPoint elapsed = t > lastUpdate ? FixedPoint(t - lastUpdate) : FixedPoint(0);
    return LinearDecay(bias, slope, elapsed);
}

std::string Point::ToString() const {
    std::ostringstream ss;
    ss << "Point(bias=" << bias
       << ", slope=" << slope
       << ", period=" << period
       << ", lastUpdate=" << lastUpdate << ")";
    return ss.str();
}

// ============================================================================
// DecayCheckpointEngine
// ============================================================================

DecayCheckpointEngine::DecayCheckpointEngine() = default;

Point DecayCheckpointEngine::ComputeLockPoint(const PoolConfig& config,
                                              const LockedBalance& locked,
                                              Timestamp lockPeriod, Timestamp now) {
    Point point;
    point.period = lockPeriod;
    point.lastUpdate = now;

    if (locked.end <= now || locked.amount <= 0) {
        return point;
    }

    FixedPoint maxLock(config.maxLockDuration);
    FixedPoint rawSlope = locked.amount / maxLock;

    // Truncates twice, in this order: weight = multiplier * period / maxLock,
    // then slope = rawSlope * weight / SCALE. Stored points depend on it.
    FixedPoint weight = config.multiplier * FixedPoint(lockPeriod) / maxLock;
    point.slope = ClampNonNegative(rawSlope * weight / SCALE);

    point.bias = point.slope * FixedPoint(locked.end - now);
    return point;
}

void DecayCheckpointEngine::AppendHistory(std::vector<Point>& history, const Point& point) {
    if (!history.empty() && history.back().lastUpdate == point.lastUpdate) {
        history.back() = point;
    } else {
        history.push_back(point);
    }
}

Point DecayCheckpointEngine::RollGlobalPoint(PoolId poolId, Timestamp now,
                                             std::vector<Point>& weekly) const {
    Point last;
    last.lastUpdate = now;
    auto it = globalPoints_.find(poolId);
    if (it != globalPoints_.end()) {
        last = it->second;
    }

    const std::map<Timestamp, FixedPoint>* schedule = nullptr;
    auto schedIt = slopeChanges_.find(poolId);
    if (schedIt != slopeChanges_.end()) {
        schedule = &schedIt->second;
    }

    Timestamp lastCheckpoint = last.lastUpdate;
    Timestamp cursor = EpochAlign(lastCheckpoint);
    bool reachedNow = false;

    for (int i = 0; i < MAX_ROLLING_WEEKS; ++i) {
        cursor += EPOCH_LENGTH;
        FixedPoint dSlope = 0;
        if (cursor > now) {
            cursor = now;
        } else if (schedule) {
            auto sched = schedule->find(cursor);
            if (sched != schedule->end()) {
                dSlope = sched->second;
            }
        }

        last.bias = LinearDecay(last.bias, last.slope, FixedPoint(cursor - lastCheckpoint));
        last.slope = ClampNonNegative(last.slope + dSlope);

        lastCheckpoint = cursor;
        last.lastUpdate = cursor;

        if (cursor == now) {
            reachedNow = true;
            break;
        }
        weekly.push_back(last);
    }

    if (!reachedNow) {
        LOG_WARN(util::LogCategory::CHECKPOINT)
            << "Pool " << poolId << " rolled " << MAX_ROLLING_WEEKS
            << " weeks and stopped at " << cursor << " short of " << now
            << "; checkpoint idle pools more often";
    }

    last.lastUpdate = now;
    return last;
}

VotingError DecayCheckpointEngine::CheckpointInternal(PoolId poolId, const PoolConfig& config,
                                                      const LockKey* key,
                                                      const LockedBalance& oldLocked,
                                                      const LockedBalance& newLocked,
                                                      Timestamp now) {
    auto globalIt = globalPoints_.find(poolId);
    if (globalIt != globalPoints_.end() && now < globalIt->second.lastUpdate) {
        LOG_WARN(util::LogCategory::CHECKPOINT)
            << "Pool " << poolId << " was checkpointed at " << globalIt->second.lastUpdate
            << "; refusing update at " << now;
        return VotingError::STALE_TIMESTAMP;
    }

    Timestamp lockPeriod = 0;
    if (key) {
        // The first lock period is carried forward for the life of the lock
        auto existing = userPoints_.find(*key);
        if (existing != userPoints_.end()) {
            if (now < existing->second.lastUpdate) {
                return VotingError::STALE_TIMESTAMP;
            }
            lockPeriod = existing->second.period;
        }
        if (lockPeriod == 0) {
            lockPeriod = newLocked.end - now;
        }
    }

    Point pointOld;
    Point pointNew;
    Point global;
    std::vector<Point> weekly;
    FixedPoint dSlopeOld = 0;
    FixedPoint dSlopeNew = 0;
    bool scheduleOld = false;
    bool scheduleNew = false;

    try {
        if (key) {
            pointOld = ComputeLockPoint(config, oldLocked, lockPeriod, now);
            pointNew = ComputeLockPoint(config, newLocked, lockPeriod, now);

            dSlopeOld = GetSlopeChange(poolId, oldLocked.end);
            dSlopeNew = newLocked.end == oldLocked.end
                            ? dSlopeOld
                            : GetSlopeChange(poolId, newLocked.end);
        }

        global = RollGlobalPoint(poolId, now, weekly);

        if (key) {
            global.slope = ClampNonNegative(global.slope + (pointNew.slope - pointOld.slope));
            global.bias = ClampNonNegative(global.bias + (pointNew.bias - pointOld.bias));

            if (oldLocked.end > now) {
                dSlopeOld += pointOld.slope;
                if (newLocked.end == oldLocked.end) {
                    dSlopeOld -= pointNew.slope;
                }
                scheduleOld = true;
            }
            if (newLocked.end > now && newLocked.end > oldLocked.end) {
                dSlopeNew -= pointNew.slope;
                scheduleNew = true;
            }
        }
    } catch (const std::overflow_error& e) {
        LOG_WARN(util::LogCategory::CHECKPOINT)
            << "Pool " << poolId << " update rejected: " << e.what();
        return VotingError::ARITHMETIC_OVERFLOW;
    }

    auto& history = globalHistory_[poolId];
    for (const Point& point : weekly) {
        AppendHistory(history, point);
    }
    globalPoints_[poolId] = global;
    AppendHistory(history, global);

    if (!key) {
        return VotingError::OK;
    }

    auto& schedule = slopeChanges_[poolId];
    if (scheduleOld) {
        schedule[oldLocked.end] = dSlopeOld;
    }
    if (scheduleNew) {
        schedule[newLocked.end] = dSlopeNew;
    }

    userPoints_[*key] = pointNew;
    AppendHistory(userHistory_[*key], pointNew);

    LOG_DEBUG(util::LogCategory::CHECKPOINT)
        << "Pool " << poolId << " global " << global.ToString()
        << ", lock " << key->second << " " << pointNew.ToString();
    return VotingError::OK;
}

VotingError DecayCheckpointEngine::Checkpoint(PoolId poolId, Timestamp now) {
    auto config = registry_.Get(poolId);
    if (!config) {
        return VotingError::POOL_NOT_CONFIGURED;
    }

    return CheckpointInternal(poolId, *config, nullptr, LockedBalance{}, LockedBalance{}, now);
}

LockCreationResult DecayCheckpointEngine::NoteLockCreation(const Address& user, PoolId poolId,
                                                           const FixedPoint& balance,
                                                           Timestamp unlockTime,
                                                           Timestamp now) {
    auto config = registry_.Get(poolId);
    if (!config) {
        return LockCreationResult::Failure(VotingError::POOL_NOT_CONFIGURED);
    }
    if (balance < 0) {
        return LockCreationResult::Failure(VotingError::NEGATIVE_BALANCE);
    }
    if (balance == 0) {
        return LockCreationResult::Failure(VotingError::ZERO_LOCK);
    }
    if (!IsEpochAligned(unlockTime)) {
        return LockCreationResult::Failure(VotingError::UNLOCK_TIME_NOT_ALIGNED);
    }
    if (unlockTime <= now || unlockTime - now < MIN_LOCK_DURATION) {
        return LockCreationResult::Failure(VotingError::LOCK_TOO_SHORT);
    }
    if (unlockTime - now > config->maxLockDuration) {
        return LockCreationResult::Failure(VotingError::LOCK_TOO_LONG);
    }

    // The id is consumed only once the checkpoint succeeds
    LockKey key(user, nextLockId_);

    LockedBalance newLocked;
    newLocked.amount = balance;
    newLocked.end = unlockTime;

    VotingError err = CheckpointInternal(poolId, *config, &key, LockedBalance{}, newLocked, now);
    if (err != VotingError::OK) {
        return LockCreationResult::Failure(err);
    }
    return LockCreationResult::Success(nextLockId_++);
}

VotingError DecayCheckpointEngine::NoteLockBalanceChange(const Address& user, PoolId poolId,
                                                         LockId lockId,
                                                         const FixedPoint& oldBalance,
                                                         const FixedPoint& newBalance,
                                                         Timestamp unlockTime,
                                                         Timestamp now) {
    auto config = registry_.Get(poolId);
    if (!config) {
        return VotingError::POOL_NOT_CONFIGURED;
    }

    LockKey key(user, lockId);
    if (userPoints_.find(key) == userPoints_.end()) {
        return VotingError::NO_LOCK_FOUND;
    }
    if (oldBalance < 0 || newBalance < 0) {
        return VotingError::NEGATIVE_BALANCE;
    }
    if (unlockTime <= now) {
        return VotingError::LOCK_EXPIRED;
    }

    LockedBalance oldLocked;
    oldLocked.amount = oldBalance;
    oldLocked.end = unlockTime;

    LockedBalance newLocked;
    newLocked.amount = newBalance;
    newLocked.end = unlockTime;

    return CheckpointInternal(poolId, *config, &key, oldLocked, newLocked, now);
}

VotingError DecayCheckpointEngine::NoteLockExtension(const Address& user, PoolId poolId,
                                                     LockId lockId,
                                                     const FixedPoint& balance,
                                                     Timestamp oldUnlockTime,
                                                     Timestamp newUnlockTime,
                                                     Timestamp now) {
    auto config = registry_.Get(poolId);
    if (!config) {
        return VotingError::POOL_NOT_CONFIGURED;
    }

    LockKey key(user, lockId);
    if (userPoints_.find(key) == userPoints_.end()) {
        return VotingError::NO_LOCK_FOUND;
    }
    if (balance < 0) {
        return VotingError::NEGATIVE_BALANCE;
    }
    if (!IsEpochAligned(newUnlockTime)) {
        return VotingError::UNLOCK_TIME_NOT_ALIGNED;
    }
    if (newUnlockTime < now) {
        return VotingError::LOCK_TOO_SHORT;
    }
    if (newUnlockTime < oldUnlockTime) {
        return VotingError::ONLY_EXTENSIONS;
    }
    if (newUnlockTime - now > config->maxLockDuration) {
        return VotingError::LOCK_TOO_LONG;
    }

    LockedBalance oldLocked;
    oldLocked.amount = balance;
    oldLocked.end = oldUnlockTime;

    LockedBalance newLocked;
    newLocked.amount = balance;
    newLocked.end = newUnlockTime;

    return CheckpointInternal(poolId, *config, &key, oldLocked, newLocked, now);
}

// ============================================================================
// State Access
// ============================================================================

std::optional<Point> DecayCheckpointEngine::GetGlobalPoint(PoolId poolId) const {
    auto it = globalPoints_.find(poolId);
    if (it == globalPoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Point> DecayCheckpointEngine::GetUserPoint(const Address& user,
                                                         LockId lockId) const {
    auto it = userPoints_.find(LockKey(user, lockId));
    if (it == userPoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

FixedPoint DecayCheckpointEngine::GetSlopeChange(PoolId poolId, Timestamp epoch) const {
    auto poolIt = slopeChanges_.find(poolId);
    if (poolIt == slopeChanges_.end()) {
        return 0;
    }
    auto it = poolIt->second.find(epoch);
    return it == poolIt->second.end() ? FixedPoint(0) : it->second;
}

std::optional<Point> DecayCheckpointEngine::FindAt(const std::vector<Point>& history,
                                                   Timestamp t) {
    auto it = std::upper_bound(history.begin(), history.end(), t,
                               [](Timestamp ts, const Point& p) {
                                   return ts < p.lastUpdate;
                               });
    if (it == history.begin()) {
        return std::nullopt;
    }
    return *std::prev(it);
}

std::optional<Point> DecayCheckpointEngine::FindGlobalPointAt(PoolId poolId,
                                                              Timestamp t) const {
    auto it = globalHistory_.find(poolId);
    if (it == globalHistory_.end()) {
        return std::nullopt;
    }
    return FindAt(it->second, t);
}

std::optional<Point> DecayCheckpointEngine::FindUserPointAt(const Address& user,
                                                            LockId lockId,
                                                            Timestamp t) const {
    auto it = userHistory_.find(LockKey(user, lockId));
    if (it == userHistory_.end()) {
        return std::nullopt;
    }
    return FindAt(it->second, t);
}

size_t DecayCheckpointEngine::GetGlobalHistorySize(PoolId poolId) const {
    auto it = globalHistory_.find(poolId);
    return it == globalHistory_.end() ? 0 : it->second.size();
}

// ============================================================================
// Persistence
// ============================================================================

void DecayCheckpointEngine::Serialize(DataStream& s) const {
    using votelock::Serialize;
    registry_.Serialize(s);
    Serialize(s, globalPoints_);
    Serialize(s, slopeChanges_);
    Serialize(s, userPoints_);
    Serialize(s, globalHistory_);
    Serialize(s, userHistory_);
    Serialize(s, nextLockId_);
}

void DecayCheckpointEngine::Unserialize(DataStream& s) {
    using votelock::Unserialize;
    registry_.Unserialize(s);
    Unserialize(s, globalPoints_);
    Unserialize(s, slopeChanges_);
    Unserialize(s, userPoints_);
    Unserialize(s, globalHistory_);
    Unserialize(s, userHistory_);
    Unserialize(s, nextLockId_);

    if (nextLockId_ < FIRST_LOCK_ID) {
        throw std::ios_base::failure("DecayCheckpointEngine: invalid next lock id");
    }
    for (const auto& entry : userPoints_) {
        if (entry.first.second >= nextLockId_) {
            throw std::ios_base::failure("DecayCheckpointEngine: lock id beyond counter");
        }
    }

    auto ordered = [](const std::vector<Point>& history) {
        return std::adjacent_find(history.begin(), history.end(),
                                  [](const Point& a, const Point& b) {
                                      return a.lastUpdate >= b.lastUpdate;
                                  }) == history.end();
    };
    for (const auto& entry : globalHistory_) {
        if (!ordered(entry.second)) {
            throw std::ios_base::failure("DecayCheckpointEngine: global history out of order");
        }
    }
    for (const auto& entry : userHistory_) {
        if (!ordered(entry.second)) {
            throw std::ios_base::failure("DecayCheckpointEngine: user history out of order");
        }
    }
}

} // namespace voting
} // namespace votelock
