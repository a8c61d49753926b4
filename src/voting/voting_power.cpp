// VOTELOCK - Voting Power Queries Implementation
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <votelock/voting/voting_power.h>
#include <votelock/core/fixed_point.h>
#include <votelock/util/logging.h>

namespace votelock {
namespace voting {

FixedPoint ComputeShare(const FixedPoint& power, const FixedPoint& total) {
    if (total <= 0) {
        return 0;
    }
    return DivDown(power, total);
}

VotingPowerQuery::VotingPowerQuery(const DecayCheckpointEngine& engine)
    : engine_(engine) {}

// ============================================================================
// Current Power
// ============================================================================

std::optional<FixedPoint> VotingPowerQuery::GetVotingPower(const Address& user,
                                                           LockId lockId,
                                                           Timestamp now) const {
    auto point = engine_.GetUserPoint(user, lockId);
    if (!point) {
        return std::nullopt;
    }
    return point->ValueAt(now);
}

FixedPoint VotingPowerQuery::GetGlobalVotingPower(PoolId poolId, Timestamp now) const {
    auto point = engine_.GetGlobalPoint(poolId);
    if (!point) {
        return 0;
    }
    return point->ValueAt(now);
}

std::optional<FixedPoint> VotingPowerQuery::GetVotingPowerShare(const Address& user,
                                                                PoolId poolId,
                                                                LockId lockId,
                                                                Timestamp now) const {
    auto power = GetVotingPower(user, lockId, now);
    if (!power) {
        return std::nullopt;
    }
    return ComputeShare(*power, GetGlobalVotingPower(poolId, now));
}

std::optional<std::vector<FixedPoint>> VotingPowerQuery::GetVotingPowerShareBatch(
    const Address& user, PoolId poolId,
    const std::vector<LockId>& lockIds, Timestamp now) const {
    FixedPoint total = GetGlobalVotingPower(poolId, now);

    std::vector<FixedPoint> shares;
    shares.reserve(lockIds.size());
    for (LockId lockId : lockIds) {
        auto power = GetVotingPower(user, lockId, now);
        if (!power) {
            LOG_DEBUG(util::LogCategory::QUERY) << "Share batch rejected: lock "
                                                << lockId << " not found";
            return std::nullopt;
        }
        shares.push_back(ComputeShare(*power, total));
    }
    return shares;
}

// ============================================================================
// Historical Power
// ============================================================================

std::optional<FixedPoint> VotingPowerQuery::GetVotingPowerAt(const Address& user,
                                                             LockId lockId,
                                                             Timestamp t,
                                                             Timestamp now) const {
    if (t > now) {
        LOG_DEBUG(util::LogCategory::QUERY)
            << "Historical query rejected: "
            << VotingErrorToString(VotingError::TIMESTAMP_IN_FUTURE);
        return std::nullopt;
    }
    if (!engine_.GetUserPoint(user, lockId)) {
        return std::nullopt;
    }

    auto point = engine_.FindUserPointAt(user, lockId, t);
    if (!point) {
        return FixedPoint(0);
    }
    return point->ValueAt(t);
}

std::optional<FixedPoint> VotingPowerQuery::GetGlobalVotingPowerAt(PoolId poolId,
                                                                   Timestamp t,
                                                                   Timestamp now) const {
    if (t > now) {
        LOG_DEBUG(util::LogCategory::QUERY)
            << "Historical query rejected: "
            << VotingErrorToString(VotingError::TIMESTAMP_IN_FUTURE);
        return std::nullopt;
    }

    auto point = engine_.FindGlobalPointAt(poolId, t);
    if (!point) {
        return FixedPoint(0);
    }
    return point->ValueAt(t);
}

// ============================================================================
// Accessors
// ============================================================================

bool VotingPowerQuery::IsOpenPool(PoolId poolId) const {
    return engine_.GetPoolRegistry().IsConfigured(poolId);
}

bool VotingPowerQuery::IsOnceNotedPoint(const Address& user, LockId lockId) const {
    return engine_.GetUserPoint(user, lockId).has_value();
}

Timestamp VotingPowerQuery::GetMaximumLockTime(PoolId poolId) const {
    auto config = engine_.GetPoolRegistry().Get(poolId);
    return config ? config->maxLockDuration : 0;
}

FixedPoint VotingPowerQuery::GetMultiplier(PoolId poolId) const {
    auto config = engine_.GetPoolRegistry().Get(poolId);
    return config ? config->multiplier : FixedPoint(0);
}

Point VotingPowerQuery::GetGlobalPoint(PoolId poolId) const {
    return engine_.GetGlobalPoint(poolId).value_or(Point{});
}

Point VotingPowerQuery::GetUserPoint(const Address& user, LockId lockId) const {
    return engine_.GetUserPoint(user, lockId).value_or(Point{});
}

} // namespace voting
} // namespace votelock
