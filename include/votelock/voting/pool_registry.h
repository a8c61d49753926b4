// VOTELOCK - Pool Registry
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Per-pool weighting configuration. A pool is configured exactly once and
// its configuration never changes afterwards.

#ifndef VOTELOCK_VOTING_POOL_REGISTRY_H
#define VOTELOCK_VOTING_POOL_REGISTRY_H

#include <votelock/core/serialize.h>
#include <votelock/core/types.h>
#include <votelock/voting/params.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace votelock {

namespace util {
class ConfigManager;
}

namespace voting {

// ============================================================================
// Pool Configuration
// ============================================================================

struct PoolConfig {
    /// Weight multiplier, SCALE-fixed, never below SCALE
    FixedPoint multiplier{0};

    /// Longest lock accepted by the pool, in seconds
    Timestamp maxLockDuration{0};

    bool operator==(const PoolConfig& other) const {
        return multiplier == other.multiplier &&
               maxLockDuration == other.maxLockDuration;
    }
    bool operator!=(const PoolConfig& other) const { return !(*this == other); }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const PoolConfig& config) {
    using votelock::Serialize;
    Serialize(s, config.multiplier);
    Serialize(s, config.maxLockDuration);
}

template<typename Stream>
void Unserialize(Stream& s, PoolConfig& config) {
    using votelock::Unserialize;
    Unserialize(s, config.multiplier);
    Unserialize(s, config.maxLockDuration);
}

// ============================================================================
// Pool Registry
// ============================================================================

/**
 * Map of pool id to configuration.
 *
 * An absent entry means the pool is unconfigured. Not internally
 * synchronized; the owning VotingEscrow serializes access.
 */
class PoolRegistry {
public:
    /**
     * One-time setup of a pool.
     * @return ALREADY_CONFIGURED, MULTIPLIER_TOO_LOW, INVALID_MAX_LOCK_DURATION or OK
     */
    VotingError Configure(PoolId poolId, const FixedPoint& multiplier,
                          Timestamp maxLockDuration);

    std::optional<PoolConfig> Get(PoolId poolId) const;

    bool IsConfigured(PoolId poolId) const;

    size_t Size() const { return pools_.size(); }

    const std::map<PoolId, PoolConfig>& GetAll() const { return pools_; }

    template<typename Stream>
    void Serialize(Stream& s) const {
        using votelock::Serialize;
        Serialize(s, pools_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        using votelock::Unserialize;
        Unserialize(s, pools_);
    }

private:
    std::map<PoolId, PoolConfig> pools_;
};

// ============================================================================
// Pool Definitions From Configuration
// ============================================================================

/// A pool parsed from a [pool.<id>] configuration section
struct PoolDefinition {
    PoolId poolId{0};
    FixedPoint multiplier{0};
    Timestamp maxLockDuration{0};
};

struct PoolDefinitionsResult {
    bool success{false};
    std::string error;
    std::vector<PoolDefinition> definitions;

    static PoolDefinitionsResult Success(std::vector<PoolDefinition> defs) {
        PoolDefinitionsResult result;
        result.success = true;
        result.definitions = std::move(defs);
        return result;
    }

    static PoolDefinitionsResult Failure(const std::string& err) {
        PoolDefinitionsResult result;
        result.error = err;
        return result;
    }
};

/**
 * Read every [pool.<id>] section, ordered by pool id.
 *
 * Each section needs a decimal multiplier and exactly one of maxlocktime
 * (seconds) or maxlockweeks. Values are range-checked later by Configure.
 */
PoolDefinitionsResult ReadPoolDefinitions(const util::ConfigManager& config);

} // namespace voting
} // namespace votelock

#endif // VOTELOCK_VOTING_POOL_REGISTRY_H
