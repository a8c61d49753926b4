// VOTELOCK - Pool Registry Implementation
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <votelock/voting/pool_registry.h>
#include <votelock/core/fixed_point.h>
#include <votelock/util/config.h>
#include <votelock/util/logging.h>
#include <votelock/util/time.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace votelock {
namespace voting {

std::string PoolConfig::ToString() const {
    std::ostringstream ss;
    ss << "PoolConfig(multiplier=" << FormatFixedPoint(multiplier)
       << ", maxLock=" << util::FormatDuration(util::Seconds{maxLockDuration}) << ")";
    return ss.str();
}

// ============================================================================
// PoolRegistry
// ============================================================================

VotingError PoolRegistry::Configure(PoolId poolId, const FixedPoint& multiplier,
                                    Timestamp maxLockDuration) {
    if (pools_.find(poolId) != pools_.end()) {
        return VotingError::ALREADY_CONFIGURED;
    }
    if (multiplier < SCALE) {
        return VotingError::MULTIPLIER_TOO_LOW;
    }
    if (maxLockDuration <= 0) {
        return VotingError::INVALID_MAX_LOCK_DURATION;
    }

    PoolConfig config;
    config.multiplier = multiplier;
    config.maxLockDuration = maxLockDuration;
    pools_.emplace(poolId, config);

    LOG_INFO(util::LogCategory::POOL) << "Configured pool " << poolId
                                      << ": " << config.ToString();
    return VotingError::OK;
}

std::optional<PoolConfig> PoolRegistry::Get(PoolId poolId) const {
    auto it = pools_.find(poolId);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PoolRegistry::IsConfigured(PoolId poolId) const {
    return pools_.find(poolId) != pools_.end();
}

// ============================================================================
// Pool Definitions
// ============================================================================

namespace {

std::optional<PoolId> ParsePoolId(const std::string& str) {
    if (str.empty() || str.size() > 20) {
        return std::nullopt;
    }
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    try {
        return static_cast<PoolId>(std::stoull(str));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

PoolDefinitionsResult ReadPoolDefinitions(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    const std::string prefix = POOL_SECTION_PREFIX;
    std::vector<PoolDefinition> defs;

    for (const auto& section : config.GetSectionsWithPrefix(prefix)) {
        const std::string where = "[" + section + "]";

        auto poolId = ParsePoolId(section.substr(prefix.size()));
        if (!poolId) {
            return PoolDefinitionsResult::Failure("Invalid pool id in section " + where);
        }

        auto multiplierStr = config.TryGetString(POOL_MULTIPLIER, section);
        if (!multiplierStr) {
            return PoolDefinitionsResult::Failure("Missing multiplier in section " + where);
        }
        auto multiplier = ParseFixedPoint(*multiplierStr);
        if (!multiplier) {
            return PoolDefinitionsResult::Failure(
                "Invalid multiplier '" + *multiplierStr + "' in section " + where);
        }

        bool hasSeconds = config.HasKey(POOL_MAX_LOCK_TIME, section);
        bool hasWeeks = config.HasKey(POOL_MAX_LOCK_WEEKS, section);
        if (hasSeconds == hasWeeks) {
            return PoolDefinitionsResult::Failure(
                "Section " + where + " needs exactly one of maxlocktime or maxlockweeks");
        }

        Timestamp maxLockDuration = 0;
        if (hasSeconds) {
            auto seconds = config.TryGetInt(POOL_MAX_LOCK_TIME, section);
            if (!seconds) {
                return PoolDefinitionsResult::Failure("Invalid maxlocktime in section " + where);
            }
            maxLockDuration = *seconds;
        } else {
            auto weeks = config.TryGetInt(POOL_MAX_LOCK_WEEKS, section);
            if (!weeks || *weeks > std::numeric_limits<Timestamp>::max() / WEEK ||
                *weeks < std::numeric_limits<Timestamp>::min() / WEEK) {
                return PoolDefinitionsResult::Failure("Invalid maxlockweeks in section " + where);
            }
            maxLockDuration = *weeks * WEEK;
        }

        PoolDefinition def;
        def.poolId = *poolId;
        def.multiplier = *multiplier;
        def.maxLockDuration = maxLockDuration;
        defs.push_back(def);
    }

    std::sort(defs.begin(), defs.end(),
              [](const PoolDefinition& a, const PoolDefinition& b) {
                  return a.poolId < b.poolId;
              });

    for (size_t i = 1; i < defs.size(); ++i) {
        if (defs[i].poolId == defs[i - 1].poolId) {
            return PoolDefinitionsResult::Failure(
                "Pool " + std::to_string(defs[i].poolId) + " defined more than once");
        }
    }

    LogDebugF(util::LogCategory::CONFIG, "Read %zu pool definitions", defs.size());
    return PoolDefinitionsResult::Success(std::move(defs));
}

} // namespace voting
} // namespace votelock
