// VOTELOCK - Pool Registry Tests
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <gtest/gtest.h>

#include <votelock/core/fixed_point.h>
#include <votelock/util/config.h>
#include <votelock/voting/params.h>
#include <votelock/voting/pool_registry.h>

namespace votelock {
namespace voting {
namespace {

// ============================================================================
// Params
// ============================================================================

TEST(ParamsTest, EpochAlign) {
    EXPECT_EQ(EpochAlign(0), 0);
    EXPECT_EQ(EpochAlign(WEEK - 1), 0);
    EXPECT_EQ(EpochAlign(WEEK), WEEK);
    EXPECT_EQ(EpochAlign(3 * WEEK + 17), 3 * WEEK);
    EXPECT_EQ(EpochAlign(-1), -WEEK);
    EXPECT_EQ(EpochAlign(-WEEK), -WEEK);
}

TEST(ParamsTest, IsEpochAligned) {
    EXPECT_TRUE(IsEpochAligned(0));
    EXPECT_TRUE(IsEpochAligned(52 * WEEK));
    EXPECT_FALSE(IsEpochAligned(52 * WEEK + 1));
}

TEST(ParamsTest, ErrorNames) {
    EXPECT_STREQ(VotingErrorToString(VotingError::OK), "OK");
    EXPECT_STREQ(VotingErrorToString(VotingError::MULTIPLIER_TOO_LOW), "MULTIPLIER_TOO_LOW");
    EXPECT_STREQ(VotingErrorToString(VotingError::ONLY_EXTENSIONS), "ONLY_EXTENSIONS");
    EXPECT_STREQ(VotingErrorToString(VotingError::TIMESTAMP_IN_FUTURE), "TIMESTAMP_IN_FUTURE");
    EXPECT_STREQ(VotingErrorToString(VotingError::STALE_TIMESTAMP), "STALE_TIMESTAMP");
    EXPECT_STREQ(VotingErrorToString(VotingError::ARITHMETIC_OVERFLOW), "ARITHMETIC_OVERFLOW");
}

// ============================================================================
// PoolRegistry
// ============================================================================

TEST(PoolRegistryTest, ConfigureAndGet) {
    PoolRegistry registry;
    EXPECT_FALSE(registry.IsConfigured(1));
    EXPECT_FALSE(registry.Get(1).has_value());

    EXPECT_EQ(registry.Configure(1, SCALE + SCALE / 2, 52 * WEEK), VotingError::OK);
    EXPECT_TRUE(registry.IsConfigured(1));
    EXPECT_EQ(registry.Size(), 1u);

    auto config = registry.Get(1);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->multiplier, SCALE + SCALE / 2);
    EXPECT_EQ(config->maxLockDuration, 52 * WEEK);
    EXPECT_EQ(config->ToString(), "PoolConfig(multiplier=1.5, maxLock=52w)");
}

TEST(PoolRegistryTest, ConfigureIsOneTime) {
    PoolRegistry registry;
    ASSERT_EQ(registry.Configure(1, SCALE, WEEK), VotingError::OK);
    EXPECT_EQ(registry.Configure(1, 2 * SCALE, 2 * WEEK), VotingError::ALREADY_CONFIGURED);
    EXPECT_EQ(registry.Get(1)->multiplier, SCALE);
}

TEST(PoolRegistryTest, ConfigureValidation) {
    PoolRegistry registry;
    EXPECT_EQ(registry.Configure(1, SCALE - 1, WEEK), VotingError::MULTIPLIER_TOO_LOW);
    EXPECT_EQ(registry.Configure(1, SCALE, 0), VotingError::INVALID_MAX_LOCK_DURATION);
    EXPECT_EQ(registry.Configure(1, SCALE, -WEEK), VotingError::INVALID_MAX_LOCK_DURATION);
    EXPECT_FALSE(registry.IsConfigured(1));

    // A multiplier of exactly 1.0 and a one-second maximum are accepted
    EXPECT_EQ(registry.Configure(1, SCALE, 1), VotingError::OK);
}

TEST(PoolRegistryTest, ConfigurationPrecedesRangeChecks) {
    PoolRegistry registry;
    ASSERT_EQ(registry.Configure(3, SCALE, WEEK), VotingError::OK);
    EXPECT_EQ(registry.Configure(3, 0, 0), VotingError::ALREADY_CONFIGURED);
}

TEST(PoolRegistryTest, SerializeRestoresPools) {
    PoolRegistry registry;
    ASSERT_EQ(registry.Configure(1, SCALE, WEEK), VotingError::OK);
    ASSERT_EQ(registry.Configure(7, 3 * SCALE, 104 * WEEK), VotingError::OK);

    DataStream s;
    registry.Serialize(s);

    PoolRegistry restored;
    restored.Unserialize(s);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(restored.GetAll(), registry.GetAll());
}

// ============================================================================
// Pool Definitions From Configuration
// ============================================================================

class PoolDefinitionsTest : public ::testing::Test {
protected:
    util::ConfigManager config;

    void Parse(const std::string& content) {
        auto result = config.ParseString(content);
        ASSERT_TRUE(result.success) << result.ToString();
    }
};

TEST_F(PoolDefinitionsTest, ReadsSortedDefinitions) {
    Parse(
        "[pool.10]\n"
        "multiplier = 2\n"
        "maxlocktime = 604800\n"
        "[pool.2]\n"
        "multiplier = 1.25\n"
        "maxlockweeks = 52\n"
        "[log]\n"
        "level = debug\n");

    auto result = ReadPoolDefinitions(config);
    ASSERT_TRUE(result.success) << result.error;
    ASSERT_EQ(result.definitions.size(), 2u);

    EXPECT_EQ(result.definitions[0].poolId, 2u);
    EXPECT_EQ(result.definitions[0].multiplier, SCALE + SCALE / 4);
    EXPECT_EQ(result.definitions[0].maxLockDuration, 52 * WEEK);

    EXPECT_EQ(result.definitions[1].poolId, 10u);
    EXPECT_EQ(result.definitions[1].multiplier, 2 * SCALE);
    EXPECT_EQ(result.definitions[1].maxLockDuration, WEEK);
}

TEST_F(PoolDefinitionsTest, NoPoolsIsEmptySuccess) {
    Parse("[log]\nlevel = info\n");
    auto result = ReadPoolDefinitions(config);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.definitions.empty());
}

TEST_F(PoolDefinitionsTest, RejectsBadPoolId) {
    Parse("[pool.abc]\nmultiplier = 1\nmaxlockweeks = 1\n");
    auto result = ReadPoolDefinitions(config);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("[pool.abc]"), std::string::npos);
}

TEST_F(PoolDefinitionsTest, RejectsMissingMultiplier) {
    Parse("[pool.1]\nmaxlockweeks = 1\n");
    auto result = ReadPoolDefinitions(config);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("Missing multiplier"), std::string::npos);
}

TEST_F(PoolDefinitionsTest, RejectsMalformedMultiplier) {
    Parse("[pool.1]\nmultiplier = 1.5x\nmaxlockweeks = 1\n");
    auto result = ReadPoolDefinitions(config);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("1.5x"), std::string::npos);
}

TEST_F(PoolDefinitionsTest, RequiresExactlyOneDuration) {
    Parse("[pool.1]\nmultiplier = 1\n");
    EXPECT_FALSE(ReadPoolDefinitions(config).success);

    config.Clear();
    Parse("[pool.1]\nmultiplier = 1\nmaxlockweeks = 1\nmaxlocktime = 604800\n");
    EXPECT_FALSE(ReadPoolDefinitions(config).success);
}

TEST_F(PoolDefinitionsTest, RejectsNonNumericDuration) {
    Parse("[pool.1]\nmultiplier = 1\nmaxlockweeks = many\n");
    EXPECT_FALSE(ReadPoolDefinitions(config).success);
}

TEST_F(PoolDefinitionsTest, RejectsDuplicateIds) {
    Parse(
        "[pool.1]\nmultiplier = 1\nmaxlockweeks = 1\n"
        "[pool.01]\nmultiplier = 2\nmaxlockweeks = 2\n");
    auto result = ReadPoolDefinitions(config);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("more than once"), std::string::npos);
}

TEST_F(PoolDefinitionsTest, RangeChecksAreLeftToConfigure) {
    Parse("[pool.1]\nmultiplier = 0.5\nmaxlockweeks = 0\n");
    auto result = ReadPoolDefinitions(config);
    ASSERT_TRUE(result.success);

    PoolRegistry registry;
    const auto& def = result.definitions[0];
    EXPECT_EQ(registry.Configure(def.poolId, def.multiplier, def.maxLockDuration),
              VotingError::MULTIPLIER_TOO_LOW);
}

} // namespace
} // namespace voting
} // namespace votelock
