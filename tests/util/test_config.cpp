// VOTELOCK - Configuration Tests
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include <gtest/gtest.h>

#include "votelock/util/config.h"
#include "votelock/util/logging.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace votelock {
namespace util {
namespace test {

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : files_) {
            std::remove(path.c_str());
        }
    }

    std::string WriteTempFile(const std::string& text) {
        char path[] = "/tmp/votelock_config_XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) {
            throw std::runtime_error("mkstemp failed");
        }
        close(fd);
        std::ofstream out(path);
        out << text;
        files_.push_back(path);
        return path;
    }

    ConfigManager config_;
    std::vector<std::string> files_;
};

// ============================================================================
// Syntax
// ============================================================================

TEST_F(ConfigTest, EmptyAndCommentOnlyInput) {
    EXPECT_TRUE(config_.ParseString("").success);
    EXPECT_TRUE(config_.ParseString("# one\n; two\n\n   \n").success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, KeysAndValuesAreTrimmed) {
    ASSERT_TRUE(config_.ParseString("  level  =  debug  \nconsole=yes\n").success);
    EXPECT_EQ(config_.GetString("level", ""), "debug");
    EXPECT_TRUE(config_.GetBool("console", false));
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigTest, TrailingCommentOnlyOutsideQuotes) {
    ASSERT_TRUE(config_.ParseString(
        "maxlocktime = 31449600   # one year\n"
        "label = \"keep # inside\"\n").success);
    EXPECT_EQ(config_.GetInt("maxlocktime", 0), 31449600);
    EXPECT_EQ(config_.GetString("label", ""), "keep # inside");
}

TEST_F(ConfigTest, Quoting) {
    ASSERT_TRUE(config_.ParseString(
        "a = \"two words\"\n"
        "b = 'raw \\n text'\n"
        "c = \"say \\\"hi\\\"\\tnow\"\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "two words");
    EXPECT_EQ(config_.GetString("b", ""), "raw \\n text");
    EXPECT_EQ(config_.GetString("c", ""), "say \"hi\"\tnow");
}

TEST_F(ConfigTest, SectionsAreSortedAndScoped) {
    ASSERT_TRUE(config_.ParseString(
        "level = info\n"
        "[pool.2]\n"
        "multiplier = 1\n"
        "[ pool.1 ]\n"
        "multiplier = 1.5\n"
        "maxlockweeks = 52\n").success);

    EXPECT_EQ(config_.GetString("level", ""), "info");
    EXPECT_FALSE(config_.HasKey("level", "pool.1"));
    EXPECT_EQ(config_.GetString("multiplier", "", "pool.1"), "1.5");
    EXPECT_FALSE(config_.HasKey("maxlockweeks", "pool.2"));

    EXPECT_EQ(config_.GetSections(), (std::vector<std::string>{"pool.1", "pool.2"}));
    EXPECT_EQ(config_.GetKeys("pool.1"),
              (std::vector<std::string>{"maxlockweeks", "multiplier"}));
    EXPECT_EQ(config_.GetKeys(""), std::vector<std::string>{"level"});
}

TEST_F(ConfigTest, PrefixFilterNeedsTheDot) {
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=debug\n[pool.7]\nx=1\n[pools]\nx=1\n").success);
    EXPECT_EQ(config_.GetSectionsWithPrefix("pool."), std::vector<std::string>{"pool.7"});
}

TEST_F(ConfigTest, LastDefinitionWins) {
    ASSERT_TRUE(config_.ParseString("level=info\nlevel=warn\n").success);
    EXPECT_EQ(config_.GetString("level", ""), "warn");
    EXPECT_EQ(config_.GetEntry("level")->line, 2);
}

TEST_F(ConfigTest, BackslashJoinsLines) {
    ASSERT_TRUE(config_.ParseString("multiplier = 1.\\\n25\nnext = 1\n").success);
    EXPECT_EQ(config_.GetString("multiplier", ""), "1.25");
    EXPECT_EQ(config_.GetInt("next", 0), 1);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("VOTELOCK_CFG_DIR", "/var/votelock", 1);
    ASSERT_TRUE(config_.ParseString("file = ${VOTELOCK_CFG_DIR}/engine.log\n").success);
    EXPECT_EQ(config_.GetString("file", ""), "/var/votelock/engine.log");
    unsetenv("VOTELOCK_CFG_DIR");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("a${VOTELOCK_UNSET_XYZ}b"), "ab");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("cost: ${open"), "cost: ${open");
}

// ============================================================================
// Typed Values
// ============================================================================

TEST_F(ConfigTest, Integers) {
    ASSERT_TRUE(config_.ParseString("week=604800\nneg=-5\nword=abc\nmixed=12abc\n").success);
    EXPECT_EQ(config_.GetInt("week", 0), 604800);
    EXPECT_EQ(config_.GetInt("neg", 0), -5);
    EXPECT_FALSE(config_.TryGetInt("word").has_value());
    EXPECT_FALSE(config_.TryGetInt("mixed").has_value());
    EXPECT_EQ(config_.GetInt("absent", 42), 42);
}

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a=TRUE\nb=on\nc=no\nd=0\ne=maybe\n").success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), true);
    EXPECT_EQ(config_.TryGetBool("c"), false);
    EXPECT_EQ(config_.TryGetBool("d"), false);
    EXPECT_FALSE(config_.TryGetBool("e").has_value());
    EXPECT_TRUE(config_.GetBool("e", true));
}

TEST_F(ConfigTest, SetOverridesParsedValue) {
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=info\n").success);
    config_.Set("level", "error", "log");
    EXPECT_EQ(config_.GetString("level", "", "log"), "error");
    EXPECT_EQ(config_.GetEntry("level", "log")->source, "<set>");
}

// ============================================================================
// Files and Errors
// ============================================================================

TEST_F(ConfigTest, ParseFileRecordsSource) {
    std::string path = WriteTempFile("[pool.3]\nmultiplier=2\nmaxlocktime=604800\n");
    ASSERT_TRUE(config_.ParseFile(path).success);

    auto entry = config_.GetEntry("maxlocktime", "pool.3");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value, "604800");
    EXPECT_EQ(entry->source, path);
    EXPECT_EQ(entry->line, 3);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/votelock.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.ToString(), "Cannot open file: /nonexistent/votelock.conf");
}

TEST_F(ConfigTest, UnclosedSectionReportsLine) {
    auto result = config_.ParseString("a=1\n[pool.1\n", "pools.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.ToString(), "pools.conf:2: Missing closing bracket in section header");
}

TEST_F(ConfigTest, RejectsMalformedLines) {
    EXPECT_FALSE(config_.ParseString("=value").success);
    EXPECT_FALSE(config_.ParseString("bad key = value").success);
    EXPECT_FALSE(config_.ParseString("console").success);
    EXPECT_FALSE(config_.ParseString("k=" + std::string(MAX_LINE_LENGTH, 'x')).success);
}

// ============================================================================
// Logging Configuration
// ============================================================================

class LoggingConfigTest : public ConfigTest {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        ConfigTest::TearDown();
    }
};

TEST_F(LoggingConfigTest, LevelAndFileSink) {
    std::string logPath = WriteTempFile("");
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=debug\nfile=" + logPath + "\n").success);

    EXPECT_TRUE(ApplyLoggingConfig(config_));
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Debug);
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingConfigTest, ConsoleSinkOnRequest) {
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=warn\nconsole=1\n").success);
    EXPECT_TRUE(ApplyLoggingConfig(config_));
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Warn);
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingConfigTest, EmptySectionChangesNothing) {
    EXPECT_TRUE(ApplyLoggingConfig(config_));
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Info);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
}

TEST_F(LoggingConfigTest, UnwritableFileFails) {
    ASSERT_TRUE(config_.ParseString("[log]\nfile=/nonexistent/dir/votelock.log\n").success);
    EXPECT_FALSE(ApplyLoggingConfig(config_));
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
}

} // namespace test
} // namespace util
} // namespace votelock
