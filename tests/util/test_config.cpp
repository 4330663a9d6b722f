// SEALBID - Configuration File Parser Tests
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include <gtest/gtest.h>

#include "sealbid/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace sealbid {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }
    
    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/sealbid_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);
        
        std::ofstream file(filename);
        file << content;
        file.close();
        
        tempFiles_.push_back(filename);
        return filename;
    }
    
    ConfigParseResult ParseArgs(std::vector<const char*> args) {
        args.insert(args.begin(), "sealbid-cli");
        return config_.ParseCommandLine(static_cast<int>(args.size()), args.data());
    }
    
    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# admin=alice
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    auto result = config_.ParseString("backend=memory\n  admin = alice  \n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString(ConfigKeys::BACKEND, ""), "memory");
    EXPECT_EQ(config_.GetString(ConfigKeys::ADMIN, ""), "alice");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    ASSERT_TRUE(config_.ParseString("admin=\"city council\"\nlogfile='/tmp/a b.log'").success);
    EXPECT_EQ(config_.GetString("admin", ""), "city council");
    EXPECT_EQ(config_.GetString("logfile", ""), "/tmp/a b.log");
}

TEST_F(ConfigTest, ParseEscapeSequences) {
    ASSERT_TRUE(config_.ParseString(R"(motd="a\tb\"c")").success);
    EXPECT_EQ(config_.GetString("motd", ""), "a\tb\"c");
}

TEST_F(ConfigTest, ParseBooleanFlag) {
    ASSERT_TRUE(config_.ParseString("printtoconsole").success);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, false));
}

TEST_F(ConfigTest, ParseNegatedFlag) {
    ASSERT_TRUE(config_.ParseString("noprinttoconsole").success);
    EXPECT_FALSE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, true));
}

TEST_F(ConfigTest, SectionsRejected) {
    auto result = config_.ParseString("admin=root\n[test]\nadmin=tester\n");
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, FirstValueWinsInFile) {
    ASSERT_TRUE(config_.ParseString("height=5\nheight=9\n").success);
    EXPECT_EQ(config_.GetUInt("height", 0), 5u);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, GetUInt) {
    ASSERT_TRUE(config_.ParseString(
        "height=18446744073709551615\nneg=-1\nbig=18446744073709551616\nmixed=12abc\nplus=+5\n").success);
    EXPECT_EQ(config_.GetUInt("height", 0), 18446744073709551615ULL);
    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
    EXPECT_FALSE(config_.TryGetUInt("big").has_value());
    EXPECT_FALSE(config_.TryGetUInt("mixed").has_value());
    EXPECT_FALSE(config_.TryGetUInt("plus").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 11), 11u);
}

TEST_F(ConfigTest, GetBool) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=off\nc=1\nd=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
}

TEST_F(ConfigTest, TryGetStringMissing) {
    EXPECT_FALSE(config_.TryGetString("nothing").has_value());
    EXPECT_EQ(config_.Find("nothing"), nullptr);
}

TEST_F(ConfigTest, GetList) {
    ASSERT_TRUE(config_.ParseString("logcategories= ledger, ,db ,audit,").success);
    std::vector<std::string> expected = {"ledger", "db", "audit"};
    EXPECT_EQ(config_.GetList(ConfigKeys::LOGCATEGORIES), expected);
    EXPECT_TRUE(config_.GetList("missing").empty());
}

TEST_F(ConfigTest, EntryRecordsSource) {
    ASSERT_TRUE(config_.ParseString("\n\nadmin=board\n", "bids.conf").success);
    const ConfigManager::Entry* entry = config_.Find(ConfigKeys::ADMIN);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->origin, ConfigManager::Origin::CONFIG_FILE);
    EXPECT_EQ(entry->source, "bids.conf");
    EXPECT_EQ(entry->line, 3);
}

// ============================================================================
// Expansion
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVarsBraced) {
    setenv("SEALBID_TEST_VAR", "test_value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("prefix_${SEALBID_TEST_VAR}_suffix"),
              "prefix_test_value_suffix");
    unsetenv("SEALBID_TEST_VAR");
}

TEST_F(ConfigTest, ExpandEnvVarsUndefined) {
    unsetenv("SEALBID_UNDEFINED_VAR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a${SEALBID_UNDEFINED_VAR}b"), "ab");
}

TEST_F(ConfigTest, ExpandEnvVarsInConfig) {
    setenv("SEALBID_TEST_DIR", "/srv/bids", 1);
    ASSERT_TRUE(config_.ParseString("datadir=${SEALBID_TEST_DIR}/main").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, ""), "/srv/bids/main");
    unsetenv("SEALBID_TEST_DIR");
}

TEST_F(ConfigTest, ExpandTilde) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/x"), "/home/tester/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), "/home/tester");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/x"), "~other/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("a/~/b"), "a/~/b");
}

TEST_F(ConfigTest, DefaultDataDir) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.sealbid");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("backend=memory\nadmin=board\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString(ConfigKeys::BACKEND, ""), "memory");
    EXPECT_EQ(config_.GetString(ConfigKeys::ADMIN, ""), "board");
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/sealbid.conf");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, ErrorReportsFileAndLine) {
    std::string path = CreateTempFile("admin=a\nbad key=1\n");
    auto result = config_.ParseFile(path);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_NE(result.ToString().find(path + ":2:"), std::string::npos);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    EXPECT_FALSE(config_.ParseString("bad key=1").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string line = "k=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    EXPECT_FALSE(config_.ParseString(line).success);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, ParseCommandLineOptionsAndPositionals) {
    auto result = ParseArgs({"--backend=memory", "--height=7", "submit", "alice", "1", "ab"});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString(ConfigKeys::BACKEND, ""), "memory");
    EXPECT_EQ(config_.GetUInt(ConfigKeys::HEIGHT, 0), 7u);
    
    std::vector<std::string> expected = {"submit", "alice", "1", "ab"};
    EXPECT_EQ(config_.GetPositionalArgs(), expected);
}

TEST_F(ConfigTest, ParseCommandLineFlags) {
    ASSERT_TRUE(ParseArgs({"--help", "--noprinttoconsole"}).success);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::HELP, false));
    EXPECT_FALSE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, true));
    EXPECT_TRUE(config_.GetPositionalArgs().empty());
}

TEST_F(ConfigTest, ParseCommandLineDoesNotConsumeNextArgument) {
    ASSERT_TRUE(ParseArgs({"--datadir", "status"}).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, ""), "true");
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "status");
}

TEST_F(ConfigTest, ArgumentsAfterCommandArePositional) {
    ASSERT_TRUE(ParseArgs({"reveal", "alice", "1", "5", "--not-an-option", "ab"}).success);
    EXPECT_FALSE(config_.HasKey("not-an-option"));
    EXPECT_EQ(config_.GetPositionalArgs().size(), 6u);
}

TEST_F(ConfigTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(ParseArgs({"--", "--backend=memory"}).success);
    EXPECT_FALSE(config_.HasKey(ConfigKeys::BACKEND));
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "--backend=memory");
}

TEST_F(ConfigTest, CommandLineBeatsConfigFile) {
    ASSERT_TRUE(ParseArgs({"--admin=cli"}).success);
    ASSERT_TRUE(config_.ParseString("admin=file\nbackend=memory\n").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::ADMIN, ""), "cli");
    EXPECT_EQ(config_.GetString(ConfigKeys::BACKEND, ""), "memory");
}

TEST_F(ConfigTest, InvalidCommandLineOption) {
    EXPECT_FALSE(ParseArgs({"--bad key=1"}).success);
    EXPECT_FALSE(ParseArgs({"---"}).success);
}

TEST_F(ConfigTest, LastCommandLineValueWins) {
    ASSERT_TRUE(ParseArgs({"--admin=a", "--admin=b"}).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::ADMIN, ""), "b");
    EXPECT_EQ(config_.Find(ConfigKeys::ADMIN)->origin, ConfigManager::Origin::COMMAND_LINE);
}

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigTest, SetDefaultIsLowestPriority) {
    config_.SetDefault("backend", "leveldb");
    EXPECT_EQ(config_.GetString("backend", ""), "leveldb");
    EXPECT_EQ(config_.Find("backend")->origin, ConfigManager::Origin::DEFAULT);
    
    ASSERT_TRUE(config_.ParseString("backend=memory").success);
    EXPECT_EQ(config_.GetString("backend", ""), "memory");
    
    // A default never replaces an existing value
    config_.SetDefault("backend", "other");
    EXPECT_EQ(config_.GetString("backend", ""), "memory");
}

TEST_F(ConfigTest, DefaultDoesNotShadowCommandLine) {
    ASSERT_TRUE(ParseArgs({"--loglevel=debug", "status"}).success);
    config_.SetDefault(ConfigKeys::LOGLEVEL, "warn");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "debug");
    EXPECT_EQ(config_.Size(), 1u);
}

} // namespace test
} // namespace util
} // namespace sealbid
