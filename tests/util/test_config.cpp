// VESCROW - Configuration File Parser Tests
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include <gtest/gtest.h>

#include "vescrow/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace vescrow {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/vescrow_config_test_XXXXXX";
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

    /// Run ParseCommandLine over a list of arguments (program name is added)
    ConfigParseResult ParseArgs(std::vector<std::string> args) {
        args.insert(args.begin(), "vescrow-cli");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(&arg[0]);
        }
        return config_.ParseCommandLine(static_cast<int>(argv.size()), argv.data());
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
# key=value
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("key=value");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("key"));
    EXPECT_EQ(config_.GetString("key", ""), "value");
}

TEST_F(ConfigTest, ParseKeyWithSpaces) {
    auto result = config_.ParseString("  datadir   =   /var/lib/vescrow  ");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/vescrow");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    std::string content = R"(
name="Vote escrowed Token"
symbol='veTKN'
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("name", ""), "Vote escrowed Token");
    EXPECT_EQ(config_.GetString("symbol", ""), "veTKN");
}

TEST_F(ConfigTest, ParseEscapeSequences) {
    auto result = config_.ParseString(R"(msg="line1\nline2\t\"q\"")");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("msg", ""), "line1\nline2\t\"q\"");
}

TEST_F(ConfigTest, SingleQuotesKeepBackslashes) {
    auto result = config_.ParseString(R"(path='C:\data\n')");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("path", ""), R"(C:\data\n)");
}

TEST_F(ConfigTest, ParseBooleanFlag) {
    auto result = config_.ParseString("printtoconsole");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
}

TEST_F(ConfigTest, ParseNegatedFlag) {
    auto result = config_.ParseString("noprinttoconsole");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("printtoconsole"));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, ParseSection) {
    std::string content = R"(
loglevel=debug

[escrow]
lockunit=86400
name=Test
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetInt("lockunit", 0, "escrow"), 86400);
    EXPECT_EQ(config_.GetString("name", "", "escrow"), "Test");
    EXPECT_FALSE(config_.HasKey("lockunit"));
}

TEST_F(ConfigTest, GetSections) {
    std::string content = R"(
global=1
[escrow]
a=1
[log]
b=2
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "escrow");
    EXPECT_EQ(sections[1], "log");
}

TEST_F(ConfigTest, GetKeysInSection) {
    std::string content = R"(
top=1
[escrow]
lockunit=604800
maxlockduration=126144000
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    auto keys = config_.GetKeys("escrow");
    EXPECT_EQ(keys.size(), 2u);
    auto global = config_.GetKeys();
    ASSERT_EQ(global.size(), 1u);
    EXPECT_EQ(global[0], "top");
}

// ============================================================================
// Typed Value Tests
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    std::string content = R"(
positive=42
negative=-7
large=9000000000
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_EQ(config_.GetInt("positive", 0), 42);
    EXPECT_EQ(config_.GetInt("negative", 0), -7);
    EXPECT_EQ(config_.GetInt("large", 0), 9000000000LL);
    EXPECT_EQ(config_.GetInt("missing", 99), 99);
}

TEST_F(ConfigTest, GetIntRejectsSuffixes) {
    ASSERT_TRUE(config_.ParseString("size=10k").success);
    EXPECT_FALSE(config_.TryGetInt("size").has_value());
    EXPECT_EQ(config_.GetInt("size", 5), 5);
}

TEST_F(ConfigTest, GetBool) {
    std::string content = R"(
t1=true
t2=yes
t3=on
t4=1
f1=false
f2=no
f3=off
f4=0
upper=TRUE
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_TRUE(config_.GetBool("t1", false));
    EXPECT_TRUE(config_.GetBool("t2", false));
    EXPECT_TRUE(config_.GetBool("t3", false));
    EXPECT_TRUE(config_.GetBool("t4", false));
    EXPECT_FALSE(config_.GetBool("f1", true));
    EXPECT_FALSE(config_.GetBool("f2", true));
    EXPECT_FALSE(config_.GetBool("f3", true));
    EXPECT_FALSE(config_.GetBool("f4", true));
    EXPECT_TRUE(config_.GetBool("upper", false));
}

TEST_F(ConfigTest, GetList) {
    std::string content = R"(
debug=escrow, checkpoint ,db
empty=
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    auto list = config_.GetList("debug");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], "escrow");
    EXPECT_EQ(list[1], "checkpoint");
    EXPECT_EQ(list[2], "db");

    EXPECT_TRUE(config_.GetList("empty").empty());
    EXPECT_TRUE(config_.GetList("missing").empty());
}

TEST_F(ConfigTest, TryGetStringMissing) {
    EXPECT_FALSE(config_.TryGetString("nope").has_value());
}

TEST_F(ConfigTest, TryGetIntInvalid) {
    ASSERT_TRUE(config_.ParseString("value=abc").success);
    EXPECT_FALSE(config_.TryGetInt("value").has_value());
}

TEST_F(ConfigTest, TryGetIntEmpty) {
    ASSERT_TRUE(config_.ParseString("value=").success);
    EXPECT_FALSE(config_.TryGetInt("value").has_value());
}

TEST_F(ConfigTest, TryGetBoolInvalid) {
    ASSERT_TRUE(config_.ParseString("value=maybe").success);
    EXPECT_FALSE(config_.TryGetBool("value").has_value());
    EXPECT_TRUE(config_.GetBool("value", true));
}

// ============================================================================
// Expansion Tests
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVarsBraced) {
    setenv("VESCROW_TEST_VAR", "hello", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${VESCROW_TEST_VAR}/world"), "hello/world");
    unsetenv("VESCROW_TEST_VAR");
}

TEST_F(ConfigTest, ExpandEnvVarsUndefined) {
    unsetenv("VESCROW_UNDEFINED_VAR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a${VESCROW_UNDEFINED_VAR}b"), "ab");
}

TEST_F(ConfigTest, ExpandEnvVarsUnterminated) {
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${OPEN"), "${OPEN");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$HOME"), "$HOME");
}

TEST_F(ConfigTest, ExpandEnvVarsInConfig) {
    setenv("VESCROW_TEST_DIR", "/srv", 1);
    ASSERT_TRUE(config_.ParseString("datadir=${VESCROW_TEST_DIR}/ledger").success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/srv/ledger");
    unsetenv("VESCROW_TEST_DIR");
}

TEST_F(ConfigTest, ExpandTilde) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(ConfigManager::ExpandTilde("~/data"), std::string(home) + "/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), std::string(home));
}

TEST_F(ConfigTest, NoExpandTildeInMiddle) {
    EXPECT_EQ(ConfigManager::ExpandTilde("/a/~/b"), "/a/~/b");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/x"), "~other/x");
}

TEST_F(ConfigTest, GetPath) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    ASSERT_TRUE(config_.ParseString("datadir=~/.vescrow").success);
    EXPECT_EQ(config_.GetPath("datadir"), std::string(home) + "/.vescrow");
    EXPECT_EQ(config_.GetPath("missing", "/tmp/x"), "/tmp/x");
}

TEST_F(ConfigTest, GetDefaultDataDir) {
    std::string dir = ConfigManager::GetDefaultDataDir();
    EXPECT_NE(dir.find(DEFAULT_DATADIR_NAME), std::string::npos);
}

TEST_F(ConfigTest, LineContinuation) {
    std::string content = "debug=escrow,\\\ncheckpoint\n";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("debug", ""), "escrow,checkpoint");
}

// ============================================================================
// File Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile(R"(
# vescrow.conf
loglevel=info
[escrow]
lockunit=604800
symbol=veVOTE
)");

    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");
    EXPECT_EQ(config_.GetInt("lockunit", 0, "escrow"), 604800);
    EXPECT_EQ(config_.GetString("symbol", "", "escrow"), "veVOTE");
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/path/vescrow.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, ParseFileReportsLine) {
    std::string path = CreateTempFile("good=1\n[broken\n");
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorFile, path);
}

// ============================================================================
// Command Line Tests
// ============================================================================

TEST_F(ConfigTest, ParseCommandLineBasic) {
    auto result = ParseArgs({"-datadir=/tmp/ve", "--loglevel=debug", "-printtoconsole"});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/ve");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
}

TEST_F(ConfigTest, ParseCommandLineNegated) {
    ASSERT_TRUE(ParseArgs({"-noprinttoconsole"}).success);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, ParseCommandLineSectionKey) {
    ASSERT_TRUE(ParseArgs({"-escrow.lockunit=3600"}).success);
    EXPECT_EQ(config_.GetInt("lockunit", 0, "escrow"), 3600);
    // Sectioned entries live under the flat "section.key" name
    EXPECT_TRUE(config_.HasKey("escrow.lockunit"));
    EXPECT_TRUE(config_.HasKey("lockunit", "escrow"));
    EXPECT_FALSE(config_.HasKey("lockunit"));
}

TEST_F(ConfigTest, ParseCommandLinePositional) {
    ASSERT_TRUE(ParseArgs({"script.txt", "-debug=escrow", "more"}).success);
    const auto& positional = config_.GetPositionalArgs();
    ASSERT_EQ(positional.size(), 2u);
    EXPECT_EQ(positional[0], "script.txt");
    EXPECT_EQ(positional[1], "more");
}

TEST_F(ConfigTest, ParseCommandLineInvalidOption) {
    EXPECT_FALSE(ParseArgs({"--"}).success);
    config_.Clear();
    EXPECT_FALSE(ParseArgs({"-bad key=1"}).success);
}

TEST_F(ConfigTest, CommandLineOverridesConfig) {
    ASSERT_TRUE(ParseArgs({"-loglevel=trace", "-escrow.symbol=veCLI"}).success);

    std::string content = R"(
loglevel=warn
datadir=/from/file
[escrow]
symbol=veFILE
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_EQ(config_.GetString("loglevel", ""), "trace");
    EXPECT_EQ(config_.GetString("symbol", "", "escrow"), "veCLI");
    EXPECT_EQ(config_.GetString("datadir", ""), "/from/file");
}

// ============================================================================
// Setting and Validation Tests
// ============================================================================

TEST_F(ConfigTest, SetOverwrites) {
    config_.Set("key", "one");
    config_.Set("key", "two");
    EXPECT_EQ(config_.GetString("key", ""), "two");
}

TEST_F(ConfigTest, SetDefault) {
    config_.Set("present", "set");
    config_.SetDefault("present", "default");
    config_.SetDefault("absent", "default");

    EXPECT_EQ(config_.GetString("present", ""), "set");
    EXPECT_EQ(config_.GetString("absent", ""), "default");
}

TEST_F(ConfigTest, SetInSection) {
    config_.Set("lockunit", "60", "escrow");
    EXPECT_TRUE(config_.HasKey("lockunit", "escrow"));
    EXPECT_FALSE(config_.HasKey("lockunit"));
}

TEST_F(ConfigTest, UnknownKeyReported) {
    config_.AllowKey(ConfigKeys::LOGLEVEL);
    config_.AllowKey(ConfigKeys::LOCKUNIT, ConfigKeys::ESCROW_SECTION);
    ASSERT_TRUE(config_.ParseString("loglevel=info\ntypo=1\n[escrow]\nlockunit=60\n").success);

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("typo"), std::string::npos);
}

TEST_F(ConfigTest, ValidateWithoutAllowedKeys) {
    ASSERT_TRUE(config_.ParseString("anything=1").success);
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ConfigTest, Clear) {
    config_.Set("a", "1");
    config_.Set("b", "2", "escrow");
    EXPECT_EQ(config_.Size(), 2u);

    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_FALSE(config_.HasKey("a"));
}

// ============================================================================
// Error Handling Tests
// ============================================================================

TEST_F(ConfigTest, InvalidSectionHeader) {
    auto result = config_.ParseString("[escrow");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, EmptyKey) {
    EXPECT_FALSE(config_.ParseString("=value").success);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    EXPECT_FALSE(config_.ParseString("bad key=value").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH + 10, 'x');
    auto result = config_.ParseString(content);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("too long"), std::string::npos);
}

// ============================================================================
// Edge Cases
// ============================================================================

TEST_F(ConfigTest, EmptyValueAllowed) {
    ASSERT_TRUE(config_.ParseString("logfile=").success);
    EXPECT_TRUE(config_.HasKey("logfile"));
    EXPECT_EQ(config_.GetString("logfile", "x"), "");
}

TEST_F(ConfigTest, MultipleEquals) {
    ASSERT_TRUE(config_.ParseString("expr=a=b=c").success);
    EXPECT_EQ(config_.GetString("expr", ""), "a=b=c");
}

TEST_F(ConfigTest, KeyWithHyphensAndUnderscores) {
    ASSERT_TRUE(config_.ParseString("max-buckets=1\nlock_unit=2").success);
    EXPECT_EQ(config_.GetInt("max-buckets", 0), 1);
    EXPECT_EQ(config_.GetInt("lock_unit", 0), 2);
}

} // namespace test
} // namespace util
} // namespace vescrow
