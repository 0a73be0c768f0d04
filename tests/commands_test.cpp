#include "cli/commands.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

namespace diskmap::cli {

// ── Fixture ──────────────────────────────────────────────────────────────────

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               ("commands_test_" + std::string(info->name()));
        ASSERT_FALSE(JsonMap::open_new(dir_, map_));
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    // Runs one command; stdout/stderr land in out_/err_.
    int run(const std::string& command, std::vector<std::string> args = {}) {
        out_.str(std::string());
        err_.str(std::string());
        CliConfig cfg;
        cfg.directory = dir_.string();
        cfg.command   = command;
        cfg.args      = std::move(args);
        return run_command(cfg, map_, out_, err_);
    }

    std::filesystem::path dir_;
    JsonMap map_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// ── parse_value ──────────────────────────────────────────────────────────────

TEST(ParseValueTest, JsonTextIsParsed) {
    EXPECT_EQ(parse_value("42"), nlohmann::json(42));
    EXPECT_EQ(parse_value("[1,2]"), nlohmann::json::array({1, 2}));
    EXPECT_EQ(parse_value("{\"a\":true}"), nlohmann::json({{"a", true}}));
    EXPECT_EQ(parse_value("\"quoted\""), nlohmann::json("quoted"));
}

TEST(ParseValueTest, OtherTextBecomesString) {
    EXPECT_EQ(parse_value("hello"), nlohmann::json("hello"));
    EXPECT_EQ(parse_value("{broken"), nlohmann::json("{broken"));
}

// ── Commands ─────────────────────────────────────────────────────────────────

TEST_F(CommandsTest, InsertThenGet) {
    EXPECT_EQ(run("insert", {"a", "{\"x\":1}"}), kExitOk);
    EXPECT_EQ(out_.str(), "OK\n");

    EXPECT_EQ(run("get", {"a"}), kExitOk);
    EXPECT_EQ(out_.str(), "{\"x\":1}\n");
}

TEST_F(CommandsTest, InsertExistingKeyFails) {
    ASSERT_EQ(run("insert", {"a", "1"}), kExitOk);
    EXPECT_EQ(run("insert", {"a", "2"}), kExitStoreError);
    EXPECT_NE(err_.str().find("cannot open file"), std::string::npos);
}

TEST_F(CommandsTest, GetMissingKeyFails) {
    EXPECT_EQ(run("get", {"nope"}), kExitStoreError);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CommandsTest, OverwriteAndDelete) {
    ASSERT_EQ(run("insert", {"a", "1"}), kExitOk);
    EXPECT_EQ(run("overwrite", {"a", "text"}), kExitOk);
    ASSERT_EQ(run("get", {"a"}), kExitOk);
    EXPECT_EQ(out_.str(), "\"text\"\n");

    EXPECT_EQ(run("delete", {"a"}), kExitOk);
    EXPECT_EQ(out_.str(), "DELETED\n");
    EXPECT_EQ(run("delete", {"a"}), kExitStoreError);
}

TEST_F(CommandsTest, AlterAddCreatesAndIncrements) {
    EXPECT_EQ(run("alter-add", {"n", "5"}), kExitOk);
    EXPECT_EQ(out_.str(), "5\n");
    EXPECT_EQ(run("alter-add", {"n", "2"}), kExitOk);
    EXPECT_EQ(out_.str(), "7\n");
    EXPECT_EQ(run("alter-add", {"n", "0.5"}), kExitOk);
    EXPECT_EQ(out_.str(), "7.5\n");
}

TEST_F(CommandsTest, AlterAddRejectsNonNumbers) {
    EXPECT_EQ(run("alter-add", {"n", "abc"}), kExitUsage);

    ASSERT_EQ(run("insert", {"s", "word"}), kExitOk);
    EXPECT_EQ(run("alter-add", {"s", "1"}), kExitStoreError);
    ASSERT_EQ(run("get", {"s"}), kExitOk);
    EXPECT_EQ(out_.str(), "\"word\"\n");  // untouched
}

TEST_F(CommandsTest, AlterAddRejectsIntegerOverflow) {
    ASSERT_EQ(run("insert", {"n", "9223372036854775807"}), kExitOk);
    EXPECT_EQ(run("alter-add", {"n", "1"}), kExitUsage);
    ASSERT_EQ(run("get", {"n"}), kExitOk);
    EXPECT_EQ(out_.str(), "9223372036854775807\n");

    EXPECT_EQ(run("alter-add", {"n", "-9223372036854775807"}), kExitOk);
    EXPECT_EQ(out_.str(), "0\n");

    // Unsigned amounts past int64 never reach the store.
    EXPECT_EQ(run("alter-add", {"m", "18446744073709551615"}), kExitUsage);
    EXPECT_EQ(run("get", {"m"}), kExitStoreError);

    ASSERT_EQ(run("insert", {"u", "18446744073709551615"}), kExitOk);
    EXPECT_EQ(run("alter-add", {"u", "-1"}), kExitUsage);
}

TEST_F(CommandsTest, KeysLenContainsDumpClear) {
    ASSERT_EQ(run("insert", {"a", "1"}), kExitOk);
    ASSERT_EQ(run("insert", {"b", "[true]"}), kExitOk);

    ASSERT_EQ(run("len"), kExitOk);
    EXPECT_EQ(out_.str(), "2\n");

    ASSERT_EQ(run("contains", {"a"}), kExitOk);
    EXPECT_EQ(out_.str(), "true\n");
    ASSERT_EQ(run("contains", {"z"}), kExitOk);
    EXPECT_EQ(out_.str(), "false\n");

    ASSERT_EQ(run("keys"), kExitOk);
    const auto keys = out_.str();
    EXPECT_TRUE(keys == "a\nb\n" || keys == "b\na\n") << keys;

    ASSERT_EQ(run("dump"), kExitOk);
    EXPECT_EQ(nlohmann::json::parse(out_.str()),
              nlohmann::json({{"a", 1}, {"b", nlohmann::json::array({true})}}));

    ASSERT_EQ(run("clear"), kExitOk);
    ASSERT_EQ(run("len"), kExitOk);
    EXPECT_EQ(out_.str(), "0\n");
}

TEST_F(CommandsTest, UnknownCommand) {
    EXPECT_EQ(run("frobnicate"), kExitUsage);
}

} // namespace diskmap::cli
