#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/HelpCommand.hpp"

using namespace evidhash;

class HelpCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerBuiltinCommands();
        oldOut = std::cout.rdbuf(out.rdbuf());
        oldErr = std::cerr.rdbuf(err.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldOut);
        std::cerr.rdbuf(oldErr);
    }

    AppContext ctx;
    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* oldOut{nullptr};
    std::streambuf* oldErr{nullptr};
};

// Test: Builtin registration exposes hash, detect and help
TEST_F(HelpCommandTest, BuiltinsRegistered) {
    auto& factory = CommandFactory::instance();
    EXPECT_TRUE(factory.contains("hash"));
    EXPECT_TRUE(factory.contains("detect"));
    EXPECT_TRUE(factory.contains("help"));
    EXPECT_FALSE(factory.contains("commit"));
    EXPECT_TRUE(factory.create("nope") == nullptr);

    auto cmds = factory.listCommands();
    ASSERT_EQ(cmds.size(), 3u);
    EXPECT_STREQ(cmds[0]->name(), "detect");
    EXPECT_STREQ(cmds[1]->name(), "hash");
    EXPECT_STREQ(cmds[2]->name(), "help");
}

// Test: Bare help lists every command
TEST_F(HelpCommandTest, ListsCommands) {
    HelpCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {}).has_value());
    const std::string text = out.str();
    EXPECT_EQ(text.rfind("usage: evidhash <command> [options]", 0), 0u);
    EXPECT_NE(text.find("  hash\t"), std::string::npos);
    EXPECT_NE(text.find("  detect\t"), std::string::npos);
    EXPECT_NE(text.find("EVIDHASH_LOG"), std::string::npos);
}

// Test: help <command> prints its synopsis and options
TEST_F(HelpCommandTest, CommandDetail) {
    HelpCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {"hash"}).has_value());
    EXPECT_NE(out.str().find("SYNOPSIS:\n  evidhash hash"), std::string::npos);
    EXPECT_NE(out.str().find("--no-detect"), std::string::npos);
}

// Test: An unknown topic warns and falls back to the listing
TEST_F(HelpCommandTest, UnknownTopic) {
    HelpCommand cmd;
    CommandInvoker invoker;
    EXPECT_EQ(invoker.run(cmd, ctx, {"frobnicate"}), 0);
    EXPECT_NE(err.str().find("Unknown help topic: frobnicate"), std::string::npos);
    EXPECT_NE(out.str().find("Commands:"), std::string::npos);
}

// Test: Exit code mapping
TEST(CommandInvokerTest, ExitCodes) {
    EXPECT_EQ(CommandInvoker::exitCodeFor(Expected<void>{}), 0);
    EXPECT_EQ(CommandInvoker::exitCodeFor(Expected<void>{Error{ErrorCode::Cancelled, "stop"}}), 1);
    EXPECT_EQ(CommandInvoker::exitCodeFor(Expected<void>{Error{ErrorCode::InvalidArgs, "bad"}}), 1);
}
