/**
 * @file daemon_args_test.cpp
 * @brief Tests for lanmonitord argument parsing.
 */

#include "lanmonitor/DaemonArgs.h"

#include <gtest/gtest.h>

using namespace LanMonitor;

TEST(DaemonArgsTest, NoArgumentsRunsLoopWithDefaults) {
    const char* argv[] = {"lanmonitord"};
    DaemonArgs a = DaemonArgs::parseOrThrow(1, argv);
    EXPECT_FALSE(a.showHelp);
    EXPECT_FALSE(a.once);
    EXPECT_FALSE(a.noDeep);
    EXPECT_FALSE(a.verbose);
    EXPECT_TRUE(a.configPath.empty());
    EXPECT_FALSE(a.subnet.has_value());
}

TEST(DaemonArgsTest, HelpFlagSetsShowHelp) {
    const char* argv[] = {"lanmonitord", "-h"};
    DaemonArgs a = DaemonArgs::parseOrThrow(2, argv);
    EXPECT_TRUE(a.showHelp);
}

TEST(DaemonArgsTest, ParsesValuesAndFlags) {
    const char* argv[] = {"lanmonitord", "--config", "/etc/lanmonitor.json",
                          "--subnet", "10.0.0.0/24", "--once", "--no-deep"};
    DaemonArgs a = DaemonArgs::parseOrThrow(7, argv);
    EXPECT_EQ(a.configPath, "/etc/lanmonitor.json");
    ASSERT_TRUE(a.subnet.has_value());
    EXPECT_EQ(*a.subnet, "10.0.0.0/24");
    EXPECT_TRUE(a.once);
    EXPECT_TRUE(a.noDeep);
}

TEST(DaemonArgsTest, MissingValueThrows) {
    const char* argv[] = {"lanmonitord", "--subnet"};
    EXPECT_THROW((void)DaemonArgs::parseOrThrow(2, argv), std::runtime_error);
}

TEST(DaemonArgsTest, UnknownArgumentThrows) {
    const char* argv[] = {"lanmonitord", "--bogus"};
    EXPECT_THROW((void)DaemonArgs::parseOrThrow(2, argv), std::runtime_error);
}

TEST(DaemonArgsTest, VerboseFlagHasShortForm) {
    const char* longForm[] = {"lanmonitord", "--verbose"};
    EXPECT_TRUE(DaemonArgs::parseOrThrow(2, longForm).verbose);

    const char* shortForm[] = {"lanmonitord", "-v", "--once"};
    DaemonArgs a = DaemonArgs::parseOrThrow(3, shortForm);
    EXPECT_TRUE(a.verbose);
    EXPECT_TRUE(a.once);
}
