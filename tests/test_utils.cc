/**
 * @file test_utils.cc
 * @brief String and environment helpers
 */

#include <cstdlib>

#include <gtest/gtest.h>

#include "utils.h"

TEST(Split, SkipsEmptyComponents)
{
    EXPECT_EQ(split("https://github.com/greenbone/openvas-scanner", "/"),
              (std::vector<std::string>{"https:", "github.com", "greenbone",
                                        "openvas-scanner"}));
    EXPECT_EQ(split("a..b", "."), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(split("", "/").empty());
}

TEST(StartsWith, Prefixes)
{
    EXPECT_TRUE(StartsWith("v1.2.3", "v"));
    EXPECT_TRUE(StartsWith("v1.2.3", "v1.2"));
    EXPECT_TRUE(StartsWith("v1.2.3", ""));
    EXPECT_FALSE(StartsWith("1.2.3", "v"));
    EXPECT_FALSE(StartsWith("v", "v1"));
}

TEST(EndsWith, Suffixes)
{
    EXPECT_TRUE(EndsWith("scanner.git", ".git"));
    EXPECT_FALSE(EndsWith("git", ".git"));
    EXPECT_FALSE(EndsWith("scanner", ".git"));
}

TEST(GetEnv, FallbackWhenUnset)
{
    ::unsetenv("RELVER_TEST_UNSET");
    EXPECT_EQ(GetEnv("RELVER_TEST_UNSET", "branch"), "branch");
    EXPECT_EQ(GetEnv("RELVER_TEST_UNSET"), "");

    ::setenv("RELVER_TEST_SET", "tag", 1);
    EXPECT_EQ(GetEnv("RELVER_TEST_SET", "branch"), "tag");
    ::unsetenv("RELVER_TEST_SET");
}
