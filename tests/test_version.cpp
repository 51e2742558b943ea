#include <agentchat/version.hpp>
#include <algorithm>
#include <gtest/gtest.h>

TEST(VersionTest, VersionString)
{
    std::string version = agentchat::version_string();
    EXPECT_FALSE(version.empty());
    std::string expected = std::to_string(agentchat::VERSION_MAJOR) + "." +
                           std::to_string(agentchat::VERSION_MINOR) + "." +
                           std::to_string(agentchat::VERSION_PATCH);
    EXPECT_EQ(version, expected);
}

TEST(VersionTest, HasThreeComponents)
{
    std::string version = agentchat::version_string();
    EXPECT_EQ(std::count(version.begin(), version.end(), '.'), 2);
}
