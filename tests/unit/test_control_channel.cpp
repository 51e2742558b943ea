#include <agentchat/protocol/control.hpp>
#include <gtest/gtest.h>

using namespace agentchat;
using namespace agentchat::protocol;

namespace
{
ControlRequestEvent bash_request(const std::string& id, const std::string& command)
{
    ControlRequestEvent event;
    event.request_id = id;
    event.subtype = "can_use_tool";
    event.tool_name = "Bash";
    event.input = {{"command", command}};
    event.tool_use_id = "toolu_" + id;
    return event;
}
} // namespace

TEST(ControlChannelTest, RegisterAndTake)
{
    ControlChannel channel;
    auto pending = channel.register_request(bash_request("r1", "npm install lodash"));

    EXPECT_EQ(pending.request_id, "r1");
    EXPECT_EQ(pending.tool_use_id, "toolu_r1");
    ASSERT_TRUE(pending.pattern.has_value());
    EXPECT_EQ(*pending.pattern, "npm install *");
    EXPECT_TRUE(channel.is_pending("r1"));
    EXPECT_EQ(channel.pending_count(), 1u);

    auto taken = channel.take("r1");
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->tool_name, "Bash");
    EXPECT_FALSE(channel.is_pending("r1"));

    // Second take of the same id finds nothing
    EXPECT_FALSE(channel.take("r1").has_value());
}

TEST(ControlChannelTest, NonShellToolsCarryNoPattern)
{
    ControlChannel channel;
    ControlRequestEvent event;
    event.request_id = "r2";
    event.tool_name = "Write";
    event.input = {{"file_path", "/tmp/x"}};

    EXPECT_FALSE(channel.register_request(event).pattern.has_value());
}

TEST(ControlChannelTest, DiscardAllForgetsEverything)
{
    ControlChannel channel;
    channel.register_request(bash_request("a", "ls"));
    channel.register_request(bash_request("b", "pwd"));
    EXPECT_EQ(channel.pending().size(), 2u);

    channel.discard_all();
    EXPECT_EQ(channel.pending_count(), 0u);
    EXPECT_FALSE(channel.take("a").has_value());
}

TEST(ControlChannelTest, ClarifyingQuestionsNeedExplicitDecision)
{
    EXPECT_TRUE(ControlChannel::requires_explicit_decision("AskUserQuestion"));
    EXPECT_FALSE(ControlChannel::requires_explicit_decision("Bash"));
}

TEST(ControlChannelTest, AllowResponseShape)
{
    ControlChannel channel;
    auto event = bash_request("req-1", "git push");
    event.permission_suggestions = json::array({json{{"type", "addRules"}}});
    auto pending = channel.register_request(event);

    auto line = ControlChannel::build_response_message(pending, true, false);
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');

    auto msg = json::parse(line);
    EXPECT_EQ(msg["type"], "control_response");
    EXPECT_EQ(msg["response"]["subtype"], "success");
    EXPECT_EQ(msg["response"]["request_id"], "req-1");

    const auto& decision = msg["response"]["response"];
    EXPECT_EQ(decision["behavior"], "allow");
    EXPECT_EQ(decision["updatedInput"]["command"], "git push");
    EXPECT_EQ(decision["toolUseID"], "toolu_req-1");
    EXPECT_FALSE(decision.contains("updatedPermissions"));
}

TEST(ControlChannelTest, AlwaysAllowEchoesSuggestions)
{
    ControlChannel channel;
    auto event = bash_request("req-2", "git push");
    event.permission_suggestions = json::array({json{{"type", "addRules"}}});
    auto pending = channel.register_request(event);

    auto msg = json::parse(ControlChannel::build_response_message(pending, true, true));
    const auto& decision = msg["response"]["response"];
    ASSERT_TRUE(decision.contains("updatedPermissions"));
    EXPECT_EQ(decision["updatedPermissions"][0]["type"], "addRules");
}

TEST(ControlChannelTest, DenyResponseShape)
{
    ControlChannel channel;
    auto pending = channel.register_request(bash_request("req-3", "rm -rf build"));

    auto msg = json::parse(ControlChannel::build_response_message(pending, false, false));
    const auto& decision = msg["response"]["response"];
    EXPECT_EQ(decision["behavior"], "deny");
    EXPECT_EQ(decision["message"], "User denied permission");
    EXPECT_EQ(decision["interrupt"], true);
    EXPECT_EQ(decision["toolUseID"], "toolu_req-3");
    EXPECT_FALSE(decision.contains("updatedInput"));
}
