#include <agentchat/session_state.hpp>
#include <gtest/gtest.h>

using namespace agentchat;

TEST(SessionStateTest, Defaults)
{
    SessionState state;
    EXPECT_FALSE(state.is_processing());
    EXPECT_FALSE(state.has_open_output());
    EXPECT_DOUBLE_EQ(state.total_cost(), 0.0);
    EXPECT_EQ(state.request_count(), 0);
    EXPECT_FALSE(state.session_id().has_value());
    EXPECT_EQ(state.selected_model(), "default");
}

TEST(SessionStateTest, TokenUsageAccumulates)
{
    SessionState state;
    UsageInfo usage;
    usage.input_tokens = 100;
    usage.output_tokens = 20;
    usage.cache_read_input_tokens = 5;

    state.add_token_usage(usage);
    state.add_token_usage(usage);

    EXPECT_EQ(state.total_tokens_input(), 200);
    EXPECT_EQ(state.total_tokens_output(), 40);
    EXPECT_EQ(state.total_cache_read_tokens(), 10);
    EXPECT_EQ(state.total_cache_creation_tokens(), 0);

    state.reset_token_counts();
    EXPECT_EQ(state.token_totals(), UsageInfo{});
}

TEST(SessionStateTest, ToolMetricsAreTakenOnce)
{
    SessionState state;
    ToolUseMetric metric;
    metric.start_time = std::chrono::steady_clock::now();
    metric.tool_name = "Bash";
    metric.tokens = 12;

    state.set_tool_metric("t1", metric);
    EXPECT_EQ(state.pending_tool_count(), 1u);

    auto taken = state.take_tool_metric("t1");
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->tool_name, "Bash");
    EXPECT_EQ(taken->tokens.value_or(0), 12);
    EXPECT_FALSE(state.take_tool_metric("t1").has_value());
}

TEST(SessionStateTest, ResetSessionKeepsModelAndDraft)
{
    SessionState state;
    state.set_selected_model("opus");
    state.set_draft_message("half typed");
    state.set_session_id(std::string("sess-1"));
    state.add_cost(0.5);
    state.increment_request_count();
    state.set_processing(true);
    state.set_tool_metric("t1", ToolUseMetric{});

    state.reset_session();

    EXPECT_FALSE(state.session_id().has_value());
    EXPECT_DOUBLE_EQ(state.total_cost(), 0.0);
    EXPECT_EQ(state.request_count(), 0);
    EXPECT_FALSE(state.is_processing());
    EXPECT_EQ(state.pending_tool_count(), 0u);
    EXPECT_EQ(state.selected_model(), "opus");
    EXPECT_EQ(state.draft_message(), "half typed");
}

TEST(SessionStateTest, RestoreFromConversation)
{
    SessionState state;
    state.increment_request_count();
    state.restore_from_conversation(1.25, 300, 40, std::string("sess-2"));

    EXPECT_DOUBLE_EQ(state.total_cost(), 1.25);
    EXPECT_EQ(state.total_tokens_input(), 300);
    EXPECT_EQ(state.total_tokens_output(), 40);
    EXPECT_EQ(state.session_id().value_or(""), "sess-2");
    EXPECT_EQ(state.request_count(), 0);

    auto j = state.to_json();
    EXPECT_EQ(j["sessionId"], "sess-2");
    EXPECT_EQ(j["totalTokensInput"], 300);
    EXPECT_EQ(j["selectedModel"], "default");
}
