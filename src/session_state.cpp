#include <agentchat/session_state.hpp>

namespace agentchat
{

void SessionState::add_token_usage(const UsageInfo& usage)
{
    totals_.input_tokens += usage.input_tokens;
    totals_.output_tokens += usage.output_tokens;
    totals_.cache_read_input_tokens += usage.cache_read_input_tokens;
    totals_.cache_creation_input_tokens += usage.cache_creation_input_tokens;
}

void SessionState::reset_token_counts()
{
    totals_ = UsageInfo{};
}

void SessionState::add_cost(double cost)
{
    total_cost_ += cost;
}

void SessionState::increment_request_count()
{
    ++request_count_;
}

void SessionState::set_tool_metric(const std::string& tool_use_id, ToolUseMetric metric)
{
    tool_metrics_[tool_use_id] = std::move(metric);
}

std::optional<ToolUseMetric> SessionState::take_tool_metric(const std::string& tool_use_id)
{
    auto it = tool_metrics_.find(tool_use_id);
    if (it == tool_metrics_.end())
        return std::nullopt;

    ToolUseMetric metric = std::move(it->second);
    tool_metrics_.erase(it);
    return metric;
}

void SessionState::reset_session()
{
    total_cost_ = 0.0;
    totals_ = UsageInfo{};
    request_count_ = 0;
    is_processing_ = false;
    has_open_output_ = false;
    session_id_.reset();
    tool_metrics_.clear();
}

void SessionState::restore_from_conversation(double total_cost, long long tokens_input,
                                             long long tokens_output,
                                             std::optional<std::string> session_id)
{
    reset_session();
    total_cost_ = total_cost;
    totals_.input_tokens = tokens_input;
    totals_.output_tokens = tokens_output;
    session_id_ = std::move(session_id);
}

json SessionState::to_json() const
{
    return {{"isProcessing", is_processing_},
            {"totalCost", total_cost_},
            {"totalTokensInput", totals_.input_tokens},
            {"totalTokensOutput", totals_.output_tokens},
            {"totalCacheReadTokens", totals_.cache_read_input_tokens},
            {"totalCacheCreationTokens", totals_.cache_creation_input_tokens},
            {"requestCount", request_count_},
            {"sessionId", session_id_ ? json(*session_id_) : json(nullptr)},
            {"selectedModel", selected_model_}};
}

} // namespace agentchat
