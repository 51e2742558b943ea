#include <agentchat/turn_processor.hpp>

namespace agentchat
{

const std::set<std::string> HIDDEN_RESULT_TOOLS = {"Read", "TodoWrite"};

namespace
{
std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string result_text(const json& content)
{
    if (content.is_null())
        return "Tool executed successfully";
    if (content.is_string())
    {
        auto text = content.get<std::string>();
        return text.empty() ? "Tool executed successfully" : text;
    }
    return content.dump(2);
}
} // namespace

std::vector<LogEntry> TurnProcessor::process(const ProtocolEvent& event, SessionState& state)
{
    if (auto* init = std::get_if<SystemInitEvent>(&event))
        return on_system_init(*init, state);
    if (auto* status = std::get_if<SystemStatusEvent>(&event))
        return on_status(*status);
    if (auto* boundary = std::get_if<CompactBoundaryEvent>(&event))
        return on_compact_boundary(*boundary, state);
    if (auto* assistant = std::get_if<AssistantEvent>(&event))
        return on_assistant(*assistant, state);
    if (auto* delta = std::get_if<AssistantDeltaEvent>(&event))
        return on_delta(*delta, state);
    if (auto* user = std::get_if<UserEvent>(&event))
        return on_user(*user, state);
    if (auto* result = std::get_if<ResultEvent>(&event))
        return on_result(*result, state);

    // Control requests never reach the transcript
    return {};
}

void TurnProcessor::reset()
{
    tool_names_.clear();
    streamed_text_ = false;
}

std::vector<LogEntry> TurnProcessor::on_system_init(const SystemInitEvent& event,
                                                    SessionState& state)
{
    if (!event.session_id.empty())
        state.set_session_id(event.session_id);

    return {make_log_entry("sessionInfo", {{"sessionId", event.session_id},
                                           {"tools", event.tools},
                                           {"mcpServers", event.mcp_servers}})};
}

std::vector<LogEntry> TurnProcessor::on_status(const SystemStatusEvent& event)
{
    return {make_log_entry("compacting", {{"isCompacting", event.compacting}})};
}

std::vector<LogEntry> TurnProcessor::on_compact_boundary(const CompactBoundaryEvent& event,
                                                         SessionState& state)
{
    // Context was summarized; earlier token counts no longer apply
    state.reset_token_counts();

    json data = json::object();
    data["trigger"] = event.trigger ? json(*event.trigger) : json(nullptr);
    data["preTokens"] = event.pre_tokens ? json(*event.pre_tokens) : json(nullptr);
    return {make_log_entry("compactBoundary", data)};
}

std::vector<LogEntry> TurnProcessor::on_assistant(const AssistantEvent& event, SessionState& state)
{
    std::vector<LogEntry> entries;

    for (const auto& block : event.content)
    {
        if (auto* text = std::get_if<TextBlock>(&block))
        {
            if (streamed_text_)
            {
                // Fragments already carried the text; just close the entry
                entries.push_back(make_log_entry("output", {{"text", ""}, {"final", true}}));
                streamed_text_ = false;
                continue;
            }

            auto trimmed = trim(text->text);
            if (!trimmed.empty())
                entries.push_back(make_log_entry("output", {{"text", trimmed}, {"final", true}}));
        }
        else if (auto* thinking = std::get_if<ThinkingBlock>(&block))
        {
            auto trimmed = trim(thinking->thinking);
            if (!trimmed.empty())
                entries.push_back(make_log_entry("thinking", {{"text", trimmed}}));
        }
        else if (auto* tool = std::get_if<ToolUseBlock>(&block))
        {
            tool_names_[tool->id] = tool->name;

            ToolUseMetric metric;
            metric.start_time = std::chrono::steady_clock::now();
            metric.tool_name = tool->name;
            if (event.usage)
                metric.tokens = event.usage->output_tokens;
            state.set_tool_metric(tool->id, metric);

            entries.push_back(make_log_entry(
                "toolUse",
                {{"toolUseId", tool->id}, {"toolName", tool->name}, {"rawInput", tool->input}}));
        }
    }

    state.set_open_output(false);

    if (event.usage)
    {
        state.add_token_usage(*event.usage);
        entries.push_back(make_log_entry("updateTokens",
                                         {{"usage", usage_to_json(*event.usage)},
                                          {"totals", usage_to_json(state.token_totals())}}));
    }

    return entries;
}

std::vector<LogEntry> TurnProcessor::on_delta(const AssistantDeltaEvent& event,
                                              SessionState& state)
{
    // Thinking arrives whole in the assistant record that follows
    if (event.kind != AssistantDeltaEvent::Kind::Text || event.text.empty())
        return {};

    streamed_text_ = true;
    state.set_open_output(true);
    return {make_log_entry("output", {{"text", event.text}, {"final", event.final}})};
}

std::vector<LogEntry> TurnProcessor::on_user(const UserEvent& event, SessionState& state)
{
    std::vector<LogEntry> entries;

    for (const auto& block : event.content)
    {
        std::string tool_name;
        auto name_it = tool_names_.find(block.tool_use_id);
        if (name_it != tool_names_.end())
            tool_name = name_it->second;

        json data = {{"content", result_text(block.content)},
                     {"isError", block.is_error},
                     {"toolUseId", block.tool_use_id},
                     {"toolName", tool_name},
                     {"hidden", HIDDEN_RESULT_TOOLS.count(tool_name) > 0 && !block.is_error}};

        if (auto metric = state.take_tool_metric(block.tool_use_id))
        {
            auto elapsed = std::chrono::steady_clock::now() - metric->start_time;
            data["durationMs"] =
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
            if (metric->tokens)
                data["tokens"] = *metric->tokens;
        }

        entries.push_back(make_log_entry("toolResult", data));
    }

    return entries;
}

std::vector<LogEntry> TurnProcessor::on_result(const ResultEvent& event, SessionState& state)
{
    streamed_text_ = false;
    state.set_open_output(false);

    if (event.subtype != "success")
        return {};

    std::vector<LogEntry> entries;
    if (event.session_id && !event.session_id->empty())
    {
        state.set_session_id(*event.session_id);
        entries.push_back(make_log_entry("sessionInfo", {{"sessionId", *event.session_id},
                                                         {"tools", json::array()},
                                                         {"mcpServers", json::array()}}));
    }

    state.increment_request_count();
    if (event.total_cost_usd)
        state.add_cost(*event.total_cost_usd);

    return entries;
}

} // namespace agentchat
