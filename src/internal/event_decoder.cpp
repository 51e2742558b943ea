#include "event_decoder.hpp"

#include <agentchat/errors.hpp>

namespace agentchat
{
namespace protocol
{

namespace
{
std::optional<std::string> optional_string(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}

std::vector<std::string> string_list(const json& j, const char* key)
{
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array())
        return out;

    for (const auto& item : j[key])
    {
        if (item.is_string())
            out.push_back(item.get<std::string>());
        else if (item.is_object() && item.contains("name") && item["name"].is_string())
            out.push_back(item["name"].get<std::string>());
    }
    return out;
}
} // namespace

std::optional<ProtocolEvent> EventDecoder::decode(const std::string& line)
{
    if (line.find_first_not_of(" \t\r\n") == std::string::npos)
        return std::nullopt;

    try
    {
        return parse_event(line);
    }
    catch (const AgentChatError&)
    {
        // Malformed agent output is skipped, never fatal
        return std::nullopt;
    }
}

ProtocolEvent EventDecoder::parse_event(const std::string& json_str)
{
    try
    {
        json j = json::parse(json_str);
        if (!j.is_object())
            throw MessageParseError("Record is not a JSON object", j);

        std::string type = j.at("type").get<std::string>();

        if (type == "assistant")
        {
            return parse_assistant_record(j);
        }
        else if (type == "user")
        {
            return parse_user_record(j);
        }
        else if (type == "system")
        {
            return parse_system_record(j);
        }
        else if (type == "stream_event")
        {
            return parse_stream_event(j);
        }
        else if (type == "control_request")
        {
            return parse_control_request(j);
        }
        else if (type == "result")
        {
            return parse_result_record(j);
        }
        else if (type == "compact_boundary")
        {
            return parse_compact_boundary(j);
        }
        else
        {
            throw MessageParseError("Unknown record type: " + type, j);
        }
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }
}

std::optional<ContentBlock> EventDecoder::parse_content_block(const json& j)
{
    std::string type = j.at("type").get<std::string>();

    if (type == "text")
    {
        TextBlock block;
        block.text = j.at("text").get<std::string>();
        return block;
    }
    else if (type == "thinking")
    {
        ThinkingBlock block;
        block.thinking = j.at("thinking").get<std::string>();
        return block;
    }
    else if (type == "tool_use")
    {
        ToolUseBlock block;
        block.id = j.at("id").get<std::string>();
        block.name = j.at("name").get<std::string>();
        block.input = j.value("input", json::object());
        return block;
    }

    // redacted_thinking, server tool blocks, etc.
    return std::nullopt;
}

ProtocolEvent EventDecoder::parse_system_record(const json& j)
{
    std::string subtype = j.value("subtype", "");

    if (subtype == "init")
    {
        SystemInitEvent event;
        event.session_id = j.value("session_id", "");
        event.tools = string_list(j, "tools");
        event.mcp_servers = string_list(j, "mcp_servers");
        event.raw_json = j;
        return event;
    }
    else if (subtype == "status")
    {
        SystemStatusEvent event;
        if (j.contains("status") && j["status"].is_string())
            event.status = j["status"].get<std::string>();
        event.compacting = event.status == "compacting";
        event.raw_json = j;
        return event;
    }
    else if (subtype == "compact_boundary")
    {
        return parse_compact_boundary(j);
    }

    throw MessageParseError("Unknown system subtype: " + subtype, j);
}

CompactBoundaryEvent EventDecoder::parse_compact_boundary(const json& j)
{
    CompactBoundaryEvent event;
    if (j.contains("compact_metadata") && j["compact_metadata"].is_object())
    {
        const auto& meta = j["compact_metadata"];
        event.trigger = optional_string(meta, "trigger");
        if (meta.contains("pre_tokens") && meta["pre_tokens"].is_number())
            event.pre_tokens = meta["pre_tokens"].get<long long>();
    }
    event.raw_json = j;
    return event;
}

AssistantEvent EventDecoder::parse_assistant_record(const json& j)
{
    AssistantEvent event;
    event.raw_json = j;

    // The agent wraps the model message in a "message" field
    const json& message = j.at("message");
    event.model = message.value("model", "");

    if (message.contains("content") && message["content"].is_array())
    {
        for (const auto& block_json : message["content"])
        {
            if (auto block = parse_content_block(block_json))
                event.content.push_back(std::move(*block));
        }
    }

    if (message.contains("usage") && message["usage"].is_object())
        event.usage = usage_from_json(message["usage"]);

    return event;
}

AssistantDeltaEvent EventDecoder::parse_stream_event(const json& j)
{
    const json& stream = j.at("event");
    std::string event_type = stream.value("type", "");

    if (event_type == "content_block_delta" && stream.contains("delta"))
    {
        const json& delta = stream["delta"];
        std::string delta_type = delta.value("type", "");

        AssistantDeltaEvent event;
        if (delta_type == "text_delta")
        {
            event.kind = AssistantDeltaEvent::Kind::Text;
            event.text = delta.at("text").get<std::string>();
            return event;
        }
        if (delta_type == "thinking_delta")
        {
            event.kind = AssistantDeltaEvent::Kind::Thinking;
            event.text = delta.at("thinking").get<std::string>();
            return event;
        }
    }

    throw MessageParseError("Unhandled stream event: " + event_type, j);
}

UserEvent EventDecoder::parse_user_record(const json& j)
{
    UserEvent event;
    event.raw_json = j;

    const json& message = j.at("message");
    if (!message.contains("content") || !message["content"].is_array())
        return event; // Plain text echo of the prompt

    for (const auto& block_json : message["content"])
    {
        if (block_json.value("type", "") != "tool_result")
            continue;

        ToolResultBlock block;
        block.tool_use_id = block_json.value("tool_use_id", "");
        if (block_json.contains("content"))
            block.content = block_json["content"];
        if (block_json.contains("is_error") && block_json["is_error"].is_boolean())
            block.is_error = block_json["is_error"].get<bool>();
        event.content.push_back(std::move(block));
    }

    return event;
}

ControlRequestEvent EventDecoder::parse_control_request(const json& j)
{
    ControlRequestEvent event;
    event.raw_json = j;
    event.request_id = j.at("request_id").get<std::string>();

    const json& request = j.at("request");
    event.subtype = request.value("subtype", "");
    event.tool_name = request.value("tool_name", "Unknown Tool");
    event.input = request.value("input", json::object());
    event.tool_use_id = request.value("tool_use_id", event.request_id);

    if (request.contains("permission_suggestions") &&
        request["permission_suggestions"].is_array())
        event.permission_suggestions = request["permission_suggestions"];

    event.decision_reason = optional_string(request, "decision_reason");
    event.blocked_path = optional_string(request, "blocked_path");
    return event;
}

ResultEvent EventDecoder::parse_result_record(const json& j)
{
    ResultEvent event;
    event.raw_json = j;
    event.subtype = j.value("subtype", "");
    event.session_id = optional_string(j, "session_id");

    if (j.contains("total_cost_usd") && j["total_cost_usd"].is_number())
        event.total_cost_usd = j["total_cost_usd"].get<double>();
    if (j.contains("duration_ms") && j["duration_ms"].is_number())
        event.duration_ms = j["duration_ms"].get<long long>();
    if (j.contains("num_turns") && j["num_turns"].is_number_integer())
        event.num_turns = j["num_turns"].get<int>();
    if (j.contains("is_error") && j["is_error"].is_boolean())
        event.is_error = j["is_error"].get<bool>();
    if (j.contains("result") && j["result"].is_string())
        event.result = j["result"].get<std::string>();

    return event;
}

} // namespace protocol
} // namespace agentchat
