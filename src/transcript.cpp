#include <agentchat/transcript.hpp>

namespace agentchat
{

namespace
{

// Text payload of entries whose data may be a bare string or {"<key>": string}
std::string text_field(const json& data, const char* key)
{
    if (data.is_string())
        return data.get<std::string>();
    if (data.is_object() && data.contains(key) && data[key].is_string())
        return data[key].get<std::string>();
    return "";
}

std::string string_field(const json& data, const char* key)
{
    if (data.is_object() && data.contains(key) && data[key].is_string())
        return data[key].get<std::string>();
    return "";
}

std::optional<long long> optional_number(const json& data, const char* key)
{
    if (data.is_object() && data.contains(key) && data[key].is_number())
        return data[key].get<long long>();
    return std::nullopt;
}

bool flag(const json& data, const char* key, bool fallback = false)
{
    if (data.is_object() && data.contains(key) && data[key].is_boolean())
        return data[key].get<bool>();
    return fallback;
}

UsageInfo merge_usage(const std::optional<UsageInfo>& base, const UsageInfo& extra)
{
    UsageInfo usage = base.value_or(UsageInfo{});
    usage.input_tokens += extra.input_tokens;
    usage.output_tokens += extra.output_tokens;
    usage.cache_read_input_tokens += extra.cache_read_input_tokens;
    usage.cache_creation_input_tokens += extra.cache_creation_input_tokens;
    return usage;
}

struct EntryJsonVisitor
{
    json& out;

    void operator()(const UserEntry& e) const
    {
        out["kind"] = "user";
        out["text"] = e.text;
    }

    void operator()(const AssistantEntry& e) const
    {
        out["kind"] = "assistant";
        out["content"] = e.content;
        out["streaming"] = e.streaming;
        out["usage"] = e.usage ? usage_to_json(*e.usage) : json(nullptr);
    }

    void operator()(const ThinkingEntry& e) const
    {
        out["kind"] = "thinking";
        out["content"] = e.content;
    }

    void operator()(const ToolUseEntry& e) const
    {
        out["kind"] = "toolUse";
        out["toolUseId"] = e.tool_use_id;
        out["toolName"] = e.tool_name;
        out["input"] = e.input;
        out["status"] = to_string(e.status);
        out["durationMs"] = e.duration_ms ? json(*e.duration_ms) : json(nullptr);
        out["tokens"] = e.tokens ? json(*e.tokens) : json(nullptr);
    }

    void operator()(const ToolResultEntry& e) const
    {
        out["kind"] = "toolResult";
        out["toolUseId"] = e.tool_use_id;
        out["toolName"] = e.tool_name;
        out["content"] = e.content;
        out["isError"] = e.is_error;
    }

    void operator()(const ErrorEntry& e) const
    {
        out["kind"] = "error";
        out["message"] = e.message;
    }
};

} // namespace

// ============================================================================
// LogEntry
// ============================================================================

json LogEntry::to_json() const
{
    return {{"type", type}, {"data", data}, {"timestamp", timestamp}};
}

LogEntry LogEntry::from_json(const json& j)
{
    LogEntry entry;
    if (j.contains("type") && j["type"].is_string())
        entry.type = j["type"].get<std::string>();
    else
        entry.type = j.at("messageType").get<std::string>();

    if (j.contains("data"))
        entry.data = j["data"];
    entry.timestamp = j.value("timestamp", "");
    return entry;
}

LogEntry make_log_entry(const std::string& type, json data)
{
    return LogEntry{type, std::move(data), iso_timestamp_now()};
}

const char* to_string(ToolStatus status)
{
    switch (status)
    {
    case ToolStatus::Executing:
        return "executing";
    case ToolStatus::Completed:
        return "completed";
    case ToolStatus::Failed:
        return "failed";
    }
    return "executing";
}

json entry_to_json(const ConversationEntry& entry)
{
    json out = {{"id", entry.id}, {"timestamp", entry.timestamp}};
    std::visit(EntryJsonVisitor{out}, entry.body);
    return out;
}

json transcript_to_json(const Transcript& transcript)
{
    json out = json::array();
    for (const auto& entry : transcript)
        out.push_back(entry_to_json(entry));
    return out;
}

// ============================================================================
// ConversationReducer
// ============================================================================

void ConversationReducer::apply(const LogEntry& entry)
{
    const std::string& type = entry.type;

    if (type == "userInput")
        on_user_input(entry);
    else if (type == "output")
        on_output(entry);
    else if (type == "thinking")
        on_thinking(entry);
    else if (type == "toolUse")
        on_tool_use(entry);
    else if (type == "toolResult")
        on_tool_result(entry);
    else if (type == "updateTokens")
        on_token_usage(entry);
    else if (type == "error")
        on_error(entry);
    // sessionInfo, compacting, compactBoundary and UI-only records: no entry
}

void ConversationReducer::finish()
{
    close_open_assistant();
}

void ConversationReducer::reset()
{
    entries_.clear();
    open_assistant_.reset();
    pending_usage_.reset();
    tool_index_.clear();
    next_id_ = 0;
}

Transcript ConversationReducer::replay(const std::vector<LogEntry>& log)
{
    ConversationReducer reducer;
    for (const auto& entry : log)
        reducer.apply(entry);
    reducer.finish();
    return reducer.transcript();
}

void ConversationReducer::on_user_input(const LogEntry& entry)
{
    close_open_assistant();
    append(entry, UserEntry{text_field(entry.data, "text")});
}

void ConversationReducer::on_output(const LogEntry& entry)
{
    const std::string text = text_field(entry.data, "text");
    // A bare string is a complete message
    const bool final = entry.data.is_string() || flag(entry.data, "final");

    if (AssistantEntry* open = open_entry())
    {
        open->content += text;
        if (final)
            close_open_assistant();
        return;
    }

    if (final && text.empty())
        return; // Nothing to finalize

    AssistantEntry assistant;
    assistant.content = text;
    assistant.streaming = !final;
    assistant.usage = pending_usage_;
    pending_usage_.reset();

    size_t index = append(entry, std::move(assistant));
    if (!final)
        open_assistant_ = index;
}

void ConversationReducer::on_thinking(const LogEntry& entry)
{
    close_open_assistant();
    append(entry, ThinkingEntry{text_field(entry.data, "text")});
}

void ConversationReducer::on_tool_use(const LogEntry& entry)
{
    close_open_assistant();

    ToolUseEntry tool;
    tool.tool_use_id = string_field(entry.data, "toolUseId");
    tool.tool_name = string_field(entry.data, "toolName");
    if (entry.data.is_object() && entry.data.contains("rawInput"))
        tool.input = entry.data["rawInput"];
    else
        tool.input = json::object();

    const std::string id = tool.tool_use_id;
    size_t index = append(entry, std::move(tool));
    if (!id.empty())
        tool_index_[id] = index;
}

void ConversationReducer::on_tool_result(const LogEntry& entry)
{
    close_open_assistant();

    const json& data = entry.data;
    ToolResultEntry result;
    result.tool_use_id = string_field(data, "toolUseId");
    result.tool_name = string_field(data, "toolName");
    result.is_error = flag(data, "isError");

    if (data.is_object() && data.contains("content"))
        result.content = data["content"].is_string() ? data["content"].get<std::string>()
                                                     : data["content"].dump(2);

    auto it = tool_index_.find(result.tool_use_id);
    if (it != tool_index_.end())
    {
        auto& tool = std::get<ToolUseEntry>(entries_[it->second].body);
        if (tool.status == ToolStatus::Executing)
        {
            tool.status = result.is_error ? ToolStatus::Failed : ToolStatus::Completed;
            if (auto duration = optional_number(data, "durationMs"))
                tool.duration_ms = duration;
            if (auto tokens = optional_number(data, "tokens"))
                tool.tokens = tokens;
        }
        if (result.tool_name.empty())
            result.tool_name = tool.tool_name;
    }

    if (!flag(data, "hidden"))
        append(entry, std::move(result));
}

void ConversationReducer::on_token_usage(const LogEntry& entry)
{
    const json& data = entry.data;
    UsageInfo usage =
        usage_from_json(data.is_object() && data.contains("usage") ? data["usage"] : data);

    if (AssistantEntry* open = open_entry())
    {
        if (!open->usage)
        {
            open->usage = usage;
            return;
        }
    }

    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
    {
        auto* assistant = std::get_if<AssistantEntry>(&it->body);
        if (assistant && !assistant->usage)
        {
            assistant->usage = usage;
            return;
        }
    }

    pending_usage_ = merge_usage(pending_usage_, usage);
}

void ConversationReducer::on_error(const LogEntry& entry)
{
    close_open_assistant();
    append(entry, ErrorEntry{text_field(entry.data, "message")});
}

void ConversationReducer::close_open_assistant()
{
    if (AssistantEntry* open = open_entry())
        open->streaming = false;
    open_assistant_.reset();
}

AssistantEntry* ConversationReducer::open_entry()
{
    if (!open_assistant_)
        return nullptr;
    return std::get_if<AssistantEntry>(&entries_[*open_assistant_].body);
}

size_t ConversationReducer::append(const LogEntry& source, EntryBody body)
{
    ConversationEntry entry;
    entry.id = "entry-" + std::to_string(next_id_++);
    entry.timestamp = source.timestamp;
    entry.body = std::move(body);
    entries_.push_back(std::move(entry));
    return entries_.size() - 1;
}

} // namespace agentchat
