#ifndef AGENTCHAT_TYPES_HPP
#define AGENTCHAT_TYPES_HPP

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentchat
{

// JSON type alias
using json = nlohmann::json;

// Callback for agent stderr output
using StderrCallback = std::function<void(const std::string& line)>;

// Token counters reported with assistant messages
struct UsageInfo
{
    long long input_tokens = 0;
    long long output_tokens = 0;
    long long cache_read_input_tokens = 0;
    long long cache_creation_input_tokens = 0;

    bool operator==(const UsageInfo& other) const
    {
        return input_tokens == other.input_tokens && output_tokens == other.output_tokens &&
               cache_read_input_tokens == other.cache_read_input_tokens &&
               cache_creation_input_tokens == other.cache_creation_input_tokens;
    }
};

UsageInfo usage_from_json(const json& j);
json usage_to_json(const UsageInfo& usage);

// Content block types carried by assistant and user records
struct TextBlock
{
    std::string type = "text";
    std::string text;
};

struct ThinkingBlock
{
    std::string type = "thinking";
    std::string thinking;
};

struct ToolUseBlock
{
    std::string type = "tool_use";
    std::string id;
    std::string name;
    json input;
};

struct ToolResultBlock
{
    std::string type = "tool_result";
    std::string tool_use_id;
    json content; // Can be string, array of content blocks, or null
    bool is_error = false;
};

// Assistant content block variant
using ContentBlock = std::variant<TextBlock, ThinkingBlock, ToolUseBlock>;

// ============================================================================
// Protocol events (one per framed stdout line)
// ============================================================================

struct SystemInitEvent
{
    std::string session_id;
    std::vector<std::string> tools;
    std::vector<std::string> mcp_servers;
    json raw_json;
};

struct SystemStatusEvent
{
    std::string status;
    bool compacting = false;
    json raw_json;
};

struct CompactBoundaryEvent
{
    std::optional<std::string> trigger;
    std::optional<long long> pre_tokens;
    json raw_json;
};

// Complete assistant record: text, thinking and tool-use blocks
struct AssistantEvent
{
    std::vector<ContentBlock> content;
    std::optional<UsageInfo> usage;
    std::string model;
    json raw_json;
};

// Streaming fragment (stream_event deltas when partial messages are enabled)
struct AssistantDeltaEvent
{
    enum class Kind
    {
        Text,
        Thinking
    };

    Kind kind = Kind::Text;
    std::string text;
    std::optional<UsageInfo> usage;
    bool final = false;
};

// User record echoed by the agent; carries tool results
struct UserEvent
{
    std::vector<ToolResultBlock> content;
    json raw_json;
};

// Agent-initiated control request (tool permission query)
struct ControlRequestEvent
{
    std::string request_id;
    std::string subtype;
    std::string tool_name;
    json input;
    std::string tool_use_id;
    json permission_suggestions; // null when absent
    std::optional<std::string> decision_reason;
    std::optional<std::string> blocked_path;
    json raw_json;
};

struct ResultEvent
{
    std::string subtype; // "success" | "error_*"
    std::optional<std::string> session_id;
    std::optional<double> total_cost_usd;
    std::optional<long long> duration_ms;
    std::optional<int> num_turns;
    bool is_error = false;
    std::string result; // Final text or diagnostic reported by the agent
    json raw_json;
};

using ProtocolEvent =
    std::variant<SystemInitEvent, SystemStatusEvent, CompactBoundaryEvent, AssistantEvent,
                 AssistantDeltaEvent, UserEvent, ControlRequestEvent, ResultEvent>;

inline bool is_result_event(const ProtocolEvent& event)
{
    return std::holds_alternative<ResultEvent>(event);
}

inline bool is_control_request(const ProtocolEvent& event)
{
    return std::holds_alternative<ControlRequestEvent>(event);
}

// Concatenated text blocks of an assistant record
std::string get_text_content(const std::vector<ContentBlock>& content);

// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string iso_timestamp_now();

// ============================================================================
// Turn input
// ============================================================================

struct ImageAttachment
{
    std::string media_type; // e.g. "image/png"
    std::string data;       // base64 payload
};

struct TurnPayload
{
    std::string text;
    std::vector<ImageAttachment> images;
};

// Parse "data:image/<kind>;base64,<payload>" into an attachment
std::optional<ImageAttachment> parse_image_data_url(const std::string& data_url);

// ============================================================================
// Configuration
// ============================================================================

// Per-turn options used to build the agent command line
struct SendOptions
{
    std::optional<std::string> session_id; // Resume this agent session when set
    bool continue_conversation = false;    // --continue (only with a session id)
    bool auto_approve = false;             // "yolo": skip all permission checks
    bool plan_mode = false;
    std::string effort;           // Thinking depth; empty disables --effort
    std::string model = "default"; // "default" leaves the agent's choice
    std::string mcp_config;       // Path to an MCP configuration file
    std::vector<std::string> allowed_tools;
    std::vector<std::string> disallowed_tools;
    int max_turns = 0;
    bool include_partial_messages = false;
};

// Process-level options shared by all turns
struct AgentOptions
{
    // Optional explicit path to the agent executable.
    // If empty, AGENTCHAT_AGENT_PATH, PATH and ~/.claude/local are searched.
    std::string agent_path;

    // Security: when non-empty, the resolved binary must be one of these paths
    std::vector<std::string> allowed_agent_paths;

    // Security: expected SHA-256 (hex) of the agent binary
    std::optional<std::string> agent_hash_sha256;

    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;

    /// Callback invoked for every non-empty stderr line of the agent process.
    /// Executes on the stderr reader thread.
    std::optional<StderrCallback> stderr_callback;

    // Grace period between SIGTERM and SIGKILL when stopping a run
    int stop_grace_ms = 500;

    // Maximum bytes buffered for one incomplete stdout line
    size_t max_line_buffer_size = 1024 * 1024;
};

} // namespace agentchat

#endif // AGENTCHAT_TYPES_HPP
