#ifndef AGENTCHAT_SESSION_STATE_HPP
#define AGENTCHAT_SESSION_STATE_HPP

#include <agentchat/types.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace agentchat
{

// Bookkeeping for an in-flight tool invocation
struct ToolUseMetric
{
    std::chrono::steady_clock::time_point start_time;
    std::string tool_name;
    std::optional<long long> tokens;
};

/**
 * Per-conversation counters and flags.
 *
 * Owned by exactly one conversation; not synchronized (the owner serializes
 * access).
 */
class SessionState
{
  public:
    bool is_processing() const { return is_processing_; }
    void set_processing(bool processing) { is_processing_ = processing; }

    bool has_open_output() const { return has_open_output_; }
    void set_open_output(bool open) { has_open_output_ = open; }

    double total_cost() const { return total_cost_; }
    long long total_tokens_input() const { return totals_.input_tokens; }
    long long total_tokens_output() const { return totals_.output_tokens; }
    long long total_cache_read_tokens() const { return totals_.cache_read_input_tokens; }
    long long total_cache_creation_tokens() const { return totals_.cache_creation_input_tokens; }
    const UsageInfo& token_totals() const { return totals_; }
    int request_count() const { return request_count_; }

    const std::optional<std::string>& session_id() const { return session_id_; }
    void set_session_id(std::optional<std::string> id) { session_id_ = std::move(id); }

    const std::string& selected_model() const { return selected_model_; }
    void set_selected_model(const std::string& model) { selected_model_ = model; }

    const std::string& draft_message() const { return draft_message_; }
    void set_draft_message(const std::string& draft) { draft_message_ = draft; }

    void add_token_usage(const UsageInfo& usage);
    void reset_token_counts();
    void add_cost(double cost);
    void increment_request_count();

    void set_tool_metric(const std::string& tool_use_id, ToolUseMetric metric);
    std::optional<ToolUseMetric> take_tool_metric(const std::string& tool_use_id);
    size_t pending_tool_count() const { return tool_metrics_.size(); }

    // New session: clears counters, agent session id and tool metrics.
    // The selected model and draft survive.
    void reset_session();

    // Seed totals from a persisted conversation
    void restore_from_conversation(double total_cost, long long tokens_input,
                                   long long tokens_output,
                                   std::optional<std::string> session_id);

    json to_json() const;

  private:
    bool is_processing_ = false;
    bool has_open_output_ = false;
    double total_cost_ = 0.0;
    UsageInfo totals_;
    int request_count_ = 0;
    std::optional<std::string> session_id_;
    std::string selected_model_ = "default";
    std::string draft_message_;
    std::map<std::string, ToolUseMetric> tool_metrics_;
};

} // namespace agentchat

#endif // AGENTCHAT_SESSION_STATE_HPP
