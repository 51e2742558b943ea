#include <agentchat/storage.hpp>

namespace agentchat
{

// ============================================================================
// ConversationRecord
// ============================================================================

json ConversationRecord::to_json() const
{
    json messages = json::array();
    for (const auto& entry : entries)
        messages.push_back(entry.to_json());

    return {{"id", id},
            {"title", title},
            {"sessionId", session_id ? json(*session_id) : json(nullptr)},
            {"totalCost", total_cost},
            {"totalTokens", {{"input", total_tokens_input}, {"output", total_tokens_output}}},
            {"messageCount", entries.size()},
            {"messages", messages}};
}

ConversationRecord ConversationRecord::from_json(const json& j)
{
    ConversationRecord record;
    record.id = j.at("id").get<std::string>();
    record.title = j.value("title", "");

    if (j.contains("sessionId") && j["sessionId"].is_string())
        record.session_id = j["sessionId"].get<std::string>();

    record.total_cost = j.value("totalCost", 0.0);
    if (j.contains("totalTokens") && j["totalTokens"].is_object())
    {
        record.total_tokens_input = j["totalTokens"].value("input", 0LL);
        record.total_tokens_output = j["totalTokens"].value("output", 0LL);
    }

    if (j.contains("messages") && j["messages"].is_array())
    {
        for (const auto& message : j["messages"])
            record.entries.push_back(LogEntry::from_json(message));
    }

    return record;
}

// ============================================================================
// In-memory stores
// ============================================================================

json MemoryPermissionStore::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return document_;
}

void MemoryPermissionStore::save(const json& document)
{
    std::lock_guard<std::mutex> lock(mutex_);
    document_ = document;
}

void MemoryConversationStore::save(const ConversationRecord& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.id] = record;
}

std::optional<ConversationRecord> MemoryConversationStore::load(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> MemoryConversationStore::list()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    for (const auto& [id, record] : records_)
        ids.push_back(id);
    return ids;
}

bool MemoryConversationStore::remove(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(id) > 0;
}

} // namespace agentchat
