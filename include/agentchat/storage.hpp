#ifndef AGENTCHAT_STORAGE_HPP
#define AGENTCHAT_STORAGE_HPP

#include <agentchat/transcript.hpp>
#include <agentchat/types.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentchat
{

// Persisted permission document: {"allowedPatterns": [{toolName, pattern, createdAt}]}
class PermissionStore
{
  public:
    virtual ~PermissionStore() = default;

    // Returns null when nothing has been stored yet
    virtual json load() = 0;
    virtual void save(const json& document) = 0;
};

// A conversation as handed to the storage collaborator
struct ConversationRecord
{
    std::string id;
    std::string title;
    std::optional<std::string> session_id;
    double total_cost = 0.0;
    long long total_tokens_input = 0;
    long long total_tokens_output = 0;
    std::vector<LogEntry> entries;

    json to_json() const;
    static ConversationRecord from_json(const json& j);
};

class ConversationStore
{
  public:
    virtual ~ConversationStore() = default;

    virtual void save(const ConversationRecord& record) = 0;
    virtual std::optional<ConversationRecord> load(const std::string& id) = 0;
    virtual std::vector<std::string> list() = 0;
    virtual bool remove(const std::string& id) = 0;
};

// In-process stores, used when no persistence medium is configured
class MemoryPermissionStore : public PermissionStore
{
  public:
    json load() override;
    void save(const json& document) override;

  private:
    std::mutex mutex_;
    json document_;
};

class MemoryConversationStore : public ConversationStore
{
  public:
    void save(const ConversationRecord& record) override;
    std::optional<ConversationRecord> load(const std::string& id) override;
    std::vector<std::string> list() override;
    bool remove(const std::string& id) override;

  private:
    std::mutex mutex_;
    std::map<std::string, ConversationRecord> records_;
};

} // namespace agentchat

#endif // AGENTCHAT_STORAGE_HPP
