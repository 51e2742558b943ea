#ifndef AGENTCHAT_PERMISSIONS_HPP
#define AGENTCHAT_PERMISSIONS_HPP

#include <agentchat/storage.hpp>
#include <agentchat/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentchat
{

struct PermissionPatternEntry
{
    std::string tool_name;
    std::string pattern;
    std::string created_at; // ISO-8601 UTC
};

/**
 * Generalize a shell command into a reusable pattern.
 *
 * Known command families map through an ordered rule table (first match
 * wins), e.g. "npm install lodash" -> "npm install *". "git status" stays
 * literal. Unknown commands become "<first-word> *", or the bare word when
 * the command has a single token.
 */
std::string generalize_command(const std::string& command);

// Comparable command string for a tool invocation (Bash command, file path,
// or search pattern); nothing for tools that are never pre-approved
std::optional<std::string> extract_command(const std::string& tool_name, const json& input);

// Exact match, or '*' as wildcard with the whole command anchored
bool pattern_matches(const std::string& pattern, const std::string& command);

/**
 * User-approved permission patterns, shared across conversations.
 *
 * Every mutation is applied in memory and then persisted through the injected
 * PermissionStore; a failed save is logged and the in-memory change kept.
 * All members are safe to call from any thread.
 */
class PermissionPatternCache
{
  public:
    explicit PermissionPatternCache(std::shared_ptr<PermissionStore> store);

    bool is_pre_approved(const std::string& tool_name, const json& input) const;

    // Returns false when the (tool, pattern) pair is already stored
    bool add(const std::string& tool_name, const std::string& pattern);
    bool remove(const std::string& tool_name, const std::string& pattern);
    void clear();

    std::vector<PermissionPatternEntry> entries() const;

    // Re-read the store, dropping the in-memory copy
    void reload();

  private:
    void persist_locked();

    std::shared_ptr<PermissionStore> store_;
    mutable std::mutex mutex_;
    std::vector<PermissionPatternEntry> entries_;
};

} // namespace agentchat

#endif // AGENTCHAT_PERMISSIONS_HPP
