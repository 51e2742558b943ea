#include <agentchat/permissions.hpp>
#include <algorithm>
#include <iostream>
#include <regex>
#include <sstream>

namespace agentchat
{

namespace
{

struct CommandRule
{
    const char* command;
    const char* subcommand; // Empty: any invocation of the command
    const char* pattern;    // Literal result; nullptr builds "<cmd> [<sub> ]*"
};

// Ordered; the first rule matching (first word, second word) wins
const CommandRule COMMAND_RULES[] = {
    {"npm", "install", nullptr},    {"npm", "i", nullptr},          {"npm", "add", nullptr},
    {"npm", "remove", nullptr},     {"npm", "uninstall", nullptr},  {"npm", "update", nullptr},
    {"npm", "run", nullptr},        {"npm", "test", nullptr},       {"npx", "", nullptr},
    {"yarn", "add", nullptr},       {"yarn", "remove", nullptr},    {"yarn", "install", nullptr},
    {"pnpm", "install", nullptr},   {"pnpm", "add", nullptr},       {"pnpm", "remove", nullptr},
    {"bun", "install", nullptr},    {"bun", "add", nullptr},

    {"git", "add", nullptr},        {"git", "commit", nullptr},     {"git", "push", nullptr},
    {"git", "pull", nullptr},       {"git", "checkout", nullptr},   {"git", "branch", nullptr},
    {"git", "merge", nullptr},      {"git", "clone", nullptr},      {"git", "reset", nullptr},
    {"git", "rebase", nullptr},     {"git", "tag", nullptr},        {"git", "status", "git status"},
    {"git", "diff", nullptr},       {"git", "log", nullptr},

    {"docker", "run", nullptr},     {"docker", "build", nullptr},   {"docker", "exec", nullptr},
    {"docker", "logs", nullptr},    {"docker", "stop", nullptr},    {"docker", "start", nullptr},
    {"docker", "rm", nullptr},      {"docker", "rmi", nullptr},     {"docker", "pull", nullptr},
    {"docker", "push", nullptr},

    {"make", "", nullptr},          {"cargo", "build", nullptr},    {"cargo", "run", nullptr},
    {"cargo", "test", nullptr},     {"cargo", "install", nullptr},  {"mvn", "compile", nullptr},
    {"mvn", "test", nullptr},       {"mvn", "package", nullptr},    {"gradle", "build", nullptr},
    {"gradle", "test", nullptr},    {"go", "build", nullptr},       {"go", "test", nullptr},

    {"curl", "", nullptr},          {"wget", "", nullptr},          {"ssh", "", nullptr},
    {"scp", "", nullptr},           {"rsync", "", nullptr},         {"tar", "", nullptr},
    {"zip", "", nullptr},           {"unzip", "", nullptr},         {"mkdir", "", nullptr},
    {"cat", "", nullptr},           {"ls", "", nullptr},            {"cd", "", nullptr},
    {"node", "", nullptr},          {"python", "", nullptr},        {"python3", "", nullptr},

    {"pip", "install", nullptr},    {"pip3", "install", nullptr},   {"composer", "install", nullptr},
    {"composer", "require", nullptr}, {"bundle", "install", nullptr}, {"gem", "install", nullptr},
};

std::vector<std::string> split_words(const std::string& command)
{
    std::vector<std::string> words;
    std::istringstream iss(command);
    std::string word;
    while (iss >> word)
        words.push_back(word);
    return words;
}

std::regex wildcard_to_regex(const std::string& pattern)
{
    static const std::string special = ".+^${}()|[]\\?";

    std::string expr = "^";
    for (char c : pattern)
    {
        if (c == '*')
            expr += ".*";
        else if (special.find(c) != std::string::npos)
        {
            expr += '\\';
            expr += c;
        }
        else
            expr += c;
    }
    expr += "$";
    return std::regex(expr);
}

PermissionPatternEntry entry_from_json(const json& j)
{
    PermissionPatternEntry entry;
    entry.tool_name = j.at("toolName").get<std::string>();
    entry.pattern = j.at("pattern").get<std::string>();
    entry.created_at = j.value("createdAt", "");
    return entry;
}

} // namespace

std::string generalize_command(const std::string& command)
{
    auto words = split_words(command);
    if (words.empty())
        return "";

    const std::string& first = words[0];
    const std::string second = words.size() > 1 ? words[1] : std::string();

    for (const auto& rule : COMMAND_RULES)
    {
        if (first != rule.command)
            continue;

        std::string sub = rule.subcommand;
        if (!sub.empty() && sub != second)
            continue;

        if (rule.pattern)
            return rule.pattern;
        if (sub.empty())
            return first + " *";
        return first + " " + sub + " *";
    }

    if (words.size() > 1)
        return first + " *";
    return first;
}

std::optional<std::string> extract_command(const std::string& tool_name, const json& input)
{
    const char* field = nullptr;

    if (tool_name == "Bash")
        field = "command";
    else if (tool_name == "Read" || tool_name == "Write" || tool_name == "Edit" ||
             tool_name == "MultiEdit")
        field = "file_path";
    else if (tool_name == "Glob" || tool_name == "Grep")
        field = "pattern";
    else
        return std::nullopt;

    if (!input.is_object() || !input.contains(field) || !input[field].is_string())
        return std::nullopt;
    return input[field].get<std::string>();
}

bool pattern_matches(const std::string& pattern, const std::string& command)
{
    if (pattern == command)
        return true;
    if (pattern.find('*') == std::string::npos)
        return false;

    try
    {
        return std::regex_match(command, wildcard_to_regex(pattern));
    }
    catch (const std::regex_error& e)
    {
        std::cerr << "Warning: unusable permission pattern '" << pattern << "': " << e.what()
                  << std::endl;
        return false;
    }
}

// ============================================================================
// PermissionPatternCache
// ============================================================================

PermissionPatternCache::PermissionPatternCache(std::shared_ptr<PermissionStore> store)
    : store_(store ? std::move(store) : std::make_shared<MemoryPermissionStore>())
{
    reload();
}

void PermissionPatternCache::reload()
{
    std::vector<PermissionPatternEntry> loaded;

    try
    {
        json document = store_->load();
        if (document.is_object() && document.contains("allowedPatterns") &&
            document["allowedPatterns"].is_array())
        {
            for (const auto& item : document["allowedPatterns"])
                loaded.push_back(entry_from_json(item));
        }
    }
    catch (const std::exception& e)
    {
        // Unreadable permissions are treated as "nothing approved"
        std::cerr << "Warning: ignoring corrupt permission store: " << e.what() << std::endl;
        loaded.clear();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(loaded);
}

bool PermissionPatternCache::is_pre_approved(const std::string& tool_name,
                                             const json& input) const
{
    auto command = extract_command(tool_name, input);
    if (!command)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const PermissionPatternEntry& entry)
                       {
                           return entry.tool_name == tool_name &&
                                  pattern_matches(entry.pattern, *command);
                       });
}

bool PermissionPatternCache::add(const std::string& tool_name, const std::string& pattern)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = std::find_if(entries_.begin(), entries_.end(),
                                 [&](const PermissionPatternEntry& entry)
                                 { return entry.tool_name == tool_name && entry.pattern == pattern; });
    if (existing != entries_.end())
        return false;

    entries_.push_back({tool_name, pattern, iso_timestamp_now()});
    persist_locked();
    return true;
}

bool PermissionPatternCache::remove(const std::string& tool_name, const std::string& pattern)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const PermissionPatternEntry& entry) {
                                      return entry.tool_name == tool_name &&
                                             entry.pattern == pattern;
                                  }),
                   entries_.end());
    if (entries_.size() == before)
        return false;

    persist_locked();
    return true;
}

void PermissionPatternCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    persist_locked();
}

std::vector<PermissionPatternEntry> PermissionPatternCache::entries() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void PermissionPatternCache::persist_locked()
{
    json patterns = json::array();
    for (const auto& entry : entries_)
        patterns.push_back(
            {{"toolName", entry.tool_name}, {"pattern", entry.pattern}, {"createdAt", entry.created_at}});

    try
    {
        store_->save({{"allowedPatterns", patterns}});
    }
    catch (const std::exception& e)
    {
        // The pattern still applies for the lifetime of this cache
        std::cerr << "Warning: failed to save permission patterns: " << e.what() << std::endl;
    }
}

} // namespace agentchat
