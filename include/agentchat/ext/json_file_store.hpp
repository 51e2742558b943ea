/**
 * @file json_file_store.hpp
 * @brief JSON-file implementations of the storage collaborators
 *
 * - JsonFilePermissionStore keeps the permission document in one file
 * - JsonFileConversationStore keeps one {id}.json file per conversation
 */

#pragma once

#include <agentchat/storage.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace agentchat {
namespace ext {

/**
 * @brief Permission document persisted as a single JSON file
 *
 * @code
 * auto store = std::make_shared<agentchat::ext::JsonFilePermissionStore>(
 *     ".agentchat/permissions.json");
 * agentchat::PermissionPatternCache patterns(store);
 * @endcode
 */
class JsonFilePermissionStore : public PermissionStore
{
public:
    /**
     * @param path File holding {"allowedPatterns": [...]}; its parent
     *             directory is created on first save
     */
    explicit JsonFilePermissionStore(std::string path);

    /**
     * @brief Read the document
     * @return null when the file does not exist
     * @throws JSONDecodeError if the file is not valid JSON
     */
    json load() override;

    /**
     * @brief Replace the document on disk
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const json& document) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

/**
 * @brief Conversations persisted as {storage_dir}/{id}.json
 */
class JsonFileConversationStore : public ConversationStore
{
public:
    /**
     * @param storage_dir Directory for conversation files (created if missing)
     */
    explicit JsonFileConversationStore(std::string storage_dir = ".agentchat_conversations");

    void save(const ConversationRecord& record) override;

    /**
     * @return nothing when no file exists for the id
     * @throws JSONDecodeError if the file is not valid JSON
     */
    std::optional<ConversationRecord> load(const std::string& id) override;

    /**
     * @brief Ids of all stored conversations, sorted
     */
    std::vector<std::string> list() override;

    bool remove(const std::string& id) override;

    std::string storage_directory() const { return storage_dir_; }

private:
    std::string file_for(const std::string& id) const;

    std::string storage_dir_;
    std::mutex mutex_;
};

} // namespace ext
} // namespace agentchat
