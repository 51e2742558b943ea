/**
 * @file json_file_store.cpp
 * @brief JSON-file storage collaborators
 */

#include <agentchat/errors.hpp>
#include <agentchat/ext/json_file_store.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace agentchat
{
namespace ext
{

namespace
{

json read_json_file(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file)
        throw std::runtime_error("Failed to open file: " + filename);

    try
    {
        json document;
        file >> document;
        return document;
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError("Invalid JSON in " + filename + ": " + e.what());
    }
}

void write_json_file(const std::string& filename, const json& document)
{
    fs::path parent = fs::path(filename).parent_path();
    if (!parent.empty())
        fs::create_directories(parent);

    std::ofstream file(filename);
    if (!file)
        throw std::runtime_error("Failed to open file: " + filename);

    // Agent diagnostics may carry raw bytes; they are stored as U+FFFD
    file << document.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
}

} // namespace

// ============================================================================
// JsonFilePermissionStore
// ============================================================================

JsonFilePermissionStore::JsonFilePermissionStore(std::string path) : path_(std::move(path)) {}

json JsonFilePermissionStore::load()
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (!fs::exists(path_))
        return nullptr;
    return read_json_file(path_);
}

void JsonFilePermissionStore::save(const json& document)
{
    std::lock_guard<std::mutex> lock(mutex_);
    write_json_file(path_, document);
}

// ============================================================================
// JsonFileConversationStore
// ============================================================================

JsonFileConversationStore::JsonFileConversationStore(std::string storage_dir)
    : storage_dir_(std::move(storage_dir))
{
    fs::create_directories(storage_dir_);
}

std::string JsonFileConversationStore::file_for(const std::string& id) const
{
    // Ids become file names
    if (id.empty() || id.find('/') != std::string::npos || id.find('\\') != std::string::npos ||
        id == "." || id == "..")
        throw AgentChatError("Invalid conversation id: " + id);

    return storage_dir_ + "/" + id + ".json";
}

void JsonFileConversationStore::save(const ConversationRecord& record)
{
    std::string filename = file_for(record.id);

    json document = record.to_json();
    document["savedAt"] = iso_timestamp_now();

    std::lock_guard<std::mutex> lock(mutex_);
    write_json_file(filename, document);
}

std::optional<ConversationRecord> JsonFileConversationStore::load(const std::string& id)
{
    std::string filename = file_for(id);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(filename))
        return std::nullopt;

    return ConversationRecord::from_json(read_json_file(filename));
}

std::vector<std::string> JsonFileConversationStore::list()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    if (!fs::exists(storage_dir_))
        return ids;

    for (const auto& entry : fs::directory_iterator(storage_dir_))
        if (entry.path().extension() == ".json")
            ids.push_back(entry.path().stem().string());

    std::sort(ids.begin(), ids.end());
    return ids;
}

bool JsonFileConversationStore::remove(const std::string& id)
{
    std::string filename = file_for(id);

    std::lock_guard<std::mutex> lock(mutex_);
    return fs::remove(filename);
}

} // namespace ext
} // namespace agentchat
