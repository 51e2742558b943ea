#include "agent_verification.hpp"

#include "../subprocess/process.hpp"

#include <agentchat/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace agentchat::internal
{

namespace
{
std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::filesystem::path canonical_or_self(const std::string& path)
{
    std::error_code ec;
    auto normalized = std::filesystem::canonical(path, ec);
    if (ec)
        return std::filesystem::path(path);
    return normalized;
}
} // namespace

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    SHA256_CTX sha256;
    if (!SHA256_Init(&sha256))
        return std::nullopt;

    const size_t BUFFER_SIZE = 8192;
    char buffer[BUFFER_SIZE];
    while (file.read(buffer, BUFFER_SIZE) || file.gcount() > 0)
        if (!SHA256_Update(&sha256, buffer, static_cast<size_t>(file.gcount())))
            return std::nullopt;

    if (file.bad())
        return std::nullopt;

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256_Final(hash, &sha256))
        return std::nullopt;

    std::ostringstream oss;
    for (size_t i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return oss.str();
}

bool verify_agent_path_allowed(const std::string& agent_path,
                               const std::vector<std::string>& allowed_paths)
{
    if (allowed_paths.empty())
        return true;

    const auto normalized = canonical_or_self(agent_path);
    return std::any_of(allowed_paths.begin(), allowed_paths.end(),
                       [&normalized](const std::string& allowed)
                       { return canonical_or_self(allowed) == normalized; });
}

bool verify_agent_hash(const std::filesystem::path& agent_path,
                       const std::optional<std::string>& expected_hash,
                       std::string& error_message)
{
    if (!expected_hash)
        return true;

    if (expected_hash->length() != 64 ||
        !std::all_of(expected_hash->begin(), expected_hash->end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; }))
    {
        error_message = "Invalid hash format: expected 64-character hex string";
        return false;
    }

    auto actual_hash = compute_file_sha256(agent_path);
    if (!actual_hash)
    {
        error_message = "Failed to compute file hash of " + agent_path.string();
        return false;
    }

    const std::string expected = to_lower(*expected_hash);
    if (expected != *actual_hash)
    {
        error_message = "Agent hash mismatch: expected " + expected + " but got " + *actual_hash;
        return false;
    }

    return true;
}

std::string resolve_agent_path(const AgentOptions& options)
{
    auto validate = [&options](const std::string& path) -> std::string
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            throw AgentNotInstalledError("Agent path does not exist: " + path);

        if (!verify_agent_path_allowed(path, options.allowed_agent_paths))
            throw AgentNotInstalledError("Agent path not in allowlist: " + path);

        std::string error_msg;
        if (!verify_agent_hash(path, options.agent_hash_sha256, error_msg))
            throw AgentNotInstalledError("Agent integrity check failed: " + error_msg);

        return path;
    };

    if (!options.agent_path.empty())
        return validate(options.agent_path);

    if (const char* env_path = std::getenv("AGENTCHAT_AGENT_PATH"); env_path && *env_path)
        return validate(env_path);

    if (auto found = subprocess::find_executable("claude"))
        return validate(*found);

    if (const char* home = std::getenv("HOME"))
    {
        auto local = std::filesystem::path(home) / ".claude" / "local" / "claude";
        std::error_code ec;
        if (std::filesystem::exists(local, ec))
            return validate(local.string());
    }

    throw AgentNotInstalledError("Could not find 'claude' executable in PATH. "
                                 "Install the agent CLI or set AGENTCHAT_AGENT_PATH.");
}

} // namespace agentchat::internal
