#pragma once

#include <agentchat/types.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentchat::internal
{

/// Hex-encoded SHA-256 (64 characters) of a file, or std::nullopt if unreadable
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// True when the allowlist is empty or contains the path (compared canonically)
bool verify_agent_path_allowed(const std::string& agent_path,
                               const std::vector<std::string>& allowed_paths);

/// True when no hash is expected or the file's SHA-256 matches (case-insensitive).
/// On failure error_message explains why.
bool verify_agent_hash(const std::filesystem::path& agent_path,
                       const std::optional<std::string>& expected_hash,
                       std::string& error_message);

/// Locate the agent binary: options.agent_path, then AGENTCHAT_AGENT_PATH,
/// then `claude` on PATH, then ~/.claude/local/claude. Every candidate must
/// pass the allowlist and hash checks. Throws AgentNotInstalledError.
std::string resolve_agent_path(const AgentOptions& options);

} // namespace agentchat::internal
