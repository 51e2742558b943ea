#ifndef AGENTCHAT_VERSION_HPP
#define AGENTCHAT_VERSION_HPP

#include <string>

namespace agentchat
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// "MAJOR.MINOR.PATCH"; exported to the agent as AGENTCHAT_VERSION
inline std::string version_string()
{
    return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace agentchat

#endif // AGENTCHAT_VERSION_HPP
