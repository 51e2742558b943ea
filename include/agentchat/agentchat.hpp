#ifndef AGENTCHAT_HPP
#define AGENTCHAT_HPP

// Main header that includes everything

#include <agentchat/errors.hpp>
#include <agentchat/permissions.hpp>
#include <agentchat/protocol/control.hpp>
#include <agentchat/session_state.hpp>
#include <agentchat/storage.hpp>
#include <agentchat/supervisor.hpp>
#include <agentchat/tab_scheduler.hpp>
#include <agentchat/transcript.hpp>
#include <agentchat/transport.hpp>
#include <agentchat/turn_processor.hpp>
#include <agentchat/types.hpp>
#include <agentchat/version.hpp>

// Optional: file-backed storage collaborators
#include <agentchat/ext/json_file_store.hpp>

#endif // AGENTCHAT_HPP
