#include <agentchat/agentchat.hpp>
#include <agentchat/ext/json_file_store.hpp>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>

// Interactive chat with permission prompts.
//
//   /new      start a new agent session
//   /fork N   fork the conversation at user input N
//   /rewind N drop user input N and everything after it
//   /stop     stop the running turn
//   /quit     exit
//
// Conversations are kept in .agentchat_conversations/, approved command
// patterns in .agentchat_permissions.json.

namespace
{

struct PromptQueue
{
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<agentchat::protocol::PendingControlRequest> request;
    bool turn_done = false;
};

void print_new_entries(const agentchat::Transcript& transcript, size_t& printed)
{
    for (; printed < transcript.size(); ++printed)
    {
        const auto& body = transcript[printed].body;
        if (auto* tool = std::get_if<agentchat::ToolUseEntry>(&body))
            std::cout << "[" << tool->tool_name << "] " << tool->input.dump() << "\n";
        else if (auto* result = std::get_if<agentchat::ToolResultEntry>(&body))
            std::cout << (result->is_error ? "  ! " : "  > ") << result->content.substr(0, 200)
                      << "\n";
        else if (auto* error = std::get_if<agentchat::ErrorEntry>(&body))
            std::cout << "Error: " << error->message << "\n";
    }
}

} // namespace

int main()
{
    auto permission_store =
        std::make_shared<agentchat::ext::JsonFilePermissionStore>(".agentchat_permissions.json");
    auto patterns = std::make_shared<agentchat::PermissionPatternCache>(permission_store);
    auto conversations = std::make_shared<agentchat::ext::JsonFileConversationStore>();

    try
    {
        agentchat::TabScheduler scheduler(agentchat::AgentOptions{}, patterns, conversations);
        PromptQueue queue;

        agentchat::SchedulerListener listener;
        listener.on_permission_request =
            [&queue](const std::string&, const agentchat::protocol::PendingControlRequest& request)
        {
            std::lock_guard<std::mutex> lock(queue.mutex);
            queue.request = request;
            queue.cv.notify_all();
        };
        listener.on_turn_complete = [&queue](const std::string&)
        {
            std::lock_guard<std::mutex> lock(queue.mutex);
            queue.turn_done = true;
            queue.cv.notify_all();
        };
        scheduler.set_listener(listener);

        std::string id = scheduler.open_conversation();
        size_t printed = 0;

        std::cout << "Agent chat (" << agentchat::version_string() << "). /quit to exit.\n";

        std::string line;
        while (std::cout << "\n> " << std::flush, std::getline(std::cin, line))
        {
            if (line == "/quit")
                break;
            if (line == "/new")
            {
                scheduler.new_session(id);
                printed = 0;
                continue;
            }
            if (line.rfind("/fork ", 0) == 0 || line.rfind("/rewind ", 0) == 0)
            {
                bool fork = line[1] == 'f';
                size_t index = std::stoul(line.substr(line.find(' ') + 1));
                if (fork)
                {
                    id = scheduler.fork_conversation(id, index);
                    std::cout << "Switched to " << scheduler.title(id) << "\n";
                }
                else
                {
                    std::cout << "Dropped: " << scheduler.rewind_conversation(id, index) << "\n";
                }
                printed = 0;
                print_new_entries(scheduler.transcript(id), printed);
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(queue.mutex);
                queue.turn_done = false;
            }

            agentchat::TurnPayload payload;
            payload.text = line;
            scheduler.send(id, payload);

            for (;;)
            {
                std::unique_lock<std::mutex> lock(queue.mutex);
                queue.cv.wait(lock, [&] { return queue.turn_done || queue.request.has_value(); });

                if (queue.request)
                {
                    auto request = *queue.request;
                    queue.request.reset();
                    lock.unlock();

                    std::cout << "\nAllow " << request.tool_name << " " << request.input.dump();
                    if (request.pattern)
                        std::cout << " (always: " << *request.pattern << ")";
                    std::cout << "? [y/n/a] " << std::flush;

                    std::string answer;
                    std::getline(std::cin, answer);
                    bool approved = answer == "y" || answer == "a";
                    scheduler.respond(request.request_id, approved, answer == "a");
                    continue;
                }
                break;
            }

            print_new_entries(scheduler.transcript(id), printed);
            auto transcript = scheduler.transcript(id);
            for (auto it = transcript.rbegin(); it != transcript.rend(); ++it)
            {
                if (auto* assistant = std::get_if<agentchat::AssistantEntry>(&it->body))
                {
                    std::cout << assistant->content << "\n";
                    break;
                }
                if (std::holds_alternative<agentchat::UserEntry>(it->body))
                    break;
            }

            auto state = scheduler.session_state(id);
            std::cout << "(tokens " << state.total_tokens_input() << " in / "
                      << state.total_tokens_output() << " out, $" << state.total_cost() << ")\n";
        }

        scheduler.save_conversation(id);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
