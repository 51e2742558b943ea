#include <agentchat/agentchat.hpp>
#include <condition_variable>
#include <iostream>
#include <mutex>

int main()
{
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;

    agentchat::SupervisorChannels channels;
    channels.on_message = [](const agentchat::ProtocolEvent& event)
    {
        if (auto* assistant = std::get_if<agentchat::AssistantEvent>(&event))
            std::cout << agentchat::get_text_content(assistant->content) << std::flush;
        else if (auto* result = std::get_if<agentchat::ResultEvent>(&event))
            if (result->total_cost_usd)
                std::cout << "\nCost: $" << *result->total_cost_usd << "\n";
    };
    channels.on_error = [](const agentchat::SessionError& error)
    { std::cerr << "Error (" << agentchat::to_string(error.category) << "): " << error.message << "\n"; };
    channels.on_end = [&]
    {
        std::lock_guard<std::mutex> lock(mutex);
        done = true;
        cv.notify_all();
    };

    agentchat::AgentOptions options;
    agentchat::ProcessSupervisor supervisor(options, channels);

    agentchat::TurnPayload payload;
    payload.text = "What is 2 + 2? Answer in one sentence.";

    agentchat::SendOptions send_options;
    send_options.auto_approve = true;
    supervisor.send(payload, send_options);

    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&] { return done; });
    return 0;
}
