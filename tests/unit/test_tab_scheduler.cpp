#include "../test_utils.hpp"

#include <agentchat/tab_scheduler.hpp>
#include <algorithm>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace agentchat;
using agentchat::test::TransportScript;

namespace
{
// Waits for turn completion and records what the listener saw
struct ListenerLog
{
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> completed;
    std::vector<std::pair<std::string, SessionError>> errors;
    std::vector<std::pair<std::string, protocol::PendingControlRequest>> requests;

    SchedulerListener listener()
    {
        SchedulerListener l;
        l.on_turn_complete = [this](const std::string& id)
        {
            std::lock_guard<std::mutex> lock(mutex);
            completed.push_back(id);
            cv.notify_all();
        };
        l.on_error = [this](const std::string& id, const SessionError& e)
        {
            std::lock_guard<std::mutex> lock(mutex);
            errors.emplace_back(id, e);
        };
        l.on_permission_request = [this](const std::string& id,
                                         const protocol::PendingControlRequest& r)
        {
            std::lock_guard<std::mutex> lock(mutex);
            requests.emplace_back(id, r);
            cv.notify_all();
        };
        return l;
    }

    bool wait_for_completions(size_t count, int timeout_ms = 3000)
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [&] { return completed.size() >= count; });
    }

    bool wait_for_request(int timeout_ms = 3000)
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [&] { return !requests.empty(); });
    }
};

TurnPayload text_turn(const std::string& text)
{
    TurnPayload payload;
    payload.text = text;
    return payload;
}

class TabSchedulerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        script = std::make_shared<TransportScript>();
        store = std::make_shared<MemoryConversationStore>();
        scheduler = std::make_unique<TabScheduler>(AgentOptions{}, nullptr, store,
                                                   test::scripted_factory(script));
        scheduler->set_listener(events.listener());
    }

    // Play one complete successful turn for the conversation
    void complete_turn(const std::string& id, const std::string& question,
                       const std::string& answer)
    {
        size_t done;
        {
            std::lock_guard<std::mutex> lock(events.mutex);
            done = events.completed.size();
        }
        script->reset_run();
        ASSERT_TRUE(scheduler->try_send(id, text_turn(question)));
        script->push_line(
            R"({"type":"system","subtype":"init","session_id":"sess-)" + id + R"(","tools":[]})");
        script->push_line(json({{"type", "assistant"},
                                {"message",
                                 {{"content", json::array({json{{"type", "text"}, {"text", answer}}})},
                                  {"usage", {{"input_tokens", 10}, {"output_tokens", 5}}}}}})
                              .dump());
        script->push_line(R"({"type":"result","subtype":"success","session_id":"sess-)" + id +
                          R"(","total_cost_usd":0.5,"result":"ok"})");
        script->finish(0);
        ASSERT_TRUE(events.wait_for_completions(done + 1));
    }

    ListenerLog events;
    std::shared_ptr<TransportScript> script;
    std::shared_ptr<MemoryConversationStore> store;
    std::unique_ptr<TabScheduler> scheduler;
};
} // namespace

TEST_F(TabSchedulerTest, OpenConversationsHaveDistinctIds)
{
    auto a = scheduler->open_conversation();
    auto b = scheduler->open_conversation("Research");

    EXPECT_NE(a, b);
    EXPECT_EQ(scheduler->title(a), "New Chat");
    EXPECT_EQ(scheduler->title(b), "Research");
    EXPECT_EQ(scheduler->conversation_ids().size(), 2u);
    EXPECT_THROW(scheduler->transcript("missing"), AgentChatError);
}

TEST_F(TabSchedulerTest, TurnBuildsTranscriptAndState)
{
    auto id = scheduler->open_conversation();
    complete_turn(id, "What is 2+2?", "Four.");

    auto transcript = scheduler->transcript(id);
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(std::get<UserEntry>(transcript[0].body).text, "What is 2+2?");
    const auto& answer = std::get<AssistantEntry>(transcript[1].body);
    EXPECT_EQ(answer.content, "Four.");
    ASSERT_TRUE(answer.usage.has_value());

    auto state = scheduler->session_state(id);
    EXPECT_FALSE(state.is_processing());
    EXPECT_EQ(state.session_id().value_or(""), "sess-" + id);
    EXPECT_EQ(state.total_tokens_input(), 10);
    EXPECT_DOUBLE_EQ(state.total_cost(), 0.5);
    EXPECT_EQ(state.request_count(), 1);

    EXPECT_FALSE(scheduler->owner().has_value());
    // Completed turns are persisted
    EXPECT_TRUE(store->load(id).has_value());
}

TEST_F(TabSchedulerTest, NextTurnResumesAgentSession)
{
    auto id = scheduler->open_conversation();
    complete_turn(id, "first", "one");
    complete_turn(id, "second", "two");

    ASSERT_EQ(script->launches.size(), 2u);
    const auto& args = script->launches[1];
    auto resume = std::find(args.begin(), args.end(), "--resume");
    ASSERT_NE(resume, args.end());
    EXPECT_EQ(*(resume + 1), "sess-" + id);
}

TEST_F(TabSchedulerTest, OnlyOneConversationOwnsTheAgent)
{
    auto a = scheduler->open_conversation();
    auto b = scheduler->open_conversation();

    ASSERT_TRUE(scheduler->try_send(a, text_turn("long task")));
    EXPECT_EQ(scheduler->owner().value_or(""), a);
    EXPECT_TRUE(scheduler->is_in_flight());

    EXPECT_FALSE(scheduler->try_send(b, text_turn("me too")));
    EXPECT_THROW(scheduler->send(b, text_turn("me too")), SchedulerBusyError);
    EXPECT_TRUE(scheduler->transcript(b).empty());
    EXPECT_EQ(script->launch_count(), 1u);

    scheduler->stop();
    EXPECT_FALSE(scheduler->is_in_flight());

    script->reset_run();
    EXPECT_TRUE(scheduler->try_send(b, text_turn("my turn")));
    scheduler->stop();
}

TEST_F(TabSchedulerTest, EventsRouteToOwnerOnly)
{
    auto a = scheduler->open_conversation();
    auto b = scheduler->open_conversation();
    complete_turn(a, "hello", "hi there");

    EXPECT_EQ(scheduler->transcript(a).size(), 2u);
    EXPECT_TRUE(scheduler->transcript(b).empty());
}

TEST_F(TabSchedulerTest, StopReleasesOwnershipWithoutError)
{
    auto id = scheduler->open_conversation();
    ASSERT_TRUE(scheduler->try_send(id, text_turn("stream")));
    script->push_line(
        R"({"type":"stream_event","event":{"type":"content_block_delta","delta":{"type":"text_delta","text":"Partial"}}})");

    // Give the reader a moment to deliver the fragment
    for (int i = 0; i < 100 && scheduler->transcript(id).size() < 2; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    scheduler->stop();

    EXPECT_FALSE(scheduler->owner().has_value());
    EXPECT_TRUE(events.errors.empty());
    auto transcript = scheduler->transcript(id);
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_FALSE(std::get<AssistantEntry>(transcript[1].body).streaming);
    EXPECT_FALSE(scheduler->session_state(id).is_processing());
}

TEST_F(TabSchedulerTest, FailedRunAppendsErrorEntry)
{
    auto id = scheduler->open_conversation();
    ASSERT_TRUE(scheduler->try_send(id, text_turn("hello")));
    script->finish(3);

    ASSERT_TRUE(events.wait_for_completions(1));
    ASSERT_EQ(events.errors.size(), 1u);
    EXPECT_EQ(events.errors[0].first, id);

    auto transcript = scheduler->transcript(id);
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(std::get<ErrorEntry>(transcript[1].body).message,
              "Agent process ended unexpectedly (exit code 3)");
}

TEST_F(TabSchedulerTest, SpawnFailureRevertsToIdle)
{
    script->fail_connect = true;
    auto id = scheduler->open_conversation();

    EXPECT_TRUE(scheduler->try_send(id, text_turn("hello")));
    EXPECT_FALSE(scheduler->is_in_flight());
    ASSERT_EQ(events.errors.size(), 1u);
    EXPECT_EQ(events.errors[0].second.category, ErrorCategory::AgentNotInstalled);
}

TEST_F(TabSchedulerTest, InvalidUtf8TurnReleasesOwnership)
{
    auto a = scheduler->open_conversation();
    auto b = scheduler->open_conversation();

    ASSERT_TRUE(scheduler->try_send(a, text_turn("bad \xff byte")));
    script->push_line(R"({"type":"result","subtype":"success","session_id":"sess-a","result":"ok"})");
    script->finish(0);
    ASSERT_TRUE(events.wait_for_completions(1));

    EXPECT_FALSE(scheduler->owner().has_value());
    EXPECT_FALSE(scheduler->session_state(a).is_processing());

    script->reset_run();
    EXPECT_TRUE(scheduler->try_send(b, text_turn("next")));
    scheduler->stop();
}

TEST_F(TabSchedulerTest, UnexpectedWriteFailureReleasesOwnership)
{
    script->fail_write = "encoder failure";
    auto id = scheduler->open_conversation();

    ASSERT_TRUE(scheduler->try_send(id, text_turn("hello")));
    ASSERT_TRUE(events.wait_for_completions(1));

    EXPECT_FALSE(scheduler->owner().has_value());
    EXPECT_FALSE(scheduler->session_state(id).is_processing());
    std::lock_guard<std::mutex> lock(events.mutex);
    ASSERT_EQ(events.errors.size(), 1u);
    EXPECT_EQ(events.errors[0].first, id);
}

TEST_F(TabSchedulerTest, PermissionRequestsCarryOwner)
{
    auto id = scheduler->open_conversation();
    ASSERT_TRUE(scheduler->try_send(id, text_turn("install")));
    script->push_line(
        R"({"type":"control_request","request_id":"req-1","request":{"subtype":"can_use_tool","tool_name":"Bash","input":{"command":"npm test"}}})");

    ASSERT_TRUE(events.wait_for_request());
    EXPECT_EQ(events.requests[0].first, id);
    EXPECT_EQ(scheduler->pending_requests().size(), 1u);

    EXPECT_TRUE(scheduler->respond("req-1", true));
    ASSERT_TRUE(script->wait_for_writes(2));

    scheduler->stop();
    EXPECT_FALSE(scheduler->respond("req-1", true));
}

TEST_F(TabSchedulerTest, CloseNonOwnerLeavesRunAlone)
{
    auto a = scheduler->open_conversation();
    auto b = scheduler->open_conversation();
    ASSERT_TRUE(scheduler->try_send(a, text_turn("busy")));

    scheduler->close_conversation(b);
    EXPECT_TRUE(scheduler->is_in_flight());
    EXPECT_FALSE(script->was_terminated());

    scheduler->close_conversation(a);
    EXPECT_FALSE(scheduler->is_in_flight());
    EXPECT_TRUE(script->was_terminated());
    EXPECT_TRUE(scheduler->conversation_ids().empty());
}

TEST_F(TabSchedulerTest, ForkCopiesThroughChosenInput)
{
    auto id = scheduler->open_conversation("Plan");
    complete_turn(id, "first", "one");
    complete_turn(id, "second", "two");

    auto fork = scheduler->fork_conversation(id, 0);
    EXPECT_EQ(scheduler->title(fork), "Plan (fork)");

    auto transcript = scheduler->transcript(fork);
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(std::get<UserEntry>(transcript[0].body).text, "first");
    EXPECT_EQ(std::get<AssistantEntry>(transcript[1].body).content, "one");
    EXPECT_FALSE(scheduler->session_state(fork).session_id().has_value());

    // Source untouched
    EXPECT_EQ(scheduler->transcript(id).size(), 4u);
    EXPECT_THROW(scheduler->fork_conversation(id, 5), AgentChatError);
}

TEST_F(TabSchedulerTest, RewindDropsInputAndAfter)
{
    auto id = scheduler->open_conversation();
    complete_turn(id, "first", "one");
    complete_turn(id, "second", "two");

    EXPECT_EQ(scheduler->rewind_conversation(id, 1), "second");

    auto transcript = scheduler->transcript(id);
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(std::get<AssistantEntry>(transcript[1].body).content, "one");

    auto state = scheduler->session_state(id);
    EXPECT_FALSE(state.session_id().has_value());
    EXPECT_EQ(state.total_tokens_input(), 10);

    EXPECT_THROW(scheduler->rewind_conversation(id, 3), AgentChatError);
}

TEST_F(TabSchedulerTest, NewSessionClearsConversation)
{
    auto id = scheduler->open_conversation();
    complete_turn(id, "hello", "hi");

    scheduler->new_session(id);
    EXPECT_TRUE(scheduler->transcript(id).empty());
    EXPECT_FALSE(scheduler->session_state(id).session_id().has_value());
    EXPECT_DOUBLE_EQ(scheduler->session_state(id).total_cost(), 0.0);
}

TEST_F(TabSchedulerTest, SaveAndLoadRestoresConversation)
{
    auto id = scheduler->open_conversation("Saved chat");
    complete_turn(id, "remember me", "noted");
    scheduler->save_conversation(id);

    TabScheduler other(AgentOptions{}, nullptr, store, test::scripted_factory(script));
    EXPECT_EQ(other.load_conversation(id), id);
    EXPECT_EQ(other.title(id), "Saved chat");

    auto transcript = other.transcript(id);
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(std::get<AssistantEntry>(transcript[1].body).content, "noted");

    auto state = other.session_state(id);
    EXPECT_EQ(state.session_id().value_or(""), "sess-" + id);
    EXPECT_DOUBLE_EQ(state.total_cost(), 0.5);
    EXPECT_EQ(state.total_tokens_output(), 5);

    EXPECT_THROW(other.load_conversation("nope"), AgentChatError);
}
