#ifndef AGENTCHAT_INTERNAL_EVENT_DECODER_HPP
#define AGENTCHAT_INTERNAL_EVENT_DECODER_HPP

#include <agentchat/types.hpp>
#include <optional>
#include <string>

namespace agentchat
{
namespace protocol
{

class EventDecoder
{
  public:
    // Decode one framed line; malformed or unrecognized records yield nothing
    static std::optional<ProtocolEvent> decode(const std::string& line);

    // Parse a complete JSON record; throws JSONDecodeError / MessageParseError
    static ProtocolEvent parse_event(const std::string& json_str);

  private:
    static std::optional<ContentBlock> parse_content_block(const json& j);

    // Parse specific record types
    static ProtocolEvent parse_system_record(const json& j);
    static AssistantEvent parse_assistant_record(const json& j);
    static AssistantDeltaEvent parse_stream_event(const json& j);
    static UserEvent parse_user_record(const json& j);
    static ControlRequestEvent parse_control_request(const json& j);
    static ResultEvent parse_result_record(const json& j);
    static CompactBoundaryEvent parse_compact_boundary(const json& j);
};

} // namespace protocol
} // namespace agentchat

#endif // AGENTCHAT_INTERNAL_EVENT_DECODER_HPP
