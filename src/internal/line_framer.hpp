#ifndef AGENTCHAT_INTERNAL_LINE_FRAMER_HPP
#define AGENTCHAT_INTERNAL_LINE_FRAMER_HPP

#include <optional>
#include <string>
#include <vector>

namespace agentchat
{
namespace protocol
{

/**
 * Incremental newline framer for the agent's stdout.
 *
 * Bytes are appended with feed(); every complete line is returned without its
 * terminator (a trailing '\r' is stripped too). The incomplete tail is kept
 * until the next feed() or handed out by flush() once the stream ends.
 * Whitespace-only lines are skipped.
 */
class LineFramer
{
  public:
    explicit LineFramer(size_t max_buffer_size = 1024 * 1024);

    // Append a chunk and return the lines it completed
    std::vector<std::string> feed(const std::string& chunk);

    // Return the buffered partial line (if any) and clear it
    std::optional<std::string> flush();

    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    void clear_buffer()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
    size_t max_buffer_size_;

    // Try to extract one complete line from buffer
    std::optional<std::string> extract_line();
};

} // namespace protocol
} // namespace agentchat

#endif // AGENTCHAT_INTERNAL_LINE_FRAMER_HPP
