#include "line_framer.hpp"

#include <agentchat/errors.hpp>

namespace agentchat
{
namespace protocol
{

namespace
{
bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}
} // namespace

LineFramer::LineFramer(size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::vector<std::string> LineFramer::feed(const std::string& chunk)
{
    buffer_ += chunk;

    std::vector<std::string> lines;
    while (auto line = extract_line())
    {
        if (is_blank(*line))
            continue;
        lines.push_back(std::move(*line));
    }

    // Only the unterminated tail counts against the limit
    if (buffer_.size() > max_buffer_size_)
    {
        size_t size = buffer_.size();
        buffer_.clear();
        throw JSONDecodeError("Line buffer exceeded maximum size of " +
                              std::to_string(max_buffer_size_) + " bytes (was " +
                              std::to_string(size) + ")");
    }

    return lines;
}

std::optional<std::string> LineFramer::flush()
{
    if (buffer_.empty())
        return std::nullopt;

    std::string rest;
    rest.swap(buffer_);
    if (!rest.empty() && rest.back() == '\r')
        rest.pop_back();
    if (is_blank(rest))
        return std::nullopt;
    return rest;
}

std::optional<std::string> LineFramer::extract_line()
{
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    return line;
}

} // namespace protocol
} // namespace agentchat
