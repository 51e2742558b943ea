#include <agentchat/types.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace agentchat
{

UsageInfo usage_from_json(const json& j)
{
    UsageInfo usage;
    if (!j.is_object())
        return usage;

    usage.input_tokens = j.value("input_tokens", 0LL);
    usage.output_tokens = j.value("output_tokens", 0LL);
    usage.cache_read_input_tokens = j.value("cache_read_input_tokens", 0LL);
    usage.cache_creation_input_tokens = j.value("cache_creation_input_tokens", 0LL);
    return usage;
}

json usage_to_json(const UsageInfo& usage)
{
    return {{"input_tokens", usage.input_tokens},
            {"output_tokens", usage.output_tokens},
            {"cache_read_input_tokens", usage.cache_read_input_tokens},
            {"cache_creation_input_tokens", usage.cache_creation_input_tokens}};
}

std::string get_text_content(const std::vector<ContentBlock>& content)
{
    std::string result;

    for (const auto& block : content)
    {
        if (auto* text_block = std::get_if<TextBlock>(&block))
        {
            result += text_block->text;
        }
    }

    return result;
}

std::string iso_timestamp_now()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << millis << 'Z';
    return ss.str();
}

std::optional<ImageAttachment> parse_image_data_url(const std::string& data_url)
{
    static const std::regex data_url_regex(R"(^data:(image/\w+);base64,(.+)$)");

    std::smatch match;
    if (!std::regex_match(data_url, match, data_url_regex))
        return std::nullopt;

    ImageAttachment image;
    image.media_type = match[1].str();
    image.data = match[2].str();
    return image;
}

} // namespace agentchat
