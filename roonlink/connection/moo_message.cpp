#include "roonlink/connection/moo_message.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <string>

namespace roonlink
{

std::optional<std::string> MooMessage::header(const std::string& key) const
{
    auto iter = headers.find(key);
    if (iter == headers.end())
    {
        return std::nullopt;
    }
    return iter->second;
}

std::optional<int> MooMessage::request_id() const
{
    auto value = header("Request-Id");
    if (!value)
    {
        return std::nullopt;
    }
    try
    {
        std::size_t parsed = 0;
        int id             = std::stoi(*value, &parsed);
        if (parsed != value->size())
        {
            return std::nullopt;
        }
        return id;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

MooMessage MooMessage::request(const std::string& name, int request_id, const std::string& json_body)
{
    return reply(request_verb, name, std::to_string(request_id), json_body);
}

MooMessage MooMessage::reply(const std::string& verb, const std::string& name, const std::string& request_id,
                             const std::string& json_body)
{
    MooMessage message;
    message.verb                  = verb;
    message.name                  = name;
    message.headers["Request-Id"] = request_id;
    message.body                  = json_body;
    return message;
}

std::string MooMessage::construct() const
{
    std::string text = std::string(protocol) + " " + verb + " " + name + "\n";
    for (const auto& entry : headers)
    {
        if (entry.first == "Content-Length" || entry.first == "Content-Type")
        {
            continue;
        }
        text += entry.first + ": " + entry.second + "\n";
    }
    if (!body.empty())
    {
        text += "Content-Length: " + std::to_string(body.size()) + "\n";
        text += "Content-Type: application/json\n";
    }
    text += "\n";
    text += body;
    return text;
}

std::optional<MooMessage> MooMessage::parse(const std::string& text)
{
    // Expected: "MOO/1 VERB name\nKey: value\n...\n\nbody"
    std::size_t line_end = text.find('\n');
    if (line_end == std::string::npos)
    {
        ROONLINK_LOG_DEBUG("Invalid MOO frame (no line break)");
        return std::nullopt;
    }

    std::string first_line = text.substr(0, line_end);
    std::size_t first_space = first_line.find(' ');
    if (first_space == std::string::npos || first_line.substr(0, first_space) != protocol)
    {
        ROONLINK_LOG_DEBUG("Invalid MOO frame (bad first line): " << first_line);
        return std::nullopt;
    }
    std::size_t second_space = first_line.find(' ', first_space + 1);
    if (second_space == std::string::npos)
    {
        ROONLINK_LOG_DEBUG("Invalid MOO frame (missing name): " << first_line);
        return std::nullopt;
    }

    MooMessage message;
    message.verb = first_line.substr(first_space + 1, second_space - first_space - 1);
    message.name = first_line.substr(second_space + 1);
    if (message.verb.empty() || message.name.empty())
    {
        ROONLINK_LOG_DEBUG("Invalid MOO frame (empty verb or name): " << first_line);
        return std::nullopt;
    }

    std::size_t position = line_end + 1;
    while (true)
    {
        if (position >= text.size())
        {
            // Headers ended with the frame
            return message;
        }
        line_end = text.find('\n', position);
        if (line_end == std::string::npos)
        {
            line_end = text.size();
        }
        std::string line = text.substr(position, line_end - position);
        position         = line_end + 1;
        if (line.empty())
        {
            break;
        }

        std::size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0)
        {
            ROONLINK_LOG_DEBUG("Invalid MOO header line: " << line);
            return std::nullopt;
        }
        std::size_t value_start = line.find_first_not_of(' ', colon + 1);
        message.headers[line.substr(0, colon)] = value_start == std::string::npos ? std::string() : line.substr(value_start);
    }

    message.body = position < text.size() ? text.substr(position) : std::string();

    auto content_length = message.header("Content-Length");
    if (content_length)
    {
        std::size_t length = 0;
        try
        {
            length = static_cast<std::size_t>(std::stoul(*content_length));
        }
        catch (const std::exception&)
        {
            ROONLINK_LOG_DEBUG("Invalid MOO Content-Length: " << *content_length);
            return std::nullopt;
        }
        if (message.body.size() < length)
        {
            ROONLINK_LOG_DEBUG("MOO body shorter than Content-Length (" << message.body.size() << " < " << length << ")");
            return std::nullopt;
        }
        message.body.resize(length);
    }

    return message;
}

} // namespace roonlink
