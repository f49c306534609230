#pragma once

#include <map>
#include <optional>
#include <string>

namespace roonlink
{

/**
 * @brief One MOO/1 frame exchanged with a Core over its WebSocket
 *
 * Text layout: "MOO/1 <VERB> <name>", then "Header: value" lines, an empty
 * line and an optional body. Requests use the verb REQUEST and a service path
 * as name ("com.roonlabs.registry:1/info"); replies use CONTINUE or COMPLETE
 * and a status name ("Success", "Registered").
 */
struct MooMessage
{
    static constexpr const char* protocol    = "MOO/1";
    static constexpr const char* request_verb = "REQUEST";
    static constexpr const char* continue_verb = "CONTINUE";
    static constexpr const char* complete_verb = "COMPLETE";

    std::string verb;
    std::string name;
    std::map<std::string, std::string> headers;
    std::string body;

    std::optional<std::string> header(const std::string& key) const;
    std::optional<int> request_id() const;

    static MooMessage request(const std::string& name, int request_id, const std::string& json_body = std::string());
    static MooMessage reply(const std::string& verb, const std::string& name, const std::string& request_id,
                            const std::string& json_body = std::string());

    /// Serializes the frame, adding Content-Length and Content-Type when there is a body.
    std::string construct() const;

    /**
     * @brief Parses a received frame
     * @return The frame, or std::nullopt when the first line or a header line is malformed
     *         or the body is shorter than its Content-Length
     */
    static std::optional<MooMessage> parse(const std::string& text);
};

} // namespace roonlink
