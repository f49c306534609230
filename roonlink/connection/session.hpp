#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace roonlink
{

/// Identity this client presents to a Core when asking to be authorized.
struct AppInfo
{
    std::string extension_id    = "com.roonlink.cli";
    std::string display_name    = "roonlink";
    std::string display_version = "1.0.0";
    std::string publisher       = "roonlink";
    std::string email           = "roonlink@localhost";

    std::vector<std::string> required_services = {"com.roonlabs.transport:2"};
    std::vector<std::string> optional_services;
    std::vector<std::string> provided_services = {"com.roonlabs.ping:1"};
};

enum class SessionEvent : std::uint8_t
{
    transport_connected,
    info_received,
    registered,
    connection_failed,
    connection_lost
};

inline const char* to_string(SessionEvent event) noexcept
{
    switch (event)
    {
    case SessionEvent::transport_connected:
        return "transport_connected";
    case SessionEvent::info_received:
        return "info_received";
    case SessionEvent::registered:
        return "registered";
    case SessionEvent::connection_failed:
        return "connection_failed";
    case SessionEvent::connection_lost:
        return "connection_lost";
    }
    return "unknown";
}

/**
 * @brief Connection to one Core, as seen by the connection state machine
 *
 * State callbacks are delivered from the session's own thread. They must not
 * be invoked while the session holds a lock that token() also takes.
 */
class Session
{
public:
    using StateCallback = std::function<void(SessionEvent event, const std::string& detail)>;

    virtual ~Session() = default;

    /// Must be called before start().
    virtual void set_state_callback(StateCallback callback) = 0;

    /**
     * @brief Starts connecting in the background
     * @throws std::exception when the attempt cannot even be started
     */
    virtual void start() = 0;

    /// Shuts the session down. May throw; callers treat it as best effort.
    virtual void stop() = 0;

    /// The authorization token, once the Core has granted one.
    virtual std::optional<std::string> token() const = 0;
};

using SessionFactory = std::function<std::shared_ptr<Session>(const AppInfo& app_info, const std::string& host, std::uint16_t port,
                                                              const std::optional<std::string>& token)>;

} // namespace roonlink
