#pragma once

#include <cstdint>

namespace roonlink
{
enum class ConnectionState : std::uint8_t
{
    disconnected,
    discovering,
    connecting,
    authenticating,
    connected,
    error
};

inline const char* to_string(ConnectionState state) noexcept
{
    switch (state)
    {
    case ConnectionState::disconnected:
        return "disconnected";
    case ConnectionState::discovering:
        return "discovering";
    case ConnectionState::connecting:
        return "connecting";
    case ConnectionState::authenticating:
        return "authenticating";
    case ConnectionState::connected:
        return "connected";
    case ConnectionState::error:
        return "error";
    }
    return "unknown";
}

} // namespace roonlink
