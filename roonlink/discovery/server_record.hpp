#pragma once

#include <cstdint>
#include <string>

namespace roonlink
{

/**
 * @brief A Core found on the network
 *
 * Two records with the same id describe the same Core, whichever interface or
 * transport the response came in on.
 */
struct ServerRecord
{
    static constexpr std::uint16_t default_port = 9100;

    std::string id;               ///< Vendor assigned unique id of the Core
    std::string name;             ///< Display name, "Unknown" when not announced
    std::string software_version; ///< Display version, "Unknown" when not announced
    std::string host;             ///< IP address the response was sent from
    std::uint16_t port = default_port;
};

inline bool operator==(const ServerRecord& lhs, const ServerRecord& rhs)
{
    return lhs.id == rhs.id && lhs.name == rhs.name && lhs.software_version == rhs.software_version && lhs.host == rhs.host &&
           lhs.port == rhs.port;
}

inline bool operator!=(const ServerRecord& lhs, const ServerRecord& rhs)
{
    return !(lhs == rhs);
}

} // namespace roonlink
