#include "roonlink/net/broadcast_address_resolver.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace roonlink
{

std::set<std::string> BroadcastAddressResolver::resolve_broadcast_targets() const
{
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0)
    {
        ROONLINK_LOG_ERROR("Failed to enumerate network interfaces: " << std::strerror(errno));
        return {limited_broadcast};
    }

    std::set<std::string> targets;
    try
    {
        targets = collect_broadcast_targets(interfaces);
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Exception while collecting broadcast addresses: " << e.what());
        targets = {limited_broadcast};
    }
    freeifaddrs(interfaces);

    return targets;
}

std::set<std::string> BroadcastAddressResolver::collect_broadcast_targets(const ifaddrs* interfaces)
{
    std::set<std::string> targets {limited_broadcast};

    for (const ifaddrs* entry = interfaces; entry != nullptr; entry = entry->ifa_next)
    {
        const char* name = entry->ifa_name != nullptr ? entry->ifa_name : "?";

        if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }
        if ((entry->ifa_flags & IFF_UP) == 0 || (entry->ifa_flags & IFF_BROADCAST) == 0)
        {
            ROONLINK_LOG_TRACE("Skipping interface " << name << " (down or not broadcast capable)");
            continue;
        }
        if (entry->ifa_broadaddr == nullptr || entry->ifa_broadaddr->sa_family != AF_INET)
        {
            ROONLINK_LOG_DEBUG("Interface " << name << " has no IPv4 broadcast address");
            continue;
        }

        const auto* broadcast = reinterpret_cast<const sockaddr_in*>(entry->ifa_broadaddr);
        boost::asio::ip::address_v4 address(ntohl(broadcast->sin_addr.s_addr));
        if (address.is_unspecified())
        {
            ROONLINK_LOG_DEBUG("Interface " << name << " reports an unspecified broadcast address");
            continue;
        }

        std::string text = address.to_string();
        ROONLINK_LOG_DEBUG("Broadcast address for interface " << name << ": " << text);
        targets.insert(text);
    }

    return targets;
}

} // namespace roonlink
