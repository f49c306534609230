#pragma once

#include <set>
#include <string>

struct ifaddrs;

namespace roonlink
{

/**
 * Works out which IPv4 broadcast addresses a discovery probe should be sent to.
 *
 * A single 255.255.255.255 send only leaves through the interface the OS
 * picks, so every active interface's subnet broadcast address is targeted too.
 */
class BroadcastAddressResolver
{
public:
    static constexpr const char* limited_broadcast = "255.255.255.255";

    BroadcastAddressResolver()          = default;
    virtual ~BroadcastAddressResolver() = default;

    BroadcastAddressResolver(const BroadcastAddressResolver&)            = delete;
    BroadcastAddressResolver& operator=(const BroadcastAddressResolver&) = delete;

    /**
     * Enumerates the local interfaces and returns their broadcast addresses.
     *
     * The limited broadcast address is always part of the result. When the
     * interfaces cannot be enumerated at all, it is the only element.
     */
    virtual std::set<std::string> resolve_broadcast_targets() const;

    /**
     * Collects the broadcast addresses of a getifaddrs() list.
     *
     * Interfaces that are down, not IPv4 or without a broadcast address are
     * skipped, as is any entry whose address cannot be converted.
     */
    static std::set<std::string> collect_broadcast_targets(const ifaddrs* interfaces);
};

} // namespace roonlink
