#pragma once

#include "roonlink/discovery/server_record.hpp"
#include "roonlink/net/broadcast_address_resolver.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace roonlink
{

struct DiscoveryConfig
{
    std::string multicast_group     = "239.255.90.90";
    unsigned short port             = 9003;
    int multicast_ttl               = 2;
    std::size_t receive_buffer_size = 64 * 1024;
};

/**
 * @brief Finds Cores on the local network
 *
 * Each call sends the SOOD probe once to the multicast group and once to
 * every broadcast address, then collects responses until the timeout
 * expires. Failures never escape: the caller gets whatever was found, which
 * may be nothing.
 *
 * Overlapping calls from different threads are fine; each call uses its own
 * socket and io_context. A call cannot be cancelled before its timeout.
 */
class DiscoveryService
{
public:
    /// Smallest multicast TTL that crosses a router; lower configured values are raised to it.
    static constexpr int min_multicast_ttl = 2;

    explicit DiscoveryService(DiscoveryConfig config = DiscoveryConfig(),
                              std::shared_ptr<const BroadcastAddressResolver> resolver = nullptr);

    DiscoveryService(const DiscoveryService&)            = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    /**
     * @brief Runs one discovery pass
     * @param timeout_seconds Length of the listening window, must be positive
     * @return Servers in the order their first response arrived
     */
    std::vector<ServerRecord> discover_servers(int timeout_seconds);

    std::vector<ServerRecord> discover_servers(std::chrono::milliseconds timeout);

    const DiscoveryConfig& config() const noexcept { return _config; }

private:
    DiscoveryConfig _config;
    std::shared_ptr<const BroadcastAddressResolver> _resolver;
};

} // namespace roonlink
