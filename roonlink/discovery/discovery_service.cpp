#include "roonlink/discovery/discovery_service.hpp"
#include "roonlink/discovery/discovery_session.hpp"
#include "roonlink/discovery/sood_codec.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>

#include <utility>

namespace roonlink
{

DiscoveryService::DiscoveryService(DiscoveryConfig config, std::shared_ptr<const BroadcastAddressResolver> resolver)
    : _config(std::move(config)), _resolver(std::move(resolver))
{
    if (!_resolver)
    {
        _resolver = std::make_shared<BroadcastAddressResolver>();
    }
    if (_config.multicast_ttl < min_multicast_ttl)
    {
        ROONLINK_LOG_WARNING("Multicast TTL " << _config.multicast_ttl << " does not leave the local subnet, using "
                                              << min_multicast_ttl);
        _config.multicast_ttl = min_multicast_ttl;
    }
}

std::vector<ServerRecord> DiscoveryService::discover_servers(int timeout_seconds)
{
    if (timeout_seconds <= 0)
    {
        ROONLINK_LOG_ERROR("Discovery timeout must be positive, got " << timeout_seconds);
        return {};
    }
    return discover_servers(std::chrono::milliseconds(std::chrono::seconds(timeout_seconds)));
}

std::vector<ServerRecord> DiscoveryService::discover_servers(std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0)
    {
        ROONLINK_LOG_ERROR("Discovery timeout must be positive, got " << timeout.count() << " ms");
        return {};
    }

    ROONLINK_LOG_INFO("Starting Core discovery (timeout: " << timeout.count() << " ms)");

    try
    {
        const auto& probe = SoodCodec::encode_probe();
        if (probe.empty())
        {
            ROONLINK_LOG_ERROR("Discovery probe payload is empty");
            return {};
        }

        boost::asio::io_context io_context;
        DiscoverySession session(io_context, _config.receive_buffer_size);

        boost::system::error_code error_code;
        auto group = boost::asio::ip::make_address(_config.multicast_group, error_code);
        if (error_code)
        {
            ROONLINK_LOG_WARNING("Invalid multicast group '" << _config.multicast_group << "': " << error_code.message());
        }
        else
        {
            session.enable_multicast(_config.multicast_ttl);
            session.send_to(probe, boost::asio::ip::udp::endpoint(group, _config.port));
        }

        std::size_t broadcasts_sent = 0;
        for (const auto& target : _resolver->resolve_broadcast_targets())
        {
            auto address = boost::asio::ip::make_address(target, error_code);
            if (error_code)
            {
                ROONLINK_LOG_WARNING("Skipping invalid broadcast address '" << target << "': " << error_code.message());
                continue;
            }
            if (session.send_to(probe, boost::asio::ip::udp::endpoint(address, _config.port)))
            {
                ++broadcasts_sent;
            }
        }
        ROONLINK_LOG_DEBUG("Probe broadcast to " << broadcasts_sent << " address(es)");

        session.receive_until(std::chrono::steady_clock::now() + timeout);

        auto servers = session.take_servers();
        ROONLINK_LOG_INFO("Discovery complete. Found " << servers.size() << " server(s)");
        return servers;
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Discovery failed: " << e.what());
    }

    return {};
}

} // namespace roonlink
