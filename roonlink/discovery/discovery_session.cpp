#include "roonlink/discovery/discovery_session.hpp"
#include "roonlink/discovery/sood_codec.hpp"
#include "roonlink/logging/roonlink_logging.hpp"
#include "roonlink/net/socket_options.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/socket_base.hpp>

namespace roonlink
{

DiscoverySession::DiscoverySession(boost::asio::io_context& io_context, std::size_t receive_buffer_size)
    : _io_context(io_context), _socket(io_context), _deadline_timer(io_context), _recv_buffer(receive_buffer_size)
{
    _socket.open(boost::asio::ip::udp::v4());

    boost::system::error_code error_code;
    _socket.set_option(boost::asio::socket_base::reuse_address(true), error_code);
    if (error_code)
    {
        ROONLINK_LOG_DEBUG("Address reuse not available: " << error_code.message());
    }
#ifdef SO_REUSEPORT
    _socket.set_option(ReusePort(true), error_code);
    if (error_code)
    {
        ROONLINK_LOG_DEBUG("Port reuse not available: " << error_code.message());
    }
#endif

    _socket.set_option(boost::asio::socket_base::broadcast(true));
    _socket.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), 0));
    ROONLINK_LOG_TRACE("Discovery socket bound to port " << local_port());
}

DiscoverySession::~DiscoverySession()
{
    boost::system::error_code error_code;
    _socket.close(error_code);
}

void DiscoverySession::enable_multicast(int ttl)
{
    boost::system::error_code error_code;
    _socket.set_option(boost::asio::ip::multicast::hops(ttl), error_code);
    if (error_code)
    {
        ROONLINK_LOG_WARNING("Failed to set multicast TTL " << ttl << ": " << error_code.message());
    }
    _socket.set_option(boost::asio::ip::multicast::outbound_interface(boost::asio::ip::address_v4::any()), error_code);
    if (error_code)
    {
        ROONLINK_LOG_WARNING("Failed to select multicast interface: " << error_code.message());
    }
}

bool DiscoverySession::send_to(const std::vector<std::uint8_t>& datagram, const boost::asio::ip::udp::endpoint& destination)
{
    boost::system::error_code error_code;
    _socket.send_to(boost::asio::buffer(datagram), destination, 0, error_code);
    if (error_code)
    {
        ROONLINK_LOG_WARNING("Failed to send probe to " << destination << ": " << error_code.message());
        return false;
    }

    ROONLINK_LOG_TRACE("Probe sent to " << destination);
    return true;
}

void DiscoverySession::receive_until(std::chrono::steady_clock::time_point deadline)
{
    _deadline_reached = false;
    _deadline_timer.expires_at(deadline);
    _deadline_timer.async_wait([this](const boost::system::error_code& error_code) { handle_deadline(error_code); });
    start_receive();

    _io_context.restart();
    _io_context.run();
}

void DiscoverySession::start_receive()
{
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                               { handle_receive(error_code, bytes_transferred); });
}

void DiscoverySession::handle_receive(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            ROONLINK_LOG_DEBUG("Discovery window closed");
        }
        else
        {
            ROONLINK_LOG_ERROR("Error receiving discovery response: " << error_code.message());
        }
        _deadline_timer.cancel();
        return;
    }

    handle_datagram(_recv_buffer.data(), bytes_transferred, _remote_endpoint.address().to_string());

    // A completion queued behind the deadline must not start another receive
    if (_deadline_reached || std::chrono::steady_clock::now() >= _deadline_timer.expiry())
    {
        ROONLINK_LOG_DEBUG("Discovery window closed");
        _deadline_reached = true;
        _deadline_timer.cancel();
        return;
    }
    start_receive();
}

void DiscoverySession::handle_deadline(const boost::system::error_code& error_code)
{
    if (error_code == boost::asio::error::operation_aborted)
    {
        return;
    }

    _deadline_reached = true;
    boost::system::error_code cancel_error;
    _socket.cancel(cancel_error);
    if (cancel_error)
    {
        ROONLINK_LOG_ERROR("Failed to cancel discovery receive: " << cancel_error.message());
    }
}

bool DiscoverySession::handle_datagram(const std::uint8_t* data, std::size_t size, const std::string& sender_host)
{
    auto decoded = SoodCodec::decode_response(data, size);
    if (const auto* error = std::get_if<DecodeError>(&decoded))
    {
        ++_rejected_count;
        ROONLINK_LOG_DEBUG("Discarding datagram from " << sender_host << " (" << to_string(*error) << ", " << size << " bytes)");
        return false;
    }

    auto record = SoodCodec::to_server_record(std::get<PropertyMap>(decoded), sender_host);
    if (!record)
    {
        ++_rejected_count;
        ROONLINK_LOG_DEBUG("Discarding response from " << sender_host << " without unique_id");
        return false;
    }

    if (_seen.count(record->id) != 0U)
    {
        ROONLINK_LOG_DEBUG("Already seen Core " << record->id << ", ignoring response from " << sender_host);
        return false;
    }

    ROONLINK_LOG_INFO("Discovered Core '" << record->name << "' (" << record->id << ") at " << record->host << ":" << record->port);
    _seen.emplace(record->id, *record);
    _servers.push_back(std::move(*record));
    return true;
}

std::vector<ServerRecord> DiscoverySession::take_servers()
{
    if (_rejected_count > 0)
    {
        ROONLINK_LOG_DEBUG(_rejected_count << " datagram(s) rejected during this pass");
    }
    _seen.clear();
    std::vector<ServerRecord> servers;
    servers.swap(_servers);
    return servers;
}

unsigned short DiscoverySession::local_port() const
{
    boost::system::error_code error_code;
    auto endpoint = _socket.local_endpoint(error_code);
    return error_code ? 0 : endpoint.port();
}

} // namespace roonlink
