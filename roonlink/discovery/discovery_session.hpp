#pragma once

#include "roonlink/discovery/server_record.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace roonlink
{

/**
 * @brief One discovery pass: the socket, the deadline and what was heard so far
 *
 * The socket is opened on an ephemeral port when the session is created and
 * closed when it is destroyed. Responses are kept in first-seen order; a later
 * response carrying an id that was already seen is dropped, even when its
 * fields differ.
 */
class DiscoverySession
{
public:
    /**
     * @brief Opens and binds the discovery socket
     * @throws boost::system::system_error when the socket cannot be opened or bound
     */
    DiscoverySession(boost::asio::io_context& io_context, std::size_t receive_buffer_size);
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&)            = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;
    DiscoverySession(DiscoverySession&&)                 = delete;
    DiscoverySession& operator=(DiscoverySession&&)      = delete;

    void enable_multicast(int ttl);

    /// Sends one datagram. Failures are logged and reported through the return value.
    bool send_to(const std::vector<std::uint8_t>& datagram, const boost::asio::ip::udp::endpoint& destination);

    /**
     * @brief Listens until the deadline passes or the socket fails
     *
     * Runs the io_context the session was created with, so it blocks the
     * calling thread for at most the remaining time until the deadline.
     */
    void receive_until(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Decodes one datagram and records the server it announces
     * @param data Received bytes
     * @param size Number of received bytes
     * @param sender_host Address the datagram came from
     * @return true when a server not seen before was added
     */
    bool handle_datagram(const std::uint8_t* data, std::size_t size, const std::string& sender_host);

    const std::vector<ServerRecord>& servers() const { return _servers; }
    std::vector<ServerRecord> take_servers();

    unsigned short local_port() const;

private:
    void start_receive();
    void handle_receive(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_deadline(const boost::system::error_code& error_code);

    boost::asio::io_context& _io_context;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;
    boost::asio::steady_timer _deadline_timer;
    std::vector<std::uint8_t> _recv_buffer;

    std::unordered_map<std::string, ServerRecord> _seen;
    std::vector<ServerRecord> _servers;
    std::size_t _rejected_count = 0;
    bool _deadline_reached      = false;
};

} // namespace roonlink
