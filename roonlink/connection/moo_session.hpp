#pragma once

#include "roonlink/connection/moo_message.hpp"
#include "roonlink/connection/session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace roonlink
{

/**
 * @brief Session that asks a Core for authorization over its WebSocket API
 *
 * Connects to ws://host:port/api, asks the registry for the Core's info and
 * registers this client. The Core answers the registration only once a user
 * has enabled the client in the Core's settings (or immediately, when a
 * token it issued earlier is presented). Ping requests from the Core are
 * answered; every other service request is refused.
 *
 * All handlers run on the io_context given at construction; that context
 * must be run by exactly one thread. Pending handlers keep the session alive.
 */
class MooSession : public Session, public std::enable_shared_from_this<MooSession>
{
public:
    static constexpr const char* registry_info     = "com.roonlabs.registry:1/info";
    static constexpr const char* registry_register = "com.roonlabs.registry:1/register";
    static constexpr const char* ping_request      = "com.roonlabs.ping:1/ping";
    static constexpr std::chrono::seconds connect_timeout {10};

    /// @throws std::invalid_argument when host is empty or port is zero
    MooSession(boost::asio::io_context& io_context, AppInfo app_info, std::string host, std::uint16_t port,
               std::optional<std::string> token);

    MooSession(const MooSession&)            = delete;
    MooSession& operator=(const MooSession&) = delete;
    MooSession(MooSession&&)                 = delete;
    MooSession& operator=(MooSession&&)      = delete;

    void set_state_callback(StateCallback callback) override;

    /// @throws std::logic_error when called twice
    void start() override;

    /**
     * Closes the connection. Blocks until the io_context has closed the
     * transport, unless called from the io_context itself.
     */
    void stop() override;

    bool async_stop(std::function<void()> on_stopped);

    std::optional<std::string> token() const override;

    /// Name the Core reported in its info reply, empty before that.
    std::string core_name() const;

    /// JSON body of the register request, as sent to the Core.
    std::string registration_body() const;

private:
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void handle_resolve(const boost::system::error_code& error_code, boost::asio::ip::tcp::resolver::results_type results);
    void handle_connect(const boost::system::error_code& error_code);
    void handle_handshake(const boost::system::error_code& error_code);
    void start_read();
    void handle_read(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_message(const MooMessage& message);
    void handle_core_request(const MooMessage& message);
    void send(const MooMessage& message);
    void write_next();
    void handle_write(const boost::system::error_code& error_code);
    void close_transport();

    void emit(SessionEvent event, const std::string& detail);
    void fail(SessionEvent event, const std::string& detail);
    bool is_stopping() const;

    static constexpr int info_request_id     = 0;
    static constexpr int register_request_id = 1;

    mutable std::mutex _mutex;
    boost::asio::io_context& _io_context;
    boost::asio::ip::tcp::resolver _resolver;
    WebSocket _websocket;
    boost::beast::flat_buffer _read_buffer;
    std::deque<std::string> _write_queue;
    bool _writing = false;

    AppInfo _app_info;
    std::string _host;
    std::uint16_t _port;
    std::optional<std::string> _token;
    std::string _core_name;

    bool _started  = false;
    bool _stopping = false;
    bool _failed   = false;
    StateCallback _state_callback;
};

/// SessionFactory creating MooSessions on the given io_context.
SessionFactory make_moo_session_factory(boost::asio::io_context& io_context);

} // namespace roonlink
