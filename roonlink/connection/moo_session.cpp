#include "roonlink/connection/moo_session.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/optional/optional.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <future>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace roonlink
{

namespace
{

void put_list(boost::property_tree::ptree& tree, const char* key, const std::vector<std::string>& values)
{
    // property_tree cannot write an empty JSON array, so empty lists are left out
    if (values.empty())
    {
        return;
    }
    boost::property_tree::ptree list;
    for (const auto& value : values)
    {
        boost::property_tree::ptree item;
        item.put("", value);
        list.push_back(std::make_pair("", item));
    }
    tree.add_child(key, list);
}

std::optional<boost::property_tree::ptree> parse_json_body(const std::string& body)
{
    if (body.empty())
    {
        return std::nullopt;
    }
    boost::property_tree::ptree tree;
    std::istringstream input(body);
    try
    {
        boost::property_tree::read_json(input, tree);
    }
    catch (const boost::property_tree::json_parser_error& e)
    {
        ROONLINK_LOG_WARNING("Invalid JSON body from Core: " << e.what());
        return std::nullopt;
    }
    return tree;
}

} // namespace

MooSession::MooSession(boost::asio::io_context& io_context, AppInfo app_info, std::string host, std::uint16_t port,
                       std::optional<std::string> token)
    : _io_context(io_context)
    , _resolver(io_context)
    , _websocket(io_context)
    , _app_info(std::move(app_info))
    , _host(std::move(host))
    , _port(port)
    , _token(std::move(token))
{
    if (_host.empty())
    {
        throw std::invalid_argument("Core host must not be empty");
    }
    if (_port == 0)
    {
        throw std::invalid_argument("Core port must be between 1 and 65535");
    }
    if (_token && _token->empty())
    {
        _token.reset();
    }
}

void MooSession::set_state_callback(StateCallback callback)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _state_callback = std::move(callback);
}

void MooSession::start()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_started)
        {
            throw std::logic_error("session already started");
        }
        _started = true;
    }

    auto self = shared_from_this();
    boost::asio::post(_io_context,
                      [self]()
                      {
                          if (self->is_stopping())
                          {
                              return;
                          }
                          ROONLINK_LOG_DEBUG("Resolving " << self->_host << ":" << self->_port);
                          self->_resolver.async_resolve(
                              self->_host, std::to_string(self->_port),
                              [self](const boost::system::error_code& error_code, boost::asio::ip::tcp::resolver::results_type results)
                              { self->handle_resolve(error_code, std::move(results)); });
                      });
}

bool MooSession::async_stop(std::function<void()> on_stopped)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping)
        {
            return false;
        }
        _stopping = true;
    }

    auto self = shared_from_this();
    boost::asio::post(_io_context,
                      [self, on_stopped = std::move(on_stopped)]()
                      {
                          self->close_transport();
                          if (on_stopped)
                          {
                              on_stopped();
                          }
                      });
    return true;
}

void MooSession::stop()
{
    if (_io_context.get_executor().running_in_this_thread())
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_stopping)
            {
                return;
            }
            _stopping = true;
        }
        ROONLINK_LOG_DEBUG("Stop called on io context, closing without waiting");
        close_transport();
        return;
    }

    if (_io_context.stopped())
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _stopping = true;
        }
        close_transport();
        return;
    }

    auto stopped = std::make_shared<std::promise<void>>();
    auto done    = stopped->get_future();
    if (async_stop([stopped]() { stopped->set_value(); }))
    {
        if (done.wait_for(connect_timeout) != std::future_status::ready)
        {
            ROONLINK_LOG_WARNING("Timed out waiting for session to stop");
        }
    }
}

std::optional<std::string> MooSession::token() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _token;
}

std::string MooSession::core_name() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _core_name;
}

std::string MooSession::registration_body() const
{
    boost::property_tree::ptree body;
    body.put("extension_id", _app_info.extension_id);
    body.put("display_name", _app_info.display_name);
    body.put("display_version", _app_info.display_version);
    body.put("publisher", _app_info.publisher);
    body.put("email", _app_info.email);
    put_list(body, "required_services", _app_info.required_services);
    put_list(body, "optional_services", _app_info.optional_services);
    put_list(body, "provided_services", _app_info.provided_services);

    auto token = this->token();
    if (token)
    {
        body.put("token", *token);
    }

    std::ostringstream output;
    boost::property_tree::write_json(output, body, false);
    return output.str();
}

void MooSession::handle_resolve(const boost::system::error_code& error_code, boost::asio::ip::tcp::resolver::results_type results)
{
    if (error_code)
    {
        if (error_code != boost::asio::error::operation_aborted)
        {
            fail(SessionEvent::connection_failed, "Failed to resolve " + _host + ": " + error_code.message());
        }
        return;
    }
    if (is_stopping())
    {
        return;
    }

    auto self = shared_from_this();
    boost::beast::get_lowest_layer(_websocket).expires_after(connect_timeout);
    boost::beast::get_lowest_layer(_websocket)
        .async_connect(results, [self](const boost::system::error_code& error_code, const boost::asio::ip::tcp::endpoint&)
                       { self->handle_connect(error_code); });
}

void MooSession::handle_connect(const boost::system::error_code& error_code)
{
    if (error_code)
    {
        if (!is_stopping())
        {
            fail(SessionEvent::connection_failed,
                 "Cannot reach Core at " + _host + ":" + std::to_string(_port) + ": " + error_code.message());
        }
        return;
    }

    ROONLINK_LOG_DEBUG("TCP connection to " << _host << ":" << _port << " established");
    boost::beast::get_lowest_layer(_websocket).expires_never();
    _websocket.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::client));

    auto self = shared_from_this();
    _websocket.async_handshake(_host + ":" + std::to_string(_port), "/api",
                               [self](const boost::system::error_code& error_code) { self->handle_handshake(error_code); });
}

void MooSession::handle_handshake(const boost::system::error_code& error_code)
{
    if (error_code)
    {
        if (!is_stopping())
        {
            fail(SessionEvent::connection_failed, "WebSocket handshake with " + _host + " failed: " + error_code.message());
        }
        return;
    }

    _websocket.binary(true);
    emit(SessionEvent::transport_connected, _host + ":" + std::to_string(_port));

    send(MooMessage::request(registry_info, info_request_id));
    start_read();
}

void MooSession::start_read()
{
    auto self = shared_from_this();
    _websocket.async_read(_read_buffer, [self](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                          { self->handle_read(error_code, bytes_transferred); });
}

void MooSession::handle_read(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    if (error_code)
    {
        if (is_stopping() || error_code == boost::asio::error::operation_aborted)
        {
            ROONLINK_LOG_DEBUG("Session read aborted");
        }
        else if (error_code == boost::beast::websocket::error::closed)
        {
            fail(SessionEvent::connection_lost, "Core closed the connection");
        }
        else
        {
            fail(SessionEvent::connection_lost, "Connection to Core lost: " + error_code.message());
        }
        return;
    }

    std::string text = boost::beast::buffers_to_string(_read_buffer.data());
    _read_buffer.consume(_read_buffer.size());
    ROONLINK_LOG_TRACE("Received " << bytes_transferred << " bytes: " << text);

    auto message = MooMessage::parse(text);
    if (message)
    {
        handle_message(*message);
    }
    else
    {
        ROONLINK_LOG_WARNING("Ignoring malformed frame from Core");
    }

    if (!is_stopping())
    {
        start_read();
    }
}

void MooSession::handle_message(const MooMessage& message)
{
    if (message.verb == MooMessage::request_verb)
    {
        handle_core_request(message);
        return;
    }

    auto request_id = message.request_id();
    if (!request_id)
    {
        ROONLINK_LOG_DEBUG("Ignoring reply without Request-Id: " << message.verb << " " << message.name);
        return;
    }

    if (*request_id == info_request_id)
    {
        auto info = parse_json_body(message.body);
        if (info)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _core_name = info->get<std::string>("display_name", "");
        }
        ROONLINK_LOG_INFO("Core info received (" << core_name() << "), registering");
        emit(SessionEvent::info_received, core_name());
        send(MooMessage::request(registry_register, register_request_id, registration_body()));
    }
    else if (*request_id == register_request_id)
    {
        if (message.verb == MooMessage::continue_verb && message.name == "Registered")
        {
            auto registration = parse_json_body(message.body);
            boost::optional<std::string> token;
            if (registration)
            {
                token = registration->get_optional<std::string>("token");
            }
            if (!token || token->empty())
            {
                ROONLINK_LOG_WARNING("Registration reply without token");
                return;
            }
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _token = *token;
            }
            emit(SessionEvent::registered, core_name());
        }
        else if (message.verb == MooMessage::complete_verb)
        {
            fail(SessionEvent::connection_failed, "Core refused registration: " + message.name);
        }
    }
    else
    {
        ROONLINK_LOG_DEBUG("Ignoring reply for unknown request " << *request_id);
    }
}

void MooSession::handle_core_request(const MooMessage& message)
{
    auto request_id = message.header("Request-Id");
    if (!request_id)
    {
        ROONLINK_LOG_DEBUG("Ignoring request without Request-Id: " << message.name);
        return;
    }

    if (message.name == ping_request)
    {
        send(MooMessage::reply(MooMessage::complete_verb, "Success", *request_id));
    }
    else
    {
        ROONLINK_LOG_DEBUG("Refusing unsupported request " << message.name);
        send(MooMessage::reply(MooMessage::complete_verb, "InvalidRequest", *request_id,
                               "{\"error\":\"unsupported request\"}"));
    }
}

void MooSession::send(const MooMessage& message)
{
    _write_queue.push_back(message.construct());
    if (!_writing)
    {
        write_next();
    }
}

void MooSession::write_next()
{
    _writing  = true;
    auto self = shared_from_this();
    _websocket.async_write(boost::asio::buffer(_write_queue.front()),
                           [self](const boost::system::error_code& error_code, std::size_t) { self->handle_write(error_code); });
}

void MooSession::handle_write(const boost::system::error_code& error_code)
{
    _write_queue.pop_front();
    if (error_code)
    {
        _writing = false;
        _write_queue.clear();
        if (!is_stopping() && error_code != boost::asio::error::operation_aborted)
        {
            fail(SessionEvent::connection_lost, "Failed to send to Core: " + error_code.message());
        }
        return;
    }

    if (_write_queue.empty())
    {
        _writing = false;
    }
    else
    {
        write_next();
    }
}

void MooSession::close_transport()
{
    _resolver.cancel();
    boost::beast::get_lowest_layer(_websocket).close();
}

void MooSession::emit(SessionEvent event, const std::string& detail)
{
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping)
        {
            return;
        }
        callback = _state_callback;
    }
    if (callback)
    {
        callback(event, detail);
    }
}

void MooSession::fail(SessionEvent event, const std::string& detail)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_failed)
        {
            return;
        }
        _failed = true;
    }
    ROONLINK_LOG_ERROR(detail);
    emit(event, detail);
}

bool MooSession::is_stopping() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _stopping;
}

SessionFactory make_moo_session_factory(boost::asio::io_context& io_context)
{
    return [&io_context](const AppInfo& app_info, const std::string& host, std::uint16_t port, const std::optional<std::string>& token)
    { return std::make_shared<MooSession>(io_context, app_info, host, port, token); };
}

} // namespace roonlink
