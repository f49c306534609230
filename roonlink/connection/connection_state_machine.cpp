#include "roonlink/connection/connection_state_machine.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <stdexcept>
#include <utility>

namespace roonlink
{

ConnectionStateMachine::ConnectionStateMachine(AppInfo app_info, std::shared_ptr<CredentialStore> credential_store,
                                               SessionFactory session_factory)
    : _app_info(std::move(app_info)), _credential_store(std::move(credential_store)), _session_factory(std::move(session_factory))
{
    if (!_credential_store)
    {
        throw std::invalid_argument("ConnectionStateMachine needs a credential store");
    }
    if (!_session_factory)
    {
        throw std::invalid_argument("ConnectionStateMachine needs a session factory");
    }
}

ConnectionStateMachine::~ConnectionStateMachine()
{
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        session = std::move(_session);
        ++_generation;
    }
    stop_session(session);
}

bool ConnectionStateMachine::connect(const ServerRecord& server, const std::optional<std::string>& token)
{
    ROONLINK_LOG_INFO("Connecting to " << server.name << " at " << server.host << ":" << server.port);

    std::shared_ptr<Session> previous;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        previous        = std::move(_session);
        _state          = ConnectionState::connecting;
        _current_server = server;
        generation      = ++_generation;
    }
    notify_state(ConnectionState::connecting);
    stop_session(previous);

    std::shared_ptr<Session> session;
    try
    {
        session = _session_factory(_app_info, server.host, server.port, token);
        if (!session)
        {
            throw std::runtime_error("no session was created for " + server.host);
        }

        session->set_state_callback([this, generation](SessionEvent event, const std::string& detail)
                                    { on_session_event(generation, event, detail); });

        bool superseded = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (generation != _generation)
            {
                superseded = true;
            }
            else
            {
                _session = session;
                _state   = ConnectionState::authenticating;
            }
        }
        if (superseded)
        {
            ROONLINK_LOG_INFO("Connection attempt to " << server.host << " was superseded");
            stop_session(session);
            return false;
        }
        notify_state(ConnectionState::authenticating);

        session->start();
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Connection failed: " << e.what());

        std::shared_ptr<Session> failed;
        bool report = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (generation == _generation)
            {
                failed = std::move(_session);
                _state = ConnectionState::error;
                report = true;
            }
        }
        stop_session(failed);
        if (report)
        {
            notify_state(ConnectionState::error);
            notify_auth_status(AuthenticationStatus::failure(e.what()));
        }
        return false;
    }

    ROONLINK_LOG_INFO("Connection initiated, waiting for authentication");
    return true;
}

void ConnectionStateMachine::disconnect()
{
    ROONLINK_LOG_INFO("Disconnecting from Core");

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        session = std::move(_session);
        _current_server.reset();
        _state = ConnectionState::disconnected;
        ++_generation;
    }
    stop_session(session);
    notify_state(ConnectionState::disconnected);
}

bool ConnectionStateMachine::reconnect_from_saved()
{
    PersistedCredential saved;
    try
    {
        saved = _credential_store->load();
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Failed to load saved credential: " << e.what());
        return false;
    }

    if (!saved.core_id || saved.core_id->empty() || !saved.host || saved.host->empty() || !saved.port)
    {
        ROONLINK_LOG_INFO("No saved configuration found");
        return false;
    }
    if (*saved.port <= 0 || *saved.port > 65535)
    {
        ROONLINK_LOG_WARNING("Saved port " << *saved.port << " is out of range");
        return false;
    }

    ServerRecord server;
    server.id               = *saved.core_id;
    server.name             = saved.core_name.value_or("Unknown");
    server.software_version = "Unknown";
    server.host             = *saved.host;
    server.port             = static_cast<std::uint16_t>(*saved.port);

    ROONLINK_LOG_INFO("Attempting to reconnect to " << server.name);
    return connect(server, saved.token);
}

void ConnectionStateMachine::set_auth_callback(AuthCallback callback)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _auth_callback = std::move(callback);
}

void ConnectionStateMachine::set_state_callback(StateCallback callback)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _state_callback = std::move(callback);
}

ConnectionState ConnectionStateMachine::state() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

std::optional<ServerRecord> ConnectionStateMachine::current_server() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _current_server;
}

std::shared_ptr<Session> ConnectionStateMachine::session() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _state == ConnectionState::connected ? _session : nullptr;
}

void ConnectionStateMachine::on_session_event(std::uint64_t generation, SessionEvent event, const std::string& detail)
{
    ROONLINK_LOG_DEBUG("Session event: " << to_string(event) << (detail.empty() ? "" : " (" + detail + ")"));

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (generation != _generation || !_session)
        {
            ROONLINK_LOG_TRACE("Ignoring event from a replaced session");
            return;
        }
        session = _session;
    }

    switch (event)
    {
    case SessionEvent::connection_failed:
    case SessionEvent::connection_lost:
        on_connection_failure(generation, detail.empty() ? std::string(to_string(event)) : detail);
        break;
    default:
        on_authorization_check(generation, session);
        break;
    }
}

void ConnectionStateMachine::on_authorization_check(std::uint64_t generation, const std::shared_ptr<Session>& session)
{
    auto token = session->token();
    if (!token || token->empty())
    {
        ROONLINK_LOG_INFO("Waiting for authorization from Core");
        return;
    }

    ServerRecord server;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        // Only the first event carrying a token completes the attempt
        if (generation != _generation || _state != ConnectionState::authenticating || !_current_server)
        {
            return;
        }
        _state = ConnectionState::connected;
        server = *_current_server;
    }

    ROONLINK_LOG_INFO("Authentication successful");
    notify_state(ConnectionState::connected);
    persist_credential(server, *token);
    notify_auth_status(AuthenticationStatus::success(*token));
}

void ConnectionStateMachine::on_connection_failure(std::uint64_t generation, const std::string& message)
{
    bool report = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (generation == _generation && (_state == ConnectionState::connecting || _state == ConnectionState::authenticating))
        {
            // The session stays referenced: it may be calling us from its own thread
            _state = ConnectionState::error;
            report = true;
        }
    }

    if (report)
    {
        ROONLINK_LOG_ERROR("Connection failed: " << message);
        notify_state(ConnectionState::error);
        notify_auth_status(AuthenticationStatus::failure(message));
    }
    else
    {
        ROONLINK_LOG_WARNING("Connection to Core lost: " << message);
    }
}

void ConnectionStateMachine::persist_credential(const ServerRecord& server, const std::string& token)
{
    PersistedCredential credential;
    credential.core_id   = server.id;
    credential.core_name = server.name;
    credential.token     = token;
    credential.host      = server.host;
    credential.port      = server.port;

    try
    {
        _credential_store->save(credential);
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Failed to save credential: " << e.what());
    }
}

void ConnectionStateMachine::notify_auth_status(const AuthenticationStatus& status)
{
    AuthCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _auth_callback;
    }
    if (!callback)
    {
        return;
    }

    try
    {
        callback(status);
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Error in auth callback: " << e.what());
    }
    catch (...)
    {
        ROONLINK_LOG_ERROR("Unknown error in auth callback");
    }
}

void ConnectionStateMachine::notify_state(ConnectionState state)
{
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _state_callback;
    }
    if (!callback)
    {
        return;
    }

    try
    {
        callback(state);
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Error in state callback: " << e.what());
    }
    catch (...)
    {
        ROONLINK_LOG_ERROR("Unknown error in state callback");
    }
}

void ConnectionStateMachine::stop_session(const std::shared_ptr<Session>& session)
{
    if (!session)
    {
        return;
    }

    try
    {
        session->stop();
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_WARNING("Error during disconnect: " << e.what());
    }
}

} // namespace roonlink
