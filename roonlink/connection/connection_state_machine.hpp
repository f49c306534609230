#pragma once

#include "roonlink/config/credential_store.hpp"
#include "roonlink/connection/authentication_status.hpp"
#include "roonlink/connection/connection_states.hpp"
#include "roonlink/connection/session.hpp"
#include "roonlink/discovery/server_record.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace roonlink
{

/**
 * @brief Drives one Core connection from selection to authorization
 *
 * connect(), disconnect() and reconnect_from_saved() are meant to be called
 * from one control thread. Session events arrive on the session's own thread;
 * both paths only touch the machine's state inside short critical sections.
 * Sessions are stopped, credentials saved and callbacks invoked outside the
 * lock.
 *
 * Every connect() starts a new attempt with its own generation number, so
 * events from a session that was already replaced or disconnected are
 * ignored.
 */
class ConnectionStateMachine
{
public:
    using AuthCallback  = std::function<void(const AuthenticationStatus& status)>;
    using StateCallback = std::function<void(ConnectionState state)>;

    ConnectionStateMachine(AppInfo app_info, std::shared_ptr<CredentialStore> credential_store, SessionFactory session_factory);
    ~ConnectionStateMachine();

    ConnectionStateMachine(const ConnectionStateMachine&)            = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine(ConnectionStateMachine&&)                 = delete;
    ConnectionStateMachine& operator=(ConnectionStateMachine&&)      = delete;

    /**
     * Starts connecting to a Core, replacing any current connection.
     * @param server The Core to connect to
     * @param token Token from an earlier authorization, lets the Core skip asking the user again
     * @return true when the attempt is under way, false when the session could not be created
     */
    bool connect(const ServerRecord& server, const std::optional<std::string>& token = std::nullopt);

    /// Drops the current connection, if any. Always ends in disconnected.
    void disconnect();

    /**
     * Connects to the Core saved by the last successful authorization.
     * @return false without touching the state when no usable Core is saved
     */
    bool reconnect_from_saved();

    void set_auth_callback(AuthCallback callback);
    void set_state_callback(StateCallback callback);

    ConnectionState state() const;
    std::optional<ServerRecord> current_server() const;

    /// The session, only while connected.
    std::shared_ptr<Session> session() const;

private:
    void on_session_event(std::uint64_t generation, SessionEvent event, const std::string& detail);
    void on_authorization_check(std::uint64_t generation, const std::shared_ptr<Session>& session);
    void on_connection_failure(std::uint64_t generation, const std::string& message);

    void persist_credential(const ServerRecord& server, const std::string& token);
    void notify_auth_status(const AuthenticationStatus& status);
    void notify_state(ConnectionState state);
    static void stop_session(const std::shared_ptr<Session>& session);

    mutable std::mutex _mutex;
    AppInfo _app_info;
    std::shared_ptr<CredentialStore> _credential_store;
    SessionFactory _session_factory;

    ConnectionState _state = ConnectionState::disconnected;
    std::optional<ServerRecord> _current_server;
    std::shared_ptr<Session> _session;
    std::uint64_t _generation = 0;

    AuthCallback _auth_callback;
    StateCallback _state_callback;
};

} // namespace roonlink
