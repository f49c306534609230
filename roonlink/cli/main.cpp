#include "roonlink/cli/cli_config.hpp"
#include "roonlink/config/json_credential_store.hpp"
#include "roonlink/connection/connection_state_machine.hpp"
#include "roonlink/connection/moo_session.hpp"
#include "roonlink/discovery/discovery_service.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options/errors.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace
{

using namespace roonlink;

void print_server(std::size_t index, const ServerRecord& server)
{
    std::cout << "Server " << index << ":\n"
              << "  Name: " << server.name << '\n'
              << "  ID: " << server.id << '\n'
              << "  Host: " << server.host << '\n'
              << "  Port: " << server.port << '\n'
              << "  Version: " << server.software_version << '\n';
}

std::vector<ServerRecord> discover(const CliConfig& config)
{
    std::cout << "State: " << to_string(ConnectionState::discovering) << '\n';
    DiscoveryService service;
    auto servers = service.discover_servers(config.timeout_seconds);

    if (servers.empty())
    {
        std::cout << "No servers found. Possible issues:\n"
                  << "  - The Core is not running\n"
                  << "  - The Core is on a different network\n"
                  << "  - A firewall is blocking discovery (UDP port " << service.config().port << ")\n"
                  << "  - The network does not pass multicast or broadcast traffic\n";
    }
    return servers;
}

int run_discover(const CliConfig& config)
{
    auto servers = discover(config);
    for (std::size_t i = 0; i < servers.size(); ++i)
    {
        print_server(i + 1, servers[i]);
    }
    return 0;
}

std::optional<ServerRecord> select_core(const std::vector<ServerRecord>& servers, const std::string& target)
{
    for (const auto& server : servers)
    {
        if (target.empty() || server.id == target || server.name == target || server.host == target)
        {
            return server;
        }
    }
    return std::nullopt;
}

std::shared_ptr<JsonCredentialStore> make_store(const CliConfig& config)
{
    if (config.config_path.empty())
    {
        return std::make_shared<JsonCredentialStore>();
    }
    return std::make_shared<JsonCredentialStore>(config.config_path);
}

int run_connection(const CliConfig& config)
{
    auto store = make_store(config);

    std::optional<ServerRecord> selected;
    if (config.command == CliCommand::connect)
    {
        auto servers = discover(config);
        if (servers.empty())
        {
            return 1;
        }
        selected = select_core(servers, config.core);
        if (!selected)
        {
            std::cerr << "No discovered Core matches '" << config.core << "'\n";
            return 1;
        }
    }

    boost::asio::io_context io_context;
    auto work = boost::asio::make_work_guard(io_context);
    std::thread io_thread(
        [&io_context]()
        {
            try
            {
                io_context.run();
            }
            catch (const std::exception& e)
            {
                ROONLINK_LOG_ERROR("io_context stopped by exception: " << e.what());
            }
        });

    auto outcome   = std::make_shared<std::promise<AuthenticationStatus>>();
    auto delivered = std::make_shared<std::atomic_bool>(false);
    auto result    = outcome->get_future();

    int exit_code = 0;
    {
        ConnectionStateMachine machine(AppInfo(), store, make_moo_session_factory(io_context));
        machine.set_state_callback([](ConnectionState state) { std::cout << "State: " << to_string(state) << '\n'; });
        machine.set_auth_callback(
            [outcome, delivered](const AuthenticationStatus& status)
            {
                if (!delivered->exchange(true))
                {
                    outcome->set_value(status);
                }
            });

        bool started = false;
        if (selected)
        {
            std::optional<std::string> token;
            auto saved = store->load();
            if (saved.core_id && *saved.core_id == selected->id)
            {
                token = saved.token;
            }
            started = machine.connect(*selected, token);
        }
        else
        {
            started = machine.reconnect_from_saved();
            if (!started && machine.state() == ConnectionState::disconnected)
            {
                std::cerr << "No saved Core, run 'connect' first\n";
            }
        }

        if (started)
        {
            std::cout << "Waiting up to " << config.wait_seconds << "s for authorization. "
                      << "Enable the extension in the Core's settings if asked.\n";
        }

        if (started && result.wait_for(std::chrono::seconds(config.wait_seconds)) == std::future_status::ready)
        {
            auto status = result.get();
            if (status.is_authenticated)
            {
                auto server = machine.current_server();
                std::cout << "Authorized by " << (server ? server->name : std::string("Core")) << '\n';
            }
            else
            {
                std::cerr << "Connection failed: " << status.error_message.value_or("unknown error") << '\n';
                exit_code = 1;
            }
        }
        else if (started)
        {
            std::cerr << "Timed out waiting for authorization\n";
            exit_code = 1;
        }
        else
        {
            if (result.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
            {
                std::cerr << "Connection failed: " << result.get().error_message.value_or("unknown error") << '\n';
            }
            exit_code = 1;
        }

        machine.disconnect();
    }

    work.reset();
    io_context.stop();
    io_thread.join();
    return exit_code;
}

int run_forget(const CliConfig& config)
{
    make_store(config)->clear();
    std::cout << "Saved Core forgotten\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    roonlink::CliConfig config;
    try
    {
        config = roonlink::parse_command_line(argc, argv);
    }
    catch (const boost::program_options::error&)
    {
        return 2;
    }

    roonlink::logging::current_log_level = config.log_level;
    ROONLINK_LOG_INFO("Starting roonlink");

    try
    {
        switch (config.command)
        {
        case roonlink::CliCommand::discover:
            return run_discover(config);
        case roonlink::CliCommand::connect:
        case roonlink::CliCommand::reconnect:
            return run_connection(config);
        case roonlink::CliCommand::forget:
            return run_forget(config);
        }
    }
    catch (const std::exception& e)
    {
        ROONLINK_LOG_ERROR("Application error: " << e.what());
        return 1;
    }

    return 0;
}
