#include "roonlink/cli/cli_config.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace roonlink
{

namespace
{

CliCommand parse_command(const std::string& name)
{
    namespace po = boost::program_options;

    if (name == "discover")
    {
        return CliCommand::discover;
    }
    if (name == "connect")
    {
        return CliCommand::connect;
    }
    if (name == "reconnect")
    {
        return CliCommand::reconnect;
    }
    if (name == "forget")
    {
        return CliCommand::forget;
    }
    throw po::error("Unknown command '" + name + "'");
}

} // namespace

CliConfig parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    po::options_description desc("roonlink Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show help message")
        ("command", po::value<std::string>()->default_value("discover"), "discover | connect | reconnect | forget")
        ("timeout,t", po::value<int>()->default_value(5), "Discovery timeout in seconds")
        ("core,c", po::value<std::string>(), "Core id, name or host to connect to (default: first found)")
        ("wait,w", po::value<int>()->default_value(120), "Seconds to wait for authorization")
        ("config", po::value<std::string>(), "Credential file (default: ~/.config/roonlink/config.json)");
    // clang-format on

    po::positional_options_description positional;
    positional.add("command", 1);

    std::vector<std::string> arguments;
    arguments.reserve(static_cast<size_t>(argc));
    for (int i = 1; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }

    // -v / -vv are counted here instead of being declared as options
    int verbosity = 0;
    std::vector<std::string> remaining;
    for (const std::string& argument : arguments)
    {
        if (argument.size() >= 2 && argument[0] == '-' && argument.find_first_not_of('v', 1) == std::string::npos)
        {
            verbosity = static_cast<int>(argument.size() - 1);
            continue;
        }
        remaining.push_back(argument);
    }

    po::variables_map variables;

    CliConfig config;

    try
    {
        auto parser = po::command_line_parser(remaining).options(desc).positional(positional);

        po::store(parser.run(), variables);
        po::notify(variables);

        if (variables.count("help") != 0U)
        {
            std::cout << "Usage: roonlink_cli [command] [options]\n\n" << desc << '\n';
            std::cout << "\nCommands:\n"
                      << "  discover  : List the Cores on the local network\n"
                      << "  connect   : Discover, pick a Core and wait for authorization\n"
                      << "  reconnect : Connect to the Core saved by the last authorization\n"
                      << "  forget    : Remove the saved Core and token\n"
                      << "\nVerbosity levels:\n"
                      << "  (none)  : Info level  - shows ERROR, WARNING and INFO messages\n"
                      << "  -v      : Debug level - adds DEBUG messages\n"
                      << "  -vv     : Trace level - shows all messages\n";
            std::exit(0);
        }

        config.command         = parse_command(variables["command"].as<std::string>());
        config.timeout_seconds = variables["timeout"].as<int>();
        config.wait_seconds    = variables["wait"].as<int>();
        if (config.timeout_seconds <= 0)
        {
            throw po::error("--timeout must be positive");
        }
        if (config.wait_seconds <= 0)
        {
            throw po::error("--wait must be positive");
        }
        if (variables.count("core") != 0U)
        {
            config.core = variables["core"].as<std::string>();
        }
        if (variables.count("config") != 0U)
        {
            config.config_path = variables["config"].as<std::string>();
        }

        if (verbosity == 0)
        {
            config.log_level = logging::LogLevel::Info;
        }
        else if (verbosity == 1)
        {
            config.log_level = logging::LogLevel::Debug;
        }
        else
        {
            config.log_level = logging::LogLevel::Trace;
        }

        ROONLINK_LOG_DEBUG("Verbosity level: " << verbosity);
        ROONLINK_LOG_TRACE("Command line arguments parsed successfully");
    }
    catch (const po::error& error)
    {
        ROONLINK_LOG_ERROR("Error parsing command line: " << error.what());
        std::cerr << "Error: " << error.what() << '\n';
        std::cerr << desc << '\n';
        throw;
    }

    return config;
}

} // namespace roonlink
