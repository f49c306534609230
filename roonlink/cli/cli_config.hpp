#pragma once

#include <string>

#include "roonlink/logging/roonlink_logging.hpp"

namespace roonlink
{

enum class CliCommand
{
    discover,
    connect,
    reconnect,
    forget
};

struct CliConfig
{
    CliCommand command          = CliCommand::discover;
    int timeout_seconds         = 5;
    int wait_seconds            = 120;
    logging::LogLevel log_level = logging::LogLevel::Info;

    std::string core;        // id, name or host of the Core to connect to; empty picks the first found
    std::string config_path; // empty uses the default credential file
};

CliConfig parse_command_line(int argc, char* argv[]);

} // namespace roonlink
