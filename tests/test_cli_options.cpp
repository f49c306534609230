#include "roonlink/cli/cli_config.hpp"

#include <gtest/gtest.h>

#include <boost/program_options/errors.hpp>

#include <string>
#include <vector>

using namespace roonlink;

namespace
{

CliConfig parse(std::vector<std::string> arguments)
{
    arguments.insert(arguments.begin(), "roonlink_cli");
    std::vector<char*> argv;
    for (auto& argument : arguments)
    {
        argv.push_back(&argument[0]);
    }
    argv.push_back(nullptr);
    return parse_command_line(static_cast<int>(arguments.size()), argv.data());
}

} // namespace

TEST(CliOptionsTest, DefaultsToDiscover)
{
    CliConfig config = parse({});
    EXPECT_EQ(config.command, CliCommand::discover);
    EXPECT_EQ(config.timeout_seconds, 5);
    EXPECT_EQ(config.wait_seconds, 120);
    EXPECT_EQ(config.log_level, logging::LogLevel::Info);
    EXPECT_TRUE(config.core.empty());
    EXPECT_TRUE(config.config_path.empty());
}

TEST(CliOptionsTest, ParsesCommands)
{
    EXPECT_EQ(parse({"connect"}).command, CliCommand::connect);
    EXPECT_EQ(parse({"reconnect"}).command, CliCommand::reconnect);
    EXPECT_EQ(parse({"forget"}).command, CliCommand::forget);
    EXPECT_EQ(parse({"discover"}).command, CliCommand::discover);
}

TEST(CliOptionsTest, ParsesConnectOptions)
{
    CliConfig config = parse({"connect", "--core", "Living Room", "-t", "3", "--wait", "30", "--config", "/tmp/roonlink.json"});
    EXPECT_EQ(config.command, CliCommand::connect);
    EXPECT_EQ(config.core, "Living Room");
    EXPECT_EQ(config.timeout_seconds, 3);
    EXPECT_EQ(config.wait_seconds, 30);
    EXPECT_EQ(config.config_path, "/tmp/roonlink.json");
}

TEST(CliOptionsTest, VerbosityRaisesLogLevel)
{
    EXPECT_EQ(parse({"-v"}).log_level, logging::LogLevel::Debug);
    EXPECT_EQ(parse({"discover", "-vv"}).log_level, logging::LogLevel::Trace);
    EXPECT_EQ(parse({"-vvv", "forget"}).log_level, logging::LogLevel::Trace);
}

TEST(CliOptionsTest, RejectsUnknownCommand)
{
    EXPECT_THROW(parse({"pair"}), boost::program_options::error);
}

TEST(CliOptionsTest, RejectsNonPositiveDurations)
{
    EXPECT_THROW(parse({"--timeout", "0"}), boost::program_options::error);
    EXPECT_THROW(parse({"connect", "--wait", "-5"}), boost::program_options::error);
}

TEST(CliOptionsTest, RejectsUnknownOption)
{
    EXPECT_THROW(parse({"--frobnicate"}), boost::program_options::error);
}
