#include "roonlink/config/json_credential_store.hpp"
#include "roonlink/logging/roonlink_logging.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace roonlink
{

namespace
{

void put_optional(boost::property_tree::ptree& tree, const char* key, const std::optional<std::string>& value)
{
    if (value)
    {
        tree.put(key, *value);
    }
}

std::optional<std::string> to_std_optional(const boost::optional<std::string>& value)
{
    if (value)
    {
        return *value;
    }
    return std::nullopt;
}

// property_tree writes every value as a JSON string; the port is stored as a number
std::string unquote_port(std::string json, int port)
{
    const std::string quoted = "\"port\": \"" + std::to_string(port) + "\"";
    auto position            = json.find(quoted);
    if (position != std::string::npos)
    {
        json.replace(position, quoted.size(), "\"port\": " + std::to_string(port));
    }
    return json;
}

} // namespace

std::filesystem::path JsonCredentialStore::default_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0')
    {
        return std::filesystem::path(".roonlink") / "config.json";
    }
    return std::filesystem::path(home) / ".config" / "roonlink" / "config.json";
}

JsonCredentialStore::JsonCredentialStore(std::filesystem::path path) : _path(std::move(path))
{
}

PersistedCredential JsonCredentialStore::load() const
{
    std::lock_guard<std::mutex> lock(_mutex);

    PersistedCredential credential;
    std::error_code exists_error;
    if (!std::filesystem::exists(_path, exists_error))
    {
        ROONLINK_LOG_DEBUG("No saved credential at " << _path.string());
        return credential;
    }

    boost::property_tree::ptree tree;
    try
    {
        boost::property_tree::read_json(_path.string(), tree);
    }
    catch (const boost::property_tree::json_parser_error& e)
    {
        ROONLINK_LOG_WARNING("Ignoring unreadable credential file " << _path.string() << ": " << e.what());
        return credential;
    }

    credential.core_id   = to_std_optional(tree.get_optional<std::string>("core_id"));
    credential.core_name = to_std_optional(tree.get_optional<std::string>("core_name"));
    credential.token     = to_std_optional(tree.get_optional<std::string>("token"));
    credential.host      = to_std_optional(tree.get_optional<std::string>("host"));

    auto port = tree.get_optional<std::string>("port");
    if (port && !port->empty())
    {
        try
        {
            credential.port = std::stoi(*port);
        }
        catch (const std::exception&)
        {
            ROONLINK_LOG_WARNING("Ignoring invalid saved port '" << *port << "'");
        }
    }

    return credential;
}

void JsonCredentialStore::save(const PersistedCredential& credential)
{
    std::lock_guard<std::mutex> lock(_mutex);

    boost::property_tree::ptree tree;
    put_optional(tree, "core_id", credential.core_id);
    put_optional(tree, "core_name", credential.core_name);
    put_optional(tree, "token", credential.token);
    put_optional(tree, "host", credential.host);
    if (credential.port)
    {
        tree.put("port", *credential.port);
    }

    std::error_code directory_error;
    if (_path.has_parent_path())
    {
        std::filesystem::create_directories(_path.parent_path(), directory_error);
        if (directory_error)
        {
            ROONLINK_LOG_ERROR("Failed to create " << _path.parent_path().string() << ": " << directory_error.message());
        }
    }

    std::ostringstream json;
    boost::property_tree::write_json(json, tree);
    std::string text = credential.port ? unquote_port(json.str(), *credential.port) : json.str();

    std::ofstream file(_path, std::ios::out | std::ios::trunc);
    file << text;
    file.close();
    if (!file)
    {
        throw boost::property_tree::json_parser_error("cannot write credential file", _path.string(), 0);
    }
    ROONLINK_LOG_DEBUG("Credential saved to " << _path.string());
}

void JsonCredentialStore::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);

    std::error_code error_code;
    if (std::filesystem::remove(_path, error_code))
    {
        ROONLINK_LOG_INFO("Removed saved credential " << _path.string());
    }
    else if (error_code)
    {
        ROONLINK_LOG_ERROR("Failed to remove " << _path.string() << ": " << error_code.message());
    }
}

} // namespace roonlink
