#include "roonlink/discovery/sood_codec.hpp"

#include "roonlink/logging/roonlink_logging.hpp"

#include <cstring>

namespace roonlink
{

namespace
{

constexpr char magic[] = {'S', 'O', 'O', 'D'};

// "SOOD" 2 'Q', then query_service_id = the Core's registry service id
constexpr char probe_bytes[] = "SOOD"
                               "\x02"
                               "Q"
                               "\x10"
                               "query_service_id"
                               "\x00\x24"
                               "00720724-5143-4a9b-abac-0e50cba674bb";

} // namespace

const std::vector<std::uint8_t>& SoodCodec::encode_probe()
{
    static const std::vector<std::uint8_t> probe(reinterpret_cast<const std::uint8_t*>(probe_bytes),
                                                 reinterpret_cast<const std::uint8_t*>(probe_bytes) + sizeof(probe_bytes) - 1);
    return probe;
}

DecodeResult SoodCodec::decode_response(const std::uint8_t* data, std::size_t size)
{
    if (data == nullptr || size < sizeof(magic) || std::memcmp(data, magic, sizeof(magic)) != 0)
    {
        return DecodeError::bad_magic;
    }
    if (size < header_size)
    {
        return DecodeError::truncated;
    }
    if (data[4] != version)
    {
        return DecodeError::unsupported_version;
    }
    if (static_cast<char>(data[5]) != response_type)
    {
        return DecodeError::unexpected_type;
    }

    PropertyMap properties;
    std::size_t position = header_size;
    while (position < size)
    {
        std::size_t key_length = data[position++];
        if (key_length == 0)
        {
            return DecodeError::empty_key;
        }
        if (position + key_length > size)
        {
            return DecodeError::truncated;
        }
        std::string key(reinterpret_cast<const char*>(data + position), key_length);
        position += key_length;

        if (position + 2 > size)
        {
            return DecodeError::truncated;
        }
        std::uint16_t value_length = static_cast<std::uint16_t>((data[position] << 8) | data[position + 1]);
        position += 2;

        if (value_length == null_length)
        {
            // null values are treated as absent
            properties.erase(key);
            continue;
        }
        if (position + value_length > size)
        {
            return DecodeError::truncated;
        }
        properties[key] = std::string(reinterpret_cast<const char*>(data + position), value_length);
        position += value_length;
    }

    return properties;
}

std::optional<ServerRecord> SoodCodec::to_server_record(const PropertyMap& properties, const std::string& host)
{
    auto unique_id = properties.find(unique_id_key);
    if (unique_id == properties.end() || unique_id->second.empty())
    {
        return std::nullopt;
    }

    ServerRecord record;
    record.id   = unique_id->second;
    record.host = host;

    auto name               = properties.find(name_key);
    record.name             = name != properties.end() ? name->second : unknown_value;
    auto display_version    = properties.find(display_version_key);
    record.software_version = display_version != properties.end() ? display_version->second : unknown_value;

    auto http_port = properties.find(http_port_key);
    if (http_port != properties.end())
    {
        auto port = parse_port(http_port->second);
        if (port)
        {
            record.port = *port;
        }
        else
        {
            ROONLINK_LOG_DEBUG("Ignoring invalid http_port '" << http_port->second << "' from " << host);
        }
    }

    return record;
}

std::optional<std::uint16_t> SoodCodec::parse_port(const std::string& text)
{
    if (text.empty() || text.size() > 5)
    {
        return std::nullopt;
    }
    unsigned long value = 0;
    for (char character : text)
    {
        if (character < '0' || character > '9')
        {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned long>(character - '0');
    }
    if (value == 0 || value > 65535)
    {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace roonlink
