#pragma once

#include "roonlink/discovery/server_record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace roonlink
{

using PropertyMap = std::map<std::string, std::string>;

enum class DecodeError
{
    bad_magic,
    unsupported_version,
    unexpected_type,
    empty_key,
    truncated
};

inline const char* to_string(DecodeError error) noexcept
{
    switch (error)
    {
    case DecodeError::bad_magic:
        return "bad_magic";
    case DecodeError::unsupported_version:
        return "unsupported_version";
    case DecodeError::unexpected_type:
        return "unexpected_type";
    case DecodeError::empty_key:
        return "empty_key";
    case DecodeError::truncated:
        return "truncated";
    }
    return "unknown";
}

using DecodeResult = std::variant<PropertyMap, DecodeError>;

/**
 * @brief Encoding and decoding of SOOD discovery datagrams
 *
 * A datagram is the marker "SOOD", a version byte (2), a type byte ('Q' for a
 * query, 'R' for a response) and a sequence of properties. Each property is a
 * one byte key length, the key, a two byte big endian value length and the
 * value. A value length of 0xFFFF marks a null value.
 */
class SoodCodec
{
public:
    static constexpr std::uint8_t version       = 2;
    static constexpr char query_type            = 'Q';
    static constexpr char response_type         = 'R';
    static constexpr std::uint16_t null_length  = 0xFFFF;
    static constexpr std::size_t header_size    = 6;

    static constexpr const char* unique_id_key       = "unique_id";
    static constexpr const char* name_key            = "name";
    static constexpr const char* display_version_key = "display_version";
    static constexpr const char* http_port_key       = "http_port";
    static constexpr const char* unknown_value       = "Unknown";

    /**
     * @brief Returns the fixed query datagram asking every Core to identify itself
     * @return The probe bytes; the same sequence on every call
     */
    static const std::vector<std::uint8_t>& encode_probe();

    /**
     * @brief Decodes and validates a response datagram
     * @param data Pointer to the received bytes
     * @param size Number of received bytes
     * @return The properties on success, the reason the datagram was rejected otherwise
     */
    static DecodeResult decode_response(const std::uint8_t* data, std::size_t size);

    static DecodeResult decode_response(const std::vector<std::uint8_t>& datagram)
    {
        return decode_response(datagram.data(), datagram.size());
    }

    /**
     * @brief Builds a ServerRecord from decoded properties
     *
     * Missing name and version become "Unknown", a missing or non numeric port
     * becomes 9100. A missing or empty unique_id makes the properties unusable.
     *
     * @param properties Decoded response properties
     * @param host Address the response was received from
     * @return The record, or std::nullopt when there is no unique_id
     */
    static std::optional<ServerRecord> to_server_record(const PropertyMap& properties, const std::string& host);

private:
    static std::optional<std::uint16_t> parse_port(const std::string& text);
};

} // namespace roonlink
