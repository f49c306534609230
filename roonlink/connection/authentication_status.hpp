#pragma once

#include <optional>
#include <string>

namespace roonlink
{

/// Outcome of one authentication attempt, delivered once per attempt.
struct AuthenticationStatus
{
    bool is_authenticated = false;
    std::optional<std::string> token;
    std::optional<std::string> error_message;

    static AuthenticationStatus success(const std::string& token) { return AuthenticationStatus {true, token, std::nullopt}; }
    static AuthenticationStatus failure(const std::string& error_message)
    {
        return AuthenticationStatus {false, std::nullopt, error_message};
    }
};

} // namespace roonlink
