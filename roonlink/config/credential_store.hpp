#pragma once

#include <optional>
#include <string>

namespace roonlink
{

/// The last Core this client was authorized by.
struct PersistedCredential
{
    std::optional<std::string> core_id;
    std::optional<std::string> core_name;
    std::optional<std::string> token;
    std::optional<std::string> host;
    std::optional<int> port;
};

inline bool operator==(const PersistedCredential& lhs, const PersistedCredential& rhs)
{
    return lhs.core_id == rhs.core_id && lhs.core_name == rhs.core_name && lhs.token == rhs.token && lhs.host == rhs.host &&
           lhs.port == rhs.port;
}

class CredentialStore
{
public:
    virtual ~CredentialStore() = default;

    /// Returns the saved record; every field is empty when nothing was saved.
    virtual PersistedCredential load() const = 0;

    virtual void save(const PersistedCredential& credential) = 0;

    /// Overwrites only the fields set in partial, saves and returns the result.
    virtual PersistedCredential update(const PersistedCredential& partial);

    virtual void clear() = 0;
};

} // namespace roonlink
