#include "roonlink/config/credential_store.hpp"

namespace roonlink
{

PersistedCredential CredentialStore::update(const PersistedCredential& partial)
{
    PersistedCredential merged = load();
    if (partial.core_id)
    {
        merged.core_id = partial.core_id;
    }
    if (partial.core_name)
    {
        merged.core_name = partial.core_name;
    }
    if (partial.token)
    {
        merged.token = partial.token;
    }
    if (partial.host)
    {
        merged.host = partial.host;
    }
    if (partial.port)
    {
        merged.port = partial.port;
    }
    save(merged);
    return merged;
}

} // namespace roonlink
