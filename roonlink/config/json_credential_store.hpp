#pragma once

#include "roonlink/config/credential_store.hpp"

#include <filesystem>
#include <mutex>

namespace roonlink
{

/**
 * @brief CredentialStore kept in a JSON file
 *
 * A missing or unreadable file loads as an empty record. The directory is
 * created on the first save.
 */
class JsonCredentialStore : public CredentialStore
{
public:
    /// $HOME/.config/roonlink/config.json, or ./.roonlink/config.json without HOME
    static std::filesystem::path default_path();

    explicit JsonCredentialStore(std::filesystem::path path = default_path());

    PersistedCredential load() const override;

    /// @throws boost::property_tree::json_parser_error when the file cannot be written
    void save(const PersistedCredential& credential) override;

    void clear() override;

    const std::filesystem::path& path() const noexcept { return _path; }

private:
    std::filesystem::path _path;
    mutable std::mutex _mutex;
};

} // namespace roonlink
