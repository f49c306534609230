#include "roonlink/config/json_credential_store.hpp"

#include <gtest/gtest.h>

#include <boost/property_tree/json_parser.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace roonlink;

class JsonCredentialStoreTest : public ::testing::Test
{
protected:
    JsonCredentialStoreTest()
    {
        auto unique = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        directory   = std::filesystem::temp_directory_path() / ("roonlink_test_" + unique);
        path        = directory / "nested" / "config.json";
    }

    ~JsonCredentialStoreTest() override
    {
        std::error_code error_code;
        std::filesystem::remove_all(directory, error_code);
    }

    std::filesystem::path directory;
    std::filesystem::path path;
};

TEST_F(JsonCredentialStoreTest, MissingFileLoadsEmpty)
{
    JsonCredentialStore store(path);
    EXPECT_EQ(store.load(), PersistedCredential());
}

TEST_F(JsonCredentialStoreTest, SaveCreatesDirectoryAndRoundTrips)
{
    JsonCredentialStore store(path);

    PersistedCredential credential;
    credential.core_id   = "core-a";
    credential.core_name = "Living Room";
    credential.token     = "token-1";
    credential.host      = "192.168.1.50";
    credential.port      = 9330;
    store.save(credential);

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(JsonCredentialStore(path).load(), credential);
}

TEST_F(JsonCredentialStoreTest, PortIsWrittenAsJsonNumber)
{
    JsonCredentialStore store(path);

    PersistedCredential credential;
    credential.core_id = "core-a";
    credential.host    = "192.168.1.50";
    credential.port    = 9330;
    store.save(credential);

    std::ifstream file(path);
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("\"port\": 9330"), std::string::npos) << text;
    EXPECT_EQ(text.find("\"9330\""), std::string::npos) << text;
    EXPECT_NE(text.find("\"host\": \"192.168.1.50\""), std::string::npos) << text;

    EXPECT_EQ(store.load().port, std::optional<int>(9330));
}

TEST_F(JsonCredentialStoreTest, SaveThrowsWhenFileCannotBeWritten)
{
    std::filesystem::create_directories(directory);
    std::ofstream(directory / "blocker") << "not a directory";
    JsonCredentialStore store(directory / "blocker" / "config.json");

    PersistedCredential credential;
    credential.core_id = "core-a";
    EXPECT_THROW(store.save(credential), boost::property_tree::json_parser_error);
}

TEST_F(JsonCredentialStoreTest, UpdateMergesOnlySetFields)
{
    JsonCredentialStore store(path);

    PersistedCredential first;
    first.core_id = "core-a";
    first.host    = "192.168.1.50";
    first.port    = 9100;
    store.save(first);

    PersistedCredential partial;
    partial.token = "token-2";
    partial.port  = 9330;
    auto merged   = store.update(partial);

    EXPECT_EQ(merged.core_id, std::optional<std::string>("core-a"));
    EXPECT_EQ(merged.host, std::optional<std::string>("192.168.1.50"));
    EXPECT_EQ(merged.token, std::optional<std::string>("token-2"));
    EXPECT_EQ(merged.port, std::optional<int>(9330));
    EXPECT_FALSE(merged.core_name.has_value());
    EXPECT_EQ(store.load(), merged);
}

TEST_F(JsonCredentialStoreTest, CorruptFileLoadsEmpty)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << "{ not json";

    JsonCredentialStore store(path);
    EXPECT_EQ(store.load(), PersistedCredential());
}

TEST_F(JsonCredentialStoreTest, NonNumericPortIsIgnored)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << R"({"core_id": "core-a", "host": "10.0.0.2", "port": "ninety"})";

    JsonCredentialStore store(path);
    auto credential = store.load();
    EXPECT_EQ(credential.core_id, std::optional<std::string>("core-a"));
    EXPECT_FALSE(credential.port.has_value());
}

TEST_F(JsonCredentialStoreTest, ClearRemovesFile)
{
    JsonCredentialStore store(path);
    PersistedCredential credential;
    credential.core_id = "core-a";
    store.save(credential);

    store.clear();

    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(store.load(), PersistedCredential());
    EXPECT_NO_THROW(store.clear());
}

TEST_F(JsonCredentialStoreTest, DefaultPathEndsInConfigJson)
{
    EXPECT_EQ(JsonCredentialStore::default_path().filename(), "config.json");
}
