#include "roonlink/connection/moo_message.hpp"

#include <gtest/gtest.h>

using namespace roonlink;

TEST(MooMessageTest, RequestWithoutBody)
{
    auto text = MooMessage::request("com.roonlabs.registry:1/info", 0).construct();
    EXPECT_EQ(text, "MOO/1 REQUEST com.roonlabs.registry:1/info\nRequest-Id: 0\n\n");
}

TEST(MooMessageTest, RequestWithBodyCarriesLengthAndType)
{
    auto text = MooMessage::request("com.roonlabs.registry:1/register", 1, "{\"a\":1}").construct();
    EXPECT_EQ(text, "MOO/1 REQUEST com.roonlabs.registry:1/register\n"
                    "Request-Id: 1\n"
                    "Content-Length: 7\n"
                    "Content-Type: application/json\n"
                    "\n"
                    "{\"a\":1}");
}

TEST(MooMessageTest, ParsesReplyWithBody)
{
    std::string text = "MOO/1 CONTINUE Registered\n"
                       "Request-Id: 1\n"
                       "Content-Length: 17\n"
                       "Content-Type: application/json\n"
                       "\n"
                       "{\"token\":\"abc\"}\n\n";

    auto message = MooMessage::parse(text);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->verb, "CONTINUE");
    EXPECT_EQ(message->name, "Registered");
    EXPECT_EQ(message->request_id(), std::optional<int>(1));
    EXPECT_EQ(message->header("Content-Type"), std::optional<std::string>("application/json"));
    EXPECT_EQ(message->body, "{\"token\":\"abc\"}\n\n");
}

TEST(MooMessageTest, BodyIsCutToContentLength)
{
    auto message = MooMessage::parse("MOO/1 COMPLETE Success\nRequest-Id: 0\nContent-Length: 2\n\n{}trailing");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->body, "{}");
}

TEST(MooMessageTest, ParsesFrameEndingAfterHeaders)
{
    auto message = MooMessage::parse("MOO/1 REQUEST com.roonlabs.ping:1/ping\nRequest-Id: 42");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->verb, "REQUEST");
    EXPECT_EQ(message->name, "com.roonlabs.ping:1/ping");
    EXPECT_EQ(message->request_id(), std::optional<int>(42));
    EXPECT_TRUE(message->body.empty());
}

TEST(MooMessageTest, RejectsMalformedFrames)
{
    EXPECT_FALSE(MooMessage::parse("").has_value());
    EXPECT_FALSE(MooMessage::parse("HTTP/1.1 200 OK\n\n").has_value());
    EXPECT_FALSE(MooMessage::parse("MOO/1 COMPLETE\n\n").has_value());
    EXPECT_FALSE(MooMessage::parse("MOO/1 COMPLETE Success\nno colon here\n\n").has_value());
    EXPECT_FALSE(MooMessage::parse("MOO/1 COMPLETE Success\nContent-Length: 10\n\n{}").has_value());
    EXPECT_FALSE(MooMessage::parse("MOO/1 COMPLETE Success\nContent-Length: many\n\n{}").has_value());
}

TEST(MooMessageTest, RequestIdMustBeNumeric)
{
    auto message = MooMessage::parse("MOO/1 COMPLETE Success\nRequest-Id: 7x\n\n");
    ASSERT_TRUE(message.has_value());
    EXPECT_FALSE(message->request_id().has_value());
}

TEST(MooMessageTest, ConstructedFrameParsesBack)
{
    auto original = MooMessage::reply("COMPLETE", "InvalidRequest", "12", "{\"error\":\"x\"}");
    auto parsed   = MooMessage::parse(original.construct());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->verb, original.verb);
    EXPECT_EQ(parsed->name, original.name);
    EXPECT_EQ(parsed->body, original.body);
    EXPECT_EQ(parsed->request_id(), std::optional<int>(12));
}
