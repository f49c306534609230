#include "roonlink/connection/moo_session.hpp"

#include <gtest/gtest.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace roonlink;
using boost::asio::ip::tcp;

namespace
{

/// Runs an io_context on a background thread for the lifetime of the fixture.
class IoThread
{
public:
    IoThread() : _work(boost::asio::make_work_guard(io_context)), _thread([this]() { io_context.run(); }) { }

    ~IoThread()
    {
        _work.reset();
        io_context.stop();
        _thread.join();
    }

    boost::asio::io_context io_context;

private:
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> _work;
    std::thread _thread;
};

/// Collects session events and lets a test wait for one kind.
class EventRecorder
{
public:
    explicit EventRecorder(SessionEvent awaited) : _awaited(awaited) { }

    Session::StateCallback callback()
    {
        return [this](SessionEvent event, const std::string& detail)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            events.push_back(event);
            details.push_back(detail);
            if (event == _awaited && !_signalled)
            {
                _signalled = true;
                _promise.set_value();
            }
        };
    }

    bool wait(std::chrono::seconds timeout = std::chrono::seconds(5))
    {
        return _future.wait_for(timeout) == std::future_status::ready;
    }

    std::vector<SessionEvent> snapshot()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return events;
    }

    std::vector<SessionEvent> events;
    std::vector<std::string> details;

private:
    std::mutex _mutex;
    SessionEvent _awaited;
    std::promise<void> _promise;
    std::future<void> _future = _promise.get_future();
    bool _signalled           = false;
};

std::string read_text(boost::beast::websocket::stream<tcp::socket>& websocket)
{
    boost::beast::flat_buffer buffer;
    websocket.read(buffer);
    return boost::beast::buffers_to_string(buffer.data());
}

void write_text(boost::beast::websocket::stream<tcp::socket>& websocket, const MooMessage& message)
{
    websocket.binary(true);
    websocket.write(boost::asio::buffer(message.construct()));
}

} // namespace

TEST(MooSessionTest, RejectsInvalidEndpoint)
{
    boost::asio::io_context io_context;
    EXPECT_THROW(MooSession(io_context, AppInfo(), "", 9100, std::nullopt), std::invalid_argument);
    EXPECT_THROW(MooSession(io_context, AppInfo(), "192.168.1.50", 0, std::nullopt), std::invalid_argument);
}

TEST(MooSessionTest, RegistrationBodyCarriesIdentityAndToken)
{
    boost::asio::io_context io_context;
    AppInfo app_info;
    app_info.extension_id = "com.example.test";

    auto with_token = std::make_shared<MooSession>(io_context, app_info, "127.0.0.1", 9100, std::string("saved-token"));
    auto body       = with_token->registration_body();
    EXPECT_NE(body.find("\"extension_id\":\"com.example.test\""), std::string::npos);
    EXPECT_NE(body.find("\"token\":\"saved-token\""), std::string::npos);
    EXPECT_NE(body.find("required_services"), std::string::npos);
    EXPECT_EQ(body.find("optional_services"), std::string::npos);
    EXPECT_EQ(with_token->token(), std::optional<std::string>("saved-token"));

    auto without_token = std::make_shared<MooSession>(io_context, app_info, "127.0.0.1", 9100, std::string());
    EXPECT_EQ(without_token->registration_body().find("\"token\""), std::string::npos);
    EXPECT_FALSE(without_token->token().has_value());
}

TEST(MooSessionTest, StartTwiceIsRejected)
{
    boost::asio::io_context io_context;
    auto session = std::make_shared<MooSession>(io_context, AppInfo(), "127.0.0.1", 9100, std::nullopt);
    session->start();
    EXPECT_THROW(session->start(), std::logic_error);
}

TEST(MooSessionTest, ReportsRefusedConnection)
{
    unsigned short closed_port = 0;
    {
        boost::asio::io_context probe;
        tcp::acceptor acceptor(probe, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        closed_port = acceptor.local_endpoint().port();
    }

    IoThread io;
    EventRecorder recorder(SessionEvent::connection_failed);
    auto session = std::make_shared<MooSession>(io.io_context, AppInfo(), "127.0.0.1", closed_port, std::nullopt);
    session->set_state_callback(recorder.callback());
    session->start();

    EXPECT_TRUE(recorder.wait());
    EXPECT_FALSE(session->token().has_value());
    session->stop();
}

TEST(MooSessionTest, RegistersWithCoreAndAnswersPing)
{
    boost::asio::io_context server_io;
    tcp::acceptor acceptor(server_io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    unsigned short port = acceptor.local_endpoint().port();

    std::string info_request;
    std::string register_request;
    std::string ping_reply;
    std::thread server(
        [&]()
        {
            try
            {
                tcp::socket socket(server_io);
                acceptor.accept(socket);
                boost::beast::websocket::stream<tcp::socket> websocket(std::move(socket));
                websocket.accept();

                info_request = read_text(websocket);
                write_text(websocket, MooMessage::reply("COMPLETE", "Success", "0",
                                                        R"({"core_id":"core-1","display_name":"Fake Core","display_version":"1.0"})"));

                register_request = read_text(websocket);
                write_text(websocket, MooMessage::request("com.roonlabs.ping:1/ping", 5));
                ping_reply = read_text(websocket);
                write_text(websocket, MooMessage::reply("CONTINUE", "Registered", "1", R"({"core_id":"core-1","token":"new-token"})"));

                read_text(websocket);
            }
            catch (const std::exception&)
            {
                // the client hanging up ends the exchange
            }
        });

    {
        IoThread io;
        EventRecorder recorder(SessionEvent::registered);
        auto session = std::make_shared<MooSession>(io.io_context, AppInfo(), "127.0.0.1", port, std::string("old-token"));
        session->set_state_callback(recorder.callback());
        session->start();

        EXPECT_TRUE(recorder.wait());
        EXPECT_EQ(session->token(), std::optional<std::string>("new-token"));
        EXPECT_EQ(session->core_name(), "Fake Core");

        auto events = recorder.snapshot();
        EXPECT_EQ(events, (std::vector<SessionEvent> {SessionEvent::transport_connected, SessionEvent::info_received,
                                                      SessionEvent::registered}));

        session->stop();
    }
    server.join();

    auto info = MooMessage::parse(info_request);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "com.roonlabs.registry:1/info");

    auto registration = MooMessage::parse(register_request);
    ASSERT_TRUE(registration.has_value());
    EXPECT_EQ(registration->name, "com.roonlabs.registry:1/register");
    EXPECT_NE(registration->body.find("old-token"), std::string::npos);

    auto ping = MooMessage::parse(ping_reply);
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ(ping->verb, "COMPLETE");
    EXPECT_EQ(ping->name, "Success");
    EXPECT_EQ(ping->request_id(), std::optional<int>(5));
}
