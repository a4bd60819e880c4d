#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "network/http_server.hpp"
#include "test_utils.hpp"

using namespace golink;
namespace beast = boost::beast;

class HttpServerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    std::unique_ptr<store::ContentStore> store;
    std::unique_ptr<http::RequestHandler> handler;
    std::unique_ptr<network::HttpServer> server;

    void SetUp() override {
        init_test_logging();
        test_dir = make_temp_dir("http_server_test_");
        store = std::make_unique<store::ContentStore>(test_dir / "state", "sha256", 5, 4);
        handler = std::make_unique<http::RequestHandler>(*store);
        server = std::make_unique<network::HttpServer>("127.0.0.1", 0, *handler, 4);
    }

    void TearDown() override {
        if (server) {
            server->shutdown();
            server.reset();
        }
        handler.reset();
        store.reset();
        std::filesystem::remove_all(test_dir);
    }

    // One request over a fresh connection, as a plain HTTP/1.1 client would
    http::Response send(beast::http::verb method, const std::string& target, const std::string& body = "") {
        boost::asio::io_context io_context;
        boost::asio::ip::tcp::socket socket(io_context);
        socket.connect({boost::asio::ip::make_address("127.0.0.1"), server->port()});

        http::Request request{method, target, 11};
        request.set(beast::http::field::host, "short.test");
        if (method == beast::http::verb::post) {
            request.body() = body;
            request.prepare_payload();
        }
        beast::http::write(socket, request);

        beast::flat_buffer buffer;
        http::Response response;
        beast::http::read(socket, buffer, response);

        beast::error_code ec;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        return response;
    }

    // Connected client that sends half a request line and then goes quiet
    std::unique_ptr<boost::asio::ip::tcp::socket> open_idle_connection(boost::asio::io_context& io_context) {
        auto socket = std::make_unique<boost::asio::ip::tcp::socket>(io_context);
        socket->connect({boost::asio::ip::make_address("127.0.0.1"), server->port()});
        boost::asio::write(*socket, boost::asio::buffer(std::string("GET /")));
        return socket;
    }
};

TEST_F(HttpServerTest, StartListenerBindsEphemeralPort) {
    ASSERT_TRUE(server->start_listener());
    EXPECT_TRUE(server->is_running());
    EXPECT_NE(server->port(), 0);
}

TEST_F(HttpServerTest, MultipleStartFails) {
    ASSERT_TRUE(server->start_listener());
    EXPECT_FALSE(server->start_listener());
}

TEST_F(HttpServerTest, ShortenAndRedirectOverTcp) {
    ASSERT_TRUE(server->start_listener());

    auto created = send(beast::http::verb::post, "/", "https://example.com/x");
    ASSERT_EQ(created.result(), beast::http::status::ok);
    EXPECT_EQ(created.body(), "http://short.test/54cef");

    auto redirect = send(beast::http::verb::get, "/54cef");
    EXPECT_EQ(redirect.result(), beast::http::status::found);
    EXPECT_EQ(redirect[beast::http::field::location], "https://example.com/x");
}

TEST_F(HttpServerTest, NotFoundAndBadRequestOverTcp) {
    ASSERT_TRUE(server->start_listener());

    auto missing = send(beast::http::verb::get, "/fffff");
    EXPECT_EQ(missing.result(), beast::http::status::not_found);
    EXPECT_TRUE(missing.body().empty());

    auto invalid = send(beast::http::verb::post, "/", "");
    EXPECT_EQ(invalid.result(), beast::http::status::bad_request);
    EXPECT_EQ(invalid.body(), "Invalid URL");
}

TEST_F(HttpServerTest, ConcurrentClients) {
    ASSERT_TRUE(server->start_listener());

    const size_t num_clients = 8;
    std::atomic<size_t> redirects{0};
    std::vector<std::thread> clients;

    for (size_t i = 0; i < num_clients; ++i) {
        clients.emplace_back([this, i, &redirects]() {
            try {
                std::string url = "https://example.com/client/" + std::to_string(i);
                auto created = send(beast::http::verb::post, "/", url);
                EXPECT_EQ(created.result(), beast::http::status::ok);
                auto id = created.body().substr(created.body().rfind('/') + 1);

                auto redirect = send(beast::http::verb::get, "/" + id);
                if (redirect.result() == beast::http::status::found &&
                    redirect[beast::http::field::location] == url) {
                    redirects++;
                }
            } catch (const std::exception& e) {
                ADD_FAILURE() << "Client " << i << " failed: " << e.what();
            }
        });
    }

    for (auto& client : clients) {
        client.join();
    }

    EXPECT_EQ(redirects, num_clients);
}

TEST_F(HttpServerTest, ShutdownStopsAccepting) {
    ASSERT_TRUE(server->start_listener());
    const uint16_t port = server->port();
    server->shutdown();
    EXPECT_FALSE(server->is_running());

    boost::asio::io_context io_context;
    boost::asio::ip::tcp::socket socket(io_context);
    boost::system::error_code ec;
    socket.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
    EXPECT_TRUE(ec);
}

TEST_F(HttpServerTest, RestartAfterShutdown) {
    ASSERT_TRUE(server->start_listener());
    server->shutdown();
    ASSERT_TRUE(server->start_listener());

    auto missing = send(beast::http::verb::get, "/00000");
    EXPECT_EQ(missing.result(), beast::http::status::not_found);
}

TEST_F(HttpServerTest, IdleConnectionsDoNotBlockRequests) {
    const size_t workers = 2;
    server = std::make_unique<network::HttpServer>("127.0.0.1", 0, *handler, workers);
    ASSERT_TRUE(server->start_listener());

    // As many silent clients as there are workers
    boost::asio::io_context io_context;
    std::vector<std::unique_ptr<boost::asio::ip::tcp::socket>> idle;
    for (size_t i = 0; i < workers; ++i) {
        idle.push_back(open_idle_connection(io_context));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto missing = send(beast::http::verb::get, "/00000");
    EXPECT_EQ(missing.result(), beast::http::status::not_found);

    auto created = send(beast::http::verb::post, "/", "https://example.com/x");
    EXPECT_EQ(created.result(), beast::http::status::ok);
}

TEST_F(HttpServerTest, ShutdownWithIdleClientReturns) {
    ASSERT_TRUE(server->start_listener());

    boost::asio::io_context io_context;
    auto idle = open_idle_connection(io_context);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Well below the 30 second read timeout
    auto stopped = std::async(std::launch::async, [this]() { server->shutdown(); });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    stopped.get();
    EXPECT_FALSE(server->is_running());

    // The idle client sees the connection closed
    char byte = 0;
    boost::system::error_code ec;
    idle->read_some(boost::asio::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec);
}

TEST_F(HttpServerTest, IdleConnectionTimesOut) {
    server = std::make_unique<network::HttpServer>("127.0.0.1", 0, *handler, 2, std::chrono::seconds(1));
    ASSERT_TRUE(server->start_listener());

    boost::asio::io_context io_context;
    auto idle = open_idle_connection(io_context);

    bool closed = false;
    char byte = 0;
    idle->async_read_some(boost::asio::buffer(&byte, 1),
        [&closed](const boost::system::error_code& ec, std::size_t) {
            closed = static_cast<bool>(ec);
        });
    io_context.run_for(std::chrono::seconds(5));
    EXPECT_TRUE(closed);

    // The server keeps serving after dropping the idle client
    auto missing = send(beast::http::verb::get, "/00000");
    EXPECT_EQ(missing.result(), beast::http::status::not_found);
}
