#include "excelpager/server/ApiServer.hpp"
#include "excelpager/utils/TimeUtils.hpp"
#include "XlsxFixture.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace excelpager {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// 同步HTTP客户端，单连接
struct TestClient {
    net::io_context ioc;
    tcp::socket socket{ioc};
    beast::flat_buffer buffer;

    void connect(uint16_t port) {
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    }

    http::response<http::string_body> get(const std::string& target) {
        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.set(http::field::authorization, "Bearer test-key");
        req.keep_alive(true);
        http::write(socket, req);

        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        return res;
    }

    // 阻塞到服务器关闭连接，返回读取错误
    beast::error_code waitForClose() {
        char byte = 0;
        beast::error_code ec;
        socket.read_some(net::buffer(&byte, 1), ec);
        return ec;
    }
};

} // namespace

class ApiServerTest : public ::testing::Test {
protected:
    void TearDown() override {
        stopServer();
    }

    void start(ApiServer::Handler handler = nullptr, const std::string& connection_timeout_ms = "30000") {
        config_ = std::make_unique<core::ServiceConfig>(core::ServiceConfig::fromValues({
            {"API_KEY", "test-key"},
            {"DATA_DIR", temp_.path().string()},
            {"BIND_ADDRESS", "127.0.0.1"},
            {"PORT", "0"},
            {"CONNECTION_TIMEOUT_MS", connection_timeout_ms},
        }));
        server_ = handler ? std::make_unique<ApiServer>(*config_, std::move(handler))
                          : std::make_unique<ApiServer>(*config_);
        ASSERT_TRUE(server_->bind().hasValue());
        ASSERT_NE(server_->port(), 0);
        runner_ = std::thread([this]() { server_->run(); });
    }

    void stopServer() {
        if (server_) {
            server_->stop();
        }
        if (runner_.joinable()) {
            runner_.join();
        }
    }

    bool waitForConnections(size_t expected) {
        for (int i = 0; i < 500; ++i) {
            if (server_->activeConnections() == expected) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    test::TempDir temp_;
    std::unique_ptr<core::ServiceConfig> config_;
    std::unique_ptr<ApiServer> server_;
    std::thread runner_;
};

TEST_F(ApiServerTest, ServesRequestsOnKeepAliveConnection) {
    start();

    TestClient client;
    client.connect(server_->port());

    auto first = client.get("/files");
    EXPECT_EQ(first.result_int(), 200u);
    EXPECT_EQ(first[http::field::content_type], "application/json");
    EXPECT_TRUE(nlohmann::json::parse(first.body())["files"].empty());

    auto missing = client.get("/file/none.xlsx");
    EXPECT_EQ(missing.result_int(), 404u);
    EXPECT_EQ(nlohmann::json::parse(missing.body())["error"], "File not found");
}

TEST_F(ApiServerTest, HandlerExceptionBecomesServerError) {
    start([](const HttpRequest& request) {
        if (request.target == "/boom") {
            throw std::runtime_error("boom");
        }
        HttpResponse response;
        response.body = "{}";
        return response;
    });

    TestClient client;
    client.connect(server_->port());

    auto failed = client.get("/boom");
    EXPECT_EQ(failed.result_int(), 500u);
    EXPECT_EQ(nlohmann::json::parse(failed.body())["error"], "Could not load data: boom");

    // 同一连接继续可用
    auto ok = client.get("/fine");
    EXPECT_EQ(ok.result_int(), 200u);
    EXPECT_EQ(ok.body(), "{}");
}

TEST_F(ApiServerTest, IdleConnectionClosedAfterTimeout) {
    start(nullptr, "200");

    TestClient client;
    client.connect(server_->port());
    ASSERT_TRUE(waitForConnections(1));

    utils::TimeUtils::PerformanceTimer timer;
    EXPECT_TRUE(client.waitForClose());
    EXPECT_LT(timer.elapsedMs(), 5000);
    EXPECT_TRUE(waitForConnections(0));
}

TEST_F(ApiServerTest, StopClosesOpenConnectionsAndWaits) {
    start(nullptr, "60000");

    TestClient idle;
    idle.connect(server_->port());
    TestClient busy;
    busy.connect(server_->port());
    EXPECT_EQ(busy.get("/files").result_int(), 200u);
    ASSERT_TRUE(waitForConnections(2));

    utils::TimeUtils::PerformanceTimer timer;
    stopServer();
    EXPECT_LT(timer.elapsedMs(), 5000);
    EXPECT_EQ(server_->activeConnections(), 0u);

    EXPECT_TRUE(idle.waitForClose());
    EXPECT_TRUE(busy.waitForClose());
}

}} // namespace excelpager::server
