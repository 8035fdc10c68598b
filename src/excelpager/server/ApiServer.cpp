/**
 * @file ApiServer.cpp
 * @brief Boost.Beast 传输层
 */

#include "excelpager/server/ApiServer.hpp"
#include "excelpager/ExcelPager.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include "excelpager/utils/TimeUtils.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <system_error>
#include <thread>

namespace excelpager {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ========== Session ==========

/**
 * @brief 单个连接：在自己的 io_context 上按 读 -> 处理 -> 写 循环
 */
class ApiServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(std::shared_ptr<net::io_context> ioc, tcp::socket socket, const Handler& handler,
            std::chrono::milliseconds timeout)
        : ioc_(std::move(ioc))
        , stream_(std::move(socket))
        , handler_(handler)
        , timeout_(timeout) {
        beast::error_code ec;
        auto remote = stream_.socket().remote_endpoint(ec);
        client_ = ec ? std::string("unknown") : remote.address().to_string();
    }

    // 在连接线程中调用，返回时连接已关闭且没有挂起的操作
    void run() {
        doRead();
        runLoop();

        // 被 stop() 中断时可能仍有挂起的读写，关闭后让它们以 operation_aborted 完成
        beast::error_code ec;
        stream_.socket().close(ec);
        ioc_->restart();
        runLoop();
    }

private:
    std::shared_ptr<net::io_context> ioc_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    const Handler& handler_;
    std::chrono::milliseconds timeout_;
    std::string client_;

    void runLoop() {
        try {
            ioc_->run();
        } catch (const std::exception& e) {
            SERVER_ERROR("Connection from {} aborted: {}", client_, e.what());
        }
    }

    void doRead() {
        request_ = {};
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec == http::error::end_of_stream) {
            shutdown();
            return;
        }
        if (ec == beast::error::timeout) {
            SERVER_DEBUG("Connection from {} idle for {} ms, closing", client_, timeout_.count());
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted) {
                SERVER_DEBUG("Read from {} failed: {}", client_, ec.message());
            }
            return;
        }

        HttpRequest request;
        request.method = std::string(request_.method_string());
        request.target = std::string(request_.target());
        request.authorization = std::string(request_[http::field::authorization]);
        request.client = client_;

        utils::TimeUtils::PerformanceTimer timer;
        HttpResponse result = dispatch(request);
        SERVER_INFO("{} {} {} -> {} ({} ms)", client_, request.method, request.target, result.status,
                    timer.elapsedMs());

        response_ = {};
        response_.version(request_.version());
        response_.result(static_cast<unsigned>(result.status));
        response_.set(http::field::server, std::string("excelpager/") + excelpager::version());
        response_.set(http::field::content_type, "application/json");
        if (result.retry_after) {
            response_.set(http::field::retry_after, std::to_string(*result.retry_after));
        }
        response_.keep_alive(request_.keep_alive());
        response_.body() = std::move(result.body);
        response_.prepare_payload();

        const bool keep_alive = response_.keep_alive();
        stream_.expires_after(timeout_);
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&Session::onWrite, shared_from_this(), keep_alive));
    }

    void onWrite(bool keep_alive, beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                SERVER_DEBUG("Write to {} failed: {}", client_, ec.message());
            }
            return;
        }
        if (!keep_alive) {
            shutdown();
            return;
        }
        doRead();
    }

    HttpResponse dispatch(const HttpRequest& request) {
        try {
            return handler_(request);
        } catch (const std::exception& e) {
            return RequestRouter::errorResponse(core::Error(core::ErrorCode::InternalError, e.what(),
                                                            request.target));
        }
    }

    void shutdown() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

// ========== ApiServer ==========

ApiServer::ApiServer(const core::ServiceConfig& config)
    : ApiServer(config, [router = std::make_shared<RequestRouter>(config)](const HttpRequest& request) {
          return router->handle(request);
      }) {}

ApiServer::ApiServer(const core::ServiceConfig& config, Handler handler)
    : config_(config)
    , handler_(std::move(handler))
    , ioc_(1)
    , acceptor_(ioc_) {}

ApiServer::~ApiServer() {
    stop();
}

core::VoidResult ApiServer::bind() {
    beast::error_code ec;
    auto address = net::ip::make_address(config_.bindAddress(), ec);
    if (ec) {
        return core::Error(core::ErrorCode::InvalidConfig,
                           "Invalid bind address '" + config_.bindAddress() + "': " + ec.message());
    }

    tcp::endpoint endpoint(address, config_.port());
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return core::Error(core::ErrorCode::InternalError,
                           "Cannot listen on " + config_.bindAddress() + ":" + std::to_string(config_.port()) +
                           ": " + ec.message());
    }

    running_ = true;
    SERVER_INFO("Listening on {}:{}", config_.bindAddress(), port());
    return {};
}

uint16_t ApiServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? config_.port() : endpoint.port();
}

size_t ApiServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void ApiServer::run() {
    while (running_) {
        auto session_ioc = std::make_shared<net::io_context>(1);
        tcp::socket socket(*session_ioc);
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            if (!running_) {
                break;
            }
            SERVER_WARN("Accept failed: {}", ec.message());
            continue;
        }

        {
            // 与 stop() 在同一把锁下检查，登记后的连接一定会被 stop() 关闭
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            if (!running_) {
                break;
            }
            sessions_.insert(session_ioc);
        }

        auto session = std::make_shared<Session>(session_ioc, std::move(socket), handler_,
                                                 config_.connectionTimeout());
        try {
            std::thread(&ApiServer::serve, this, session, session_ioc).detach();
        } catch (const std::system_error& e) {
            SERVER_ERROR("Cannot start connection thread: {}", e.what());
            session.reset();
            removeSession(session_ioc);
        }
    }

    beast::error_code ec;
    acceptor_.close(ec);

    std::unique_lock<std::mutex> lock(sessions_mutex_);
    sessions_cv_.wait(lock, [this]() { return sessions_.empty(); });
    SERVER_INFO("Server stopped");
}

void ApiServer::serve(std::shared_ptr<Session> session, std::shared_ptr<net::io_context> ioc) {
    session->run();
    session.reset();
    removeSession(ioc);
}

void ApiServer::removeSession(const std::shared_ptr<net::io_context>& ioc) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(ioc);
    sessions_cv_.notify_all();
}

void ApiServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (!sessions_.empty()) {
            SERVER_INFO("Closing {} open connections", sessions_.size());
        }
        for (const auto& ioc : sessions_) {
            ioc->stop();
        }
    }

    wakeAcceptor();
}

void ApiServer::wakeAcceptor() {
    // 用一个本地连接唤醒阻塞中的 accept()
    beast::error_code ec;
    tcp::endpoint local = acceptor_.local_endpoint(ec);
    if (ec) {
        return;
    }
    if (local.address().is_unspecified()) {
        local.address(local.address().is_v6() ? net::ip::address(net::ip::address_v6::loopback())
                                              : net::ip::address(net::ip::address_v4::loopback()));
    }
    net::io_context wake_ioc;
    tcp::socket wake(wake_ioc);
    wake.connect(local, ec);
    if (ec) {
        SERVER_DEBUG("Wake-up connection failed: {}", ec.message());
    }
}

}} // namespace excelpager::server
