#pragma once

#include "excelpager/core/Config.hpp"
#include "excelpager/server/RequestRouter.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace excelpager {
namespace server {

/**
 * @brief HTTP服务器（Boost.Beast），每个连接一个线程
 *
 * 连接线程各自拥有一个 io_context，读写都带 CONNECTION_TIMEOUT_MS 截止时间。
 * 请求互相独立，连接线程之间唯一共享的可变状态是限流器。
 * run() 在所有连接线程结束后才返回。
 */
class ApiServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    explicit ApiServer(const core::ServiceConfig& config);

    /**
     * @brief 使用自定义处理函数（config 只提供监听地址与超时）
     */
    ApiServer(const core::ServiceConfig& config, Handler handler);

    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /**
     * @brief 绑定监听地址
     * @return 地址无效或端口被占用时返回错误
     */
    core::VoidResult bind();

    /**
     * @brief 阻塞接受连接，直到 stop() 被调用且所有连接关闭
     */
    void run();

    /**
     * @brief 停止接受新连接并关闭已有连接（可从信号处理线程调用）
     */
    void stop();

    /**
     * @brief 实际监听端口（配置端口为0时由系统分配）
     */
    uint16_t port() const;

    size_t activeConnections() const;

private:
    class Session;

    const core::ServiceConfig& config_;
    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_{false};

    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    std::unordered_set<std::shared_ptr<boost::asio::io_context>> sessions_;

    void serve(std::shared_ptr<Session> session, std::shared_ptr<boost::asio::io_context> ioc);
    void removeSession(const std::shared_ptr<boost::asio::io_context>& ioc);
    void wakeAcceptor();
};

}} // namespace excelpager::server
