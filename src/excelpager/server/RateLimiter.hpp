#pragma once

#include "excelpager/core/Config.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace excelpager {
namespace server {

/**
 * @brief 按客户端地址计数的固定窗口限流器（线程安全）
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(core::RateLimitSpec spec);

    /**
     * @brief 记录一次请求
     * @param retry_after 被拒绝时填入距窗口结束的秒数
     * @return 是否放行
     */
    bool allow(const std::string& client, Clock::time_point now, int64_t& retry_after);

    bool allow(const std::string& client) {
        int64_t retry_after = 0;
        return allow(client, Clock::now(), retry_after);
    }

    size_t trackedClients() const;

private:
    struct Window {
        Clock::time_point start;
        uint32_t count = 0;
    };

    core::RateLimitSpec spec_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
    Clock::time_point last_purge_;

    void purgeExpired(Clock::time_point now);
};

}} // namespace excelpager::server
