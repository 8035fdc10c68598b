#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace excelpager {
namespace core {

/**
 * @brief 协作式取消令牌
 *
 * 拷贝共享同一状态：边界层持有一份用于 cancel()，流式读取循环持有另一份
 * 逐行、逐块轮询 isCancelled()。可选的截止时间到期后同样视为已取消。
 * 默认构造的令牌永不取消。
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    /**
     * @brief 创建带截止时间的令牌，timeout 为 0 表示不设截止时间
     */
    static CancellationToken withTimeout(std::chrono::milliseconds timeout) {
        CancellationToken token;
        if (timeout.count() > 0) {
            token.state_->has_deadline = true;
            token.state_->deadline = std::chrono::steady_clock::now() + timeout;
        }
        return token;
    }

    void cancel() noexcept {
        state_->cancelled.store(true, std::memory_order_release);
    }

    bool isCancelled() const noexcept {
        if (state_->cancelled.load(std::memory_order_acquire)) {
            return true;
        }
        return state_->has_deadline && std::chrono::steady_clock::now() >= state_->deadline;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        bool has_deadline = false;
        std::chrono::steady_clock::time_point deadline;
    };

    std::shared_ptr<State> state_;
};

}} // namespace excelpager::core
