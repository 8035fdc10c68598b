#include "excelpager/server/RateLimiter.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace excelpager {
namespace server {

RateLimiter::RateLimiter(core::RateLimitSpec spec)
    : spec_(spec)
    , last_purge_(Clock::now()) {}

bool RateLimiter::allow(const std::string& client, Clock::time_point now, int64_t& retry_after) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (now - last_purge_ >= spec_.window) {
        purgeExpired(now);
    }

    Window& window = windows_[client];
    if (window.count == 0 || now - window.start >= spec_.window) {
        window.start = now;
        window.count = 0;
    }

    if (window.count >= spec_.requests) {
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(window.start + spec_.window - now);
        retry_after = std::max<int64_t>(remaining.count(), 1);
        SERVER_DEBUG("Client {} exceeded {} ({}s left)", client, spec_.toString(), retry_after);
        return false;
    }

    ++window.count;
    return true;
}

size_t RateLimiter::trackedClients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

void RateLimiter::purgeExpired(Clock::time_point now) {
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now - it->second.start >= spec_.window) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
    last_purge_ = now;
}

}} // namespace excelpager::server
