#include "core/LogUtils.h"

namespace core {

LogRateLimiter::LogRateLimiter(std::chrono::milliseconds minInterval)
    : minInterval_(minInterval) {}

bool LogRateLimiter::allow() {
    return allow(Clock::now());
}

bool LogRateLimiter::allow(Clock::time_point now) {
    if (!fired_ || now - last_ >= minInterval_) {
        last_ = now;
        fired_ = true;
        suppressed_ = 0;
        return true;
    }
    ++suppressed_;
    return false;
}

void LogRateLimiter::reset() {
    fired_ = false;
    suppressed_ = 0;
}

}  // namespace core
