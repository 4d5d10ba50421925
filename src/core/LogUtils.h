#pragma once

#include <chrono>

namespace core {

// Lets one log line through per interval. Single event-loop use only.
class LogRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit LogRateLimiter(std::chrono::milliseconds minInterval);

    bool allow();
    bool allow(Clock::time_point now);
    void reset();

    std::size_t suppressed() const noexcept { return suppressed_; }

private:
    std::chrono::milliseconds minInterval_;
    Clock::time_point last_;
    bool fired_{false};
    std::size_t suppressed_{0};
};

}  // namespace core
