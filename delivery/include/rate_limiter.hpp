#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "clock.hpp"

namespace mailfwd::delivery {

// Sliding-window limiter: at most max_per_window acquisitions per key in any
// window. acquire() blocks until a slot frees up; it never refuses.
class RateLimiter {
public:
    explicit RateLimiter(size_t max_per_window,
                         std::chrono::seconds window = std::chrono::seconds(60),
                         std::shared_ptr<Clock> clock = Clock::system());

    // Returns how long the caller was held back.
    Clock::duration acquire(const std::string& key);

    size_t in_window(const std::string& key);
    size_t max_per_window() const { return max_per_window_; }

private:
    void prune(std::deque<Clock::time_point>& stamps, Clock::time_point now) const;

    size_t max_per_window_;
    std::chrono::seconds window_;
    std::shared_ptr<Clock> clock_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> windows_;
};

}  // namespace mailfwd::delivery
