#include "rate_limiter.hpp"
#include "logger.hpp"

namespace mailfwd::delivery {

RateLimiter::RateLimiter(size_t max_per_window, std::chrono::seconds window,
                         std::shared_ptr<Clock> clock)
    : max_per_window_(max_per_window)
    , window_(window)
    , clock_(std::move(clock)) {
}

void RateLimiter::prune(std::deque<Clock::time_point>& stamps, Clock::time_point now) const {
    while (!stamps.empty() && stamps.front() + window_ <= now) {
        stamps.pop_front();
    }
}

Clock::duration RateLimiter::acquire(const std::string& key) {
    if (max_per_window_ == 0) {
        return Clock::duration::zero();
    }

    Clock::duration wait = Clock::duration::zero();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();
        auto& stamps = windows_[key];
        prune(stamps, now);

        if (stamps.size() < max_per_window_) {
            stamps.push_back(now);
            return wait;
        }

        // Reserve the slot that opens once enough older entries leave the
        // window; later callers queue behind this reservation.
        auto slot = stamps[stamps.size() - max_per_window_] + window_;
        stamps.push_back(slot);
        wait = slot - now;
    }

    LOG_WARNING_FMT("Rate limit reached for {}, waiting {} ms", key,
                    std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
    clock_->sleep_for(wait);
    return wait;
}

size_t RateLimiter::in_window(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(key);
    if (it == windows_.end()) return 0;
    prune(it->second, clock_->now());
    return it->second.size();
}

}  // namespace mailfwd::delivery
