#include "clock.hpp"

#include <algorithm>
#include <thread>

namespace mailfwd {

std::shared_ptr<Clock> Clock::system() {
    static auto clock = std::make_shared<SystemClock>();
    return clock;
}

Clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(duration d) {
    if (d > duration::zero()) {
        std::this_thread::sleep_for(d);
    }
}

std::chrono::seconds backoff_delay(int attempt) {
    if (attempt < 1) {
        return std::chrono::seconds(1);
    }
    // 2^12 already exceeds the cap
    if (attempt >= 12) {
        return kMaxBackoff;
    }
    return std::min(std::chrono::seconds(1LL << attempt), kMaxBackoff);
}

}  // namespace mailfwd
