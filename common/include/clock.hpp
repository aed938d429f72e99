#pragma once

#include <chrono>
#include <memory>

namespace mailfwd {

// Time source for TTLs, rate-limit windows and retry backoff. Delivery code
// never calls std::this_thread::sleep_for directly so tests can run it on a
// manual clock.
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(duration d) = 0;

    static std::shared_ptr<Clock> system();
};

class SystemClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration d) override;
};

constexpr std::chrono::seconds kMaxBackoff{3600};

// 2^attempt seconds, capped at kMaxBackoff; attempts below 1 wait one second.
std::chrono::seconds backoff_delay(int attempt);

}  // namespace mailfwd
