#pragma once

#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "clock.hpp"
#include "config.hpp"
#include "connection_pool.hpp"
#include "rate_limiter.hpp"

namespace mailfwd::delivery {

enum class Priority {
    High = 1,
    Normal = 2,
    Low = 3
};

const char* priority_name(Priority priority);

struct EmailJob {
    std::string message;
    std::vector<std::string> recipients;
    std::string mail_from;
    Priority priority = Priority::Normal;
    int retry_count = 0;
    uint64_t sequence = 0;
    std::shared_ptr<std::promise<bool>> completion;
};

// Smart-host delivery: a bounded priority queue drained by worker threads
// sharing a pool of authenticated connections.
class RelayService {
public:
    struct Stats {
        uint64_t queued = 0;
        uint64_t sent = 0;
        uint64_t failed = 0;
        uint64_t retried = 0;
        uint64_t dropped = 0;
        size_t queue_size = 0;
        size_t pool_size = 0;
        bool running = false;
    };

    RelayService(const RelayConfig& config, std::string hostname, SmtpClientFactory factory,
                 std::shared_ptr<Clock> clock = Clock::system());
    ~RelayService();

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;

    void start();
    // Stops intake, waits for queued and in-flight jobs, then joins the
    // workers and closes the pool.
    void stop();
    bool is_running() const;

    // The future resolves once the job is sent or dropped. Throws
    // QueueFullError at capacity; resolves false at once when not running.
    std::future<bool> submit(std::string message, std::vector<std::string> recipients,
                             std::string mail_from, Priority priority = Priority::Normal);

    // Blocks until the job's final outcome is known.
    bool send(const std::string& message, const std::vector<std::string>& recipients,
              const std::string& mail_from, Priority priority = Priority::Normal);

    Stats stats() const;

private:
    struct JobOrder {
        bool operator()(const EmailJob& a, const EmailJob& b) const {
            if (a.priority != b.priority) {
                return static_cast<int>(a.priority) > static_cast<int>(b.priority);
            }
            return a.sequence > b.sequence;
        }
    };

    void worker_loop(size_t id);
    bool deliver(const EmailJob& job);
    void handle_failure(EmailJob job);

    RelayConfig config_;
    std::shared_ptr<Clock> clock_;
    ConnectionPool pool_;
    RateLimiter rate_limiter_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable drained_;
    std::priority_queue<EmailJob, std::vector<EmailJob>, JobOrder> queue_;
    uint64_t next_sequence_ = 0;
    size_t in_flight_ = 0;
    bool running_ = false;
    bool accepting_ = false;
    std::vector<std::thread> workers_;
    Stats stats_;
};

}  // namespace mailfwd::delivery
