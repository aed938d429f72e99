#include "relay_service.hpp"
#include "delivery_errors.hpp"
#include "logger.hpp"

namespace mailfwd::delivery {

namespace {

constexpr const char* kRateLimitKey = "relay";

}  // namespace

const char* priority_name(Priority priority) {
    switch (priority) {
        case Priority::High:   return "HIGH";
        case Priority::Normal: return "NORMAL";
        case Priority::Low:    return "LOW";
    }
    return "UNKNOWN";
}

RelayService::RelayService(const RelayConfig& config, std::string hostname,
                           SmtpClientFactory factory, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
    , pool_(config, std::move(hostname), std::move(factory))
    , rate_limiter_(config.rate_limit, std::chrono::seconds(60), clock_) {
    LOG_INFO_FMT("Relay service configured for {}:{} (pool {}, rate limit {}/min)",
                 config_.host, config_.port, config_.pool_size, config_.rate_limit);
}

RelayService::~RelayService() {
    stop();
}

void RelayService::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            LOG_WARNING("Relay service already running");
            return;
        }
    }

    pool_.warm_up();

    size_t count = config_.workers == 0 ? 1 : config_.workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
        accepting_ = true;
    }
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&RelayService::worker_loop, this, i + 1);
    }

    LOG_INFO_FMT("Relay service started with {} worker(s)", count);
}

void RelayService::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!running_) return;

        accepting_ = false;
        LOG_INFO_FMT("Stopping relay service, draining {} queued job(s)", queue_.size());
        drained_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
        running_ = false;
    }
    work_available_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    pool_.close();
    LOG_INFO("Relay service stopped");
}

bool RelayService::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::future<bool> RelayService::submit(std::string message, std::vector<std::string> recipients,
                                       std::string mail_from, Priority priority) {
    auto completion = std::make_shared<std::promise<bool>>();
    auto future = completion->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            LOG_WARNING("Relay service is not running, job refused");
            completion->set_value(false);
            return future;
        }

        if (queue_.size() >= config_.queue_capacity) {
            throw QueueFullError(config_.queue_capacity);
        }

        EmailJob job;
        job.message = std::move(message);
        job.recipients = std::move(recipients);
        job.mail_from = std::move(mail_from);
        job.priority = priority;
        job.sequence = next_sequence_++;
        job.completion = completion;

        LOG_DEBUG_FMT("Queued relay job {} ({} priority, {} recipient(s))",
                      job.sequence, priority_name(priority), job.recipients.size());
        queue_.push(std::move(job));
        ++stats_.queued;
    }
    work_available_.notify_one();

    return future;
}

bool RelayService::send(const std::string& message, const std::vector<std::string>& recipients,
                        const std::string& mail_from, Priority priority) {
    try {
        return submit(message, recipients, mail_from, priority).get();
    } catch (const QueueFullError& e) {
        LOG_ERROR_FMT("Relay submission failed: {}", e.what());
        return false;
    }
}

void RelayService::worker_loop(size_t id) {
    LOG_DEBUG_FMT("Relay worker {} started", id);

    while (true) {
        EmailJob job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            job = queue_.top();
            queue_.pop();
            ++in_flight_;
        }

        if (deliver(job)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.sent;
            }
            job.completion->set_value(true);
        } else {
            handle_failure(std::move(job));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
            if (queue_.empty() && in_flight_ == 0) {
                drained_.notify_all();
            }
        }
    }

    LOG_DEBUG_FMT("Relay worker {} stopped", id);
}

bool RelayService::deliver(const EmailJob& job) {
    try {
        rate_limiter_.acquire(kRateLimitKey);

        auto connection = pool_.acquire();
        try {
            auto refused = connection->send_mail(job.mail_from, job.recipients, job.message);
            for (const auto& rcpt : refused) {
                LOG_WARNING_FMT("Relay refused recipient {}", rcpt);
            }
        } catch (const SmtpError&) {
            connection.invalidate();
            throw;
        }

        LOG_INFO_FMT("Relayed message to {} recipient(s) via {}", job.recipients.size(), config_.host);
        return true;
    } catch (const SmtpError& e) {
        LOG_ERROR_FMT("Relay send failed: {}", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failed;
        return false;
    }
}

void RelayService::handle_failure(EmailJob job) {
    if (job.retry_count >= config_.max_retries) {
        LOG_ERROR_FMT("Relay job {} failed after {} retries, giving up", job.sequence, job.retry_count);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.dropped;
        }
        job.completion->set_value(false);
        return;
    }

    ++job.retry_count;
    auto wait = backoff_delay(job.retry_count);
    LOG_INFO_FMT("Retrying relay job {} (attempt {}/{}) in {}s",
                 job.sequence, job.retry_count, config_.max_retries, wait.count());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.retried;
    }

    clock_->sleep_for(wait);

    // Retries go back in regardless of capacity; the job was already accepted.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(job));
    }
    work_available_.notify_one();
}

RelayService::Stats RelayService::stats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s = stats_;
        s.queue_size = queue_.size();
        s.running = running_;
    }
    s.pool_size = pool_.size();
    return s;
}

}  // namespace mailfwd::delivery
