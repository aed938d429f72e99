#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clock.hpp"
#include "mx_resolver.hpp"
#include "rate_limiter.hpp"
#include "smtp_client.hpp"

namespace mailfwd::delivery {

enum class DeliveryOutcome {
    Success,
    Bounced,   // permanent: 5xx, refused recipient, NXDOMAIN
    Failed     // temporary errors outlasted every retry
};

const char* outcome_name(DeliveryOutcome outcome);

struct DeliveryAttempt {
    int number = 0;
    std::string host;       // empty when the attempt failed before any connection
    std::string error;
};

struct DeliveryResult {
    DeliveryOutcome outcome = DeliveryOutcome::Failed;
    std::string error;
    std::vector<DeliveryAttempt> attempts;

    bool success() const { return outcome == DeliveryOutcome::Success; }
};

// Delivers straight to the recipient domain's exchangers on port 25.
class DirectDeliveryService {
public:
    struct Stats {
        uint64_t sent = 0;
        uint64_t failed = 0;
        uint64_t deferred = 0;
        uint64_t bounced = 0;
        uint64_t mx_lookups = 0;
        uint64_t mx_cache_hits = 0;
        size_t mx_cache_size = 0;
    };

    static constexpr uint16_t kSmtpPort = 25;

    DirectDeliveryService(std::shared_ptr<MxResolver> resolver,
                          std::shared_ptr<RateLimiter> rate_limiter,
                          SmtpClientFactory client_factory,
                          std::string hostname,
                          int max_retries = 3,
                          std::shared_ptr<Clock> clock = Clock::system());

    DeliveryResult send(const std::string& message,
                        const std::string& recipient,
                        const std::string& mail_from);

    std::map<std::string, bool> send_bulk(const std::string& message,
                                          const std::vector<std::string>& recipients,
                                          const std::string& mail_from);

    Stats stats() const;
    MxResolver& resolver() { return *resolver_; }

private:
    // Throws PermanentSmtpError or TemporarySmtpError.
    void deliver_to_host(const std::string& host, const std::string& message,
                         const std::string& recipient, const std::string& mail_from);

    void record(DeliveryOutcome outcome);

    std::shared_ptr<MxResolver> resolver_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    SmtpClientFactory client_factory_;
    std::string hostname_;
    int max_retries_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace mailfwd::delivery
