#include "direct_delivery.hpp"
#include "delivery_errors.hpp"
#include "mail_message.hpp"
#include "logger.hpp"

namespace mailfwd::delivery {

namespace {

std::string domain_of(const std::string& address) {
    auto at = address.rfind('@');
    if (at == std::string::npos || at + 1 >= address.size()) {
        return "";
    }
    return to_lower_copy(address.substr(at + 1));
}

}  // namespace

const char* outcome_name(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::Success: return "SUCCESS";
        case DeliveryOutcome::Bounced: return "BOUNCED";
        case DeliveryOutcome::Failed:  return "FAILED";
    }
    return "UNKNOWN";
}

DirectDeliveryService::DirectDeliveryService(std::shared_ptr<MxResolver> resolver,
                                             std::shared_ptr<RateLimiter> rate_limiter,
                                             SmtpClientFactory client_factory,
                                             std::string hostname,
                                             int max_retries,
                                             std::shared_ptr<Clock> clock)
    : resolver_(std::move(resolver))
    , rate_limiter_(std::move(rate_limiter))
    , client_factory_(std::move(client_factory))
    , hostname_(std::move(hostname))
    , max_retries_(max_retries < 1 ? 1 : max_retries)
    , clock_(std::move(clock)) {
}

DeliveryResult DirectDeliveryService::send(const std::string& message,
                                           const std::string& recipient,
                                           const std::string& mail_from) {
    DeliveryResult result;

    std::string domain = domain_of(recipient);
    if (domain.empty()) {
        result.outcome = DeliveryOutcome::Bounced;
        result.error = "Invalid recipient address: " + recipient;
        LOG_ERROR(result.error);
        record(result.outcome);
        return result;
    }

    for (int attempt = 1; attempt <= max_retries_; ++attempt) {
        std::string error;

        std::vector<std::string> hosts;
        try {
            hosts = resolver_->resolve(domain);
        } catch (const DnsResolutionError& e) {
            result.attempts.push_back({attempt, "", e.what()});
            if (e.is_nxdomain()) {
                result.outcome = DeliveryOutcome::Bounced;
                result.error = e.what();
                LOG_ERROR_FMT("Bouncing mail for {}: {}", recipient, e.what());
                record(result.outcome);
                return result;
            }
            error = e.what();
        }

        if (!hosts.empty()) {
            rate_limiter_->acquire(domain);
        }

        for (const auto& host : hosts) {
            LOG_DEBUG_FMT("Delivering to {} via {} (attempt {}/{})",
                          recipient, host, attempt, max_retries_);
            try {
                deliver_to_host(host, message, recipient, mail_from);
                result.attempts.push_back({attempt, host, ""});
                result.outcome = DeliveryOutcome::Success;
                result.error.clear();
                LOG_INFO_FMT("Delivered mail for {} via {}", recipient, host);
                record(result.outcome);
                return result;
            } catch (const PermanentSmtpError& e) {
                result.attempts.push_back({attempt, host, e.what()});
                result.outcome = DeliveryOutcome::Bounced;
                result.error = e.what();
                LOG_ERROR_FMT("Permanent failure for {} at {}, not retrying: {}",
                              recipient, host, e.what());
                record(result.outcome);
                return result;
            } catch (const TemporarySmtpError& e) {
                result.attempts.push_back({attempt, host, e.what()});
                error = e.what();
                LOG_WARNING_FMT("Temporary failure for {} at {}: {}", recipient, host, e.what());
            }
        }

        result.error = error.empty() ? "All MX hosts failed" : error;

        if (attempt < max_retries_) {
            auto wait = backoff_delay(attempt);
            LOG_INFO_FMT("Delivery to {} failed (attempt {}/{}), retrying in {}s: {}",
                         recipient, attempt, max_retries_, wait.count(), result.error);
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.deferred;
            }
            clock_->sleep_for(wait);
        }
    }

    result.outcome = DeliveryOutcome::Failed;
    LOG_ERROR_FMT("Delivery to {} failed after {} attempts: {}",
                  recipient, max_retries_, result.error);
    record(result.outcome);
    return result;
}

void DirectDeliveryService::deliver_to_host(const std::string& host, const std::string& message,
                                            const std::string& recipient,
                                            const std::string& mail_from) {
    auto client = client_factory_();
    client->connect(host, kSmtpPort);
    client->ehlo(hostname_);

    if (client->supports("STARTTLS")) {
        try {
            client->starttls();
            client->ehlo(hostname_);
        } catch (const SmtpError& e) {
            // A failed handshake leaves the session unusable, so start over in plaintext
            LOG_WARNING_FMT("STARTTLS with {} failed, continuing without TLS: {}", host, e.what());
            client = client_factory_();
            client->connect(host, kSmtpPort);
            client->ehlo(hostname_);
        }
    }

    client->send_mail(mail_from, {recipient}, message);
    client->quit();
}

std::map<std::string, bool> DirectDeliveryService::send_bulk(const std::string& message,
                                                             const std::vector<std::string>& recipients,
                                                             const std::string& mail_from) {
    std::map<std::string, bool> results;
    for (const auto& recipient : recipients) {
        results[recipient] = send(message, recipient, mail_from).success();
    }
    return results;
}

void DirectDeliveryService::record(DeliveryOutcome outcome) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    switch (outcome) {
        case DeliveryOutcome::Success: ++stats_.sent; break;
        case DeliveryOutcome::Bounced: ++stats_.bounced; break;
        case DeliveryOutcome::Failed:  ++stats_.failed; break;
    }
}

DirectDeliveryService::Stats DirectDeliveryService::stats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        s = stats_;
    }
    auto mx = resolver_->stats();
    s.mx_lookups = mx.lookups;
    s.mx_cache_hits = mx.cache_hits;
    s.mx_cache_size = resolver_->cache_size();
    return s;
}

}  // namespace mailfwd::delivery
