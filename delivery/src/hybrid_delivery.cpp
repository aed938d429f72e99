#include "hybrid_delivery.hpp"
#include "delivery_errors.hpp"
#include "logger.hpp"

#include <future>

namespace mailfwd::delivery {

HybridDelivery::HybridDelivery(DeliveryMode mode,
                               const RelayConfig& relay_config,
                               std::shared_ptr<DirectDeliveryService> direct,
                               std::shared_ptr<RelayService> relay,
                               std::shared_ptr<DkimSigner> signer)
    : mode_(mode)
    , direct_(std::move(direct))
    , relay_(std::move(relay))
    , signer_(std::move(signer)) {
    if (mode_ != DeliveryMode::Direct && (!relay_config.configured() || !relay_)) {
        LOG_WARNING_FMT("Relay not configured, forcing delivery mode to direct (was {})",
                        delivery_mode_name(mode_));
        mode_ = DeliveryMode::Direct;
    }

    LOG_INFO_FMT("Outbound delivery: mode={}, dkim={}",
                 delivery_mode_name(mode_), signer_ ? "enabled" : "disabled");
}

std::string HybridDelivery::sign(const std::string& message, const std::string& mail_from) {
    if (!signer_) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.dkim_unsigned;
        return message;
    }

    auto signed_message = signer_->sign(message, mail_from);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (signed_message.dkim_signed) {
        ++stats_.dkim_signed;
    } else {
        ++stats_.dkim_unsigned;
    }
    return std::move(signed_message.data);
}

std::map<std::string, bool> HybridDelivery::send(const std::string& message,
                                                 const std::vector<std::string>& recipients,
                                                 const std::string& mail_from,
                                                 Priority priority) {
    if (recipients.empty()) {
        return {};
    }

    std::string data = sign(message, mail_from);

    switch (mode_) {
        case DeliveryMode::Direct:
            return send_direct(data, recipients, mail_from);

        case DeliveryMode::Relay:
            return send_relay(data, recipients, mail_from, priority);

        case DeliveryMode::Hybrid: {
            auto results = send_direct(data, recipients, mail_from);

            std::vector<std::string> failed;
            for (const auto& [recipient, ok] : results) {
                if (!ok) failed.push_back(recipient);
            }

            if (!failed.empty()) {
                LOG_INFO_FMT("Direct delivery failed for {} recipient(s), falling back to relay",
                             failed.size());
                for (const auto& [recipient, ok] : send_relay(data, failed, mail_from, priority)) {
                    results[recipient] = ok;
                }
            }
            return results;
        }

        case DeliveryMode::Smart:
            return send_smart(data, recipients, mail_from, priority);
    }

    LOG_ERROR("Unknown delivery mode");
    std::map<std::string, bool> results;
    for (const auto& recipient : recipients) {
        results[recipient] = false;
    }
    return results;
}

std::map<std::string, bool> HybridDelivery::send_direct(const std::string& message,
                                                        const std::vector<std::string>& recipients,
                                                        const std::string& mail_from) {
    auto results = direct_->send_bulk(message, recipients, mail_from);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    for (const auto& [recipient, ok] : results) {
        if (ok) {
            ++stats_.direct_sent;
        } else {
            ++stats_.direct_failed;
        }
    }
    return results;
}

std::map<std::string, bool> HybridDelivery::send_relay(const std::string& message,
                                                       const std::vector<std::string>& recipients,
                                                       const std::string& mail_from,
                                                       Priority priority) {
    std::map<std::string, bool> results;

    if (!relay_) {
        LOG_ERROR("Relay service not available");
        for (const auto& recipient : recipients) {
            results[recipient] = false;
        }
        return results;
    }

    // One job per recipient so a refusal only fails that recipient.
    std::vector<std::pair<std::string, std::future<bool>>> pending;
    for (const auto& recipient : recipients) {
        try {
            pending.emplace_back(recipient, relay_->submit(message, {recipient}, mail_from, priority));
        } catch (const QueueFullError& e) {
            LOG_ERROR_FMT("Could not queue relay job for {}: {}", recipient, e.what());
            results[recipient] = false;
        }
    }

    for (auto& [recipient, future] : pending) {
        results[recipient] = future.get();
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    for (const auto& [recipient, ok] : results) {
        if (ok) {
            ++stats_.relay_sent;
        } else {
            ++stats_.relay_failed;
        }
    }
    return results;
}

std::map<std::string, bool> HybridDelivery::send_smart(const std::string& message,
                                                       const std::vector<std::string>& recipients,
                                                       const std::string& mail_from,
                                                       Priority priority) {
    return send_relay(message, recipients, mail_from, priority);
}

HybridDelivery::Stats HybridDelivery::stats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        s = stats_;
    }
    s.mode = mode_;
    s.direct = direct_->stats();
    if (relay_) {
        s.relay = relay_->stats();
    }
    return s;
}

}  // namespace mailfwd::delivery
