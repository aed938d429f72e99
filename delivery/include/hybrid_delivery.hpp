#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "direct_delivery.hpp"
#include "dkim_signer.hpp"
#include "relay_service.hpp"

namespace mailfwd::delivery {

// Single outbound entry point: signs, then routes by delivery mode.
class HybridDelivery {
public:
    struct Stats {
        uint64_t direct_sent = 0;
        uint64_t direct_failed = 0;
        uint64_t relay_sent = 0;
        uint64_t relay_failed = 0;
        uint64_t dkim_signed = 0;
        uint64_t dkim_unsigned = 0;
        DeliveryMode mode = DeliveryMode::Direct;
        DirectDeliveryService::Stats direct;
        std::optional<RelayService::Stats> relay;
    };

    // A null signer disables DKIM. Any mode other than direct falls back to
    // direct when the relay is absent or has no credentials.
    HybridDelivery(DeliveryMode mode,
                   const RelayConfig& relay_config,
                   std::shared_ptr<DirectDeliveryService> direct,
                   std::shared_ptr<RelayService> relay,
                   std::shared_ptr<DkimSigner> signer);

    std::map<std::string, bool> send(const std::string& message,
                                     const std::vector<std::string>& recipients,
                                     const std::string& mail_from,
                                     Priority priority = Priority::Normal);

    DeliveryMode mode() const { return mode_; }
    Stats stats() const;

private:
    std::string sign(const std::string& message, const std::string& mail_from);

    std::map<std::string, bool> send_direct(const std::string& message,
                                            const std::vector<std::string>& recipients,
                                            const std::string& mail_from);
    std::map<std::string, bool> send_relay(const std::string& message,
                                           const std::vector<std::string>& recipients,
                                           const std::string& mail_from,
                                           Priority priority);
    // Routing hook for per-domain reputation; relays everything for now.
    std::map<std::string, bool> send_smart(const std::string& message,
                                           const std::vector<std::string>& recipients,
                                           const std::string& mail_from,
                                           Priority priority);

    DeliveryMode mode_;
    std::shared_ptr<DirectDeliveryService> direct_;
    std::shared_ptr<RelayService> relay_;
    std::shared_ptr<DkimSigner> signer_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace mailfwd::delivery
