#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "alias_resolver.hpp"
#include "hybrid_delivery.hpp"
#include "mail_message.hpp"
#include "notifier.hpp"
#include "storage/store.hpp"

namespace mailfwd::smtp {

// What the SMTP session calls once a message has been received.
class MessageHandler {
public:
    virtual ~MessageHandler() = default;

    virtual bool accepts_domain(const std::string& domain) = 0;
    // Returns the SMTP reply line for the end of DATA.
    virtual std::string handle_data(const std::string& mail_from,
                                    const std::vector<std::string>& rcpt_tos,
                                    const std::string& raw_message) = 0;
};

struct ForwardingOptions {
    std::string hostname = "localhost";      // for generated Message-IDs
    std::string forwarded_by = "mailfwd";
    std::string envelope_sender;              // empty = noreply@<alias domain>

    static ForwardingOptions from_config(const Config& config);
};

// Resolves each recipient, records a Message row per recipient and forwards
// through the delivery coordinator.
class InboundHandler : public MessageHandler {
public:
    InboundHandler(std::shared_ptr<Store> store,
                   std::shared_ptr<delivery::HybridDelivery> delivery,
                   std::shared_ptr<Notifier> notifier,
                   ForwardingOptions options);

    bool accepts_domain(const std::string& domain) override;

    std::string handle_data(const std::string& mail_from,
                            const std::vector<std::string>& rcpt_tos,
                            const std::string& raw_message) override;

private:
    void process_recipient(const std::string& mail_from, const std::string& recipient,
                           const MailMessage& parsed, const Message& base);

    void reject(Message row, const std::string& reason);

    std::string forwarded_copy(const MailMessage& parsed, const std::string& recipient,
                               const std::string& mail_from,
                               const std::vector<std::string>& targets) const;

    void notify_failure(const Domain& domain, const std::string& recipient,
                        const Message& row, const std::string& error);

    std::shared_ptr<Store> store_;
    std::shared_ptr<delivery::HybridDelivery> delivery_;
    std::shared_ptr<Notifier> notifier_;
    ForwardingOptions options_;
    AliasResolver resolver_;
};

}  // namespace mailfwd::smtp
