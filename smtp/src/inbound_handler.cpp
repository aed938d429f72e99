#include "inbound_handler.hpp"
#include "delivery_errors.hpp"
#include "smtp_commands.hpp"
#include "logger.hpp"

namespace mailfwd::smtp {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

}  // namespace

ForwardingOptions ForwardingOptions::from_config(const Config& config) {
    ForwardingOptions options;
    options.hostname = config.sending_hostname();
    options.forwarded_by = config.delivery().forwarded_by;
    options.envelope_sender = config.delivery().envelope_sender;
    return options;
}

InboundHandler::InboundHandler(std::shared_ptr<Store> store,
                               std::shared_ptr<delivery::HybridDelivery> delivery,
                               std::shared_ptr<Notifier> notifier,
                               ForwardingOptions options)
    : store_(std::move(store))
    , delivery_(std::move(delivery))
    , notifier_(std::move(notifier))
    , options_(std::move(options))
    , resolver_(store_) {
}

bool InboundHandler::accepts_domain(const std::string& domain) {
    try {
        return resolver_.is_hosted_domain(domain);
    } catch (const StoreError& e) {
        LOG_ERROR_FMT("Domain lookup for {} failed: {}", domain, e.what());
        return false;
    }
}

std::string InboundHandler::handle_data(const std::string& mail_from,
                                        const std::vector<std::string>& rcpt_tos,
                                        const std::string& raw_message) {
    try {
        auto parsed = MailMessage::parse(raw_message);

        Message base;
        base.message_id = parsed.message_id().value_or(
            MailMessage::generate_message_id(raw_message, options_.hostname));
        base.sender_email = mail_from;
        base.subject = parsed.subject();
        base.size_bytes = raw_message.size();
        base.has_attachments = parsed.has_attachments();

        LOG_INFO_FMT("Received {} from {} for {} recipient(s) ({} bytes)",
                     base.message_id, mail_from, rcpt_tos.size(), base.size_bytes);

        for (const auto& recipient : rcpt_tos) {
            try {
                process_recipient(mail_from, recipient, parsed, base);
            } catch (const StoreError& e) {
                LOG_ERROR_FMT("Storage error while processing {}: {}", recipient, e.what());
            } catch (const delivery::DeliveryError& e) {
                LOG_ERROR_FMT("Delivery error while processing {}: {}", recipient, e.what());
            }
        }

        return reply::make(reply::OK, "Message accepted for delivery");
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("Error handling message from {}: {}", mail_from, e.what());
        return reply::make(reply::LOCAL_ERROR, "Requested action aborted: error processing message");
    }
}

void InboundHandler::process_recipient(const std::string& mail_from, const std::string& recipient,
                                       const MailMessage& parsed, const Message& base) {
    MessageFacts facts{mail_from, base.subject, base.size_bytes, base.has_attachments};
    auto resolution = resolver_.resolve(recipient, facts);

    Message row = base;
    row.recipient_email = recipient;

    if (auto* none = std::get_if<NoRoute>(&resolution)) {
        if (!none->domain) {
            LOG_INFO_FMT("No route for {}: {}", recipient, none->reason);
            return;
        }
        row.domain_id = none->domain->id;
        reject(std::move(row), none->reason);
        return;
    }

    if (auto* blocked = std::get_if<Blocked>(&resolution)) {
        row.domain_id = blocked->domain.id;
        reject(std::move(row), "Blocked by forwarding rule " + std::to_string(blocked->rule_id));
        return;
    }

    const auto& routed = std::get<Routed>(resolution);
    row.domain_id = routed.domain.id;
    row.status = MessageStatus::Pending;

    int64_t id = store_->insert_message(row);
    store_->update_message_status(id, MessageStatus::Processing);

    std::string envelope_sender = options_.envelope_sender.empty()
        ? "noreply@" + routed.domain.name : options_.envelope_sender;

    auto data = forwarded_copy(parsed, recipient, mail_from, routed.targets);
    auto results = delivery_->send(data, routed.targets, envelope_sender);

    std::vector<std::string> failed;
    for (const auto& target : routed.targets) {
        auto it = results.find(target);
        if (it == results.end() || !it->second) {
            failed.push_back(target);
        }
    }

    std::string forwarded_to = join(routed.targets, ",");

    if (failed.empty()) {
        store_->update_message_status(id, MessageStatus::Delivered, std::nullopt, forwarded_to);
        LOG_INFO_FMT("Forwarded mail for {} to {}", recipient, forwarded_to);
        return;
    }

    std::string error = "Delivery failed for: " + join(failed);
    store_->update_message_status(id, MessageStatus::Failed, error, forwarded_to);
    LOG_WARNING_FMT("Forwarding for {} failed: {}", recipient, error);

    notify_failure(routed.domain, recipient, row, error);
}

void InboundHandler::reject(Message row, const std::string& reason) {
    row.status = MessageStatus::Rejected;
    row.error_message = reason;
    store_->insert_message(row);
    LOG_INFO_FMT("Rejected mail for {}: {}", row.recipient_email, reason);
}

std::string InboundHandler::forwarded_copy(const MailMessage& parsed, const std::string& recipient,
                                           const std::string& mail_from,
                                           const std::vector<std::string>& targets) const {
    MailMessage copy = parsed;
    copy.add_header("X-Forwarded-By", options_.forwarded_by);
    copy.set_header("X-Original-To", recipient);
    copy.set_header("X-Original-Sender", mail_from);
    copy.set_header("To", join(targets));
    return copy.serialize();
}

void InboundHandler::notify_failure(const Domain& domain, const std::string& recipient,
                                    const Message& row, const std::string& error) {
    if (!notifier_) return;

    if (!store_->notification_preferences(domain.owner_id).notify_on_failure) {
        LOG_DEBUG_FMT("User {} opted out of failure notices", domain.owner_id);
        return;
    }

    notifier_->forwarding_failed({domain.owner_id, recipient, row.sender_email, row.subject, error});
}

}  // namespace mailfwd::smtp
