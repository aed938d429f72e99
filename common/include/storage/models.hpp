#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <cstdint>

namespace mailfwd {

using Timestamp = std::chrono::system_clock::time_point;

struct Domain {
    int64_t id = 0;
    std::string name;
    int64_t owner_id = 0;
    std::optional<std::string> dkim_private_key;  // PEM
    std::string dkim_selector = "mailfwd";
    std::optional<std::string> catch_all_email;
    bool is_deleted = false;
};

struct Alias {
    int64_t id = 0;
    int64_t domain_id = 0;
    std::string local_part;
    std::string targets;  // comma-separated, in delivery order
    std::optional<Timestamp> expires_at;
    bool is_deleted = false;

    bool is_expired(Timestamp now) const {
        return expires_at && *expires_at <= now;
    }
};

enum class RuleConditionType {
    SenderContains,
    SenderEquals,
    SenderDomain,
    SubjectContains,
    SubjectEquals,
    SizeGreaterThan,
    SizeLessThan,
    HasAttachments
};

enum class RuleActionType {
    Forward,
    Block,
    Redirect
};

// Persisted names are the upper-case identifiers ("SENDER_CONTAINS", "BLOCK", ...).
std::optional<RuleConditionType> parse_condition_type(std::string_view name);
std::string_view condition_type_name(RuleConditionType type);
std::optional<RuleActionType> parse_action_type(std::string_view name);
std::string_view action_type_name(RuleActionType type);

struct ForwardingRule {
    int64_t id = 0;
    int64_t alias_id = 0;
    int priority = 0;
    RuleConditionType condition_type = RuleConditionType::SenderContains;
    std::string condition_value;
    RuleActionType action_type = RuleActionType::Forward;
    std::optional<std::string> action_value;
    bool is_active = true;
    int64_t match_count = 0;
};

enum class MessageStatus {
    Pending,
    Processing,
    Delivered,
    Failed,
    Bounced,
    Rejected
};

std::optional<MessageStatus> parse_message_status(std::string_view name);
std::string_view message_status_name(MessageStatus status);

bool is_terminal(MessageStatus status);
// PENDING -> PROCESSING -> {DELIVERED, FAILED, BOUNCED, REJECTED}; PENDING -> REJECTED.
bool can_transition(MessageStatus from, MessageStatus to);

struct Message {
    int64_t id = 0;
    std::string message_id;
    int64_t domain_id = 0;
    std::string sender_email;
    std::string recipient_email;
    std::optional<std::string> forwarded_to;
    std::string subject;
    size_t size_bytes = 0;
    bool has_attachments = false;
    MessageStatus status = MessageStatus::Pending;
    std::optional<std::string> error_message;
};

struct UserPreferences {
    int64_t user_id = 0;
    bool notify_on_failure = true;
};

}  // namespace mailfwd
