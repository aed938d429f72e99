#include "storage/models.hpp"
#include <algorithm>
#include <cctype>

namespace mailfwd {

namespace {

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

}  // namespace

std::optional<RuleConditionType> parse_condition_type(std::string_view name) {
    auto n = to_upper(name);
    if (n == "SENDER_CONTAINS") return RuleConditionType::SenderContains;
    if (n == "SENDER_EQUALS") return RuleConditionType::SenderEquals;
    if (n == "SENDER_DOMAIN") return RuleConditionType::SenderDomain;
    if (n == "SUBJECT_CONTAINS") return RuleConditionType::SubjectContains;
    if (n == "SUBJECT_EQUALS") return RuleConditionType::SubjectEquals;
    if (n == "SIZE_GREATER_THAN") return RuleConditionType::SizeGreaterThan;
    if (n == "SIZE_LESS_THAN") return RuleConditionType::SizeLessThan;
    if (n == "HAS_ATTACHMENTS") return RuleConditionType::HasAttachments;
    return std::nullopt;
}

std::string_view condition_type_name(RuleConditionType type) {
    switch (type) {
        case RuleConditionType::SenderContains:  return "SENDER_CONTAINS";
        case RuleConditionType::SenderEquals:    return "SENDER_EQUALS";
        case RuleConditionType::SenderDomain:    return "SENDER_DOMAIN";
        case RuleConditionType::SubjectContains: return "SUBJECT_CONTAINS";
        case RuleConditionType::SubjectEquals:   return "SUBJECT_EQUALS";
        case RuleConditionType::SizeGreaterThan: return "SIZE_GREATER_THAN";
        case RuleConditionType::SizeLessThan:    return "SIZE_LESS_THAN";
        case RuleConditionType::HasAttachments:  return "HAS_ATTACHMENTS";
    }
    return "UNKNOWN";
}

std::optional<RuleActionType> parse_action_type(std::string_view name) {
    auto n = to_upper(name);
    if (n == "FORWARD") return RuleActionType::Forward;
    if (n == "BLOCK") return RuleActionType::Block;
    if (n == "REDIRECT") return RuleActionType::Redirect;
    return std::nullopt;
}

std::string_view action_type_name(RuleActionType type) {
    switch (type) {
        case RuleActionType::Forward:  return "FORWARD";
        case RuleActionType::Block:    return "BLOCK";
        case RuleActionType::Redirect: return "REDIRECT";
    }
    return "UNKNOWN";
}

std::optional<MessageStatus> parse_message_status(std::string_view name) {
    auto n = to_upper(name);
    if (n == "PENDING") return MessageStatus::Pending;
    if (n == "PROCESSING") return MessageStatus::Processing;
    if (n == "DELIVERED") return MessageStatus::Delivered;
    if (n == "FAILED") return MessageStatus::Failed;
    if (n == "BOUNCED") return MessageStatus::Bounced;
    if (n == "REJECTED") return MessageStatus::Rejected;
    return std::nullopt;
}

std::string_view message_status_name(MessageStatus status) {
    switch (status) {
        case MessageStatus::Pending:    return "PENDING";
        case MessageStatus::Processing: return "PROCESSING";
        case MessageStatus::Delivered:  return "DELIVERED";
        case MessageStatus::Failed:     return "FAILED";
        case MessageStatus::Bounced:    return "BOUNCED";
        case MessageStatus::Rejected:   return "REJECTED";
    }
    return "UNKNOWN";
}

bool is_terminal(MessageStatus status) {
    switch (status) {
        case MessageStatus::Pending:
        case MessageStatus::Processing:
            return false;
        case MessageStatus::Delivered:
        case MessageStatus::Failed:
        case MessageStatus::Bounced:
        case MessageStatus::Rejected:
            return true;
    }
    return false;
}

bool can_transition(MessageStatus from, MessageStatus to) {
    switch (from) {
        case MessageStatus::Pending:
            return to == MessageStatus::Processing || to == MessageStatus::Rejected;
        case MessageStatus::Processing:
            return is_terminal(to);
        case MessageStatus::Delivered:
        case MessageStatus::Failed:
        case MessageStatus::Bounced:
        case MessageStatus::Rejected:
            return false;
    }
    return false;
}

}  // namespace mailfwd
