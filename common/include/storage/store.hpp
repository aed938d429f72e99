#pragma once

#include "storage/models.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <optional>

namespace mailfwd {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A persisted value that does not map onto a known enum.
class DecodeError : public StoreError {
public:
    using StoreError::StoreError;
};

class InvalidTransitionError : public StoreError {
public:
    InvalidTransitionError(MessageStatus from, MessageStatus to);

    MessageStatus from() const { return from_; }
    MessageStatus to() const { return to_; }

private:
    MessageStatus from_;
    MessageStatus to_;
};

// Persistence consumed by the forwarding core. Every call is atomic on its own.
class Store {
public:
    virtual ~Store() = default;

    // Non-deleted domain, name matched case-insensitively.
    virtual std::optional<Domain> find_domain(const std::string& name) = 0;
    // Non-deleted alias. Expiry is left to the caller.
    virtual std::optional<Alias> find_alias(int64_t domain_id, const std::string& local_part) = 0;
    // Active rules in ascending priority.
    virtual std::vector<ForwardingRule> active_rules(int64_t alias_id) = 0;
    virtual void increment_match_count(int64_t rule_id) = 0;

    virtual int64_t insert_message(const Message& message) = 0;
    virtual void update_message_status(int64_t id, MessageStatus status,
                                       const std::optional<std::string>& error_message = std::nullopt,
                                       const std::optional<std::string>& forwarded_to = std::nullopt) = 0;
    virtual std::optional<Message> find_message(int64_t id) = 0;

    virtual UserPreferences notification_preferences(int64_t user_id) = 0;
};

}  // namespace mailfwd
