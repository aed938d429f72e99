#include "alias_resolver.hpp"
#include "smtp_commands.hpp"
#include "mail_message.hpp"
#include "logger.hpp"

#include <charconv>

namespace mailfwd::smtp {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool icontains(const std::string& haystack, const std::string& needle) {
    return to_lower_copy(haystack).find(to_lower_copy(needle)) != std::string::npos;
}

std::optional<size_t> parse_size(const std::string& value) {
    auto text = trim(value);
    size_t out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return out;
}

}  // namespace

AliasResolver::AliasResolver(std::shared_ptr<Store> store)
    : store_(std::move(store)) {
}

bool AliasResolver::is_hosted_domain(const std::string& domain) {
    return store_->find_domain(domain).has_value();
}

Resolution AliasResolver::resolve(const std::string& recipient, const MessageFacts& facts) {
    auto addr = EmailAddress::parse(recipient);
    if (!addr || addr->local_part.empty() || addr->domain.empty()) {
        return NoRoute{std::nullopt, "Invalid recipient address"};
    }

    auto domain = store_->find_domain(addr->domain);
    if (!domain) {
        LOG_INFO_FMT("Domain {} is not hosted here", addr->domain);
        return NoRoute{std::nullopt, "Domain not hosted"};
    }

    auto alias = store_->find_alias(domain->id, addr->local_part);
    if (alias && alias->is_expired(std::chrono::system_clock::now())) {
        LOG_INFO_FMT("Alias {} has expired", recipient);
        alias.reset();
    }

    if (!alias) {
        if (domain->catch_all_email) {
            auto targets = parse_targets(*domain->catch_all_email);
            if (!targets.empty()) {
                LOG_INFO_FMT("No alias for {}, using catch-all {}", recipient, targets.front());
                return Routed{*domain, std::move(targets)};
            }
        }
        return NoRoute{*domain, "No alias found"};
    }

    std::string target_list = alias->targets;

    for (const auto& rule : store_->active_rules(alias->id)) {
        if (!rule_matches(rule, facts)) {
            continue;
        }

        store_->increment_match_count(rule.id);
        LOG_INFO_FMT("Rule {} ({} {}) matched mail for {}", rule.id,
                     condition_type_name(rule.condition_type),
                     action_type_name(rule.action_type), recipient);

        switch (rule.action_type) {
            case RuleActionType::Block:
                return Blocked{*domain, rule.id};
            case RuleActionType::Forward:
                break;
            case RuleActionType::Redirect:
                if (rule.action_value && !trim(*rule.action_value).empty()) {
                    target_list = *rule.action_value;
                } else {
                    LOG_WARNING_FMT("Redirect rule {} has no targets, using the alias targets",
                                    rule.id);
                }
                break;
        }
        break;
    }

    auto targets = parse_targets(target_list);
    if (targets.empty()) {
        LOG_WARNING_FMT("Alias {} resolved to no valid targets", recipient);
        return NoRoute{*domain, "No valid targets"};
    }
    return Routed{*domain, std::move(targets)};
}

bool AliasResolver::rule_matches(const ForwardingRule& rule, const MessageFacts& facts) {
    const std::string& value = rule.condition_value;

    switch (rule.condition_type) {
        case RuleConditionType::SenderContains:
            return icontains(facts.sender, value);

        case RuleConditionType::SenderEquals:
            return iequals(trim(facts.sender), trim(value));

        case RuleConditionType::SenderDomain: {
            auto at = facts.sender.rfind('@');
            if (at == std::string::npos) return false;
            std::string wanted = trim(value);
            if (!wanted.empty() && wanted.front() == '@') {
                wanted.erase(0, 1);
            }
            return iequals(facts.sender.substr(at + 1), wanted);
        }

        case RuleConditionType::SubjectContains:
            return icontains(facts.subject, value);

        case RuleConditionType::SubjectEquals:
            return iequals(trim(facts.subject), trim(value));

        case RuleConditionType::SizeGreaterThan: {
            auto limit = parse_size(value);
            return limit && facts.size_bytes > *limit;
        }

        case RuleConditionType::SizeLessThan: {
            auto limit = parse_size(value);
            return limit && facts.size_bytes < *limit;
        }

        case RuleConditionType::HasAttachments: {
            auto wanted = to_lower_copy(trim(value));
            if (wanted == "false" || wanted == "no" || wanted == "0") {
                return !facts.has_attachments;
            }
            return facts.has_attachments;
        }
    }
    return false;
}

std::vector<std::string> AliasResolver::parse_targets(const std::string& list) {
    std::vector<std::string> targets;

    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        std::string entry = trim(list.substr(pos, comma == std::string::npos
                                                      ? std::string::npos : comma - pos));
        if (!entry.empty()) {
            auto addr = EmailAddress::parse(entry);
            bool valid = addr && !addr->local_part.empty() &&
                         addr->domain.find('.') != std::string::npos &&
                         entry.find_first_of(" <>") == std::string::npos;
            if (valid) {
                targets.push_back(addr->full_address);
            } else {
                LOG_WARNING_FMT("Ignoring invalid forwarding target '{}'", entry);
            }
        }
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }

    return targets;
}

}  // namespace mailfwd::smtp
