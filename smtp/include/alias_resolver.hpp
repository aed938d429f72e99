#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "storage/store.hpp"

namespace mailfwd::smtp {

// What forwarding rules may inspect about an inbound message.
struct MessageFacts {
    std::string sender;
    std::string subject;
    size_t size_bytes = 0;
    bool has_attachments = false;
};

struct Routed {
    Domain domain;
    std::vector<std::string> targets;
};

struct Blocked {
    Domain domain;
    int64_t rule_id = 0;
};

struct NoRoute {
    std::optional<Domain> domain;  // set when the domain is hosted but nothing matched
    std::string reason;
};

using Resolution = std::variant<Routed, Blocked, NoRoute>;

// Maps an envelope recipient onto forwarding targets: alias first, then the
// domain catch-all, with the alias's rules able to block or redirect.
class AliasResolver {
public:
    explicit AliasResolver(std::shared_ptr<Store> store);

    Resolution resolve(const std::string& recipient, const MessageFacts& facts);

    bool is_hosted_domain(const std::string& domain);

    static bool rule_matches(const ForwardingRule& rule, const MessageFacts& facts);
    // Splits on commas and keeps only well-formed local@domain entries.
    static std::vector<std::string> parse_targets(const std::string& list);

private:
    std::shared_ptr<Store> store_;
};

}  // namespace mailfwd::smtp
