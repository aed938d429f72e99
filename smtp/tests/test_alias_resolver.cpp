#include <catch2/catch_test_macros.hpp>
#include "alias_resolver.hpp"
#include "../../tests/support/test_doubles.hpp"

using namespace mailfwd;
using namespace mailfwd::smtp;
using namespace mailfwd::testing;

namespace {

ForwardingRule make_rule(RuleConditionType type, const std::string& value) {
    ForwardingRule rule;
    rule.condition_type = type;
    rule.condition_value = value;
    return rule;
}

MessageFacts facts(const std::string& sender, const std::string& subject = "Hello",
                   size_t size = 1000, bool attachments = false) {
    return MessageFacts{sender, subject, size, attachments};
}

}  // namespace

TEST_CASE("Alias resolution", "[smtp][resolver]") {
    auto store = std::make_shared<MemoryStore>();
    int64_t domain_id = store->add_domain("example.com", 7).id;
    AliasResolver resolver(store);

    SECTION("Unhosted domain has no route and no domain") {
        auto result = resolver.resolve("bob@elsewhere.org", facts("alice@sender.org"));
        auto* none = std::get_if<NoRoute>(&result);
        REQUIRE(none != nullptr);
        REQUIRE_FALSE(none->domain.has_value());
        REQUIRE_FALSE(resolver.is_hosted_domain("elsewhere.org"));
    }

    SECTION("Hosted domain lookup ignores case") {
        REQUIRE(resolver.is_hosted_domain("EXAMPLE.com"));
    }

    SECTION("Alias routes to its targets in order") {
        store->add_alias(domain_id, "bob", "bob@gmail.com, backup@yahoo.com");

        auto result = resolver.resolve("Bob@Example.com", facts("alice@sender.org"));
        auto* routed = std::get_if<Routed>(&result);
        REQUIRE(routed != nullptr);
        REQUIRE(routed->domain.id == domain_id);
        REQUIRE(routed->targets == std::vector<std::string>{"bob@gmail.com", "backup@yahoo.com"});
    }

    SECTION("Missing alias falls back to the catch-all") {
        store->domains[0].catch_all_email = "owner@gmail.com";

        auto result = resolver.resolve("random@example.com", facts("alice@sender.org"));
        auto* routed = std::get_if<Routed>(&result);
        REQUIRE(routed != nullptr);
        REQUIRE(routed->targets == std::vector<std::string>{"owner@gmail.com"});
    }

    SECTION("Missing alias without catch-all is rejected for the domain") {
        auto result = resolver.resolve("random@example.com", facts("alice@sender.org"));
        auto* none = std::get_if<NoRoute>(&result);
        REQUIRE(none != nullptr);
        REQUIRE(none->domain.has_value());
        REQUIRE(none->domain->id == domain_id);
        REQUIRE(none->reason == "No alias found");
    }

    SECTION("Expired alias counts as missing") {
        auto& alias = store->add_alias(domain_id, "promo", "bob@gmail.com");
        alias.expires_at = std::chrono::system_clock::now() - std::chrono::hours(1);
        store->domains[0].catch_all_email = "owner@gmail.com";

        auto result = resolver.resolve("promo@example.com", facts("alice@sender.org"));
        auto* routed = std::get_if<Routed>(&result);
        REQUIRE(routed != nullptr);
        REQUIRE(routed->targets == std::vector<std::string>{"owner@gmail.com"});
    }

    SECTION("Alias that expires later is still used") {
        auto& alias = store->add_alias(domain_id, "promo", "bob@gmail.com");
        alias.expires_at = std::chrono::system_clock::now() + std::chrono::hours(1);

        auto result = resolver.resolve("promo@example.com", facts("alice@sender.org"));
        REQUIRE(std::holds_alternative<Routed>(result));
    }

    SECTION("Alias with only invalid targets has no route") {
        store->add_alias(domain_id, "broken", "not-an-address, also bad@");

        auto result = resolver.resolve("broken@example.com", facts("alice@sender.org"));
        auto* none = std::get_if<NoRoute>(&result);
        REQUIRE(none != nullptr);
        REQUIRE(none->reason == "No valid targets");
    }
}

TEST_CASE("Forwarding rules", "[smtp][resolver][rules]") {
    auto store = std::make_shared<MemoryStore>();
    int64_t domain_id = store->add_domain("example.com").id;
    int64_t alias_id = store->add_alias(domain_id, "bob", "bob@gmail.com").id;
    AliasResolver resolver(store);

    SECTION("Block rule stops delivery and counts the match") {
        store->add_rule(alias_id, 1, RuleConditionType::SenderDomain, "@spam.com",
                        RuleActionType::Block);

        auto result = resolver.resolve("bob@example.com", facts("x@spam.com"));
        auto* blocked = std::get_if<Blocked>(&result);
        REQUIRE(blocked != nullptr);
        REQUIRE(blocked->rule_id == store->rules[0].id);
        REQUIRE(store->rules[0].match_count == 1);
    }

    SECTION("Non-matching rule leaves the alias targets") {
        store->add_rule(alias_id, 1, RuleConditionType::SenderDomain, "spam.com",
                        RuleActionType::Block);

        auto result = resolver.resolve("bob@example.com", facts("alice@sender.org"));
        REQUIRE(std::holds_alternative<Routed>(result));
        REQUIRE(store->rules[0].match_count == 0);
    }

    SECTION("Redirect rule replaces the targets") {
        store->add_rule(alias_id, 1, RuleConditionType::SubjectContains, "invoice",
                        RuleActionType::Redirect, "billing@corp.com");

        auto result = resolver.resolve("bob@example.com",
                                       facts("alice@sender.org", "Your INVOICE for May"));
        auto* routed = std::get_if<Routed>(&result);
        REQUIRE(routed != nullptr);
        REQUIRE(routed->targets == std::vector<std::string>{"billing@corp.com"});
    }

    SECTION("Redirect without a value keeps the alias targets") {
        store->add_rule(alias_id, 1, RuleConditionType::SubjectContains, "invoice",
                        RuleActionType::Redirect, "  ");

        auto result = resolver.resolve("bob@example.com", facts("alice@sender.org", "invoice"));
        auto* routed = std::get_if<Routed>(&result);
        REQUIRE(routed != nullptr);
        REQUIRE(routed->targets == std::vector<std::string>{"bob@gmail.com"});
    }

    SECTION("First matching rule by priority wins") {
        store->add_rule(alias_id, 20, RuleConditionType::SenderContains, "alice",
                        RuleActionType::Block);
        store->add_rule(alias_id, 10, RuleConditionType::SenderContains, "alice",
                        RuleActionType::Forward);

        auto result = resolver.resolve("bob@example.com", facts("alice@sender.org"));
        REQUIRE(std::holds_alternative<Routed>(result));
        REQUIRE(store->rules[1].match_count == 1);
        REQUIRE(store->rules[0].match_count == 0);
    }

    SECTION("Inactive rules are skipped") {
        auto& rule = store->add_rule(alias_id, 1, RuleConditionType::SenderContains, "alice",
                                     RuleActionType::Block);
        rule.is_active = false;

        auto result = resolver.resolve("bob@example.com", facts("alice@sender.org"));
        REQUIRE(std::holds_alternative<Routed>(result));
    }
}

TEST_CASE("Rule conditions", "[smtp][resolver][rules]") {
    SECTION("Sender conditions ignore case") {
        REQUIRE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SenderContains, "NEWS"), facts("news@list.org")));
        REQUIRE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SenderEquals, "Alice@Sender.org"), facts("alice@sender.org")));
        REQUIRE_FALSE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SenderEquals, "alice@sender.org"), facts("alice@sender.org.evil")));
    }

    SECTION("Sender domain accepts a leading @") {
        auto facts_in = facts("x@Spam.com");
        REQUIRE(AliasResolver::rule_matches(make_rule(RuleConditionType::SenderDomain, "spam.com"), facts_in));
        REQUIRE(AliasResolver::rule_matches(make_rule(RuleConditionType::SenderDomain, "@spam.com"), facts_in));
        REQUIRE_FALSE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SenderDomain, "spam.com"), facts("x@notspam.com")));
    }

    SECTION("Subject conditions") {
        REQUIRE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SubjectEquals, "weekly report"), facts("a@b.org", "Weekly Report")));
        REQUIRE_FALSE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SubjectEquals, "weekly"), facts("a@b.org", "Weekly Report")));
    }

    SECTION("Size thresholds are strict") {
        auto big = make_rule(RuleConditionType::SizeGreaterThan, "1000");
        REQUIRE(AliasResolver::rule_matches(big, facts("a@b.org", "s", 1001)));
        REQUIRE_FALSE(AliasResolver::rule_matches(big, facts("a@b.org", "s", 1000)));

        auto small = make_rule(RuleConditionType::SizeLessThan, "1000");
        REQUIRE(AliasResolver::rule_matches(small, facts("a@b.org", "s", 999)));
        REQUIRE_FALSE(AliasResolver::rule_matches(small, facts("a@b.org", "s", 1000)));
    }

    SECTION("Unparseable size never matches") {
        REQUIRE_FALSE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SizeGreaterThan, "lots"), facts("a@b.org", "s", 5000000)));
        REQUIRE_FALSE(AliasResolver::rule_matches(
            make_rule(RuleConditionType::SizeLessThan, "10kb"), facts("a@b.org", "s", 1)));
    }

    SECTION("Attachment condition") {
        auto with = make_rule(RuleConditionType::HasAttachments, "true");
        auto without = make_rule(RuleConditionType::HasAttachments, "false");
        REQUIRE(AliasResolver::rule_matches(with, facts("a@b.org", "s", 10, true)));
        REQUIRE_FALSE(AliasResolver::rule_matches(with, facts("a@b.org", "s", 10, false)));
        REQUIRE(AliasResolver::rule_matches(without, facts("a@b.org", "s", 10, false)));
    }
}

TEST_CASE("Forwarding target lists", "[smtp][resolver]") {
    SECTION("Entries are trimmed and empty ones skipped") {
        auto targets = AliasResolver::parse_targets(" a@x.com ,, b@y.org,");
        REQUIRE(targets == std::vector<std::string>{"a@x.com", "b@y.org"});
    }

    SECTION("Malformed entries are dropped") {
        auto targets = AliasResolver::parse_targets("good@x.com, nodot@localhost, <c@z.com>, @x.com");
        REQUIRE(targets == std::vector<std::string>{"good@x.com"});
    }

    SECTION("Empty list") {
        REQUIRE(AliasResolver::parse_targets("").empty());
    }
}
