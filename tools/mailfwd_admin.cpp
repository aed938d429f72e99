#include "storage/sqlite_store.hpp"
#include "config.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <chrono>

namespace {

void print_usage(const char* program) {
    std::cout << "mailfwd administration tool\n\n"
              << "Usage: " << program << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  domain add <domain> [owner_id]                 Add a hosted domain\n"
              << "  domain delete <domain>                         Delete a domain\n"
              << "  domain list                                    List domains\n"
              << "  domain catchall <domain> [address]             Set or clear the catch-all\n"
              << "  domain dkim <domain> <key.pem> [selector]      Install a DKIM private key\n"
              << "  alias add <alias@domain> <targets> [expires]   Add an alias (targets comma-separated,\n"
              << "                                                 expires in seconds from now)\n"
              << "  alias delete <alias@domain>                    Delete an alias\n"
              << "  alias list <domain>                            List aliases\n"
              << "  rule add <alias@domain> <priority> <CONDITION> <value> <ACTION> [action_value]\n"
              << "                                                 Add a forwarding rule\n"
              << "  rule list <alias@domain>                       List rules\n"
              << "  prefs set <user_id> <yes|no>                   Failure notices on or off\n"
              << "  messages list [limit]                          Show recent messages\n\n"
              << "Conditions: SENDER_CONTAINS SENDER_EQUALS SENDER_DOMAIN SUBJECT_CONTAINS\n"
              << "            SUBJECT_EQUALS SIZE_GREATER_THAN SIZE_LESS_THAN HAS_ATTACHMENTS\n"
              << "Actions:    FORWARD BLOCK REDIRECT\n\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file (default: /etc/mailfwd/mailfwd.conf)\n"
              << "  -d, --database <file>  Database file (overrides config)\n"
              << "  -h, --help             Show this help\n";
}

bool split_address(const std::string& address, std::string& local, std::string& domain) {
    auto at = address.rfind('@');
    if (at == std::string::npos || at == 0 || at == address.size() - 1) {
        std::cerr << "Invalid address format. Use: alias@domain.com\n";
        return false;
    }
    local = address.substr(0, at);
    domain = address.substr(at + 1);
    return true;
}

int domain_command(mailfwd::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: domain <add|delete|list|catchall|dkim> ...\n";
        return 1;
    }

    const std::string& sub = args[0];

    if (sub == "add") {
        if (args.size() < 2) {
            std::cerr << "Usage: domain add <domain> [owner_id]\n";
            return 1;
        }
        int64_t owner = args.size() > 2 ? std::stoll(args[2]) : 0;
        int64_t id = store.create_domain(args[1], owner);
        std::cout << "Domain created: " << args[1] << " (id " << id << ")\n";

    } else if (sub == "delete") {
        if (args.size() < 2) {
            std::cerr << "Usage: domain delete <domain>\n";
            return 1;
        }
        if (!store.delete_domain(args[1])) {
            std::cerr << "Domain not found: " << args[1] << "\n";
            return 1;
        }
        std::cout << "Domain deleted: " << args[1] << "\n";

    } else if (sub == "list") {
        auto domains = store.list_domains();
        if (domains.empty()) {
            std::cout << "No domains found.\n";
            return 0;
        }
        std::cout << "Domains:\n";
        for (const auto& domain : domains) {
            std::cout << "  " << domain.name << " (owner " << domain.owner_id << ")";
            if (domain.catch_all_email) {
                std::cout << " catch-all " << *domain.catch_all_email;
            }
            if (domain.dkim_private_key) {
                std::cout << " dkim " << domain.dkim_selector;
            }
            std::cout << "\n";
        }

    } else if (sub == "catchall") {
        if (args.size() < 2) {
            std::cerr << "Usage: domain catchall <domain> [address]\n";
            return 1;
        }
        std::optional<std::string> address;
        if (args.size() > 2) {
            address = args[2];
        }
        if (!store.set_catch_all(args[1], address)) {
            std::cerr << "Domain not found: " << args[1] << "\n";
            return 1;
        }
        std::cout << (address ? "Catch-all set for " : "Catch-all cleared for ") << args[1] << "\n";

    } else if (sub == "dkim") {
        if (args.size() < 3) {
            std::cerr << "Usage: domain dkim <domain> <key.pem> [selector]\n";
            return 1;
        }
        std::ifstream in(args[2]);
        if (!in) {
            std::cerr << "Cannot read key file: " << args[2] << "\n";
            return 1;
        }
        std::stringstream pem;
        pem << in.rdbuf();
        std::string selector = args.size() > 3 ? args[3] : "mailfwd";
        if (!store.set_dkim_key(args[1], pem.str(), selector)) {
            std::cerr << "Domain not found: " << args[1] << "\n";
            return 1;
        }
        std::cout << "DKIM key installed for " << args[1] << " (selector " << selector << ")\n";

    } else {
        std::cerr << "Unknown domain subcommand: " << sub << "\n";
        return 1;
    }
    return 0;
}

int alias_command(mailfwd::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: alias <add|delete|list> ...\n";
        return 1;
    }

    const std::string& sub = args[0];

    if (sub == "list") {
        auto domain = store.find_domain(args[1]);
        if (!domain) {
            std::cerr << "Domain not found: " << args[1] << "\n";
            return 1;
        }
        auto aliases = store.list_aliases(domain->id);
        if (aliases.empty()) {
            std::cout << "No aliases found.\n";
            return 0;
        }
        auto now = std::chrono::system_clock::now();
        std::cout << "Aliases:\n";
        for (const auto& alias : aliases) {
            std::cout << "  " << alias.local_part << "@" << domain->name << " -> " << alias.targets;
            if (alias.is_expired(now)) {
                std::cout << " (expired)";
            }
            std::cout << "\n";
        }
        return 0;
    }

    std::string local, domain_name;
    if (!split_address(args[1], local, domain_name)) {
        return 1;
    }
    auto domain = store.find_domain(domain_name);
    if (!domain) {
        std::cerr << "Domain not found: " << domain_name << "\n";
        return 1;
    }

    if (sub == "add") {
        if (args.size() < 3) {
            std::cerr << "Usage: alias add <alias@domain> <targets> [expires_in_seconds]\n";
            return 1;
        }
        std::optional<mailfwd::Timestamp> expires;
        if (args.size() > 3) {
            expires = std::chrono::system_clock::now() + std::chrono::seconds(std::stoll(args[3]));
        }
        int64_t id = store.create_alias(domain->id, local, args[2], expires);
        std::cout << "Alias created: " << args[1] << " -> " << args[2] << " (id " << id << ")\n";

    } else if (sub == "delete") {
        if (!store.delete_alias(domain->id, local)) {
            std::cerr << "Alias not found: " << args[1] << "\n";
            return 1;
        }
        std::cout << "Alias deleted: " << args[1] << "\n";

    } else {
        std::cerr << "Unknown alias subcommand: " << sub << "\n";
        return 1;
    }
    return 0;
}

int rule_command(mailfwd::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: rule <add|list> <alias@domain> ...\n";
        return 1;
    }

    std::string local, domain_name;
    if (!split_address(args[1], local, domain_name)) {
        return 1;
    }
    auto domain = store.find_domain(domain_name);
    auto alias = domain ? store.find_alias(domain->id, local) : std::nullopt;
    if (!alias) {
        std::cerr << "Alias not found: " << args[1] << "\n";
        return 1;
    }

    if (args[0] == "add") {
        if (args.size() < 6) {
            std::cerr << "Usage: rule add <alias@domain> <priority> <CONDITION> <value> <ACTION> [action_value]\n";
            return 1;
        }
        auto condition = mailfwd::parse_condition_type(args[3]);
        auto action = mailfwd::parse_action_type(args[5]);
        if (!condition || !action) {
            std::cerr << "Unknown condition or action\n";
            return 1;
        }

        mailfwd::ForwardingRule rule;
        rule.alias_id = alias->id;
        rule.priority = std::stoi(args[2]);
        rule.condition_type = *condition;
        rule.condition_value = args[4];
        rule.action_type = *action;
        if (args.size() > 6) {
            rule.action_value = args[6];
        }

        int64_t id = store.create_rule(rule);
        std::cout << "Rule created: " << id << "\n";

    } else if (args[0] == "list") {
        auto rules = store.list_rules(alias->id);
        if (rules.empty()) {
            std::cout << "No rules found.\n";
            return 0;
        }
        std::cout << "Rules for " << args[1] << ":\n";
        for (const auto& rule : rules) {
            std::cout << "  #" << rule.id << " [" << rule.priority << "] "
                      << mailfwd::condition_type_name(rule.condition_type) << " '" << rule.condition_value
                      << "' -> " << mailfwd::action_type_name(rule.action_type);
            if (rule.action_value) {
                std::cout << " " << *rule.action_value;
            }
            std::cout << " (matched " << rule.match_count << ")";
            if (!rule.is_active) {
                std::cout << " (inactive)";
            }
            std::cout << "\n";
        }

    } else {
        std::cerr << "Unknown rule subcommand: " << args[0] << "\n";
        return 1;
    }
    return 0;
}

int prefs_command(mailfwd::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.size() < 3 || args[0] != "set") {
        std::cerr << "Usage: prefs set <user_id> <yes|no>\n";
        return 1;
    }
    mailfwd::UserPreferences prefs;
    prefs.user_id = std::stoll(args[1]);
    prefs.notify_on_failure = args[2] == "yes" || args[2] == "true" || args[2] == "1" || args[2] == "on";
    store.set_notification_preferences(prefs);
    std::cout << "Failure notices for user " << prefs.user_id << ": "
              << (prefs.notify_on_failure ? "on" : "off") << "\n";
    return 0;
}

int messages_command(mailfwd::SqliteStore& store, const std::vector<std::string>& args) {
    if (args.empty() || args[0] != "list") {
        std::cerr << "Usage: messages list [limit]\n";
        return 1;
    }
    size_t limit = args.size() > 1 ? std::stoul(args[1]) : 50;
    auto messages = store.list_messages(limit);
    if (messages.empty()) {
        std::cout << "No messages found.\n";
        return 0;
    }
    for (const auto& m : messages) {
        std::cout << "  " << m.id << " " << mailfwd::message_status_name(m.status) << " "
                  << m.sender_email << " -> " << m.recipient_email;
        if (m.forwarded_to) {
            std::cout << " => " << *m.forwarded_to;
        }
        if (m.error_message) {
            std::cout << " [" << *m.error_message << "]";
        }
        std::cout << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file = "/etc/mailfwd/mailfwd.conf";
    std::string db_file;

    int cmd_start = argc;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            db_file = argv[++i];
        } else if (arg[0] != '-') {
            cmd_start = i;
            break;
        }
    }

    if (cmd_start >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    mailfwd::Logger::instance().init(mailfwd::LogLevel::Warning, true);

    auto& config = mailfwd::Config::instance();
    config.load(config_file);

    if (db_file.empty()) {
        db_file = config.database().path.string();
    }

    mailfwd::SqliteStore store(db_file);
    if (!store.initialize()) {
        std::cerr << "Failed to initialize database: " << store.last_error() << "\n";
        return 1;
    }

    std::string command = argv[cmd_start];
    std::vector<std::string> args(argv + cmd_start + 1, argv + argc);

    try {
        if (command == "domain") {
            return domain_command(store, args);
        } else if (command == "alias") {
            return alias_command(store, args);
        } else if (command == "rule") {
            return rule_command(store, args);
        } else if (command == "prefs") {
            return prefs_command(store, args);
        } else if (command == "messages") {
            return messages_command(store, args);
        }
    } catch (const mailfwd::StoreError& e) {
        std::cerr << "Database error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Number out of range: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
